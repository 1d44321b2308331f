#ifndef PERMISSIONPROVIDER_H
#define PERMISSIONPROVIDER_H

#include <QString>

namespace FieldSync {

enum class DeviceCapability {
    Camera,
    Microphone,
    Location
};

enum class PermissionState {
    Granted,
    Prompt,         ///< Will be asked when first used
    Denied,
    Unavailable,    ///< No such device or API on this platform
    Unknown
};

/**
 * @brief Source of capture permission states for the preflight check
 */
class PermissionProvider
{
public:
    virtual ~PermissionProvider() = default;
    virtual PermissionState state(DeviceCapability capability) const = 0;
};

/**
 * @brief Asks QCoreApplication::checkPermission()
 *
 * Needs a QCoreApplication instance; reports Unknown without one.
 */
class QtPermissionProvider : public PermissionProvider
{
public:
    PermissionState state(DeviceCapability capability) const override;
};

} // namespace FieldSync

#endif // PERMISSIONPROVIDER_H
