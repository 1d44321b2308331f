#include "permissionprovider.h"

#include <QCoreApplication>
#if QT_CONFIG(permissions)
#include <QPermissions>
#endif

namespace FieldSync {

PermissionState QtPermissionProvider::state(DeviceCapability capability) const
{
#if QT_CONFIG(permissions)
    QCoreApplication *app = QCoreApplication::instance();
    if (!app) {
        return PermissionState::Unknown;
    }

    Qt::PermissionStatus status = Qt::PermissionStatus::Undetermined;
    switch (capability) {
    case DeviceCapability::Camera:
        status = app->checkPermission(QCameraPermission{});
        break;
    case DeviceCapability::Microphone:
        status = app->checkPermission(QMicrophonePermission{});
        break;
    case DeviceCapability::Location: {
        QLocationPermission location;
        location.setAccuracy(QLocationPermission::Precise);
        status = app->checkPermission(location);
        break;
    }
    }

    switch (status) {
    case Qt::PermissionStatus::Granted: return PermissionState::Granted;
    case Qt::PermissionStatus::Undetermined: return PermissionState::Prompt;
    case Qt::PermissionStatus::Denied: return PermissionState::Denied;
    }
    return PermissionState::Unknown;
#else
    Q_UNUSED(capability);
    return PermissionState::Unavailable;
#endif
}

} // namespace FieldSync
