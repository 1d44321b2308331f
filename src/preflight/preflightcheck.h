#ifndef PREFLIGHTCHECK_H
#define PREFLIGHTCHECK_H

#include <QObject>
#include <QString>
#include <QList>
#include <QMetaType>
#include <memory>
#include "permissionprovider.h"

namespace FieldSync {

class FieldworkStore;
class CacheManager;
class StorageManager;

enum class CheckStatus {
    Pass,
    Warning,
    Fail
};

QString checkStatusToString(CheckStatus status);

struct PreflightCheckResult {
    QString name;
    CheckStatus status = CheckStatus::Pass;
    QString message;
};

struct PreflightResult {
    bool ready = false;     ///< No check failed
    QList<PreflightCheckResult> checks;
};

/**
 * @brief Readiness check before going into the field
 *
 * Checks run in order, each reported through checkCompleted() as soon as
 * it finishes:
 *   1. storage-engine  local store opens and accepts writes (fail otherwise)
 *   2. camera          capture permission (never fails)
 *   3. microphone      capture permission (never fails)
 *   4. gps             location permission (never fails)
 *   5. reviewData      review cached, caching it now if needed
 *   6. storage         free space against the configured thresholds
 */
class PreflightCheck : public QObject
{
    Q_OBJECT

public:
    static const int DEFAULT_MIN_FREE_MB = 100;
    static const int DEFAULT_WARN_FREE_MB = 50;

    PreflightCheck(FieldworkStore *store,
                   CacheManager *cache,
                   StorageManager *storage,
                   QObject *parent = nullptr);
    ~PreflightCheck() override;

    /**
     * @brief Replace the permission source (not owned)
     */
    void setPermissionProvider(PermissionProvider *provider);

    void setFreeSpaceThresholds(int minFreeMb, int warnFreeMb);

    PreflightResult run(const QString &reviewId);

    // ========== Individual Checks ==========

    PreflightCheckResult checkStorageEngine() const;
    PreflightCheckResult checkCamera() const;
    PreflightCheckResult checkMicrophone() const;
    PreflightCheckResult checkGps() const;
    PreflightCheckResult checkReviewData(const QString &reviewId);
    PreflightCheckResult checkStorageQuota() const;

signals:
    void checkCompleted(const PreflightCheckResult &result);
    void finished(bool ready);

private:
    PermissionProvider *permissions() const;

    FieldworkStore *m_store = nullptr;
    CacheManager *m_cache = nullptr;
    StorageManager *m_storage = nullptr;

    std::unique_ptr<PermissionProvider> m_defaultPermissions;
    PermissionProvider *m_permissions = nullptr;

    int m_minFreeMb = DEFAULT_MIN_FREE_MB;
    int m_warnFreeMb = DEFAULT_WARN_FREE_MB;
};

} // namespace FieldSync

Q_DECLARE_METATYPE(FieldSync::PreflightCheckResult)

#endif // PREFLIGHTCHECK_H
