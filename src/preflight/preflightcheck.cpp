#include "preflightcheck.h"
#include "../store/fieldworkstore.h"
#include "../cache/cachemanager.h"
#include "../storage/storagemanager.h"

#include <QDebug>
#include <functional>

namespace FieldSync {

const int PreflightCheck::DEFAULT_MIN_FREE_MB;
const int PreflightCheck::DEFAULT_WARN_FREE_MB;

QString checkStatusToString(CheckStatus status)
{
    switch (status) {
    case CheckStatus::Pass: return "pass";
    case CheckStatus::Warning: return "warning";
    case CheckStatus::Fail: return "fail";
    }
    return "warning";
}

namespace {

PreflightCheckResult makeResult(const QString &name, CheckStatus status, const QString &message)
{
    PreflightCheckResult result;
    result.name = name;
    result.status = status;
    result.message = message;
    return result;
}

struct PermissionMessages {
    const char *name;
    const char *granted;
    const char *prompt;
    const char *denied;
    const char *unavailable;
    const char *unknown;
};

PreflightCheckResult permissionResult(PermissionState state, const PermissionMessages &text)
{
    switch (state) {
    case PermissionState::Granted:
        return makeResult(text.name, CheckStatus::Pass, text.granted);
    case PermissionState::Prompt:
        return makeResult(text.name, CheckStatus::Warning, text.prompt);
    case PermissionState::Denied:
        return makeResult(text.name, CheckStatus::Warning, text.denied);
    case PermissionState::Unavailable:
        return makeResult(text.name, CheckStatus::Warning, text.unavailable);
    case PermissionState::Unknown:
        break;
    }
    return makeResult(text.name, CheckStatus::Warning, text.unknown);
}

} // namespace

PreflightCheck::PreflightCheck(FieldworkStore *store,
                               CacheManager *cache,
                               StorageManager *storage,
                               QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_cache(cache)
    , m_storage(storage)
    , m_defaultPermissions(new QtPermissionProvider)
{
}

PreflightCheck::~PreflightCheck() = default;

void PreflightCheck::setPermissionProvider(PermissionProvider *provider)
{
    m_permissions = provider;
}

PermissionProvider *PreflightCheck::permissions() const
{
    return m_permissions ? m_permissions : m_defaultPermissions.get();
}

void PreflightCheck::setFreeSpaceThresholds(int minFreeMb, int warnFreeMb)
{
    m_minFreeMb = minFreeMb;
    m_warnFreeMb = qMin(warnFreeMb, minFreeMb);
}

PreflightResult PreflightCheck::run(const QString &reviewId)
{
    PreflightResult result;

    // Sequential so progress can be shown check by check
    const QList<std::function<PreflightCheckResult()>> runners = {
        [this]() { return checkStorageEngine(); },
        [this]() { return checkCamera(); },
        [this]() { return checkMicrophone(); },
        [this]() { return checkGps(); },
        [this, reviewId]() { return checkReviewData(reviewId); },
        [this]() { return checkStorageQuota(); }
    };

    for (const auto &runner : runners) {
        PreflightCheckResult check = runner();
        qDebug() << "[PreflightCheck]" << check.name << checkStatusToString(check.status) << check.message;
        result.checks.append(check);
        emit checkCompleted(check);
    }

    result.ready = true;
    for (const PreflightCheckResult &check : result.checks) {
        if (check.status == CheckStatus::Fail) {
            result.ready = false;
            break;
        }
    }

    emit finished(result.ready);
    return result;
}

// ========== Individual Checks ==========

PreflightCheckResult PreflightCheck::checkStorageEngine() const
{
    const QString name = "storage-engine";

    if (m_store && (m_store->isOpen() || m_store->open()) && m_store->checkWritable()) {
        return makeResult(name, CheckStatus::Pass, "Local database is available and writable");
    }
    return makeResult(name, CheckStatus::Fail,
                      "Local database is not available. Offline mode cannot function.");
}

PreflightCheckResult PreflightCheck::checkCamera() const
{
    static const PermissionMessages text = {
        "camera",
        "Camera permission granted",
        "Camera permission will be requested when needed",
        "Camera permission denied. You can still attach existing photos.",
        "Camera not available on this device",
        "Camera permission status unknown"
    };
    return permissionResult(permissions()->state(DeviceCapability::Camera), text);
}

PreflightCheckResult PreflightCheck::checkMicrophone() const
{
    static const PermissionMessages text = {
        "microphone",
        "Microphone permission granted",
        "Microphone permission will be requested when needed",
        "Microphone permission denied. Voice notes unavailable.",
        "Microphone not available on this device",
        "Microphone permission status unknown"
    };
    return permissionResult(permissions()->state(DeviceCapability::Microphone), text);
}

PreflightCheckResult PreflightCheck::checkGps() const
{
    static const PermissionMessages text = {
        "gps",
        "GPS permission granted",
        "GPS permission will be requested when needed",
        "GPS permission denied. Location tagging unavailable.",
        "Geolocation not available on this device",
        "GPS permission status unknown"
    };
    return permissionResult(permissions()->state(DeviceCapability::Location), text);
}

PreflightCheckResult PreflightCheck::checkReviewData(const QString &reviewId)
{
    const QString name = "reviewData";

    if (!m_cache) {
        return makeResult(name, CheckStatus::Warning, "Unable to verify cache status");
    }

    if (m_cache->isCachedForOffline(reviewId)) {
        return makeResult(name, CheckStatus::Pass, "Review data cached for offline use");
    }

    // Try to cache it now
    m_cache->fetchReviewNow(reviewId);
    if (m_cache->isCachedForOffline(reviewId)) {
        return makeResult(name, CheckStatus::Pass, "Review data has been cached for offline use");
    }

    return makeResult(name, CheckStatus::Warning,
                      "Could not cache review data. Some features may not work offline.");
}

PreflightCheckResult PreflightCheck::checkStorageQuota() const
{
    const QString name = "storage";

    if (!m_storage) {
        return makeResult(name, CheckStatus::Warning, "Unable to check storage quota");
    }

    StorageEstimate estimate = m_storage->getStorageEstimate();
    if (!estimate.isKnown()) {
        return makeResult(name, CheckStatus::Warning, "Unable to check storage quota");
    }

    qint64 freeMb = (estimate.quota - estimate.usage) / (1024 * 1024);

    if (freeMb >= m_minFreeMb) {
        return makeResult(name, CheckStatus::Pass,
                          QString("%1 MB free storage available").arg(freeMb));
    }
    if (freeMb >= m_warnFreeMb) {
        return makeResult(name, CheckStatus::Warning,
                          QString("Only %1 MB free. Consider clearing old data for best experience.").arg(freeMb));
    }
    return makeResult(name, CheckStatus::Fail,
                      QString("Only %1 MB free. At least %2 MB recommended. Clear old reviews.")
                          .arg(freeMb).arg(m_minFreeMb));
}

} // namespace FieldSync
