#include "fieldsyncconfig.h"
#include "sync/syncengine.h"
#include "sync/syncscheduler.h"
#include "net/connectivitymonitor.h"
#include "preflight/preflightcheck.h"
#include "storage/storagemanager.h"
#include "sync/handlers/fieldevidencehandler.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>

namespace FieldSync {

const QString FieldSyncConfig::CONFIG_FILE_NAME = "fieldsync.conf";
const QString FieldSyncConfig::DATABASE_FILE_NAME = "fieldwork.db";
const QString FieldSyncConfig::DEFAULT_BASE_URL = "http://localhost:3000";

namespace {
const char *DEFAULT_UPLOAD_PATH = "/api/fieldwork/evidence";
const char *DEFAULT_HEALTH_PATH = "/api/health";
const int DEFAULT_REQUEST_TIMEOUT_MS = 30000;
}

FieldSyncConfig::FieldSyncConfig(const QString &dataDirectory)
    : m_dataDirectory(dataDirectory)
    , m_baseUrl(DEFAULT_BASE_URL)
    , m_uploadPath(DEFAULT_UPLOAD_PATH)
    , m_healthPath(DEFAULT_HEALTH_PATH)
    , m_requestTimeoutMs(DEFAULT_REQUEST_TIMEOUT_MS)
    , m_maxRetries(SyncEngine::DEFAULT_MAX_RETRIES)
    , m_backoffBaseMs(SyncEngine::DEFAULT_BACKOFF_BASE_MS)
    , m_backoffMultiplier(SyncEngine::DEFAULT_BACKOFF_MULTIPLIER)
    , m_completedTtlHours(SyncEngine::DEFAULT_COMPLETED_TTL_HOURS)
    , m_reconnectDelayMs(SyncScheduler::DEFAULT_RECONNECT_DELAY_MS)
    , m_periodicIntervalMs(SyncScheduler::DEFAULT_PERIODIC_INTERVAL_MS)
    , m_pollIntervalMs(ConnectivityMonitor::DEFAULT_POLL_INTERVAL_MS)
    , m_probeTimeoutMs(ConnectivityMonitor::DEFAULT_PROBE_TIMEOUT_MS)
    , m_retentionDays(StorageManager::DEFAULT_RETENTION_DAYS)
    , m_minFreeMb(PreflightCheck::DEFAULT_MIN_FREE_MB)
    , m_warnFreeMb(PreflightCheck::DEFAULT_WARN_FREE_MB)
    , m_quotaBytes(0)
    , m_cleanupIntervalHours(SyncScheduler::DEFAULT_CLEANUP_INTERVAL_HOURS)
    , m_maxUploadBytes(FieldEvidenceHandler::DEFAULT_MAX_UPLOAD_BYTES)
    , m_debugLogging(false)
{
    // Try to load existing settings if path is set
    if (!m_dataDirectory.isEmpty()) {
        load();
    }
}

FieldSyncConfig FieldSyncConfig::fromFile(const QString &configFilePath)
{
    FieldSyncConfig config;
    config.setConfigFilePath(configFilePath);
    config.setDataDirectory(QFileInfo(configFilePath).absolutePath());
    config.load();
    return config;
}

// ========== Locations ==========

QString FieldSyncConfig::configFilePath() const
{
    if (!m_configFilePath.isEmpty()) {
        return m_configFilePath;
    }
    if (m_dataDirectory.isEmpty()) {
        return QString();
    }
    return QDir(m_dataDirectory).filePath(CONFIG_FILE_NAME);
}

QString FieldSyncConfig::databasePath() const
{
    if (m_dataDirectory.isEmpty()) {
        return QString();
    }
    return QDir(m_dataDirectory).filePath(DATABASE_FILE_NAME);
}

QString FieldSyncConfig::cacheDirectory() const
{
    if (!m_cacheDirectory.isEmpty()) {
        return m_cacheDirectory;
    }
    if (m_dataDirectory.isEmpty()) {
        return QString();
    }
    return QDir(m_dataDirectory).filePath("cache");
}

bool FieldSyncConfig::exists() const
{
    QString path = configFilePath();
    return !path.isEmpty() && QFile::exists(path);
}

// ========== Persistence ==========

bool FieldSyncConfig::load()
{
    QString configPath = configFilePath();
    if (configPath.isEmpty() || !QFile::exists(configPath)) {
        return false;
    }

    QSettings settings(configPath, QSettings::IniFormat);

    // Server
    m_baseUrl = QUrl(settings.value("server/baseUrl", DEFAULT_BASE_URL).toString());
    m_uploadPath = settings.value("server/uploadPath", DEFAULT_UPLOAD_PATH).toString();
    m_healthPath = settings.value("server/healthPath", DEFAULT_HEALTH_PATH).toString();
    m_authToken = settings.value("server/authToken", QString()).toString();
    m_requestTimeoutMs = settings.value("server/requestTimeoutMs", m_requestTimeoutMs).toInt();

    // Sync
    m_maxRetries = settings.value("sync/maxRetries", m_maxRetries).toInt();
    m_backoffBaseMs = settings.value("sync/backoffBaseMs", m_backoffBaseMs).toInt();
    m_backoffMultiplier = settings.value("sync/backoffMultiplier", m_backoffMultiplier).toInt();
    m_completedTtlHours = settings.value("sync/completedTtlHours", m_completedTtlHours).toInt();
    m_reconnectDelayMs = settings.value("sync/reconnectDelayMs", m_reconnectDelayMs).toInt();
    m_periodicIntervalMs = settings.value("sync/periodicIntervalMs", m_periodicIntervalMs).toInt();

    // Connectivity
    m_pollIntervalMs = settings.value("connectivity/pollIntervalMs", m_pollIntervalMs).toInt();
    m_probeTimeoutMs = settings.value("connectivity/probeTimeoutMs", m_probeTimeoutMs).toInt();

    // Storage (an explicit data directory wins over the file location)
    QString dataDir = settings.value("storage/dataDirectory", QString()).toString();
    if (!dataDir.isEmpty()) {
        m_dataDirectory = dataDir;
    }
    m_retentionDays = settings.value("storage/retentionDays", m_retentionDays).toInt();
    m_minFreeMb = settings.value("storage/minFreeMb", m_minFreeMb).toInt();
    m_warnFreeMb = settings.value("storage/warnFreeMb", m_warnFreeMb).toInt();
    m_quotaBytes = settings.value("storage/quotaBytes", m_quotaBytes).toLongLong();
    m_cleanupIntervalHours = settings.value("storage/cleanupIntervalHours", m_cleanupIntervalHours).toInt();

    // Cache
    m_cacheDirectory = settings.value("cache/directory", QString()).toString();
    m_questionnaireTypes = settings.value("cache/questionnaireTypes", QStringList()).toStringList();

    // Evidence
    m_maxUploadBytes = settings.value("evidence/maxUploadBytes", m_maxUploadBytes).toLongLong();

    // Advanced
    m_debugLogging = settings.value("advanced/debugLogging", false).toBool();

    return settings.status() == QSettings::NoError;
}

bool FieldSyncConfig::save()
{
    QString configPath = configFilePath();
    if (configPath.isEmpty()) {
        return false;
    }

    // Ensure directory exists
    QDir dir = QFileInfo(configPath).absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        return false;
    }

    QSettings settings(configPath, QSettings::IniFormat);

    settings.setValue("server/baseUrl", m_baseUrl.toString());
    settings.setValue("server/uploadPath", m_uploadPath);
    settings.setValue("server/healthPath", m_healthPath);
    if (!m_authToken.isEmpty()) {
        settings.setValue("server/authToken", m_authToken);
    } else {
        settings.remove("server/authToken");
    }
    settings.setValue("server/requestTimeoutMs", m_requestTimeoutMs);

    settings.setValue("sync/maxRetries", m_maxRetries);
    settings.setValue("sync/backoffBaseMs", m_backoffBaseMs);
    settings.setValue("sync/backoffMultiplier", m_backoffMultiplier);
    settings.setValue("sync/completedTtlHours", m_completedTtlHours);
    settings.setValue("sync/reconnectDelayMs", m_reconnectDelayMs);
    settings.setValue("sync/periodicIntervalMs", m_periodicIntervalMs);

    settings.setValue("connectivity/pollIntervalMs", m_pollIntervalMs);
    settings.setValue("connectivity/probeTimeoutMs", m_probeTimeoutMs);

    // Only written when the data lives somewhere other than beside the file
    if (!m_dataDirectory.isEmpty()
        && QDir(m_dataDirectory).absolutePath() != dir.absolutePath()) {
        settings.setValue("storage/dataDirectory", m_dataDirectory);
    }
    settings.setValue("storage/retentionDays", m_retentionDays);
    settings.setValue("storage/minFreeMb", m_minFreeMb);
    settings.setValue("storage/warnFreeMb", m_warnFreeMb);
    settings.setValue("storage/quotaBytes", m_quotaBytes);
    settings.setValue("storage/cleanupIntervalHours", m_cleanupIntervalHours);

    if (!m_cacheDirectory.isEmpty()) {
        settings.setValue("cache/directory", m_cacheDirectory);
    }
    settings.setValue("cache/questionnaireTypes", m_questionnaireTypes);

    settings.setValue("evidence/maxUploadBytes", m_maxUploadBytes);

    settings.setValue("advanced/debugLogging", m_debugLogging);

    settings.sync();
    return settings.status() == QSettings::NoError;
}

bool FieldSyncConfig::initialize()
{
    if (m_dataDirectory.isEmpty()) {
        return false;
    }

    QDir dir(m_dataDirectory);
    if (!dir.exists() && !dir.mkpath(".")) {
        return false;
    }

    QString cacheDir = cacheDirectory();
    if (!QDir().mkpath(cacheDir)) {
        return false;
    }

    return save();
}

} // namespace FieldSync
