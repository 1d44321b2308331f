#ifndef FIELDSYNCCONFIG_H
#define FIELDSYNCCONFIG_H

#include <QString>
#include <QStringList>
#include <QUrl>

namespace FieldSync {

/**
 * @brief Settings of one FieldSync installation
 *
 * Stored as an INI file, by default fieldsync.conf inside the data
 * directory, so the data directory carries its own configuration:
 * move the folder and the settings travel with it.
 *
 * Groups:
 *   - server/        remote endpoint and credentials
 *   - sync/          retry budget, backoff, scheduler intervals
 *   - connectivity/  probe timing
 *   - storage/       database location, retention, free space thresholds
 *   - cache/         read cache location and questionnaire types
 *   - evidence/      upload limits
 *   - advanced/      debugging
 */
class FieldSyncConfig
{
public:
    /**
     * @brief Configuration rooted at @p dataDirectory
     *
     * Existing settings are loaded when the config file is present.
     */
    explicit FieldSyncConfig(const QString &dataDirectory = QString());

    /**
     * @brief Configuration read from an explicit file
     *
     * storage/dataDirectory in the file decides where data lives; it
     * defaults to the file's directory.
     */
    static FieldSyncConfig fromFile(const QString &configFilePath);

    // ========== Locations ==========

    QString dataDirectory() const { return m_dataDirectory; }
    void setDataDirectory(const QString &path) { m_dataDirectory = path; }

    QString configFilePath() const;
    void setConfigFilePath(const QString &path) { m_configFilePath = path; }

    QString databasePath() const;

    /**
     * @brief Read cache root, "<dataDirectory>/cache" unless configured
     */
    QString cacheDirectory() const;
    void setCacheDirectory(const QString &path) { m_cacheDirectory = path; }

    bool exists() const;

    // ========== Server ==========

    QUrl baseUrl() const { return m_baseUrl; }
    void setBaseUrl(const QUrl &url) { m_baseUrl = url; }

    QString uploadPath() const { return m_uploadPath; }
    void setUploadPath(const QString &path) { m_uploadPath = path; }

    QString healthPath() const { return m_healthPath; }
    void setHealthPath(const QString &path) { m_healthPath = path; }

    QString authToken() const { return m_authToken; }
    void setAuthToken(const QString &token) { m_authToken = token; }

    int requestTimeoutMs() const { return m_requestTimeoutMs; }
    void setRequestTimeoutMs(int ms) { m_requestTimeoutMs = ms; }

    // ========== Sync ==========

    int maxRetries() const { return m_maxRetries; }
    void setMaxRetries(int retries) { m_maxRetries = retries; }

    int backoffBaseMs() const { return m_backoffBaseMs; }
    int backoffMultiplier() const { return m_backoffMultiplier; }
    void setBackoff(int baseMs, int multiplier) {
        m_backoffBaseMs = baseMs;
        m_backoffMultiplier = multiplier;
    }

    int completedTtlHours() const { return m_completedTtlHours; }
    void setCompletedTtlHours(int hours) { m_completedTtlHours = hours; }

    int reconnectDelayMs() const { return m_reconnectDelayMs; }
    void setReconnectDelayMs(int ms) { m_reconnectDelayMs = ms; }

    int periodicIntervalMs() const { return m_periodicIntervalMs; }
    void setPeriodicIntervalMs(int ms) { m_periodicIntervalMs = ms; }

    // ========== Connectivity ==========

    int pollIntervalMs() const { return m_pollIntervalMs; }
    void setPollIntervalMs(int ms) { m_pollIntervalMs = ms; }

    int probeTimeoutMs() const { return m_probeTimeoutMs; }
    void setProbeTimeoutMs(int ms) { m_probeTimeoutMs = ms; }

    // ========== Storage ==========

    int retentionDays() const { return m_retentionDays; }
    void setRetentionDays(int days) { m_retentionDays = days; }

    int minFreeMb() const { return m_minFreeMb; }
    int warnFreeMb() const { return m_warnFreeMb; }
    void setFreeSpaceThresholds(int minFreeMb, int warnFreeMb) {
        m_minFreeMb = minFreeMb;
        m_warnFreeMb = warnFreeMb;
    }

    qint64 quotaBytes() const { return m_quotaBytes; }
    void setQuotaBytes(qint64 bytes) { m_quotaBytes = bytes; }

    int cleanupIntervalHours() const { return m_cleanupIntervalHours; }
    void setCleanupIntervalHours(int hours) { m_cleanupIntervalHours = hours; }

    // ========== Cache / Evidence / Advanced ==========

    QStringList questionnaireTypes() const { return m_questionnaireTypes; }
    void setQuestionnaireTypes(const QStringList &types) { m_questionnaireTypes = types; }

    qint64 maxUploadBytes() const { return m_maxUploadBytes; }
    void setMaxUploadBytes(qint64 bytes) { m_maxUploadBytes = bytes; }

    bool debugLogging() const { return m_debugLogging; }
    void setDebugLogging(bool enabled) { m_debugLogging = enabled; }

    // ========== Persistence ==========

    bool load();
    bool save();

    /**
     * @brief Create the data and cache directories and write defaults
     */
    bool initialize();

    static const QString CONFIG_FILE_NAME;
    static const QString DATABASE_FILE_NAME;
    static const QString DEFAULT_BASE_URL;

private:
    QString m_dataDirectory;
    QString m_configFilePath;
    QString m_cacheDirectory;

    QUrl m_baseUrl;
    QString m_uploadPath;
    QString m_healthPath;
    QString m_authToken;
    int m_requestTimeoutMs;

    int m_maxRetries;
    int m_backoffBaseMs;
    int m_backoffMultiplier;
    int m_completedTtlHours;
    int m_reconnectDelayMs;
    int m_periodicIntervalMs;

    int m_pollIntervalMs;
    int m_probeTimeoutMs;

    int m_retentionDays;
    int m_minFreeMb;
    int m_warnFreeMb;
    qint64 m_quotaBytes;
    int m_cleanupIntervalHours;

    QStringList m_questionnaireTypes;
    qint64 m_maxUploadBytes;
    bool m_debugLogging;
};

} // namespace FieldSync

#endif // FIELDSYNCCONFIG_H
