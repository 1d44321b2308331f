#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QStandardPaths>
#include <QTextStream>
#include <QDir>
#include <QDebug>

#include "fieldsync_version.h"
#include "fieldsyncconfig.h"
#include "app/consolelog.h"
#include "store/fieldworkstore.h"
#include "net/httptransport.h"
#include "net/connectivitymonitor.h"
#include "sync/syncengine.h"
#include "sync/synchandlerset.h"
#include "sync/syncscheduler.h"
#include "sync/handlers/fieldevidencehandler.h"
#include "storage/storagemanager.h"
#include "cache/cachemanager.h"
#include "preflight/preflightcheck.h"

using namespace FieldSync;

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitFailure = 1,
    ExitUsage = 2,
    ExitOffline = 3
};

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

HttpTransport *createTransport(const FieldSyncConfig &config, QObject *parent = nullptr)
{
    HttpTransport *transport = new HttpTransport(config.baseUrl(), parent);
    transport->setUploadPath(config.uploadPath());
    transport->setHealthPath(config.healthPath());
    transport->setAuthToken(config.authToken());
    transport->setRequestTimeout(config.requestTimeoutMs());
    return transport;
}

/**
 * @brief Everything one command needs, wired from the configuration
 */
class Application : public QObject
{
public:
    explicit Application(const FieldSyncConfig &config, ConsoleLog *log)
        : m_config(config)
        , m_log(log)
    {
        store = new FieldworkStore(config.databasePath(), this);
        transport = createTransport(config, this);

        SyncHandlerSet handlers = SyncHandlerSet::createDefault(store, transport);
        if (auto *evidence = qobject_cast<FieldEvidenceHandler*>(handlers.handlerFor(EntityType::FieldEvidence))) {
            evidence->setMaxUploadBytes(config.maxUploadBytes());
        }

        engine = new SyncEngine(store, handlers, this);
        engine->setDefaultMaxRetries(config.maxRetries());
        engine->setBackoff(config.backoffBaseMs(), config.backoffMultiplier());
        engine->setCompletedTtlHours(config.completedTtlHours());

        monitor = new ConnectivityMonitor(transport, this);
        monitor->setPollInterval(config.pollIntervalMs());
        monitor->setProbeTimeout(config.probeTimeoutMs());

        storage = new StorageManager(store, this);
        storage->setQuotaBytes(config.quotaBytes());

        cache = new CacheManager(config.cacheDirectory(), transport, this);
        cache->setQuestionnaireTypes(config.questionnaireTypes());

        preflight = new PreflightCheck(store, cache, storage, this);
        preflight->setFreeSpaceThresholds(config.minFreeMb(), config.warnFreeMb());

        scheduler = new SyncScheduler(engine, monitor, storage, this);
        scheduler->setReconnectDelay(config.reconnectDelayMs());
        scheduler->setPeriodicInterval(config.periodicIntervalMs());
        scheduler->setCleanupInterval(config.cleanupIntervalHours());
        scheduler->setRetentionDays(config.retentionDays());

        connectLogging();
    }

    bool openStore()
    {
        if (store->open()) {
            return true;
        }
        m_log->logError(QString("Cannot open local database %1: %2")
            .arg(store->databasePath(), store->lastErrorString()));
        return false;
    }

    const FieldSyncConfig &config() const { return m_config; }

    FieldworkStore *store = nullptr;
    HttpTransport *transport = nullptr;
    SyncEngine *engine = nullptr;
    ConnectivityMonitor *monitor = nullptr;
    StorageManager *storage = nullptr;
    CacheManager *cache = nullptr;
    PreflightCheck *preflight = nullptr;
    SyncScheduler *scheduler = nullptr;

private:
    void connectLogging()
    {
        connect(store, &FieldworkStore::errorOccurred, m_log, &ConsoleLog::logError);
        connect(engine, &SyncEngine::logMessage, m_log, &ConsoleLog::logInfo);
        connect(engine, &SyncEngine::errorOccurred, m_log, &ConsoleLog::logError);
        connect(engine, &SyncEngine::entryFailed, m_log, [this](const QString &entryId, const QString &error) {
            m_log->logWarning(QString("Entry %1 failed: %2").arg(entryId, error));
        });
        connect(engine, &SyncEngine::conflictDetected, m_log, [this](const QString &entryId, const QString &entityId) {
            m_log->logWarning(QString("Conflict on %1 (entry %2), resolve with: fieldsync resolve %2 keep-local|keep-server")
                .arg(entityId, entryId));
        });
        connect(monitor, &ConnectivityMonitor::statusChanged, m_log, [this](bool online) {
            m_log->logInfo(online ? QString("Connection restored") : QString("Connection lost, working offline"));
        });
        connect(storage, &StorageManager::logMessage, m_log, &ConsoleLog::logInfo);
        connect(storage, &StorageManager::errorOccurred, m_log, &ConsoleLog::logError);
        connect(cache, &CacheManager::logMessage, m_log, &ConsoleLog::logInfo);
        connect(cache, &CacheManager::errorOccurred, m_log, &ConsoleLog::logError);
        connect(scheduler, &SyncScheduler::logMessage, m_log, &ConsoleLog::logInfo);
    }

    FieldSyncConfig m_config;
    ConsoleLog *m_log = nullptr;
};

// ========== Commands ==========

int runInit(FieldSyncConfig &config)
{
    if (!config.initialize()) {
        qWarning() << "[main] Failed to initialize" << config.dataDirectory();
        return ExitFailure;
    }

    FieldworkStore store(config.databasePath());
    if (!store.open()) {
        out() << "Created " << config.configFilePath() << " but the database could not be opened: "
              << store.lastErrorString() << Qt::endl;
        return ExitFailure;
    }

    out() << "Data directory: " << config.dataDirectory() << Qt::endl;
    out() << "Configuration:  " << config.configFilePath() << Qt::endl;
    out() << "Database:       " << config.databasePath() << Qt::endl;
    out() << "Cache:          " << config.cacheDirectory() << Qt::endl;
    return ExitOk;
}

int runStatus(Application &app)
{
    SyncEngineStatus status = app.engine->getSyncStatus();
    out() << status.summary() << Qt::endl;
    if (!status.lastError.isEmpty()) {
        out() << "Last error: " << status.lastError << Qt::endl;
    }

    StorageEstimate estimate = app.storage->getStorageEstimate();
    if (estimate.isKnown()) {
        out() << QString("Storage: %1 MB used of %2 MB (%3%)")
                     .arg(estimate.usage / (1024 * 1024))
                     .arg(estimate.quota / (1024 * 1024))
                     .arg(qRound(estimate.usageRatio() * 100))
              << Qt::endl;
    } else {
        out() << "Storage: unknown" << Qt::endl;
    }

    const QList<CachedReview> reviews = app.cache->getCachedReviews();
    out() << "Cached reviews: " << reviews.size() << Qt::endl;
    for (const CachedReview &review : reviews) {
        out() << "  " << review.reviewId << "  cached " << toIsoString(review.cachedAt) << Qt::endl;
    }

    const QList<SyncQueueEntry> conflicts = app.engine->conflicts();
    for (const SyncQueueEntry &entry : conflicts) {
        out() << "Conflict: entry " << entry.id << " " << entry.entityTypeName
              << " " << entry.entityId << " - " << entry.error << Qt::endl;
    }
    return ExitOk;
}

int runSync(Application &app)
{
    if (!app.monitor->checkNow()) {
        out() << "Server unreachable at " << app.transport->endpointDescription()
              << ", changes stay queued" << Qt::endl;
        return ExitOffline;
    }

    int synced = app.engine->processQueue();
    out() << "Synced " << synced << " change(s)" << Qt::endl;
    out() << app.engine->getSyncStatus().summary() << Qt::endl;
    return ExitOk;
}

int runCleanup(Application &app, int days)
{
    int removed = app.storage->clearOldSyncedData(days);
    if (removed < 0) {
        return ExitFailure;
    }
    int entries = app.engine->clearCompleted();
    out() << "Removed " << removed << " synced record(s) older than " << days << " day(s) and "
          << entries << " finished queue entr" << (entries == 1 ? "y" : "ies") << Qt::endl;
    return ExitOk;
}

int runExport(Application &app, const QString &reviewId, const QString &filePath)
{
    if (!app.storage->writeExport(reviewId, filePath)) {
        return ExitFailure;
    }
    out() << "Exported review " << reviewId << " to " << filePath << Qt::endl;
    return ExitOk;
}

int runCache(Application &app, const QString &reviewId)
{
    int stored = app.cache->fetchReviewNow(reviewId);
    if (!app.cache->isCachedForOffline(reviewId)) {
        out() << "Could not cache review " << reviewId << Qt::endl;
        return ExitFailure;
    }
    out() << "Cached " << stored << " response(s) for review " << reviewId << Qt::endl;
    return ExitOk;
}

int runPreflight(Application &app, const QString &reviewId)
{
    QObject::connect(app.preflight, &PreflightCheck::checkCompleted, [](const PreflightCheckResult &check) {
        out() << QString("[%1] %2: %3")
                     .arg(checkStatusToString(check.status).toUpper(), -7)
                     .arg(check.name, check.message)
              << Qt::endl;
    });

    PreflightResult result = app.preflight->run(reviewId);
    out() << (result.ready ? "Ready for offline fieldwork" : "Not ready for offline fieldwork") << Qt::endl;
    return result.ready ? ExitOk : ExitFailure;
}

int runResolve(Application &app, const QString &entryId, const QString &choice)
{
    ConflictResolution resolution;
    if (choice == "keep-local") {
        resolution = ConflictResolution::KeepLocal;
    } else if (choice == "keep-server") {
        resolution = ConflictResolution::KeepServer;
    } else {
        out() << "Unknown resolution: " << choice << " (use keep-local or keep-server)" << Qt::endl;
        return ExitUsage;
    }

    if (!app.engine->resolveConflict(entryId, resolution)) {
        return ExitFailure;
    }
    out() << "Resolved " << entryId << " (" << choice << ")" << Qt::endl;
    return ExitOk;
}

int runWatch(QCoreApplication &qapp, Application &app)
{
    FieldSyncConfig config = app.config();
    app.cache->startWorker([config]() { return createTransport(config); });

    app.monitor->attachPlatformEvents();
    app.monitor->start();
    app.scheduler->start();

    out() << "Watching " << app.transport->endpointDescription() << " (Ctrl+C to stop)" << Qt::endl;
    int rc = qapp.exec();

    app.scheduler->stop();
    app.monitor->destroy();
    app.cache->stopWorker();
    return rc;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("FieldSync");
    app.setApplicationVersion(FIELDSYNC_VERSION_STRING);
    app.setOrganizationName("FieldSync");

    QCommandLineParser parser;
    parser.setApplicationDescription("Offline fieldwork store and sync queue");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption("config", "Configuration file.", "file");
    QCommandLineOption dataDirOption("data-dir", "Data directory.", "dir");
    QCommandLineOption daysOption("days", "Retention in days for cleanup.", "n");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Enable debug output.");
    parser.addOption(configOption);
    parser.addOption(dataDirOption);
    parser.addOption(daysOption);
    parser.addOption(verboseOption);

    parser.addPositionalArgument("command",
        "status | sync | retry-failed | clear-completed | cleanup | export <reviewId> <file> |\n"
        "cache <reviewId> | preflight <reviewId> | resolve <entryId> keep-local|keep-server |\n"
        "watch | init");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(ExitUsage);
    }
    const QString command = args.first();

    // Configuration
    FieldSyncConfig config;
    if (parser.isSet(configOption)) {
        config = FieldSyncConfig::fromFile(parser.value(configOption));
    } else {
        QString dataDir = parser.isSet(dataDirOption)
            ? parser.value(dataDirOption)
            : QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        config = FieldSyncConfig(dataDir);
    }
    if (parser.isSet(dataDirOption)) {
        config.setDataDirectory(parser.value(dataDirOption));
    }

    bool verbose = parser.isSet(verboseOption) || config.debugLogging();
    QLoggingCategory::setFilterRules(verbose ? QStringLiteral("*.debug=true")
                                             : QStringLiteral("*.debug=false"));

    ConsoleLog log;
    log.setTimestamps(command == "watch");

    if (command == "init") {
        return runInit(config);
    }

    if (!config.exists()) {
        log.logWarning(QString("No configuration at %1, using defaults (run 'fieldsync init')")
            .arg(config.configFilePath()));
    }

    Application fieldsync(config, &log);
    if (!fieldsync.openStore()) {
        return ExitFailure;
    }

    auto requireArgs = [&](int count) {
        if (args.size() < count + 1) {
            out() << "Missing arguments for " << command << Qt::endl;
            return false;
        }
        return true;
    };

    if (command == "status") {
        return runStatus(fieldsync);
    }
    if (command == "sync") {
        return runSync(fieldsync);
    }
    if (command == "retry-failed") {
        int reset = fieldsync.engine->retryFailed();
        out() << "Re-armed " << reset << " failed entr" << (reset == 1 ? "y" : "ies") << Qt::endl;
        return ExitOk;
    }
    if (command == "clear-completed") {
        int removed = fieldsync.engine->clearCompleted();
        out() << "Removed " << removed << " finished entr" << (removed == 1 ? "y" : "ies") << Qt::endl;
        return ExitOk;
    }
    if (command == "cleanup") {
        bool ok = true;
        int days = parser.isSet(daysOption) ? parser.value(daysOption).toInt(&ok) : config.retentionDays();
        if (!ok || days < 0) {
            out() << "Invalid --days value: " << parser.value(daysOption) << Qt::endl;
            return ExitUsage;
        }
        return runCleanup(fieldsync, days);
    }
    if (command == "export") {
        return requireArgs(2) ? runExport(fieldsync, args.at(1), args.at(2)) : int(ExitUsage);
    }
    if (command == "cache") {
        return requireArgs(1) ? runCache(fieldsync, args.at(1)) : int(ExitUsage);
    }
    if (command == "preflight") {
        return requireArgs(1) ? runPreflight(fieldsync, args.at(1)) : int(ExitUsage);
    }
    if (command == "resolve") {
        return requireArgs(2) ? runResolve(fieldsync, args.at(1), args.at(2)) : int(ExitUsage);
    }
    if (command == "watch") {
        return runWatch(app, fieldsync);
    }

    out() << "Unknown command: " << command << Qt::endl;
    parser.showHelp(ExitUsage);
}
