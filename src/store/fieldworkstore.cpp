#include "fieldworkstore.h"

#include <QSqlQuery>
#include <QSqlError>
#include <QSqlRecord>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonArray>
#include <QUuid>
#include <QDebug>

namespace FieldSync {

const int FieldworkStore::SCHEMA_VERSION = 1;

namespace {

// Timestamps are stored as milliseconds since epoch so that ordering and
// retention cutoffs are plain integer comparisons.
QVariant msOrNull(const QDateTime &dt)
{
    if (!dt.isValid()) {
        return QVariant();
    }
    return dt.toMSecsSinceEpoch();
}

QDateTime dateFromMs(const QVariant &value)
{
    if (value.isNull()) {
        return QDateTime();
    }
    return QDateTime::fromMSecsSinceEpoch(value.toLongLong(), Qt::UTC);
}

QVariant doubleOrNull(bool valid, double value)
{
    return valid ? QVariant(value) : QVariant();
}

QVariant textOrNull(const QString &value)
{
    return value.isEmpty() ? QVariant() : QVariant(value);
}

const char *EVIDENCE_COLUMNS =
    "id, checklist_item_id, review_id, type, mime_type, file_name, file_size, "
    "gps_latitude, gps_longitude, gps_accuracy, captured_at, annotation, "
    "marked_for_deletion, sync_status";

const char *QUEUE_COLUMNS =
    "id, entity_type, entity_id, action, payload, retry_count, max_retries, "
    "last_attempt, error, created_at, conflicted, server_snapshot";

} // namespace

FieldworkStore::FieldworkStore(const QString &databasePath, QObject *parent)
    : QObject(parent)
    , m_databasePath(databasePath)
    , m_connectionName(QString("fieldwork-%1").arg(QUuid::createUuid().toString(QUuid::WithoutBraces)))
{
}

FieldworkStore::~FieldworkStore()
{
    close();
}

// ========== Lifecycle ==========

bool FieldworkStore::open()
{
    if (m_db.isOpen()) {
        return true;
    }

    QFileInfo info(m_databasePath);
    QDir dir = info.absoluteDir();
    if (!dir.exists() && !dir.mkpath(".")) {
        setError(StoreError::StorageUnavailable,
                 QString("Cannot create data directory: %1").arg(dir.absolutePath()));
        return false;
    }

    m_db = QSqlDatabase::addDatabase("QSQLITE", m_connectionName);
    if (!m_db.isValid()) {
        setError(StoreError::StorageUnavailable, "SQLite driver is not available");
        m_db = QSqlDatabase();
        QSqlDatabase::removeDatabase(m_connectionName);
        return false;
    }

    m_db.setDatabaseName(m_databasePath);
    if (!m_db.open()) {
        setError(StoreError::StorageUnavailable,
                 QString("Cannot open local store %1: %2")
                     .arg(m_databasePath, m_db.lastError().text()));
        return false;
    }

    QSqlQuery pragma(m_db);
    pragma.exec("PRAGMA journal_mode=WAL");
    pragma.exec("PRAGMA busy_timeout = 5000");

    if (!createSchema()) {
        m_db.close();
        return false;
    }

    clearError();
    qDebug() << "[FieldworkStore] Opened" << m_databasePath;
    return true;
}

void FieldworkStore::close()
{
    if (!m_db.isValid()) {
        return;
    }

    if (m_db.isOpen()) {
        if (m_transactionDepth > 0) {
            m_db.rollback();
            m_transactionDepth = 0;
        }
        m_db.close();
    }

    // removeDatabase() must only run once no QSqlDatabase handle is alive
    m_db = QSqlDatabase();
    QSqlDatabase::removeDatabase(m_connectionName);
}

bool FieldworkStore::isOpen() const
{
    return m_db.isValid() && m_db.isOpen();
}

bool FieldworkStore::isAvailable() const
{
    return isOpen();
}

bool FieldworkStore::checkWritable()
{
    if (!ensureAvailable()) {
        return false;
    }

    OfflineSession probe;
    probe.id = QString("__preflight_%1").arg(QDateTime::currentMSecsSinceEpoch());
    probe.reviewId = "__test__";
    probe.userId = "__test__";
    probe.startedAt = QDateTime::currentDateTimeUtc();

    if (!putSession(probe)) {
        setError(StoreError::StorageUnavailable,
                 QString("Local store is not writable: %1").arg(m_lastErrorString));
        return false;
    }
    if (!deleteSession(probe.id)) {
        setError(StoreError::StorageUnavailable,
                 QString("Local store is not writable: %1").arg(m_lastErrorString));
        return false;
    }
    return true;
}

QStringList FieldworkStore::storageFiles() const
{
    return {m_databasePath, m_databasePath + "-wal", m_databasePath + "-shm"};
}

bool FieldworkStore::createSchema()
{
    QSqlQuery query(m_db);

    const QStringList statements = {
        R"(
        CREATE TABLE IF NOT EXISTS checklist_items (
            id TEXT PRIMARY KEY,
            review_id TEXT NOT NULL,
            item_code TEXT,
            label TEXT,
            phase TEXT NOT NULL DEFAULT 'on-site',
            sort_order INTEGER NOT NULL DEFAULT 0,
            is_completed INTEGER NOT NULL DEFAULT 0,
            completed_at INTEGER,
            completed_by_id TEXT,
            notes TEXT,
            updated_at INTEGER,
            sync_status TEXT NOT NULL DEFAULT 'pending'
        )
        )",
        R"(
        CREATE TABLE IF NOT EXISTS field_evidence (
            id TEXT PRIMARY KEY,
            checklist_item_id TEXT NOT NULL,
            review_id TEXT NOT NULL,
            type TEXT NOT NULL,
            blob BLOB,
            thumbnail BLOB,
            mime_type TEXT,
            file_name TEXT,
            file_size INTEGER NOT NULL DEFAULT 0,
            gps_latitude REAL,
            gps_longitude REAL,
            gps_accuracy REAL,
            captured_at INTEGER,
            annotation TEXT,
            marked_for_deletion INTEGER NOT NULL DEFAULT 0,
            sync_status TEXT NOT NULL DEFAULT 'pending'
        )
        )",
        R"(
        CREATE TABLE IF NOT EXISTS draft_findings (
            id TEXT PRIMARY KEY,
            review_id TEXT NOT NULL,
            title TEXT,
            description TEXT,
            severity TEXT NOT NULL DEFAULT 'observation',
            area_code TEXT,
            question_id TEXT,
            evidence_ids TEXT,
            gps_latitude REAL,
            gps_longitude REAL,
            created_at INTEGER,
            updated_at INTEGER,
            marked_for_deletion INTEGER NOT NULL DEFAULT 0,
            sync_status TEXT NOT NULL DEFAULT 'pending'
        )
        )",
        R"(
        CREATE TABLE IF NOT EXISTS sync_queue (
            id TEXT PRIMARY KEY,
            entity_type TEXT NOT NULL,
            entity_id TEXT NOT NULL,
            action TEXT NOT NULL,
            payload BLOB,
            retry_count INTEGER NOT NULL DEFAULT 0,
            max_retries INTEGER NOT NULL DEFAULT 3,
            last_attempt INTEGER,
            error TEXT,
            created_at INTEGER NOT NULL,
            conflicted INTEGER NOT NULL DEFAULT 0,
            server_snapshot BLOB
        )
        )",
        R"(
        CREATE TABLE IF NOT EXISTS offline_sessions (
            id TEXT PRIMARY KEY,
            review_id TEXT NOT NULL,
            user_id TEXT,
            started_at INTEGER,
            ended_at INTEGER,
            device_info TEXT,
            synced_at INTEGER
        )
        )",
        "CREATE TABLE IF NOT EXISTS store_meta (key TEXT PRIMARY KEY, value TEXT)",
        "CREATE TABLE IF NOT EXISTS schema_version (version INTEGER PRIMARY KEY)",
        "CREATE INDEX IF NOT EXISTS idx_checklist_review ON checklist_items(review_id)",
        "CREATE INDEX IF NOT EXISTS idx_checklist_status ON checklist_items(sync_status)",
        "CREATE INDEX IF NOT EXISTS idx_evidence_review ON field_evidence(review_id)",
        "CREATE INDEX IF NOT EXISTS idx_evidence_item ON field_evidence(checklist_item_id)",
        "CREATE INDEX IF NOT EXISTS idx_evidence_status ON field_evidence(sync_status)",
        "CREATE INDEX IF NOT EXISTS idx_findings_review ON draft_findings(review_id)",
        "CREATE INDEX IF NOT EXISTS idx_findings_status ON draft_findings(sync_status)",
        "CREATE INDEX IF NOT EXISTS idx_queue_created ON sync_queue(created_at)",
        "CREATE INDEX IF NOT EXISTS idx_queue_entity ON sync_queue(entity_type, entity_id)",
        "CREATE INDEX IF NOT EXISTS idx_sessions_review ON offline_sessions(review_id)"
    };

    for (const QString &sql : statements) {
        if (!query.exec(sql)) {
            setError(StoreError::StorageUnavailable,
                     QString("Failed to create schema: %1").arg(query.lastError().text()));
            return false;
        }
    }

    int version = 0;
    if (query.exec("SELECT MAX(version) FROM schema_version") && query.next()) {
        version = query.value(0).toInt();
    }

    if (version < SCHEMA_VERSION) {
        query.prepare("INSERT OR REPLACE INTO schema_version (version) VALUES (?)");
        query.addBindValue(SCHEMA_VERSION);
        if (!query.exec()) {
            setError(StoreError::StorageUnavailable,
                     QString("Failed to record schema version: %1").arg(query.lastError().text()));
            return false;
        }
        qDebug() << "[FieldworkStore] Schema at version" << SCHEMA_VERSION;
    }

    return true;
}

// ========== Error helpers ==========

bool FieldworkStore::ensureAvailable() const
{
    if (isOpen()) {
        return true;
    }
    setError(StoreError::StorageUnavailable,
             QString("Local store is not available: %1").arg(m_databasePath));
    return false;
}

bool FieldworkStore::exec(QSqlQuery &query) const
{
    if (query.exec()) {
        return true;
    }

    QSqlError err = query.lastError();

    // Primary SQLite result codes that mean the storage itself is unusable:
    // 8 READONLY, 10 IOERR, 13 FULL, 14 CANTOPEN, 26 NOTADB
    int code = err.nativeErrorCode().toInt() & 0xff;
    bool storageFault = code == 8 || code == 10 || code == 13 || code == 14 || code == 26;

    setError(storageFault ? StoreError::StorageUnavailable : StoreError::QueryFailed,
             err.text());
    return false;
}

void FieldworkStore::setError(StoreError error, const QString &message) const
{
    m_lastError = error;
    m_lastErrorString = message;
    qWarning() << "[FieldworkStore]" << message;
    emit const_cast<FieldworkStore *>(this)->errorOccurred(message);
}

void FieldworkStore::clearError() const
{
    m_lastError = StoreError::None;
    m_lastErrorString.clear();
}

// ========== Transactions ==========

bool FieldworkStore::beginTransaction()
{
    if (!ensureAvailable()) {
        return false;
    }

    if (m_transactionDepth == 0) {
        if (!m_db.transaction()) {
            setError(StoreError::StorageUnavailable,
                     QString("Cannot begin transaction: %1").arg(m_db.lastError().text()));
            return false;
        }
        m_rollbackOnly = false;
    }
    m_transactionDepth++;
    return true;
}

bool FieldworkStore::commit()
{
    if (m_transactionDepth == 0) {
        return false;
    }

    m_transactionDepth--;
    if (m_transactionDepth > 0) {
        return true;
    }

    if (m_rollbackOnly) {
        m_db.rollback();
        m_rollbackOnly = false;
        setError(StoreError::QueryFailed, "Transaction rolled back by a nested failure");
        return false;
    }

    if (!m_db.commit()) {
        QString message = m_db.lastError().text();
        m_db.rollback();
        setError(StoreError::StorageUnavailable, QString("Commit failed: %1").arg(message));
        return false;
    }
    return true;
}

void FieldworkStore::rollback()
{
    if (m_transactionDepth == 0) {
        return;
    }

    m_transactionDepth--;
    if (m_transactionDepth > 0) {
        m_rollbackOnly = true;
        return;
    }

    m_db.rollback();
    m_rollbackOnly = false;
}

bool FieldworkStore::runInTransaction(const std::function<bool()> &work)
{
    if (!beginTransaction()) {
        return false;
    }

    if (!work()) {
        rollback();
        return false;
    }

    return commit();
}

// ========== Filters ==========

QString FieldworkStore::tableFor(EntityType type)
{
    switch (type) {
    case EntityType::ChecklistItem: return "checklist_items";
    case EntityType::FieldEvidence: return "field_evidence";
    case EntityType::DraftFinding: return "draft_findings";
    case EntityType::OfflineSession: return "offline_sessions";
    }
    return QString();
}

QString FieldworkStore::whereClause(const RecordFilter &filter, bool hasChecklistColumn)
{
    QStringList conditions;
    if (!filter.reviewId.isEmpty()) {
        conditions << "review_id = :review_id";
    }
    if (hasChecklistColumn && !filter.checklistItemId.isEmpty()) {
        conditions << "checklist_item_id = :checklist_item_id";
    }
    if (filter.filterStatus) {
        conditions << "sync_status = :sync_status";
    }
    if (conditions.isEmpty()) {
        return QString();
    }
    return " WHERE " + conditions.join(" AND ");
}

void FieldworkStore::bindFilter(QSqlQuery &query, const RecordFilter &filter)
{
    if (!filter.reviewId.isEmpty()) {
        query.bindValue(":review_id", filter.reviewId);
    }
    if (!filter.checklistItemId.isEmpty()) {
        query.bindValue(":checklist_item_id", filter.checklistItemId);
    }
    if (filter.filterStatus) {
        query.bindValue(":sync_status", syncStatusToString(filter.status));
    }
}

// ========== Checklist items ==========

bool FieldworkStore::putChecklistItem(const ChecklistItem &item)
{
    if (!ensureAvailable()) return false;

    QSqlQuery query(m_db);
    query.prepare(R"(
        INSERT OR REPLACE INTO checklist_items
            (id, review_id, item_code, label, phase, sort_order, is_completed,
             completed_at, completed_by_id, notes, updated_at, sync_status)
        VALUES
            (:id, :review_id, :item_code, :label, :phase, :sort_order, :is_completed,
             :completed_at, :completed_by_id, :notes, :updated_at, :sync_status)
    )");
    query.bindValue(":id", item.id);
    query.bindValue(":review_id", item.reviewId);
    query.bindValue(":item_code", item.itemCode);
    query.bindValue(":label", item.label);
    query.bindValue(":phase", checklistPhaseToString(item.phase));
    query.bindValue(":sort_order", item.sortOrder);
    query.bindValue(":is_completed", item.isCompleted ? 1 : 0);
    query.bindValue(":completed_at", msOrNull(item.completedAt));
    query.bindValue(":completed_by_id", textOrNull(item.completedById));
    query.bindValue(":notes", item.notes);
    query.bindValue(":updated_at", msOrNull(item.updatedAt));
    query.bindValue(":sync_status", syncStatusToString(item.syncStatus));
    return exec(query);
}

ChecklistItem FieldworkStore::checklistItem(const QString &id) const
{
    if (!ensureAvailable()) return ChecklistItem();

    QSqlQuery query(m_db);
    query.prepare("SELECT * FROM checklist_items WHERE id = ?");
    query.addBindValue(id);
    if (!exec(query) || !query.next()) {
        return ChecklistItem();
    }
    return checklistItemFromQuery(query);
}

QList<ChecklistItem> FieldworkStore::checklistItems(const RecordFilter &filter,
                                                    const std::function<bool(const ChecklistItem &)> &predicate) const
{
    QList<ChecklistItem> items;
    if (!ensureAvailable()) return items;

    QSqlQuery query(m_db);
    query.prepare("SELECT * FROM checklist_items" + whereClause(filter, false)
                  + " ORDER BY sort_order, rowid");
    bindFilter(query, filter);
    if (!exec(query)) {
        return items;
    }

    while (query.next()) {
        ChecklistItem item = checklistItemFromQuery(query);
        if (!predicate || predicate(item)) {
            items.append(item);
        }
    }
    return items;
}

bool FieldworkStore::deleteChecklistItem(const QString &id)
{
    return deleteEntity(EntityType::ChecklistItem, id);
}

ChecklistItem FieldworkStore::checklistItemFromQuery(const QSqlQuery &query) const
{
    ChecklistItem item;
    item.id = query.value("id").toString();
    item.reviewId = query.value("review_id").toString();
    item.itemCode = query.value("item_code").toString();
    item.label = query.value("label").toString();
    item.phase = checklistPhaseFromString(query.value("phase").toString());
    item.sortOrder = query.value("sort_order").toInt();
    item.isCompleted = query.value("is_completed").toInt() != 0;
    item.completedAt = dateFromMs(query.value("completed_at"));
    item.completedById = query.value("completed_by_id").toString();
    item.notes = query.value("notes").toString();
    item.updatedAt = dateFromMs(query.value("updated_at"));
    item.syncStatus = syncStatusFromString(query.value("sync_status").toString());
    return item;
}

// ========== Field evidence ==========

bool FieldworkStore::putEvidence(const FieldEvidence &evidence)
{
    if (!ensureAvailable()) return false;

    QSqlQuery query(m_db);
    query.prepare(R"(
        INSERT OR REPLACE INTO field_evidence
            (id, checklist_item_id, review_id, type, blob, thumbnail, mime_type,
             file_name, file_size, gps_latitude, gps_longitude, gps_accuracy,
             captured_at, annotation, marked_for_deletion, sync_status)
        VALUES
            (:id, :checklist_item_id, :review_id, :type, :blob, :thumbnail, :mime_type,
             :file_name, :file_size, :gps_latitude, :gps_longitude, :gps_accuracy,
             :captured_at, :annotation, :marked_for_deletion, :sync_status)
    )");
    query.bindValue(":id", evidence.id);
    query.bindValue(":checklist_item_id", evidence.checklistItemId);
    query.bindValue(":review_id", evidence.reviewId);
    query.bindValue(":type", evidenceTypeToString(evidence.type));
    query.bindValue(":blob", evidence.blob);
    query.bindValue(":thumbnail", evidence.thumbnail.isEmpty() ? QVariant() : QVariant(evidence.thumbnail));
    query.bindValue(":mime_type", evidence.mimeType);
    query.bindValue(":file_name", evidence.fileName);
    query.bindValue(":file_size", evidence.fileSize);
    query.bindValue(":gps_latitude", doubleOrNull(evidence.gps.valid, evidence.gps.latitude));
    query.bindValue(":gps_longitude", doubleOrNull(evidence.gps.valid, evidence.gps.longitude));
    query.bindValue(":gps_accuracy", doubleOrNull(evidence.gps.valid && evidence.gps.accuracy >= 0,
                                                  evidence.gps.accuracy));
    query.bindValue(":captured_at", msOrNull(evidence.capturedAt));
    query.bindValue(":annotation", evidence.annotation);
    query.bindValue(":marked_for_deletion", evidence.markedForDeletion ? 1 : 0);
    query.bindValue(":sync_status", syncStatusToString(evidence.syncStatus));
    return exec(query);
}

FieldEvidence FieldworkStore::evidence(const QString &id) const
{
    if (!ensureAvailable()) return FieldEvidence();

    QSqlQuery query(m_db);
    query.prepare(QString("SELECT %1, blob, thumbnail FROM field_evidence WHERE id = ?")
                      .arg(EVIDENCE_COLUMNS));
    query.addBindValue(id);
    if (!exec(query) || !query.next()) {
        return FieldEvidence();
    }
    return evidenceFromQuery(query, true);
}

QList<FieldEvidence> FieldworkStore::evidenceRecords(const RecordFilter &filter, bool withBlobs,
                                                     const std::function<bool(const FieldEvidence &)> &predicate) const
{
    QList<FieldEvidence> records;
    if (!ensureAvailable()) return records;

    QString columns = EVIDENCE_COLUMNS;
    if (withBlobs) {
        columns += ", blob, thumbnail";
    }

    QSqlQuery query(m_db);
    query.prepare(QString("SELECT %1 FROM field_evidence").arg(columns)
                  + whereClause(filter, true) + " ORDER BY captured_at, rowid");
    bindFilter(query, filter);
    if (!exec(query)) {
        return records;
    }

    while (query.next()) {
        FieldEvidence record = evidenceFromQuery(query, withBlobs);
        if (!predicate || predicate(record)) {
            records.append(record);
        }
    }
    return records;
}

bool FieldworkStore::deleteEvidence(const QString &id)
{
    return deleteEntity(EntityType::FieldEvidence, id);
}

bool FieldworkStore::updateEvidenceBlob(const QString &id, const QByteArray &blob,
                                        const QByteArray &thumbnail, const QString &annotation)
{
    if (!ensureAvailable()) return false;

    QSqlQuery query(m_db);
    query.prepare(R"(
        UPDATE field_evidence
        SET blob = :blob, thumbnail = :thumbnail, file_size = :file_size, annotation = :annotation
        WHERE id = :id
    )");
    query.bindValue(":blob", blob);
    query.bindValue(":thumbnail", thumbnail.isEmpty() ? QVariant() : QVariant(thumbnail));
    query.bindValue(":file_size", static_cast<qint64>(blob.size()));
    query.bindValue(":annotation", annotation);
    query.bindValue(":id", id);
    if (!exec(query)) {
        return false;
    }
    if (query.numRowsAffected() == 0) {
        setError(StoreError::NotFound, QString("Evidence not found: %1").arg(id));
        return false;
    }
    return true;
}

FieldEvidence FieldworkStore::evidenceFromQuery(const QSqlQuery &query, bool withBlobs) const
{
    FieldEvidence record;
    record.id = query.value("id").toString();
    record.checklistItemId = query.value("checklist_item_id").toString();
    record.reviewId = query.value("review_id").toString();
    record.type = evidenceTypeFromString(query.value("type").toString());
    record.mimeType = query.value("mime_type").toString();
    record.fileName = query.value("file_name").toString();
    record.fileSize = query.value("file_size").toLongLong();

    QVariant lat = query.value("gps_latitude");
    QVariant lon = query.value("gps_longitude");
    if (!lat.isNull() && !lon.isNull()) {
        record.gps.valid = true;
        record.gps.latitude = lat.toDouble();
        record.gps.longitude = lon.toDouble();
        QVariant acc = query.value("gps_accuracy");
        record.gps.accuracy = acc.isNull() ? -1.0 : acc.toDouble();
    }

    record.capturedAt = dateFromMs(query.value("captured_at"));
    record.annotation = query.value("annotation").toString();
    record.markedForDeletion = query.value("marked_for_deletion").toInt() != 0;
    record.syncStatus = syncStatusFromString(query.value("sync_status").toString());

    if (withBlobs) {
        record.blob = query.value("blob").toByteArray();
        record.thumbnail = query.value("thumbnail").toByteArray();
    }
    return record;
}

// ========== Draft findings ==========

bool FieldworkStore::putDraftFinding(const DraftFinding &finding)
{
    if (!ensureAvailable()) return false;

    QSqlQuery query(m_db);
    query.prepare(R"(
        INSERT OR REPLACE INTO draft_findings
            (id, review_id, title, description, severity, area_code, question_id,
             evidence_ids, gps_latitude, gps_longitude, created_at, updated_at,
             marked_for_deletion, sync_status)
        VALUES
            (:id, :review_id, :title, :description, :severity, :area_code, :question_id,
             :evidence_ids, :gps_latitude, :gps_longitude, :created_at, :updated_at,
             :marked_for_deletion, :sync_status)
    )");
    query.bindValue(":id", finding.id);
    query.bindValue(":review_id", finding.reviewId);
    query.bindValue(":title", finding.title);
    query.bindValue(":description", finding.description);
    query.bindValue(":severity", findingSeverityToString(finding.severity));
    query.bindValue(":area_code", finding.areaCode);
    query.bindValue(":question_id", textOrNull(finding.questionId));
    query.bindValue(":evidence_ids", QString::fromUtf8(
        QJsonDocument(QJsonArray::fromStringList(finding.evidenceIds)).toJson(QJsonDocument::Compact)));
    query.bindValue(":gps_latitude", doubleOrNull(finding.gps.valid, finding.gps.latitude));
    query.bindValue(":gps_longitude", doubleOrNull(finding.gps.valid, finding.gps.longitude));
    query.bindValue(":created_at", msOrNull(finding.createdAt));
    query.bindValue(":updated_at", msOrNull(finding.updatedAt));
    query.bindValue(":marked_for_deletion", finding.markedForDeletion ? 1 : 0);
    query.bindValue(":sync_status", syncStatusToString(finding.syncStatus));
    return exec(query);
}

DraftFinding FieldworkStore::draftFinding(const QString &id) const
{
    if (!ensureAvailable()) return DraftFinding();

    QSqlQuery query(m_db);
    query.prepare("SELECT * FROM draft_findings WHERE id = ?");
    query.addBindValue(id);
    if (!exec(query) || !query.next()) {
        return DraftFinding();
    }
    return draftFindingFromQuery(query);
}

QList<DraftFinding> FieldworkStore::draftFindings(const RecordFilter &filter,
                                                  const std::function<bool(const DraftFinding &)> &predicate) const
{
    QList<DraftFinding> findings;
    if (!ensureAvailable()) return findings;

    QSqlQuery query(m_db);
    query.prepare("SELECT * FROM draft_findings" + whereClause(filter, false)
                  + " ORDER BY created_at, rowid");
    bindFilter(query, filter);
    if (!exec(query)) {
        return findings;
    }

    while (query.next()) {
        DraftFinding finding = draftFindingFromQuery(query);
        if (!predicate || predicate(finding)) {
            findings.append(finding);
        }
    }
    return findings;
}

bool FieldworkStore::deleteDraftFinding(const QString &id)
{
    return deleteEntity(EntityType::DraftFinding, id);
}

DraftFinding FieldworkStore::draftFindingFromQuery(const QSqlQuery &query) const
{
    DraftFinding finding;
    finding.id = query.value("id").toString();
    finding.reviewId = query.value("review_id").toString();
    finding.title = query.value("title").toString();
    finding.description = query.value("description").toString();
    finding.severity = findingSeverityFromString(query.value("severity").toString());
    finding.areaCode = query.value("area_code").toString();
    finding.questionId = query.value("question_id").toString();

    const QJsonArray ids = QJsonDocument::fromJson(query.value("evidence_ids").toByteArray()).array();
    for (const QJsonValue &val : ids) {
        finding.evidenceIds << val.toString();
    }

    QVariant lat = query.value("gps_latitude");
    QVariant lon = query.value("gps_longitude");
    if (!lat.isNull() && !lon.isNull()) {
        finding.gps.valid = true;
        finding.gps.latitude = lat.toDouble();
        finding.gps.longitude = lon.toDouble();
    }

    finding.createdAt = dateFromMs(query.value("created_at"));
    finding.updatedAt = dateFromMs(query.value("updated_at"));
    finding.markedForDeletion = query.value("marked_for_deletion").toInt() != 0;
    finding.syncStatus = syncStatusFromString(query.value("sync_status").toString());
    return finding;
}

// ========== Offline sessions ==========

bool FieldworkStore::putSession(const OfflineSession &session)
{
    if (!ensureAvailable()) return false;

    QSqlQuery query(m_db);
    query.prepare(R"(
        INSERT OR REPLACE INTO offline_sessions
            (id, review_id, user_id, started_at, ended_at, device_info, synced_at)
        VALUES
            (:id, :review_id, :user_id, :started_at, :ended_at, :device_info, :synced_at)
    )");
    query.bindValue(":id", session.id);
    query.bindValue(":review_id", session.reviewId);
    query.bindValue(":user_id", session.userId);
    query.bindValue(":started_at", msOrNull(session.startedAt));
    query.bindValue(":ended_at", msOrNull(session.endedAt));
    query.bindValue(":device_info", session.deviceInfo);
    query.bindValue(":synced_at", msOrNull(session.syncedAt));
    return exec(query);
}

OfflineSession FieldworkStore::session(const QString &id) const
{
    if (!ensureAvailable()) return OfflineSession();

    QSqlQuery query(m_db);
    query.prepare("SELECT * FROM offline_sessions WHERE id = ?");
    query.addBindValue(id);
    if (!exec(query) || !query.next()) {
        return OfflineSession();
    }
    return sessionFromQuery(query);
}

QList<OfflineSession> FieldworkStore::sessionsForReview(const QString &reviewId) const
{
    QList<OfflineSession> sessions;
    if (!ensureAvailable()) return sessions;

    QSqlQuery query(m_db);
    query.prepare("SELECT * FROM offline_sessions WHERE review_id = ? ORDER BY started_at, rowid");
    query.addBindValue(reviewId);
    if (!exec(query)) {
        return sessions;
    }
    while (query.next()) {
        sessions.append(sessionFromQuery(query));
    }
    return sessions;
}

bool FieldworkStore::deleteSession(const QString &id)
{
    return deleteEntity(EntityType::OfflineSession, id);
}

OfflineSession FieldworkStore::sessionFromQuery(const QSqlQuery &query) const
{
    OfflineSession session;
    session.id = query.value("id").toString();
    session.reviewId = query.value("review_id").toString();
    session.userId = query.value("user_id").toString();
    session.startedAt = dateFromMs(query.value("started_at"));
    session.endedAt = dateFromMs(query.value("ended_at"));
    session.deviceInfo = query.value("device_info").toString();
    session.syncedAt = dateFromMs(query.value("synced_at"));
    return session;
}

// ========== Sync queue ==========

bool FieldworkStore::addQueueEntry(const SyncQueueEntry &entry)
{
    if (!ensureAvailable()) return false;

    QSqlQuery query(m_db);
    query.prepare(QString("INSERT INTO sync_queue (%1) VALUES "
                          "(:id, :entity_type, :entity_id, :action, :payload, :retry_count, "
                          ":max_retries, :last_attempt, :error, :created_at, :conflicted, "
                          ":server_snapshot)").arg(QUEUE_COLUMNS));
    query.bindValue(":id", entry.id);
    query.bindValue(":entity_type", entry.entityTypeKnown ? entityTypeToString(entry.entityType)
                                                          : entry.entityTypeName);
    query.bindValue(":entity_id", entry.entityId);
    query.bindValue(":action", syncActionToString(entry.action));
    query.bindValue(":payload", entry.payload);
    query.bindValue(":retry_count", entry.retryCount);
    query.bindValue(":max_retries", entry.maxRetries);
    query.bindValue(":last_attempt", msOrNull(entry.lastAttempt));
    query.bindValue(":error", textOrNull(entry.error));
    query.bindValue(":created_at", entry.createdAt.isValid()
                                       ? entry.createdAt.toMSecsSinceEpoch()
                                       : QDateTime::currentMSecsSinceEpoch());
    query.bindValue(":conflicted", entry.conflicted ? 1 : 0);
    query.bindValue(":server_snapshot", entry.serverSnapshot.isEmpty() ? QVariant()
                                                                       : QVariant(entry.serverSnapshot));
    return exec(query);
}

bool FieldworkStore::updateQueueEntry(const SyncQueueEntry &entry)
{
    if (!ensureAvailable()) return false;

    // Entity identity and creation time are immutable; FIFO order depends on them
    QSqlQuery query(m_db);
    query.prepare(R"(
        UPDATE sync_queue
        SET payload = :payload, retry_count = :retry_count, max_retries = :max_retries,
            last_attempt = :last_attempt, error = :error, conflicted = :conflicted,
            server_snapshot = :server_snapshot
        WHERE id = :id
    )");
    query.bindValue(":payload", entry.payload);
    query.bindValue(":retry_count", entry.retryCount);
    query.bindValue(":max_retries", entry.maxRetries);
    query.bindValue(":last_attempt", msOrNull(entry.lastAttempt));
    query.bindValue(":error", textOrNull(entry.error));
    query.bindValue(":conflicted", entry.conflicted ? 1 : 0);
    query.bindValue(":server_snapshot", entry.serverSnapshot.isEmpty() ? QVariant()
                                                                       : QVariant(entry.serverSnapshot));
    query.bindValue(":id", entry.id);
    if (!exec(query)) {
        return false;
    }
    if (query.numRowsAffected() == 0) {
        setError(StoreError::NotFound, QString("Queue entry not found: %1").arg(entry.id));
        return false;
    }
    return true;
}

SyncQueueEntry FieldworkStore::queueEntry(const QString &id) const
{
    QList<SyncQueueEntry> entries = selectQueue(
        QString("SELECT %1 FROM sync_queue WHERE id = ?").arg(QUEUE_COLUMNS), {id});
    return entries.isEmpty() ? SyncQueueEntry() : entries.first();
}

QList<SyncQueueEntry> FieldworkStore::queueEntries() const
{
    return selectQueue(QString("SELECT %1 FROM sync_queue ORDER BY created_at, rowid")
                           .arg(QUEUE_COLUMNS));
}

QList<SyncQueueEntry> FieldworkStore::eligibleQueueEntries() const
{
    return selectQueue(QString("SELECT %1 FROM sync_queue WHERE retry_count < max_retries "
                               "ORDER BY created_at, rowid").arg(QUEUE_COLUMNS));
}

QList<SyncQueueEntry> FieldworkStore::queueEntriesForEntity(EntityType type, const QString &entityId) const
{
    return selectQueue(QString("SELECT %1 FROM sync_queue WHERE entity_type = ? AND entity_id = ? "
                               "ORDER BY created_at, rowid").arg(QUEUE_COLUMNS),
                       {entityTypeToString(type), entityId});
}

bool FieldworkStore::deleteQueueEntry(const QString &id)
{
    if (!ensureAvailable()) return false;

    QSqlQuery query(m_db);
    query.prepare("DELETE FROM sync_queue WHERE id = ?");
    query.addBindValue(id);
    return exec(query);
}

int FieldworkStore::deleteQueueEntries(const QStringList &ids)
{
    if (!ensureAvailable()) return -1;
    if (ids.isEmpty()) return 0;

    int removed = 0;
    bool ok = runInTransaction([&]() {
        QSqlQuery query(m_db);
        query.prepare("DELETE FROM sync_queue WHERE id = ?");
        for (const QString &id : ids) {
            query.bindValue(0, id);
            if (!exec(query)) {
                return false;
            }
            removed += query.numRowsAffected();
        }
        return true;
    });
    return ok ? removed : -1;
}

QList<SyncQueueEntry> FieldworkStore::selectQueue(const QString &sql, const QVariantList &bindings) const
{
    QList<SyncQueueEntry> entries;
    if (!ensureAvailable()) return entries;

    QSqlQuery query(m_db);
    query.prepare(sql);
    for (const QVariant &value : bindings) {
        query.addBindValue(value);
    }
    if (!exec(query)) {
        return entries;
    }
    while (query.next()) {
        entries.append(queueEntryFromQuery(query));
    }
    return entries;
}

SyncQueueEntry FieldworkStore::queueEntryFromQuery(const QSqlQuery &query) const
{
    SyncQueueEntry entry;
    entry.id = query.value("id").toString();
    entry.entityTypeName = query.value("entity_type").toString();
    entry.entityType = entityTypeFromString(entry.entityTypeName, &entry.entityTypeKnown);
    entry.entityId = query.value("entity_id").toString();
    entry.action = syncActionFromString(query.value("action").toString());
    entry.payload = query.value("payload").toByteArray();
    entry.retryCount = query.value("retry_count").toInt();
    entry.maxRetries = query.value("max_retries").toInt();
    entry.lastAttempt = dateFromMs(query.value("last_attempt"));
    entry.error = query.value("error").toString();
    entry.createdAt = dateFromMs(query.value("created_at"));
    entry.conflicted = query.value("conflicted").toInt() != 0;
    entry.serverSnapshot = query.value("server_snapshot").toByteArray();
    return entry;
}

// ========== Sync status ==========

bool FieldworkStore::setSyncStatus(EntityType type, const QString &entityId, SyncStatus status)
{
    if (type == EntityType::OfflineSession) {
        return true;
    }
    if (!ensureAvailable()) return false;

    QSqlQuery query(m_db);
    query.prepare(QString("UPDATE %1 SET sync_status = ? WHERE id = ?").arg(tableFor(type)));
    query.addBindValue(syncStatusToString(status));
    query.addBindValue(entityId);
    return exec(query);
}

SyncStatus FieldworkStore::syncStatus(EntityType type, const QString &entityId, bool *found) const
{
    if (found) *found = false;
    if (type == EntityType::OfflineSession || !ensureAvailable()) {
        return SyncStatus::Pending;
    }

    QSqlQuery query(m_db);
    query.prepare(QString("SELECT sync_status FROM %1 WHERE id = ?").arg(tableFor(type)));
    query.addBindValue(entityId);
    if (!exec(query) || !query.next()) {
        return SyncStatus::Pending;
    }
    if (found) *found = true;
    return syncStatusFromString(query.value(0).toString());
}

int FieldworkStore::countWithStatus(EntityType type, SyncStatus status) const
{
    if (type == EntityType::OfflineSession) return 0;
    if (!ensureAvailable()) return -1;

    QSqlQuery query(m_db);
    query.prepare(QString("SELECT COUNT(*) FROM %1 WHERE sync_status = ?").arg(tableFor(type)));
    query.addBindValue(syncStatusToString(status));
    if (!exec(query) || !query.next()) {
        return -1;
    }
    return query.value(0).toInt();
}

bool FieldworkStore::deleteEntity(EntityType type, const QString &entityId)
{
    if (!ensureAvailable()) return false;

    QSqlQuery query(m_db);
    query.prepare(QString("DELETE FROM %1 WHERE id = ?").arg(tableFor(type)));
    query.addBindValue(entityId);
    return exec(query);
}

int FieldworkStore::deleteEntities(EntityType type, const QStringList &ids)
{
    if (!ensureAvailable()) return -1;
    if (ids.isEmpty()) return 0;

    int removed = 0;
    bool ok = runInTransaction([&]() {
        QSqlQuery query(m_db);
        query.prepare(QString("DELETE FROM %1 WHERE id = ?").arg(tableFor(type)));
        for (const QString &id : ids) {
            query.bindValue(0, id);
            if (!exec(query)) {
                return false;
            }
            removed += query.numRowsAffected();
        }
        return true;
    });
    return ok ? removed : -1;
}

// ========== Metadata ==========

QVariant FieldworkStore::metaValue(const QString &key, const QVariant &defaultValue) const
{
    if (!ensureAvailable()) return defaultValue;

    QSqlQuery query(m_db);
    query.prepare("SELECT value FROM store_meta WHERE key = ?");
    query.addBindValue(key);
    if (!exec(query) || !query.next()) {
        return defaultValue;
    }
    return query.value(0);
}

bool FieldworkStore::setMetaValue(const QString &key, const QVariant &value)
{
    if (!ensureAvailable()) return false;

    QSqlQuery query(m_db);
    query.prepare("INSERT OR REPLACE INTO store_meta (key, value) VALUES (?, ?)");
    query.addBindValue(key);
    query.addBindValue(value.toString());
    return exec(query);
}

} // namespace FieldSync
