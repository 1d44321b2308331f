#include "fieldevidencehandler.h"
#include "../../store/fieldworkstore.h"

#include <QDebug>

namespace FieldSync {

const char *FieldEvidenceHandler::DELETE_PROCEDURE = "fieldworkSync.deleteEvidence";
const qint64 FieldEvidenceHandler::DEFAULT_MAX_UPLOAD_BYTES = 10 * 1024 * 1024;

namespace {

QString formatMegabytes(qint64 bytes)
{
    return QString::number(bytes / (1024.0 * 1024.0), 'f', 1);
}

} // namespace

FieldEvidenceHandler::FieldEvidenceHandler(FieldworkStore *store, RemoteTransport *transport, QObject *parent)
    : SyncHandler(store, transport, parent)
{
}

PushResult FieldEvidenceHandler::push(const SyncQueueEntry &entry)
{
    if (!m_transport) {
        return PushResult::retryable("No remote transport configured");
    }

    if (entry.action == SyncAction::Delete) {
        return pushDelete(entry);
    }
    return pushUpload(entry);
}

PushResult FieldEvidenceHandler::pushDelete(const SyncQueueEntry &entry)
{
    QJsonObject input;
    input["id"] = entry.entityId;
    return classify(m_transport->mutate(DELETE_PROCEDURE, input));
}

PushResult FieldEvidenceHandler::pushUpload(const SyncQueueEntry &entry)
{
    if (!m_store) {
        return PushResult::permanent("No local store attached to evidence handler");
    }

    // The payload only carries metadata; the blob lives in the store
    FieldEvidence record = m_store->evidence(entry.entityId);
    if (!record.isValid()) {
        if (!m_store->isAvailable()) {
            return PushResult::retryable(QString("Local store is not available"));
        }
        return PushResult::permanent(QString("Evidence record not found: %1").arg(entry.entityId));
    }

    qint64 size = qMax(record.fileSize, static_cast<qint64>(record.blob.size()));
    if (size > m_maxUploadBytes) {
        QString message = QString("%1 is too large to upload (%2 MB, limit %3 MB)")
            .arg(record.fileName.isEmpty() ? QString("Evidence file") : record.fileName)
            .arg(formatMegabytes(size))
            .arg(formatMegabytes(m_maxUploadBytes));
        qDebug() << "[FieldEvidenceHandler]" << message;
        return PushResult::permanent(message);
    }

    if (record.blob.isEmpty()) {
        return PushResult::permanent(QString("Evidence %1 has no captured data").arg(record.id));
    }

    emit logMessage(QString("Uploading %1 (%2 bytes)").arg(record.fileName).arg(record.blob.size()));

    return classify(m_transport->upload(record.blob, record.fileName, record.mimeType,
                                        record.metadataJson()));
}

} // namespace FieldSync
