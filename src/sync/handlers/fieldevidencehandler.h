#ifndef FIELDEVIDENCEHANDLER_H
#define FIELDEVIDENCEHANDLER_H

#include "../synchandler.h"

namespace FieldSync {

/**
 * @brief Uploads captured evidence and propagates evidence deletes
 *
 * Queue payloads hold metadata only. For create/update the full record is
 * loaded from the store and its blob is sent as the "file" part of a
 * multipart upload, next to a "metadata" JSON part. Oversized blobs are
 * rejected before any network call.
 */
class FieldEvidenceHandler : public SyncHandler
{
    Q_OBJECT

public:
    static const char *DELETE_PROCEDURE;
    static const qint64 DEFAULT_MAX_UPLOAD_BYTES;   ///< 10 MB

    FieldEvidenceHandler(FieldworkStore *store, RemoteTransport *transport, QObject *parent = nullptr);

    EntityType entityType() const override { return EntityType::FieldEvidence; }
    QString displayName() const override { return "Field Evidence"; }

    PushResult push(const SyncQueueEntry &entry) override;

    void setMaxUploadBytes(qint64 bytes) { m_maxUploadBytes = bytes; }
    qint64 maxUploadBytes() const { return m_maxUploadBytes; }

private:
    PushResult pushDelete(const SyncQueueEntry &entry);
    PushResult pushUpload(const SyncQueueEntry &entry);

    qint64 m_maxUploadBytes = DEFAULT_MAX_UPLOAD_BYTES;
};

} // namespace FieldSync

#endif // FIELDEVIDENCEHANDLER_H
