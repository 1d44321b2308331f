#ifndef SYNCHANDLER_H
#define SYNCHANDLER_H

#include <QObject>
#include <QString>
#include <QByteArray>
#include <QJsonObject>
#include "../store/fieldworktypes.h"
#include "../net/remotetransport.h"

namespace FieldSync {

class FieldworkStore;

/**
 * @brief How the remote side answered one push
 */
enum class PushOutcome {
    Success,        ///< 2xx, the change is confirmed
    Conflict,       ///< 409 or an in-band conflict report
    Retryable,      ///< 5xx or transport failure
    Permanent       ///< Any other status, or local validation failure
};

/**
 * @brief Typed result of SyncHandler::push()
 */
struct PushResult {
    PushOutcome outcome = PushOutcome::Permanent;
    int httpStatus = 0;
    QString message;            ///< Server message verbatim, or local reason
    QByteArray serverSnapshot;  ///< Server copy returned with a conflict

    bool isSuccess() const { return outcome == PushOutcome::Success; }

    static PushResult success(int httpStatus = 200) {
        PushResult r;
        r.outcome = PushOutcome::Success;
        r.httpStatus = httpStatus;
        return r;
    }

    static PushResult permanent(const QString &message, int httpStatus = 0) {
        PushResult r;
        r.outcome = PushOutcome::Permanent;
        r.httpStatus = httpStatus;
        r.message = message;
        return r;
    }

    static PushResult retryable(const QString &message, int httpStatus = 0) {
        PushResult r;
        r.outcome = PushOutcome::Retryable;
        r.httpStatus = httpStatus;
        r.message = message;
        return r;
    }

    static PushResult conflict(const QString &message, const QByteArray &snapshot, int httpStatus = 409) {
        PushResult r;
        r.outcome = PushOutcome::Conflict;
        r.httpStatus = httpStatus;
        r.message = message;
        r.serverSnapshot = snapshot;
        return r;
    }
};

QString pushOutcomeToString(PushOutcome outcome);

/**
 * @brief Abstract base class for per-entity sync handlers
 *
 * A handler knows how to push one kind of queued change to the remote API.
 * It is stateless between calls: everything it needs is in the queue entry,
 * the store (for records whose payload is metadata only) and the transport.
 *
 * To create a new handler:
 * 1. Subclass SyncHandler
 * 2. Implement entityType(), displayName() and push()
 * 3. Add it to the SyncHandlerSet slot for its entity type
 *
 * Handlers:
 *   - ChecklistItemHandler:  fieldworkSync.syncChecklistItem
 *   - FieldEvidenceHandler:  multipart upload / fieldworkSync.deleteEvidence
 *   - DraftFindingHandler:   fieldworkSync.syncDraftFinding
 *   - OfflineSessionHandler: fieldworkSync.syncOfflineSession
 */
class SyncHandler : public QObject
{
    Q_OBJECT

public:
    SyncHandler(FieldworkStore *store, RemoteTransport *transport, QObject *parent = nullptr);
    virtual ~SyncHandler() = default;

    // ========== Handler Identity ==========

    virtual EntityType entityType() const = 0;

    /**
     * @brief Human-readable name for logs
     */
    virtual QString displayName() const = 0;

    // ========== Push ==========

    /**
     * @brief Push one queued change to the remote API
     *
     * Validation happens before any network call. The entry is not
     * modified; the SyncEngine applies the outcome to the queue.
     */
    virtual PushResult push(const SyncQueueEntry &entry) = 0;

    // ========== Classification ==========

    /**
     * @brief Map a transport response to a push outcome
     *
     *   2xx            → Success
     *   409            → Conflict (body kept as server snapshot)
     *   5xx, status 0  → Retryable
     *   anything else  → Permanent with the server's message
     */
    static PushResult classify(const TransportResponse &response);

    /**
     * @brief Server message from a JSON error body
     *
     * Looks at error.message, error.json.message and message, in that
     * order. Falls back to "HTTP <code>".
     */
    static QString extractMessage(const TransportResponse &response);

    /**
     * @brief Unwrap a tRPC result envelope ({result: {data: {json: ...}}})
     *
     * Bodies without an envelope are returned unchanged.
     */
    static QJsonObject resultData(const QJsonObject &body);

    FieldworkStore *store() const { return m_store; }
    RemoteTransport *transport() const { return m_transport; }

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

protected:
    /**
     * @brief Parse the entry payload as a JSON object
     *
     * @param failure Set to a permanent result when parsing fails
     * @return true on success
     */
    bool parsePayload(const SyncQueueEntry &entry, QJsonObject &payload, PushResult &failure) const;

    FieldworkStore *m_store = nullptr;
    RemoteTransport *m_transport = nullptr;
};

} // namespace FieldSync

#endif // SYNCHANDLER_H
