#include "offlinesessionhandler.h"

namespace FieldSync {

const char *OfflineSessionHandler::PROCEDURE = "fieldworkSync.syncOfflineSession";

OfflineSessionHandler::OfflineSessionHandler(FieldworkStore *store, RemoteTransport *transport, QObject *parent)
    : SyncHandler(store, transport, parent)
{
}

PushResult OfflineSessionHandler::push(const SyncQueueEntry &entry)
{
    if (!m_transport) {
        return PushResult::retryable("No remote transport configured");
    }

    QJsonObject payload;
    PushResult failure;
    if (!parsePayload(entry, payload, failure)) {
        return failure;
    }

    OfflineSession session = OfflineSession::fromJson(payload);
    if (session.reviewId.isEmpty() || !session.startedAt.isValid()) {
        return PushResult::permanent("Offline session payload needs reviewId and startedAt");
    }

    QJsonObject input = session.toJson();
    if (input.value("id").toString().isEmpty()) {
        input["id"] = entry.entityId;
    }
    input["action"] = syncActionToString(entry.action);

    return classify(m_transport->mutate(PROCEDURE, input));
}

} // namespace FieldSync
