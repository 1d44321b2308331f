#include "draftfindinghandler.h"

#include <QJsonArray>

namespace FieldSync {

const char *DraftFindingHandler::PROCEDURE = "fieldworkSync.syncDraftFinding";

DraftFindingHandler::DraftFindingHandler(FieldworkStore *store, RemoteTransport *transport, QObject *parent)
    : SyncHandler(store, transport, parent)
{
}

QJsonObject DraftFindingHandler::buildInput(const DraftFinding &finding, SyncAction action)
{
    QJsonObject input;
    input["clientId"] = finding.id;
    input["reviewId"] = finding.reviewId;
    input["title"] = finding.title;
    input["description"] = finding.description;
    input["severity"] = findingSeverityToString(finding.severity).toUpper();
    input["areaCode"] = finding.areaCode;
    input["questionId"] = finding.questionId.isEmpty() ? QJsonValue(QJsonValue::Null)
                                                       : QJsonValue(finding.questionId);
    input["evidenceDocumentIds"] = QJsonArray::fromStringList(finding.evidenceIds);
    if (finding.gps.valid) {
        input["gpsLatitude"] = finding.gps.latitude;
        input["gpsLongitude"] = finding.gps.longitude;
    } else {
        input["gpsLatitude"] = QJsonValue(QJsonValue::Null);
        input["gpsLongitude"] = QJsonValue(QJsonValue::Null);
    }
    input["action"] = syncActionToString(action);
    return input;
}

PushResult DraftFindingHandler::push(const SyncQueueEntry &entry)
{
    if (!m_transport) {
        return PushResult::retryable("No remote transport configured");
    }

    QJsonObject payload;
    PushResult failure;
    if (!parsePayload(entry, payload, failure)) {
        return failure;
    }

    DraftFinding finding = DraftFinding::fromJson(payload);
    if (finding.id.isEmpty()) {
        finding.id = entry.entityId;
    }
    if (finding.reviewId.isEmpty()) {
        return PushResult::permanent("Draft finding payload has no reviewId");
    }
    if (entry.action != SyncAction::Delete && finding.title.trimmed().isEmpty()) {
        return PushResult::permanent("Draft finding has no title");
    }

    TransportResponse response = m_transport->mutate(PROCEDURE, buildInput(finding, entry.action));
    return classify(response);
}

} // namespace FieldSync
