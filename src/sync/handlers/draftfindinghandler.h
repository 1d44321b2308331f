#ifndef DRAFTFINDINGHANDLER_H
#define DRAFTFINDINGHANDLER_H

#include "../synchandler.h"

namespace FieldSync {

/**
 * @brief Pushes draft findings to fieldworkSync.syncDraftFinding
 *
 * The server deduplicates on clientId, so a replayed create is answered
 * with "already_synced" and counts as success.
 */
class DraftFindingHandler : public SyncHandler
{
    Q_OBJECT

public:
    static const char *PROCEDURE;

    DraftFindingHandler(FieldworkStore *store, RemoteTransport *transport, QObject *parent = nullptr);

    EntityType entityType() const override { return EntityType::DraftFinding; }
    QString displayName() const override { return "Draft Findings"; }

    PushResult push(const SyncQueueEntry &entry) override;

    static QJsonObject buildInput(const DraftFinding &finding, SyncAction action);
};

} // namespace FieldSync

#endif // DRAFTFINDINGHANDLER_H
