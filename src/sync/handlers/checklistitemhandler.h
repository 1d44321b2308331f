#ifndef CHECKLISTITEMHANDLER_H
#define CHECKLISTITEMHANDLER_H

#include "../synchandler.h"

namespace FieldSync {

/**
 * @brief Pushes checklist item snapshots to fieldworkSync.syncChecklistItem
 *
 * The server compares its own updatedAt with clientUpdatedAt. When its copy
 * is newer it answers 2xx with {status: "conflict", serverData: {...}}
 * instead of 409; both forms are treated as a conflict.
 */
class ChecklistItemHandler : public SyncHandler
{
    Q_OBJECT

public:
    static const char *PROCEDURE;

    ChecklistItemHandler(FieldworkStore *store, RemoteTransport *transport, QObject *parent = nullptr);

    EntityType entityType() const override { return EntityType::ChecklistItem; }
    QString displayName() const override { return "Checklist Items"; }

    PushResult push(const SyncQueueEntry &entry) override;

    /**
     * @brief Build the mutation input from a stored snapshot
     */
    static QJsonObject buildInput(const ChecklistItem &item, SyncAction action);
};

} // namespace FieldSync

#endif // CHECKLISTITEMHANDLER_H
