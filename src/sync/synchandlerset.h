#ifndef SYNCHANDLERSET_H
#define SYNCHANDLERSET_H

#include <QList>
#include "../store/fieldworktypes.h"

namespace FieldSync {

class SyncHandler;
class FieldworkStore;
class RemoteTransport;

/**
 * @brief Exhaustive mapping from entity type to its handler
 *
 * Built with one slot per EntityType. A slot may be null, in which case
 * entries of that type fail permanently with "No handler for entityType".
 * Ownership of the handlers passes to the SyncEngine that receives the set.
 */
class SyncHandlerSet
{
public:
    SyncHandlerSet() = default;
    SyncHandlerSet(SyncHandler *checklistItems,
                   SyncHandler *fieldEvidence,
                   SyncHandler *draftFindings,
                   SyncHandler *offlineSessions);

    /**
     * @brief Handlers for the four entity types talking to @p transport
     */
    static SyncHandlerSet createDefault(FieldworkStore *store, RemoteTransport *transport);

    SyncHandler *handlerFor(EntityType type) const;

    /**
     * @brief Non-null handlers in slot order
     */
    QList<SyncHandler*> handlers() const;

private:
    SyncHandler *m_checklistItems = nullptr;
    SyncHandler *m_fieldEvidence = nullptr;
    SyncHandler *m_draftFindings = nullptr;
    SyncHandler *m_offlineSessions = nullptr;
};

} // namespace FieldSync

#endif // SYNCHANDLERSET_H
