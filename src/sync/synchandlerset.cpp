#include "synchandlerset.h"
#include "synchandler.h"
#include "handlers/checklistitemhandler.h"
#include "handlers/fieldevidencehandler.h"
#include "handlers/draftfindinghandler.h"
#include "handlers/offlinesessionhandler.h"

namespace FieldSync {

SyncHandlerSet::SyncHandlerSet(SyncHandler *checklistItems,
                               SyncHandler *fieldEvidence,
                               SyncHandler *draftFindings,
                               SyncHandler *offlineSessions)
    : m_checklistItems(checklistItems)
    , m_fieldEvidence(fieldEvidence)
    , m_draftFindings(draftFindings)
    , m_offlineSessions(offlineSessions)
{
}

SyncHandlerSet SyncHandlerSet::createDefault(FieldworkStore *store, RemoteTransport *transport)
{
    return SyncHandlerSet(new ChecklistItemHandler(store, transport),
                          new FieldEvidenceHandler(store, transport),
                          new DraftFindingHandler(store, transport),
                          new OfflineSessionHandler(store, transport));
}

SyncHandler *SyncHandlerSet::handlerFor(EntityType type) const
{
    switch (type) {
    case EntityType::ChecklistItem: return m_checklistItems;
    case EntityType::FieldEvidence: return m_fieldEvidence;
    case EntityType::DraftFinding: return m_draftFindings;
    case EntityType::OfflineSession: return m_offlineSessions;
    }
    return nullptr;
}

QList<SyncHandler*> SyncHandlerSet::handlers() const
{
    QList<SyncHandler*> list;
    for (SyncHandler *handler : {m_checklistItems, m_fieldEvidence, m_draftFindings, m_offlineSessions}) {
        if (handler) {
            list.append(handler);
        }
    }
    return list;
}

} // namespace FieldSync
