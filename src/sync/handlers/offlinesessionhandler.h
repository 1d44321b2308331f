#ifndef OFFLINESESSIONHANDLER_H
#define OFFLINESESSIONHANDLER_H

#include "../synchandler.h"

namespace FieldSync {

/**
 * @brief Pushes offline session audit records
 */
class OfflineSessionHandler : public SyncHandler
{
    Q_OBJECT

public:
    static const char *PROCEDURE;

    OfflineSessionHandler(FieldworkStore *store, RemoteTransport *transport, QObject *parent = nullptr);

    EntityType entityType() const override { return EntityType::OfflineSession; }
    QString displayName() const override { return "Offline Sessions"; }

    PushResult push(const SyncQueueEntry &entry) override;
};

} // namespace FieldSync

#endif // OFFLINESESSIONHANDLER_H
