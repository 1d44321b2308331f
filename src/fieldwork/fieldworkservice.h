#ifndef FIELDWORKSERVICE_H
#define FIELDWORKSERVICE_H

#include <QObject>
#include <QString>
#include <QList>
#include "../store/fieldworktypes.h"

namespace FieldSync {

class FieldworkStore;
class SyncEngine;

struct ChecklistProgress {
    int total = 0;
    int completed = 0;
    int percentage = 0;     ///< Rounded, 0 when the checklist is empty
};

/**
 * @brief Reviewer-facing operations on offline fieldwork data
 *
 * Every mutation writes the record and queues the matching sync entry in
 * one store transaction: either both land or neither does. The service
 * never touches syncStatus; SyncEngine::enqueue() marks the entity pending.
 *
 * Records marked for deletion are hidden from the read helpers but stay in
 * the store until the delete is confirmed by the server.
 */
class FieldworkService : public QObject
{
    Q_OBJECT

public:
    FieldworkService(FieldworkStore *store, SyncEngine *engine, QObject *parent = nullptr);

    // ========== Checklist ==========

    /**
     * @brief Seed a review's checklist for offline use
     *
     * Items come from the server template and are stored as synced with no
     * queue entry. When the review already has a local checklist it is
     * returned unchanged.
     */
    QList<ChecklistItem> initializeChecklist(const QString &reviewId,
                                             const QList<ChecklistItem> &templateItems);

    /**
     * @brief Checklist of a review ordered by phase, then sortOrder
     */
    QList<ChecklistItem> checklistForReview(const QString &reviewId) const;

    /**
     * @brief Save edited fields of an existing item (notes, completion)
     */
    bool updateChecklistItem(const ChecklistItem &item);

    bool completeChecklistItem(const QString &itemId, const QString &userId, bool completed = true);

    ChecklistProgress checklistProgress(const QString &reviewId) const;

    // ========== Evidence ==========

    /**
     * @brief Store captured evidence and queue its upload
     *
     * @p evidence must reference an existing checklist item. id, reviewId,
     * capturedAt and fileSize are filled in when missing.
     *
     * @return New evidence id, empty on failure
     */
    QString addEvidence(FieldEvidence evidence);

    /**
     * @brief Replace the blob with an annotated version
     *
     * Refused while the record is being uploaded or marked for deletion.
     */
    bool annotateEvidence(const QString &evidenceId, const QByteArray &annotatedBlob,
                          const QString &annotation, const QByteArray &thumbnail = QByteArray());

    /**
     * @brief Mark evidence for deletion and queue the remote delete
     */
    bool removeEvidence(const QString &evidenceId);

    QList<FieldEvidence> evidenceForChecklistItem(const QString &checklistItemId,
                                                  bool withBlobs = false) const;

    // ========== Draft findings ==========

    /**
     * @brief Create or update a draft finding
     *
     * A finding whose id is empty or unknown is created.
     *
     * @return Finding id, empty on failure
     */
    QString saveDraftFinding(DraftFinding finding);

    bool deleteDraftFinding(const QString &findingId);

    QList<DraftFinding> draftFindingsForReview(const QString &reviewId) const;

    // ========== Sessions ==========

    /**
     * @brief Open an offline session audit record
     *
     * @return Session id, empty on failure
     */
    QString startSession(const QString &reviewId, const QString &userId,
                         const QString &deviceInfo = QString());

    bool endSession(const QString &sessionId);

    QString lastError() const { return m_lastError; }

signals:
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    bool fail(const QString &error);
    static QString newId();

    FieldworkStore *m_store = nullptr;
    SyncEngine *m_engine = nullptr;
    QString m_lastError;
};

} // namespace FieldSync

#endif // FIELDWORKSERVICE_H
