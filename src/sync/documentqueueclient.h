#ifndef DOCUMENTQUEUECLIENT_H
#define DOCUMENTQUEUECLIENT_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QList>

#include "synctypes.h"
#include "collections/collectiontypes.h"

namespace FieldSync {

/**
 * @brief Abstract interface to the local document queue and its remote
 *
 * The queue owns Documents and their status transitions. The orchestrator
 * never edits a Document; it only calls the operations below, which cause
 * the queue to move documents through their lifecycle.
 *
 * Implementations:
 *   - LocalDocumentQueue: JSON file store delegating to a RemoteService
 *
 * Failures are reported through the returned result structs. A failure to
 * deliver one document is recorded on that document and does not fail the
 * batch operation.
 */
class DocumentQueueClient : public QObject
{
    Q_OBJECT

public:
    explicit DocumentQueueClient(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~DocumentQueueClient() = default;

    // ========== Reference Data ==========

    /**
     * @brief Whether any reference data (partners) exists locally
     *
     * Drives the first-run decision.
     */
    virtual bool hasReferenceData() = 0;

    /**
     * @brief Current reference sync timestamps
     */
    virtual SyncStatus currentSyncStatus() = 0;

    /**
     * @brief Pull partners and products from the remote
     */
    virtual QueueResult<SyncStatus> syncReferenceData() = 0;

    // ========== Documents ==========

    /**
     * @brief List documents of a kind
     * @param statusFilter Statuses to include; empty means all
     */
    virtual QueueResult<QList<Document>> listDocuments(DocumentKind kind,
                                                       const QList<DocumentStatus> &statusFilter = {}) = 0;

    /**
     * @brief Submit one document (or, for collections, its receipt group)
     * @return The document after the attempt. A delivery failure is a
     *         successful call returning a Failed document.
     */
    virtual QueueResult<Document> submitDocument(DocumentKind kind, const QString &id) = 0;

    /**
     * @brief Submit every pending and failed document of a kind
     * @return Identifiers that reached Sent/Synced during this call
     */
    virtual QueueResult<QStringList> submitAllPending(DocumentKind kind) = 0;

    // ========== Balances & Collections ==========

    /**
     * @brief Refresh outstanding client balances from the remote
     */
    virtual OperationResult syncBalances() = 0;

    /**
     * @brief Push pending/failed collections and reconcile with the remote
     */
    virtual OperationResult syncCollections() = 0;

    /**
     * @brief Outstanding balances with a non-zero rest
     * @param partnerId Restrict to one partner; empty for all
     */
    virtual QueueResult<QList<OutstandingBalance>> outstandingBalances(const QString &partnerId = QString()) = 0;

    /**
     * @brief Queue a validated payment for later delivery
     * @return Receipt group id
     */
    virtual QueueResult<QString> createCollectionGroup(const CollectionGroupRequest &request) = 0;

signals:
    void documentChanged(FieldSync::DocumentKind kind, const QString &id);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);
};

} // namespace FieldSync

#endif // DOCUMENTQUEUECLIENT_H
