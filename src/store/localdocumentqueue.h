#ifndef LOCALDOCUMENTQUEUE_H
#define LOCALDOCUMENTQUEUE_H

#include <QMap>
#include <QString>
#include <QDateTime>

#include "sync/documentqueueclient.h"
#include "storetypes.h"

namespace FieldSync {

class AgentProfile;
class RemoteService;

/**
 * @brief JSON file backed document queue
 *
 * Directory structure:
 *   <storeDir>/queue.json   invoices, invoice lines, collections, balances,
 *                           partners, products, reference sync timestamps
 *
 * Every mutation is written through immediately. On load, a document left
 * in Sending by a previous process is moved to Failed so the next cycle
 * retries it.
 *
 * Collections travel in receipt groups: rows created by one
 * createCollectionGroup() call share a receiptGroupId and change status
 * together.
 */
class LocalDocumentQueue : public DocumentQueueClient
{
    Q_OBJECT

public:
    explicit LocalDocumentQueue(const QString &storeDirectory, QObject *parent = nullptr);
    ~LocalDocumentQueue() override;

    // ========== Collaborators ==========

    /**
     * @brief Set the remote service
     *
     * The queue takes ownership of the remote.
     */
    void setRemote(RemoteService *remote);
    RemoteService* remote() const { return m_remote; }

    /**
     * @brief Profile used for the agent code and document numbering (not owned)
     */
    void setProfile(AgentProfile *profile) { m_profile = profile; }

    QString storeDirectory() const { return m_storeDirectory; }

    // ========== Persistence ==========

    bool load();
    bool save();

    // ========== DocumentQueueClient ==========

    bool hasReferenceData() override;
    SyncStatus currentSyncStatus() override;
    QueueResult<SyncStatus> syncReferenceData() override;

    QueueResult<QList<Document>> listDocuments(DocumentKind kind,
                                               const QList<DocumentStatus> &statusFilter = {}) override;
    QueueResult<Document> submitDocument(DocumentKind kind, const QString &id) override;
    QueueResult<QStringList> submitAllPending(DocumentKind kind) override;

    OperationResult syncBalances() override;
    OperationResult syncCollections() override;
    QueueResult<QList<OutstandingBalance>> outstandingBalances(const QString &partnerId = QString()) override;
    QueueResult<QString> createCollectionGroup(const CollectionGroupRequest &request) override;

    // ========== Local Operations ==========

    /**
     * @brief Create a pending invoice
     * @return The new invoice id
     */
    QueueResult<QString> createInvoice(const InvoiceDraft &draft);

    /**
     * @brief Return an invoice stuck in Sending to Pending
     *
     * Invoices only; collections have no cancel path.
     */
    OperationResult cancelSending(const QString &invoiceId);

    /**
     * @brief Remove a document that never reached the remote
     *
     * Deleting a collection removes its whole receipt group.
     */
    OperationResult deleteDocument(DocumentKind kind, const QString &id);

    QueueResult<Document> document(DocumentKind kind, const QString &id) const;
    QList<InvoiceLine> invoiceLines(const QString &invoiceId) const { return m_invoiceLines.value(invoiceId); }

    QList<Partner> partners() const { return m_partners; }
    QList<Product> products() const { return m_products; }

private:
    QMap<QString, Document> &documents(DocumentKind kind);
    const QMap<QString, Document> &documents(DocumentKind kind) const;

    QueueResult<Document> submitInvoice(const QString &id);
    QueueResult<Document> submitCollectionGroup(const QString &groupKey);
    QStringList groupRowIds(const QString &groupKey) const;
    void applyGroupStatus(const QStringList &rowIds, DocumentStatus status,
                          const QString &remoteId, const QString &error);
    void applyPaymentToBalances(const QList<Document> &rows);
    bool hasOpenCollectionFor(const DocumentReference &reference) const;

    QString stateFilePath() const;
    QString newId() const;

    QString m_storeDirectory;
    RemoteService *m_remote = nullptr;
    AgentProfile *m_profile = nullptr;

    QMap<QString, Document> m_invoices;
    QMap<QString, Document> m_collections;
    QMap<QString, QList<InvoiceLine>> m_invoiceLines;
    QList<OutstandingBalance> m_balances;
    QList<Partner> m_partners;
    QList<Product> m_products;
    QDateTime m_partnersSyncedAt;
    QDateTime m_productsSyncedAt;
};

} // namespace FieldSync

#endif // LOCALDOCUMENTQUEUE_H
