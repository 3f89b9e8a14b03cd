#ifndef REMOTESERVICE_H
#define REMOTESERVICE_H

#include <QObject>
#include <QString>
#include <QList>

#include "storetypes.h"
#include "sync/synctypes.h"
#include "collections/collectiontypes.h"

namespace FieldSync {

/**
 * @brief Abstract interface for the central authoritative system
 *
 * The transport is not part of this project. Implementations:
 *   - MockRemoteService: in-process remote with canned data
 *
 * Calls are blocking from the caller's point of view. An implementation
 * may spin an event loop while it waits. Errors come back in the result;
 * a thrown std::exception is treated by callers as a failed call.
 */
class RemoteService : public QObject
{
    Q_OBJECT

public:
    explicit RemoteService(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~RemoteService() = default;

    virtual QString serviceName() const = 0;

    // ========== Reference Data ==========

    virtual QueueResult<QList<Partner>> fetchPartners() = 0;
    virtual QueueResult<QList<Product>> fetchProducts() = 0;

    /**
     * @brief Outstanding balances of the agent's clients
     */
    virtual QueueResult<QList<OutstandingBalance>> fetchBalances(const QString &agentCode) = 0;

    // ========== Submissions ==========

    virtual RemoteSubmission submitInvoice(const Document &invoice,
                                           const QList<InvoiceLine> &lines) = 0;

    /**
     * @brief Submit all rows of one receipt group as a single payment
     */
    virtual RemoteSubmission submitCollectionGroup(const QList<Document> &rows) = 0;

    /**
     * @brief Whether the remote already holds this receipt group
     */
    virtual QueueResult<bool> isCollectionGroupRecorded(const QList<Document> &rows) = 0;

signals:
    void logMessage(const QString &message);
};

} // namespace FieldSync

#endif // REMOTESERVICE_H
