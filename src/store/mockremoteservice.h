#ifndef MOCKREMOTESERVICE_H
#define MOCKREMOTESERVICE_H

#include <QMap>
#include <QSet>
#include <QStringList>

#include "remoteservice.h"

namespace FieldSync {

/**
 * @brief In-process remote with canned reference data
 *
 * Used by the --mock command line switch and by tests. Failures can be
 * injected per call type or per invoice. Re-submitting an accepted
 * document answers alreadyRecorded, like the real remote.
 */
class MockRemoteService : public RemoteService
{
    Q_OBJECT

public:
    explicit MockRemoteService(QObject *parent = nullptr);

    QString serviceName() const override { return "mock"; }

    QueueResult<QList<Partner>> fetchPartners() override;
    QueueResult<QList<Product>> fetchProducts() override;
    QueueResult<QList<OutstandingBalance>> fetchBalances(const QString &agentCode) override;

    RemoteSubmission submitInvoice(const Document &invoice,
                                   const QList<InvoiceLine> &lines) override;
    RemoteSubmission submitCollectionGroup(const QList<Document> &rows) override;
    QueueResult<bool> isCollectionGroupRecorded(const QList<Document> &rows) override;

    // ========== Canned Data ==========

    void setPartners(const QList<Partner> &partners) { m_partners = partners; }
    void setProducts(const QList<Product> &products) { m_products = products; }
    void setBalances(const QList<OutstandingBalance> &balances) { m_balances = balances; }
    QList<OutstandingBalance> balances() const { return m_balances; }

    // ========== Failure Injection ==========

    void failInvoice(const QString &invoiceId, const QString &error = "Rejected by remote");
    void clearInvoiceFailures() { m_invoiceFailures.clear(); }
    void setFailReferenceData(bool fail) { m_failReferenceData = fail; }
    void setFailBalances(bool fail) { m_failBalances = fail; }
    void setFailCollections(bool fail) { m_failCollections = fail; }
    void setFailRecordedCheck(bool fail) { m_failRecordedCheck = fail; }

    /**
     * @brief Pretend a receipt group reached the remote by another path
     */
    void markGroupRecorded(const QString &receiptGroupId) { m_recordedGroups.insert(receiptGroupId); }

    // ========== Inspection ==========

    QStringList submittedInvoiceIds() const { return m_submittedInvoices; }
    QStringList submittedGroupIds() const { return m_submittedGroups; }
    int invoiceSubmitCount() const { return m_invoiceSubmitCount; }

private:
    QList<Partner> m_partners;
    QList<Product> m_products;
    QList<OutstandingBalance> m_balances;

    QMap<QString, QString> m_invoiceFailures;
    bool m_failReferenceData = false;
    bool m_failBalances = false;
    bool m_failCollections = false;
    bool m_failRecordedCheck = false;

    QSet<QString> m_recordedGroups;
    QSet<QString> m_acceptedInvoices;
    QStringList m_submittedInvoices;
    QStringList m_submittedGroups;
    int m_invoiceSubmitCount = 0;
};

} // namespace FieldSync

#endif // MOCKREMOTESERVICE_H
