#include "mockremoteservice.h"

#include <QDebug>

namespace FieldSync {

namespace {

OutstandingBalance makeBalance(const QString &partnerId, const QString &partnerName,
                               const QString &series, const QString &number,
                               const QDate &date, qint64 valueCents, qint64 restCents)
{
    OutstandingBalance balance;
    balance.partnerId = partnerId;
    balance.partnerName = partnerName;
    balance.documentType = "Factura";
    balance.documentCode = "FCT";
    balance.series = series;
    balance.number = number;
    balance.date = date;
    balance.dueDate = date.addDays(30);
    balance.value = Money::fromCents(valueCents);
    balance.rest = Money::fromCents(restCents);
    return balance;
}

} // namespace

MockRemoteService::MockRemoteService(QObject *parent)
    : RemoteService(parent)
{
    m_partners = {
        {"p1", "Acme Corporation SRL", "RO12345678"},
        {"p2", "TechStart Solutions SRL", "RO23456789"},
        {"p3", "Global Trade Import-Export SA", "RO34567890"}
    };

    m_products = {
        {"prod1", "Office Chair", "buc", Money::fromCents(45000)},
        {"prod2", "Printer Paper A4", "top", Money::fromCents(2550)},
        {"prod3", "Desk Lamp", "buc", Money::fromCents(8999)}
    };

    m_balances = {
        makeBalance("p1", "Acme Corporation SRL", "FA", "1001", QDate(2024, 1, 15), 50000, 15000),
        makeBalance("p1", "Acme Corporation SRL", "FA", "1002", QDate(2024, 2, 1), 12000, 12000),
        makeBalance("p2", "TechStart Solutions SRL", "FA", "1003", QDate(2024, 2, 10), 30000, 30000)
    };
}

// ========== Reference Data ==========

QueueResult<QList<Partner>> MockRemoteService::fetchPartners()
{
    if (m_failReferenceData) {
        return QueueResult<QList<Partner>>::failure("Remote unavailable: partners");
    }
    return QueueResult<QList<Partner>>::ok(m_partners);
}

QueueResult<QList<Product>> MockRemoteService::fetchProducts()
{
    if (m_failReferenceData) {
        return QueueResult<QList<Product>>::failure("Remote unavailable: products");
    }
    return QueueResult<QList<Product>>::ok(m_products);
}

QueueResult<QList<OutstandingBalance>> MockRemoteService::fetchBalances(const QString &agentCode)
{
    if (m_failBalances) {
        return QueueResult<QList<OutstandingBalance>>::failure("Remote unavailable: balances");
    }
    qDebug() << "[MockRemoteService] Balances for agent" << agentCode;
    return QueueResult<QList<OutstandingBalance>>::ok(m_balances);
}

// ========== Submissions ==========

RemoteSubmission MockRemoteService::submitInvoice(const Document &invoice,
                                                  const QList<InvoiceLine> &lines)
{
    ++m_invoiceSubmitCount;
    RemoteSubmission submission;

    if (m_invoiceFailures.contains(invoice.id)) {
        submission.errorMessage = m_invoiceFailures.value(invoice.id);
        return submission;
    }

    submission.remoteId = QString("INV-%1%2").arg(invoice.series, invoice.number);
    if (m_acceptedInvoices.contains(invoice.id)) {
        submission.alreadyRecorded = true;
        return submission;
    }

    m_acceptedInvoices.insert(invoice.id);
    m_submittedInvoices.append(invoice.id);
    submission.accepted = true;

    emit logMessage(QString("Mock remote accepted invoice %1 (%2 line(s))")
        .arg(invoice.id).arg(lines.size()));
    return submission;
}

RemoteSubmission MockRemoteService::submitCollectionGroup(const QList<Document> &rows)
{
    RemoteSubmission submission;
    if (rows.isEmpty()) {
        submission.errorMessage = "Empty receipt group";
        return submission;
    }

    const QString groupId = rows.first().groupKey();
    if (m_failCollections) {
        submission.errorMessage = "Remote unavailable: collections";
        return submission;
    }

    submission.remoteId = QString("REC-%1%2").arg(rows.first().receiptSeries, rows.first().receiptNumber);
    if (m_recordedGroups.contains(groupId)) {
        submission.alreadyRecorded = true;
        return submission;
    }

    // Apply the payment to the remote balances
    for (const Document &row : rows) {
        for (OutstandingBalance &balance : m_balances) {
            if (balance.partnerId == row.partnerId && balance.series == row.series
                && balance.number == row.number && balance.documentCode == row.documentCode) {
                balance.rest -= row.amount;
                if (balance.rest < Money()) {
                    balance.rest = Money();
                }
            }
        }
    }

    m_recordedGroups.insert(groupId);
    m_submittedGroups.append(groupId);
    submission.accepted = true;
    return submission;
}

QueueResult<bool> MockRemoteService::isCollectionGroupRecorded(const QList<Document> &rows)
{
    if (m_failRecordedCheck) {
        return QueueResult<bool>::failure("Remote unavailable: receipt lookup");
    }
    if (rows.isEmpty()) {
        return QueueResult<bool>::ok(false);
    }
    return QueueResult<bool>::ok(m_recordedGroups.contains(rows.first().groupKey()));
}

// ========== Failure Injection ==========

void MockRemoteService::failInvoice(const QString &invoiceId, const QString &error)
{
    m_invoiceFailures.insert(invoiceId, error);
}

} // namespace FieldSync
