#include "synctypes.h"

namespace FieldSync {

QString documentKindName(DocumentKind kind)
{
    switch (kind) {
    case DocumentKind::Invoice: return "invoice";
    case DocumentKind::Collection: return "collection";
    }
    return QString();
}

QString documentStatusName(DocumentStatus status)
{
    switch (status) {
    case DocumentStatus::Pending: return "pending";
    case DocumentStatus::Sending: return "sending";
    case DocumentStatus::Sent: return "sent";
    case DocumentStatus::Synced: return "synced";
    case DocumentStatus::Failed: return "failed";
    }
    return QString();
}

DocumentStatus documentStatusFromName(const QString &name, bool *ok)
{
    if (ok) {
        *ok = true;
    }

    if (name == "pending") return DocumentStatus::Pending;
    if (name == "sending") return DocumentStatus::Sending;
    if (name == "sent") return DocumentStatus::Sent;
    if (name == "synced") return DocumentStatus::Synced;
    if (name == "failed") return DocumentStatus::Failed;

    if (ok) {
        *ok = false;
    }
    return DocumentStatus::Pending;
}

QString syncTopicName(SyncTopic topic)
{
    switch (topic) {
    case SyncTopic::SyncStarted: return "sync-started";
    case SyncTopic::SyncCompleted: return "sync-completed";
    case SyncTopic::InvoicesUpdated: return "invoices-updated";
    case SyncTopic::CollectionsUpdated: return "collections-updated";
    }
    return QString();
}

QString syncStageName(SyncStage stage)
{
    switch (stage) {
    case SyncStage::Baseline: return "baseline";
    case SyncStage::ReferenceData: return "reference-data";
    case SyncStage::Invoices: return "invoices";
    case SyncStage::Balances: return "balances";
    case SyncStage::Collections: return "collections";
    case SyncStage::PostCount: return "post-count";
    }
    return QString();
}

// ========== Document ==========

QJsonObject Document::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["kind"] = documentKindName(kind);
    obj["status"] = documentStatusName(status);
    obj["partnerId"] = partnerId;
    obj["partnerName"] = partnerName;
    obj["locationId"] = locationId;
    obj["series"] = series;
    obj["number"] = number;
    obj["documentCode"] = documentCode;
    obj["documentDate"] = documentDate.toString(Qt::ISODate);
    obj["receiptGroupId"] = receiptGroupId;
    obj["receiptSeries"] = receiptSeries;
    obj["receiptNumber"] = receiptNumber;
    obj["amountCents"] = static_cast<double>(amount.cents());
    obj["itemCount"] = itemCount;
    obj["notes"] = notes;
    obj["createdAt"] = createdAt.toString(Qt::ISODate);
    obj["sentAt"] = sentAt.toString(Qt::ISODate);
    obj["remoteId"] = remoteId;
    obj["errorMessage"] = errorMessage;
    return obj;
}

Document Document::fromJson(const QJsonObject &json)
{
    Document doc;
    doc.id = json["id"].toString();
    doc.kind = json["kind"].toString() == "collection" ? DocumentKind::Collection
                                                       : DocumentKind::Invoice;
    doc.status = documentStatusFromName(json["status"].toString());
    doc.partnerId = json["partnerId"].toString();
    doc.partnerName = json["partnerName"].toString();
    doc.locationId = json["locationId"].toString();
    doc.series = json["series"].toString();
    doc.number = json["number"].toString();
    doc.documentCode = json["documentCode"].toString();
    doc.documentDate = QDate::fromString(json["documentDate"].toString(), Qt::ISODate);
    doc.receiptGroupId = json["receiptGroupId"].toString();
    doc.receiptSeries = json["receiptSeries"].toString();
    doc.receiptNumber = json["receiptNumber"].toString();
    doc.amount = Money::fromCents(static_cast<qint64>(json["amountCents"].toDouble()));
    doc.itemCount = json["itemCount"].toInt();
    doc.notes = json["notes"].toString();
    doc.createdAt = QDateTime::fromString(json["createdAt"].toString(), Qt::ISODate);
    doc.sentAt = QDateTime::fromString(json["sentAt"].toString(), Qt::ISODate);
    doc.remoteId = json["remoteId"].toString();
    doc.errorMessage = json["errorMessage"].toString();
    return doc;
}

// ========== DocumentLifecycle ==========

DocumentStatus DocumentLifecycle::deliveredStatus(DocumentKind kind)
{
    return kind == DocumentKind::Invoice ? DocumentStatus::Sent : DocumentStatus::Synced;
}

bool DocumentLifecycle::canTransition(DocumentKind kind, DocumentStatus from, DocumentStatus to)
{
    switch (from) {
    case DocumentStatus::Pending:
    case DocumentStatus::Failed:
        return to == DocumentStatus::Sending;

    case DocumentStatus::Sending:
        if (to == DocumentStatus::Failed) {
            return true;
        }
        if (to == deliveredStatus(kind)) {
            return true;
        }
        // Only an invoice can be pulled back by the user mid-send
        return to == DocumentStatus::Pending && kind == DocumentKind::Invoice;

    case DocumentStatus::Sent:
    case DocumentStatus::Synced:
        return false;
    }
    return false;
}

} // namespace FieldSync
