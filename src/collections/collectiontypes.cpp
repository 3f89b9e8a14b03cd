#include "collectiontypes.h"

#include <QStringList>

namespace FieldSync {

QString DocumentReference::key() const
{
    return QStringList{
        partnerId.trimmed(),
        series.trimmed(),
        number.trimmed(),
        documentCode.trimmed(),
        date.toString(Qt::ISODate)
    }.join('|');
}

QString DocumentReference::displayName() const
{
    if (series.isEmpty()) {
        return number;
    }
    return QString("%1 %2").arg(series, number);
}

// ========== OutstandingBalance ==========

DocumentReference OutstandingBalance::reference() const
{
    DocumentReference ref;
    ref.partnerId = partnerId;
    ref.series = series;
    ref.number = number;
    ref.documentCode = documentCode;
    ref.date = date;
    return ref;
}

QJsonObject OutstandingBalance::toJson() const
{
    QJsonObject obj;
    obj["partnerId"] = partnerId;
    obj["partnerName"] = partnerName;
    obj["documentType"] = documentType;
    obj["documentCode"] = documentCode;
    obj["series"] = series;
    obj["number"] = number;
    obj["date"] = date.toString(Qt::ISODate);
    obj["dueDate"] = dueDate.toString(Qt::ISODate);
    obj["valueCents"] = static_cast<double>(value.cents());
    obj["restCents"] = static_cast<double>(rest.cents());
    obj["currency"] = currency;
    return obj;
}

OutstandingBalance OutstandingBalance::fromJson(const QJsonObject &json)
{
    OutstandingBalance balance;
    balance.partnerId = json["partnerId"].toString();
    balance.partnerName = json["partnerName"].toString();
    balance.documentType = json["documentType"].toString();
    balance.documentCode = json["documentCode"].toString();
    balance.series = json["series"].toString();
    balance.number = json["number"].toString();
    balance.date = QDate::fromString(json["date"].toString(), Qt::ISODate);
    balance.dueDate = QDate::fromString(json["dueDate"].toString(), Qt::ISODate);
    balance.value = Money::fromCents(static_cast<qint64>(json["valueCents"].toDouble()));
    balance.rest = Money::fromCents(static_cast<qint64>(json["restCents"].toDouble()));
    balance.currency = json["currency"].toString("RON");
    return balance;
}

// ========== CollectionGroupRequest ==========

Money CollectionGroupRequest::total() const
{
    Money sum;
    for (const BalanceAllocation &allocation : allocations) {
        sum += allocation.requestedAmount;
    }
    return sum;
}

} // namespace FieldSync
