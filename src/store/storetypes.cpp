#include "storetypes.h"

#include <cmath>

namespace FieldSync {

QJsonObject Partner::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["name"] = name;
    obj["fiscalCode"] = fiscalCode;
    return obj;
}

Partner Partner::fromJson(const QJsonObject &json)
{
    Partner partner;
    partner.id = json["id"].toString();
    partner.name = json["name"].toString();
    partner.fiscalCode = json["fiscalCode"].toString();
    return partner;
}

QJsonObject Product::toJson() const
{
    QJsonObject obj;
    obj["id"] = id;
    obj["name"] = name;
    obj["unitOfMeasure"] = unitOfMeasure;
    obj["priceCents"] = static_cast<double>(price.cents());
    return obj;
}

Product Product::fromJson(const QJsonObject &json)
{
    Product product;
    product.id = json["id"].toString();
    product.name = json["name"].toString();
    product.unitOfMeasure = json["unitOfMeasure"].toString();
    product.price = Money::fromCents(static_cast<qint64>(json["priceCents"].toDouble()));
    return product;
}

Money InvoiceLine::total() const
{
    return Money::fromCents(std::llround(quantity * static_cast<double>(unitPrice.cents())));
}

QJsonObject InvoiceLine::toJson() const
{
    QJsonObject obj;
    obj["productId"] = productId;
    obj["productName"] = productName;
    obj["quantity"] = quantity;
    obj["unitPriceCents"] = static_cast<double>(unitPrice.cents());
    return obj;
}

InvoiceLine InvoiceLine::fromJson(const QJsonObject &json)
{
    InvoiceLine line;
    line.productId = json["productId"].toString();
    line.productName = json["productName"].toString();
    line.quantity = json["quantity"].toDouble();
    line.unitPrice = Money::fromCents(static_cast<qint64>(json["unitPriceCents"].toDouble()));
    return line;
}

Money InvoiceDraft::total() const
{
    Money sum;
    for (const InvoiceLine &line : lines) {
        sum += line.total();
    }
    return sum;
}

} // namespace FieldSync
