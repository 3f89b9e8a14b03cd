#ifndef STORETYPES_H
#define STORETYPES_H

#include <QString>
#include <QList>
#include <QJsonObject>

#include "sync/money.h"

namespace FieldSync {

/**
 * @brief A client of the agent, pulled from the remote as reference data
 */
struct Partner {
    QString id;
    QString name;
    QString fiscalCode;

    QJsonObject toJson() const;
    static Partner fromJson(const QJsonObject &json);
};

/**
 * @brief A sellable product, pulled from the remote as reference data
 */
struct Product {
    QString id;
    QString name;
    QString unitOfMeasure;
    Money price;

    QJsonObject toJson() const;
    static Product fromJson(const QJsonObject &json);
};

struct InvoiceLine {
    QString productId;
    QString productName;
    double quantity = 0.0;
    Money unitPrice;

    /**
     * @brief quantity * unitPrice, rounded to cents
     */
    Money total() const;

    QJsonObject toJson() const;
    static InvoiceLine fromJson(const QJsonObject &json);
};

/**
 * @brief Input for creating a new pending invoice
 */
struct InvoiceDraft {
    QString partnerId;
    QString partnerName;
    QString locationId;
    QString notes;
    QList<InvoiceLine> lines;

    Money total() const;
};

/**
 * @brief What the remote said about one submission
 *
 * alreadyRecorded means the remote had accepted this document before;
 * the caller treats it as delivered.
 */
struct RemoteSubmission {
    bool accepted = false;
    bool alreadyRecorded = false;
    QString remoteId;
    QString errorMessage;

    bool delivered() const { return accepted || alreadyRecorded; }
};

} // namespace FieldSync

#endif // STORETYPES_H
