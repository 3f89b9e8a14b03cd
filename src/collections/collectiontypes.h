#ifndef COLLECTIONTYPES_H
#define COLLECTIONTYPES_H

#include <QString>
#include <QDate>
#include <QList>
#include <QJsonObject>

#include "sync/money.h"

namespace FieldSync {

/**
 * @brief Identifies one remote document that can receive a payment
 *
 * Series and number alone are not unique across the remote's document
 * types, so the key also carries the partner, document code and date.
 */
struct DocumentReference {
    QString partnerId;
    QString series;
    QString number;
    QString documentCode;
    QDate date;

    QString key() const;
    QString displayName() const;
};

/**
 * @brief An outstanding client balance as reported by the remote
 */
struct OutstandingBalance {
    QString partnerId;
    QString partnerName;
    QString documentType;   ///< e.g. "Factura"
    QString documentCode;
    QString series;
    QString number;
    QDate date;
    QDate dueDate;
    Money value;            ///< Original document value
    Money rest;             ///< Amount still unpaid
    QString currency = "RON";

    DocumentReference reference() const;
    QString key() const { return reference().key(); }

    QJsonObject toJson() const;
    static OutstandingBalance fromJson(const QJsonObject &json);
};

/**
 * @brief One line of a payment: how much goes to which document
 */
struct BalanceAllocation {
    DocumentReference document;
    Money requestedAmount;
};

/**
 * @brief A single payment split across one or more outstanding balances
 */
struct CollectionGroupRequest {
    QString partnerId;
    QString partnerName;
    QList<BalanceAllocation> allocations;

    Money total() const;
};

} // namespace FieldSync

#endif // COLLECTIONTYPES_H
