#ifndef PAYMENTALLOCATION_H
#define PAYMENTALLOCATION_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>

#include "collectiontypes.h"

namespace FieldSync {

/**
 * @brief Why an allocation line cannot be submitted
 */
struct AllocationIssue {
    enum class Reason {
        NotANumber,     ///< Entered text does not parse as an amount
        NotPositive,    ///< Zero or negative
        ExceedsBalance, ///< More than the outstanding rest
        UnknownBalance  ///< Key no longer present in the partner's balances
    };

    QString balanceKey;
    Reason reason = Reason::NotANumber;
    Money entered;
    Money outstanding;
    QString message;
};

/**
 * @brief Per-line validation state of the current selection
 */
struct AllocationValidation {
    QList<AllocationIssue> issues;

    bool isValid() const { return issues.isEmpty(); }
    bool isLineValid(const QString &balanceKey) const;
    QStringList invalidKeys() const;
};

/**
 * @brief Outcome of building a collection group request
 */
struct AllocationResult {
    bool success = false;
    CollectionGroupRequest request;
    QList<AllocationIssue> issues;
    QString errorMessage;
};

/**
 * @brief Splits one payment across a partner's outstanding balances
 *
 * Usage:
 * @code
 * PaymentAllocationEngine engine;
 * engine.setPartner("p1", "Acme Corporation SRL");
 * engine.setOutstandingBalances(balances);
 *
 * engine.select(balances[0].key());           // defaults to the full rest
 * engine.select(balances[1].key());
 * engine.setAmount(balances[1].key(), "60,00"); // partial payment
 *
 * AllocationResult result = engine.buildRequest();
 * if (!result.success) {
 *     // result.issues names every offending line
 * }
 * @endcode
 *
 * A line is valid iff 0 < amount <= rest. Out of range amounts are
 * reported, never clamped, and any invalid line blocks the whole request.
 */
class PaymentAllocationEngine
{
public:
    PaymentAllocationEngine() = default;

    // ========== Partner & Balances ==========

    /**
     * @brief Choose the paying partner
     *
     * Clears any current selection.
     */
    void setPartner(const QString &partnerId, const QString &partnerName = QString());

    QString partnerId() const { return m_partnerId; }
    QString partnerName() const { return m_partnerName; }

    /**
     * @brief Replace the partner's outstanding balances
     *
     * Selected lines whose key disappears stay selected and are reported
     * as UnknownBalance until deselected.
     */
    void setOutstandingBalances(const QList<OutstandingBalance> &balances);

    QList<OutstandingBalance> outstandingBalances() const { return m_balances; }

    // ========== Selection ==========

    /**
     * @brief Select a balance, defaulting its amount to the full rest
     * @return false if the key is unknown or already selected
     */
    bool select(const QString &balanceKey);

    void deselect(const QString &balanceKey);

    /**
     * @brief Select if unselected, deselect otherwise
     * @return true if the balance is selected afterwards
     */
    bool toggle(const QString &balanceKey);

    bool isSelected(const QString &balanceKey) const;
    QStringList selectedKeys() const { return m_selection; }
    void clearSelection();

    // ========== Amounts ==========

    /**
     * @brief Override the amount for a selected line
     *
     * The text is kept verbatim so the entry field can show what was typed.
     * @return false if the line is not selected
     */
    bool setAmount(const QString &balanceKey, const QString &text);

    QString enteredAmount(const QString &balanceKey) const;

    /**
     * @brief Parsed amount for a line; zero when the text does not parse
     */
    Money allocatedAmount(const QString &balanceKey) const;

    Money allocatedTotal() const;
    Money selectedOutstandingTotal() const;

    // ========== Validation ==========

    static bool isAmountValid(const Money &amount, const Money &outstanding);

    AllocationValidation validate() const;

    /**
     * @brief Produce the request handed to the document queue
     *
     * Fails with the full issue list if any selected line is invalid.
     */
    AllocationResult buildRequest() const;

private:
    const OutstandingBalance *findBalance(const QString &balanceKey) const;

    QString m_partnerId;
    QString m_partnerName;
    QList<OutstandingBalance> m_balances;

    QStringList m_selection;            // selection order is submission order
    QMap<QString, QString> m_entered;   // balance key -> raw entered text
};

} // namespace FieldSync

#endif // PAYMENTALLOCATION_H
