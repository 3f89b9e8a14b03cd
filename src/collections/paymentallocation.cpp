#include "paymentallocation.h"

#include <QDebug>

namespace FieldSync {

bool AllocationValidation::isLineValid(const QString &balanceKey) const
{
    for (const AllocationIssue &issue : issues) {
        if (issue.balanceKey == balanceKey) {
            return false;
        }
    }
    return true;
}

QStringList AllocationValidation::invalidKeys() const
{
    QStringList keys;
    for (const AllocationIssue &issue : issues) {
        if (!keys.contains(issue.balanceKey)) {
            keys << issue.balanceKey;
        }
    }
    return keys;
}

// ========== Partner & Balances ==========

void PaymentAllocationEngine::setPartner(const QString &partnerId, const QString &partnerName)
{
    m_partnerId = partnerId.trimmed();
    m_partnerName = partnerName;
    clearSelection();
}

void PaymentAllocationEngine::setOutstandingBalances(const QList<OutstandingBalance> &balances)
{
    m_balances = balances;
}

const OutstandingBalance *PaymentAllocationEngine::findBalance(const QString &balanceKey) const
{
    for (const OutstandingBalance &balance : m_balances) {
        if (balance.key() == balanceKey) {
            return &balance;
        }
    }
    return nullptr;
}

// ========== Selection ==========

bool PaymentAllocationEngine::select(const QString &balanceKey)
{
    if (m_selection.contains(balanceKey)) {
        return false;
    }

    const OutstandingBalance *balance = findBalance(balanceKey);
    if (!balance) {
        qWarning() << "[PaymentAllocation] Unknown balance key:" << balanceKey;
        return false;
    }

    m_selection << balanceKey;
    m_entered[balanceKey] = balance->rest.toString();
    return true;
}

void PaymentAllocationEngine::deselect(const QString &balanceKey)
{
    m_selection.removeAll(balanceKey);
    m_entered.remove(balanceKey);
}

bool PaymentAllocationEngine::toggle(const QString &balanceKey)
{
    if (isSelected(balanceKey)) {
        deselect(balanceKey);
        return false;
    }
    return select(balanceKey);
}

bool PaymentAllocationEngine::isSelected(const QString &balanceKey) const
{
    return m_selection.contains(balanceKey);
}

void PaymentAllocationEngine::clearSelection()
{
    m_selection.clear();
    m_entered.clear();
}

// ========== Amounts ==========

bool PaymentAllocationEngine::setAmount(const QString &balanceKey, const QString &text)
{
    if (!m_selection.contains(balanceKey)) {
        return false;
    }
    m_entered[balanceKey] = text;
    return true;
}

QString PaymentAllocationEngine::enteredAmount(const QString &balanceKey) const
{
    return m_entered.value(balanceKey);
}

Money PaymentAllocationEngine::allocatedAmount(const QString &balanceKey) const
{
    bool ok = false;
    Money amount = Money::parse(m_entered.value(balanceKey), &ok);
    return ok ? amount : Money();
}

Money PaymentAllocationEngine::allocatedTotal() const
{
    Money total;
    for (const QString &key : m_selection) {
        total += allocatedAmount(key);
    }
    return total;
}

Money PaymentAllocationEngine::selectedOutstandingTotal() const
{
    Money total;
    for (const QString &key : m_selection) {
        if (const OutstandingBalance *balance = findBalance(key)) {
            total += balance->rest;
        }
    }
    return total;
}

// ========== Validation ==========

bool PaymentAllocationEngine::isAmountValid(const Money &amount, const Money &outstanding)
{
    return amount.isPositive() && amount <= outstanding;
}

AllocationValidation PaymentAllocationEngine::validate() const
{
    AllocationValidation validation;

    for (const QString &key : m_selection) {
        AllocationIssue issue;
        issue.balanceKey = key;

        const OutstandingBalance *balance = findBalance(key);
        if (!balance) {
            issue.reason = AllocationIssue::Reason::UnknownBalance;
            issue.message = "Invoice no longer has an outstanding balance";
            validation.issues << issue;
            continue;
        }

        issue.outstanding = balance->rest;
        const QString docName = balance->reference().displayName();

        bool ok = false;
        Money amount = Money::parse(m_entered.value(key), &ok);
        issue.entered = amount;

        if (!ok) {
            issue.reason = AllocationIssue::Reason::NotANumber;
            issue.message = QString("Enter a valid amount for invoice %1").arg(docName);
            validation.issues << issue;
        } else if (!amount.isPositive()) {
            issue.reason = AllocationIssue::Reason::NotPositive;
            issue.message = QString("Amount for invoice %1 must be greater than 0").arg(docName);
            validation.issues << issue;
        } else if (amount > balance->rest) {
            issue.reason = AllocationIssue::Reason::ExceedsBalance;
            issue.message = QString("Amount exceeds the outstanding balance (%1) for invoice %2")
                .arg(balance->rest.toString(), docName);
            validation.issues << issue;
        }
    }

    return validation;
}

AllocationResult PaymentAllocationEngine::buildRequest() const
{
    AllocationResult result;

    if (m_partnerId.isEmpty()) {
        result.errorMessage = "Invalid partner for collection";
        return result;
    }

    if (m_selection.isEmpty()) {
        result.errorMessage = "Select at least one invoice";
        return result;
    }

    AllocationValidation validation = validate();
    if (!validation.isValid()) {
        result.issues = validation.issues;
        result.errorMessage = QString("%1 of %2 selected invoice(s) have invalid amounts")
            .arg(validation.invalidKeys().size())
            .arg(m_selection.size());
        return result;
    }

    result.request.partnerId = m_partnerId;
    result.request.partnerName = m_partnerName;

    for (const QString &key : m_selection) {
        const OutstandingBalance *balance = findBalance(key);
        Money amount = allocatedAmount(key);
        if (!balance || !amount.isPositive()) {
            continue;
        }

        BalanceAllocation allocation;
        allocation.document = balance->reference();
        allocation.requestedAmount = amount;
        result.request.allocations << allocation;
    }

    if (result.request.allocations.isEmpty()) {
        result.errorMessage = "Enter valid amounts for at least one invoice";
        return result;
    }

    result.success = true;
    return result;
}

} // namespace FieldSync
