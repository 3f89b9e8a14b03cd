#ifndef MONEY_H
#define MONEY_H

#include <QString>
#include <QtGlobal>

namespace FieldSync {

/**
 * @brief Currency amount with two-decimal semantics
 *
 * Amounts are held as a whole number of cents so that sums of allocations
 * are exact. Parsing accepts the forms an agent types on a device keyboard:
 * "150", "150.5", "150,50". More than two decimals is rejected rather than
 * rounded.
 */
class Money
{
public:
    Money() = default;

    static Money fromCents(qint64 cents);

    /**
     * @brief Convert a floating point value, rounding half away from zero
     *
     * Only used at the boundary with remote payloads that carry doubles.
     */
    static Money fromDouble(double value);

    /**
     * @brief Parse user-entered text
     * @param ok Set to false when the text is empty, not a number,
     *           or has more than two decimals
     */
    static Money parse(const QString &text, bool *ok = nullptr);

    qint64 cents() const { return m_cents; }
    double toDouble() const { return static_cast<double>(m_cents) / 100.0; }

    /**
     * @brief Format as "1234.50" (no grouping, dot separator)
     */
    QString toString() const;

    bool isZero() const { return m_cents == 0; }
    bool isPositive() const { return m_cents > 0; }

    Money operator+(const Money &other) const { return fromCents(m_cents + other.m_cents); }
    Money operator-(const Money &other) const { return fromCents(m_cents - other.m_cents); }
    Money &operator+=(const Money &other) { m_cents += other.m_cents; return *this; }
    Money &operator-=(const Money &other) { m_cents -= other.m_cents; return *this; }

    bool operator==(const Money &other) const { return m_cents == other.m_cents; }
    bool operator!=(const Money &other) const { return m_cents != other.m_cents; }
    bool operator<(const Money &other) const { return m_cents < other.m_cents; }
    bool operator<=(const Money &other) const { return m_cents <= other.m_cents; }
    bool operator>(const Money &other) const { return m_cents > other.m_cents; }
    bool operator>=(const Money &other) const { return m_cents >= other.m_cents; }

private:
    qint64 m_cents = 0;
};

} // namespace FieldSync

#endif // MONEY_H
