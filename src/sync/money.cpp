#include "money.h"

#include <QRegularExpression>
#include <cmath>
#include <limits>

namespace FieldSync {

Money Money::fromCents(qint64 cents)
{
    Money money;
    money.m_cents = cents;
    return money;
}

Money Money::fromDouble(double value)
{
    return fromCents(static_cast<qint64>(std::llround(value * 100.0)));
}

Money Money::parse(const QString &text, bool *ok)
{
    static const QRegularExpression pattern(QStringLiteral("^([+-]?)(\\d+)(?:[.,](\\d{0,2}))?$"));

    if (ok) {
        *ok = false;
    }

    const QString trimmed = text.trimmed();
    QRegularExpressionMatch match = pattern.match(trimmed);
    if (!match.hasMatch()) {
        return Money();
    }

    bool wholeOk = false;
    qint64 whole = match.captured(2).toLongLong(&wholeOk);
    if (!wholeOk) {
        return Money();
    }
    // whole * 100 plus two fraction digits must stay inside qint64
    if (whole > (std::numeric_limits<qint64>::max() - 99) / 100) {
        return Money();
    }

    QString fraction = match.captured(3);
    while (fraction.size() < 2) {
        fraction.append(QLatin1Char('0'));
    }

    qint64 cents = whole * 100 + fraction.toLongLong();
    if (match.captured(1) == QLatin1String("-")) {
        cents = -cents;
    }

    if (ok) {
        *ok = true;
    }
    return fromCents(cents);
}

QString Money::toString() const
{
    const qint64 absolute = m_cents < 0 ? -m_cents : m_cents;
    return QString("%1%2.%3")
        .arg(m_cents < 0 ? QLatin1String("-") : QLatin1String(""))
        .arg(absolute / 100)
        .arg(absolute % 100, 2, 10, QLatin1Char('0'));
}

} // namespace FieldSync
