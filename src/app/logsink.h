#ifndef LOGSINK_H
#define LOGSINK_H

#include <QObject>
#include <QStringList>

namespace FieldSync {

/**
 * @brief Collects user-facing log lines for the headless agent
 *
 * Provides formatted log output with INFO, WARNING, and ERROR levels,
 * echoed to stderr. Keeps the most recent lines only.
 */
class LogSink : public QObject
{
    Q_OBJECT

public:
    explicit LogSink(QObject *parent = nullptr);

    QStringList lines() const { return m_lines; }
    void setEcho(bool echo) { m_echo = echo; }

    static const int MAX_LINES = 1000;

    /**
     * @brief Route Qt messages through a filter
     *
     * Debug messages are dropped unless @p debug is set.
     */
    static void installMessageHandler(bool debug);

public slots:
    void logInfo(const QString &message);
    void logWarning(const QString &message);
    void logError(const QString &message);
    void clear();

signals:
    void lineAdded(const QString &line);

private:
    void append(const QString &line);

    QStringList m_lines;
    bool m_echo = true;
};

} // namespace FieldSync

#endif // LOGSINK_H
