#include "logsink.h"

#include <cstdio>

namespace FieldSync {

namespace {

bool s_debugEnabled = false;

void filteredMessageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    Q_UNUSED(context);
    if (type == QtDebugMsg && !s_debugEnabled) {
        return;
    }
    const QByteArray local = msg.toLocal8Bit();
    std::fprintf(stderr, "%s\n", local.constData());
    std::fflush(stderr);
}

} // namespace

LogSink::LogSink(QObject *parent)
    : QObject(parent)
{
}

void LogSink::installMessageHandler(bool debug)
{
    s_debugEnabled = debug;
    qInstallMessageHandler(filteredMessageHandler);
}

void LogSink::logInfo(const QString &message)
{
    append(QString("[INFO] %1").arg(message));
}

void LogSink::logWarning(const QString &message)
{
    append(QString("[WARNING] %1").arg(message));
}

void LogSink::logError(const QString &message)
{
    append(QString("[ERROR] %1").arg(message));
}

void LogSink::clear()
{
    m_lines.clear();
}

void LogSink::append(const QString &line)
{
    m_lines.append(line);
    while (m_lines.size() > MAX_LINES) {
        m_lines.removeFirst();
    }
    if (m_echo) {
        const QByteArray local = line.toLocal8Bit();
        std::fprintf(stderr, "%s\n", local.constData());
    }
    emit lineAdded(line);
}

} // namespace FieldSync
