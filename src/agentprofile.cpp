#include "agentprofile.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSettings>
#include <QDateTime>

namespace FieldSync {

const QString AgentProfile::DEFAULT_RECEIPT_SERIES = "CH";
const QString AgentProfile::DEFAULT_INVOICE_SERIES = "FA";
const QString AgentProfile::DEFAULT_AUTO_SYNC_TIME = "18:00";

AgentProfile::AgentProfile(const QString &dataFolderPath)
    : m_dataFolderPath(dataFolderPath)
    , m_receiptSeries(DEFAULT_RECEIPT_SERIES)
    , m_invoiceSeries(DEFAULT_INVOICE_SERIES)
    , m_autoSyncTime(QTime::fromString(DEFAULT_AUTO_SYNC_TIME, "HH:mm"))
{
    // Try to load existing settings if path is set
    if (!m_dataFolderPath.isEmpty()) {
        load();
    }
}

void AgentProfile::setDataFolderPath(const QString &path)
{
    m_dataFolderPath = path;
}

bool AgentProfile::isValid() const
{
    if (m_dataFolderPath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_dataFolderPath);
    return info.exists() && info.isDir() && info.isWritable();
}

bool AgentProfile::exists() const
{
    return QFile::exists(configFilePath());
}

// ========== Numbering ==========

QueueResult<QString> AgentProfile::takeReceiptNumber()
{
    return takeNumber(m_receiptRange, "Receipt number range exhausted");
}

QueueResult<QString> AgentProfile::takeInvoiceNumber()
{
    return takeNumber(m_invoiceRange, "Invoice number range exhausted");
}

QueueResult<QString> AgentProfile::takeNumber(NumberRange &range, const QString &exhaustedMessage)
{
    if (!range.isConfigured()) {
        return QueueResult<QString>::ok(
            QDateTime::currentDateTime().toString("yyyyMMddHHmmss"));
    }

    if (range.current < range.start) {
        range.current = range.start;
    }
    if (range.isExhausted()) {
        return QueueResult<QString>::failure(exhaustedMessage);
    }

    const qint64 number = range.current++;

    // Persist right away so a crash cannot hand out the same number twice
    if (!m_dataFolderPath.isEmpty() && !save()) {
        --range.current;
        return QueueResult<QString>::failure(
            QString("Failed to save profile: %1").arg(configFilePath()));
    }

    return QueueResult<QString>::ok(QString::number(number));
}

// ========== Persistence ==========

bool AgentProfile::load()
{
    QString configPath = configFilePath();
    if (!QFile::exists(configPath)) {
        return false;
    }

    QSettings settings(configPath, QSettings::IniFormat);

    // Agent identity
    m_agentName = settings.value("agent/name", QString()).toString();
    m_agentCode = settings.value("agent/code", QString()).toString();

    // Receipts
    m_receiptSeries = settings.value("receipts/series", DEFAULT_RECEIPT_SERIES).toString();
    m_receiptRange.start = settings.value("receipts/start", 0).toLongLong();
    m_receiptRange.end = settings.value("receipts/end", 0).toLongLong();
    m_receiptRange.current = settings.value("receipts/current", m_receiptRange.start).toLongLong();

    // Invoices
    m_invoiceSeries = settings.value("invoices/series", DEFAULT_INVOICE_SERIES).toString();
    m_invoiceRange.start = settings.value("invoices/start", 0).toLongLong();
    m_invoiceRange.end = settings.value("invoices/end", 0).toLongLong();
    m_invoiceRange.current = settings.value("invoices/current", m_invoiceRange.start).toLongLong();

    // Sync settings
    m_autoSyncEnabled = settings.value("sync/autoSyncEnabled", false).toBool();
    m_autoSyncTime = QTime::fromString(
        settings.value("sync/autoSyncTime", DEFAULT_AUTO_SYNC_TIME).toString(), "HH:mm");

    return true;
}

bool AgentProfile::save()
{
    if (m_dataFolderPath.isEmpty()) {
        return false;
    }

    // Ensure directory exists
    QDir dir(m_dataFolderPath);
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    QSettings settings(configFilePath(), QSettings::IniFormat);

    settings.setValue("agent/name", m_agentName);
    settings.setValue("agent/code", m_agentCode);

    settings.setValue("receipts/series", m_receiptSeries);
    settings.setValue("receipts/start", m_receiptRange.start);
    settings.setValue("receipts/end", m_receiptRange.end);
    settings.setValue("receipts/current", m_receiptRange.current);

    settings.setValue("invoices/series", m_invoiceSeries);
    settings.setValue("invoices/start", m_invoiceRange.start);
    settings.setValue("invoices/end", m_invoiceRange.end);
    settings.setValue("invoices/current", m_invoiceRange.current);

    settings.setValue("sync/autoSyncEnabled", m_autoSyncEnabled);
    settings.setValue("sync/autoSyncTime", m_autoSyncTime.toString("HH:mm"));

    settings.sync();
    return settings.status() == QSettings::NoError;
}

bool AgentProfile::initialize()
{
    if (m_dataFolderPath.isEmpty()) {
        return false;
    }

    QDir dir(m_dataFolderPath);

    // Create main directory
    if (!dir.exists()) {
        if (!dir.mkpath(".")) {
            return false;
        }
    }

    dir.mkpath("store");
    dir.mkpath(".state");

    // Save default settings
    return save();
}

QString AgentProfile::configFilePath() const
{
    if (m_dataFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_dataFolderPath).filePath(".qfieldsync.conf");
}

QString AgentProfile::storeDirectoryPath() const
{
    if (m_dataFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_dataFolderPath).filePath("store");
}

QString AgentProfile::stateDirectoryPath() const
{
    if (m_dataFolderPath.isEmpty()) {
        return QString();
    }
    return QDir(m_dataFolderPath).filePath(".state");
}

} // namespace FieldSync
