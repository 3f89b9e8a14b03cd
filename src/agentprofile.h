#ifndef AGENTPROFILE_H
#define AGENTPROFILE_H

#include <QString>
#include <QTime>

#include "sync/synctypes.h"

namespace FieldSync {

/**
 * @brief A document number range handed out by the central office
 *
 * current is the next number to use. An unset range (end == 0) means
 * numbers are not managed locally.
 */
struct NumberRange
{
    qint64 start = 0;
    qint64 end = 0;
    qint64 current = 0;

    bool isConfigured() const { return end > 0; }
    bool isExhausted() const { return isConfigured() && current > end; }
    qint64 remaining() const { return isConfigured() ? qMax<qint64>(0, end - current + 1) : 0; }
};

/**
 * @brief Field agent profile with its numbering and sync settings
 *
 * Profile settings are stored in the data folder itself as .qfieldsync.conf,
 * so the queue, state and numbering travel together.
 *
 * Each profile corresponds to:
 *   - One field agent (name and agent code)
 *   - A receipt series and number range
 *   - An invoice series and number range
 *   - The daily auto-sync switch and time
 */
class AgentProfile
{
public:
    /**
     * @brief Create a profile for the given data folder
     * @param dataFolderPath Path to the data folder (e.g., ~/FieldSync)
     */
    explicit AgentProfile(const QString &dataFolderPath = QString());

    QString dataFolderPath() const { return m_dataFolderPath; }
    void setDataFolderPath(const QString &path);

    // Check if profile is valid (folder exists and is writable)
    bool isValid() const;

    // Check if profile config file exists
    bool exists() const;

    // ========== Agent Identity ==========

    QString agentName() const { return m_agentName; }
    void setAgentName(const QString &name) { m_agentName = name; }

    QString agentCode() const { return m_agentCode; }
    void setAgentCode(const QString &code) { m_agentCode = code; }

    // ========== Numbering ==========

    QString receiptSeries() const { return m_receiptSeries; }
    void setReceiptSeries(const QString &series) { m_receiptSeries = series; }

    NumberRange receiptRange() const { return m_receiptRange; }
    void setReceiptRange(const NumberRange &range) { m_receiptRange = range; }

    QString invoiceSeries() const { return m_invoiceSeries; }
    void setInvoiceSeries(const QString &series) { m_invoiceSeries = series; }

    NumberRange invoiceRange() const { return m_invoiceRange; }
    void setInvoiceRange(const NumberRange &range) { m_invoiceRange = range; }

    /**
     * @brief Reserve the next receipt number and persist the range
     *
     * Without a configured range the number is a yyyyMMddHHmmss timestamp.
     */
    QueueResult<QString> takeReceiptNumber();
    QueueResult<QString> takeInvoiceNumber();

    // ========== Sync Settings ==========

    bool autoSyncEnabled() const { return m_autoSyncEnabled; }
    void setAutoSyncEnabled(bool enabled) { m_autoSyncEnabled = enabled; }

    // Daily auto-sync time of day
    QTime autoSyncTime() const { return m_autoSyncTime; }
    void setAutoSyncTime(const QTime &time) { m_autoSyncTime = time; }

    // ========== Persistence ==========

    // Load settings from .qfieldsync.conf in the data folder
    bool load();

    // Save settings to .qfieldsync.conf in the data folder
    bool save();

    // Initialize a new profile (create directories and default config)
    bool initialize();

    QString configFilePath() const;

    // Queue files live here
    QString storeDirectoryPath() const;

    // Sync status lives here
    QString stateDirectoryPath() const;

private:
    QueueResult<QString> takeNumber(NumberRange &range, const QString &exhaustedMessage);

    QString m_dataFolderPath;

    QString m_agentName;
    QString m_agentCode;

    QString m_receiptSeries;
    NumberRange m_receiptRange;
    QString m_invoiceSeries;
    NumberRange m_invoiceRange;

    bool m_autoSyncEnabled = false;
    QTime m_autoSyncTime;

    // Default values
    static const QString DEFAULT_RECEIPT_SERIES;
    static const QString DEFAULT_INVOICE_SERIES;
    static const QString DEFAULT_AUTO_SYNC_TIME;
};

} // namespace FieldSync

#endif // AGENTPROFILE_H
