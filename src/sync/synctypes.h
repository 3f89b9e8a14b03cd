#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QJsonObject>
#include <QMetaType>

#include "money.h"

/**
 * @file synctypes.h
 * @brief Common types and enums for the sync orchestrator
 */

namespace FieldSync {

/**
 * @brief Last known reachability of the central system
 */
enum class ConnectivityState {
    Online,
    Offline
};

/**
 * @brief Kinds of documents queued for delivery
 */
enum class DocumentKind {
    Invoice,
    Collection      ///< Payment receipt row; rows sharing a receipt group travel together
};

/**
 * @brief Delivery status of a queued document
 *
 * pending → sending → {sent | synced} | failed, failed → sending (retry),
 * sending → pending (user cancellation, invoices only).
 * Invoices end in Sent, collections end in Synced.
 */
enum class DocumentStatus {
    Pending,
    Sending,
    Sent,
    Synced,
    Failed
};

/**
 * @brief Invalidation topics published after sync activity
 *
 * Payloads carry no state. Subscribers re-query what they display.
 */
enum class SyncTopic {
    SyncStarted,
    SyncCompleted,
    InvoicesUpdated,
    CollectionsUpdated
};

/**
 * @brief Stages of one orchestrator cycle, in execution order
 */
enum class SyncStage {
    Baseline,       ///< Count pending+failed collections before the cycle
    ReferenceData,  ///< Partners/products (manual sync only)
    Invoices,       ///< Submit pending/failed invoices
    Balances,       ///< Refresh outstanding client balances (non-fatal)
    Collections,    ///< Push pending/failed collections
    PostCount       ///< Count pending+failed collections after the cycle
};

/**
 * @brief How a call to runCycle() ended
 */
enum class CycleOutcome {
    Completed,      ///< All stages were attempted (some may have failed)
    SkippedBusy,    ///< Another cycle held the guard
    SkippedOffline, ///< Connectivity was offline
    Rejected        ///< Manual sync refused up front
};

QString documentKindName(DocumentKind kind);
QString documentStatusName(DocumentStatus status);
DocumentStatus documentStatusFromName(const QString &name, bool *ok = nullptr);
QString syncTopicName(SyncTopic topic);
QString syncStageName(SyncStage stage);

/**
 * @brief A locally created invoice or collection row
 *
 * Created as Pending before any network attempt. Only gains a remoteId
 * once it reaches Sent/Synced.
 */
struct Document {
    QString id;
    DocumentKind kind = DocumentKind::Invoice;
    DocumentStatus status = DocumentStatus::Pending;

    QString partnerId;
    QString partnerName;
    QString locationId;     ///< Delivery location (invoices)

    QString series;         ///< Invoice: own series. Collection: series of the paid invoice
    QString number;         ///< Invoice: own number. Collection: number of the paid invoice
    QString documentCode;   ///< Collection: code of the paid document
    QDate documentDate;     ///< Collection: date of the paid document

    QString receiptGroupId; ///< Collection: shared by all rows of one payment
    QString receiptSeries;
    QString receiptNumber;

    Money amount;
    int itemCount = 0;
    QString notes;

    QDateTime createdAt;
    QDateTime sentAt;
    QString remoteId;
    QString errorMessage;   ///< Set only when entering Failed

    bool isOpen() const {
        return status == DocumentStatus::Pending || status == DocumentStatus::Failed;
    }

    QString groupKey() const {
        return receiptGroupId.isEmpty() ? id : receiptGroupId;
    }

    QJsonObject toJson() const;
    static Document fromJson(const QJsonObject &json);
};

/**
 * @brief Legal status transitions for queued documents
 */
class DocumentLifecycle
{
public:
    static bool canTransition(DocumentKind kind, DocumentStatus from, DocumentStatus to);

    /**
     * @brief Terminal success status for a document kind
     */
    static DocumentStatus deliveredStatus(DocumentKind kind);
};

/**
 * @brief Reference data sync timestamps
 */
struct SyncTimestamps {
    QDateTime partnersSyncedAt;
    QDateTime productsSyncedAt;
};

/**
 * @brief Snapshot exposed to the UI
 *
 * isSyncing drives affordances (disable the sync button). It is not the
 * concurrency guard.
 */
struct SyncStatus {
    bool isFirstRun = true;
    QDateTime partnersSyncedAt;
    QDateTime productsSyncedAt;
    bool isSyncing = false;

    SyncTimestamps timestamps() const { return {partnersSyncedAt, productsSyncedAt}; }
};

/**
 * @brief Result of a fallible operation with no value
 */
struct OperationResult {
    bool success = false;
    QString errorMessage;

    static OperationResult ok() { return {true, QString()}; }
    static OperationResult failure(const QString &message) { return {false, message}; }
};

/**
 * @brief Result of a fallible operation carrying a value
 */
template<typename T>
struct QueueResult {
    T value{};
    bool success = false;
    QString errorMessage;

    static QueueResult ok(const T &value) {
        QueueResult result;
        result.value = value;
        result.success = true;
        return result;
    }

    static QueueResult failure(const QString &message) {
        QueueResult result;
        result.errorMessage = message;
        return result;
    }
};

/**
 * @brief Aggregate report of one orchestrator cycle
 */
struct CycleResult {
    CycleOutcome outcome = CycleOutcome::Completed;
    bool manual = false;

    int invoicesSent = 0;
    int collectionsProcessed = 0;   ///< max(0, baseline - post); reporting only
    QStringList sentInvoiceIds;
    QStringList partialFailures;    ///< Stage names that failed
    QStringList warnings;           ///< Soft, user-facing warnings
    QString errorMessage;           ///< Set when Rejected

    QDateTime startTime;
    QDateTime endTime;

    bool ran() const { return outcome == CycleOutcome::Completed; }
    bool hasPartialFailures() const { return !partialFailures.isEmpty(); }

    qint64 durationMs() const {
        return startTime.msecsTo(endTime);
    }

    QString summary() const {
        return QString("Invoices sent: %1, Collections processed: %2, Failed stages: %3")
            .arg(invoicesSent)
            .arg(collectionsProcessed)
            .arg(partialFailures.isEmpty() ? QString("none") : partialFailures.join(", "));
    }
};

} // namespace FieldSync

// Register types for Qt metatype system (needed for queued signals and QSignalSpy)
Q_DECLARE_METATYPE(FieldSync::CycleResult)
Q_DECLARE_METATYPE(FieldSync::SyncStatus)
Q_DECLARE_METATYPE(FieldSync::SyncTopic)
Q_DECLARE_METATYPE(FieldSync::SyncStage)
Q_DECLARE_METATYPE(FieldSync::DocumentKind)

#endif // SYNCTYPES_H
