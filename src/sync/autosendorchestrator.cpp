#include "autosendorchestrator.h"
#include "connectivityprobe.h"
#include "documentqueueclient.h"
#include "signalbus.h"
#include "syncstatusstore.h"

#include <QDebug>

#include <exception>

namespace FieldSync {

namespace {

// Holds the in-progress flag for the lifetime of one cycle
class CycleGuard
{
public:
    explicit CycleGuard(std::atomic<bool> &flag)
        : m_flag(flag)
        , m_acquired(!flag.exchange(true))
    {
    }

    ~CycleGuard()
    {
        if (m_acquired) {
            m_flag.store(false);
        }
    }

    CycleGuard(const CycleGuard &) = delete;
    CycleGuard &operator=(const CycleGuard &) = delete;

    bool acquired() const { return m_acquired; }

private:
    std::atomic<bool> &m_flag;
    bool m_acquired;
};

// Status updates and subscribers must not abort a cycle that already holds the guard
template<typename Notify>
void notifySafely(const char *what, Notify notify)
{
    try {
        notify();
    } catch (const std::exception &e) {
        qWarning() << "[AutoSendOrchestrator]" << what << "threw:" << e.what();
    }
}

const char *kBalancesWarning = "Balances could not be synced now; collections continue to sync.";

} // namespace

AutoSendOrchestrator::AutoSendOrchestrator(QObject *parent)
    : QObject(parent)
{
}

AutoSendOrchestrator::~AutoSendOrchestrator() = default;

bool AutoSendOrchestrator::isOnline() const
{
    return m_probe && m_probe->isOnline();
}

// ========== Entry Points ==========

CycleResult AutoSendOrchestrator::runCycle()
{
    CycleResult skipped;
    skipped.startTime = QDateTime::currentDateTime();
    skipped.endTime = skipped.startTime;

    if (!isOnline()) {
        qDebug() << "[AutoSendOrchestrator] Offline, cycle skipped";
        skipped.outcome = CycleOutcome::SkippedOffline;
        return skipped;
    }

    return execute(false);
}

CycleResult AutoSendOrchestrator::runManualSync()
{
    CycleResult rejected;
    rejected.manual = true;
    rejected.startTime = QDateTime::currentDateTime();
    rejected.endTime = rejected.startTime;

    if (!isOnline()) {
        rejected.outcome = CycleOutcome::Rejected;
        rejected.errorMessage = "No internet connection";
        emit errorOccurred(rejected.errorMessage);
        return rejected;
    }

    return execute(true);
}

// ========== Pipeline ==========

template<typename Body>
bool AutoSendOrchestrator::runStage(SyncStage stage, CycleResult &result, Body body)
{
    notifySafely("stageStarted", [&] { emit stageStarted(stage); });

    QString error;
    bool ok = false;
    try {
        ok = body(error);
    } catch (const std::exception &e) {
        error = QString::fromUtf8(e.what());
        ok = false;
    }

    if (!ok) {
        result.partialFailures.append(syncStageName(stage));
        qWarning() << "[AutoSendOrchestrator] Stage" << syncStageName(stage) << "failed:" << error;
        notifySafely("logMessage", [&] {
            emit logMessage(QString("Stage %1 failed: %2").arg(syncStageName(stage), error));
        });
    }

    notifySafely("stageFinished", [&] { emit stageFinished(stage, ok); });
    return ok;
}

CycleResult AutoSendOrchestrator::execute(bool manual)
{
    CycleResult result;
    result.manual = manual;
    result.startTime = QDateTime::currentDateTime();

    if (!m_queue) {
        result.outcome = CycleOutcome::Rejected;
        result.errorMessage = "No document queue configured";
        result.endTime = result.startTime;
        emit errorOccurred(result.errorMessage);
        return result;
    }

    CycleGuard guard(m_inProgress);
    if (!guard.acquired()) {
        qDebug() << "[AutoSendOrchestrator] Cycle already in progress, trigger dropped";
        result.outcome = CycleOutcome::SkippedBusy;
        result.endTime = result.startTime;
        return result;
    }

    SignalBus *bus = m_bus ? m_bus : &SignalBus::instance();

    if (m_statusStore) {
        notifySafely("markSyncStarted", [this] { m_statusStore->markSyncStarted(); });
    }
    notifySafely("SyncStarted subscriber", [bus] { bus->publish(SyncTopic::SyncStarted); });
    notifySafely("cycleStarted", [&] {
        emit cycleStarted(manual);
        emit logMessage(manual ? QString("Starting manual sync") : QString("Starting auto-send"));
    });

    // 1. Baseline
    int baseline = 0;
    const bool baselineOk = runStage(SyncStage::Baseline, result, [&](QString &error) {
        baseline = countOpenCollections(error);
        return baseline >= 0;
    });

    // Reference data, manual sync only
    if (manual) {
        runStage(SyncStage::ReferenceData, result, [&](QString &error) {
            QueueResult<SyncStatus> synced = m_queue->syncReferenceData();
            error = synced.errorMessage;
            return synced.success;
        });
    }

    // 2. Invoices
    runStage(SyncStage::Invoices, result, [&](QString &error) {
        QueueResult<QStringList> sent = m_queue->submitAllPending(DocumentKind::Invoice);
        if (!sent.success) {
            error = sent.errorMessage;
            return false;
        }
        result.sentInvoiceIds = sent.value;
        result.invoicesSent = sent.value.size();
        return true;
    });

    // 3. Balances (non-fatal)
    const bool balancesOk = runStage(SyncStage::Balances, result, [&](QString &error) {
        OperationResult synced = m_queue->syncBalances();
        error = synced.errorMessage;
        return synced.success;
    });
    if (!balancesOk) {
        result.warnings.append(kBalancesWarning);
        notifySafely("warningRaised", [this] { emit warningRaised(kBalancesWarning); });
    }

    // 4. Collections
    runStage(SyncStage::Collections, result, [&](QString &error) {
        OperationResult synced = m_queue->syncCollections();
        error = synced.errorMessage;
        return synced.success;
    });

    // 5. Post count
    int post = 0;
    const bool postOk = runStage(SyncStage::PostCount, result, [&](QString &error) {
        post = countOpenCollections(error);
        return post >= 0;
    });

    // Without both counts there is nothing meaningful to report
    result.collectionsProcessed = (baselineOk && postOk) ? qMax(0, baseline - post) : 0;

    finishCycle(result);

    if (result.invoicesSent > 0) {
        notifySafely("InvoicesUpdated subscriber", [bus] { bus->publish(SyncTopic::InvoicesUpdated); });
    }
    if (result.collectionsProcessed > 0) {
        notifySafely("CollectionsUpdated subscriber", [bus] { bus->publish(SyncTopic::CollectionsUpdated); });
    }
    notifySafely("SyncCompleted subscriber", [bus] { bus->publish(SyncTopic::SyncCompleted); });

    ++m_cyclesRun;
    m_lastResult = result;

    notifySafely("cycleFinished", [&] {
        emit logMessage(QString("Sync complete. %1. Duration: %2ms")
            .arg(result.summary())
            .arg(result.durationMs()));
        emit cycleFinished(result);
    });
    return result;
}

int AutoSendOrchestrator::countOpenCollections(QString &error)
{
    QueueResult<QList<Document>> open = m_queue->listDocuments(
        DocumentKind::Collection, {DocumentStatus::Pending, DocumentStatus::Failed});
    if (!open.success) {
        error = open.errorMessage;
        return -1;
    }
    return open.value.size();
}

void AutoSendOrchestrator::finishCycle(CycleResult &result)
{
    result.outcome = CycleOutcome::Completed;
    result.endTime = QDateTime::currentDateTime();

    if (!m_statusStore) {
        return;
    }

    SyncTimestamps timestamps;
    try {
        timestamps = m_queue->currentSyncStatus().timestamps();
    } catch (const std::exception &e) {
        qWarning() << "[AutoSendOrchestrator] Could not read sync timestamps:" << e.what();
    }
    notifySafely("markSyncCompleted", [&] { m_statusStore->markSyncCompleted(timestamps); });
}

} // namespace FieldSync
