#ifndef AUTOSENDORCHESTRATOR_H
#define AUTOSENDORCHESTRATOR_H

#include <QObject>
#include <QString>
#include <atomic>

#include "synctypes.h"

namespace FieldSync {

class ConnectivityProbe;
class DocumentQueueClient;
class SignalBus;
class SyncStatusStore;

/**
 * @brief Runs the staged auto-send pipeline, one cycle at a time
 *
 * The orchestrator coordinates:
 *   - The in-progress guard (test-and-set; a busy trigger is dropped)
 *   - Stage execution against the document queue, in fixed order
 *   - Before/after collection counts for reporting
 *   - SyncStatusStore updates and SignalBus invalidation topics
 *
 * Usage:
 * @code
 * AutoSendOrchestrator orchestrator;
 * orchestrator.setQueue(queue);
 * orchestrator.setProbe(probe);
 * orchestrator.setStatusStore(store);
 *
 * connect(probe, &ConnectivityProbe::connectionRestored,
 *         &orchestrator, &AutoSendOrchestrator::runCycle);
 * @endcode
 *
 * Stages:
 *   1. baseline      pending+failed collections
 *   -  reference-data (manual sync only)
 *   2. invoices      submit pending/failed invoices
 *   3. balances      refresh outstanding balances, non-fatal
 *   4. collections   push pending/failed collections
 *   5. post-count    pending+failed collections again
 *
 * A stage failure is recorded in CycleResult::partialFailures and the next
 * stage runs anyway. Nothing thrown by a stage escapes runCycle().
 */
class AutoSendOrchestrator : public QObject
{
    Q_OBJECT

public:
    explicit AutoSendOrchestrator(QObject *parent = nullptr);
    ~AutoSendOrchestrator() override;

    // ========== Collaborators ==========
    // None of these are owned by the orchestrator.

    void setQueue(DocumentQueueClient *queue) { m_queue = queue; }
    DocumentQueueClient* queue() const { return m_queue; }

    /**
     * @brief Source of the connectivity state
     *
     * Without a probe the orchestrator considers itself offline.
     */
    void setProbe(ConnectivityProbe *probe) { m_probe = probe; }
    ConnectivityProbe* probe() const { return m_probe; }

    void setStatusStore(SyncStatusStore *store) { m_statusStore = store; }
    SyncStatusStore* statusStore() const { return m_statusStore; }

    /**
     * @brief Bus for invalidation topics (default: SignalBus::instance())
     */
    void setSignalBus(SignalBus *bus) { m_bus = bus; }

    // ========== State ==========

    /**
     * @brief Whether a cycle currently holds the guard
     */
    bool isInProgress() const { return m_inProgress.load(); }

    bool isOnline() const;

    CycleResult lastResult() const { return m_lastResult; }
    int cyclesRun() const { return m_cyclesRun; }

public slots:
    /**
     * @brief Run one auto-send cycle
     *
     * Returns immediately with SkippedOffline or SkippedBusy, touching no
     * state and emitting nothing, when offline or already running.
     */
    FieldSync::CycleResult runCycle();

    /**
     * @brief User-initiated sync
     *
     * Same pipeline plus a reference data stage before invoices. Rejected
     * with errorOccurred() when offline.
     */
    FieldSync::CycleResult runManualSync();

signals:
    void cycleStarted(bool manual);
    void stageStarted(FieldSync::SyncStage stage);
    void stageFinished(FieldSync::SyncStage stage, bool success);
    void cycleFinished(const FieldSync::CycleResult &result);
    void logMessage(const QString &message);
    void warningRaised(const QString &warning);
    void errorOccurred(const QString &error);

private:
    CycleResult execute(bool manual);

    template<typename Body>
    bool runStage(SyncStage stage, CycleResult &result, Body body);

    int countOpenCollections(QString &error);
    void finishCycle(CycleResult &result);

    DocumentQueueClient *m_queue = nullptr;
    ConnectivityProbe *m_probe = nullptr;
    SyncStatusStore *m_statusStore = nullptr;
    SignalBus *m_bus = nullptr;

    std::atomic<bool> m_inProgress{false};
    CycleResult m_lastResult;
    int m_cyclesRun = 0;
};

} // namespace FieldSync

#endif // AUTOSENDORCHESTRATOR_H
