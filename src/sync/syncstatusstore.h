#ifndef SYNCSTATUSSTORE_H
#define SYNCSTATUSSTORE_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QJsonObject>

#include "synctypes.h"

namespace FieldSync {

class DocumentQueueClient;

/**
 * @brief Holds last-known sync timestamps and the first-run flag
 *
 * Written only by the orchestrator (markSyncStarted/markSyncCompleted).
 * Views read it through get() and statusChanged().
 *
 * State is stored in:
 *   <stateDir>/sync_status.json
 *
 * The first-run decision is made once in initialize(). It is not
 * re-derived mid-session except through recheckFirstRun(), and once a
 * reference sync completes it never flips back to true.
 */
class SyncStatusStore : public QObject
{
    Q_OBJECT

public:
    explicit SyncStatusStore(QObject *parent = nullptr);
    ~SyncStatusStore() override;

    // ========== Read Access ==========

    SyncStatus get() const { return m_status; }
    bool isFirstRun() const { return m_status.isFirstRun; }
    bool isSyncing() const { return m_status.isSyncing; }

    /**
     * @brief When the last orchestrator cycle finished
     */
    QDateTime lastCycleAt() const { return m_lastCycleAt; }

    // ========== First Run ==========

    /**
     * @brief Load persisted state and decide first run
     *
     * First run is true when the queue has no reference data locally.
     */
    bool initialize(DocumentQueueClient *client);

    /**
     * @brief Explicit fresh first-run check
     */
    bool recheckFirstRun(DocumentQueueClient *client);

    bool isInitialized() const { return m_initialized; }

    // ========== Orchestrator Updates ==========

    void markSyncStarted();

    /**
     * @brief Record the end of a cycle
     *
     * Invalid timestamps leave the previous value in place. A valid
     * partners timestamp clears the first-run flag for good.
     */
    void markSyncCompleted(const SyncTimestamps &timestamps);

    // ========== Persistence ==========

    bool load();
    bool save();

    QString statePath() const { return m_stateDir; }
    void setStateDirectory(const QString &path);

signals:
    void statusChanged(const FieldSync::SyncStatus &status);
    void errorOccurred(const QString &error);

private:
    QString stateFilePath() const;

    SyncStatus m_status;
    QDateTime m_lastCycleAt;
    QString m_stateDir;
    bool m_initialized = false;
};

} // namespace FieldSync

#endif // SYNCSTATUSSTORE_H
