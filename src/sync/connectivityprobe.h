#ifndef CONNECTIVITYPROBE_H
#define CONNECTIVITYPROBE_H

#include <QObject>
#include <QTimer>
#include <QUrl>
#include <functional>

#include "synctypes.h"

class QNetworkAccessManager;

namespace FieldSync {

/**
 * @brief Periodic reachability check against a stable external endpoint
 *
 * The probe owns the process's ConnectivityState. Nothing else writes it.
 * It runs on a fixed interval and is re-triggered by transport-level
 * notifications. The observable state is always the result of the most
 * recently *completed* probe, never one in flight.
 *
 * Implementation notes:
 * - The default check is an asynchronous HTTP HEAD with a hard timeout; any
 *   reply that carries an HTTP status counts as reachable
 * - Results are applied in the order checks complete, not the order they
 *   started
 * - An interval tick is skipped while a probe is in flight; an external
 *   trigger is allowed one extra concurrent probe
 * - A false result sets the state offline unconditionally
 * - A false → true transition emits connectionRestored() exactly once
 * - Starts offline, so the first successful probe counts as a restore
 */
class ConnectivityProbe : public QObject
{
    Q_OBJECT

public:
    using CheckCallback = std::function<void(bool online)>;
    using ReachabilityCheck = std::function<bool()>;
    using AsyncReachabilityCheck = std::function<void(CheckCallback done)>;

    explicit ConnectivityProbe(QObject *parent = nullptr);
    ~ConnectivityProbe() override;

    // ========== Configuration ==========

    void setEndpoint(const QUrl &url) { m_endpoint = url; }
    QUrl endpoint() const { return m_endpoint; }

    /**
     * @brief Hard timeout for one check, in milliseconds (default 3000)
     */
    void setTimeout(int timeoutMs) { m_timeoutMs = timeoutMs; }
    int timeout() const { return m_timeoutMs; }

    /**
     * @brief Probe interval in milliseconds (default 30000)
     */
    void setInterval(int intervalMs);
    int interval() const { return m_intervalMs; }

    /**
     * @brief Replace the network check with one that answers immediately
     *
     * Used by tests and by callers that already know the answer. A throw
     * reads as unreachable.
     */
    void setReachabilityCheck(ReachabilityCheck check);

    /**
     * @brief Replace the network check with one that answers later
     *
     * The check must call done exactly once within a bounded time and must
     * not block. Extra calls are ignored.
     */
    void setAsyncReachabilityCheck(AsyncReachabilityCheck check) { m_check = std::move(check); }

    // ========== State ==========

    bool isOnline() const { return m_state == ConnectivityState::Online; }
    ConnectivityState state() const { return m_state; }
    bool isRunning() const { return m_timer->isActive(); }
    int probeCount() const { return m_probeCount; }
    int probesInFlight() const { return m_inFlight; }

    /**
     * @brief Run the reachability check once
     *
     * done is called exactly once, possibly before check() returns.
     * Never throws. Timeouts, aborts and errors all read as false.
     * Does not change the connectivity state.
     */
    void check(CheckCallback done);

    /**
     * @brief Follow the OS network reachability notifications
     * @return false if no QNetworkInformation backend is available
     */
    bool watchSystemNetwork();

public slots:
    /**
     * @brief Start the interval timer and probe immediately
     */
    void start();
    void stop();

    /**
     * @brief Explicit re-check requested from outside the timer
     */
    void checkNow();

    void onTransportOnline();
    void onTransportOffline();

signals:
    /**
     * @brief Emitted after every completed probe
     */
    void probeFinished(bool online);

    void connectivityChanged(bool online);

    /**
     * @brief Offline → online transition
     *
     * Connected receivers run inside the completion of the check, after the
     * state is set, so the transition happens-before anything they start.
     */
    void connectionRestored();

    void connectionLost();
    void logMessage(const QString &message);

private slots:
    void onIntervalTick();

private:
    enum class Trigger { Interval, External };

    void runProbe(Trigger trigger);
    void applyResult(bool online);
    void httpCheck(const CheckCallback &done);

    QTimer *m_timer = nullptr;
    QNetworkAccessManager *m_networkManager = nullptr;
    AsyncReachabilityCheck m_check;

    QUrl m_endpoint;
    int m_timeoutMs = 3000;
    int m_intervalMs = 30000;

    ConnectivityState m_state = ConnectivityState::Offline;
    int m_inFlight = 0;
    int m_probeCount = 0;
};

} // namespace FieldSync

#endif // CONNECTIVITYPROBE_H
