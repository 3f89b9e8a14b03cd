#ifndef DAILYSYNCSCHEDULER_H
#define DAILYSYNCSCHEDULER_H

#include <QObject>
#include <QDate>
#include <QDateTime>
#include <QTime>
#include <QTimer>

namespace FieldSync {

class AutoSendOrchestrator;

/**
 * @brief Triggers one auto-send cycle per day after a configured time
 *
 * Checks once a minute. A day counts as done only when the triggered
 * cycle actually ran; an offline or busy skip is retried on the next tick.
 */
class DailySyncScheduler : public QObject
{
    Q_OBJECT

public:
    explicit DailySyncScheduler(QObject *parent = nullptr);
    ~DailySyncScheduler() override;

    void setOrchestrator(AutoSendOrchestrator *orchestrator) { m_orchestrator = orchestrator; }

    void setEnabled(bool enabled) { m_enabled = enabled; }
    bool isEnabled() const { return m_enabled; }

    /**
     * @brief Time of day after which the daily cycle is due
     */
    void setTime(const QTime &time) { m_time = time; }
    QTime time() const { return m_time; }

    void setCheckInterval(int intervalMs);

    QDate lastRunDate() const { return m_lastRunDate; }
    void setLastRunDate(const QDate &date) { m_lastRunDate = date; }

    bool isDue(const QDateTime &now) const;

public slots:
    void start();
    void stop();

    /**
     * @brief Run the daily cycle if it is due at @p now
     * @return true if a cycle ran
     */
    bool checkAt(const QDateTime &now);

signals:
    void dailySyncTriggered(const QDate &date);
    void logMessage(const QString &message);

private slots:
    void onTick();

private:
    AutoSendOrchestrator *m_orchestrator = nullptr;
    QTimer *m_timer = nullptr;
    int m_checkIntervalMs = 60000;
    bool m_enabled = false;
    QTime m_time;
    QDate m_lastRunDate;
};

} // namespace FieldSync

#endif // DAILYSYNCSCHEDULER_H
