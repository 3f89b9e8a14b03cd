#include "dailysyncscheduler.h"
#include "autosendorchestrator.h"

#include <QDebug>

namespace FieldSync {

DailySyncScheduler::DailySyncScheduler(QObject *parent)
    : QObject(parent)
{
    m_timer = new QTimer(this);
    connect(m_timer, &QTimer::timeout, this, &DailySyncScheduler::onTick);
}

DailySyncScheduler::~DailySyncScheduler()
{
    stop();
}

void DailySyncScheduler::setCheckInterval(int intervalMs)
{
    m_checkIntervalMs = intervalMs;
    if (m_timer->isActive()) {
        m_timer->setInterval(intervalMs);
    }
}

void DailySyncScheduler::start()
{
    if (m_timer->isActive()) {
        return;
    }
    m_timer->start(m_checkIntervalMs);
    qDebug() << "[DailySyncScheduler] Started, enabled:" << m_enabled
             << "time:" << m_time.toString("HH:mm");
}

void DailySyncScheduler::stop()
{
    m_timer->stop();
}

bool DailySyncScheduler::isDue(const QDateTime &now) const
{
    if (!m_enabled || !m_time.isValid()) {
        return false;
    }
    return now.time() >= m_time && m_lastRunDate != now.date();
}

void DailySyncScheduler::onTick()
{
    checkAt(QDateTime::currentDateTime());
}

bool DailySyncScheduler::checkAt(const QDateTime &now)
{
    if (!m_orchestrator || !isDue(now)) {
        return false;
    }

    emit logMessage(QString("Daily sync due (%1)").arg(m_time.toString("HH:mm")));
    CycleResult result = m_orchestrator->runCycle();
    if (!result.ran()) {
        qDebug() << "[DailySyncScheduler] Daily cycle did not run, will retry";
        return false;
    }

    m_lastRunDate = now.date();
    emit dailySyncTriggered(m_lastRunDate);
    return true;
}

} // namespace FieldSync
