#include "connectivityprobe.h"

#include <QNetworkAccessManager>
#include <QNetworkInformation>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QElapsedTimer>
#include <QPointer>
#include <QDebug>

#include <exception>
#include <memory>

namespace FieldSync {

ConnectivityProbe::ConnectivityProbe(QObject *parent)
    : QObject(parent)
    , m_endpoint(QStringLiteral("https://www.google.com/generate_204"))
{
    m_timer = new QTimer(this);
    connect(m_timer, &QTimer::timeout, this, &ConnectivityProbe::onIntervalTick);

    qDebug() << "[ConnectivityProbe] Created";
}

ConnectivityProbe::~ConnectivityProbe()
{
    stop();
    delete m_networkManager;
    qDebug() << "[ConnectivityProbe] Destroyed";
}

void ConnectivityProbe::setReachabilityCheck(ReachabilityCheck check)
{
    if (!check) {
        m_check = nullptr;
        return;
    }
    m_check = [check](CheckCallback done) {
        done(check());
    };
}

void ConnectivityProbe::setInterval(int intervalMs)
{
    m_intervalMs = intervalMs;
    if (m_timer->isActive()) {
        m_timer->setInterval(intervalMs);
    }
}

// ========== Lifecycle ==========

void ConnectivityProbe::start()
{
    if (m_timer->isActive()) {
        return;  // Already running
    }

    m_timer->start(m_intervalMs);
    qDebug() << "[ConnectivityProbe] Started with interval:" << m_intervalMs
             << "ms, timeout:" << m_timeoutMs << "ms, endpoint:" << m_endpoint.toString();

    runProbe(Trigger::External);
}

void ConnectivityProbe::stop()
{
    if (!m_timer->isActive()) {
        return;
    }

    m_timer->stop();
    qDebug() << "[ConnectivityProbe] Stopped";
}

// ========== Triggers ==========

void ConnectivityProbe::onIntervalTick()
{
    runProbe(Trigger::Interval);
}

void ConnectivityProbe::checkNow()
{
    runProbe(Trigger::External);
}

void ConnectivityProbe::onTransportOnline()
{
    qDebug() << "[ConnectivityProbe] Transport reports online, re-checking";
    runProbe(Trigger::External);
}

void ConnectivityProbe::onTransportOffline()
{
    qDebug() << "[ConnectivityProbe] Transport reports offline";
    applyResult(false);
}

bool ConnectivityProbe::watchSystemNetwork()
{
    if (!QNetworkInformation::loadBackendByFeatures(QNetworkInformation::Feature::Reachability)) {
        qWarning() << "[ConnectivityProbe] No network information backend available";
        return false;
    }

    QNetworkInformation *info = QNetworkInformation::instance();
    connect(info, &QNetworkInformation::reachabilityChanged, this,
            [this](QNetworkInformation::Reachability reachability) {
                if (reachability == QNetworkInformation::Reachability::Disconnected) {
                    onTransportOffline();
                } else if (reachability == QNetworkInformation::Reachability::Online) {
                    onTransportOnline();
                }
            });

    qDebug() << "[ConnectivityProbe] Watching system network via" << info->backendName();
    return true;
}

// ========== Probing ==========

void ConnectivityProbe::runProbe(Trigger trigger)
{
    // One probe may already be running when the timer fires; an external
    // event may add at most one more.
    const int limit = (trigger == Trigger::Interval) ? 1 : 2;
    if (m_inFlight >= limit) {
        qDebug() << "[ConnectivityProbe] Probe skipped, in flight:" << m_inFlight;
        return;
    }

    const int probeNumber = ++m_probeCount;
    ++m_inFlight;

    QElapsedTimer elapsed;
    elapsed.start();
    QPointer<ConnectivityProbe> self(this);

    check([self, probeNumber, elapsed](bool online) {
        if (!self) {
            return;
        }
        --self->m_inFlight;

        qDebug() << "[ConnectivityProbe] Probe" << probeNumber
                 << (online ? "online" : "offline") << "in" << elapsed.elapsed() << "ms";

        self->applyResult(online);
    });
}

void ConnectivityProbe::check(CheckCallback done)
{
    auto completed = std::make_shared<bool>(false);
    CheckCallback once = [completed, done](bool online) {
        if (*completed) {
            return;
        }
        *completed = true;
        done(online);
    };

    try {
        if (m_check) {
            m_check(once);
        } else {
            httpCheck(once);
        }
    } catch (const std::exception &e) {
        qWarning() << "[ConnectivityProbe] Check threw:" << e.what();
        once(false);
    }
}

void ConnectivityProbe::httpCheck(const CheckCallback &done)
{
    if (!m_endpoint.isValid()) {
        done(false);
        return;
    }

    if (!m_networkManager) {
        m_networkManager = new QNetworkAccessManager();  // No parent - we manage lifetime
    }

    QNetworkRequest request(m_endpoint);
    request.setHeader(QNetworkRequest::UserAgentHeader, "QFieldSync/1.0");
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute,
                         QNetworkRequest::AlwaysNetwork);
    request.setTransferTimeout(m_timeoutMs);

    QNetworkReply *reply = m_networkManager->head(request);

    // Hard timeout; an aborted reply finishes without a status
    QTimer::singleShot(m_timeoutMs, reply, [reply]() {
        if (reply->isRunning()) {
            reply->abort();
        }
    });

    connect(reply, &QNetworkReply::finished, this, [reply, done]() {
        // Any HTTP reply, even an error status, proves the route is up
        const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
        reply->deleteLater();
        done(status.isValid());
    });
}

void ConnectivityProbe::applyResult(bool online)
{
    const ConnectivityState previous = m_state;
    m_state = online ? ConnectivityState::Online : ConnectivityState::Offline;

    emit probeFinished(online);

    if (previous == m_state) {
        return;
    }

    emit connectivityChanged(online);

    if (online) {
        emit logMessage("Connection restored");
        emit connectionRestored();
    } else {
        emit logMessage("Connection lost");
        emit connectionLost();
    }
}

} // namespace FieldSync
