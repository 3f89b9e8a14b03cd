#ifndef SIGNALBUS_H
#define SIGNALBUS_H

#include <QObject>
#include <QMap>
#include <functional>

#include "synctypes.h"

namespace FieldSync {

/**
 * @brief Process-wide invalidation channel
 *
 * Independent views subscribe to a topic and re-query the document queue
 * when it fires. Topics are a closed enum and carry no payload.
 *
 * Usage:
 * @code
 * SignalBus::instance().subscribe(SyncTopic::InvoicesUpdated, this, [this]() {
 *     reloadInvoices();
 * });
 * @endcode
 */
class SignalBus : public QObject
{
    Q_OBJECT

public:
    explicit SignalBus(QObject *parent = nullptr);

    /**
     * @brief The process-wide bus
     */
    static SignalBus &instance();

    /**
     * @brief Fire a topic to every subscriber
     */
    void publish(SyncTopic topic);

    /**
     * @brief Call @p handler whenever @p topic is published
     *
     * The connection is dropped automatically when @p context is destroyed.
     */
    QMetaObject::Connection subscribe(SyncTopic topic, QObject *context,
                                      std::function<void()> handler);

    /**
     * @brief How many times a topic has been published on this bus
     */
    int publishCount(SyncTopic topic) const { return m_publishCounts.value(topic, 0); }

signals:
    void published(FieldSync::SyncTopic topic);

private:
    QMap<SyncTopic, int> m_publishCounts;
};

} // namespace FieldSync

#endif // SIGNALBUS_H
