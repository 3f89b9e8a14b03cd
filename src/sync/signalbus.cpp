#include "signalbus.h"

#include <QDebug>

namespace FieldSync {

SignalBus::SignalBus(QObject *parent)
    : QObject(parent)
{
}

SignalBus &SignalBus::instance()
{
    static SignalBus bus;
    return bus;
}

void SignalBus::publish(SyncTopic topic)
{
    m_publishCounts[topic] = m_publishCounts.value(topic, 0) + 1;
    qDebug() << "[SignalBus] Publish" << syncTopicName(topic);
    emit published(topic);
}

QMetaObject::Connection SignalBus::subscribe(SyncTopic topic, QObject *context,
                                             std::function<void()> handler)
{
    return connect(this, &SignalBus::published, context,
                   [topic, handler](SyncTopic fired) {
                       if (fired == topic && handler) {
                           handler();
                       }
                   });
}

} // namespace FieldSync
