#include "syncstatusstore.h"
#include "documentqueueclient.h"

#include <QDir>
#include <QFile>
#include <QSaveFile>
#include <QJsonDocument>
#include <QStandardPaths>
#include <QDebug>

namespace FieldSync {

SyncStatusStore::SyncStatusStore(QObject *parent)
    : QObject(parent)
{
    m_stateDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

SyncStatusStore::~SyncStatusStore()
{
    if (m_initialized) {
        save();
    }
}

void SyncStatusStore::setStateDirectory(const QString &path)
{
    m_stateDir = path;
}

QString SyncStatusStore::stateFilePath() const
{
    return QDir(m_stateDir).filePath("sync_status.json");
}

// ========== First Run ==========

bool SyncStatusStore::initialize(DocumentQueueClient *client)
{
    bool loaded = load();

    m_status.isSyncing = false;
    m_status.isFirstRun = !client || !client->hasReferenceData();
    m_initialized = true;

    qDebug() << "[SyncStatusStore] Initialized, first run:" << m_status.isFirstRun;
    emit statusChanged(m_status);
    return loaded;
}

bool SyncStatusStore::recheckFirstRun(DocumentQueueClient *client)
{
    const bool firstRun = !client || !client->hasReferenceData();
    if (firstRun != m_status.isFirstRun) {
        m_status.isFirstRun = firstRun;
        emit statusChanged(m_status);
    }
    return firstRun;
}

// ========== Orchestrator Updates ==========

void SyncStatusStore::markSyncStarted()
{
    m_status.isSyncing = true;
    emit statusChanged(m_status);
}

void SyncStatusStore::markSyncCompleted(const SyncTimestamps &timestamps)
{
    if (timestamps.partnersSyncedAt.isValid()) {
        m_status.partnersSyncedAt = timestamps.partnersSyncedAt;
        m_status.isFirstRun = false;
    }
    if (timestamps.productsSyncedAt.isValid()) {
        m_status.productsSyncedAt = timestamps.productsSyncedAt;
    }

    m_status.isSyncing = false;
    m_lastCycleAt = QDateTime::currentDateTime();

    save();
    emit statusChanged(m_status);
}

// ========== Persistence ==========

bool SyncStatusStore::load()
{
    QFile file(stateFilePath());
    if (!file.exists()) {
        // Nothing synced yet
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open sync status: %1").arg(file.fileName()));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError) {
        emit errorOccurred(QString("Failed to parse sync status: %1").arg(parseError.errorString()));
        return false;
    }

    QJsonObject root = doc.object();
    m_status.partnersSyncedAt = QDateTime::fromString(root["partnersSyncedAt"].toString(), Qt::ISODate);
    m_status.productsSyncedAt = QDateTime::fromString(root["productsSyncedAt"].toString(), Qt::ISODate);
    m_lastCycleAt = QDateTime::fromString(root["lastCycleAt"].toString(), Qt::ISODate);

    qDebug() << "[SyncStatusStore] Loaded, partners synced at" << m_status.partnersSyncedAt;
    return true;
}

bool SyncStatusStore::save()
{
    QDir dir(m_stateDir);
    if (!dir.exists() && !dir.mkpath(".")) {
        emit errorOccurred(QString("Failed to create state directory: %1").arg(m_stateDir));
        return false;
    }

    QJsonObject root;
    root["partnersSyncedAt"] = m_status.partnersSyncedAt.toString(Qt::ISODate);
    root["productsSyncedAt"] = m_status.productsSyncedAt.toString(Qt::ISODate);
    root["lastCycleAt"] = m_lastCycleAt.toString(Qt::ISODate);
    root["version"] = 1;

    QSaveFile file(stateFilePath());
    if (!file.open(QIODevice::WriteOnly)) {
        emit errorOccurred(QString("Failed to save sync status: %1").arg(file.fileName()));
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        emit errorOccurred(QString("Failed to commit sync status: %1").arg(file.fileName()));
        return false;
    }
    return true;
}

} // namespace FieldSync
