#include "recordconduit.h"
#include "objectstore.h"
#include "recordstore.h"
#include "syncqueue.h"
#include "syncablerecord.h"

#include <QJsonObject>
#include <QSet>
#include <QThread>
#include <QDebug>

namespace RecordSync {

const QString RecordConduit::RecordsFolder = QStringLiteral("Records");

RecordConduit::RecordConduit(RemoteObjectStore *store, QObject *parent)
    : QObject(parent)
    , m_store(store)
{
}

void RecordConduit::setConfig(const SyncConfig &config)
{
    m_maxAttempts = qMax(1, config.maxAttemptsPerPass);
    m_retryBackoffMs = qMax(0, config.retryBackoffMs);
}

QString RecordConduit::recordPath(const QString &fileName)
{
    return RecordsFolder + "/" + fileName;
}

bool RecordConduit::parseObjectName(const QString &name, QString &entityType, QUuid &syncId)
{
    if (!name.endsWith(".json")) {
        return false;
    }
    const QString base = name.left(name.size() - 5);
    const int separator = base.lastIndexOf('_');
    if (separator <= 0) {
        return false;
    }

    entityType = base.left(separator);
    syncId = SyncJson::idFromString(base.mid(separator + 1));
    return !syncId.isNull();
}

// ========== Device Registry ==========

bool RecordConduit::fetchDeviceRegistry(DeviceRegistry &registry)
{
    if (!m_store || !m_store->isAvailable()) {
        setError("Remote store is not available");
        return false;
    }

    if (!m_store->hasObject(DeviceRegistry::ObjectName)) {
        qDebug() << "[RecordConduit] No device registry yet";
        registry = DeviceRegistry();
        return true;
    }

    QByteArray data;
    if (!m_store->readObject(DeviceRegistry::ObjectName, data)) {
        setError(QString("Failed to read device registry: %1").arg(m_store->lastError()));
        return false;
    }

    // Never overwrite a registry we cannot read: other devices are listed in it
    bool ok = false;
    DeviceRegistry parsed = DeviceRegistry::fromDocument(data, &ok);
    if (!ok) {
        setError("Device registry is unreadable");
        return false;
    }
    registry = parsed;
    return true;
}

bool RecordConduit::updateDeviceRegistry(const DeviceRegistry &registry)
{
    if (!m_store || !m_store->isAvailable()) {
        setError("Remote store is not available");
        return false;
    }

    if (!m_store->writeObject(DeviceRegistry::ObjectName, registry.toDocument())) {
        setError(QString("Failed to write device registry: %1").arg(m_store->lastError()));
        return false;
    }
    return true;
}

// ========== Reconcile ==========

PhaseResult RecordConduit::reconcileFromRemote(RecordStore &records)
{
    PhaseResult result;

    if (!m_store || !m_store->isAvailable()) {
        result.errorMessage = "Remote store is not available";
        setError(result.errorMessage);
        return result;
    }

    bool listed = false;
    const QList<RemoteObjectInfo> objects = m_store->listObjects(RecordsFolder, &listed);
    if (!listed) {
        result.errorMessage = QString("Failed to list remote records: %1").arg(m_store->lastError());
        setError(result.errorMessage);
        return result;
    }

    qDebug() << "[RecordConduit] Reconciling" << objects.size() << "remote records";

    int current = 0;
    for (const RemoteObjectInfo &object : objects) {
        emit progressUpdated(++current, objects.size(), object.name);

        QString entityType;
        QUuid syncId;
        if (!parseObjectName(object.name, entityType, syncId)) {
            continue;
        }
        if (!records.factory().hasType(entityType)) {
            qWarning() << "[RecordConduit] Skipping unknown entity type:" << object.name;
            result.stats.skipped++;
            continue;
        }

        // Only fetch what is new to us or changed since our last write
        const QDateTime localModified = records.lastModified(entityType, syncId);
        if (localModified.isValid() && object.modifiedTime <= localModified) {
            continue;
        }

        QByteArray data;
        if (!m_store->readObject(recordPath(object.name), data)) {
            qWarning() << "[RecordConduit] Failed to download" << object.name << ":" << m_store->lastError();
            result.stats.failed++;
            continue;
        }

        QJsonObject document;
        QString decodeError;
        if (!SyncJson::decodeObject(data, document, &decodeError)) {
            qWarning() << "[RecordConduit] Malformed remote record" << object.name << ":" << decodeError;
            result.stats.failed++;
            continue;
        }

        switch (records.applyRemote(entityType, syncId, document)) {
        case RecordStore::ApplyResult::Created:
        case RecordStore::ApplyResult::Updated:
        case RecordStore::ApplyResult::Deleted:
            result.stats.transferred++;
            break;
        case RecordStore::ApplyResult::Ignored:
            break;
        case RecordStore::ApplyResult::Invalid:
            result.stats.skipped++;
            break;
        }
    }

    qDebug() << "[RecordConduit] Reconcile:" << result.stats.summary();
    result.success = true;
    return result;
}

PhaseResult RecordConduit::downloadAll(RecordStore &records)
{
    PhaseResult result;

    if (!m_store || !m_store->isAvailable()) {
        result.errorMessage = "Remote store is not available";
        setError(result.errorMessage);
        return result;
    }

    bool listed = false;
    const QList<RemoteObjectInfo> objects = m_store->listObjects(RecordsFolder, &listed);
    if (!listed) {
        result.errorMessage = QString("Failed to list remote records: %1").arg(m_store->lastError());
        setError(result.errorMessage);
        return result;
    }

    emit logMessage(QString("Downloading %1 remote records").arg(objects.size()));

    // Everything present remotely survives, even if this pass cannot read it
    QSet<QString> remoteKeys;

    int current = 0;
    for (const RemoteObjectInfo &object : objects) {
        emit progressUpdated(++current, objects.size(), object.name);

        QString entityType;
        QUuid syncId;
        if (!parseObjectName(object.name, entityType, syncId)) {
            continue;
        }
        remoteKeys.insert(RecordStore::makeKey(entityType, syncId));

        if (!records.factory().hasType(entityType)) {
            qWarning() << "[RecordConduit] Skipping unknown entity type:" << object.name;
            result.stats.skipped++;
            continue;
        }

        QByteArray data;
        QJsonObject document;
        if (!m_store->readObject(recordPath(object.name), data)
                || !SyncJson::decodeObject(data, document)) {
            qWarning() << "[RecordConduit] Failed to download" << object.name;
            result.stats.failed++;
            continue;
        }

        switch (records.applyRemote(entityType, syncId, document, true)) {
        case RecordStore::ApplyResult::Created:
        case RecordStore::ApplyResult::Updated:
        case RecordStore::ApplyResult::Deleted:
            result.stats.transferred++;
            break;
        case RecordStore::ApplyResult::Ignored:
            break;
        case RecordStore::ApplyResult::Invalid:
            result.stats.skipped++;
            break;
        }
    }

    int tombstoned = records.tombstoneAllExcept(remoteKeys);
    if (tombstoned > 0) {
        emit logMessage(QString("Removed %1 records not present in the cloud").arg(tombstoned));
    }

    qDebug() << "[RecordConduit] Download all:" << result.stats.summary();
    result.success = true;
    return result;
}

// ========== Upload ==========

PhaseResult RecordConduit::uploadPendingRecords(SyncQueueManager &queue, RecordStore &records)
{
    PhaseResult result;

    if (!m_store || !m_store->isAvailable()) {
        result.errorMessage = "Remote store is not available";
        setError(result.errorMessage);
        return result;
    }

    const QList<SyncQueueItem> items = queue.getPriorityQueue();
    if (items.isEmpty()) {
        result.success = true;
        return result;
    }

    qDebug() << "[RecordConduit] Uploading" << items.size() << "pending records";

    int current = 0;
    for (const SyncQueueItem &item : items) {
        emit progressUpdated(++current, items.size(), item.storageKey());

        bool found = false;
        QByteArray data = records.serialize(item.entityType, item.syncId, &found);

        if (!found) {
            // The record is gone locally; let other devices know
            qInfo() << "[RecordConduit] Record missing locally, uploading tombstone:" << item.storageKey();
            data = tombstoneDocument(item);
        } else if (data.isEmpty()) {
            qWarning() << "[RecordConduit] Could not serialize" << item.storageKey() << "- skipping";
            result.stats.skipped++;
            continue;
        }

        if (uploadWithRetry(item, data)) {
            queue.removeFromQueue(item);
            result.stats.transferred++;
        } else {
            queue.recordFailedAttempt(item);
            result.stats.failed++;
            emit logMessage(QString("Failed to upload %1: %2")
                            .arg(item.storageKey(), m_store->lastError()));
        }
    }

    qDebug() << "[RecordConduit] Upload:" << result.stats.summary();
    result.success = true;
    return result;
}

PhaseResult RecordConduit::uploadAllRecords(SyncQueueManager &queue, RecordStore &records)
{
    queue.queueAllRecords(records);
    return uploadPendingRecords(queue, records);
}

// ========== Private ==========

bool RecordConduit::uploadWithRetry(const SyncQueueItem &item, const QByteArray &data)
{
    const QString path = recordPath(SyncQueueManager::generateFilename(item));

    for (int attempt = 1; attempt <= m_maxAttempts; ++attempt) {
        if (m_store->writeObject(path, data)) {
            return true;
        }

        qWarning() << "[RecordConduit] Upload attempt" << attempt << "of" << m_maxAttempts
                   << "failed for" << item.storageKey() << ":" << m_store->lastError();

        if (attempt < m_maxAttempts && m_retryBackoffMs > 0) {
            QThread::msleep(static_cast<unsigned long>(m_retryBackoffMs) * attempt);
        }
    }
    return false;
}

QByteArray RecordConduit::tombstoneDocument(const SyncQueueItem &item) const
{
    QJsonObject json;
    json["syncID"] = SyncJson::idToString(item.syncId);
    json["isDeleted"] = true;
    json["lastModified"] = SyncDate::toString(SyncDate::now());
    return SyncJson::encode(json);
}

void RecordConduit::setError(const QString &error)
{
    m_lastError = error;
    qWarning() << "[RecordConduit]" << error;
    emit errorOccurred(error);
}

} // namespace RecordSync
