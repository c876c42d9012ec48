#include "syncqueue.h"
#include "syncablerecord.h"
#include "recordstore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSaveFile>
#include <QDebug>

#include <algorithm>

namespace RecordSync {

namespace {
const char *QueueKey = "pendingSyncQueue";
}

// ========== SyncQueueItem ==========

QString SyncQueueItem::storageKey() const
{
    return QString("%1_%2").arg(entityType, SyncJson::idToString(syncId));
}

QJsonObject SyncQueueItem::toJson() const
{
    QJsonObject json;
    json["syncID"] = SyncJson::idToString(syncId);
    json["entityType"] = entityType;
    json["recordClass"] = recordClassToString(recordClass);
    if (createdAt.isValid()) {
        json["createdAt"] = SyncDate::toString(createdAt);
    }
    json["queuedAt"] = SyncDate::toString(queuedAt);
    json["attempts"] = attempts;
    return json;
}

SyncQueueItem SyncQueueItem::fromJson(const QJsonObject &json, bool *ok)
{
    SyncQueueItem item;
    item.syncId = SyncJson::idFromString(json["syncID"].toString());
    item.entityType = json["entityType"].toString();
    item.recordClass = recordClassFromString(json["recordClass"].toString());
    item.createdAt = SyncDate::fromString(json["createdAt"].toString());
    item.queuedAt = SyncDate::fromString(json["queuedAt"].toString());
    item.attempts = json["attempts"].toInt();

    if (ok) {
        *ok = !item.syncId.isNull() && !item.entityType.isEmpty();
    }
    return item;
}

// ========== SyncQueueManager ==========

SyncQueueManager::SyncQueueManager(QObject *parent)
    : QObject(parent)
{
}

SyncQueueManager::~SyncQueueManager()
{
}

void SyncQueueManager::setConfig(const SyncConfig &config)
{
    QMutexLocker locker(&m_mutex);
    m_recentWindowHours = config.recentWindowHours;
    m_maxQueueSize = config.maxQueueSize;
}

void SyncQueueManager::addToQueue(const RecordRef &record)
{
    if (!record.isValid()) return;

    SyncQueueItem item;
    item.syncId = record.syncId;
    item.entityType = record.entityType;
    item.recordClass = record.recordClass;
    item.createdAt = record.createdAt;
    item.queuedAt = SyncDate::now();

    bool overflowed = false;
    int count = 0;
    {
        QMutexLocker locker(&m_mutex);

        if (indexOfLocked(item.syncId) < 0 && m_maxQueueSize > 0
                && m_queue.size() >= m_maxQueueSize) {
            // Too far behind to track individually: fall back to a full resync
            m_queue.clear();
            m_needsFullResync = true;
            overflowed = true;
        } else {
            insertLocked(item);
        }

        saveLocked();
        count = m_queue.size();
    }

    if (overflowed) {
        qWarning() << "[SyncQueue] Queue exceeded" << m_maxQueueSize
                   << "items, scheduling full resync";
        emit logMessage("Pending changes exceeded queue capacity; full resync scheduled");
        emit queueOverflowed();
    }
    emit queueChanged(count);
}

bool SyncQueueManager::removeFromQueue(const SyncQueueItem &item)
{
    int count = 0;
    {
        QMutexLocker locker(&m_mutex);
        int index = indexOfLocked(item.syncId);
        if (index < 0) {
            return false;
        }
        if (m_queue[index].queuedAt > item.queuedAt) {
            qDebug() << "[SyncQueue] Keeping" << item.storageKey() << "- changed during upload";
            return false;
        }
        m_queue.removeAt(index);
        saveLocked();
        count = m_queue.size();
    }

    emit queueChanged(count);
    return true;
}

void SyncQueueManager::clearQueue()
{
    {
        QMutexLocker locker(&m_mutex);
        m_queue.clear();
        saveLocked();
    }
    emit queueChanged(0);
}

int SyncQueueManager::queueAllRecords(const RecordStore &store)
{
    const QList<RecordRef> records = store.recordRefs();

    int count = 0;
    {
        QMutexLocker locker(&m_mutex);
        const QDateTime now = SyncDate::now();
        for (const RecordRef &record : records) {
            SyncQueueItem item;
            item.syncId = record.syncId;
            item.entityType = record.entityType;
            item.recordClass = record.recordClass;
            item.createdAt = record.createdAt;
            item.queuedAt = now;
            insertLocked(item);
        }
        m_needsFullResync = false;
        saveLocked();
        count = m_queue.size();
    }

    qDebug() << "[SyncQueue] Queued" << records.size() << "records for full sync";
    emit logMessage(QString("Queued %1 records for full sync").arg(records.size()));
    emit queueChanged(count);
    return records.size();
}

void SyncQueueManager::recordFailedAttempt(const SyncQueueItem &item)
{
    QMutexLocker locker(&m_mutex);
    int index = indexOfLocked(item.syncId);
    if (index < 0) {
        return;
    }
    m_queue[index].attempts++;
    saveLocked();
}

// ========== Queries ==========

QList<SyncQueueItem> SyncQueueManager::queue() const
{
    QMutexLocker locker(&m_mutex);
    return m_queue;
}

QList<SyncQueueItem> SyncQueueManager::getPriorityQueue() const
{
    return getPriorityQueue(SyncDate::now());
}

QList<SyncQueueItem> SyncQueueManager::getPriorityQueue(const QDateTime &now) const
{
    QList<SyncQueueItem> items;
    qint64 windowSecs = 0;
    {
        QMutexLocker locker(&m_mutex);
        items = m_queue;
        windowSecs = qint64(m_recentWindowHours) * 3600;
    }

    // 0 = recent instance, 1 = older instance, 2 = template
    auto tier = [&](const SyncQueueItem &item) {
        if (item.recordClass != RecordClass::Instance) {
            return 2;
        }
        if (item.createdAt.isValid() && item.createdAt.secsTo(now) < windowSecs) {
            return 0;
        }
        return 1;
    };

    std::stable_sort(items.begin(), items.end(),
                     [&](const SyncQueueItem &a, const SyncQueueItem &b) {
        int tierA = tier(a);
        int tierB = tier(b);
        if (tierA != tierB) {
            return tierA < tierB;
        }
        return a.queuedAt < b.queuedAt;
    });
    return items;
}

int SyncQueueManager::count() const
{
    QMutexLocker locker(&m_mutex);
    return m_queue.size();
}

bool SyncQueueManager::isEmpty() const
{
    return count() == 0;
}

bool SyncQueueManager::contains(const QUuid &syncId) const
{
    QMutexLocker locker(&m_mutex);
    return indexOfLocked(syncId) >= 0;
}

bool SyncQueueManager::needsFullResync() const
{
    QMutexLocker locker(&m_mutex);
    return m_needsFullResync;
}

QString SyncQueueManager::generateFilename(const SyncQueueItem &item)
{
    return item.storageKey() + ".json";
}

// ========== Persistence ==========

void SyncQueueManager::setStoragePath(const QString &path)
{
    QMutexLocker locker(&m_mutex);
    m_storagePath = path;
}

QString SyncQueueManager::storagePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_storagePath;
}

bool SyncQueueManager::load()
{
    int count = 0;
    {
        QMutexLocker locker(&m_mutex);
        m_queue.clear();
        m_needsFullResync = false;

        QFile file(m_storagePath);
        if (m_storagePath.isEmpty() || !file.exists()) {
            return true;
        }

        if (!file.open(QIODevice::ReadOnly)) {
            qWarning() << "[SyncQueue] Failed to open queue file:" << m_storagePath;
            return false;
        }

        QJsonParseError parseError;
        QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
        file.close();

        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            qWarning() << "[SyncQueue] Discarding malformed queue data:" << parseError.errorString();
            return true;
        }

        QJsonObject root = doc.object();
        m_needsFullResync = SyncJson::toBool(root["needsFullResync"]);

        const QJsonArray items = root[QueueKey].toArray();
        for (const QJsonValue &value : items) {
            bool ok = false;
            SyncQueueItem item = SyncQueueItem::fromJson(value.toObject(), &ok);
            if (!ok) {
                qWarning() << "[SyncQueue] Skipping malformed queue entry";
                continue;
            }
            if (!item.queuedAt.isValid()) {
                item.queuedAt = SyncDate::now();
            }
            insertLocked(item);
        }
        count = m_queue.size();
    }

    qDebug() << "[SyncQueue] Loaded" << count << "pending items";
    emit queueChanged(count);
    return true;
}

// ========== Private ==========

int SyncQueueManager::indexOfLocked(const QUuid &syncId) const
{
    for (int i = 0; i < m_queue.size(); ++i) {
        if (m_queue[i].syncId == syncId) {
            return i;
        }
    }
    return -1;
}

void SyncQueueManager::insertLocked(SyncQueueItem item)
{
    int index = indexOfLocked(item.syncId);
    if (index >= 0) {
        // Keep queuedAt strictly increasing per record so a snapshot taken
        // before this enqueue always compares older
        const QDateTime previous = m_queue[index].queuedAt;
        if (previous.isValid() && item.queuedAt <= previous) {
            item.queuedAt = previous.addMSecs(1);
        }
        item.attempts = 0;
        m_queue.removeAt(index);
    }
    m_queue.append(item);
}

bool SyncQueueManager::saveLocked()
{
    if (m_storagePath.isEmpty()) {
        return true;
    }

    QDir().mkpath(QFileInfo(m_storagePath).absolutePath());

    QJsonArray items;
    for (const SyncQueueItem &item : m_queue) {
        items.append(item.toJson());
    }

    QJsonObject root;
    root[QueueKey] = items;
    root["needsFullResync"] = m_needsFullResync;

    // A write failure is not fatal; the in-memory queue keeps working
    QSaveFile file(m_storagePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[SyncQueue] Failed to persist queue:" << file.errorString();
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        qWarning() << "[SyncQueue] Failed to commit queue:" << file.errorString();
        return false;
    }
    return true;
}

} // namespace RecordSync
