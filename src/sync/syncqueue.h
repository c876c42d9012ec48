#ifndef SYNCQUEUE_H
#define SYNCQUEUE_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QList>
#include <QJsonObject>
#include <QMutex>
#include <QUuid>

#include "synctypes.h"
#include "syncablerecord.h"

namespace RecordSync {

class RecordStore;

/**
 * @brief A pending local change waiting for upload
 *
 * Only points at the record; the document is serialized at upload time so
 * the newest local state is what leaves the device.
 */
struct SyncQueueItem {
    QUuid syncId;
    QString entityType;
    RecordClass recordClass = RecordClass::Template;
    QDateTime createdAt;        ///< Creation time of the record (priority input)
    QDateTime queuedAt;         ///< When this change was enqueued
    int attempts = 0;           ///< Failed upload tries so far

    /**
     * @brief "<EntityType>_<syncID>"
     */
    QString storageKey() const;

    QJsonObject toJson() const;
    static SyncQueueItem fromJson(const QJsonObject &json, bool *ok = nullptr);

    bool operator==(const SyncQueueItem &other) const {
        return syncId == other.syncId && entityType == other.entityType;
    }
    bool operator!=(const SyncQueueItem &other) const { return !(*this == other); }
};

/**
 * @brief Persisted, deduplicated, priority-ordered upload queue
 *
 * One entry per syncID. Every change is written through to
 * <storagePath> immediately:
 *   { "pendingSyncQueue": [ ... ], "needsFullResync": false }
 *
 * All methods lock, so domain edits may enqueue while a sync pass drains.
 * Signals are emitted after the lock is released.
 */
class SyncQueueManager : public QObject
{
    Q_OBJECT

public:
    explicit SyncQueueManager(QObject *parent = nullptr);
    ~SyncQueueManager();

    /**
     * @brief Apply recentWindowHours and maxQueueSize
     */
    void setConfig(const SyncConfig &config);

    // ========== Queue Management ==========

    /**
     * @brief Remove an uploaded item
     *
     * The stored entry is kept if the record was enqueued again after
     * @p item was taken from the queue, so a change made during upload
     * is not lost.
     * @return true if an entry was removed
     */
    bool removeFromQueue(const SyncQueueItem &item);

    /**
     * @brief Drop every entry (after a full resync or reset)
     */
    void clearQueue();

    /**
     * @brief Enqueue every record in the store, tombstones included
     *
     * Clears the full-resync flag. Not subject to the capacity limit.
     * @return Number of records queued
     */
    int queueAllRecords(const RecordStore &store);

    /**
     * @brief Count a failed upload try against an entry
     */
    void recordFailedAttempt(const SyncQueueItem &item);

    // ========== Queries ==========

    /**
     * @brief Snapshot in insertion order
     */
    QList<SyncQueueItem> queue() const;

    /**
     * @brief Snapshot in upload order
     *
     * Instance records created within the recent window first, then other
     * instance records, then templates. FIFO by queuedAt within each tier.
     */
    QList<SyncQueueItem> getPriorityQueue() const;
    QList<SyncQueueItem> getPriorityQueue(const QDateTime &now) const;

    int count() const;
    bool isEmpty() const;
    bool contains(const QUuid &syncId) const;

    /**
     * @brief True after an overflow until queueAllRecords() runs
     */
    bool needsFullResync() const;

    /**
     * @brief Remote object name for an item: "<EntityType>_<SYNCID>.json"
     */
    static QString generateFilename(const SyncQueueItem &item);

    // ========== Persistence ==========

    void setStoragePath(const QString &path);
    QString storagePath() const;

    /**
     * @brief Load from storagePath(); malformed data yields an empty queue
     */
    bool load();

public slots:
    /**
     * @brief Enqueue a mutated record, replacing any entry with the same syncID
     *
     * Invalid refs are ignored.
     */
    void addToQueue(const RecordSync::RecordRef &record);

signals:
    void queueChanged(int count);
    void queueOverflowed();
    void logMessage(const QString &message);

private:
    int indexOfLocked(const QUuid &syncId) const;
    void insertLocked(SyncQueueItem item);
    bool saveLocked();

    QList<SyncQueueItem> m_queue;
    bool m_needsFullResync = false;
    int m_recentWindowHours = 24;
    int m_maxQueueSize = 5000;
    QString m_storagePath;

    mutable QMutex m_mutex;
};

} // namespace RecordSync

Q_DECLARE_METATYPE(RecordSync::SyncQueueItem)

#endif // SYNCQUEUE_H
