#ifndef RECORDSTORE_H
#define RECORDSTORE_H

#include <QObject>
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QMap>
#include <QSet>
#include <QJsonObject>
#include <QRecursiveMutex>
#include <QUuid>
#include <functional>

#include "recordfactory.h"
#include "syncablerecord.h"

namespace RecordSync {

/**
 * @brief The local, offline-first record store
 *
 * Owns every syncable record keyed by "<EntityType>_<syncID>" and persists
 * them to a single JSON file:
 *   <storagePath>   { "version": 1, "records": [ {entityType, document}, ... ] }
 *
 * Local mutations go through insert(), update() and softDelete() and emit
 * recordChanged() with a RecordRef copied under the store lock, which the
 * application connects to SyncQueueManager::addToQueue(). Remote merges go
 * through applyRemote() and never emit recordChanged(), so downloaded data
 * is not re-uploaded.
 *
 * All methods are safe to call from the sync worker thread. applyRemote()
 * updates known records in place, so a pointer returned by record() stays
 * valid until the record is replaced by insert() or the store is reloaded.
 * Reading its fields while another thread merges still needs the store
 * lock; prefer recordRefs() or serialize() from other threads.
 */
class RecordStore : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Outcome of merging one remote document
     */
    enum class ApplyResult {
        Created,    ///< Record was unknown locally and has been materialised
        Updated,    ///< Remote version replaced the local one
        Deleted,    ///< Remote tombstone marked the local record deleted
        Ignored,    ///< Local version is as new or newer, or tombstone for unknown record
        Invalid     ///< Unknown entity type or unusable document
    };

    explicit RecordStore(const RecordFactory &factory, QObject *parent = nullptr);
    ~RecordStore();

    // ========== Local Mutations ==========

    /**
     * @brief Add a record (replacing any record with the same key)
     *
     * The store takes ownership.
     * @return The stored record
     */
    SyncableRecord* insert(SyncableRecord *record);

    /**
     * @brief Mutate a record in place
     *
     * The mutator runs under the store lock; use the record's setters so
     * lastModified is bumped.
     * @return false if no such record exists
     */
    bool update(const QString &entityType, const QUuid &id,
                const std::function<void(SyncableRecord*)> &mutator);

    /**
     * @brief Tombstone a record (it stays in the store so the deletion syncs)
     */
    bool softDelete(const QString &entityType, const QUuid &id);

    // ========== Queries ==========

    SyncableRecord* record(const QString &entityType, const QUuid &id) const;

    /**
     * @brief Identities of every record, taken under the store lock
     */
    QList<RecordRef> recordRefs() const;
    QStringList keys() const;
    bool contains(const QString &entityType, const QUuid &id) const;

    /**
     * @brief Number of records, tombstones included unless told otherwise
     */
    int recordCount(bool includeDeleted = true) const;

    /**
     * @brief Local lastModified, invalid if the record is unknown
     */
    QDateTime lastModified(const QString &entityType, const QUuid &id) const;

    /**
     * @brief Serialize a record for upload
     * @param found Set to whether the record exists locally
     * @return Document bytes, empty if missing or on an encoding fault
     */
    QByteArray serialize(const QString &entityType, const QUuid &id, bool *found = nullptr) const;

    const RecordFactory& factory() const { return m_factory; }

    // ========== Remote Merges ==========

    /**
     * @brief Merge a remote document (last writer wins)
     *
     * A document without a parseable lastModified is Invalid: it cannot be
     * ordered against the local copy.
     * @param force Apply even if the local copy is newer (used by "use cloud data")
     */
    ApplyResult applyRemote(const QString &entityType, const QUuid &id,
                            const QJsonObject &document, bool force = false);

    /**
     * @brief Tombstone every live record whose key is not in keepKeys
     *
     * Used when the remote dataset becomes authoritative.
     * @return Number of records tombstoned
     */
    int tombstoneAllExcept(const QSet<QString> &keepKeys);

    // ========== Persistence ==========

    void setStoragePath(const QString &path);
    QString storagePath() const;

    /**
     * @brief Load records from storagePath()
     * @return true if loaded (or no file yet); malformed files load as empty
     */
    bool load();

    /**
     * @brief Save records to storagePath()
     */
    bool save();

    QString lastError() const;

    static QString makeKey(const QString &entityType, const QUuid &id);

signals:
    void recordChanged(const RecordSync::RecordRef &record);
    void recordMerged(const QString &key, RecordSync::RecordStore::ApplyResult result);
    void errorOccurred(const QString &error);

private:
    SyncableRecord* findLocked(const QString &key) const;
    void replaceLocked(const QString &key, SyncableRecord *record);
    bool saveLocked();
    void setError(const QString &error);

    RecordFactory m_factory;
    QMap<QString, SyncableRecord*> m_records;
    QString m_storagePath;
    QString m_lastError;

    mutable QRecursiveMutex m_mutex;
};

} // namespace RecordSync

#endif // RECORDSTORE_H
