#ifndef RECORDCONDUIT_H
#define RECORDCONDUIT_H

#include <QObject>
#include <QString>
#include <QUuid>

#include "synctypes.h"
#include "deviceregistry.h"

namespace RecordSync {

class RemoteObjectStore;
class RecordStore;
class SyncQueueManager;
struct SyncQueueItem;

/**
 * @brief Moves records and the device registry between the local store and a RemoteObjectStore
 *
 * Remote layout:
 *   device_registry.json
 *   Records/<EntityType>_<SYNCID>.json
 *
 * Per-record problems are counted in the returned PhaseResult and never
 * abort a batch. A phase fails only when the store itself cannot be used
 * (unreachable, listing failed).
 *
 * Methods block; the engine calls them from its worker thread.
 * The store is not owned by the conduit.
 */
class RecordConduit : public QObject
{
    Q_OBJECT

public:
    static const QString RecordsFolder;

    explicit RecordConduit(RemoteObjectStore *store, QObject *parent = nullptr);
    ~RecordConduit() override = default;

    /**
     * @brief Apply maxAttemptsPerPass and retryBackoffMs
     */
    void setConfig(const SyncConfig &config);

    RemoteObjectStore* store() const { return m_store; }

    // ========== Device Registry ==========

    /**
     * @brief Fetch the shared registry
     *
     * A missing registry yields an empty one.
     * @return false if the store cannot be reached, the read fails, or the
     *         registry exists but cannot be parsed
     */
    bool fetchDeviceRegistry(DeviceRegistry &registry);

    /**
     * @brief Replace the shared registry
     */
    bool updateDeviceRegistry(const DeviceRegistry &registry);

    // ========== Records ==========

    /**
     * @brief Merge remote records newer than their local copies (last writer wins)
     *
     * stats.transferred counts records created, updated or tombstoned locally.
     */
    PhaseResult reconcileFromRemote(RecordStore &records);

    /**
     * @brief Upload the queue in priority order
     *
     * Uploaded items leave the queue; failed ones stay with their attempt
     * count bumped; records that cannot be serialized stay and are skipped.
     */
    PhaseResult uploadPendingRecords(SyncQueueManager &queue, RecordStore &records);

    /**
     * @brief Enqueue every local record and upload (local dataset becomes authoritative)
     */
    PhaseResult uploadAllRecords(SyncQueueManager &queue, RecordStore &records);

    /**
     * @brief Apply every remote record regardless of timestamps (remote dataset becomes authoritative)
     *
     * Live local records that do not exist remotely are tombstoned.
     */
    PhaseResult downloadAll(RecordStore &records);

    /**
     * @brief Split "<EntityType>_<SYNCID>.json"
     * @return false if the name is not a record object name
     */
    static bool parseObjectName(const QString &name, QString &entityType, QUuid &syncId);

    static QString recordPath(const QString &fileName);

    QString lastError() const { return m_lastError; }

signals:
    void logMessage(const QString &message);
    void progressUpdated(int current, int total, const QString &message);
    void errorOccurred(const QString &error);

private:
    bool uploadWithRetry(const SyncQueueItem &item, const QByteArray &data);
    QByteArray tombstoneDocument(const SyncQueueItem &item) const;
    void setError(const QString &error);

    RemoteObjectStore *m_store;
    int m_maxAttempts = 3;
    int m_retryBackoffMs = 500;
    QString m_lastError;
};

} // namespace RecordSync

#endif // RECORDCONDUIT_H
