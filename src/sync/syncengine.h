#ifndef SYNCENGINE_H
#define SYNCENGINE_H

#include <QObject>
#include <QString>
#include <QFuture>
#include <QList>
#include <QMutex>
#include <functional>
#include <optional>

#include "synctypes.h"
#include "deviceidentity.h"

namespace RecordSync {

class RecordStore;
class SyncQueueManager;
class RecordConduit;
class SyncState;
class SyncHistory;

/**
 * @brief Main sync orchestrator
 *
 * One pass runs, strictly in order:
 *   1. fetch the device registry
 *   2. stop with ConflictDetected if an unfamiliar device meets an existing dataset
 *   3. reconcile remote records into the local store
 *   4. upload the pending queue in priority order
 *   5. register this device and write the registry back
 *
 * Any failing step aborts the rest, so the registry is only rewritten after
 * the record phases completed. Passes run on a worker thread and never
 * overlap; the status is published through statusChanged().
 *
 * Usage:
 * @code
 * SyncEngine engine;
 * engine.setRecordStore(&records);
 * engine.setQueue(&queue);
 * auto *conduit = new RecordConduit(store);
 * store->setParent(conduit);
 * engine.setConduit(conduit);
 * engine.setIdentity(identity);
 * engine.setSignedInCheck([&account]() { return account.isSignedIn(); });
 *
 * engine.performFullSyncSafely();          // fire and forget
 * SyncResult r = engine.forceSync().result();  // or wait
 * @endcode
 */
class SyncEngine : public QObject
{
    Q_OBJECT

public:
    explicit SyncEngine(QObject *parent = nullptr);
    ~SyncEngine();

    // ========== Collaborators ==========

    /**
     * @brief Local records (not owned)
     */
    void setRecordStore(RecordStore *store);
    RecordStore* recordStore() const { return m_store; }

    /**
     * @brief Pending upload queue (not owned)
     */
    void setQueue(SyncQueueManager *queue);
    SyncQueueManager* queue() const { return m_queue; }

    /**
     * @brief Remote transfer layer
     *
     * The engine takes ownership of the conduit.
     */
    void setConduit(RecordConduit *conduit);
    RecordConduit* conduit() const { return m_conduit; }

    void setIdentity(const DeviceIdentity &identity);
    std::optional<DeviceIdentity> identity() const { return m_identity; }

    /**
     * @brief Persisted metadata (not owned, optional)
     */
    void setSyncState(SyncState *state);

    /**
     * @brief History log (not owned, optional)
     */
    void setHistory(SyncHistory *history);

    /**
     * @brief Account check consulted before every pass
     *
     * Without a callback the engine does not gate on sign-in.
     */
    void setSignedInCheck(std::function<bool()> callback);

    void setConfig(const SyncConfig &config);
    SyncConfig config() const;

    // ========== Sync Operations ==========

    /**
     * @brief Lifecycle-triggered sync
     *
     * Skipped when signed out, on a simulator, while a pass runs, or within
     * the cooldown of the last lifecycle-triggered pass.
     */
    QFuture<SyncResult> performFullSyncSafely();

    /**
     * @brief User-requested sync; same guards without the cooldown
     */
    QFuture<SyncResult> forceSync();

    /**
     * @brief Settle a device conflict
     *
     *   UseThisDevice - upload the whole local dataset, then register
     *   UseCloudData  - download the whole remote dataset, drop the queue, then register
     */
    QFuture<SyncResult> handleConflictResolution(ConflictChoice choice);

    /**
     * @brief Return a finished or conflicted status to idle
     */
    void dismissStatus();

    SyncStatus status() const;
    bool isSyncing() const;

signals:
    void statusChanged(const RecordSync::SyncStatus &status);
    void syncStarted();
    void syncFinished(const RecordSync::SyncResult &result);
    void conflictDetected(const RecordSync::ConflictInfo &info);
    void progressUpdated(int current, int total, const QString &message);
    void logMessage(const QString &message);
    void errorOccurred(const QString &error);

private:
    /**
     * @brief Guards shared by every entry point
     * @return Skip reason, empty if the pass may run
     */
    QString checkGuards(bool applyCooldown) const;

    /**
     * @brief Claim the engine for a pass (Idle/Success/Failed/Conflict -> Syncing)
     *
     * Refused while a previous pass body is still running, even if it has
     * already published its final status.
     */
    bool tryBeginSync(const QString &message);

    /**
     * @brief Release the claim taken by tryBeginSync(); last step of a worker
     */
    void endPass();

    QFuture<SyncResult> startPass(SyncAction action, bool applyCooldown,
                                  std::function<SyncResult(SyncResult)> body);
    static QFuture<SyncResult> skipped(SyncAction action, const QString &reason);

    SyncResult executeSync(SyncResult result);
    SyncResult resolveUsingThisDevice(SyncResult result);
    SyncResult resolveUsingCloudData(SyncResult result);

    /**
     * @brief Re-fetch the registry, add or refresh this device and write it back
     */
    bool registerThisDevice();
    SyncResult finishSync(SyncResult result, int downloaded, int uploaded, int failed);
    SyncResult failSync(SyncResult result, const QString &message);
    void recordHistory(const SyncResult &result);

    void setStatus(const SyncStatus &status);
    void scheduleIdle();

    RecordStore *m_store = nullptr;
    SyncQueueManager *m_queue = nullptr;
    RecordConduit *m_conduit = nullptr;
    SyncState *m_state = nullptr;
    SyncHistory *m_history = nullptr;
    std::optional<DeviceIdentity> m_identity;
    std::function<bool()> m_signedInCheck;
    SyncConfig m_config;

    SyncStatus m_status;
    quint64 m_statusGeneration = 0;
    bool m_passRunning = false;
    QList<QFuture<SyncResult>> m_passes;

    mutable QMutex m_mutex;
};

} // namespace RecordSync

#endif // SYNCENGINE_H
