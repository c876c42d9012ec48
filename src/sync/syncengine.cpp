#include "syncengine.h"
#include "deviceregistry.h"
#include "objectstore.h"
#include "recordconduit.h"
#include "recordstore.h"
#include "syncablerecord.h"
#include "synchistory.h"
#include "syncqueue.h"
#include "syncstate.h"

#include <QMetaObject>
#include <QMutexLocker>
#include <QTimer>
#include <QtConcurrent/QtConcurrentRun>
#include <QDebug>

#include <algorithm>

namespace RecordSync {

SyncEngine::SyncEngine(QObject *parent)
    : QObject(parent)
{
    qRegisterMetaType<RecordSync::SyncStatus>();
    qRegisterMetaType<RecordSync::SyncResult>();
    qRegisterMetaType<RecordSync::ConflictInfo>();
}

SyncEngine::~SyncEngine()
{
    // An in-flight pass always runs to completion
    QList<QFuture<SyncResult>> passes;
    {
        QMutexLocker locker(&m_mutex);
        passes = m_passes;
    }
    for (QFuture<SyncResult> &pass : passes) {
        pass.waitForFinished();
    }
}

// ========== Collaborators ==========

void SyncEngine::setRecordStore(RecordStore *store)
{
    m_store = store;
}

void SyncEngine::setQueue(SyncQueueManager *queue)
{
    if (m_queue) {
        disconnect(m_queue, nullptr, this, nullptr);
    }
    m_queue = queue;
    if (m_queue) {
        connect(m_queue, &SyncQueueManager::logMessage, this, &SyncEngine::logMessage);
    }
}

void SyncEngine::setConduit(RecordConduit *conduit)
{
    delete m_conduit;
    m_conduit = conduit;

    if (m_conduit) {
        m_conduit->setParent(this);
        m_conduit->setConfig(m_config);
        connect(m_conduit, &RecordConduit::logMessage, this, &SyncEngine::logMessage);
        connect(m_conduit, &RecordConduit::progressUpdated, this, &SyncEngine::progressUpdated);
    }
}

void SyncEngine::setIdentity(const DeviceIdentity &identity)
{
    m_identity = identity;
}

void SyncEngine::setSyncState(SyncState *state)
{
    m_state = state;
}

void SyncEngine::setHistory(SyncHistory *history)
{
    m_history = history;
}

void SyncEngine::setSignedInCheck(std::function<bool()> callback)
{
    m_signedInCheck = callback;
}

void SyncEngine::setConfig(const SyncConfig &config)
{
    {
        QMutexLocker locker(&m_mutex);
        m_config = config;
    }
    if (m_conduit) {
        m_conduit->setConfig(config);
    }
}

SyncConfig SyncEngine::config() const
{
    QMutexLocker locker(&m_mutex);
    return m_config;
}

// ========== Sync Operations ==========

QFuture<SyncResult> SyncEngine::performFullSyncSafely()
{
    return startPass(SyncAction::FullSync, true, [this](SyncResult result) {
        return executeSync(result);
    });
}

QFuture<SyncResult> SyncEngine::forceSync()
{
    return startPass(SyncAction::ManualSync, false, [this](SyncResult result) {
        return executeSync(result);
    });
}

QFuture<SyncResult> SyncEngine::handleConflictResolution(ConflictChoice choice)
{
    return startPass(SyncAction::ConflictResolution, false, [this, choice](SyncResult result) {
        if (choice == ConflictChoice::UseThisDevice) {
            return resolveUsingThisDevice(result);
        }
        return resolveUsingCloudData(result);
    });
}

void SyncEngine::dismissStatus()
{
    SyncStatus current = status();
    if (current.isActive() || current.isIdle()) {
        return;
    }
    setStatus(SyncStatus::idle());
}

SyncStatus SyncEngine::status() const
{
    QMutexLocker locker(&m_mutex);
    return m_status;
}

bool SyncEngine::isSyncing() const
{
    QMutexLocker locker(&m_mutex);
    return m_passRunning || m_status.isActive();
}

// ========== Pass Control ==========

QString SyncEngine::checkGuards(bool applyCooldown) const
{
    if (!m_store || !m_queue || !m_conduit || !m_identity) {
        return "Sync is not configured";
    }
    if (m_signedInCheck && !m_signedInCheck()) {
        return "Not signed in";
    }
    if (m_identity->isSimulator()) {
        // Disposable development identities must never touch the registry
        return "Sync is disabled on simulators";
    }
    if (applyCooldown && m_state
            && m_state->isWithinCooldown(SyncDate::now(), config().cooldownSeconds)) {
        return "Synced recently";
    }
    return QString();
}

bool SyncEngine::tryBeginSync(const QString &message)
{
    SyncStatus syncing = SyncStatus::syncing(message);
    {
        QMutexLocker locker(&m_mutex);
        if (m_passRunning || m_status.isActive()) {
            return false;
        }
        m_passRunning = true;
        m_status = syncing;
        m_statusGeneration++;
    }
    emit statusChanged(syncing);
    return true;
}

void SyncEngine::endPass()
{
    QMutexLocker locker(&m_mutex);
    m_passRunning = false;
}

QFuture<SyncResult> SyncEngine::startPass(SyncAction action, bool applyCooldown,
                                          std::function<SyncResult(SyncResult)> body)
{
    const QString reason = checkGuards(applyCooldown);
    if (!reason.isEmpty()) {
        qDebug() << "[SyncEngine] Skipping" << syncActionToString(action) << "-" << reason;
        return skipped(action, reason);
    }

    if (!tryBeginSync("Syncing...")) {
        qDebug() << "[SyncEngine] Skipping" << syncActionToString(action) << "- already syncing";
        return skipped(action, "Sync already in progress");
    }

    if (applyCooldown && m_state) {
        m_state->setLastForegroundSync(SyncDate::now());
        m_state->save();
    }

    SyncResult result;
    result.action = action;
    result.startTime = SyncDate::now();

    emit syncStarted();

    QFuture<SyncResult> future = QtConcurrent::run([this, body, result]() {
        SyncResult finished = body(result);
        endPass();
        return finished;
    });

    {
        QMutexLocker locker(&m_mutex);
        m_passes.erase(std::remove_if(m_passes.begin(), m_passes.end(),
                                      [](const QFuture<SyncResult> &pass) {
                                          return pass.isFinished();
                                      }),
                       m_passes.end());
        m_passes.append(future);
    }
    return future;
}

QFuture<SyncResult> SyncEngine::skipped(SyncAction action, const QString &reason)
{
    SyncResult result;
    result.outcome = SyncOutcome::Skipped;
    result.action = action;
    result.message = reason;
    result.startTime = SyncDate::now();
    result.endTime = result.startTime;

    return QtConcurrent::run([result]() { return result; });
}

// ========== Pass Bodies ==========

SyncResult SyncEngine::executeSync(SyncResult result)
{
    emit logMessage(QString("Starting sync with %1").arg(m_conduit->store()
                    ? m_conduit->store()->displayName() : QString("remote store")));

    // 1. Registry
    DeviceRegistry registry;
    if (!m_conduit->fetchDeviceRegistry(registry)) {
        return failSync(result, m_conduit->lastError());
    }

    // 2. Conflict check - no record data is read or written on conflict
    ConflictInfo conflict = registry.detectConflict(m_identity->deviceId(),
                                                    m_store->recordCount(false));
    if (conflict.isValid()) {
        result.outcome = SyncOutcome::Conflict;
        result.conflict = conflict;
        result.message = QString("Conflict with %1").arg(conflict.otherDeviceName);
        result.endTime = SyncDate::now();

        qInfo() << "[SyncEngine] Device conflict with" << conflict.otherDeviceName;
        setStatus(SyncStatus::conflictDetected(conflict));
        emit logMessage(QString("This device has not synced this account before; %1 has. "
                                "Choose which data to keep.").arg(conflict.otherDeviceName));
        emit conflictDetected(conflict);
        recordHistory(result);
        emit syncFinished(result);
        return result;
    }

    // 3. Reconcile before upload so local edits rebase on the latest remote state
    PhaseResult download = m_conduit->reconcileFromRemote(*m_store);
    if (!download.success) {
        return failSync(result, download.errorMessage);
    }

    // 4. Upload
    if (m_queue->needsFullResync()) {
        emit logMessage("Pending changes overflowed earlier; uploading all records");
        m_queue->queueAllRecords(*m_store);
    }

    PhaseResult upload = m_conduit->uploadPendingRecords(*m_queue, *m_store);
    if (!upload.success) {
        return failSync(result, upload.errorMessage);
    }

    // 5. Register
    if (!registerThisDevice()) {
        return failSync(result, m_conduit->lastError());
    }

    return finishSync(result, download.stats.transferred, upload.stats.transferred,
                      download.stats.failed + upload.stats.failed);
}

SyncResult SyncEngine::resolveUsingThisDevice(SyncResult result)
{
    emit logMessage("Keeping this device's data: uploading all local records");

    PhaseResult upload = m_conduit->uploadAllRecords(*m_queue, *m_store);
    if (!upload.success) {
        return failSync(result, upload.errorMessage);
    }

    if (!registerThisDevice()) {
        return failSync(result, m_conduit->lastError());
    }

    return finishSync(result, 0, upload.stats.transferred, upload.stats.failed);
}

SyncResult SyncEngine::resolveUsingCloudData(SyncResult result)
{
    emit logMessage("Using cloud data: downloading all remote records");

    PhaseResult download = m_conduit->downloadAll(*m_store);
    if (!download.success) {
        return failSync(result, download.errorMessage);
    }

    // Local-only changes are superseded by the cloud dataset
    m_queue->clearQueue();

    if (!registerThisDevice()) {
        return failSync(result, m_conduit->lastError());
    }

    return finishSync(result, download.stats.transferred, 0, download.stats.failed);
}

bool SyncEngine::registerThisDevice()
{
    // Fetch again so devices registered during this pass are not overwritten
    DeviceRegistry registry;
    if (!m_conduit->fetchDeviceRegistry(registry)) {
        return false;
    }

    registry.registerDevice(*m_identity, SyncDate::now());
    return m_conduit->updateDeviceRegistry(registry);
}

// ========== Completion ==========

SyncResult SyncEngine::finishSync(SyncResult result, int downloaded, int uploaded, int failed)
{
    const QDateTime now = SyncDate::now();

    result.downloaded = downloaded;
    result.uploaded = uploaded;
    result.failed = failed;
    result.endTime = now;

    if (m_state) {
        m_state->setLastSyncTime(now);
        m_state->setLastSyncDevice(m_identity->deviceId());
        m_state->save();
    }

    QString message;
    if (downloaded + uploaded + failed == 0) {
        message = "Up to date";
    } else {
        message = QString("Synced %1↓ %2↑").arg(downloaded).arg(uploaded);
        if (failed > 0) {
            message += QString(" (%1 failed)").arg(failed);
        }
    }

    result.outcome = failed > 0 ? SyncOutcome::PartialSuccess : SyncOutcome::Success;
    result.message = message;

    qInfo() << "[SyncEngine] Sync complete:" << downloaded << "down," << uploaded << "up,"
            << failed << "failed in" << result.durationMs() << "ms";

    setStatus(SyncStatus::success(message));
    scheduleIdle();

    emit logMessage(message);
    recordHistory(result);
    emit syncFinished(result);
    return result;
}

SyncResult SyncEngine::failSync(SyncResult result, const QString &message)
{
    const QString error = message.isEmpty() ? QString("Sync failed") : message;

    result.outcome = SyncOutcome::Failed;
    result.errorMessage = error;
    result.message = error;
    result.endTime = SyncDate::now();

    qWarning() << "[SyncEngine] Sync failed:" << error;

    setStatus(SyncStatus::failed(error));
    scheduleIdle();

    emit errorOccurred(error);
    recordHistory(result);
    emit syncFinished(result);
    return result;
}

void SyncEngine::recordHistory(const SyncResult &result)
{
    if (m_history) {
        m_history->addEntry(SyncHistoryEntry::fromResult(result));
    }
}

// ========== Status ==========

void SyncEngine::setStatus(const SyncStatus &status)
{
    {
        QMutexLocker locker(&m_mutex);
        m_status = status;
        m_statusGeneration++;
    }
    emit statusChanged(status);
}

void SyncEngine::scheduleIdle()
{
    quint64 generation = 0;
    int delay = 0;
    {
        QMutexLocker locker(&m_mutex);
        generation = m_statusGeneration;
        delay = m_config.statusDisplayMs;
    }

    // Timers belong to the engine's thread, not the worker
    QMetaObject::invokeMethod(this, [this, generation, delay]() {
        QTimer::singleShot(delay, this, [this, generation]() {
            {
                QMutexLocker locker(&m_mutex);
                if (m_statusGeneration != generation) {
                    return;
                }
                m_status = SyncStatus::idle();
                m_statusGeneration++;
            }
            emit statusChanged(SyncStatus::idle());
        });
    }, Qt::QueuedConnection);
}

} // namespace RecordSync
