#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QDateTime>
#include <QList>
#include <QMetaType>

/**
 * @file synctypes.h
 * @brief Common types and enums for the sync engine
 */

namespace RecordSync {

/**
 * @brief Priority class of a syncable entity
 *
 * Instance records (completions, check-ins) are latency sensitive and
 * may jump the upload queue. Template records never do.
 */
enum class RecordClass {
    Instance,
    Template
};

QString recordClassToString(RecordClass recordClass);
RecordClass recordClassFromString(const QString &value);

/**
 * @brief The two ways a user can settle a device conflict
 */
enum class ConflictChoice {
    UseThisDevice,  ///< Local dataset becomes authoritative (upload everything)
    UseCloudData    ///< Remote dataset becomes authoritative (download everything)
};

/**
 * @brief What the user is shown when an unfamiliar device meets an existing dataset
 */
struct ConflictInfo {
    QString otherDeviceId;
    QString otherDeviceName;
    QDateTime otherDeviceLastSync;
    int localRecordCount = 0;
    bool isOtherDeviceSimulator = false;

    bool isValid() const { return !otherDeviceId.isEmpty(); }

    bool operator==(const ConflictInfo &other) const {
        return otherDeviceId == other.otherDeviceId
            && otherDeviceLastSync == other.otherDeviceLastSync;
    }
    bool operator!=(const ConflictInfo &other) const { return !(*this == other); }
};

/**
 * @brief Observable state of the sync engine
 *
 *   Idle -> Syncing -> { Success | Failed | ConflictDetected } -> Idle
 */
class SyncStatus
{
public:
    enum class Kind {
        Idle,
        Syncing,
        Success,
        Failed,
        ConflictDetected
    };

    SyncStatus() = default;

    static SyncStatus idle() { return SyncStatus(); }
    static SyncStatus syncing(const QString &message = QString());
    static SyncStatus success(const QString &message);
    static SyncStatus failed(const QString &message);
    static SyncStatus conflictDetected(const ConflictInfo &info);

    Kind kind() const { return m_kind; }
    ConflictInfo conflict() const { return m_conflict; }

    /**
     * @brief Display text for the current state
     */
    QString message() const;

    /**
     * @brief True while a pass is running
     */
    bool isActive() const { return m_kind == Kind::Syncing; }

    bool isIdle() const { return m_kind == Kind::Idle; }

    bool operator==(const SyncStatus &other) const;
    bool operator!=(const SyncStatus &other) const { return !(*this == other); }

private:
    Kind m_kind = Kind::Idle;
    QString m_message;
    ConflictInfo m_conflict;
};

/**
 * @brief How a sync pass was started
 */
enum class SyncAction {
    FullSync,           ///< Lifecycle-triggered sync (throttled)
    ManualSync,         ///< User-initiated "sync now"
    ConflictResolution  ///< Pass run after the user settled a conflict
};

/**
 * @brief Outcome of a sync pass
 */
enum class SyncOutcome {
    Success,
    PartialSuccess,     ///< Pass completed but some records failed to transfer
    Failed,
    Conflict,
    Skipped             ///< Guard rejected the pass (signed out, simulator, throttled, busy)
};

QString syncActionToString(SyncAction action);
SyncAction syncActionFromString(const QString &value);
QString syncOutcomeToString(SyncOutcome outcome);
SyncOutcome syncOutcomeFromString(const QString &value);

/**
 * @brief Counters for one transfer phase
 */
struct TransferStats {
    int transferred = 0;    ///< Records downloaded or uploaded
    int failed = 0;         ///< Records that could not be transferred
    int skipped = 0;        ///< Records left out of this batch (encoding faults, unknown types)

    QString summary() const {
        return QString("Transferred: %1, Failed: %2, Skipped: %3")
            .arg(transferred).arg(failed).arg(skipped);
    }
};

/**
 * @brief Result of a single phase talking to the remote store
 */
struct PhaseResult {
    bool success = false;
    QString errorMessage;
    TransferStats stats;
};

/**
 * @brief Result of a complete sync pass
 */
struct SyncResult {
    SyncOutcome outcome = SyncOutcome::Skipped;
    SyncAction action = SyncAction::FullSync;
    QString message;        ///< Status text or skip reason
    QString errorMessage;
    int downloaded = 0;
    int uploaded = 0;
    int failed = 0;
    ConflictInfo conflict;
    QDateTime startTime;
    QDateTime endTime;

    bool succeeded() const {
        return outcome == SyncOutcome::Success || outcome == SyncOutcome::PartialSuccess;
    }

    qint64 durationMs() const {
        if (!startTime.isValid() || !endTime.isValid()) return 0;
        return startTime.msecsTo(endTime);
    }
};

/**
 * @brief Tunables shared by the engine, the queue and the conduit
 */
struct SyncConfig {
    int cooldownSeconds = 300;          ///< Foreground sync throttle
    int statusDisplayMs = 3000;         ///< How long success/failed stay visible
    int recentWindowHours = 24;         ///< Instance records newer than this upload first
    int maxAttemptsPerPass = 3;         ///< Upload tries per item within one pass
    int retryBackoffMs = 500;           ///< Linear backoff step between tries
    int maxQueueSize = 5000;            ///< Beyond this the queue collapses into a full resync
    int historyLimit = 100;             ///< Rolling sync history size
};

} // namespace RecordSync

// Register types for Qt metatype system (needed for cross-thread signals)
Q_DECLARE_METATYPE(RecordSync::SyncStatus)
Q_DECLARE_METATYPE(RecordSync::SyncResult)
Q_DECLARE_METATYPE(RecordSync::ConflictInfo)

#endif // SYNCTYPES_H
