#ifndef SYNCSTATE_H
#define SYNCSTATE_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QMutex>

namespace RecordSync {

/**
 * @brief Per-installation sync metadata
 *
 * State is stored in:
 *   <stateDir>/sync_state.json
 *     lastSyncTime        - last successful pass
 *     lastForegroundSync  - last pass that counted against the cooldown
 *     lastSyncDevice      - device ID that wrote the last pass
 */
class SyncState : public QObject
{
    Q_OBJECT

public:
    static const QString FileName;

    explicit SyncState(QObject *parent = nullptr);
    ~SyncState();

    // ========== Sync Metadata ==========

    /**
     * @brief Get timestamp of last successful sync
     */
    QDateTime lastSyncTime() const;

    /**
     * @brief Set last sync timestamp (called after successful sync)
     */
    void setLastSyncTime(const QDateTime &time);

    /**
     * @brief Start of the last lifecycle-triggered pass (cooldown input)
     */
    QDateTime lastForegroundSync() const;
    void setLastForegroundSync(const QDateTime &time);

    QString lastSyncDevice() const;
    void setLastSyncDevice(const QString &deviceId);

    /**
     * @brief Check if this installation has never completed a pass
     */
    bool isFirstSync() const;

    /**
     * @brief True if a foreground pass started less than @p cooldownSeconds before @p now
     *
     * A last pass recorded after @p now never counts as within the cooldown.
     */
    bool isWithinCooldown(const QDateTime &now, int cooldownSeconds) const;

    // ========== Persistence ==========

    /**
     * @brief Load state from disk
     * @return true if loaded successfully (or if no previous state exists)
     */
    bool load();

    /**
     * @brief Save state to disk
     * @return true if saved successfully
     */
    bool save();

    /**
     * @brief Clear all state (sign-out)
     */
    void clear();

    QString statePath() const;

    /**
     * @brief Set the directory holding sync_state.json
     *
     * Must be called before load() or save().
     */
    void setStateDirectory(const QString &dir);

signals:
    void stateChanged();
    void errorOccurred(const QString &error);

private:
    QString m_stateDir;

    QDateTime m_lastSyncTime;
    QDateTime m_lastForegroundSync;
    QString m_lastSyncDevice;

    mutable QMutex m_mutex;
};

} // namespace RecordSync

#endif // SYNCSTATE_H
