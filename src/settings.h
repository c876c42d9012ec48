#ifndef SETTINGS_H
#define SETTINGS_H

#include <QString>
#include <QSettings>

#include "sync/synctypes.h"

/**
 * @brief Application settings manager using QSettings
 *
 * Holds machine-wide preferences. The signed-in account lives in Account,
 * inside the state directory.
 *
 * instance() uses platform-appropriate storage:
 *   - Linux: ~/.config/QRecordSync/QRecordSync.conf
 *   - Windows: Registry
 *   - macOS: plist
 * A Settings constructed with a path reads and writes that INI file instead
 * (--config on the command line, tests).
 */
class Settings
{
public:
    static Settings& instance();

    /**
     * @brief Settings backed by an explicit INI file
     */
    explicit Settings(const QString &iniPath);
    ~Settings() = default;

    // ========== Sync Tuning ==========

    int cooldownSeconds() const;
    void setCooldownSeconds(int seconds);

    int statusDisplayMs() const;
    void setStatusDisplayMs(int ms);

    int recentWindowHours() const;
    void setRecentWindowHours(int hours);

    int maxAttemptsPerPass() const;
    void setMaxAttemptsPerPass(int attempts);

    int retryBackoffMs() const;
    void setRetryBackoffMs(int ms);

    int maxQueueSize() const;
    void setMaxQueueSize(int size);

    int historyLimit() const;
    void setHistoryLimit(int limit);

    /**
     * @brief All tunables as one value for the engine, queue and conduit
     */
    RecordSync::SyncConfig syncConfig() const;

    // ========== Paths ==========

    // Remote folder used when the account does not name one
    QString remoteFolder() const;
    void setRemoteFolder(const QString &path);

    // Local state: records, queue, identity, history
    QString stateDirectory() const;
    void setStateDirectory(const QString &path);

    // ========== Advanced Settings ==========
    bool debugLogging() const;
    void setDebugLogging(bool enabled);

    QString fileName() const { return m_settings.fileName(); }

    // Sync to disk
    void sync();

private:
    Settings();
    Settings(const Settings&) = delete;
    Settings& operator=(const Settings&) = delete;

    int boundedInt(const char *key, int defaultValue, int minimum) const;

    QSettings m_settings;
};

#endif // SETTINGS_H
