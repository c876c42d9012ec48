#include "settings.h"
#include <QDir>
#include <QStandardPaths>

Settings& Settings::instance()
{
    static Settings instance;
    return instance;
}

Settings::Settings()
    : m_settings("QRecordSync", "QRecordSync")
{
}

Settings::Settings(const QString &iniPath)
    : m_settings(iniPath, QSettings::IniFormat)
{
}

int Settings::boundedInt(const char *key, int defaultValue, int minimum) const
{
    bool ok = false;
    int value = m_settings.value(key, defaultValue).toInt(&ok);
    if (!ok || value < minimum) {
        return defaultValue;
    }
    return value;
}

// ========== Sync Tuning ==========

int Settings::cooldownSeconds() const
{
    return boundedInt("sync/cooldownSeconds", RecordSync::SyncConfig().cooldownSeconds, 0);
}

void Settings::setCooldownSeconds(int seconds)
{
    m_settings.setValue("sync/cooldownSeconds", seconds);
}

int Settings::statusDisplayMs() const
{
    return boundedInt("sync/statusDisplayMs", RecordSync::SyncConfig().statusDisplayMs, 0);
}

void Settings::setStatusDisplayMs(int ms)
{
    m_settings.setValue("sync/statusDisplayMs", ms);
}

int Settings::recentWindowHours() const
{
    return boundedInt("sync/recentWindowHours", RecordSync::SyncConfig().recentWindowHours, 1);
}

void Settings::setRecentWindowHours(int hours)
{
    m_settings.setValue("sync/recentWindowHours", hours);
}

int Settings::maxAttemptsPerPass() const
{
    return boundedInt("sync/maxAttemptsPerPass", RecordSync::SyncConfig().maxAttemptsPerPass, 1);
}

void Settings::setMaxAttemptsPerPass(int attempts)
{
    m_settings.setValue("sync/maxAttemptsPerPass", attempts);
}

int Settings::retryBackoffMs() const
{
    return boundedInt("sync/retryBackoffMs", RecordSync::SyncConfig().retryBackoffMs, 0);
}

void Settings::setRetryBackoffMs(int ms)
{
    m_settings.setValue("sync/retryBackoffMs", ms);
}

int Settings::maxQueueSize() const
{
    return boundedInt("sync/maxQueueSize", RecordSync::SyncConfig().maxQueueSize, 1);
}

void Settings::setMaxQueueSize(int size)
{
    m_settings.setValue("sync/maxQueueSize", size);
}

int Settings::historyLimit() const
{
    return boundedInt("sync/historyLimit", RecordSync::SyncConfig().historyLimit, 1);
}

void Settings::setHistoryLimit(int limit)
{
    m_settings.setValue("sync/historyLimit", limit);
}

RecordSync::SyncConfig Settings::syncConfig() const
{
    RecordSync::SyncConfig config;
    config.cooldownSeconds = cooldownSeconds();
    config.statusDisplayMs = statusDisplayMs();
    config.recentWindowHours = recentWindowHours();
    config.maxAttemptsPerPass = maxAttemptsPerPass();
    config.retryBackoffMs = retryBackoffMs();
    config.maxQueueSize = maxQueueSize();
    config.historyLimit = historyLimit();
    return config;
}

// ========== Paths ==========

QString Settings::remoteFolder() const
{
    return m_settings.value("paths/remoteFolder", QString()).toString();
}

void Settings::setRemoteFolder(const QString &path)
{
    m_settings.setValue("paths/remoteFolder", QDir::cleanPath(path));
}

QString Settings::stateDirectory() const
{
    QString path = m_settings.value("paths/stateDirectory", QString()).toString();
    if (path.isEmpty()) {
        path = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    }
    return path;
}

void Settings::setStateDirectory(const QString &path)
{
    m_settings.setValue("paths/stateDirectory", QDir::cleanPath(path));
}

// ========== Advanced Settings ==========

bool Settings::debugLogging() const
{
    return m_settings.value("logging/debug", false).toBool();
}

void Settings::setDebugLogging(bool enabled)
{
    m_settings.setValue("logging/debug", enabled);
}

void Settings::sync()
{
    m_settings.sync();
}
