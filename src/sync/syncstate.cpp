#include "syncstate.h"
#include "syncablerecord.h"

#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutexLocker>
#include <QSaveFile>
#include <QDebug>

namespace RecordSync {

const QString SyncState::FileName = QStringLiteral("sync_state.json");

SyncState::SyncState(QObject *parent)
    : QObject(parent)
{
}

SyncState::~SyncState()
{
}

// ========== Sync Metadata ==========

QDateTime SyncState::lastSyncTime() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastSyncTime;
}

void SyncState::setLastSyncTime(const QDateTime &time)
{
    {
        QMutexLocker locker(&m_mutex);
        m_lastSyncTime = time;
    }
    emit stateChanged();
}

QDateTime SyncState::lastForegroundSync() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastForegroundSync;
}

void SyncState::setLastForegroundSync(const QDateTime &time)
{
    {
        QMutexLocker locker(&m_mutex);
        m_lastForegroundSync = time;
    }
    emit stateChanged();
}

QString SyncState::lastSyncDevice() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastSyncDevice;
}

void SyncState::setLastSyncDevice(const QString &deviceId)
{
    {
        QMutexLocker locker(&m_mutex);
        m_lastSyncDevice = deviceId;
    }
    emit stateChanged();
}

bool SyncState::isFirstSync() const
{
    QMutexLocker locker(&m_mutex);
    return !m_lastSyncTime.isValid();
}

bool SyncState::isWithinCooldown(const QDateTime &now, int cooldownSeconds) const
{
    QMutexLocker locker(&m_mutex);
    if (!m_lastForegroundSync.isValid() || cooldownSeconds <= 0) {
        return false;
    }
    const qint64 elapsed = m_lastForegroundSync.secsTo(now);
    // A stamp in the future means the clock moved back; do not throttle on it
    return elapsed >= 0 && elapsed < cooldownSeconds;
}

// ========== Persistence ==========

bool SyncState::load()
{
    QString stateFile = statePath();
    if (stateFile.isEmpty()) {
        return true;
    }

    QFile file(stateFile);
    if (!file.exists()) {
        // No previous state - this is fine for first sync
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        emit errorOccurred(QString("Failed to open sync state: %1").arg(stateFile));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[SyncState] Ignoring malformed state:" << parseError.errorString();
        return true;
    }

    QJsonObject root = doc.object();
    {
        QMutexLocker locker(&m_mutex);
        m_lastSyncTime = SyncDate::fromString(root["lastSyncTime"].toString());
        m_lastForegroundSync = SyncDate::fromString(root["lastForegroundSync"].toString());
        m_lastSyncDevice = root["lastSyncDevice"].toString();
    }

    qDebug() << "[SyncState] Loaded, last sync" << lastSyncTime();
    return true;
}

bool SyncState::save()
{
    QString stateFile = statePath();
    if (stateFile.isEmpty()) {
        return true;
    }

    if (!QDir().mkpath(m_stateDir)) {
        emit errorOccurred(QString("Failed to create state directory: %1").arg(m_stateDir));
        return false;
    }

    QJsonObject root;
    {
        QMutexLocker locker(&m_mutex);
        if (m_lastSyncTime.isValid()) {
            root["lastSyncTime"] = SyncDate::toString(m_lastSyncTime);
        }
        if (m_lastForegroundSync.isValid()) {
            root["lastForegroundSync"] = SyncDate::toString(m_lastForegroundSync);
        }
        root["lastSyncDevice"] = m_lastSyncDevice;
    }
    root["version"] = 1;

    QSaveFile file(stateFile);
    if (!file.open(QIODevice::WriteOnly)) {
        emit errorOccurred(QString("Failed to save sync state: %1").arg(stateFile));
        return false;
    }

    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        emit errorOccurred(QString("Failed to commit sync state: %1").arg(file.errorString()));
        return false;
    }
    return true;
}

void SyncState::clear()
{
    {
        QMutexLocker locker(&m_mutex);
        m_lastSyncTime = QDateTime();
        m_lastForegroundSync = QDateTime();
        m_lastSyncDevice.clear();
    }
    emit stateChanged();
}

QString SyncState::statePath() const
{
    if (m_stateDir.isEmpty()) {
        return QString();
    }
    return QDir(m_stateDir).filePath(FileName);
}

void SyncState::setStateDirectory(const QString &dir)
{
    m_stateDir = dir;
}

} // namespace RecordSync
