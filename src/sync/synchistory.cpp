#include "synchistory.h"
#include "syncablerecord.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSaveFile>
#include <QDebug>

namespace RecordSync {

// ========== SyncHistoryEntry ==========

SyncHistoryEntry SyncHistoryEntry::fromResult(const SyncResult &result)
{
    SyncHistoryEntry entry;
    entry.id = QUuid::createUuid();
    entry.timestamp = result.endTime.isValid() ? result.endTime : SyncDate::now();
    entry.action = result.action;
    entry.result = result.outcome;
    entry.details = result.message;
    entry.uploaded = result.uploaded;
    entry.downloaded = result.downloaded;
    entry.failed = result.failed;
    entry.durationMs = result.durationMs();
    entry.errorMessage = result.errorMessage;
    return entry;
}

QJsonObject SyncHistoryEntry::toJson() const
{
    QJsonObject json;
    json["id"] = SyncJson::idToString(id);
    json["timestamp"] = SyncDate::toString(timestamp);
    json["action"] = syncActionToString(action);
    json["result"] = syncOutcomeToString(result);
    json["details"] = details;
    json["uploaded"] = uploaded;
    json["downloaded"] = downloaded;
    json["failed"] = failed;
    json["durationMs"] = durationMs;
    if (!errorMessage.isEmpty()) {
        json["errorMessage"] = errorMessage;
    }
    return json;
}

SyncHistoryEntry SyncHistoryEntry::fromJson(const QJsonObject &json)
{
    SyncHistoryEntry entry;
    entry.id = SyncJson::idFromString(json["id"].toString());
    entry.timestamp = SyncDate::fromString(json["timestamp"].toString());
    entry.action = syncActionFromString(json["action"].toString());
    entry.result = syncOutcomeFromString(json["result"].toString());
    entry.details = json["details"].toString();
    entry.uploaded = json["uploaded"].toInt();
    entry.downloaded = json["downloaded"].toInt();
    entry.failed = json["failed"].toInt();
    entry.durationMs = json["durationMs"].toVariant().toLongLong();
    entry.errorMessage = json["errorMessage"].toString();
    return entry;
}

// ========== SyncHistory ==========

const QString SyncHistory::FileName = QStringLiteral("sync_history.json");

SyncHistory::SyncHistory(QObject *parent)
    : QObject(parent)
{
}

void SyncHistory::setLimit(int limit)
{
    QMutexLocker locker(&m_mutex);
    m_limit = qMax(1, limit);
    while (m_entries.size() > m_limit) {
        m_entries.removeLast();
    }
}

int SyncHistory::limit() const
{
    QMutexLocker locker(&m_mutex);
    return m_limit;
}

void SyncHistory::addEntry(const SyncHistoryEntry &entry)
{
    {
        QMutexLocker locker(&m_mutex);
        m_entries.prepend(entry);
        while (m_entries.size() > m_limit) {
            m_entries.removeLast();
        }
        saveLocked();
    }
    emit historyChanged();
}

QList<SyncHistoryEntry> SyncHistory::entries() const
{
    QMutexLocker locker(&m_mutex);
    return m_entries;
}

int SyncHistory::count() const
{
    QMutexLocker locker(&m_mutex);
    return m_entries.size();
}

std::optional<SyncHistoryEntry> SyncHistory::lastSync() const
{
    QMutexLocker locker(&m_mutex);
    if (m_entries.isEmpty()) {
        return std::nullopt;
    }
    return m_entries.first();
}

std::optional<SyncHistoryEntry> SyncHistory::lastSuccessfulSync() const
{
    QMutexLocker locker(&m_mutex);
    for (const SyncHistoryEntry &entry : m_entries) {
        if (entry.result == SyncOutcome::Success || entry.result == SyncOutcome::PartialSuccess) {
            return entry;
        }
    }
    return std::nullopt;
}

void SyncHistory::clear()
{
    {
        QMutexLocker locker(&m_mutex);
        m_entries.clear();
        saveLocked();
    }
    emit historyChanged();
}

QByteArray SyncHistory::exportJson() const
{
    QMutexLocker locker(&m_mutex);
    QJsonArray array;
    for (const SyncHistoryEntry &entry : m_entries) {
        array.append(entry.toJson());
    }
    return QJsonDocument(array).toJson(QJsonDocument::Indented);
}

// ========== Persistence ==========

void SyncHistory::setStoragePath(const QString &path)
{
    QMutexLocker locker(&m_mutex);
    m_storagePath = path;
}

bool SyncHistory::load()
{
    QMutexLocker locker(&m_mutex);
    m_entries.clear();

    QFile file(m_storagePath);
    if (m_storagePath.isEmpty() || !file.exists()) {
        return true;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[SyncHistory] Failed to open" << m_storagePath;
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "[SyncHistory] Ignoring malformed history:" << parseError.errorString();
        return true;
    }

    const QJsonArray array = doc.array();
    for (const QJsonValue &value : array) {
        if (m_entries.size() >= m_limit) break;
        m_entries.append(SyncHistoryEntry::fromJson(value.toObject()));
    }
    return true;
}

bool SyncHistory::save()
{
    QMutexLocker locker(&m_mutex);
    return saveLocked();
}

bool SyncHistory::saveLocked()
{
    if (m_storagePath.isEmpty()) {
        return true;
    }

    QDir().mkpath(QFileInfo(m_storagePath).absolutePath());

    QJsonArray array;
    for (const SyncHistoryEntry &entry : m_entries) {
        array.append(entry.toJson());
    }

    QSaveFile file(m_storagePath);
    if (!file.open(QIODevice::WriteOnly)) {
        qWarning() << "[SyncHistory] Failed to save" << m_storagePath;
        return false;
    }
    file.write(QJsonDocument(array).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        qWarning() << "[SyncHistory] Failed to commit" << file.errorString();
        return false;
    }
    return true;
}

} // namespace RecordSync
