#ifndef SYNCHISTORY_H
#define SYNCHISTORY_H

#include <QObject>
#include <QString>
#include <QDateTime>
#include <QList>
#include <QUuid>
#include <QJsonObject>
#include <QMutex>
#include <optional>

#include "synctypes.h"

namespace RecordSync {

/**
 * @brief One line in the sync history
 */
struct SyncHistoryEntry {
    QUuid id;
    QDateTime timestamp;
    SyncAction action = SyncAction::FullSync;
    SyncOutcome result = SyncOutcome::Success;
    QString details;
    int uploaded = 0;
    int downloaded = 0;
    int failed = 0;
    qint64 durationMs = 0;
    QString errorMessage;

    /**
     * @brief Build an entry from a finished pass
     */
    static SyncHistoryEntry fromResult(const SyncResult &result);

    QJsonObject toJson() const;
    static SyncHistoryEntry fromJson(const QJsonObject &json);
};

/**
 * @brief Rolling, persisted log of sync passes, newest first
 */
class SyncHistory : public QObject
{
    Q_OBJECT

public:
    static const QString FileName;

    explicit SyncHistory(QObject *parent = nullptr);

    void setLimit(int limit);
    int limit() const;

    /**
     * @brief Prepend an entry, trimming to limit(), and persist
     */
    void addEntry(const SyncHistoryEntry &entry);

    QList<SyncHistoryEntry> entries() const;
    int count() const;

    std::optional<SyncHistoryEntry> lastSync() const;

    /**
     * @brief Newest entry whose result is success or partial success
     */
    std::optional<SyncHistoryEntry> lastSuccessfulSync() const;

    void clear();

    /**
     * @brief Entries as an indented JSON array, for support bundles
     */
    QByteArray exportJson() const;

    // ========== Persistence ==========

    void setStoragePath(const QString &path);
    bool load();
    bool save();

signals:
    void historyChanged();

private:
    bool saveLocked();

    QList<SyncHistoryEntry> m_entries;
    int m_limit = 100;
    QString m_storagePath;

    mutable QMutex m_mutex;
};

} // namespace RecordSync

#endif // SYNCHISTORY_H
