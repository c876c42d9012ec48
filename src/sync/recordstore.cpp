#include "recordstore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QMutexLocker>
#include <QSaveFile>
#include <QDebug>

namespace RecordSync {

RecordStore::RecordStore(const RecordFactory &factory, QObject *parent)
    : QObject(parent)
    , m_factory(factory)
{
    qRegisterMetaType<RecordSync::RecordRef>();
}

RecordStore::~RecordStore()
{
    qDeleteAll(m_records);
}

QString RecordStore::makeKey(const QString &entityType, const QUuid &id)
{
    return QString("%1_%2").arg(entityType, SyncJson::idToString(id));
}

// ========== Local Mutations ==========

SyncableRecord* RecordStore::insert(SyncableRecord *record)
{
    if (!record) return nullptr;

    RecordRef ref;
    {
        QMutexLocker locker(&m_mutex);
        replaceLocked(record->storageKey(), record);
        saveLocked();
        ref = RecordRef(record);
    }

    emit recordChanged(ref);
    return record;
}

bool RecordStore::update(const QString &entityType, const QUuid &id,
                         const std::function<void(SyncableRecord*)> &mutator)
{
    RecordRef ref;
    {
        QMutexLocker locker(&m_mutex);
        SyncableRecord *record = findLocked(makeKey(entityType, id));
        if (!record) {
            return false;
        }
        mutator(record);
        saveLocked();
        ref = RecordRef(record);
    }

    emit recordChanged(ref);
    return true;
}

bool RecordStore::softDelete(const QString &entityType, const QUuid &id)
{
    return update(entityType, id, [](SyncableRecord *record) {
        record->setDeleted(true);
    });
}

// ========== Queries ==========

SyncableRecord* RecordStore::record(const QString &entityType, const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    return findLocked(makeKey(entityType, id));
}

QList<RecordRef> RecordStore::recordRefs() const
{
    QMutexLocker locker(&m_mutex);
    QList<RecordRef> refs;
    refs.reserve(m_records.size());
    for (const SyncableRecord *record : m_records) {
        refs.append(RecordRef(record));
    }
    return refs;
}

QStringList RecordStore::keys() const
{
    QMutexLocker locker(&m_mutex);
    return m_records.keys();
}

bool RecordStore::contains(const QString &entityType, const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    return m_records.contains(makeKey(entityType, id));
}

int RecordStore::recordCount(bool includeDeleted) const
{
    QMutexLocker locker(&m_mutex);
    if (includeDeleted) {
        return m_records.size();
    }

    int count = 0;
    for (const SyncableRecord *record : m_records) {
        if (!record->isDeleted()) {
            count++;
        }
    }
    return count;
}

QDateTime RecordStore::lastModified(const QString &entityType, const QUuid &id) const
{
    QMutexLocker locker(&m_mutex);
    SyncableRecord *record = findLocked(makeKey(entityType, id));
    return record ? record->lastModified() : QDateTime();
}

QByteArray RecordStore::serialize(const QString &entityType, const QUuid &id, bool *found) const
{
    QMutexLocker locker(&m_mutex);
    SyncableRecord *record = findLocked(makeKey(entityType, id));
    if (found) {
        *found = (record != nullptr);
    }
    return record ? record->toSyncJson() : QByteArray();
}

// ========== Remote Merges ==========

RecordStore::ApplyResult RecordStore::applyRemote(const QString &entityType, const QUuid &id,
                                                  const QJsonObject &document, bool force)
{
    const QString key = makeKey(entityType, id);
    const bool remoteDeleted = SyncJson::toBool(document["isDeleted"]);
    const QDateTime remoteModified = SyncDate::fromString(document["lastModified"].toString());

    if (!remoteModified.isValid()) {
        qWarning() << "[RecordStore] No usable lastModified in" << key;
        return ApplyResult::Invalid;
    }

    ApplyResult result = ApplyResult::Ignored;
    {
        QMutexLocker locker(&m_mutex);
        SyncableRecord *existing = findLocked(key);

        if (existing && !force && remoteModified <= existing->lastModified()) {
            return ApplyResult::Ignored;
        }

        if (remoteDeleted) {
            // Tombstones for records we never had are not materialised
            if (!existing) {
                return ApplyResult::Ignored;
            }
            existing->setDeleted(true);
            existing->setLastModified(remoteModified);
            result = ApplyResult::Deleted;
        } else {
            // Validate on a scratch record so a rejected document leaves
            // the local copy untouched
            SyncableRecord *incoming = m_factory.create(entityType, id);
            if (!incoming) {
                qWarning() << "[RecordStore] Unknown entity type" << entityType << "for" << key;
                return ApplyResult::Invalid;
            }
            if (!incoming->applySyncJson(document)) {
                delete incoming;
                return ApplyResult::Invalid;
            }

            if (existing) {
                // Known records are overwritten in place; pointers stay valid
                delete incoming;
                if (!existing->applySyncJson(document)) {
                    return ApplyResult::Invalid;
                }
                result = ApplyResult::Updated;
            } else {
                m_records.insert(key, incoming);
                result = ApplyResult::Created;
            }
        }

        saveLocked();
    }

    emit recordMerged(key, result);
    return result;
}

int RecordStore::tombstoneAllExcept(const QSet<QString> &keepKeys)
{
    QMutexLocker locker(&m_mutex);

    int count = 0;
    for (auto it = m_records.begin(); it != m_records.end(); ++it) {
        if (keepKeys.contains(it.key()) || it.value()->isDeleted()) {
            continue;
        }
        it.value()->setDeleted(true);
        count++;
    }

    if (count > 0) {
        qDebug() << "[RecordStore] Tombstoned" << count << "local-only records";
        saveLocked();
    }
    return count;
}

// ========== Persistence ==========

void RecordStore::setStoragePath(const QString &path)
{
    QMutexLocker locker(&m_mutex);
    m_storagePath = path;
}

QString RecordStore::storagePath() const
{
    QMutexLocker locker(&m_mutex);
    return m_storagePath;
}

bool RecordStore::load()
{
    QMutexLocker locker(&m_mutex);

    if (m_storagePath.isEmpty()) {
        return true;
    }

    QFile file(m_storagePath);
    if (!file.exists()) {
        // Nothing stored yet - fine for a fresh installation
        return true;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        setError(QString("Failed to open record store: %1").arg(m_storagePath));
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    qDeleteAll(m_records);
    m_records.clear();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[RecordStore] Ignoring malformed record store:" << parseError.errorString();
        return true;
    }

    const QJsonArray entries = doc.object()["records"].toArray();
    int skipped = 0;
    for (const QJsonValue &value : entries) {
        const QJsonObject entry = value.toObject();
        const QString entityType = entry["entityType"].toString();
        const QJsonObject document = entry["document"].toObject();
        const QUuid id = SyncJson::idFromString(document["syncID"].toString());

        SyncableRecord *record = m_factory.create(entityType, id);
        if (!record || !record->applySyncJson(document)) {
            delete record;
            skipped++;
            continue;
        }
        replaceLocked(record->storageKey(), record);
    }

    if (skipped > 0) {
        qWarning() << "[RecordStore] Skipped" << skipped << "unreadable records";
    }
    qDebug() << "[RecordStore] Loaded" << m_records.size() << "records";
    return true;
}

bool RecordStore::save()
{
    QMutexLocker locker(&m_mutex);
    return saveLocked();
}

bool RecordStore::saveLocked()
{
    if (m_storagePath.isEmpty()) {
        return true;
    }

    QDir().mkpath(QFileInfo(m_storagePath).absolutePath());

    QJsonArray entries;
    for (const SyncableRecord *record : m_records) {
        QJsonObject document;
        if (!SyncJson::decodeObject(record->toSyncJson(), document)) {
            qWarning() << "[RecordStore] Not persisting unencodable record" << record->storageKey();
            continue;
        }
        QJsonObject entry;
        entry["entityType"] = record->entityType();
        entry["document"] = document;
        entries.append(entry);
    }

    QJsonObject root;
    root["version"] = 1;
    root["records"] = entries;

    QSaveFile file(m_storagePath);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(QString("Failed to save record store: %1").arg(m_storagePath));
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        setError(QString("Failed to commit record store: %1").arg(file.errorString()));
        return false;
    }
    return true;
}

QString RecordStore::lastError() const
{
    QMutexLocker locker(&m_mutex);
    return m_lastError;
}

// ========== Private ==========

SyncableRecord* RecordStore::findLocked(const QString &key) const
{
    return m_records.value(key, nullptr);
}

void RecordStore::replaceLocked(const QString &key, SyncableRecord *record)
{
    SyncableRecord *previous = m_records.value(key, nullptr);
    if (previous && previous != record) {
        delete previous;
    }
    m_records[key] = record;
}

void RecordStore::setError(const QString &error)
{
    m_lastError = error;
    qWarning() << "[RecordStore]" << error;
    emit errorOccurred(error);
}

} // namespace RecordSync
