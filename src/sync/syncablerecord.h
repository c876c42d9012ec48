#ifndef SYNCABLERECORD_H
#define SYNCABLERECORD_H

#include <QByteArray>
#include <QDateTime>
#include <QJsonArray>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QString>
#include <QUuid>
#include <QMetaType>

#include "synctypes.h"

namespace RecordSync {

/**
 * @brief Shared wire formatting for sync documents
 *
 * Every device must format and parse dates and IDs identically, so all
 * entities go through these helpers rather than formatting on their own.
 */
namespace SyncDate {

/**
 * @brief Format as ISO-8601 UTC with milliseconds ("2026-01-07T10:15:30.250Z")
 */
QString toString(const QDateTime &dateTime);

/**
 * @brief Parse an ISO-8601 timestamp, with or without fractional seconds
 * @return UTC date time, invalid if the text cannot be parsed
 */
QDateTime fromString(const QString &text);

/**
 * @brief Current time in UTC, millisecond precision
 */
QDateTime now();

} // namespace SyncDate

namespace SyncJson {

/**
 * @brief Canonical uppercase, brace-less form used in documents and object names
 */
QString idToString(const QUuid &id);
QUuid idFromString(const QString &text);

QJsonArray idsToJson(const QList<QUuid> &ids);
QList<QUuid> idsFromJson(const QJsonValue &value);

QJsonArray intsToJson(const QList<int> &values);
QList<int> intsFromJson(const QJsonValue &value);

/**
 * @brief Lenient boolean read: accepts true/false, numbers and "true"/"false" strings
 */
bool toBool(const QJsonValue &value, bool defaultValue = false);

/**
 * @brief Compact encoding with keys in sorted order
 */
QByteArray encode(const QJsonObject &object);

/**
 * @brief Decode a document that must be a JSON object
 * @return false (and an empty object) if the data is not a JSON object
 */
bool decodeObject(const QByteArray &data, QJsonObject &object, QString *errorMessage = nullptr);

} // namespace SyncJson

/**
 * @brief Contract every syncable entity implements
 *
 * A record has a stable identity that is never reused, a last-modified
 * timestamp bumped by every local mutation, and a tombstone flag. Deleted
 * records stay in the store so the deletion can reach other devices.
 *
 * Serialization produces a flat JSON object: scalars inline, a parent
 * relationship as a single ID string, children as an array of ID strings.
 */
class SyncableRecord
{
public:
    virtual ~SyncableRecord() = default;

    // ========== Identity ==========

    virtual QUuid syncId() const = 0;

    /**
     * @brief Entity type name, used in object names ("MoleculeInstance")
     */
    virtual QString entityType() const = 0;

    /**
     * @brief Upload priority class
     */
    virtual RecordClass recordClass() const = 0;

    virtual QDateTime createdAt() const = 0;

    // ========== Change Tracking ==========

    virtual QDateTime lastModified() const = 0;
    virtual void setLastModified(const QDateTime &dateTime) = 0;

    virtual bool isDeleted() const = 0;
    virtual void setDeleted(bool deleted) = 0;

    // ========== Serialization ==========

    /**
     * @brief Serialize to the sync document
     * @return Encoded JSON, or an empty array on a local encoding fault
     */
    virtual QByteArray toSyncJson() const = 0;

    /**
     * @brief Overwrite this record's fields from a sync document
     * @return false if the document does not describe this record
     */
    virtual bool applySyncJson(const QJsonObject &json) = 0;

    /**
     * @brief "<EntityType>_<syncID>", the key used locally and remotely
     */
    QString storageKey() const;

protected:
    /**
     * @brief Fields shared by every document: syncID, lastModified, isDeleted
     */
    QJsonObject baseSyncJson() const;

    /**
     * @brief Validate the shared fields and apply lastModified/isDeleted
     */
    bool applyBaseSyncJson(const QJsonObject &json);
};

/**
 * @brief Identity of a record, copied out of the store
 *
 * Carries what the upload queue needs so that signals and queued
 * connections never hold on to a record the store may replace or free.
 * Converts implicitly from a record pointer; a null pointer gives an
 * invalid ref.
 */
struct RecordRef
{
    RecordRef() = default;
    RecordRef(const SyncableRecord *record);

    bool isValid() const { return !entityType.isEmpty() && !syncId.isNull(); }
    QString storageKey() const;

    QString entityType;
    QUuid syncId;
    RecordClass recordClass = RecordClass::Template;
    QDateTime createdAt;
};

} // namespace RecordSync

Q_DECLARE_METATYPE(RecordSync::RecordRef)

#endif // SYNCABLERECORD_H
