#include "syncablerecord.h"

#include <QJsonDocument>
#include <QJsonParseError>
#include <QDebug>

namespace RecordSync {

// ========== SyncDate ==========

namespace SyncDate {

QString toString(const QDateTime &dateTime)
{
    if (!dateTime.isValid()) {
        return QString();
    }
    return dateTime.toUTC().toString(Qt::ISODateWithMs);
}

QDateTime fromString(const QString &text)
{
    if (text.isEmpty()) {
        return QDateTime();
    }

    QDateTime parsed = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        parsed = QDateTime::fromString(text, Qt::ISODate);
    }
    if (!parsed.isValid()) {
        return QDateTime();
    }
    return parsed.toUTC();
}

QDateTime now()
{
    return QDateTime::currentDateTimeUtc();
}

} // namespace SyncDate

// ========== SyncJson ==========

namespace SyncJson {

QString idToString(const QUuid &id)
{
    return id.toString(QUuid::WithoutBraces).toUpper();
}

QUuid idFromString(const QString &text)
{
    return QUuid::fromString(text);
}

QJsonArray idsToJson(const QList<QUuid> &ids)
{
    QJsonArray array;
    for (const QUuid &id : ids) {
        array.append(idToString(id));
    }
    return array;
}

QList<QUuid> idsFromJson(const QJsonValue &value)
{
    QList<QUuid> ids;
    const QJsonArray array = value.toArray();
    for (const QJsonValue &entry : array) {
        QUuid id = idFromString(entry.toString());
        if (!id.isNull()) {
            ids.append(id);
        }
    }
    return ids;
}

QJsonArray intsToJson(const QList<int> &values)
{
    QJsonArray array;
    for (int value : values) {
        array.append(value);
    }
    return array;
}

QList<int> intsFromJson(const QJsonValue &value)
{
    QList<int> values;
    const QJsonArray array = value.toArray();
    for (const QJsonValue &entry : array) {
        if (entry.isDouble()) {
            values.append(entry.toInt());
        }
    }
    return values;
}

bool toBool(const QJsonValue &value, bool defaultValue)
{
    switch (value.type()) {
    case QJsonValue::Bool:
        return value.toBool();
    case QJsonValue::Double:
        return value.toDouble() != 0.0;
    case QJsonValue::String:
        return value.toString().compare("true", Qt::CaseInsensitive) == 0;
    default:
        return defaultValue;
    }
}

QByteArray encode(const QJsonObject &object)
{
    // QJsonObject keeps its keys sorted, so the output is canonical
    return QJsonDocument(object).toJson(QJsonDocument::Compact);
}

bool decodeObject(const QByteArray &data, QJsonObject &object, QString *errorMessage)
{
    object = QJsonObject();

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (errorMessage) {
            *errorMessage = parseError.errorString();
        }
        return false;
    }
    if (!doc.isObject()) {
        if (errorMessage) {
            *errorMessage = "Document is not a JSON object";
        }
        return false;
    }

    object = doc.object();
    return true;
}

} // namespace SyncJson

// ========== SyncableRecord ==========

QString SyncableRecord::storageKey() const
{
    return QString("%1_%2").arg(entityType(), SyncJson::idToString(syncId()));
}

QJsonObject SyncableRecord::baseSyncJson() const
{
    QJsonObject json;
    json["syncID"] = SyncJson::idToString(syncId());
    json["lastModified"] = SyncDate::toString(lastModified());
    json["isDeleted"] = isDeleted();
    return json;
}

bool SyncableRecord::applyBaseSyncJson(const QJsonObject &json)
{
    QUuid id = SyncJson::idFromString(json["syncID"].toString());
    if (id.isNull() || id != syncId()) {
        qWarning() << "[SyncableRecord] Document ID" << json["syncID"].toString()
                   << "does not match" << storageKey();
        return false;
    }

    // setDeleted() counts as a mutation, so the document timestamp goes last
    setDeleted(SyncJson::toBool(json["isDeleted"]));
    QDateTime modified = SyncDate::fromString(json["lastModified"].toString());
    if (modified.isValid()) {
        setLastModified(modified);
    }
    return true;
}

// ========== RecordRef ==========

RecordRef::RecordRef(const SyncableRecord *record)
{
    if (!record) return;
    entityType = record->entityType();
    syncId = record->syncId();
    recordClass = record->recordClass();
    createdAt = record->createdAt();
}

QString RecordRef::storageKey() const
{
    return QString("%1_%2").arg(entityType, SyncJson::idToString(syncId));
}

} // namespace RecordSync
