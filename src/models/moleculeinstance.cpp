#include "moleculeinstance.h"

#include <QDebug>

namespace RecordSync {

const QString MoleculeInstance::EntityType = "MoleculeInstance";

MoleculeInstance::MoleculeInstance(const QUuid &id)
    : m_id(id)
    , m_createdAt(SyncDate::now())
    , m_lastModified(m_createdAt)
{
    m_scheduledDate = m_createdAt;
}

void MoleculeInstance::touch()
{
    m_lastModified = SyncDate::now();
}

void MoleculeInstance::setDeleted(bool deleted)
{
    m_deleted = deleted;
    touch();
}

void MoleculeInstance::setCompleted(bool completed)
{
    m_completed = completed;
    m_completedAt = completed ? SyncDate::now() : QDateTime();
    touch();
}

void MoleculeInstance::setScheduledDate(const QDateTime &date) { m_scheduledDate = date; touch(); }
void MoleculeInstance::setException(bool exception) { m_exception = exception; touch(); }
void MoleculeInstance::setExceptionTitle(const QString &title) { m_exceptionTitle = title; touch(); }
void MoleculeInstance::setExceptionTime(const QDateTime &time) { m_exceptionTime = time; touch(); }
void MoleculeInstance::setNotes(const QString &notes) { m_notes = notes; touch(); }
void MoleculeInstance::setOriginalScheduledDate(const QDateTime &date) { m_originalScheduledDate = date; touch(); }
void MoleculeInstance::setAlertOffsets(const QList<int> &offsets) { m_alertOffsets = offsets; touch(); }
void MoleculeInstance::setAllDay(bool allDay) { m_allDay = allDay; touch(); }
void MoleculeInstance::setMoleculeTemplateId(const QUuid &id) { m_templateId = id; touch(); }
void MoleculeInstance::setAtomInstanceIds(const QList<QUuid> &ids) { m_atomInstanceIds = ids; touch(); }

QByteArray MoleculeInstance::toSyncJson() const
{
    if (m_id.isNull() || !m_lastModified.isValid()) {
        qWarning() << "[MoleculeInstance] Cannot encode record without identity or timestamp";
        return QByteArray();
    }

    QJsonObject json = baseSyncJson();
    json["scheduledDate"] = SyncDate::toString(m_scheduledDate);
    json["isCompleted"] = m_completed;
    json["isException"] = m_exception;
    json["isAllDay"] = m_allDay;
    json["alertOffsets"] = SyncJson::intsToJson(m_alertOffsets);
    json["createdAt"] = SyncDate::toString(m_createdAt);

    if (m_completedAt.isValid()) {
        json["completedAt"] = SyncDate::toString(m_completedAt);
    }
    if (!m_exceptionTitle.isNull()) {
        json["exceptionTitle"] = m_exceptionTitle;
    }
    if (m_exceptionTime.isValid()) {
        json["exceptionTime"] = SyncDate::toString(m_exceptionTime);
    }
    if (!m_notes.isNull()) {
        json["notes"] = m_notes;
    }
    if (m_originalScheduledDate.isValid()) {
        json["originalScheduledDate"] = SyncDate::toString(m_originalScheduledDate);
    }

    if (!m_templateId.isNull()) {
        json["moleculeTemplateID"] = SyncJson::idToString(m_templateId);
    }
    json["atomInstanceIDs"] = SyncJson::idsToJson(m_atomInstanceIds);

    return SyncJson::encode(json);
}

bool MoleculeInstance::applySyncJson(const QJsonObject &json)
{
    QDateTime scheduled = SyncDate::fromString(json["scheduledDate"].toString());
    if (!scheduled.isValid()) {
        qWarning() << "[MoleculeInstance] Missing scheduledDate in" << storageKey();
        return false;
    }
    if (!applyBaseSyncJson(json)) {
        return false;
    }

    m_scheduledDate = scheduled;
    m_completed = SyncJson::toBool(json["isCompleted"]);
    m_completedAt = SyncDate::fromString(json["completedAt"].toString());
    m_exception = SyncJson::toBool(json["isException"]);
    m_exceptionTitle = json.contains("exceptionTitle") ? json["exceptionTitle"].toString() : QString();
    m_exceptionTime = SyncDate::fromString(json["exceptionTime"].toString());
    m_notes = json.contains("notes") ? json["notes"].toString() : QString();
    m_originalScheduledDate = SyncDate::fromString(json["originalScheduledDate"].toString());
    m_alertOffsets = json.contains("alertOffsets")
        ? SyncJson::intsFromJson(json["alertOffsets"]) : QList<int>{15};
    m_allDay = SyncJson::toBool(json["isAllDay"]);

    QDateTime created = SyncDate::fromString(json["createdAt"].toString());
    if (created.isValid()) {
        m_createdAt = created;
    }

    m_templateId = SyncJson::idFromString(json["moleculeTemplateID"].toString());
    m_atomInstanceIds = SyncJson::idsFromJson(json["atomInstanceIDs"]);
    return true;
}

} // namespace RecordSync
