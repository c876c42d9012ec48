#include "moleculetemplate.h"

#include <QDebug>

namespace RecordSync {

const QString MoleculeTemplate::EntityType = "MoleculeTemplate";

MoleculeTemplate::MoleculeTemplate(const QUuid &id)
    : m_id(id)
    , m_createdAt(SyncDate::now())
    , m_lastModified(m_createdAt)
{
}

void MoleculeTemplate::touch()
{
    m_lastModified = SyncDate::now();
}

void MoleculeTemplate::setDeleted(bool deleted)
{
    m_deleted = deleted;
    touch();
}

// ========== Fields ==========

void MoleculeTemplate::setTitle(const QString &title) { m_title = title; touch(); }
void MoleculeTemplate::setBaseTime(const QDateTime &time) { m_baseTime = time; touch(); }
void MoleculeTemplate::setRecurrenceFreq(const QString &freq) { m_recurrenceFreq = freq; touch(); }
void MoleculeTemplate::setRecurrenceDays(const QList<int> &days) { m_recurrenceDays = days; touch(); }
void MoleculeTemplate::setEndRuleType(const QString &type) { m_endRuleType = type; touch(); }
void MoleculeTemplate::setEndRuleDate(const QDateTime &date) { m_endRuleDate = date; touch(); }
void MoleculeTemplate::setEndRuleCount(std::optional<int> count) { m_endRuleCount = count; touch(); }
void MoleculeTemplate::setNotes(const QString &notes) { m_notes = notes; touch(); }
void MoleculeTemplate::setCompound(const QString &compound) { m_compound = compound; touch(); }
void MoleculeTemplate::setAlertOffsets(const QList<int> &offsets) { m_alertOffsets = offsets; touch(); }
void MoleculeTemplate::setAllDay(bool allDay) { m_allDay = allDay; touch(); }
void MoleculeTemplate::setIconSymbol(const QString &symbol) { m_iconSymbol = symbol; touch(); }
void MoleculeTemplate::setIconFrame(const QString &frame) { m_iconFrame = frame; touch(); }
void MoleculeTemplate::setThemeColorHex(const QString &hex) { m_themeColorHex = hex; touch(); }
void MoleculeTemplate::setPinned(bool pinned) { m_pinned = pinned; touch(); }
void MoleculeTemplate::setSortOrder(int order) { m_sortOrder = order; touch(); }
void MoleculeTemplate::setInstanceIds(const QList<QUuid> &ids) { m_instanceIds = ids; touch(); }
void MoleculeTemplate::setAtomTemplateIds(const QList<QUuid> &ids) { m_atomTemplateIds = ids; touch(); }

// ========== Serialization ==========

QByteArray MoleculeTemplate::toSyncJson() const
{
    if (m_id.isNull() || !m_lastModified.isValid()) {
        qWarning() << "[MoleculeTemplate] Cannot encode record without identity or timestamp";
        return QByteArray();
    }

    QJsonObject json = baseSyncJson();
    json["title"] = m_title;
    json["baseTime"] = SyncDate::toString(m_baseTime);
    json["recurrenceFreq"] = m_recurrenceFreq;
    json["recurrenceDays"] = SyncJson::intsToJson(m_recurrenceDays);
    json["endRuleType"] = m_endRuleType;
    json["alertOffsets"] = SyncJson::intsToJson(m_alertOffsets);
    json["isAllDay"] = m_allDay;
    json["iconFrameRaw"] = m_iconFrame;
    json["themeColorHex"] = m_themeColorHex;
    json["isPinned"] = m_pinned;
    json["sortOrder"] = m_sortOrder;
    json["createdAt"] = SyncDate::toString(m_createdAt);

    // Optional properties
    if (m_endRuleDate.isValid()) {
        json["endRuleDate"] = SyncDate::toString(m_endRuleDate);
    }
    if (m_endRuleCount) {
        json["endRuleCount"] = *m_endRuleCount;
    }
    if (!m_notes.isNull()) {
        json["notes"] = m_notes;
    }
    if (!m_compound.isNull()) {
        json["compound"] = m_compound;
    }
    if (!m_iconSymbol.isNull()) {
        json["iconSymbol"] = m_iconSymbol;
    }

    // Child relationship IDs
    json["instanceIDs"] = SyncJson::idsToJson(m_instanceIds);
    json["atomTemplateIDs"] = SyncJson::idsToJson(m_atomTemplateIds);

    return SyncJson::encode(json);
}

bool MoleculeTemplate::applySyncJson(const QJsonObject &json)
{
    if (!json.contains("title")) {
        qWarning() << "[MoleculeTemplate] Missing required fields in" << storageKey();
        return false;
    }
    if (!applyBaseSyncJson(json)) {
        return false;
    }

    m_title = json["title"].toString();
    m_baseTime = SyncDate::fromString(json["baseTime"].toString());
    m_recurrenceFreq = json["recurrenceFreq"].toString("daily");
    m_recurrenceDays = SyncJson::intsFromJson(json["recurrenceDays"]);
    m_endRuleType = json["endRuleType"].toString("never");
    m_endRuleDate = SyncDate::fromString(json["endRuleDate"].toString());
    m_endRuleCount = json["endRuleCount"].isDouble()
        ? std::optional<int>(json["endRuleCount"].toInt()) : std::nullopt;
    m_notes = json.contains("notes") ? json["notes"].toString() : QString();
    m_compound = json.contains("compound") ? json["compound"].toString() : QString();
    m_alertOffsets = json.contains("alertOffsets")
        ? SyncJson::intsFromJson(json["alertOffsets"]) : QList<int>{15};
    m_allDay = SyncJson::toBool(json["isAllDay"]);
    m_iconSymbol = json.contains("iconSymbol") ? json["iconSymbol"].toString() : QString();
    m_iconFrame = json["iconFrameRaw"].toString("circle");
    m_themeColorHex = json["themeColorHex"].toString("#007AFF");
    m_pinned = SyncJson::toBool(json["isPinned"]);
    m_sortOrder = json["sortOrder"].toInt(0);

    QDateTime created = SyncDate::fromString(json["createdAt"].toString());
    if (created.isValid()) {
        m_createdAt = created;
    }

    m_instanceIds = SyncJson::idsFromJson(json["instanceIDs"]);
    m_atomTemplateIds = SyncJson::idsFromJson(json["atomTemplateIDs"]);
    return true;
}

} // namespace RecordSync
