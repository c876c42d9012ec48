#include "atomtemplate.h"

#include <QDebug>

namespace RecordSync {

const QString AtomTemplate::EntityType = "AtomTemplate";

namespace {

std::optional<int> optionalInt(const QJsonValue &value)
{
    if (value.isDouble()) {
        return value.toInt();
    }
    return std::nullopt;
}

std::optional<double> optionalDouble(const QJsonValue &value)
{
    if (value.isDouble()) {
        return value.toDouble();
    }
    return std::nullopt;
}

QString optionalString(const QJsonObject &json, const QString &key)
{
    return json.contains(key) ? json[key].toString() : QString();
}

} // namespace

AtomTemplate::AtomTemplate(const QUuid &id)
    : m_id(id)
    , m_createdAt(SyncDate::now())
    , m_lastModified(m_createdAt)
{
}

void AtomTemplate::touch()
{
    m_lastModified = SyncDate::now();
}

void AtomTemplate::setDeleted(bool deleted)
{
    m_deleted = deleted;
    touch();
}

void AtomTemplate::setTitle(const QString &title) { m_title = title; touch(); }
void AtomTemplate::setInputType(const QString &type) { m_inputType = type; touch(); }
void AtomTemplate::setTargetValue(std::optional<double> value) { m_targetValue = value; touch(); }
void AtomTemplate::setUnit(const QString &unit) { m_unit = unit; touch(); }
void AtomTemplate::setOrder(int order) { m_order = order; touch(); }
void AtomTemplate::setTargetSets(std::optional<int> sets) { m_targetSets = sets; touch(); }
void AtomTemplate::setTargetReps(std::optional<int> reps) { m_targetReps = reps; touch(); }
void AtomTemplate::setDefaultRestTime(std::optional<double> seconds) { m_defaultRestTime = seconds; touch(); }
void AtomTemplate::setVideoUrl(const QString &url) { m_videoUrl = url; touch(); }
void AtomTemplate::setIconSymbol(const QString &symbol) { m_iconSymbol = symbol; touch(); }
void AtomTemplate::setIconFrame(const QString &frame) { m_iconFrame = frame; touch(); }
void AtomTemplate::setThemeColorHex(const QString &hex) { m_themeColorHex = hex; touch(); }
void AtomTemplate::setParentTemplateId(const QUuid &id) { m_parentTemplateId = id; touch(); }

QByteArray AtomTemplate::toSyncJson() const
{
    if (m_id.isNull() || !m_lastModified.isValid()) {
        qWarning() << "[AtomTemplate] Cannot encode record without identity or timestamp";
        return QByteArray();
    }

    QJsonObject json = baseSyncJson();
    json["title"] = m_title;
    json["inputType"] = m_inputType;
    json["order"] = m_order;
    json["iconFrameRaw"] = m_iconFrame;
    json["themeColorHex"] = m_themeColorHex;
    json["createdAt"] = SyncDate::toString(m_createdAt);

    if (m_targetValue) json["targetValue"] = *m_targetValue;
    if (m_targetSets) json["targetSets"] = *m_targetSets;
    if (m_targetReps) json["targetReps"] = *m_targetReps;
    if (m_defaultRestTime) json["defaultRestTime"] = *m_defaultRestTime;
    if (!m_unit.isNull()) json["unit"] = m_unit;
    if (!m_videoUrl.isNull()) json["videoURL"] = m_videoUrl;
    if (!m_iconSymbol.isNull()) json["iconSymbol"] = m_iconSymbol;

    if (!m_parentTemplateId.isNull()) {
        json["moleculeTemplateID"] = SyncJson::idToString(m_parentTemplateId);
    }

    return SyncJson::encode(json);
}

bool AtomTemplate::applySyncJson(const QJsonObject &json)
{
    if (!json.contains("title")) {
        qWarning() << "[AtomTemplate] Missing required fields in" << storageKey();
        return false;
    }
    if (!applyBaseSyncJson(json)) {
        return false;
    }

    m_title = json["title"].toString();
    m_inputType = json["inputType"].toString("binary");
    m_targetValue = optionalDouble(json["targetValue"]);
    m_unit = optionalString(json, "unit");
    m_order = json["order"].toInt(0);
    m_targetSets = optionalInt(json["targetSets"]);
    m_targetReps = optionalInt(json["targetReps"]);
    m_defaultRestTime = optionalDouble(json["defaultRestTime"]);
    m_videoUrl = optionalString(json, "videoURL");
    m_iconSymbol = optionalString(json, "iconSymbol");
    m_iconFrame = json["iconFrameRaw"].toString("circle");
    m_themeColorHex = json["themeColorHex"].toString("#007AFF");

    QDateTime created = SyncDate::fromString(json["createdAt"].toString());
    if (created.isValid()) {
        m_createdAt = created;
    }

    m_parentTemplateId = SyncJson::idFromString(json["moleculeTemplateID"].toString());
    return true;
}

} // namespace RecordSync
