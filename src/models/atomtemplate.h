#ifndef ATOMTEMPLATE_H
#define ATOMTEMPLATE_H

#include <QDateTime>
#include <QString>
#include <QUuid>
#include <optional>

#include "../sync/syncablerecord.h"

namespace RecordSync {

/**
 * @brief A single tracked step inside a MoleculeTemplate
 */
class AtomTemplate : public SyncableRecord
{
public:
    static const QString EntityType;

    explicit AtomTemplate(const QUuid &id = QUuid::createUuid());

    // ========== SyncableRecord ==========

    QUuid syncId() const override { return m_id; }
    QString entityType() const override { return EntityType; }
    RecordClass recordClass() const override { return RecordClass::Template; }
    QDateTime createdAt() const override { return m_createdAt; }

    QDateTime lastModified() const override { return m_lastModified; }
    void setLastModified(const QDateTime &dateTime) override { m_lastModified = dateTime; }

    bool isDeleted() const override { return m_deleted; }
    void setDeleted(bool deleted) override;

    QByteArray toSyncJson() const override;
    bool applySyncJson(const QJsonObject &json) override;

    // ========== Fields ==========

    QString title() const { return m_title; }
    void setTitle(const QString &title);

    /**
     * @brief "binary", "counter", "value", "timer", ...
     */
    QString inputType() const { return m_inputType; }
    void setInputType(const QString &type);

    std::optional<double> targetValue() const { return m_targetValue; }
    void setTargetValue(std::optional<double> value);

    QString unit() const { return m_unit; }
    void setUnit(const QString &unit);

    int order() const { return m_order; }
    void setOrder(int order);

    std::optional<int> targetSets() const { return m_targetSets; }
    void setTargetSets(std::optional<int> sets);

    std::optional<int> targetReps() const { return m_targetReps; }
    void setTargetReps(std::optional<int> reps);

    /**
     * @brief Rest between sets, in seconds
     */
    std::optional<double> defaultRestTime() const { return m_defaultRestTime; }
    void setDefaultRestTime(std::optional<double> seconds);

    QString videoUrl() const { return m_videoUrl; }
    void setVideoUrl(const QString &url);

    QString iconSymbol() const { return m_iconSymbol; }
    void setIconSymbol(const QString &symbol);

    QString iconFrame() const { return m_iconFrame; }
    void setIconFrame(const QString &frame);

    QString themeColorHex() const { return m_themeColorHex; }
    void setThemeColorHex(const QString &hex);

    void setCreatedAt(const QDateTime &createdAt) { m_createdAt = createdAt; }

    // ========== Relationships ==========

    QUuid parentTemplateId() const { return m_parentTemplateId; }
    void setParentTemplateId(const QUuid &id);

private:
    void touch();

    QUuid m_id;
    QString m_title;
    QString m_inputType = "binary";
    std::optional<double> m_targetValue;
    QString m_unit;
    int m_order = 0;
    std::optional<int> m_targetSets;
    std::optional<int> m_targetReps;
    std::optional<double> m_defaultRestTime;
    QString m_videoUrl;
    QString m_iconSymbol;
    QString m_iconFrame = "circle";
    QString m_themeColorHex = "#007AFF";
    QDateTime m_createdAt;
    QDateTime m_lastModified;
    bool m_deleted = false;

    QUuid m_parentTemplateId;
};

} // namespace RecordSync

#endif // ATOMTEMPLATE_H
