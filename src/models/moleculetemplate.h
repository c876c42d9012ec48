#ifndef MOLECULETEMPLATE_H
#define MOLECULETEMPLATE_H

#include <QDateTime>
#include <QList>
#include <QString>
#include <QUuid>
#include <optional>

#include "../sync/syncablerecord.h"

namespace RecordSync {

/**
 * @brief A recurring routine definition
 *
 * Templates are edited rarely and never jump the upload queue.
 * Children (generated instances and atom templates) are referenced by ID.
 */
class MoleculeTemplate : public SyncableRecord
{
public:
    static const QString EntityType;

    explicit MoleculeTemplate(const QUuid &id = QUuid::createUuid());

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

    QDateTime baseTime() const { return m_baseTime; }
    void setBaseTime(const QDateTime &time);

    QString recurrenceFreq() const { return m_recurrenceFreq; }
    void setRecurrenceFreq(const QString &freq);

    QList<int> recurrenceDays() const { return m_recurrenceDays; }
    void setRecurrenceDays(const QList<int> &days);

    QString endRuleType() const { return m_endRuleType; }
    void setEndRuleType(const QString &type);

    QDateTime endRuleDate() const { return m_endRuleDate; }
    void setEndRuleDate(const QDateTime &date);

    std::optional<int> endRuleCount() const { return m_endRuleCount; }
    void setEndRuleCount(std::optional<int> count);

    QString notes() const { return m_notes; }
    void setNotes(const QString &notes);

    QString compound() const { return m_compound; }
    void setCompound(const QString &compound);

    QList<int> alertOffsets() const { return m_alertOffsets; }
    void setAlertOffsets(const QList<int> &offsets);

    bool isAllDay() const { return m_allDay; }
    void setAllDay(bool allDay);

    QString iconSymbol() const { return m_iconSymbol; }
    void setIconSymbol(const QString &symbol);

    QString iconFrame() const { return m_iconFrame; }
    void setIconFrame(const QString &frame);

    QString themeColorHex() const { return m_themeColorHex; }
    void setThemeColorHex(const QString &hex);

    bool isPinned() const { return m_pinned; }
    void setPinned(bool pinned);

    int sortOrder() const { return m_sortOrder; }
    void setSortOrder(int order);

    void setCreatedAt(const QDateTime &createdAt) { m_createdAt = createdAt; }

    // ========== Relationships ==========

    QList<QUuid> instanceIds() const { return m_instanceIds; }
    void setInstanceIds(const QList<QUuid> &ids);

    QList<QUuid> atomTemplateIds() const { return m_atomTemplateIds; }
    void setAtomTemplateIds(const QList<QUuid> &ids);

private:
    void touch();

    QUuid m_id;
    QString m_title;
    QDateTime m_baseTime;
    QString m_recurrenceFreq = "daily";
    QList<int> m_recurrenceDays;
    QString m_endRuleType = "never";
    QDateTime m_endRuleDate;
    std::optional<int> m_endRuleCount;
    QString m_notes;
    QString m_compound;
    QList<int> m_alertOffsets{15};
    bool m_allDay = false;
    QString m_iconSymbol;
    QString m_iconFrame = "circle";
    QString m_themeColorHex = "#007AFF";
    bool m_pinned = false;
    int m_sortOrder = 0;
    QDateTime m_createdAt;
    QDateTime m_lastModified;
    bool m_deleted = false;

    QList<QUuid> m_instanceIds;
    QList<QUuid> m_atomTemplateIds;
};

} // namespace RecordSync

#endif // MOLECULETEMPLATE_H
