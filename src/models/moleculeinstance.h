#ifndef MOLECULEINSTANCE_H
#define MOLECULEINSTANCE_H

#include <QDateTime>
#include <QList>
#include <QString>
#include <QUuid>

#include "../sync/syncablerecord.h"

namespace RecordSync {

/**
 * @brief One scheduled occurrence of a MoleculeTemplate
 *
 * Instances carry completions, so they are the latency-sensitive class
 * and recent ones upload ahead of everything else.
 */
class MoleculeInstance : public SyncableRecord
{
public:
    static const QString EntityType;

    explicit MoleculeInstance(const QUuid &id = QUuid::createUuid());

    // ========== SyncableRecord ==========

    QUuid syncId() const override { return m_id; }
    QString entityType() const override { return EntityType; }
    RecordClass recordClass() const override { return RecordClass::Instance; }
    QDateTime createdAt() const override { return m_createdAt; }

    QDateTime lastModified() const override { return m_lastModified; }
    void setLastModified(const QDateTime &dateTime) override { m_lastModified = dateTime; }

    bool isDeleted() const override { return m_deleted; }
    void setDeleted(bool deleted) override;

    QByteArray toSyncJson() const override;
    bool applySyncJson(const QJsonObject &json) override;

    // ========== Fields ==========

    QDateTime scheduledDate() const { return m_scheduledDate; }
    void setScheduledDate(const QDateTime &date);

    bool isCompleted() const { return m_completed; }
    QDateTime completedAt() const { return m_completedAt; }

    /**
     * @brief Mark complete (stamps completedAt) or reopen (clears it)
     */
    void setCompleted(bool completed);

    bool isException() const { return m_exception; }
    void setException(bool exception);

    QString exceptionTitle() const { return m_exceptionTitle; }
    void setExceptionTitle(const QString &title);

    QDateTime exceptionTime() const { return m_exceptionTime; }
    void setExceptionTime(const QDateTime &time);

    QString notes() const { return m_notes; }
    void setNotes(const QString &notes);

    QDateTime originalScheduledDate() const { return m_originalScheduledDate; }
    void setOriginalScheduledDate(const QDateTime &date);

    QList<int> alertOffsets() const { return m_alertOffsets; }
    void setAlertOffsets(const QList<int> &offsets);

    bool isAllDay() const { return m_allDay; }
    void setAllDay(bool allDay);

    void setCreatedAt(const QDateTime &createdAt) { m_createdAt = createdAt; }

    // ========== Relationships ==========

    QUuid moleculeTemplateId() const { return m_templateId; }
    void setMoleculeTemplateId(const QUuid &id);

    QList<QUuid> atomInstanceIds() const { return m_atomInstanceIds; }
    void setAtomInstanceIds(const QList<QUuid> &ids);

private:
    void touch();

    QUuid m_id;
    QDateTime m_scheduledDate;
    bool m_completed = false;
    QDateTime m_completedAt;
    bool m_exception = false;
    QString m_exceptionTitle;
    QDateTime m_exceptionTime;
    QString m_notes;
    QDateTime m_originalScheduledDate;
    QList<int> m_alertOffsets{15};
    bool m_allDay = false;
    QDateTime m_createdAt;
    QDateTime m_lastModified;
    bool m_deleted = false;

    QUuid m_templateId;
    QList<QUuid> m_atomInstanceIds;
};

} // namespace RecordSync

#endif // MOLECULEINSTANCE_H
