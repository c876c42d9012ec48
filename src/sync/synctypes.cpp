#include "synctypes.h"

namespace RecordSync {

QString recordClassToString(RecordClass recordClass)
{
    switch (recordClass) {
    case RecordClass::Instance: return "instance";
    case RecordClass::Template: return "template";
    }
    return "template";
}

RecordClass recordClassFromString(const QString &value)
{
    // Anything unrecognised is treated as a template so it never jumps the queue
    if (value == "instance") {
        return RecordClass::Instance;
    }
    return RecordClass::Template;
}

// ========== SyncStatus ==========

SyncStatus SyncStatus::syncing(const QString &message)
{
    SyncStatus status;
    status.m_kind = Kind::Syncing;
    status.m_message = message;
    return status;
}

SyncStatus SyncStatus::success(const QString &message)
{
    SyncStatus status;
    status.m_kind = Kind::Success;
    status.m_message = message;
    return status;
}

SyncStatus SyncStatus::failed(const QString &message)
{
    SyncStatus status;
    status.m_kind = Kind::Failed;
    status.m_message = message;
    return status;
}

SyncStatus SyncStatus::conflictDetected(const ConflictInfo &info)
{
    SyncStatus status;
    status.m_kind = Kind::ConflictDetected;
    status.m_conflict = info;
    return status;
}

QString SyncStatus::message() const
{
    switch (m_kind) {
    case Kind::Idle:
        return QString();
    case Kind::ConflictDetected:
        return QString("Conflict with %1").arg(m_conflict.otherDeviceName);
    case Kind::Syncing:
    case Kind::Success:
    case Kind::Failed:
        return m_message;
    }
    return QString();
}

bool SyncStatus::operator==(const SyncStatus &other) const
{
    if (m_kind != other.m_kind) {
        return false;
    }
    switch (m_kind) {
    case Kind::Idle:
        return true;
    case Kind::ConflictDetected:
        return m_conflict == other.m_conflict;
    case Kind::Syncing:
    case Kind::Success:
    case Kind::Failed:
        return m_message == other.m_message;
    }
    return false;
}

// ========== History enums ==========

QString syncActionToString(SyncAction action)
{
    switch (action) {
    case SyncAction::FullSync: return "fullSync";
    case SyncAction::ManualSync: return "manualSync";
    case SyncAction::ConflictResolution: return "conflictResolution";
    }
    return "fullSync";
}

SyncAction syncActionFromString(const QString &value)
{
    if (value == "manualSync") return SyncAction::ManualSync;
    if (value == "conflictResolution") return SyncAction::ConflictResolution;
    return SyncAction::FullSync;
}

QString syncOutcomeToString(SyncOutcome outcome)
{
    switch (outcome) {
    case SyncOutcome::Success: return "success";
    case SyncOutcome::PartialSuccess: return "partialSuccess";
    case SyncOutcome::Failed: return "failed";
    case SyncOutcome::Conflict: return "conflict";
    case SyncOutcome::Skipped: return "skipped";
    }
    return "skipped";
}

SyncOutcome syncOutcomeFromString(const QString &value)
{
    if (value == "success") return SyncOutcome::Success;
    if (value == "partialSuccess") return SyncOutcome::PartialSuccess;
    if (value == "failed") return SyncOutcome::Failed;
    if (value == "conflict") return SyncOutcome::Conflict;
    return SyncOutcome::Skipped;
}

} // namespace RecordSync
