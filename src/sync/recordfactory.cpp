#include "recordfactory.h"
#include "syncablerecord.h"

namespace RecordSync {

void RecordFactory::registerType(const QString &entityType, Creator creator)
{
    m_creators[entityType] = creator;
}

bool RecordFactory::hasType(const QString &entityType) const
{
    return m_creators.contains(entityType);
}

QStringList RecordFactory::types() const
{
    return m_creators.keys();
}

SyncableRecord* RecordFactory::create(const QString &entityType, const QUuid &id) const
{
    auto it = m_creators.constFind(entityType);
    if (it == m_creators.constEnd() || id.isNull()) {
        return nullptr;
    }
    return it.value()(id);
}

} // namespace RecordSync
