#ifndef RECORDFACTORY_H
#define RECORDFACTORY_H

#include <QMap>
#include <QString>
#include <QStringList>
#include <QUuid>
#include <functional>

namespace RecordSync {

class SyncableRecord;

/**
 * @brief Creates empty records by entity type name
 *
 * Remote documents only carry their type in the object name, so the
 * store needs a way to materialise a record it has never seen.
 */
class RecordFactory
{
public:
    using Creator = std::function<SyncableRecord*(const QUuid &id)>;

    /**
     * @brief Register a creator for an entity type (replaces an existing one)
     */
    void registerType(const QString &entityType, Creator creator);

    bool hasType(const QString &entityType) const;
    QStringList types() const;

    /**
     * @brief Create an empty record
     * @return New record (caller takes ownership) or nullptr for unknown types
     */
    SyncableRecord* create(const QString &entityType, const QUuid &id) const;

private:
    QMap<QString, Creator> m_creators;
};

} // namespace RecordSync

#endif // RECORDFACTORY_H
