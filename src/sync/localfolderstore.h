#ifndef LOCALFOLDERSTORE_H
#define LOCALFOLDERSTORE_H

#include "objectstore.h"
#include <QString>

namespace RecordSync {

/**
 * @brief Object store over a plain directory
 *
 *   <basePath>/
 *   ├── device_registry.json
 *   └── Records/
 *       ├── MoleculeTemplate_<ID>.json
 *       └── MoleculeInstance_<ID>.json
 *
 * Point it at a folder a drive client mirrors and several machines can
 * share one account. Writes go through QSaveFile so a reader never sees
 * half an object. File modification times stand in for server times.
 */
class LocalFolderObjectStore : public RemoteObjectStore
{
    Q_OBJECT

public:
    explicit LocalFolderObjectStore(const QString &basePath, QObject *parent = nullptr);
    ~LocalFolderObjectStore() override = default;

    QString storeId() const override { return "local-folder"; }
    QString displayName() const override;
    bool isAvailable() const override;

    QList<RemoteObjectInfo> listObjects(const QString &folder, bool *ok = nullptr) override;
    bool readObject(const QString &path, QByteArray &data) override;
    bool writeObject(const QString &path, const QByteArray &data) override;
    bool hasObject(const QString &path) const override;

    QString basePath() const { return m_basePath; }

    /**
     * @brief Create the base directory if missing
     */
    bool ensureBasePath();

private:
    QString absolutePath(const QString &path) const;
    bool isSafePath(const QString &path) const;

    QString m_basePath;
};

} // namespace RecordSync

#endif // LOCALFOLDERSTORE_H
