#include "localfolderstore.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QDebug>

namespace RecordSync {

LocalFolderObjectStore::LocalFolderObjectStore(const QString &basePath, QObject *parent)
    : RemoteObjectStore(parent)
    , m_basePath(QDir::cleanPath(basePath))
{
}

QString LocalFolderObjectStore::displayName() const
{
    return QString("Folder %1").arg(QDir::toNativeSeparators(m_basePath));
}

bool LocalFolderObjectStore::isAvailable() const
{
    if (m_basePath.isEmpty()) {
        return false;
    }
    QFileInfo info(m_basePath);
    return info.exists() && info.isDir() && info.isWritable();
}

bool LocalFolderObjectStore::ensureBasePath()
{
    if (m_basePath.isEmpty()) {
        setError("No remote folder configured");
        return false;
    }
    if (!QDir().mkpath(m_basePath)) {
        setError(QString("Failed to create remote folder: %1").arg(m_basePath));
        return false;
    }
    return true;
}

// ========== Object Operations ==========

QList<RemoteObjectInfo> LocalFolderObjectStore::listObjects(const QString &folder, bool *ok)
{
    QList<RemoteObjectInfo> objects;

    if (!isAvailable()) {
        setError(QString("Remote folder not available: %1").arg(m_basePath));
        if (ok) *ok = false;
        return objects;
    }
    if (!isSafePath(folder)) {
        setError(QString("Invalid folder: %1").arg(folder));
        if (ok) *ok = false;
        return objects;
    }

    QDir dir(absolutePath(folder));
    if (!dir.exists()) {
        // Nothing uploaded yet
        if (ok) *ok = true;
        return objects;
    }

    const QFileInfoList entries = dir.entryInfoList(QStringList() << "*.json",
                                                    QDir::Files, QDir::Name);
    for (const QFileInfo &entry : entries) {
        RemoteObjectInfo info;
        info.name = entry.fileName();
        info.modifiedTime = entry.lastModified().toUTC();
        info.size = entry.size();
        objects.append(info);
    }

    if (ok) *ok = true;
    return objects;
}

bool LocalFolderObjectStore::readObject(const QString &path, QByteArray &data)
{
    if (!isSafePath(path)) {
        setError(QString("Invalid object path: %1").arg(path));
        return false;
    }

    QFile file(absolutePath(path));
    if (!file.exists()) {
        setError(QString("Object not found: %1").arg(path));
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        setError(QString("Failed to open object %1: %2").arg(path, file.errorString()));
        return false;
    }

    data = file.readAll();
    return true;
}

bool LocalFolderObjectStore::writeObject(const QString &path, const QByteArray &data)
{
    if (!isSafePath(path)) {
        setError(QString("Invalid object path: %1").arg(path));
        return false;
    }
    if (!isAvailable()) {
        setError(QString("Remote folder not available: %1").arg(m_basePath));
        return false;
    }

    const QString filePath = absolutePath(path);
    if (!QDir().mkpath(QFileInfo(filePath).absolutePath())) {
        setError(QString("Failed to create folder for %1").arg(path));
        return false;
    }

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        setError(QString("Failed to open %1 for writing: %2").arg(path, file.errorString()));
        return false;
    }
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        setError(QString("Failed to write %1: %2").arg(path, file.errorString()));
        return false;
    }
    if (!file.commit()) {
        setError(QString("Failed to commit %1: %2").arg(path, file.errorString()));
        return false;
    }
    return true;
}

bool LocalFolderObjectStore::hasObject(const QString &path) const
{
    return isSafePath(path) && QFile::exists(absolutePath(path));
}

// ========== Private ==========

QString LocalFolderObjectStore::absolutePath(const QString &path) const
{
    if (path.isEmpty()) {
        return m_basePath;
    }
    return QDir(m_basePath).filePath(path);
}

bool LocalFolderObjectStore::isSafePath(const QString &path) const
{
    // Object names never climb out of the sync folder
    if (QDir::isAbsolutePath(path)) {
        return false;
    }
    const QStringList parts = path.split('/', Qt::SkipEmptyParts);
    for (const QString &part : parts) {
        if (part == "..") {
            return false;
        }
    }
    return true;
}

} // namespace RecordSync
