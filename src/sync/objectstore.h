#ifndef OBJECTSTORE_H
#define OBJECTSTORE_H

#include <QObject>
#include <QString>
#include <QList>
#include <QByteArray>
#include <QDateTime>

namespace RecordSync {

/**
 * @brief Metadata for one remote object
 */
struct RemoteObjectInfo {
    QString name;               ///< Object name within its folder ("MoleculeInstance_<ID>.json")
    QDateTime modifiedTime;     ///< Server-side modification time
    qint64 size = 0;
};

/**
 * @brief Abstract interface to the remote object store
 *
 * Objects are addressed by '/'-separated paths relative to the account's
 * sync folder, e.g. "Records/MoleculeInstance_<ID>.json" or
 * "device_registry.json". Implementations might be:
 *   - LocalFolderObjectStore: a directory, possibly mirrored by a drive client
 *   - A cloud drive REST client
 *
 * Every operation reports failure through its return value; details are
 * available from lastError() and errorOccurred().
 */
class RemoteObjectStore : public QObject
{
    Q_OBJECT

public:
    explicit RemoteObjectStore(QObject *parent = nullptr) : QObject(parent) {}
    virtual ~RemoteObjectStore() = default;

    // ========== Store Identity ==========

    /**
     * @brief Short identifier for logs ("local-folder")
     */
    virtual QString storeId() const = 0;

    /**
     * @brief Human-readable location
     */
    virtual QString displayName() const = 0;

    /**
     * @brief Check if the store can be reached right now
     */
    virtual bool isAvailable() const = 0;

    // ========== Object Operations ==========

    /**
     * @brief List the objects directly inside a folder
     * @param ok Set to false if the listing itself failed
     */
    virtual QList<RemoteObjectInfo> listObjects(const QString &folder, bool *ok = nullptr) = 0;

    /**
     * @brief Read an object
     * @return false if missing or unreadable
     */
    virtual bool readObject(const QString &path, QByteArray &data) = 0;

    /**
     * @brief Create or overwrite an object
     */
    virtual bool writeObject(const QString &path, const QByteArray &data) = 0;

    virtual bool hasObject(const QString &path) const = 0;

    QString lastError() const { return m_lastError; }

signals:
    void errorOccurred(const QString &error);

protected:
    void setError(const QString &error) {
        m_lastError = error;
        emit errorOccurred(error);
    }

private:
    QString m_lastError;
};

} // namespace RecordSync

#endif // OBJECTSTORE_H
