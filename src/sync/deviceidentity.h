#ifndef DEVICEIDENTITY_H
#define DEVICEIDENTITY_H

#include <QString>
#include <QJsonObject>
#include <QVariantMap>

namespace RecordSync {

enum class DeviceType {
    Phone,
    Tablet,
    Simulator,
    Unknown
};

QString deviceTypeToString(DeviceType type);
DeviceType deviceTypeFromString(const QString &value);

/**
 * @brief Descriptive facts about the machine we run on
 */
struct DeviceInfo {
    QString name;
    DeviceType type = DeviceType::Unknown;
    bool simulator = false;

    /**
     * @brief Detect from the platform
     *
     * Name from QSysInfo::machineHostName(), type from
     * QSysInfo::productType() and the name. QRECORDSYNC_SIMULATOR=1 in the
     * environment marks a development build as a simulator, and
     * QRECORDSYNC_DEVICE_TYPE=Phone|Tablet overrides the detected type.
     */
    static DeviceInfo detect();

    /**
     * @brief Device type for a mobile platform and model or device name
     *
     * Desktop platforms are Unknown.
     */
    static DeviceType typeForPlatform(const QString &productType, const QString &model);
};

/**
 * @brief Durable key-value store for secrets that must survive reinstalls
 */
class SecureStore
{
public:
    virtual ~SecureStore() = default;

    /**
     * @brief Read a value
     * @return false if the key is not present or the store is unreadable
     */
    virtual bool read(const QString &key, QString &value) const = 0;

    virtual bool write(const QString &key, const QString &value) = 0;
    virtual bool remove(const QString &key) = 0;

    virtual QString lastError() const = 0;
};

/**
 * @brief SecureStore backed by a JSON file readable only by its owner
 */
class FileSecureStore : public SecureStore
{
public:
    explicit FileSecureStore(const QString &filePath);

    bool read(const QString &key, QString &value) const override;
    bool write(const QString &key, const QString &value) override;
    bool remove(const QString &key) override;
    QString lastError() const override { return m_lastError; }

    QString filePath() const { return m_filePath; }

private:
    bool loadAll(QJsonObject &values) const;
    bool saveAll(const QJsonObject &values);

    QString m_filePath;
    mutable QString m_lastError;
};

/**
 * @brief Stable identity of this installation
 *
 * The device ID is created once and kept in a SecureStore. The first ID is
 * derived from the hardware identifier so a wiped store on the same machine
 * comes back with the same ID; machines without one get a random UUID.
 */
class DeviceIdentity
{
public:
    static const QString StoreKey;

    explicit DeviceIdentity(SecureStore &store, const DeviceInfo &info = DeviceInfo::detect());

    /**
     * @brief Identity with a known ID (restored profiles, tests)
     */
    DeviceIdentity(const QString &deviceId, const DeviceInfo &info);

    QString deviceId() const { return m_deviceId; }
    QString deviceName() const { return m_info.name; }
    DeviceType deviceType() const { return m_info.type; }
    bool isSimulator() const { return m_info.simulator; }

    /**
     * @brief {deviceID, deviceName, deviceType, isSimulator}
     */
    QVariantMap toVariantMap() const;
    QJsonObject toJson() const;

    /**
     * @brief "Name (Type)", or "Simulator"
     */
    QString shortDescription() const;

private:
    static QString getOrCreateDeviceId(SecureStore &store);

    QString m_deviceId;
    DeviceInfo m_info;
};

} // namespace RecordSync

#endif // DEVICEIDENTITY_H
