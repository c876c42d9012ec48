#ifndef DEVICEREGISTRY_H
#define DEVICEREGISTRY_H

#include <QString>
#include <QDateTime>
#include <QList>
#include <QByteArray>
#include <QJsonObject>
#include <optional>

#include "synctypes.h"

namespace RecordSync {

class DeviceIdentity;

/**
 * @brief One device that has synced this account
 */
struct RegisteredDevice {
    QString deviceId;
    QString deviceName;
    QString deviceType;
    bool isSimulator = false;
    QDateTime firstSyncDate;
    QDateTime lastSyncDate;
    bool isPrimary = false;

    bool isValid() const { return !deviceId.isEmpty(); }

    QJsonObject toJson() const;
    static RegisteredDevice fromJson(const QJsonObject &json);
};

/**
 * @brief Shared ledger of devices, stored remotely as device_registry.json
 *
 * Fetched and rewritten whole on every pass. Only registerDevice() mutates
 * it.
 */
class DeviceRegistry
{
public:
    static const QString ObjectName;

    DeviceRegistry();

    bool isDeviceRegistered(const QString &deviceId) const;

    /**
     * @brief Most recently synced device that is not @p deviceId and not a simulator
     */
    std::optional<RegisteredDevice> lastOtherDevice(const QString &deviceId) const;

    /**
     * @brief Insert or refresh a device
     *
     * Known devices get lastSyncDate = @p now. New devices are appended and
     * become primary if the registry was empty. Always stamps
     * lastModifiedBy/lastModifiedAt.
     */
    void registerDevice(const DeviceIdentity &identity, const QDateTime &now);
    void registerDevice(const DeviceIdentity &identity);

    /**
     * @brief Apply the conflict rule for a device about to sync
     * @param localRecordCount Reported to the user alongside the other device
     * @return Conflict details, or an invalid ConflictInfo if there is no conflict
     */
    ConflictInfo detectConflict(const QString &deviceId, int localRecordCount = 0) const;

    QList<RegisteredDevice> devices() const { return m_devices; }
    bool isEmpty() const { return m_devices.isEmpty(); }
    QString lastModifiedBy() const { return m_lastModifiedBy; }
    QDateTime lastModifiedAt() const { return m_lastModifiedAt; }

    // ========== Serialization ==========

    QJsonObject toJson() const;
    QByteArray toDocument() const;

    /**
     * @brief Parse a registry document
     * @param ok Set to false when the data is not a registry (result is empty)
     */
    static DeviceRegistry fromJson(const QJsonObject &json);
    static DeviceRegistry fromDocument(const QByteArray &data, bool *ok = nullptr);

private:
    QList<RegisteredDevice> m_devices;
    QString m_lastModifiedBy;
    QDateTime m_lastModifiedAt;
};

} // namespace RecordSync

#endif // DEVICEREGISTRY_H
