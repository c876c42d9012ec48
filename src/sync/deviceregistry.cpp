#include "deviceregistry.h"
#include "deviceidentity.h"
#include "syncablerecord.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QDebug>

namespace RecordSync {

// ========== RegisteredDevice ==========

QJsonObject RegisteredDevice::toJson() const
{
    QJsonObject json;
    json["deviceID"] = deviceId;
    json["deviceName"] = deviceName;
    json["deviceType"] = deviceType;
    json["isSimulator"] = isSimulator;
    json["firstSyncDate"] = SyncDate::toString(firstSyncDate);
    json["lastSyncDate"] = SyncDate::toString(lastSyncDate);
    json["isPrimary"] = isPrimary;
    return json;
}

RegisteredDevice RegisteredDevice::fromJson(const QJsonObject &json)
{
    RegisteredDevice device;
    device.deviceId = json["deviceID"].toString();
    device.deviceName = json["deviceName"].toString();
    device.deviceType = json["deviceType"].toString();
    device.isSimulator = SyncJson::toBool(json["isSimulator"]);
    device.firstSyncDate = SyncDate::fromString(json["firstSyncDate"].toString());
    device.lastSyncDate = SyncDate::fromString(json["lastSyncDate"].toString());
    device.isPrimary = SyncJson::toBool(json["isPrimary"]);
    return device;
}

// ========== DeviceRegistry ==========

const QString DeviceRegistry::ObjectName = QStringLiteral("device_registry.json");

DeviceRegistry::DeviceRegistry()
    : m_lastModifiedAt(SyncDate::now())
{
}

bool DeviceRegistry::isDeviceRegistered(const QString &deviceId) const
{
    for (const RegisteredDevice &device : m_devices) {
        if (device.deviceId == deviceId) {
            return true;
        }
    }
    return false;
}

std::optional<RegisteredDevice> DeviceRegistry::lastOtherDevice(const QString &deviceId) const
{
    std::optional<RegisteredDevice> latest;
    for (const RegisteredDevice &device : m_devices) {
        if (device.deviceId == deviceId || device.isSimulator) {
            continue;
        }
        if (!latest || device.lastSyncDate > latest->lastSyncDate) {
            latest = device;
        }
    }
    return latest;
}

void DeviceRegistry::registerDevice(const DeviceIdentity &identity)
{
    registerDevice(identity, SyncDate::now());
}

void DeviceRegistry::registerDevice(const DeviceIdentity &identity, const QDateTime &now)
{
    bool found = false;
    for (RegisteredDevice &device : m_devices) {
        if (device.deviceId == identity.deviceId()) {
            device.lastSyncDate = now;
            found = true;
            break;
        }
    }

    if (!found) {
        RegisteredDevice device;
        device.deviceId = identity.deviceId();
        device.deviceName = identity.deviceName();
        device.deviceType = deviceTypeToString(identity.deviceType());
        device.isSimulator = identity.isSimulator();
        device.firstSyncDate = now;
        device.lastSyncDate = now;
        device.isPrimary = m_devices.isEmpty();
        m_devices.append(device);

        qDebug() << "[DeviceRegistry] Registered new device" << identity.shortDescription()
                 << (device.isPrimary ? "(primary)" : "");
    }

    m_lastModifiedBy = identity.deviceId();
    m_lastModifiedAt = now;
}

ConflictInfo DeviceRegistry::detectConflict(const QString &deviceId, int localRecordCount) const
{
    if (isDeviceRegistered(deviceId)) {
        return ConflictInfo();
    }

    std::optional<RegisteredDevice> other = lastOtherDevice(deviceId);
    if (!other) {
        // First real device for this account, or only simulators so far
        return ConflictInfo();
    }

    ConflictInfo info;
    info.otherDeviceId = other->deviceId;
    info.otherDeviceName = other->deviceName;
    info.otherDeviceLastSync = other->lastSyncDate;
    info.localRecordCount = localRecordCount;
    info.isOtherDeviceSimulator = other->isSimulator;
    return info;
}

// ========== Serialization ==========

QJsonObject DeviceRegistry::toJson() const
{
    QJsonArray devices;
    for (const RegisteredDevice &device : m_devices) {
        devices.append(device.toJson());
    }

    QJsonObject json;
    json["registeredDevices"] = devices;
    json["lastModifiedBy"] = m_lastModifiedBy;
    json["lastModifiedAt"] = SyncDate::toString(m_lastModifiedAt);
    return json;
}

QByteArray DeviceRegistry::toDocument() const
{
    return QJsonDocument(toJson()).toJson(QJsonDocument::Indented);
}

DeviceRegistry DeviceRegistry::fromJson(const QJsonObject &json)
{
    DeviceRegistry registry;
    const QJsonArray devices = json["registeredDevices"].toArray();
    for (const QJsonValue &value : devices) {
        RegisteredDevice device = RegisteredDevice::fromJson(value.toObject());
        if (!device.isValid() || registry.isDeviceRegistered(device.deviceId)) {
            continue;
        }
        registry.m_devices.append(device);
    }
    registry.m_lastModifiedBy = json["lastModifiedBy"].toString();

    QDateTime modifiedAt = SyncDate::fromString(json["lastModifiedAt"].toString());
    if (modifiedAt.isValid()) {
        registry.m_lastModifiedAt = modifiedAt;
    }
    return registry;
}

DeviceRegistry DeviceRegistry::fromDocument(const QByteArray &data, bool *ok)
{
    QJsonObject json;
    QString error;
    if (!SyncJson::decodeObject(data, json, &error)) {
        qWarning() << "[DeviceRegistry] Unreadable registry document:" << error;
        if (ok) *ok = false;
        return DeviceRegistry();
    }
    if (ok) *ok = true;
    return fromJson(json);
}

} // namespace RecordSync
