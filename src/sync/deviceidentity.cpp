#include "deviceidentity.h"
#include "syncablerecord.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QSaveFile>
#include <QSysInfo>
#include <QUuid>
#include <QDebug>

namespace RecordSync {

namespace {
// Namespace for name-based device IDs derived from the machine identifier
const QUuid DeviceNamespace("{6f1c2a4e-8d3b-5e7a-9c10-2b4d6e8fa013}");
}

QString deviceTypeToString(DeviceType type)
{
    switch (type) {
    case DeviceType::Phone:     return "Phone";
    case DeviceType::Tablet:    return "Tablet";
    case DeviceType::Simulator: return "Simulator";
    case DeviceType::Unknown:   return "Unknown";
    }
    return "Unknown";
}

DeviceType deviceTypeFromString(const QString &value)
{
    if (value == "Phone") return DeviceType::Phone;
    if (value == "Tablet") return DeviceType::Tablet;
    if (value == "Simulator") return DeviceType::Simulator;
    return DeviceType::Unknown;
}

// ========== DeviceInfo ==========

DeviceInfo DeviceInfo::detect()
{
    DeviceInfo info;
    info.name = QSysInfo::machineHostName();
    if (info.name.isEmpty()) {
        info.name = QSysInfo::prettyProductName();
    }

    if (qEnvironmentVariableIntValue("QRECORDSYNC_SIMULATOR") == 1) {
        info.simulator = true;
        info.type = DeviceType::Simulator;
        return info;
    }

    const DeviceType configured = deviceTypeFromString(qEnvironmentVariable("QRECORDSYNC_DEVICE_TYPE"));
    if (configured == DeviceType::Phone || configured == DeviceType::Tablet) {
        info.type = configured;
        return info;
    }

    info.type = typeForPlatform(QSysInfo::productType(), info.name);
    return info;
}

DeviceType DeviceInfo::typeForPlatform(const QString &productType, const QString &model)
{
    if (productType != "ios" && productType != "android") {
        return DeviceType::Unknown;
    }

    // iPadOS reports "ios"; the model or default device name tells them apart
    if (model.contains("iPad", Qt::CaseInsensitive)
            || model.contains("Tablet", Qt::CaseInsensitive)) {
        return DeviceType::Tablet;
    }
    return DeviceType::Phone;
}

// ========== FileSecureStore ==========

FileSecureStore::FileSecureStore(const QString &filePath)
    : m_filePath(filePath)
{
}

bool FileSecureStore::read(const QString &key, QString &value) const
{
    QJsonObject values;
    if (!loadAll(values) || !values.contains(key)) {
        return false;
    }
    value = values[key].toString();
    return true;
}

bool FileSecureStore::write(const QString &key, const QString &value)
{
    QJsonObject values;
    loadAll(values);
    values[key] = value;
    return saveAll(values);
}

bool FileSecureStore::remove(const QString &key)
{
    QJsonObject values;
    if (!loadAll(values)) {
        return false;
    }
    values.remove(key);
    return saveAll(values);
}

bool FileSecureStore::loadAll(QJsonObject &values) const
{
    QFile file(m_filePath);
    if (!file.exists()) {
        return false;
    }
    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = QString("Cannot read secure store: %1").arg(file.errorString());
        return false;
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        m_lastError = QString("Corrupt secure store: %1").arg(m_filePath);
        qWarning() << "[SecureStore]" << m_lastError;
        return false;
    }
    values = doc.object();
    return true;
}

bool FileSecureStore::saveAll(const QJsonObject &values)
{
    QDir().mkpath(QFileInfo(m_filePath).absolutePath());

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_lastError = QString("Cannot write secure store: %1").arg(file.errorString());
        qWarning() << "[SecureStore]" << m_lastError;
        return false;
    }
    // Restricted before the contents appear under the final name
    if (!file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner)) {
        m_lastError = QString("Cannot restrict secure store: %1").arg(file.errorString());
        qWarning() << "[SecureStore]" << m_lastError;
        file.cancelWriting();
        return false;
    }
    file.write(QJsonDocument(values).toJson(QJsonDocument::Compact));
    if (!file.commit()) {
        m_lastError = QString("Cannot commit secure store: %1").arg(file.errorString());
        qWarning() << "[SecureStore]" << m_lastError;
        return false;
    }
    return true;
}

// ========== DeviceIdentity ==========

const QString DeviceIdentity::StoreKey = QStringLiteral("deviceID");

DeviceIdentity::DeviceIdentity(SecureStore &store, const DeviceInfo &info)
    : m_deviceId(getOrCreateDeviceId(store))
    , m_info(info)
{
}

DeviceIdentity::DeviceIdentity(const QString &deviceId, const DeviceInfo &info)
    : m_deviceId(deviceId)
    , m_info(info)
{
}

QString DeviceIdentity::getOrCreateDeviceId(SecureStore &store)
{
    QString existing;
    if (store.read(StoreKey, existing) && !existing.isEmpty()) {
        return existing;
    }

    QUuid id;
    const QByteArray machineId = QSysInfo::machineUniqueId();
    if (!machineId.isEmpty()) {
        id = QUuid::createUuidV5(DeviceNamespace, machineId);
    } else {
        id = QUuid::createUuid();
    }

    const QString deviceId = SyncJson::idToString(id);
    if (!store.write(StoreKey, deviceId)) {
        // Still usable for this run; the next start derives the same ID
        // from the machine identifier when one exists
        qWarning() << "[DeviceIdentity] Could not persist device ID:" << store.lastError();
    }

    qDebug() << "[DeviceIdentity] Created device ID" << deviceId;
    return deviceId;
}

QVariantMap DeviceIdentity::toVariantMap() const
{
    QVariantMap map;
    map["deviceID"] = m_deviceId;
    map["deviceName"] = m_info.name;
    map["deviceType"] = deviceTypeToString(m_info.type);
    map["isSimulator"] = m_info.simulator;
    return map;
}

QJsonObject DeviceIdentity::toJson() const
{
    return QJsonObject::fromVariantMap(toVariantMap());
}

QString DeviceIdentity::shortDescription() const
{
    if (m_info.simulator) {
        return "Simulator";
    }
    return QString("%1 (%2)").arg(m_info.name, deviceTypeToString(m_info.type));
}

} // namespace RecordSync
