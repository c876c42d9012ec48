/**
 * @file test_deviceregistry.cpp
 * @brief Unit tests for DeviceRegistry
 *
 * Tests registration, the multi-device conflict rule and the registry
 * document format.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QJsonArray>
#include "sync/deviceregistry.h"
#include "sync/deviceidentity.h"

using namespace RecordSync;

class TestDeviceRegistry : public QObject
{
    Q_OBJECT

private slots:
    // ========== Registration Tests ==========
    void testEmptyRegistry();
    void testFirstDeviceIsPrimary();
    void testSecondDeviceNotPrimary();
    void testRegisterIsIdempotent();
    void testRegisterStampsModification();

    // ========== Last Other Device Tests ==========
    void testLastOtherDevicePicksMostRecent();
    void testLastOtherDeviceSkipsSimulators();
    void testLastOtherDeviceNone();

    // ========== Conflict Detection Tests ==========
    void testConflictEmptyRegistry();
    void testConflictSimulatorOnly();
    void testConflictForeignDevice();
    void testConflictCurrentDevicePresent();

    // ========== Serialization Tests ==========
    void testDocumentFormat();
    void testDocumentRoundTrip();
    void testFromDocumentMalformed();
    void testFromJsonDropsDuplicatesAndInvalid();

private:
    static DeviceIdentity device(const QString &id, const QString &name, bool simulator = false);
};

DeviceIdentity TestDeviceRegistry::device(const QString &id, const QString &name, bool simulator)
{
    DeviceInfo info;
    info.name = name;
    info.type = simulator ? DeviceType::Simulator : DeviceType::Phone;
    info.simulator = simulator;
    return DeviceIdentity(id, info);
}

// ========== Registration Tests ==========

void TestDeviceRegistry::testEmptyRegistry()
{
    DeviceRegistry registry;
    QVERIFY(registry.isEmpty());
    QVERIFY(!registry.isDeviceRegistered("DEVICE-A"));
}

void TestDeviceRegistry::testFirstDeviceIsPrimary()
{
    DeviceRegistry registry;
    QDateTime now = QDateTime::currentDateTimeUtc();
    registry.registerDevice(device("DEVICE-A", "Phone A"), now);

    QCOMPARE(registry.devices().size(), 1);
    RegisteredDevice a = registry.devices().first();
    QCOMPARE(a.deviceId, QString("DEVICE-A"));
    QCOMPARE(a.deviceName, QString("Phone A"));
    QCOMPARE(a.deviceType, QString("Phone"));
    QVERIFY(a.isPrimary);
    QCOMPARE(a.firstSyncDate, now);
    QCOMPARE(a.lastSyncDate, now);
}

void TestDeviceRegistry::testSecondDeviceNotPrimary()
{
    DeviceRegistry registry;
    registry.registerDevice(device("DEVICE-A", "Phone A"));
    registry.registerDevice(device("DEVICE-B", "Phone B"));

    QCOMPARE(registry.devices().size(), 2);
    QVERIFY(registry.devices().at(0).isPrimary);
    QVERIFY(!registry.devices().at(1).isPrimary);
}

void TestDeviceRegistry::testRegisterIsIdempotent()
{
    DeviceRegistry registry;
    QDateTime first = QDateTime::currentDateTimeUtc().addDays(-1);
    QDateTime later = first.addSecs(3600);

    registry.registerDevice(device("DEVICE-A", "Phone A"), first);
    registry.registerDevice(device("DEVICE-A", "Phone A"), later);

    QCOMPARE(registry.devices().size(), 1);
    RegisteredDevice a = registry.devices().first();
    QCOMPARE(a.firstSyncDate, first);
    QCOMPARE(a.lastSyncDate, later);
    QVERIFY(a.isPrimary);
}

void TestDeviceRegistry::testRegisterStampsModification()
{
    DeviceRegistry registry;
    QDateTime now = QDateTime::currentDateTimeUtc();
    registry.registerDevice(device("DEVICE-B", "Phone B"), now);

    QCOMPARE(registry.lastModifiedBy(), QString("DEVICE-B"));
    QCOMPARE(registry.lastModifiedAt(), now);
}

// ========== Last Other Device Tests ==========

void TestDeviceRegistry::testLastOtherDevicePicksMostRecent()
{
    DeviceRegistry registry;
    QDateTime now = QDateTime::currentDateTimeUtc();
    registry.registerDevice(device("DEVICE-A", "Phone A"), now.addDays(-2));
    registry.registerDevice(device("DEVICE-B", "Tablet B"), now.addDays(-1));
    registry.registerDevice(device("DEVICE-C", "Phone C"), now);

    std::optional<RegisteredDevice> other = registry.lastOtherDevice("DEVICE-C");
    QVERIFY(other.has_value());
    QCOMPARE(other->deviceId, QString("DEVICE-B"));
}

void TestDeviceRegistry::testLastOtherDeviceSkipsSimulators()
{
    DeviceRegistry registry;
    QDateTime now = QDateTime::currentDateTimeUtc();
    registry.registerDevice(device("DEVICE-A", "Phone A"), now.addDays(-2));
    registry.registerDevice(device("SIM-1", "Simulator", true), now);

    std::optional<RegisteredDevice> other = registry.lastOtherDevice("DEVICE-X");
    QVERIFY(other.has_value());
    QCOMPARE(other->deviceId, QString("DEVICE-A"));
}

void TestDeviceRegistry::testLastOtherDeviceNone()
{
    DeviceRegistry registry;
    registry.registerDevice(device("DEVICE-A", "Phone A"));

    QVERIFY(!registry.lastOtherDevice("DEVICE-A").has_value());
}

// ========== Conflict Detection Tests ==========

void TestDeviceRegistry::testConflictEmptyRegistry()
{
    DeviceRegistry registry;
    QVERIFY(!registry.detectConflict("DEVICE-A").isValid());
}

void TestDeviceRegistry::testConflictSimulatorOnly()
{
    DeviceRegistry registry;
    registry.registerDevice(device("SIM-1", "Simulator", true));
    registry.registerDevice(device("SIM-2", "Simulator", true));

    QVERIFY(!registry.detectConflict("DEVICE-A").isValid());
}

void TestDeviceRegistry::testConflictForeignDevice()
{
    DeviceRegistry registry;
    QDateTime lastSync = QDateTime::currentDateTimeUtc().addSecs(-600);
    registry.registerDevice(device("DEVICE-A", "Phone A"), lastSync);

    ConflictInfo conflict = registry.detectConflict("DEVICE-B", 12);
    QVERIFY(conflict.isValid());
    QCOMPARE(conflict.otherDeviceId, QString("DEVICE-A"));
    QCOMPARE(conflict.otherDeviceName, QString("Phone A"));
    QCOMPARE(conflict.otherDeviceLastSync, lastSync);
    QCOMPARE(conflict.localRecordCount, 12);
    QVERIFY(!conflict.isOtherDeviceSimulator);
}

void TestDeviceRegistry::testConflictCurrentDevicePresent()
{
    DeviceRegistry registry;
    registry.registerDevice(device("DEVICE-A", "Phone A"));
    registry.registerDevice(device("DEVICE-B", "Phone B"));
    registry.registerDevice(device("DEVICE-C", "Phone C"));

    QVERIFY(!registry.detectConflict("DEVICE-B").isValid());
}

// ========== Serialization Tests ==========

void TestDeviceRegistry::testDocumentFormat()
{
    DeviceRegistry registry;
    registry.registerDevice(device("DEVICE-A", "Phone A"));

    QJsonObject json = registry.toJson();
    QVERIFY(json["registeredDevices"].isArray());
    QCOMPARE(json["lastModifiedBy"].toString(), QString("DEVICE-A"));
    QVERIFY(SyncDate::fromString(json["lastModifiedAt"].toString()).isValid());

    QJsonObject entry = json["registeredDevices"].toArray().first().toObject();
    QCOMPARE(entry["deviceID"].toString(), QString("DEVICE-A"));
    QCOMPARE(entry["deviceType"].toString(), QString("Phone"));
    QCOMPARE(entry["isPrimary"].toBool(), true);
    QCOMPARE(entry["isSimulator"].toBool(), false);
}

void TestDeviceRegistry::testDocumentRoundTrip()
{
    DeviceRegistry registry;
    QDateTime now = QDateTime::fromString("2026-04-10T09:00:00.000Z", Qt::ISODateWithMs);
    registry.registerDevice(device("DEVICE-A", "Phone A"), now.addDays(-1));
    registry.registerDevice(device("SIM-1", "Simulator", true), now);

    bool ok = false;
    DeviceRegistry parsed = DeviceRegistry::fromDocument(registry.toDocument(), &ok);
    QVERIFY(ok);
    QCOMPARE(parsed.devices().size(), 2);
    QVERIFY(parsed.devices().at(1).isSimulator);
    QCOMPARE(parsed.devices().at(0).lastSyncDate, now.addDays(-1));
    QCOMPARE(parsed.lastModifiedBy(), QString("SIM-1"));
    QCOMPARE(parsed.lastModifiedAt(), now);
}

void TestDeviceRegistry::testFromDocumentMalformed()
{
    bool ok = true;
    DeviceRegistry parsed = DeviceRegistry::fromDocument("<<not json>>", &ok);
    QVERIFY(!ok);
    QVERIFY(parsed.isEmpty());
}

void TestDeviceRegistry::testFromJsonDropsDuplicatesAndInvalid()
{
    QJsonObject a;
    a["deviceID"] = "DEVICE-A";
    a["deviceName"] = "First";
    QJsonObject duplicate;
    duplicate["deviceID"] = "DEVICE-A";
    duplicate["deviceName"] = "Second";
    QJsonObject invalid;
    invalid["deviceName"] = "No ID";

    QJsonObject json;
    json["registeredDevices"] = QJsonArray{a, duplicate, invalid};

    DeviceRegistry registry = DeviceRegistry::fromJson(json);
    QCOMPARE(registry.devices().size(), 1);
    QCOMPARE(registry.devices().first().deviceName, QString("First"));
}

QTEST_MAIN(TestDeviceRegistry)
#include "test_deviceregistry.moc"
