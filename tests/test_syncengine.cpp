/**
 * @file test_syncengine.cpp
 * @brief Unit tests for SyncEngine class
 *
 * Tests pass guards, the status lifecycle, device conflicts and their
 * resolution, and two devices sharing one remote folder.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QSignalSpy>
#include <QSemaphore>
#include <QDir>
#include "sync/syncengine.h"
#include "sync/recordconduit.h"
#include "sync/localfolderstore.h"
#include "sync/recordstore.h"
#include "sync/syncqueue.h"
#include "sync/syncstate.h"
#include "sync/synchistory.h"
#include "models/models.h"

using namespace RecordSync;

/**
 * @brief Folder store that holds every caller until the gate opens
 */
class GatedFolderStore : public LocalFolderObjectStore
{
public:
    explicit GatedFolderStore(const QString &basePath)
        : LocalFolderObjectStore(basePath)
    {
    }

    bool isAvailable() const override
    {
        m_entered.release();
        m_gate.acquire();
        m_gate.release();
        return LocalFolderObjectStore::isAvailable();
    }

    void waitUntilEntered() { m_entered.acquire(); }
    void open() { m_gate.release(); }

private:
    mutable QSemaphore m_entered;
    mutable QSemaphore m_gate;
};

/**
 * @brief Folder store that can refuse listings or registry writes
 */
class FaultyFolderStore : public LocalFolderObjectStore
{
public:
    explicit FaultyFolderStore(const QString &basePath)
        : LocalFolderObjectStore(basePath)
    {
    }

    QList<RemoteObjectInfo> listObjects(const QString &folder, bool *ok = nullptr) override
    {
        if (failListing) {
            setError("Listing refused");
            if (ok) *ok = false;
            return QList<RemoteObjectInfo>();
        }
        return LocalFolderObjectStore::listObjects(folder, ok);
    }

    bool writeObject(const QString &path, const QByteArray &data) override
    {
        if (failRegistryWrite && path == DeviceRegistry::ObjectName) {
            setError("Registry write refused");
            return false;
        }
        return LocalFolderObjectStore::writeObject(path, data);
    }

    bool failListing = false;
    bool failRegistryWrite = false;
};

/**
 * @brief Everything one installation owns: records, queue, state and an engine
 */
struct TestDevice
{
    TestDevice(const RecordFactory &factory, const QString &stateDir, const QString &deviceId,
               const QString &name, bool simulator = false)
        : records(factory)
    {
        SyncConfig config;
        config.cooldownSeconds = 0;
        config.statusDisplayMs = 20;
        config.retryBackoffMs = 0;
        config.maxAttemptsPerPass = 1;

        QObject::connect(&records, &RecordStore::recordChanged,
                         &queue, &SyncQueueManager::addToQueue);
        queue.setConfig(config);
        state.setStateDirectory(stateDir);
        history.setStoragePath(QDir(stateDir).filePath(SyncHistory::FileName));

        DeviceInfo info;
        info.name = name;
        info.type = simulator ? DeviceType::Simulator : DeviceType::Phone;
        info.simulator = simulator;

        engine.setConfig(config);
        engine.setRecordStore(&records);
        engine.setQueue(&queue);
        engine.setSyncState(&state);
        engine.setHistory(&history);
        engine.setIdentity(DeviceIdentity(deviceId, info));
        engine.setSignedInCheck([this]() { return signedIn; });
    }

    void useRemote(LocalFolderObjectStore *store)
    {
        auto *conduit = new RecordConduit(store);
        store->setParent(conduit);
        engine.setConduit(conduit);
    }

    void useRemote(const QString &remoteDir)
    {
        useRemote(new LocalFolderObjectStore(remoteDir));
    }

    MoleculeTemplate* addTemplate(const QString &title)
    {
        auto *molecule = new MoleculeTemplate();
        molecule->setTitle(title);
        return static_cast<MoleculeTemplate*>(records.insert(molecule));
    }

    bool signedIn = true;
    RecordStore records;
    SyncQueueManager queue;
    SyncState state;
    SyncHistory history;
    SyncEngine engine;      // last, so a running pass finishes before the rest goes
};

class TestSyncEngine : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Guard Tests ==========
    void testDefaultState();
    void testNotConfiguredSkips();
    void testSignedOutSkips();
    void testSimulatorSkips();
    void testCooldownSkipsLifecycleSync();
    void testBusySkips();
    void testPassHoldsEngineUntilFinished();

    // ========== Pass Tests ==========
    void testFirstSyncUploadsAndRegisters();
    void testSecondSyncUpToDate();
    void testStatusLifecycle();
    void testUnavailableStoreFails();
    void testListingFailureCommitsNothing();
    void testRegistryWriteFailureCommitsNothing();
    void testUnreadableRegistryFailsPass();
    void testFailedUploadIsPartialSuccess();
    void testOverflowUploadsEverything();

    // ========== Conflict Tests ==========
    void testConflictDetected();
    void testResolveUsingThisDevice();
    void testResolveUsingCloudData();
    void testSimulatorInRegistryIsNoConflict();

    // ========== Multi-Device Tests ==========
    void testTwoDevicesShareChanges();

private:
    static SyncResult waitFor(QFuture<SyncResult> future);
    static QStringList remoteRecords(const QString &remoteDir);
    static DeviceRegistry remoteRegistry(const QString &remoteDir);
    TestDevice* makeDevice(const QString &deviceId, const QString &name, bool simulator = false);

    QTemporaryDir *m_tempDir;
    QString m_remoteDir;
    RecordFactory m_factory;
    QList<TestDevice*> m_devices;
};

void TestSyncEngine::initTestCase()
{
    qDebug() << "Starting SyncEngine tests";
    registerModelTypes(m_factory);
}

void TestSyncEngine::cleanupTestCase()
{
    qDebug() << "SyncEngine tests complete";
}

void TestSyncEngine::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
    m_remoteDir = m_tempDir->filePath("remote");
    QVERIFY(QDir().mkpath(m_remoteDir));
}

void TestSyncEngine::cleanup()
{
    qDeleteAll(m_devices);
    m_devices.clear();
    delete m_tempDir;
    m_tempDir = nullptr;
}

SyncResult TestSyncEngine::waitFor(QFuture<SyncResult> future)
{
    future.waitForFinished();
    return future.result();
}

QStringList TestSyncEngine::remoteRecords(const QString &remoteDir)
{
    return QDir(QDir(remoteDir).filePath(RecordConduit::RecordsFolder))
        .entryList(QStringList() << "*.json", QDir::Files, QDir::Name);
}

DeviceRegistry TestSyncEngine::remoteRegistry(const QString &remoteDir)
{
    QFile file(QDir(remoteDir).filePath(DeviceRegistry::ObjectName));
    if (!file.open(QIODevice::ReadOnly)) {
        return DeviceRegistry();
    }
    return DeviceRegistry::fromDocument(file.readAll());
}

TestDevice* TestSyncEngine::makeDevice(const QString &deviceId, const QString &name, bool simulator)
{
    const QString stateDir = m_tempDir->filePath("state-" + deviceId);
    QDir().mkpath(stateDir);

    auto *device = new TestDevice(m_factory, stateDir, deviceId, name, simulator);
    device->useRemote(m_remoteDir);
    m_devices.append(device);
    return device;
}

// ========== Guard Tests ==========

void TestSyncEngine::testDefaultState()
{
    SyncEngine engine;
    QVERIFY(!engine.isSyncing());
    QVERIFY(engine.status().isIdle());
    QVERIFY(engine.conduit() == nullptr);
    QVERIFY(!engine.identity().has_value());
}

void TestSyncEngine::testNotConfiguredSkips()
{
    SyncEngine engine;
    QSignalSpy started(&engine, &SyncEngine::syncStarted);

    SyncResult result = waitFor(engine.forceSync());
    QCOMPARE(result.outcome, SyncOutcome::Skipped);
    QCOMPARE(result.action, SyncAction::ManualSync);
    QCOMPARE(result.message, QString("Sync is not configured"));
    QCOMPARE(started.count(), 0);
}

void TestSyncEngine::testSignedOutSkips()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    a->addTemplate("Stretch");
    a->signedIn = false;

    SyncResult result = waitFor(a->engine.forceSync());
    QCOMPARE(result.outcome, SyncOutcome::Skipped);
    QCOMPARE(result.message, QString("Not signed in"));
    QVERIFY(a->engine.status().isIdle());
    QCOMPARE(a->history.count(), 0);
    QCOMPARE(a->queue.count(), 1);
    QVERIFY(remoteRecords(m_remoteDir).isEmpty());
}

void TestSyncEngine::testSimulatorSkips()
{
    TestDevice *sim = makeDevice("SIM-1", "Simulator", true);
    sim->addTemplate("Stretch");

    SyncResult result = waitFor(sim->engine.performFullSyncSafely());
    QCOMPARE(result.outcome, SyncOutcome::Skipped);
    QVERIFY(remoteRegistry(m_remoteDir).isEmpty());
    QVERIFY(remoteRecords(m_remoteDir).isEmpty());
}

void TestSyncEngine::testCooldownSkipsLifecycleSync()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    SyncConfig config = a->engine.config();
    config.cooldownSeconds = 300;
    a->engine.setConfig(config);

    SyncResult first = waitFor(a->engine.performFullSyncSafely());
    QCOMPARE(first.outcome, SyncOutcome::Success);
    QVERIFY(a->state.lastForegroundSync().isValid());

    SyncResult second = waitFor(a->engine.performFullSyncSafely());
    QCOMPARE(second.outcome, SyncOutcome::Skipped);
    QCOMPARE(second.message, QString("Synced recently"));

    // A user request is not throttled
    SyncResult manual = waitFor(a->engine.forceSync());
    QCOMPARE(manual.outcome, SyncOutcome::Success);
}

void TestSyncEngine::testBusySkips()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    auto *gated = new GatedFolderStore(m_remoteDir);
    a->useRemote(gated);

    QFuture<SyncResult> running = a->engine.forceSync();
    gated->waitUntilEntered();
    QVERIFY(a->engine.isSyncing());

    SyncResult overlapping = waitFor(a->engine.forceSync());
    QCOMPARE(overlapping.outcome, SyncOutcome::Skipped);
    QCOMPARE(overlapping.message, QString("Sync already in progress"));

    gated->open();
    QCOMPARE(waitFor(running).outcome, SyncOutcome::Success);
}

void TestSyncEngine::testPassHoldsEngineUntilFinished()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    a->addTemplate("Stretch");

    // Runs on the worker, after Success is published but before history and syncFinished
    QList<QFuture<SyncResult>> requests;
    bool syncingAtSuccess = false;
    connect(&a->engine, &SyncEngine::statusChanged, &a->engine,
            [a, &requests, &syncingAtSuccess](const SyncStatus &status) {
        if (status.kind() == SyncStatus::Kind::Success && requests.isEmpty()) {
            syncingAtSuccess = a->engine.isSyncing();
            requests.append(a->engine.forceSync());
        }
    }, Qt::DirectConnection);

    QCOMPARE(waitFor(a->engine.forceSync()).outcome, SyncOutcome::Success);
    QCOMPARE(requests.size(), 1);
    QVERIFY(syncingAtSuccess);

    SyncResult early = waitFor(requests.first());
    QCOMPARE(early.outcome, SyncOutcome::Skipped);
    QCOMPARE(early.message, QString("Sync already in progress"));
    QCOMPARE(a->history.count(), 1);

    // Released once the worker returns
    QVERIFY(!a->engine.isSyncing());
    QCOMPARE(waitFor(a->engine.forceSync()).outcome, SyncOutcome::Success);
    QCOMPARE(a->history.count(), 2);
}

// ========== Pass Tests ==========

void TestSyncEngine::testFirstSyncUploadsAndRegisters()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    MoleculeTemplate *molecule = a->addTemplate("Stretch");
    auto *instance = new MoleculeInstance();
    instance->setMoleculeTemplateId(molecule->syncId());
    a->records.insert(instance);

    QSignalSpy started(&a->engine, &SyncEngine::syncStarted);
    QSignalSpy finished(&a->engine, &SyncEngine::syncFinished);

    SyncResult result = waitFor(a->engine.forceSync());
    QCOMPARE(result.outcome, SyncOutcome::Success);
    QCOMPARE(result.uploaded, 2);
    QCOMPARE(result.downloaded, 0);
    QCOMPARE(result.failed, 0);
    QCOMPARE(result.message, QString("Synced 0↓ 2↑"));
    QCOMPARE(started.count(), 1);
    QCOMPARE(finished.count(), 1);

    QVERIFY(a->queue.isEmpty());
    QCOMPARE(remoteRecords(m_remoteDir).size(), 2);

    DeviceRegistry registry = remoteRegistry(m_remoteDir);
    QVERIFY(registry.isDeviceRegistered("DEVICE-A"));
    QVERIFY(registry.devices().first().isPrimary);

    QVERIFY(a->state.lastSyncTime().isValid());
    QCOMPARE(a->state.lastSyncDevice(), QString("DEVICE-A"));
    QCOMPARE(a->history.count(), 1);
    QCOMPARE(a->history.lastSync()->result, SyncOutcome::Success);
}

void TestSyncEngine::testSecondSyncUpToDate()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    a->addTemplate("Stretch");
    QCOMPARE(waitFor(a->engine.forceSync()).outcome, SyncOutcome::Success);

    SyncResult result = waitFor(a->engine.forceSync());
    QCOMPARE(result.outcome, SyncOutcome::Success);
    QCOMPARE(result.message, QString("Up to date"));
    QCOMPARE(remoteRegistry(m_remoteDir).devices().size(), 1);
    QCOMPARE(a->history.count(), 2);
}

void TestSyncEngine::testStatusLifecycle()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    QSignalSpy statusSpy(&a->engine, &SyncEngine::statusChanged);

    QCOMPARE(waitFor(a->engine.forceSync()).outcome, SyncOutcome::Success);
    QCOMPARE(a->engine.status().kind(), SyncStatus::Kind::Success);
    QCOMPARE(a->engine.status().message(), QString("Up to date"));

    // Success returns to idle after statusDisplayMs
    QTRY_VERIFY(a->engine.status().isIdle());

    QCOMPARE(statusSpy.count(), 3);
    QCOMPARE(statusSpy.at(0).at(0).value<SyncStatus>().kind(), SyncStatus::Kind::Syncing);
    QCOMPARE(statusSpy.at(1).at(0).value<SyncStatus>().kind(), SyncStatus::Kind::Success);
    QCOMPARE(statusSpy.at(2).at(0).value<SyncStatus>().kind(), SyncStatus::Kind::Idle);
}

void TestSyncEngine::testUnavailableStoreFails()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    a->useRemote(m_tempDir->filePath("unmounted"));
    a->addTemplate("Stretch");

    QSignalSpy errors(&a->engine, &SyncEngine::errorOccurred);

    SyncResult result = waitFor(a->engine.forceSync());
    QCOMPARE(result.outcome, SyncOutcome::Failed);
    QCOMPARE(result.errorMessage, QString("Remote store is not available"));
    QCOMPARE(errors.count(), 1);
    QCOMPARE(a->engine.status().kind(), SyncStatus::Kind::Failed);

    // Nothing lost, nothing recorded as synced
    QCOMPARE(a->queue.count(), 1);
    QVERIFY(!a->state.lastSyncTime().isValid());
    QCOMPARE(a->history.lastSync()->result, SyncOutcome::Failed);

    QTRY_VERIFY(a->engine.status().isIdle());
}

void TestSyncEngine::testListingFailureCommitsNothing()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    auto *faulty = new FaultyFolderStore(m_remoteDir);
    faulty->failListing = true;
    a->useRemote(faulty);
    a->addTemplate("Stretch");

    SyncResult result = waitFor(a->engine.forceSync());
    QCOMPARE(result.outcome, SyncOutcome::Failed);
    QVERIFY(result.errorMessage.startsWith("Failed to list remote records"));
    QCOMPARE(a->engine.status().kind(), SyncStatus::Kind::Failed);

    QVERIFY(!a->state.lastSyncTime().isValid());
    QVERIFY(a->state.lastSyncDevice().isEmpty());
    QCOMPARE(a->queue.count(), 1);
    QVERIFY(remoteRecords(m_remoteDir).isEmpty());
    QVERIFY(!remoteRegistry(m_remoteDir).isDeviceRegistered("DEVICE-A"));
    QCOMPARE(a->history.lastSync()->result, SyncOutcome::Failed);
}

void TestSyncEngine::testRegistryWriteFailureCommitsNothing()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    auto *faulty = new FaultyFolderStore(m_remoteDir);
    faulty->failRegistryWrite = true;
    a->useRemote(faulty);
    a->addTemplate("Stretch");

    SyncResult result = waitFor(a->engine.forceSync());
    QCOMPARE(result.outcome, SyncOutcome::Failed);
    QVERIFY(result.errorMessage.startsWith("Failed to write device registry"));
    QCOMPARE(a->engine.status().kind(), SyncStatus::Kind::Failed);

    // Uploads are idempotent and may stay; the pass itself is not recorded as synced
    QCOMPARE(remoteRecords(m_remoteDir).size(), 1);
    QVERIFY(!a->state.lastSyncTime().isValid());
    QVERIFY(a->state.lastSyncDevice().isEmpty());
    QVERIFY(!QFile::exists(QDir(m_remoteDir).filePath(DeviceRegistry::ObjectName)));
    QVERIFY(!remoteRegistry(m_remoteDir).isDeviceRegistered("DEVICE-A"));
    QCOMPARE(a->history.lastSync()->result, SyncOutcome::Failed);
}

void TestSyncEngine::testUnreadableRegistryFailsPass()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    a->addTemplate("From A");
    QCOMPARE(waitFor(a->engine.forceSync()).outcome, SyncOutcome::Success);

    const QString registryPath = QDir(m_remoteDir).filePath(DeviceRegistry::ObjectName);
    QFile file(registryPath);
    QVERIFY(file.open(QIODevice::WriteOnly | QIODevice::Truncate));
    file.write("{");
    file.close();

    TestDevice *b = makeDevice("DEVICE-B", "Phone B");
    b->addTemplate("From B");

    SyncResult result = waitFor(b->engine.forceSync());
    QCOMPARE(result.outcome, SyncOutcome::Failed);
    QCOMPARE(result.errorMessage, QString("Device registry is unreadable"));
    QCOMPARE(b->engine.status().kind(), SyncStatus::Kind::Failed);

    // B neither merged, uploaded nor claimed the registry
    QCOMPARE(remoteRecords(m_remoteDir).size(), 1);
    QCOMPARE(b->records.recordCount(), 1);
    QCOMPARE(b->queue.count(), 1);
    QVERIFY(!b->state.lastSyncTime().isValid());

    QVERIFY(file.open(QIODevice::ReadOnly));
    QCOMPARE(file.readAll(), QByteArray("{"));
    file.close();
}

void TestSyncEngine::testFailedUploadIsPartialSuccess()
{
    // A record whose object path is occupied by a directory cannot be written
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    MoleculeTemplate *blocked = a->addTemplate("Blocked");
    a->addTemplate("Fine");
    QVERIFY(QDir(m_remoteDir).mkpath(RecordConduit::recordPath(blocked->storageKey() + ".json")));

    SyncResult result = waitFor(a->engine.forceSync());
    QCOMPARE(result.outcome, SyncOutcome::PartialSuccess);
    QCOMPARE(result.uploaded, 1);
    QCOMPARE(result.failed, 1);
    QCOMPARE(result.message, QString("Synced 0↓ 1↑ (1 failed)"));

    QCOMPARE(a->queue.count(), 1);
    QVERIFY(a->queue.contains(blocked->syncId()));
    QVERIFY(remoteRegistry(m_remoteDir).isDeviceRegistered("DEVICE-A"));
}

void TestSyncEngine::testOverflowUploadsEverything()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    SyncConfig config = a->engine.config();
    config.maxQueueSize = 2;
    a->queue.setConfig(config);

    a->addTemplate("One");
    a->addTemplate("Two");
    a->addTemplate("Three");
    QVERIFY(a->queue.needsFullResync());

    SyncResult result = waitFor(a->engine.forceSync());
    QCOMPARE(result.outcome, SyncOutcome::Success);
    QCOMPARE(result.uploaded, 3);
    QVERIFY(!a->queue.needsFullResync());
    QVERIFY(a->queue.isEmpty());
    QCOMPARE(remoteRecords(m_remoteDir).size(), 3);
}

// ========== Conflict Tests ==========

void TestSyncEngine::testConflictDetected()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    a->addTemplate("From A");
    QCOMPARE(waitFor(a->engine.forceSync()).outcome, SyncOutcome::Success);

    TestDevice *b = makeDevice("DEVICE-B", "Phone B");
    b->addTemplate("From B");
    QSignalSpy conflicts(&b->engine, &SyncEngine::conflictDetected);

    SyncResult result = waitFor(b->engine.forceSync());
    QCOMPARE(result.outcome, SyncOutcome::Conflict);
    QCOMPARE(result.conflict.otherDeviceId, QString("DEVICE-A"));
    QCOMPARE(result.conflict.otherDeviceName, QString("Phone A"));
    QCOMPARE(result.conflict.localRecordCount, 1);
    QCOMPARE(conflicts.count(), 1);
    QCOMPARE(b->engine.status().kind(), SyncStatus::Kind::ConflictDetected);
    QCOMPARE(b->engine.status().conflict().otherDeviceId, QString("DEVICE-A"));

    // Neither records nor registry were touched
    QCOMPARE(remoteRecords(m_remoteDir).size(), 1);
    QVERIFY(!remoteRegistry(m_remoteDir).isDeviceRegistered("DEVICE-B"));
    QCOMPARE(b->records.recordCount(), 1);
    QCOMPARE(b->queue.count(), 1);

    // Conflict stays until the user acts
    QTest::qWait(100);
    QCOMPARE(b->engine.status().kind(), SyncStatus::Kind::ConflictDetected);
    b->engine.dismissStatus();
    QVERIFY(b->engine.status().isIdle());
}

void TestSyncEngine::testResolveUsingThisDevice()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    a->addTemplate("From A");
    QCOMPARE(waitFor(a->engine.forceSync()).outcome, SyncOutcome::Success);

    TestDevice *b = makeDevice("DEVICE-B", "Phone B");
    b->addTemplate("From B");
    b->addTemplate("Also B");
    QCOMPARE(waitFor(b->engine.forceSync()).outcome, SyncOutcome::Conflict);

    SyncResult result = waitFor(b->engine.handleConflictResolution(ConflictChoice::UseThisDevice));
    QCOMPARE(result.outcome, SyncOutcome::Success);
    QCOMPARE(result.action, SyncAction::ConflictResolution);
    QCOMPARE(result.uploaded, 2);
    QVERIFY(b->queue.isEmpty());
    QCOMPARE(remoteRecords(m_remoteDir).size(), 3);

    DeviceRegistry registry = remoteRegistry(m_remoteDir);
    QVERIFY(registry.isDeviceRegistered("DEVICE-A"));
    QVERIFY(registry.isDeviceRegistered("DEVICE-B"));

    // Registered now, so the next pass is ordinary
    QCOMPARE(waitFor(b->engine.forceSync()).outcome, SyncOutcome::Success);
}

void TestSyncEngine::testResolveUsingCloudData()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    MoleculeTemplate *fromA = a->addTemplate("From A");
    QCOMPARE(waitFor(a->engine.forceSync()).outcome, SyncOutcome::Success);

    TestDevice *b = makeDevice("DEVICE-B", "Phone B");
    MoleculeTemplate *fromB = b->addTemplate("From B");
    QCOMPARE(waitFor(b->engine.forceSync()).outcome, SyncOutcome::Conflict);

    SyncResult result = waitFor(b->engine.handleConflictResolution(ConflictChoice::UseCloudData));
    QCOMPARE(result.outcome, SyncOutcome::Success);
    QCOMPARE(result.downloaded, 1);
    QCOMPARE(result.uploaded, 0);

    auto *downloaded = dynamic_cast<MoleculeTemplate*>(
        b->records.record(MoleculeTemplate::EntityType, fromA->syncId()));
    QVERIFY(downloaded);
    QCOMPARE(downloaded->title(), QString("From A"));
    QVERIFY(b->records.record(MoleculeTemplate::EntityType, fromB->syncId())->isDeleted());
    QVERIFY(b->queue.isEmpty());

    // B's local-only record never reached the remote
    QCOMPARE(remoteRecords(m_remoteDir).size(), 1);
    QVERIFY(remoteRegistry(m_remoteDir).isDeviceRegistered("DEVICE-B"));
}

void TestSyncEngine::testSimulatorInRegistryIsNoConflict()
{
    DeviceInfo info;
    info.name = "Simulator";
    info.type = DeviceType::Simulator;
    info.simulator = true;

    DeviceRegistry seeded;
    seeded.registerDevice(DeviceIdentity("SIM-1", info));
    QFile file(QDir(m_remoteDir).filePath(DeviceRegistry::ObjectName));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write(seeded.toDocument());
    file.close();

    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    a->addTemplate("Stretch");

    QCOMPARE(waitFor(a->engine.forceSync()).outcome, SyncOutcome::Success);
    QCOMPARE(remoteRegistry(m_remoteDir).devices().size(), 2);
}

// ========== Multi-Device Tests ==========

void TestSyncEngine::testTwoDevicesShareChanges()
{
    TestDevice *a = makeDevice("DEVICE-A", "Phone A");
    TestDevice *b = makeDevice("DEVICE-B", "Tablet B");

    // A starts the account
    MoleculeTemplate *molecule = a->addTemplate("Meditate");
    const QUuid id = molecule->syncId();
    QCOMPARE(waitFor(a->engine.forceSync()).outcome, SyncOutcome::Success);

    // B joins with an empty dataset and takes the cloud copy
    QCOMPARE(waitFor(b->engine.forceSync()).outcome, SyncOutcome::Conflict);
    QCOMPARE(waitFor(b->engine.handleConflictResolution(ConflictChoice::UseCloudData)).outcome,
             SyncOutcome::Success);
    QVERIFY(b->records.contains(MoleculeTemplate::EntityType, id));

    // B edits, A picks the edit up
    QTest::qWait(20);
    QVERIFY(b->records.update(MoleculeTemplate::EntityType, id, [](SyncableRecord *record) {
        static_cast<MoleculeTemplate*>(record)->setTitle("Meditate 20 min");
    }));
    QCOMPARE(waitFor(b->engine.forceSync()).uploaded, 1);

    SyncResult pulled = waitFor(a->engine.forceSync());
    QCOMPARE(pulled.outcome, SyncOutcome::Success);
    QCOMPARE(pulled.downloaded, 1);
    auto *onA = dynamic_cast<MoleculeTemplate*>(a->records.record(MoleculeTemplate::EntityType, id));
    QVERIFY(onA);
    QCOMPARE(onA->title(), QString("Meditate 20 min"));

    // A deletes, B receives the tombstone
    QTest::qWait(20);
    QVERIFY(a->records.softDelete(MoleculeTemplate::EntityType, id));
    QCOMPARE(waitFor(a->engine.forceSync()).uploaded, 1);

    SyncResult deleted = waitFor(b->engine.forceSync());
    QCOMPARE(deleted.downloaded, 1);
    QVERIFY(b->records.record(MoleculeTemplate::EntityType, id)->isDeleted());

    DeviceRegistry registry = remoteRegistry(m_remoteDir);
    QCOMPARE(registry.devices().size(), 2);
    QCOMPARE(registry.lastModifiedBy(), QString("DEVICE-B"));
}

QTEST_MAIN(TestSyncEngine)
#include "test_syncengine.moc"
