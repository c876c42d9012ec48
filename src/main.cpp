#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFutureWatcher>
#include <QLoggingCategory>
#include <QTextStream>
#include <QDebug>

#include <memory>

#include "qrecordsync_version.h"
#include "settings.h"
#include "account.h"

#include "models/models.h"

// Sync engine
#include "sync/syncengine.h"
#include "sync/syncqueue.h"
#include "sync/syncstate.h"
#include "sync/synchistory.h"
#include "sync/recordstore.h"
#include "sync/recordconduit.h"
#include "sync/localfolderstore.h"
#include "sync/deviceidentity.h"
#include "sync/deviceregistry.h"

using namespace RecordSync;

namespace {

enum ExitCode {
    ExitOk = 0,
    ExitFailed = 1,
    ExitConflict = 2,
    ExitUsage = 64
};

QTextStream& out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err()
{
    static QTextStream stream(stderr);
    return stream;
}

/**
 * @brief Everything a command needs, wired the way the application runs
 */
class CommandContext
{
public:
    CommandContext(Settings &settings, const QString &stateDir, const QString &remoteOverride)
        : settings(settings)
        , stateDir(stateDir)
        , account(stateDir)
        , records(factory)
        , secureStore(QDir(stateDir).filePath("device_identity.json"))
    {
        config = settings.syncConfig();

        registerModelTypes(factory);
        records.setStoragePath(QDir(stateDir).filePath("records.json"));
        if (!records.load()) {
            qWarning() << "[main] Could not load records:" << records.lastError();
        }

        queue.setConfig(config);
        queue.setStoragePath(QDir(stateDir).filePath("pending_queue.json"));
        if (!queue.load()) {
            qWarning() << "[main] Could not load pending queue";
        }

        // Every local edit becomes a pending upload
        QObject::connect(&records, &RecordStore::recordChanged,
                         &queue, &SyncQueueManager::addToQueue);

        state.setStateDirectory(stateDir);
        if (!state.load()) {
            qWarning() << "[main] Could not load sync state";
        }

        history.setLimit(config.historyLimit);
        history.setStoragePath(QDir(stateDir).filePath(SyncHistory::FileName));
        if (!history.load()) {
            qWarning() << "[main] Could not load sync history";
        }

        remoteFolder = remoteOverride;
        if (remoteFolder.isEmpty()) remoteFolder = account.remoteFolder();
        if (remoteFolder.isEmpty()) remoteFolder = settings.remoteFolder();
    }

    DeviceIdentity identity()
    {
        return DeviceIdentity(secureStore);
    }

    /**
     * @brief Conduit over the configured remote folder (caller owns it)
     */
    RecordConduit* createConduit()
    {
        auto *folder = new LocalFolderObjectStore(remoteFolder);
        if (!remoteFolder.isEmpty() && !folder->ensureBasePath()) {
            qWarning() << "[main]" << folder->lastError();
        }
        auto *conduit = new RecordConduit(folder);
        folder->setParent(conduit);
        conduit->setConfig(config);
        return conduit;
    }

    Settings &settings;
    QString stateDir;
    QString remoteFolder;
    SyncConfig config;

    Account account;
    RecordFactory factory;
    RecordStore records;
    SyncQueueManager queue;
    SyncState state;
    SyncHistory history;
    FileSecureStore secureStore;
};

QString formatTime(const QDateTime &time)
{
    if (!time.isValid()) return "never";
    return time.toLocalTime().toString("yyyy-MM-dd hh:mm:ss");
}

// ========== Commands ==========

int cmdStatus(CommandContext &ctx)
{
    DeviceIdentity identity = ctx.identity();

    out() << "Account:       " << (ctx.account.isSignedIn() ? ctx.account.displayName() : QString("signed out")) << "\n";
    out() << "Remote folder: " << (ctx.remoteFolder.isEmpty() ? QString("(not set)") : ctx.remoteFolder) << "\n";
    out() << "Device:        " << identity.shortDescription() << " [" << identity.deviceId() << "]\n";
    out() << "Records:       " << ctx.records.recordCount(false) << " live, "
          << ctx.records.recordCount() - ctx.records.recordCount(false) << " deleted\n";
    out() << "Pending:       " << ctx.queue.count()
          << (ctx.queue.needsFullResync() ? " (full resync scheduled)" : "") << "\n";
    out() << "Last sync:     " << formatTime(ctx.state.lastSyncTime()) << "\n";
    return ExitOk;
}

int runPass(QCoreApplication &app, CommandContext &ctx, const QString &command, const QString &argument)
{
    if (ctx.remoteFolder.isEmpty()) {
        err() << "No remote folder configured; use --remote or signin\n";
        return ExitUsage;
    }

    ConflictChoice choice = ConflictChoice::UseCloudData;
    if (command == "resolve") {
        if (argument == "this-device") {
            choice = ConflictChoice::UseThisDevice;
        } else if (argument != "cloud") {
            err() << "resolve expects 'this-device' or 'cloud'\n";
            return ExitUsage;
        }
    }

    SyncEngine engine;
    engine.setConfig(ctx.config);
    engine.setRecordStore(&ctx.records);
    engine.setQueue(&ctx.queue);
    engine.setConduit(ctx.createConduit());
    engine.setIdentity(ctx.identity());
    engine.setSyncState(&ctx.state);
    engine.setHistory(&ctx.history);
    engine.setSignedInCheck([&ctx]() { return ctx.account.isSignedIn(); });

    QObject::connect(&engine, &SyncEngine::logMessage, [](const QString &message) {
        out() << message << "\n";
        out().flush();
    });

    QFuture<SyncResult> future;
    if (command == "sync") {
        future = engine.performFullSyncSafely();
    } else if (command == "force-sync") {
        future = engine.forceSync();
    } else {
        future = engine.handleConflictResolution(choice);
    }

    // Keep the event loop running so worker-thread signals get delivered
    QFutureWatcher<SyncResult> watcher;
    QObject::connect(&watcher, &QFutureWatcher<SyncResult>::finished, &app, &QCoreApplication::quit);
    watcher.setFuture(future);
    if (!future.isFinished()) {
        app.exec();
    }

    const SyncResult result = future.result();
    switch (result.outcome) {
    case SyncOutcome::Success:
    case SyncOutcome::PartialSuccess:
        out() << result.message << "\n";
        return result.failed > 0 ? ExitFailed : ExitOk;
    case SyncOutcome::Skipped:
        out() << "Skipped: " << result.message << "\n";
        return ExitOk;
    case SyncOutcome::Conflict:
        out() << "Conflict: this device has never synced, but "
              << result.conflict.otherDeviceName << " last synced "
              << formatTime(result.conflict.otherDeviceLastSync) << ".\n"
              << "Run 'resolve this-device' to upload local data or 'resolve cloud' to replace it.\n";
        return ExitConflict;
    case SyncOutcome::Failed:
        err() << "Sync failed: " << result.errorMessage << "\n";
        return ExitFailed;
    }
    return ExitFailed;
}

int cmdQueue(CommandContext &ctx)
{
    const QList<SyncQueueItem> items = ctx.queue.getPriorityQueue();
    if (items.isEmpty()) {
        out() << "No pending changes\n";
        return ExitOk;
    }
    for (const SyncQueueItem &item : items) {
        out() << SyncQueueManager::generateFilename(item)
              << "  queued " << formatTime(item.queuedAt);
        if (item.attempts > 0) {
            out() << "  attempts " << item.attempts;
        }
        out() << "\n";
    }
    return ExitOk;
}

int cmdDevices(CommandContext &ctx)
{
    std::unique_ptr<RecordConduit> conduit(ctx.createConduit());
    DeviceRegistry registry;
    if (!conduit->fetchDeviceRegistry(registry)) {
        err() << "Cannot read device registry: " << conduit->lastError() << "\n";
        return ExitFailed;
    }

    const QString thisDevice = ctx.identity().deviceId();
    if (registry.isEmpty()) {
        out() << "No devices registered\n";
    }
    for (const RegisteredDevice &device : registry.devices()) {
        out() << (device.deviceId == thisDevice ? "* " : "  ")
              << device.deviceName << " (" << device.deviceType << ")"
              << (device.isPrimary ? " primary" : "")
              << (device.isSimulator ? " simulator" : "")
              << "  last sync " << formatTime(device.lastSyncDate) << "\n";
    }
    return ExitOk;
}

int cmdHistory(CommandContext &ctx)
{
    const QList<SyncHistoryEntry> entries = ctx.history.entries();
    if (entries.isEmpty()) {
        out() << "No sync history\n";
    }
    for (const SyncHistoryEntry &entry : entries) {
        out() << formatTime(entry.timestamp) << "  "
              << syncActionToString(entry.action) << "  "
              << syncOutcomeToString(entry.result) << "  "
              << (entry.errorMessage.isEmpty() ? entry.details : entry.errorMessage) << "\n";
    }
    return ExitOk;
}

int cmdSignIn(CommandContext &ctx, const QString &accountId)
{
    ctx.account.signIn(accountId, ctx.remoteFolder);
    if (!ctx.account.save()) {
        err() << "Failed to save account to " << ctx.account.configFilePath() << "\n";
        return ExitFailed;
    }
    out() << "Signed in as " << ctx.account.displayName() << "\n";
    return ExitOk;
}

int cmdSignOut(CommandContext &ctx)
{
    ctx.account.signOut();
    ctx.state.clear();
    if (!ctx.state.save()) {
        qWarning() << "[main] Could not reset sync state";
    }
    if (!ctx.account.save()) {
        err() << "Failed to save account to " << ctx.account.configFilePath() << "\n";
        return ExitFailed;
    }
    out() << "Signed out\n";
    return ExitOk;
}

int cmdAddTemplate(CommandContext &ctx, const QString &title)
{
    auto *molecule = new MoleculeTemplate();
    molecule->setTitle(title);
    ctx.records.insert(molecule);
    out() << SyncJson::idToString(molecule->syncId()) << "\n";
    return ExitOk;
}

int cmdAddInstance(CommandContext &ctx, const QString &templateText)
{
    const QUuid templateId = SyncJson::idFromString(templateText);
    if (!ctx.records.contains(MoleculeTemplate::EntityType, templateId)) {
        err() << "No such template: " << templateText << "\n";
        return ExitFailed;
    }

    auto *instance = new MoleculeInstance();
    instance->setMoleculeTemplateId(templateId);
    instance->setScheduledDate(SyncDate::now());
    ctx.records.insert(instance);

    const QUuid instanceId = instance->syncId();
    ctx.records.update(MoleculeTemplate::EntityType, templateId, [instanceId](SyncableRecord *record) {
        auto *molecule = static_cast<MoleculeTemplate*>(record);
        QList<QUuid> ids = molecule->instanceIds();
        ids.append(instanceId);
        molecule->setInstanceIds(ids);
    });

    out() << SyncJson::idToString(instanceId) << "\n";
    return ExitOk;
}

int cmdAddAtom(CommandContext &ctx, const QString &templateText, const QString &title)
{
    const QUuid templateId = SyncJson::idFromString(templateText);
    if (!ctx.records.contains(MoleculeTemplate::EntityType, templateId)) {
        err() << "No such template: " << templateText << "\n";
        return ExitFailed;
    }

    auto *atom = new AtomTemplate();
    atom->setTitle(title);
    atom->setParentTemplateId(templateId);
    ctx.records.insert(atom);

    const QUuid atomId = atom->syncId();
    ctx.records.update(MoleculeTemplate::EntityType, templateId, [atomId](SyncableRecord *record) {
        auto *molecule = static_cast<MoleculeTemplate*>(record);
        QList<QUuid> ids = molecule->atomTemplateIds();
        ids.append(atomId);
        molecule->setAtomTemplateIds(ids);
    });

    out() << SyncJson::idToString(atomId) << "\n";
    return ExitOk;
}

int cmdComplete(CommandContext &ctx, const QString &instanceText)
{
    const QUuid id = SyncJson::idFromString(instanceText);
    bool found = ctx.records.update(MoleculeInstance::EntityType, id, [](SyncableRecord *record) {
        static_cast<MoleculeInstance*>(record)->setCompleted(true);
    });
    if (!found) {
        err() << "No such instance: " << instanceText << "\n";
        return ExitFailed;
    }
    out() << "Completed\n";
    return ExitOk;
}

int cmdDelete(CommandContext &ctx, const QString &entityType, const QString &idText)
{
    if (!ctx.factory.hasType(entityType)) {
        err() << "Unknown entity type: " << entityType
              << " (expected one of " << ctx.factory.types().join(", ") << ")\n";
        return ExitUsage;
    }
    if (!ctx.records.softDelete(entityType, SyncJson::idFromString(idText))) {
        err() << "No such record: " << entityType << " " << idText << "\n";
        return ExitFailed;
    }
    out() << "Deleted\n";
    return ExitOk;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("QRecordSync");
    app.setApplicationVersion(QRECORDSYNC_VERSION_STRING);
    app.setOrganizationName("QRecordSync");
    app.setOrganizationDomain("qrecordsync.org");

    QCommandLineParser parser;
    parser.setApplicationDescription("Offline-first record sync across devices through a shared folder");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption stateDirOption("state-dir", "Local state directory.", "dir");
    QCommandLineOption remoteOption("remote", "Remote sync folder.", "dir");
    QCommandLineOption configOption("config", "Settings file (INI).", "file");
    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Show debug output.");
    parser.addOption(stateDirOption);
    parser.addOption(remoteOption);
    parser.addOption(configOption);
    parser.addOption(verboseOption);

    parser.addPositionalArgument("command",
        "status | sync | force-sync | resolve <this-device|cloud> | queue | devices | history |\n"
        "signin <account> | signout | add-template <title> | add-instance <templateId> |\n"
        "add-atom <templateId> <title> | complete <instanceId> | delete <type> <id>");
    parser.process(app);

    std::unique_ptr<Settings> fileSettings;
    if (parser.isSet(configOption)) {
        fileSettings.reset(new Settings(parser.value(configOption)));
    }
    Settings &settings = fileSettings ? *fileSettings : Settings::instance();

    qSetMessagePattern("[%{time hh:mm:ss.zzz}] %{if-warning}warning: %{endif}%{message}");
    if (!parser.isSet(verboseOption) && !settings.debugLogging()) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(ExitUsage);
    }

    const QString stateDir = parser.isSet(stateDirOption)
        ? parser.value(stateDirOption) : settings.stateDirectory();
    if (!QDir().mkpath(stateDir)) {
        err() << "Cannot create state directory " << stateDir << "\n";
        return ExitFailed;
    }

    CommandContext ctx(settings, stateDir, parser.value(remoteOption));

    const QString command = args.at(0);
    auto requireArgs = [&](int count) {
        if (args.size() < count + 1) {
            err() << command << ": missing argument\n";
            return false;
        }
        return true;
    };

    if (command == "status") {
        return cmdStatus(ctx);
    } else if (command == "sync" || command == "force-sync") {
        return runPass(app, ctx, command, QString());
    } else if (command == "resolve") {
        if (!requireArgs(1)) return ExitUsage;
        return runPass(app, ctx, command, args.at(1));
    } else if (command == "queue") {
        return cmdQueue(ctx);
    } else if (command == "devices") {
        return cmdDevices(ctx);
    } else if (command == "history") {
        return cmdHistory(ctx);
    } else if (command == "signin") {
        if (!requireArgs(1)) return ExitUsage;
        return cmdSignIn(ctx, args.at(1));
    } else if (command == "signout") {
        return cmdSignOut(ctx);
    } else if (command == "add-template") {
        if (!requireArgs(1)) return ExitUsage;
        return cmdAddTemplate(ctx, args.mid(1).join(' '));
    } else if (command == "add-instance") {
        if (!requireArgs(1)) return ExitUsage;
        return cmdAddInstance(ctx, args.at(1));
    } else if (command == "add-atom") {
        if (!requireArgs(2)) return ExitUsage;
        return cmdAddAtom(ctx, args.at(1), args.mid(2).join(' '));
    } else if (command == "complete") {
        if (!requireArgs(1)) return ExitUsage;
        return cmdComplete(ctx, args.at(1));
    } else if (command == "delete") {
        if (!requireArgs(2)) return ExitUsage;
        return cmdDelete(ctx, args.at(1), args.at(2));
    }

    err() << "Unknown command: " << command << "\n";
    return ExitUsage;
}
