#include <QCoreApplication>
#include <QCommandLineParser>
#include <QCommandLineOption>
#include <QTextStream>
#include <QTime>
#include <QDebug>

#include "qfieldsync_version.h"
#include "settings.h"
#include "agentprofile.h"
#include "app/logsink.h"
#include "store/localdocumentqueue.h"
#include "store/mockremoteservice.h"
#include "sync/autosendorchestrator.h"
#include "sync/connectivityprobe.h"
#include "sync/dailysyncscheduler.h"
#include "sync/signalbus.h"
#include "sync/syncstatusstore.h"

using namespace FieldSync;

namespace {

void connectLogging(LogSink &sink, LocalDocumentQueue &queue, SyncStatusStore &store,
                    ConnectivityProbe &probe, AutoSendOrchestrator &orchestrator,
                    DailySyncScheduler &scheduler)
{
    QObject::connect(&queue, &DocumentQueueClient::logMessage, &sink, &LogSink::logInfo);
    QObject::connect(&queue, &DocumentQueueClient::errorOccurred, &sink, &LogSink::logError);
    QObject::connect(&store, &SyncStatusStore::errorOccurred, &sink, &LogSink::logError);
    QObject::connect(&probe, &ConnectivityProbe::logMessage, &sink, &LogSink::logInfo);
    QObject::connect(&orchestrator, &AutoSendOrchestrator::logMessage, &sink, &LogSink::logInfo);
    QObject::connect(&orchestrator, &AutoSendOrchestrator::warningRaised, &sink, &LogSink::logWarning);
    QObject::connect(&orchestrator, &AutoSendOrchestrator::errorOccurred, &sink, &LogSink::logError);
    QObject::connect(&scheduler, &DailySyncScheduler::logMessage, &sink, &LogSink::logInfo);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("QFieldSync");
    app.setApplicationVersion(QFIELDSYNC_VERSION_STRING);
    app.setOrganizationName("QFieldSync");

    qRegisterMetaType<FieldSync::CycleResult>();
    qRegisterMetaType<FieldSync::SyncStatus>();
    qRegisterMetaType<FieldSync::SyncTopic>();
    qRegisterMetaType<FieldSync::SyncStage>();
    qRegisterMetaType<FieldSync::DocumentKind>();

    QCommandLineParser parser;
    parser.setApplicationDescription("Offline-first invoice and collection sync agent");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption dataDirOption("data-dir", "Data folder with profile and queue.", "path");
    QCommandLineOption endpointOption("endpoint", "Reachability check URL.", "url");
    QCommandLineOption intervalOption("interval", "Probe interval in milliseconds.", "ms");
    QCommandLineOption timeoutOption("timeout", "Probe timeout in milliseconds.", "ms");
    QCommandLineOption debugOption("debug", "Enable debug logging.");
    QCommandLineOption onceOption("once", "Run one manual sync and exit.");
    QCommandLineOption mockOption("mock", "Use the built-in mock remote.");
    parser.addOptions({dataDirOption, endpointOption, intervalOption, timeoutOption,
                       debugOption, onceOption, mockOption});
    parser.process(app);

    Settings &settings = Settings::instance();
    const QString dataDir = parser.isSet(dataDirOption)
        ? parser.value(dataDirOption) : settings.dataDirectory();
    const QString endpoint = parser.isSet(endpointOption)
        ? parser.value(endpointOption) : settings.reachabilityEndpoint();
    const int intervalMs = parser.isSet(intervalOption)
        ? parser.value(intervalOption).toInt() : settings.probeIntervalMs();
    const int timeoutMs = parser.isSet(timeoutOption)
        ? parser.value(timeoutOption).toInt() : settings.probeTimeoutMs();
    const bool debug = parser.isSet(debugOption) || settings.debugLogging();
    const bool useMock = parser.isSet(mockOption) || settings.useMockRemote();

    LogSink::installMessageHandler(debug);
    LogSink sink;

    if (intervalMs <= 0 || timeoutMs <= 0) {
        sink.logError("Probe interval and timeout must be positive");
        return 2;
    }

    AgentProfile profile(dataDir);
    if (!profile.exists() && !profile.initialize()) {
        sink.logError(QString("Cannot initialize data folder: %1").arg(dataDir));
        return 1;
    }

    LocalDocumentQueue queue(profile.storeDirectoryPath());
    queue.setProfile(&profile);
    if (useMock) {
        queue.setRemote(new MockRemoteService());
    } else {
        sink.logError("No remote transport configured; run with --mock");
        return 1;
    }

    SyncStatusStore statusStore;
    statusStore.setStateDirectory(profile.stateDirectoryPath());

    ConnectivityProbe probe;
    probe.setEndpoint(QUrl(endpoint));
    probe.setInterval(intervalMs);
    probe.setTimeout(timeoutMs);

    AutoSendOrchestrator orchestrator;
    orchestrator.setQueue(&queue);
    orchestrator.setProbe(&probe);
    orchestrator.setStatusStore(&statusStore);

    DailySyncScheduler scheduler;
    scheduler.setOrchestrator(&orchestrator);
    scheduler.setEnabled(profile.autoSyncEnabled());
    scheduler.setTime(profile.autoSyncTime());

    connectLogging(sink, queue, statusStore, probe, orchestrator, scheduler);

    if (!queue.load()) {
        return 1;
    }
    statusStore.initialize(&queue);

    if (parser.isSet(onceOption)) {
        probe.checkNow();
        CycleResult result = orchestrator.runManualSync();
        if (!result.ran()) {
            return 2;
        }
        QTextStream(stdout) << result.summary() << Qt::endl;
        return result.hasPartialFailures() ? 1 : 0;
    }

    // Views in a full client re-query on these; the agent just reports them
    SignalBus &bus = SignalBus::instance();
    bus.subscribe(SyncTopic::InvoicesUpdated, &sink, [&queue, &sink]() {
        const int open = queue.listDocuments(DocumentKind::Invoice,
            {DocumentStatus::Pending, DocumentStatus::Failed}).value.size();
        sink.logInfo(QString("Invoices updated, %1 still waiting").arg(open));
    });
    bus.subscribe(SyncTopic::CollectionsUpdated, &sink, [&queue, &sink]() {
        const int open = queue.listDocuments(DocumentKind::Collection,
            {DocumentStatus::Pending, DocumentStatus::Failed}).value.size();
        sink.logInfo(QString("Collections updated, %1 still waiting").arg(open));
    });

    // Direct connection: the online transition happens-before the cycle
    QObject::connect(&probe, &ConnectivityProbe::connectionRestored,
                     &orchestrator, &AutoSendOrchestrator::runCycle);

    if (!probe.watchSystemNetwork()) {
        sink.logWarning("System network notifications unavailable; relying on periodic probes");
    }

    sink.logInfo(QString("QFieldSync %1 started for agent %2")
        .arg(QString(QFIELDSYNC_VERSION_STRING), profile.agentName().isEmpty() ? QString("(unnamed)") : profile.agentName()));

    probe.start();
    scheduler.start();

    return app.exec();
}
