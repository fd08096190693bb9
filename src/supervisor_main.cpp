#include "cli/AppSetup.hpp"
#include "core/CaptureEnumerator.hpp"
#include "core/DeviceManager.hpp"
#include "core/Logger.hpp"
#include "core/ProcessScanner.hpp"
#include "core/RuleStore.hpp"
#include "core/SignalBridge.hpp"
#include "core/StreamLauncher.hpp"
#include "core/StreamSupervisor.hpp"
#include "core/SystemQuery.hpp"
#include "core/TopologyResolver.hpp"
#include "utils/ConfigManager.hpp"
#include "utils/StatusReporter.hpp"
#include <usb-audio/Constants.hpp>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDateTime>
#include <QTextStream>
#include <QTimer>
#include <cstdio>

using namespace usb_audio;

namespace {

void setupCommandLineParser(QCommandLineParser& parser) {
    parser.setApplicationDescription("Keeps one RTSP audio stream running per USB capture device");
    parser.addHelpOption();
    parser.addVersionOption();

    parser.addOption(QCommandLineOption(
        QStringList() << "s" << "status",
        "Print the active streams and the running streaming processes, then exit."));
    addCommonOptions(parser);
}

int printStatus(const ConfigManager& config) {
    QTextStream out(stdout);
    const std::string statusFile = config.getString("statusFile", DEFAULT_STATUS_FILE);

    if (auto snapshot = StatusReporter::readStatusFile(statusFile)) {
        out << QString::fromStdString(StatusReporter::formatTable(snapshot->streams));
        out << QString::fromStdString(StatusReporter::remoteAccessHint(snapshot->streamHost,
                                                                       snapshot->hostAddress));
        if (!snapshot->generatedAt.empty()) {
            out << "Last updated: " << QString::fromStdString(snapshot->generatedAt) << "\n";
        }
    } else {
        out << "No status file at " << QString::fromStdString(statusFile)
            << ". Is the supervisor running?\n";
    }

    ProcessScanner scanner(QString::fromStdString(config.getString("procRoot", DEFAULT_PROC_ROOT)));
    const auto processes = scanner.findByCommandLine(std::string(STREAM_SCHEME) + "://", STREAM_PROGRAM);
    out << "\nRunning streaming processes: " << processes.size() << "\n";
    for (const auto& process : processes) {
        const auto& arguments = process.arguments;
        QString url = arguments.empty() ? QString() : QString::fromStdString(arguments.back());
        out << "  pid " << process.pid << "  " << url << "\n";
    }
    out.flush();
    return ExitCodes::OK;
}

}

int main(int argc, char* argv[]) {
    try {
        QCoreApplication app(argc, argv);
        app.setApplicationName("audio-rtsp-supervisor");
        app.setApplicationVersion("1.0.0");

        QCommandLineParser parser;
        setupCommandLineParser(parser);
        parser.process(app);

        Logger::instance().setSystemIdentity("audio-rtsp-supervisor");

        ConfigManager config;
        if (!loadConfiguration(config, parser)) {
            return ExitCodes::FAILURE;
        }
        initializeLogger(parser, config);

        if (parser.isSet("status")) {
            return printStatus(config);
        }

        SignalBridge signalBridge;
        if (!signalBridge.install()) {
            return ExitCodes::FAILURE;
        }

        ProcessSystemQuery query;

        ResolverPaths paths;
        paths.sysfsUsbRoot = QString::fromStdString(config.getString("sysfsUsbRoot", DEFAULT_SYSFS_USB_ROOT));
        paths.udevadmPath = QString::fromStdString(config.getString("udevadmPath", "udevadm"));
        TopologyResolver resolver(paths, query);

        RuleStore rules(config.getString("rulesFile", DEFAULT_RULES_FILE));

        EnumeratorOptions enumeratorOptions;
        enumeratorOptions.asoundRoot = QString::fromStdString(config.getString("asoundRoot", DEFAULT_ASOUND_ROOT));
        enumeratorOptions.arecordPath = QString::fromStdString(config.getString("arecordPath", "arecord"));
        enumeratorOptions.streamHost = config.getString("streamHost", "localhost");
        enumeratorOptions.streamPort = config.getInt("streamPort", DEFAULT_STREAM_PORT);
        enumeratorOptions.extraDenylist = config.getList("extraDenylist");
        CaptureEnumerator enumerator(enumeratorOptions, query, &rules, &resolver);

        SupervisorOptions supervisorOptions;
        supervisorOptions.staggerDelayMs = config.getInt("staggerDelayMs", STAGGER_DELAY);
        supervisorOptions.stopTimeoutMs = config.getInt("stopTimeoutMs", STOP_TIMEOUT);
        supervisorOptions.streamHost = enumeratorOptions.streamHost;
        supervisorOptions.streamPort = enumeratorOptions.streamPort;

        ProcessStreamLauncher launcher;
        ProcessScanner scanner(QString::fromStdString(config.getString("procRoot", DEFAULT_PROC_ROOT)));
        StreamSupervisor supervisor(supervisorOptions, launcher, &scanner, &config);

        const std::string statusFile = config.getString("statusFile", DEFAULT_STATUS_FILE);
        QObject::connect(&supervisor, &StreamSupervisor::streamsChanged, [&]() {
            StatusSnapshot snapshot;
            snapshot.generatedAt = QDateTime::currentDateTimeUtc().toString(Qt::ISODate).toStdString();
            snapshot.streamHost = supervisorOptions.streamHost;
            snapshot.streamPort = supervisorOptions.streamPort;
            snapshot.hostAddress = StatusReporter::primaryIPv4Address();
            snapshot.streams = supervisor.activeStreams();

            if (!supervisor.isShuttingDown()) {
                LOG_INFO("\n" + StatusReporter::formatTable(snapshot.streams) +
                         StatusReporter::remoteAccessHint(snapshot.streamHost, snapshot.hostAddress));
            }
            StatusReporter::writeStatusFile(statusFile, snapshot);
        });

        auto runPass = [&]() {
            if (supervisor.isShuttingDown()) {
                return;
            }
            if (!rules.load()) {
                LOG_WARNING("Using previously loaded mapping rules");
            }
            supervisor.reconcile(enumerator.listCaptureDevices());
        };

        QTimer rescanTimer;
        QObject::connect(&rescanTimer, &QTimer::timeout, runPass);
        rescanTimer.start(config.getInt("rescanIntervalMs", RESCAN_INTERVAL));

        // ALSA registers a card some time after the USB device appears.
        QTimer settleTimer;
        settleTimer.setSingleShot(true);
        settleTimer.setInterval(config.getInt("hotplugSettleMs", HOTPLUG_SETTLE));
        QObject::connect(&settleTimer, &QTimer::timeout, runPass);

        DeviceManager deviceManager;
        QObject::connect(&deviceManager, &DeviceManager::devicesChanged, [&]() {
            LOG_DEBUG("USB devices changed, rescanning after settle delay");
            settleTimer.start();
        });
        deviceManager.startMonitoring();

        QObject::connect(&signalBridge, &SignalBridge::reloadRequested, runPass);
        QObject::connect(&signalBridge, &SignalBridge::terminationRequested, [&](int) {
            rescanTimer.stop();
            settleTimer.stop();
            deviceManager.stopMonitoring();
            supervisor.shutdown();
            app.quit();
        });

        QTimer::singleShot(0, runPass);
        LOG_INFO("Audio RTSP supervisor started");

        int result = app.exec();
        supervisor.shutdown();
        LOG_INFO("Audio RTSP supervisor stopped");
        return result;

    } catch (const std::exception& e) {
        LOG_CRITICAL(e.what());
        return ExitCodes::FAILURE;
    }
}
