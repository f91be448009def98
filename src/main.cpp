#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QSocketNotifier>
#include <QTimer>
#include <algorithm>
#include <csignal>
#include <iostream>
#include <memory>
#include <sys/socket.h>
#include <unistd.h>
#include "configmanager.h"
#include "diagnosticslog.h"
#include "framebufferpool.h"
#include "persistencecoordinator.h"
#include "memorymonitor.h"
#include "adaptivecompressioncontroller.h"
#include "opencvcapturesource.h"
#include "ffmpegchunkencoder.h"
#include "recordingcoordinator.h"
#include "retentionmanager.h"

namespace {

int g_signalFd[2] = {-1, -1};

void handleTerminationSignal(int)
{
    char byte = 1;
    ssize_t written = ::write(g_signalFd[0], &byte, sizeof(byte));
    (void)written;
}

// Route SIGINT/SIGTERM into the event loop through a socket pair
bool installSignalHandlers(QCoreApplication& app)
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFd) != 0) {
        return false;
    }

    auto* notifier = new QSocketNotifier(g_signalFd[1], QSocketNotifier::Read, &app);
    QObject::connect(notifier, &QSocketNotifier::activated, &app, [notifier]() {
        notifier->setEnabled(false);
        char byte;
        ssize_t received = ::read(g_signalFd[1], &byte, sizeof(byte));
        (void)received;
        LOG_INFO("Main", "Termination requested");
        QCoreApplication::quit();
    });

    struct sigaction action = {};
    action.sa_handler = handleTerminationSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;
    return ::sigaction(SIGINT, &action, nullptr) == 0 && ::sigaction(SIGTERM, &action, nullptr) == 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application properties
    app.setApplicationName("ScreenChronicle");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("ScreenChronicle");

    QCommandLineParser parser;
    parser.setApplicationDescription("Continuous screen recorder with bounded memory and local retention");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configDumpOption("config-dump", "Print the effective configuration and exit.");
    QCommandLineOption durationOption("duration", "Stop recording after <seconds>.", "seconds");
    QCommandLineOption sourceOption("source", "Capture source: device index, file or GStreamer pipeline.", "spec");
    parser.addOption(configDumpOption);
    parser.addOption(durationOption);
    QCommandLineOption exportOption("export-diagnostics", "Write log entries and latency statistics as JSON on exit.",
                                    "file");
    parser.addOption(sourceOption);
    parser.addOption(exportOption);
    parser.process(app);

    ConfigManager configManager;
    AppConfig config = configManager.loadConfig();
    if (parser.isSet(sourceOption)) {
        config.captureSource = parser.value(sourceOption);
    }

    if (parser.isSet(configDumpOption)) {
        std::cout << ConfigManager::describe(config).toStdString() << std::endl;
        return 0;
    }

    QString configError;
    if (!ConfigManager::validate(config, &configError)) {
        std::cerr << "Invalid configuration: " << configError.toStdString() << std::endl;
        return 1;
    }

    int durationSeconds = 0;
    if (parser.isSet(durationOption)) {
        bool ok = false;
        durationSeconds = parser.value(durationOption).toInt(&ok);
        if (!ok || durationSeconds <= 0) {
            std::cerr << "--duration expects a positive number of seconds" << std::endl;
            return 1;
        }
    }

    DiagnosticsLog& log = DiagnosticsLog::getInstance();
    log.setMinLogLevel(config.logLevel);
    if (!config.logFilePath.isEmpty() && !log.setFileLoggingEnabled(true, config.logFilePath.toStdString())) {
        std::cerr << "Could not open log file " << config.logFilePath.toStdString() << std::endl;
    }

    if (!QDir().mkpath(config.recordingsDirectory)) {
        LOG_CRITICAL("Main", "Could not create recordings directory " + config.recordingsDirectory.toStdString());
        return 1;
    }
    QDir().mkpath(QFileInfo(config.databasePath).absolutePath());

    // Components
    FrameBufferPool pool;

    PersistenceCoordinator store(config.databasePath);
    try {
        store.open();
    } catch (const PersistenceError& e) {
        LOG_CRITICAL("Main", std::string("Could not open database: ") + e.what());
        return 1;
    }

    MemoryMonitor monitor(std::make_unique<LinuxMemoryReader>());
    monitor.setFrameBufferPool(&pool);
    monitor.setPersistenceCoordinator(&store);

    int fps = CompressionSettings::fpsForInterval(config.captureIntervalMs);
    AdaptiveCompressionController compression(
        CompressionSettings::defaults(config.captureWidth, config.captureHeight, fps, config.codec, config.quality));

    OpenCvCaptureSource source(config.captureSource);

    RecorderConfig recorderConfig;
    recorderConfig.recordingsDirectory = config.recordingsDirectory;
    recorderConfig.captureIntervalMs = config.captureIntervalMs;
    recorderConfig.chunkDurationSeconds = config.chunkDurationSeconds;
    recorderConfig.minimumFreeSpaceMB = config.minimumFreeSpaceMB;

    RecordingCoordinator recorder(source, pool, store, compression,
                                  []() { return std::make_unique<FfmpegChunkEncoder>(); },
                                  recorderConfig);

    RetentionManager retention(store, config.recordingsDirectory);

    // Observers
    QObject::connect(&monitor, &MemoryMonitor::alertRaised, &recorder, [&pool](const MemoryAlert& alert) {
        LOG_INFO("Main", "Recommended action: " + alert.recommendedAction.toStdString() +
                 " (" + std::to_string(pool.count()) + " buffers held)");
    });
    QObject::connect(&recorder, &RecordingCoordinator::stateChanged, [](const RecorderState& state) {
        LOG_INFO("Main", "Recorder is " + state.description().toStdString());
    });
    QObject::connect(&recorder, &RecordingCoordinator::errorOccurred, [](const RecordingError& error) {
        LOG_ERROR("Main", error.message.toStdString());
    });
    QObject::connect(&recorder, &RecordingCoordinator::chunkRecorded, [](const CompressedChunk& chunk) {
        LOG_INFO("Main", "Chunk saved: " + chunk.fileRef.toStdString() + " (" +
                 std::to_string(chunk.sizeBytes / 1024) + " KB, " + std::to_string(chunk.frameCount) + " frames)");
    });
    QObject::connect(&retention, &RetentionManager::quotaApproaching, [](qint64 used, qint64 quota) {
        LOG_WARNING("Main", "Storage quota nearly reached: " + std::to_string(used / (1024 * 1024)) + " of " +
                    std::to_string(quota / (1024 * 1024)) + " MB");
    });

    // Orphaned chunk files from a previous run
    try {
        int recovered = store.recoverChunksFromDirectory(config.recordingsDirectory);
        if (recovered > 0) {
            LOG_INFO("Main", "Recovered " + std::to_string(recovered) + " orphaned chunks");
        }
    } catch (const PersistenceError& e) {
        LOG_ERROR("Main", std::string("Chunk recovery failed: ") + e.what());
    }

    if (!installSignalHandlers(app)) {
        LOG_WARNING("Main", "Could not install signal handlers; stop with --duration");
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&]() {
        recorder.stop();
        if (!recorder.waitForWorker(10000)) {
            LOG_ERROR("Main", "Capture worker did not stop within 10 s");
        }
        retention.stopAutomaticCleanup();
        monitor.stopMonitoring();
        store.close();
        LOG_INFO("Main", "Shutdown complete");

        if (parser.isSet(exportOption) &&
            !DiagnosticsLog::getInstance().exportToJson(parser.value(exportOption).toStdString())) {
            LOG_ERROR("Main", "Diagnostics export failed");
        }
    });

    monitor.startMonitoring(config.monitorIntervalSeconds);
    retention.loadSettings();
    retention.startAutomaticCleanup();
    QTimer::singleShot(0, &retention, [&retention]() { retention.performCleanup(); });
    recorder.start();

    if (durationSeconds > 0) {
        QTimer::singleShot(durationSeconds * 1000, &app, &QCoreApplication::quit);
    }

    return app.exec();
}
