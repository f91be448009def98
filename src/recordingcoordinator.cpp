#include "recordingcoordinator.h"
#include "diagnosticslog.h"
#include <QDir>
#include <QStorageInfo>

RecordingCoordinator::RecordingCoordinator(CaptureSource& source,
                                           FrameBufferPool& pool,
                                           PersistenceCoordinator& store,
                                           AdaptiveCompressionController& compression,
                                           VideoEncoderFactory encoderFactory,
                                           const RecorderConfig& config,
                                           QObject* parent)
    : QObject(parent),
      m_source(source),
      m_pool(pool),
      m_store(store),
      m_compression(compression),
      m_encoderFactory(std::move(encoderFactory)),
      m_config(config),
      m_workerGeneration(0),
      m_displayCount(0),
      m_attempt(1),
      m_restartPending(false),
      m_restartAfterDisplayChange(false),
      m_pausedBySystem(false),
      m_displayReconfiguring(false),
      m_displayDebounceTimer(new QTimer(this)),
      m_retryTimer(new QTimer(this)),
      m_resumeTimer(new QTimer(this))
{
    qRegisterMetaType<RecorderState>("RecorderState");
    qRegisterMetaType<RecordingError>("RecordingError");
    qRegisterMetaType<DisplayChangeEvent>("DisplayChangeEvent");
    qRegisterMetaType<CompressedChunk>("CompressedChunk");

    m_freeSpaceProvider = [](const QString& directory) -> qint64 {
        QStorageInfo storage(directory);
        return storage.isValid() ? storage.bytesAvailable() : -1;
    };

    m_displayDebounceTimer->setSingleShot(true);
    m_retryTimer->setSingleShot(true);
    m_resumeTimer->setSingleShot(true);

    connect(m_displayDebounceTimer, &QTimer::timeout, this, &RecordingCoordinator::onDisplayDebounceElapsed);
    connect(m_retryTimer, &QTimer::timeout, this, &RecordingCoordinator::onRetryTimer);
    connect(m_resumeTimer, &QTimer::timeout, this, [this]() {
        if (m_state.kind() == RecorderState::Kind::Paused) {
            start();
        }
    });
}

RecordingCoordinator::~RecordingCoordinator()
{
    cancelTimers();
    reapWorker();
}

void RecordingCoordinator::setFreeSpaceProvider(FreeSpaceProvider provider)
{
    m_freeSpaceProvider = std::move(provider);
}

bool RecordingCoordinator::waitForWorker(unsigned long timeoutMs)
{
    if (!m_worker) {
        return true;
    }
    return m_worker->wait(timeoutMs);
}

// ============================================================================
// State transitions
// ============================================================================

void RecordingCoordinator::transition(const RecorderState& next, const QString& context)
{
    if (next == m_state) {
        return;
    }

    std::string message = "State " + m_state.description().toStdString() + " -> " + next.description().toStdString();
    if (!context.isEmpty()) {
        message += " (" + context.toStdString() + ")";
    }
    LOG_INFO("Recorder", message);

    m_state = next;
    emit stateChanged(m_state);
}

void RecordingCoordinator::fail(const RecordingError& error)
{
    cancelTimers();
    m_restartPending = false;
    if (m_worker) {
        m_worker->requestStop();
    }

    m_lastError = error;
    LOG_ERROR("Recorder", RecordingError::codeName(error.code).toStdString() + ": " + error.message.toStdString());

    if (m_state.kind() != RecorderState::Kind::Stopping) {
        transition(RecorderState::error(error.code));
    }
    emit errorOccurred(error);
}

void RecordingCoordinator::cancelTimers()
{
    m_displayDebounceTimer->stop();
    m_retryTimer->stop();
    m_resumeTimer->stop();
    m_displayReconfiguring = false;
}

void RecordingCoordinator::start()
{
    if (!m_state.canStart()) {
        LOG_DEBUG("Recorder", "start() ignored in state " + m_state.description().toStdString());
        return;
    }

    cancelTimers();
    m_pausedBySystem = false;

    if (!m_source.hasPermission()) {
        fail(RecordingError::fromCode(RecordingErrorCode::PermissionDenied));
        return;
    }

    QDir().mkpath(m_config.recordingsDirectory);
    qint64 available = m_freeSpaceProvider ? m_freeSpaceProvider(m_config.recordingsDirectory) : -1;
    if (available >= 0 && available < m_config.minimumFreeSpaceMB * 1024 * 1024) {
        fail(RecordingError::storageSpaceLow(available));
        return;
    }

    m_attempt = 1;
    m_restartAfterDisplayChange = false;
    transition(RecorderState::starting());
    launchWorker();
}

void RecordingCoordinator::stop()
{
    cancelTimers();
    m_restartPending = false;
    m_pausedBySystem = false;

    switch (m_state.kind()) {
        case RecorderState::Kind::Idle:
        case RecorderState::Kind::Stopping:
            return;
        default:
            break;
    }

    if (m_worker && m_worker->isRunning()) {
        transition(RecorderState::stopping());
        m_worker->requestStop();
        return;
    }

    transition(RecorderState::stopping());
    reapWorker();
    transition(RecorderState::idle());
}

// ============================================================================
// Worker management
// ============================================================================

void RecordingCoordinator::launchWorker()
{
    if (m_worker && m_worker->isRunning()) {
        // Relaunched from onWorkerFinished once the previous segment is finalized
        m_restartPending = true;
        m_worker->requestStop();
        return;
    }
    reapWorker();

    CaptureWorkerConfig workerConfig;
    workerConfig.recordingsDirectory = m_config.recordingsDirectory;
    workerConfig.captureIntervalMs = m_config.captureIntervalMs;
    workerConfig.chunkDurationSeconds = m_config.chunkDurationSeconds;

    m_worker = std::make_unique<CaptureWorker>(m_source, m_pool, m_store, m_compression,
                                               m_encoderFactory, workerConfig);
    const quint64 generation = ++m_workerGeneration;
    CaptureWorker* worker = m_worker.get();

    // Signals from a replaced worker are dropped
    auto current = [this, generation]() { return generation == m_workerGeneration; };

    connect(worker, &CaptureWorker::firstFrameCaptured, this, [this, current](int displayCount) {
        if (current()) onFirstFrame(displayCount);
    });
    connect(worker, &CaptureWorker::segmentStarted, this, [this, current](qint64, const QString&) {
        if (current()) onSegmentStarted();
    });
    connect(worker, &CaptureWorker::segmentFinishing, this, [this, current]() {
        if (current()) onSegmentFinishing();
    });
    connect(worker, &CaptureWorker::segmentFinished, this, [this](const CompressedChunk& chunk) {
        emit chunkRecorded(chunk);
    });
    connect(worker, &CaptureWorker::captureFailed, this, [this, current](const QString& message, bool retryable) {
        if (current()) onCaptureFailed(message, retryable);
    });
    connect(worker, &CaptureWorker::permissionRevoked, this, [this, current]() {
        if (current()) handlePermissionRevoked();
    });
    connect(worker, &CaptureWorker::encoderFailed, this, [this, current](const QString& message) {
        if (current()) fail(RecordingError::fromCode(RecordingErrorCode::CompressionFailed, message));
    });
    connect(worker, &CaptureWorker::storeFailed, this, [this, current](const QString& message) {
        if (current()) fail(RecordingError::fromCode(RecordingErrorCode::DatabaseWriteFailed, message));
    });
    connect(worker, &QThread::finished, this, [this, current]() {
        if (current()) onWorkerFinished();
    });

    worker->start();
}

void RecordingCoordinator::reapWorker()
{
    if (!m_worker) {
        return;
    }
    m_worker->requestStop();
    if (!m_worker->wait(WORKER_STOP_TIMEOUT_MS)) {
        LOG_WARNING("Recorder", "Capture worker did not stop within " + std::to_string(WORKER_STOP_TIMEOUT_MS) +
                    " ms, waiting for segment finalization");
        // A running QThread must not be destroyed
        m_worker->wait();
    }
    m_worker.reset();
}

void RecordingCoordinator::onWorkerFinished()
{
    reapWorker();

    switch (m_state.kind()) {
        case RecorderState::Kind::Stopping:
            transition(RecorderState::idle(), "worker finished");
            break;
        case RecorderState::Kind::Starting:
            if (m_restartPending) {
                m_restartPending = false;
                launchWorker();
            }
            break;
        case RecorderState::Kind::Recording:
        case RecorderState::Kind::Finishing:
            LOG_WARNING("Recorder", "Capture worker exited unexpectedly");
            transition(RecorderState::idle(), "worker exited");
            break;
        default:
            break;
    }
}

void RecordingCoordinator::onFirstFrame(int displayCount)
{
    m_displayCount = displayCount;
    m_attempt = 1;
    m_restartAfterDisplayChange = false;

    if (m_state.kind() == RecorderState::Kind::Starting) {
        transition(RecorderState::recording(displayCount), "first frame");
    }
}

void RecordingCoordinator::onSegmentStarted()
{
    if (m_state.kind() == RecorderState::Kind::Finishing) {
        transition(RecorderState::recording(m_displayCount), "segment rotated");
    }
}

void RecordingCoordinator::onSegmentFinishing()
{
    if (m_state.kind() == RecorderState::Kind::Recording) {
        transition(RecorderState::finishing(), "chunk boundary");
    }
}

void RecordingCoordinator::onCaptureFailed(const QString& message, bool retryable)
{
    if (!m_state.isActive()) {
        LOG_DEBUG("Recorder", "Capture fault ignored in state " + m_state.description().toStdString() +
                  ": " + message.toStdString());
        return;
    }

    if (retryable && m_attempt < m_config.maxStartAttempts) {
        int delayMs = m_attempt * m_config.retryBaseDelayMs;
        LOG_WARNING("Recorder", "Capture attempt " + std::to_string(m_attempt) + "/" +
                    std::to_string(m_config.maxStartAttempts) + " failed (" + message.toStdString() +
                    "), retrying in " + std::to_string(delayMs) + " ms");
        m_attempt++;
        transition(RecorderState::starting(), "retry");
        m_retryTimer->start(delayMs);
        return;
    }

    LOG_ERROR("Recorder", std::string(retryable ? "Retries exhausted: " : "Non-retryable capture fault: ") +
              message.toStdString());
    fail(RecordingError::fromCode(m_restartAfterDisplayChange ? RecordingErrorCode::DisplayConfigurationChanged
                                                              : RecordingErrorCode::FrameCaptureTimeout));
}

void RecordingCoordinator::onRetryTimer()
{
    if (m_state.kind() == RecorderState::Kind::Starting) {
        launchWorker();
    }
}

// ============================================================================
// System events
// ============================================================================

void RecordingCoordinator::pauseForSystemEvent(const QString& context)
{
    if (!m_state.isActive()) {
        return;
    }

    cancelTimers();
    m_restartPending = false;
    m_pausedBySystem = true;
    if (m_worker) {
        m_worker->requestStop();
    }
    transition(RecorderState::paused(), context);
}

void RecordingCoordinator::scheduleResume(int delayMs, const QString& context)
{
    if (m_state.kind() != RecorderState::Kind::Paused || !m_pausedBySystem) {
        return;
    }
    LOG_INFO("Recorder", "Resuming after " + context.toStdString() + " in " + std::to_string(delayMs) + " ms");
    m_resumeTimer->start(delayMs);
}

void RecordingCoordinator::handleSystemSleep()
{
    pauseForSystemEvent("system sleep");
}

void RecordingCoordinator::handleSystemWake()
{
    scheduleResume(m_config.wakeResumeDelayMs, "wake");
}

void RecordingCoordinator::handleScreenLocked()
{
    pauseForSystemEvent("screen locked");
}

void RecordingCoordinator::handleScreenUnlocked()
{
    scheduleResume(m_config.unlockResumeDelayMs, "unlock");
}

void RecordingCoordinator::handlePermissionRevoked()
{
    if (m_state.kind() == RecorderState::Kind::Idle) {
        return;
    }
    fail(RecordingError::fromCode(RecordingErrorCode::PermissionDenied));
}

void RecordingCoordinator::handleDisplayChange(const DisplayChangeEvent& event)
{
    if (!m_state.isActive()) {
        return;
    }

    LOG_INFO("Recorder", event.description().toStdString());

    if (!event.isSettled()) {
        // Wait for the layout to settle before restarting
        m_displayReconfiguring = true;
        m_displayDebounceTimer->stop();
        return;
    }

    m_displayReconfiguring = false;
    m_displayDebounceTimer->start(m_config.displayDebounceMs);
}

void RecordingCoordinator::onDisplayDebounceElapsed()
{
    if (!m_state.isActive() || m_displayReconfiguring) {
        return;
    }

    m_retryTimer->stop();
    m_restartAfterDisplayChange = true;
    m_attempt = 1;
    transition(RecorderState::starting(), "display change");

    if (m_worker && m_worker->isRunning()) {
        m_restartPending = true;
        m_worker->requestStop();
    } else {
        launchWorker();
    }
}
