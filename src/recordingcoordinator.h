#ifndef RECORDINGCOORDINATOR_H
#define RECORDINGCOORDINATOR_H

#include <QObject>
#include <QTimer>
#include <functional>
#include <memory>
#include <optional>
#include "recorderstate.h"
#include "captureworker.h"

struct RecorderConfig {
    QString recordingsDirectory;
    int captureIntervalMs = 1000;
    int chunkDurationSeconds = 900;
    qint64 minimumFreeSpaceMB = 100;
    int displayDebounceMs = 1000;
    int wakeResumeDelayMs = 5000;
    int unlockResumeDelayMs = 500;
    int maxStartAttempts = 4;
    int retryBaseDelayMs = 1000;
};

/**
 * Recording lifecycle state machine.
 *
 * Owns the capture worker and drives it from start/stop requests, system
 * sleep and lock notifications and display changes. Every state change is
 * published on stateChanged and every fault on errorOccurred.
 */
class RecordingCoordinator : public QObject
{
    Q_OBJECT

public:
    using FreeSpaceProvider = std::function<qint64(const QString& directory)>;

    static constexpr unsigned long WORKER_STOP_TIMEOUT_MS = 5000;

    RecordingCoordinator(CaptureSource& source,
                         FrameBufferPool& pool,
                         PersistenceCoordinator& store,
                         AdaptiveCompressionController& compression,
                         VideoEncoderFactory encoderFactory,
                         const RecorderConfig& config,
                         QObject* parent = nullptr);
    ~RecordingCoordinator() override;

    RecorderState state() const { return m_state; }
    std::optional<RecordingError> lastError() const { return m_lastError; }
    const RecorderConfig& config() const { return m_config; }

    /**
     * Override how free disk space is measured (bytes available in a directory)
     */
    void setFreeSpaceProvider(FreeSpaceProvider provider);

    /**
     * Block until the worker thread has exited
     * @return false if it is still running after timeoutMs
     */
    bool waitForWorker(unsigned long timeoutMs);

public slots:
    void start();
    void stop();

    void handleSystemSleep();
    void handleSystemWake();
    void handleScreenLocked();
    void handleScreenUnlocked();
    void handleDisplayChange(const DisplayChangeEvent& event);
    void handlePermissionRevoked();

signals:
    void stateChanged(const RecorderState& state);
    void errorOccurred(const RecordingError& error);
    void chunkRecorded(const CompressedChunk& chunk);

private:
    void transition(const RecorderState& next, const QString& context = QString());
    void fail(const RecordingError& error);
    void launchWorker();
    void reapWorker();
    void pauseForSystemEvent(const QString& context);
    void scheduleResume(int delayMs, const QString& context);
    void cancelTimers();

    void onFirstFrame(int displayCount);
    void onSegmentStarted();
    void onSegmentFinishing();
    void onCaptureFailed(const QString& message, bool retryable);
    void onWorkerFinished();
    void onDisplayDebounceElapsed();
    void onRetryTimer();

    CaptureSource& m_source;
    FrameBufferPool& m_pool;
    PersistenceCoordinator& m_store;
    AdaptiveCompressionController& m_compression;
    VideoEncoderFactory m_encoderFactory;
    RecorderConfig m_config;
    FreeSpaceProvider m_freeSpaceProvider;

    RecorderState m_state;
    std::optional<RecordingError> m_lastError;

    std::unique_ptr<CaptureWorker> m_worker;
    quint64 m_workerGeneration;
    int m_displayCount;

    int m_attempt;
    bool m_restartPending;
    bool m_restartAfterDisplayChange;
    bool m_pausedBySystem;
    bool m_displayReconfiguring;

    QTimer* m_displayDebounceTimer;
    QTimer* m_retryTimer;
    QTimer* m_resumeTimer;
};

#endif // RECORDINGCOORDINATOR_H
