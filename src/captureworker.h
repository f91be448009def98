#ifndef CAPTUREWORKER_H
#define CAPTUREWORKER_H

#include <QThread>
#include <QMutex>
#include <QWaitCondition>
#include <QElapsedTimer>
#include <memory>
#include "capturesource.h"
#include "videoencoder.h"
#include "framebufferpool.h"
#include "persistencecoordinator.h"
#include "adaptivecompressioncontroller.h"

struct CaptureWorkerConfig {
    QString recordingsDirectory;
    int captureIntervalMs = 1000;
    int chunkDurationSeconds = 900;
    QString fileExtension = "mp4";
};

/**
 * Capture loop running on its own thread.
 *
 * Frames flow source -> FrameBufferPool -> encoder, one segment (chunk) at a
 * time. Each segment is registered pending before encoding and marked
 * completed once the file is closed; a segment without frames is discarded
 * with its record. Faults are reported by signal after the open segment has
 * been closed, and the thread then exits.
 */
class CaptureWorker : public QThread
{
    Q_OBJECT

public:
    CaptureWorker(CaptureSource& source,
                  FrameBufferPool& pool,
                  PersistenceCoordinator& store,
                  AdaptiveCompressionController& compression,
                  VideoEncoderFactory encoderFactory,
                  const CaptureWorkerConfig& config,
                  QObject* parent = nullptr);
    ~CaptureWorker() override;

    /**
     * Finish the current segment early and exit. Interrupts a pending
     * capture wait immediately.
     */
    void requestStop();
    bool isStopRequested() const;

    int segmentsCompleted() const;

signals:
    void firstFrameCaptured(int displayCount);
    void segmentStarted(qint64 chunkId, const QString& fileRef);
    void segmentFinishing();
    void segmentFinished(const CompressedChunk& chunk);

    void captureFailed(const QString& message, bool retryable);
    void permissionRevoked();
    void encoderFailed(const QString& message);
    void storeFailed(const QString& message);

protected:
    void run() override;

private:
    enum class SegmentEnd {
        Boundary,
        Stopped,
        CaptureFault,
        EncoderFault
    };

    struct Segment {
        qint64 chunkId = 0;
        qint64 startTs = 0;
        qint64 plannedEndTs = 0;
        QString fileRef;
        std::unique_ptr<VideoEncoder> encoder;
        QElapsedTimer clock;
    };

    void runSegments();
    bool beginSegment();
    SegmentEnd captureSegment();
    bool finishSegment(SegmentEnd reason);
    void abandonSegment();

    /**
     * Sleep until the next capture tick or a stop request
     * @return false if stop was requested
     */
    bool waitForNextCapture(qint64 elapsedMs);

    CaptureSource& m_source;
    FrameBufferPool& m_pool;
    PersistenceCoordinator& m_store;
    AdaptiveCompressionController& m_compression;
    VideoEncoderFactory m_encoderFactory;
    CaptureWorkerConfig m_config;

    std::unique_ptr<Segment> m_segment;
    bool m_firstFrameSeen;
    QString m_faultMessage;
    CaptureFault m_captureFault;

    mutable QMutex m_mutex;
    QWaitCondition m_wakeup;
    bool m_stopRequested;
    int m_segmentsCompleted;
};

#endif // CAPTUREWORKER_H
