#include "captureworker.h"
#include "chunkfilename.h"
#include "diagnosticslog.h"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QMutexLocker>
#include <algorithm>
#include <cmath>

CaptureWorker::CaptureWorker(CaptureSource& source,
                             FrameBufferPool& pool,
                             PersistenceCoordinator& store,
                             AdaptiveCompressionController& compression,
                             VideoEncoderFactory encoderFactory,
                             const CaptureWorkerConfig& config,
                             QObject* parent)
    : QThread(parent),
      m_source(source),
      m_pool(pool),
      m_store(store),
      m_compression(compression),
      m_encoderFactory(std::move(encoderFactory)),
      m_config(config),
      m_firstFrameSeen(false),
      m_captureFault(CaptureFault::None),
      m_stopRequested(false),
      m_segmentsCompleted(0)
{
    qRegisterMetaType<CompressedChunk>("CompressedChunk");
}

CaptureWorker::~CaptureWorker()
{
    requestStop();
    wait();
}

void CaptureWorker::requestStop()
{
    QMutexLocker locker(&m_mutex);
    m_stopRequested = true;
    m_wakeup.wakeAll();
}

bool CaptureWorker::isStopRequested() const
{
    QMutexLocker locker(&m_mutex);
    return m_stopRequested;
}

int CaptureWorker::segmentsCompleted() const
{
    QMutexLocker locker(&m_mutex);
    return m_segmentsCompleted;
}

void CaptureWorker::run()
{
    m_firstFrameSeen = false;

    if (!m_source.isOpen() && !m_source.open()) {
        CaptureFault fault = m_source.lastFault();
        QString message = m_source.lastError();
        if (fault == CaptureFault::PermissionRevoked) {
            emit permissionRevoked();
        } else {
            emit captureFailed(message, CaptureSource::isRetryable(fault));
        }
        return;
    }

    try {
        runSegments();
    } catch (const PersistenceError& e) {
        LOG_ERROR("CaptureWorker", std::string("Store error: ") + e.what());
        abandonSegment();
        emit storeFailed(QString::fromUtf8(e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR("CaptureWorker", std::string("Capture loop error: ") + e.what());
        abandonSegment();
        emit encoderFailed(QString::fromUtf8(e.what()));
    }

    int dropped = m_pool.releaseAll();
    if (dropped > 0) {
        LOG_DEBUG("CaptureWorker", "Released " + std::to_string(dropped) + " unencoded frames");
    }
    m_source.close();
}

// ============================================================================
// Segment loop
// ============================================================================

void CaptureWorker::runSegments()
{
    while (!isStopRequested()) {
        if (!beginSegment()) {
            emit encoderFailed(m_faultMessage);
            return;
        }

        SegmentEnd end = captureSegment();
        if (end == SegmentEnd::Boundary) {
            emit segmentFinishing();
        }

        if (!finishSegment(end)) {
            emit encoderFailed(m_faultMessage);
            return;
        }

        switch (end) {
            case SegmentEnd::Boundary:
                break;
            case SegmentEnd::Stopped:
                return;
            case SegmentEnd::CaptureFault:
                if (m_captureFault == CaptureFault::PermissionRevoked) {
                    emit permissionRevoked();
                } else {
                    emit captureFailed(m_faultMessage, CaptureSource::isRetryable(m_captureFault));
                }
                return;
            case SegmentEnd::EncoderFault:
                emit encoderFailed(m_faultMessage);
                return;
        }
    }
}

bool CaptureWorker::beginSegment()
{
    QDir().mkpath(m_config.recordingsDirectory);

    auto segment = std::make_unique<Segment>();
    segment->startTs = QDateTime::currentSecsSinceEpoch();
    segment->plannedEndTs = segment->startTs + m_config.chunkDurationSeconds;
    segment->fileRef = QDir(m_config.recordingsDirectory)
                           .absoluteFilePath(ChunkFileName::format(segment->startTs, segment->plannedEndTs,
                                                                   m_config.fileExtension));

    segment->chunkId = m_store.registerChunk(segment->fileRef, segment->startTs, segment->plannedEndTs);

    segment->encoder = m_encoderFactory();
    CompressionSettings settings = m_compression.currentSettings();
    settings.fps = CompressionSettings::fpsForInterval(m_config.captureIntervalMs);

    if (!segment->encoder || !segment->encoder->open(segment->fileRef, settings)) {
        m_faultMessage = segment->encoder ? segment->encoder->lastError() : QString("No encoder available");
        if (segment->encoder) {
            segment->encoder->cancel();
        }
        m_store.markFailed(segment->chunkId);
        return false;
    }

    segment->clock.start();
    m_segment = std::move(segment);
    emit segmentStarted(m_segment->chunkId, m_segment->fileRef);
    return true;
}

CaptureWorker::SegmentEnd CaptureWorker::captureSegment()
{
    const qint64 segmentMs = static_cast<qint64>(m_config.chunkDurationSeconds) * 1000;
    QElapsedTimer tick;

    while (true) {
        if (isStopRequested()) {
            return SegmentEnd::Stopped;
        }
        if (m_segment->clock.elapsed() >= segmentMs) {
            return SegmentEnd::Boundary;
        }

        tick.start();

        cv::Mat mat;
        if (!m_source.grabFrame(mat)) {
            m_captureFault = m_source.lastFault();
            m_faultMessage = m_source.lastError();
            return SegmentEnd::CaptureFault;
        }

        m_pool.add(FrameBuffer::fromMat(mat));

        if (!m_firstFrameSeen) {
            m_firstFrameSeen = true;
            emit firstFrameCaptured(m_source.displayCount());
        }

        while (std::optional<FrameHandle> handle = m_pool.takeOldest()) {
            if (!m_segment->encoder->appendFrame(std::move(handle->frame))) {
                m_faultMessage = m_segment->encoder->lastError();
                return SegmentEnd::EncoderFault;
            }
        }

        if (!waitForNextCapture(tick.elapsed())) {
            return SegmentEnd::Stopped;
        }
    }
}

bool CaptureWorker::waitForNextCapture(qint64 elapsedMs)
{
    qint64 remaining = m_config.captureIntervalMs - elapsedMs;

    QMutexLocker locker(&m_mutex);
    if (remaining > 0 && !m_stopRequested) {
        m_wakeup.wait(&m_mutex, static_cast<unsigned long>(remaining));
    }
    return !m_stopRequested;
}

bool CaptureWorker::finishSegment(SegmentEnd reason)
{
    std::unique_ptr<Segment> segment = std::move(m_segment);
    if (!segment) {
        return true;
    }

    if (reason == SegmentEnd::EncoderFault || segment->encoder->frameCount() == 0) {
        segment->encoder->cancel();
        m_store.markFailed(segment->chunkId);
        LOG_INFO("CaptureWorker", "Discarded segment " + std::to_string(segment->chunkId) + " without frames");
        return true;
    }

    CompressedChunk chunk;
    if (!segment->encoder->finish(chunk)) {
        m_faultMessage = segment->encoder->lastError();
        segment->encoder->cancel();
        m_store.markFailed(segment->chunkId);
        return false;
    }

    qint64 endTs = segment->plannedEndTs;
    if (reason != SegmentEnd::Boundary) {
        endTs = std::clamp(QDateTime::currentSecsSinceEpoch(), segment->startTs, segment->plannedEndTs);
    }

    if (endTs != segment->plannedEndTs) {
        QString finalRef = QDir(m_config.recordingsDirectory)
                               .absoluteFilePath(ChunkFileName::format(segment->startTs, endTs,
                                                                       m_config.fileExtension));
        if (!QFile::exists(finalRef) && QFile::rename(segment->fileRef, finalRef)) {
            chunk.fileRef = finalRef;
        } else {
            LOG_WARNING("CaptureWorker", "Could not rename early segment to " + finalRef.toStdString() +
                        ", keeping planned name");
            chunk.fileRef = segment->fileRef;
        }
        m_store.updateChunkSpan(segment->chunkId, endTs, chunk.fileRef);
    }

    m_store.markCompleted(segment->chunkId);

    {
        QMutexLocker locker(&m_mutex);
        m_segmentsCompleted++;
    }
    emit segmentFinished(chunk);

    if (std::optional<CompressionSettings> next = m_compression.analyzeAndAdjust(chunk)) {
        LOG_DEBUG("CaptureWorker", "Next segment bitrate " + std::to_string(next->targetBitrate()) + " bps");
    }
    return true;
}

void CaptureWorker::abandonSegment()
{
    std::unique_ptr<Segment> segment = std::move(m_segment);
    if (!segment) {
        return;
    }

    if (segment->encoder) {
        segment->encoder->cancel();
    }

    try {
        m_store.markFailed(segment->chunkId);
    } catch (const PersistenceError& e) {
        LOG_ERROR("CaptureWorker", "Could not discard segment " + std::to_string(segment->chunkId) + ": " + e.what());
    }
}
