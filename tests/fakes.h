#ifndef TESTS_FAKES_H
#define TESTS_FAKES_H

#include <QCoreApplication>
#include <QDateTime>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <algorithm>
#include <atomic>
#include <functional>
#include <mutex>
#include <opencv2/core.hpp>
#include "capturesource.h"
#include "memorymonitor.h"
#include "videoencoder.h"

/**
 * Pump the event loop until the predicate holds or the timeout expires
 */
inline bool waitFor(const std::function<bool()>& predicate, int timeoutMs = 5000)
{
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(2);
    }
    return true;
}

/**
 * Pump the event loop for a fixed time
 */
inline void spinFor(int ms)
{
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
        QThread::msleep(2);
    }
}

/**
 * Synthetic capture source producing small solid-colour frames.
 * Faults can be injected from the test thread while the worker is grabbing.
 */
class FakeCaptureSource : public CaptureSource
{
public:
    bool hasPermission() const override { return permission.load(); }

    bool open() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        openCalls++;
        if (failOpensRemaining > 0) {
            failOpensRemaining--;
            m_fault = openFault;
            m_error = "Source not ready";
            return false;
        }
        if (!permission.load()) {
            m_fault = CaptureFault::PermissionRevoked;
            m_error = "Permission denied";
            return false;
        }
        m_open = true;
        m_fault = CaptureFault::None;
        m_error.clear();
        return true;
    }

    void close() override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_open = false;
    }

    bool isOpen() const override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_open;
    }

    bool grabFrame(cv::Mat& frame) override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (pendingFault != CaptureFault::None) {
            m_fault = pendingFault;
            m_error = "Injected capture fault";
            pendingFault = CaptureFault::None;
            m_open = false;
            return false;
        }
        frame = cv::Mat(16, 16, CV_8UC3, cv::Scalar(0, 128, 255));
        framesGrabbed++;
        return true;
    }

    int displayCount() const override { return displays.load(); }

    CaptureFault lastFault() const override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_fault;
    }

    QString lastError() const override
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_error;
    }

    void injectFault(CaptureFault fault)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        pendingFault = fault;
    }

    void failNextOpens(int count, CaptureFault fault)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        failOpensRemaining = count;
        openFault = fault;
    }

    int openCount() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return openCalls;
    }

    std::atomic<bool> permission{true};
    std::atomic<int> displays{1};
    std::atomic<int> framesGrabbed{0};

private:
    mutable std::mutex m_mutex;
    bool m_open = false;
    CaptureFault m_fault = CaptureFault::None;
    QString m_error;
    CaptureFault pendingFault = CaptureFault::None;
    int failOpensRemaining = 0;
    CaptureFault openFault = CaptureFault::SourceUnavailable;
    int openCalls = 0;
};

/**
 * Encoder writing a few bytes per frame to the chunk file
 */
class FakeEncoder : public VideoEncoder
{
public:
    static constexpr int BYTES_PER_FRAME = 64;

    bool open(const QString& filePath, const CompressionSettings& settings) override
    {
        m_settings = settings;
        m_file.setFileName(filePath);
        if (!m_file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
            m_lastError = "Cannot open " + filePath;
            return false;
        }
        return true;
    }

    bool appendFrame(FrameBuffer&& frame) override
    {
        FrameBuffer owned = std::move(frame);
        if (!owned.isValid()) {
            m_lastError = "Invalid frame";
            return false;
        }
        QByteArray bytes(BYTES_PER_FRAME, 'x');
        if (m_file.write(bytes) != bytes.size()) {
            m_lastError = "Short write";
            return false;
        }
        m_frameCount++;
        return true;
    }

    bool finish(CompressedChunk& chunk) override
    {
        QString path = m_file.fileName();
        m_file.close();
        chunk.fileRef = path;
        chunk.sizeBytes = QFileInfo(path).size();
        chunk.frameCount = m_frameCount;
        chunk.durationSeconds = static_cast<double>(m_frameCount) / std::max(1, m_settings.fps);
        chunk.compressionRatio = 1.0;
        chunk.createdAt = QDateTime::currentDateTime();
        chunk.settings = m_settings;
        return true;
    }

    void cancel() override
    {
        QString path = m_file.fileName();
        m_file.close();
        if (!path.isEmpty()) {
            QFile::remove(path);
        }
    }

    int frameCount() const override { return m_frameCount; }
    QString lastError() const override { return m_lastError; }

private:
    QFile m_file;
    CompressionSettings m_settings;
    int m_frameCount = 0;
    QString m_lastError;
};

/**
 * Memory reader returning scripted values
 */
class FakeMemoryReader : public SystemMemoryReader
{
public:
    bool read(SystemMemoryInfo& info) override
    {
        if (fail) {
            return false;
        }
        info.usedMemoryMB = usedMB;
        info.availableMemoryMB = availableMB;
        info.threadCount = threads;
        return true;
    }

    double usedMB = 4000.0;
    double availableMB = 12000.0;
    int threads = 4;
    bool fail = false;
};

#endif // TESTS_FAKES_H
