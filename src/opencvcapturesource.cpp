#include "opencvcapturesource.h"
#include "diagnosticslog.h"
#include <QFileInfo>
#include <opencv2/imgproc.hpp>

OpenCvCaptureSource::OpenCvCaptureSource(const QString& sourceSpec)
    : m_sourceSpec(sourceSpec.trimmed())
{
}

OpenCvCaptureSource::~OpenCvCaptureSource()
{
    close();
}

bool OpenCvCaptureSource::isDeviceIndex(int* index) const
{
    bool ok = false;
    int value = m_sourceSpec.toInt(&ok);
    if (ok && index) {
        *index = value;
    }
    return ok && value >= 0;
}

bool OpenCvCaptureSource::isPipeline() const
{
    return m_sourceSpec.contains('!');
}

bool OpenCvCaptureSource::hasPermission() const
{
    int index = 0;
    if (isDeviceIndex(&index)) {
        QFileInfo device(QString("/dev/video%1").arg(index));
        return !device.exists() || device.isReadable();
    }
    if (isPipeline()) {
        return true;
    }
    QFileInfo file(m_sourceSpec);
    return !file.exists() || file.isReadable();
}

bool OpenCvCaptureSource::open()
{
    close();
    m_lastFault = CaptureFault::None;
    m_lastError.clear();

    bool opened = false;
    try {
        int index = 0;
        if (isDeviceIndex(&index)) {
            opened = m_capture.open(index);
        } else if (isPipeline()) {
            opened = m_capture.open(m_sourceSpec.toStdString(), cv::CAP_GSTREAMER);
        } else {
            opened = m_capture.open(m_sourceSpec.toStdString());
        }
    } catch (const cv::Exception& e) {
        fail(CaptureFault::SourceUnavailable, QString("OpenCV error opening %1: %2").arg(m_sourceSpec, e.what()));
        return false;
    }

    if (!opened || !m_capture.isOpened()) {
        fail(CaptureFault::SourceUnavailable, "Could not open capture source " + m_sourceSpec);
        return false;
    }

    LOG_INFO("Capture", "Opened capture source " + m_sourceSpec.toStdString());
    return true;
}

void OpenCvCaptureSource::close()
{
    if (m_capture.isOpened()) {
        m_capture.release();
    }
}

bool OpenCvCaptureSource::isOpen() const
{
    return m_capture.isOpened();
}

bool OpenCvCaptureSource::grabFrame(cv::Mat& frame)
{
    if (!m_capture.isOpened()) {
        fail(CaptureFault::SourceUnavailable, "Capture source is not open");
        return false;
    }

    cv::Mat raw;
    try {
        if (!m_capture.read(raw) || raw.empty()) {
            fail(CaptureFault::StreamInterrupted, "Capture stream returned no frame");
            close();
            return false;
        }
    } catch (const cv::Exception& e) {
        fail(CaptureFault::StreamInterrupted, QString("OpenCV error reading frame: %1").arg(e.what()));
        close();
        return false;
    }

    if (raw.type() == CV_8UC3) {
        frame = raw;
    } else if (raw.type() == CV_8UC4) {
        cv::cvtColor(raw, frame, cv::COLOR_BGRA2BGR);
    } else if (raw.type() == CV_8UC1) {
        cv::cvtColor(raw, frame, cv::COLOR_GRAY2BGR);
    } else {
        fail(CaptureFault::Fatal, QString("Unsupported frame type %1").arg(raw.type()));
        return false;
    }

    m_lastFault = CaptureFault::None;
    return true;
}

void OpenCvCaptureSource::fail(CaptureFault fault, const QString& message)
{
    m_lastFault = fault;
    m_lastError = message;
    LOG_WARNING("Capture", message.toStdString());
}
