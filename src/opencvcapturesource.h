#ifndef OPENCVCAPTURESOURCE_H
#define OPENCVCAPTURESOURCE_H

#include "capturesource.h"
#include <opencv2/videoio.hpp>

/**
 * CaptureSource backed by cv::VideoCapture.
 *
 * The source spec is either a device index ("0"), a file path, or a
 * GStreamer pipeline (anything containing '!'), e.g.
 * "ximagesrc use-damage=0 ! videoconvert ! appsink".
 */
class OpenCvCaptureSource : public CaptureSource
{
public:
    explicit OpenCvCaptureSource(const QString& sourceSpec);
    ~OpenCvCaptureSource() override;

    bool hasPermission() const override;
    bool open() override;
    void close() override;
    bool isOpen() const override;
    bool grabFrame(cv::Mat& frame) override;
    int displayCount() const override { return 1; }
    CaptureFault lastFault() const override { return m_lastFault; }
    QString lastError() const override { return m_lastError; }

    QString sourceSpec() const { return m_sourceSpec; }

private:
    bool isDeviceIndex(int* index = nullptr) const;
    bool isPipeline() const;
    void fail(CaptureFault fault, const QString& message);

    QString m_sourceSpec;
    cv::VideoCapture m_capture;
    CaptureFault m_lastFault = CaptureFault::None;
    QString m_lastError;
};

#endif // OPENCVCAPTURESOURCE_H
