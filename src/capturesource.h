#ifndef CAPTURESOURCE_H
#define CAPTURESOURCE_H

#include <QString>
#include <opencv2/core.hpp>

enum class CaptureFault {
    None,
    StreamInterrupted,      // Stream stopped mid-recording; retryable
    SourceUnavailable,      // Source could not be opened yet; retryable
    DisplayNotReady,        // No display after wake/unlock/reconfigure; retryable
    PermissionRevoked,
    Fatal
};

/**
 * Producer of screen frames in BGR format
 */
class CaptureSource
{
public:
    virtual ~CaptureSource() = default;

    virtual bool hasPermission() const = 0;

    /**
     * @return false on failure; lastFault() and lastError() describe it
     */
    virtual bool open() = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    /**
     * Grab the next frame
     * @param frame Receives a BGR frame on success
     * @return false on failure; lastFault() and lastError() describe it
     */
    virtual bool grabFrame(cv::Mat& frame) = 0;

    virtual int displayCount() const = 0;
    virtual CaptureFault lastFault() const = 0;
    virtual QString lastError() const = 0;

    static bool isRetryable(CaptureFault fault) {
        return fault == CaptureFault::StreamInterrupted ||
               fault == CaptureFault::SourceUnavailable ||
               fault == CaptureFault::DisplayNotReady;
    }
};

#endif // CAPTURESOURCE_H
