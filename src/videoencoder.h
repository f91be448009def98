#ifndef VIDEOENCODER_H
#define VIDEOENCODER_H

#include <QString>
#include <functional>
#include <memory>
#include "compressionsettings.h"
#include "framebufferpool.h"

/**
 * Segment encoder. One instance writes one chunk file:
 * open() -> appendFrame()* -> finish() or cancel().
 */
class VideoEncoder
{
public:
    virtual ~VideoEncoder() = default;

    virtual bool open(const QString& filePath, const CompressionSettings& settings) = 0;

    /**
     * Encode a frame. The encoder takes ownership and frees the payload
     * before returning.
     */
    virtual bool appendFrame(FrameBuffer&& frame) = 0;

    /**
     * Flush and close the file
     * @param chunk Receives the size, duration and frame count of the segment
     */
    virtual bool finish(CompressedChunk& chunk) = 0;

    /**
     * Abandon the segment and remove its partial file
     */
    virtual void cancel() = 0;

    virtual int frameCount() const = 0;
    virtual QString lastError() const = 0;
};

using VideoEncoderFactory = std::function<std::unique_ptr<VideoEncoder>()>;

#endif // VIDEOENCODER_H
