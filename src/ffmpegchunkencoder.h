#ifndef FFMPEGCHUNKENCODER_H
#define FFMPEGCHUNKENCODER_H

#include "videoencoder.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/imgutils.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
}

/**
 * H.264/H.265 chunk writer using the FFmpeg C API.
 * BGR frames are converted to YUV420P with libswscale; bitrate and GOP
 * come from CompressionSettings.
 */
class FfmpegChunkEncoder : public VideoEncoder
{
public:
    FfmpegChunkEncoder();
    ~FfmpegChunkEncoder() override;

    FfmpegChunkEncoder(const FfmpegChunkEncoder&) = delete;
    FfmpegChunkEncoder& operator=(const FfmpegChunkEncoder&) = delete;

    bool open(const QString& filePath, const CompressionSettings& settings) override;
    bool appendFrame(FrameBuffer&& frame) override;
    bool finish(CompressedChunk& chunk) override;
    void cancel() override;

    int frameCount() const override { return m_frameCount; }
    QString lastError() const override { return m_lastError; }

    /**
     * Name of the libavcodec encoder that open() selected, e.g. "libx264"
     */
    QString encoderName() const { return m_encoderName; }

private:
    bool encode(AVFrame* frame);
    bool fail(const QString& message, int averror = 0);
    void close();

    QString m_filePath;
    CompressionSettings m_settings;
    QString m_encoderName;
    QString m_lastError;

    AVFormatContext* m_formatContext;
    AVCodecContext* m_codecContext;
    AVStream* m_stream;
    AVFrame* m_frame;
    AVPacket* m_packet;
    SwsContext* m_swsContext;

    int m_frameCount;
    qint64 m_rawBytes;
    bool m_headerWritten;
};

#endif // FFMPEGCHUNKENCODER_H
