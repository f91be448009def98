#include "ffmpegchunkencoder.h"
#include "diagnosticslog.h"
#include <QFile>
#include <QFileInfo>

namespace {

QString averrorText(int averror)
{
    char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(averror, buffer, sizeof(buffer));
    return QString::fromUtf8(buffer);
}

} // namespace

FfmpegChunkEncoder::FfmpegChunkEncoder()
    : m_formatContext(nullptr),
      m_codecContext(nullptr),
      m_stream(nullptr),
      m_frame(nullptr),
      m_packet(nullptr),
      m_swsContext(nullptr),
      m_frameCount(0),
      m_rawBytes(0),
      m_headerWritten(false)
{
}

FfmpegChunkEncoder::~FfmpegChunkEncoder()
{
    close();
}

bool FfmpegChunkEncoder::fail(const QString& message, int averror)
{
    m_lastError = averror != 0 ? QString("%1: %2").arg(message, averrorText(averror)) : message;
    LOG_ERROR("Encoder", m_lastError.toStdString());
    return false;
}

bool FfmpegChunkEncoder::open(const QString& filePath, const CompressionSettings& settings)
{
    close();
    m_filePath = filePath;
    m_settings = settings;
    m_frameCount = 0;
    m_rawBytes = 0;
    m_lastError.clear();

    QByteArray path = filePath.toUtf8();
    int ret = avformat_alloc_output_context2(&m_formatContext, nullptr, nullptr, path.constData());
    if (ret < 0 || !m_formatContext) {
        return fail("Could not create output context for " + filePath, ret);
    }

    AVCodecID codecId = settings.codec == VideoCodec::H265 ? AV_CODEC_ID_HEVC : AV_CODEC_ID_H264;
    const AVCodec* codec = avcodec_find_encoder(codecId);
    if (!codec) {
        close();
        return fail("No encoder available for " + CompressionSettings::codecName(settings.codec));
    }
    m_encoderName = QString::fromUtf8(codec->name);

    m_stream = avformat_new_stream(m_formatContext, nullptr);
    if (!m_stream) {
        close();
        return fail("Could not create output stream");
    }

    m_codecContext = avcodec_alloc_context3(codec);
    if (!m_codecContext) {
        close();
        return fail("Could not allocate codec context");
    }

    int fps = settings.fps > 0 ? settings.fps : 1;
    // YUV420P needs even dimensions
    m_codecContext->width = settings.width & ~1;
    m_codecContext->height = settings.height & ~1;
    m_codecContext->pix_fmt = AV_PIX_FMT_YUV420P;
    m_codecContext->time_base = AVRational{1, fps};
    m_codecContext->framerate = AVRational{fps, 1};
    m_codecContext->bit_rate = settings.targetBitrate();
    m_codecContext->gop_size = settings.keyFrameInterval;
    m_codecContext->max_b_frames = 0;

    if (m_formatContext->oformat->flags & AVFMT_GLOBALHEADER) {
        m_codecContext->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    if (av_opt_set(m_codecContext->priv_data, "preset", "veryfast", 0) < 0) {
        LOG_DEBUG("Encoder", "Encoder " + m_encoderName.toStdString() + " has no preset option");
    }

    ret = avcodec_open2(m_codecContext, codec, nullptr);
    if (ret < 0) {
        close();
        return fail("Could not open encoder " + m_encoderName, ret);
    }

    ret = avcodec_parameters_from_context(m_stream->codecpar, m_codecContext);
    if (ret < 0) {
        close();
        return fail("Could not copy codec parameters", ret);
    }
    m_stream->time_base = m_codecContext->time_base;

    if (!(m_formatContext->oformat->flags & AVFMT_NOFILE)) {
        ret = avio_open(&m_formatContext->pb, path.constData(), AVIO_FLAG_WRITE);
        if (ret < 0) {
            close();
            return fail("Could not open " + filePath + " for writing", ret);
        }
    }

    ret = avformat_write_header(m_formatContext, nullptr);
    if (ret < 0) {
        close();
        return fail("Could not write container header", ret);
    }
    m_headerWritten = true;

    m_frame = av_frame_alloc();
    m_packet = av_packet_alloc();
    if (!m_frame || !m_packet) {
        close();
        return fail("Could not allocate frame or packet");
    }

    m_frame->format = m_codecContext->pix_fmt;
    m_frame->width = m_codecContext->width;
    m_frame->height = m_codecContext->height;
    ret = av_frame_get_buffer(m_frame, 0);
    if (ret < 0) {
        close();
        return fail("Could not allocate frame buffer", ret);
    }

    LOG_DEBUG("Encoder", "Opened " + filePath.toStdString() + " with " + m_encoderName.toStdString() +
              " at " + std::to_string(m_codecContext->bit_rate) + " bps");
    return true;
}

bool FfmpegChunkEncoder::appendFrame(FrameBuffer&& frame)
{
    FrameBuffer owned(std::move(frame));

    if (!m_codecContext || !m_headerWritten) {
        return fail("Encoder is not open");
    }
    if (!owned.isValid()) {
        return fail("Invalid frame buffer");
    }

    cv::Mat view = owned.getMatView();
    if (view.type() != CV_8UC3) {
        return fail(QString("Unsupported frame type %1, expected BGR").arg(view.type()));
    }

    m_swsContext = sws_getCachedContext(m_swsContext,
                                        view.cols, view.rows, AV_PIX_FMT_BGR24,
                                        m_codecContext->width, m_codecContext->height, AV_PIX_FMT_YUV420P,
                                        SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!m_swsContext) {
        return fail("Could not create colour conversion context");
    }

    int ret = av_frame_make_writable(m_frame);
    if (ret < 0) {
        return fail("Frame is not writable", ret);
    }

    const uint8_t* srcData[1] = {view.data};
    int srcLinesize[1] = {static_cast<int>(view.step[0])};
    sws_scale(m_swsContext, srcData, srcLinesize, 0, view.rows, m_frame->data, m_frame->linesize);

    m_frame->pts = m_frameCount;
    m_rawBytes += static_cast<qint64>(owned.size());

    // The payload is no longer needed once converted
    owned.reset();

    if (!encode(m_frame)) {
        return false;
    }
    m_frameCount++;
    return true;
}

bool FfmpegChunkEncoder::encode(AVFrame* frame)
{
    int ret = avcodec_send_frame(m_codecContext, frame);
    if (ret < 0) {
        return fail("Error sending frame to encoder", ret);
    }

    while (true) {
        ret = avcodec_receive_packet(m_codecContext, m_packet);
        if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
            return true;
        }
        if (ret < 0) {
            return fail("Error receiving packet from encoder", ret);
        }

        av_packet_rescale_ts(m_packet, m_codecContext->time_base, m_stream->time_base);
        m_packet->stream_index = m_stream->index;

        ret = av_interleaved_write_frame(m_formatContext, m_packet);
        av_packet_unref(m_packet);
        if (ret < 0) {
            return fail("Error writing packet", ret);
        }
    }
}

bool FfmpegChunkEncoder::finish(CompressedChunk& chunk)
{
    if (!m_codecContext || !m_headerWritten) {
        return fail("Encoder is not open");
    }

    bool flushed = encode(nullptr);

    int ret = av_write_trailer(m_formatContext);
    if (ret < 0) {
        close();
        return fail("Could not write container trailer", ret);
    }
    if (!flushed) {
        close();
        return false;
    }

    int fps = m_codecContext->framerate.num > 0 ? m_codecContext->framerate.num : 1;
    close();

    QFileInfo info(m_filePath);
    chunk.fileRef = m_filePath;
    chunk.sizeBytes = info.exists() ? info.size() : 0;
    chunk.frameCount = m_frameCount;
    chunk.durationSeconds = static_cast<double>(m_frameCount) / fps;
    chunk.compressionRatio = chunk.sizeBytes > 0 ? static_cast<double>(m_rawBytes) / chunk.sizeBytes : 0.0;
    chunk.createdAt = QDateTime::currentDateTime();
    chunk.settings = m_settings;
    return true;
}

void FfmpegChunkEncoder::cancel()
{
    close();
    if (!m_filePath.isEmpty() && QFile::exists(m_filePath) && !QFile::remove(m_filePath)) {
        LOG_WARNING("Encoder", "Could not remove cancelled segment " + m_filePath.toStdString());
    }
}

void FfmpegChunkEncoder::close()
{
    if (m_frame) {
        av_frame_free(&m_frame);
    }
    if (m_packet) {
        av_packet_free(&m_packet);
    }
    if (m_swsContext) {
        sws_freeContext(m_swsContext);
        m_swsContext = nullptr;
    }
    if (m_codecContext) {
        avcodec_free_context(&m_codecContext);
    }
    if (m_formatContext) {
        if (m_formatContext->pb && !(m_formatContext->oformat->flags & AVFMT_NOFILE)) {
            avio_closep(&m_formatContext->pb);
        }
        avformat_free_context(m_formatContext);
        m_formatContext = nullptr;
    }
    m_stream = nullptr;
    m_headerWritten = false;
}
