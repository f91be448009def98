#ifndef COMPRESSIONSETTINGS_H
#define COMPRESSIONSETTINGS_H

#include <QString>
#include <QDateTime>
#include <QJsonObject>
#include <QMetaType>

enum class VideoCodec {
    H264,
    H265
};

enum class CompressionQuality {
    Low,
    Medium,
    High,
    Auto
};

/**
 * Encoder parameters for one chunk
 *
 * The effective bitrate is baseBitrate scaled by the quality preset and by
 * the adaptive multiplier, which AdaptiveCompressionController keeps in
 * [MIN_MULTIPLIER, MAX_MULTIPLIER].
 */
struct CompressionSettings {
    static constexpr double MIN_MULTIPLIER = 0.4;
    static constexpr double MAX_MULTIPLIER = 2.0;
    static constexpr int BASE_BITS_PER_FRAME = 560000;
    static constexpr int DEFAULT_KEYFRAME_INTERVAL = 30;

    VideoCodec codec = VideoCodec::H264;
    CompressionQuality quality = CompressionQuality::Auto;
    int width = 1920;
    int height = 1080;
    int fps = 1;
    int baseBitrate = BASE_BITS_PER_FRAME;
    double bitrateMultiplier = 1.0;
    int keyFrameInterval = DEFAULT_KEYFRAME_INTERVAL;

    /**
     * Build settings scaled to the capture resolution
     * Base bitrate is 560 kbit per frame at 1920x1080, scaled by pixel area and fps
     */
    static CompressionSettings defaults(int width, int height, int fps = 1,
                                        VideoCodec codec = VideoCodec::H264,
                                        CompressionQuality quality = CompressionQuality::Auto);

    /**
     * Frame rate for a capture interval, rounded to the nearest whole fps and at least 1
     */
    static int fpsForInterval(int captureIntervalMs);

    /**
     * Bits per second handed to the encoder
     */
    int targetBitrate() const;

    CompressionSettings withMultiplier(double multiplier) const;

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& json, CompressionSettings& out);

    bool operator==(const CompressionSettings& other) const;
    bool operator!=(const CompressionSettings& other) const { return !(*this == other); }

    static double qualityFactor(CompressionQuality quality);
    static QString codecName(VideoCodec codec);
    static VideoCodec codecFromName(const QString& name);
    static QString qualityName(CompressionQuality quality);
    static CompressionQuality qualityFromName(const QString& name);
};

/**
 * A finished, encoded segment as reported by the encoder
 */
struct CompressedChunk {
    QString fileRef;
    qint64 sizeBytes = 0;
    double durationSeconds = 0.0;
    int frameCount = 0;
    double compressionRatio = 0.0;
    QDateTime createdAt;
    CompressionSettings settings;

    qint64 averageBytesPerFrame() const {
        return frameCount > 0 ? sizeBytes / frameCount : 0;
    }
};

Q_DECLARE_METATYPE(CompressedChunk)

#endif // COMPRESSIONSETTINGS_H
