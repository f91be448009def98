#include "compressionsettings.h"
#include <algorithm>
#include <cmath>

CompressionSettings CompressionSettings::defaults(int width, int height, int fps,
                                                  VideoCodec codec, CompressionQuality quality)
{
    CompressionSettings settings;
    settings.codec = codec;
    settings.quality = quality;
    settings.width = width;
    settings.height = height;
    settings.fps = std::max(1, fps);

    double scalingFactor = static_cast<double>(width) * height / (1920.0 * 1080.0);
    settings.baseBitrate = static_cast<int>(BASE_BITS_PER_FRAME * settings.fps * scalingFactor);
    settings.bitrateMultiplier = 1.0;
    settings.keyFrameInterval = DEFAULT_KEYFRAME_INTERVAL;
    return settings;
}

int CompressionSettings::fpsForInterval(int captureIntervalMs)
{
    return std::max(1, static_cast<int>(std::lround(1000.0 / std::max(1, captureIntervalMs))));
}

int CompressionSettings::targetBitrate() const
{
    double bitrate = baseBitrate * qualityFactor(quality) * bitrateMultiplier;
    return std::max(1, static_cast<int>(std::lround(bitrate)));
}

CompressionSettings CompressionSettings::withMultiplier(double multiplier) const
{
    CompressionSettings copy = *this;
    copy.bitrateMultiplier = std::clamp(multiplier, MIN_MULTIPLIER, MAX_MULTIPLIER);
    return copy;
}

QJsonObject CompressionSettings::toJson() const
{
    QJsonObject json;
    json["codec"] = codecName(codec);
    json["quality"] = qualityName(quality);
    json["width"] = width;
    json["height"] = height;
    json["fps"] = fps;
    json["baseBitrate"] = baseBitrate;
    json["bitrateMultiplier"] = bitrateMultiplier;
    json["keyFrameInterval"] = keyFrameInterval;
    return json;
}

bool CompressionSettings::fromJson(const QJsonObject& json, CompressionSettings& out)
{
    const char* required[] = {"codec", "quality", "width", "height", "fps",
                              "baseBitrate", "bitrateMultiplier", "keyFrameInterval"};
    for (const char* key : required) {
        if (!json.contains(key)) {
            return false;
        }
    }

    CompressionSettings parsed;
    parsed.codec = codecFromName(json["codec"].toString());
    parsed.quality = qualityFromName(json["quality"].toString());
    parsed.width = json["width"].toInt();
    parsed.height = json["height"].toInt();
    parsed.fps = json["fps"].toInt();
    parsed.baseBitrate = json["baseBitrate"].toInt();
    parsed.bitrateMultiplier = json["bitrateMultiplier"].toDouble();
    parsed.keyFrameInterval = json["keyFrameInterval"].toInt();

    if (parsed.width <= 0 || parsed.height <= 0 || parsed.fps <= 0 || parsed.baseBitrate <= 0 ||
        parsed.bitrateMultiplier < MIN_MULTIPLIER || parsed.bitrateMultiplier > MAX_MULTIPLIER) {
        return false;
    }

    out = parsed;
    return true;
}

bool CompressionSettings::operator==(const CompressionSettings& other) const
{
    return codec == other.codec &&
           quality == other.quality &&
           width == other.width &&
           height == other.height &&
           fps == other.fps &&
           baseBitrate == other.baseBitrate &&
           std::abs(bitrateMultiplier - other.bitrateMultiplier) < 1e-9 &&
           keyFrameInterval == other.keyFrameInterval;
}

double CompressionSettings::qualityFactor(CompressionQuality quality)
{
    switch (quality) {
        case CompressionQuality::Low:
            return 0.5;
        case CompressionQuality::Medium:
            return 1.0;
        case CompressionQuality::High:
            return 1.5;
        case CompressionQuality::Auto:
            return 1.0;
        default:
            return 1.0;
    }
}

QString CompressionSettings::codecName(VideoCodec codec)
{
    switch (codec) {
        case VideoCodec::H264:
            return "H.264";
        case VideoCodec::H265:
            return "H.265";
        default:
            return "H.264";
    }
}

VideoCodec CompressionSettings::codecFromName(const QString& name)
{
    if (name == "H.265" || name.compare("hevc", Qt::CaseInsensitive) == 0) {
        return VideoCodec::H265;
    }
    return VideoCodec::H264;
}

QString CompressionSettings::qualityName(CompressionQuality quality)
{
    switch (quality) {
        case CompressionQuality::Low:
            return "low";
        case CompressionQuality::Medium:
            return "medium";
        case CompressionQuality::High:
            return "high";
        case CompressionQuality::Auto:
            return "auto";
        default:
            return "auto";
    }
}

CompressionQuality CompressionSettings::qualityFromName(const QString& name)
{
    if (name == "low") {
        return CompressionQuality::Low;
    } else if (name == "medium") {
        return CompressionQuality::Medium;
    } else if (name == "high") {
        return CompressionQuality::High;
    } else {
        return CompressionQuality::Auto;
    }
}
