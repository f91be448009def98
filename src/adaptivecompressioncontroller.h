#ifndef ADAPTIVECOMPRESSIONCONTROLLER_H
#define ADAPTIVECOMPRESSIONCONTROLLER_H

#include <deque>
#include <optional>
#include <vector>
#include <QDateTime>
#include <QString>
#include "compressionsettings.h"

/**
 * One multiplier change, kept for diagnostics only
 */
struct AdjustmentRecord {
    QDateTime timestamp;
    double previousMultiplier = 1.0;
    double newMultiplier = 1.0;
    double deviation = 0.0;
    qint64 averageChunkBytes = 0;
    qint64 targetChunkBytes = 0;
    QString reason;
};

struct AdjustmentStatistics {
    int totalAdjustments = 0;
    int increasedCount = 0;
    int decreasedCount = 0;
    double currentMultiplier = 1.0;
    double averageMultiplier = 1.0;
    double minMultiplier = 1.0;
    double maxMultiplier = 1.0;

    /**
     * 1.0 when the current multiplier sits on the historical average, falling toward 0
     */
    double stabilityScore() const;
};

/**
 * Feedback controller that steers chunk sizes toward a storage budget
 *
 * Chunk sizes are collected in a rolling window. Once the window is full
 * its average is compared with the per-chunk target; outside the tolerance
 * band the bitrate multiplier moves one fixed step and is clamped to
 * [CompressionSettings::MIN_MULTIPLIER, CompressionSettings::MAX_MULTIPLIER].
 * Not thread-safe: owned and driven by the capture worker.
 */
class AdaptiveCompressionController
{
public:
    static constexpr int DEFAULT_WINDOW_SIZE = 4;
    static constexpr double DEFAULT_TOLERANCE = 0.10;
    static constexpr double DEFAULT_STEP = 0.10;
    static constexpr qint64 DEFAULT_TARGET_BYTES_PER_DAY = 2LL * 1024 * 1024 * 1024;
    static constexpr double RECORDING_SECONDS_PER_DAY = 8.0 * 60.0 * 60.0;
    static constexpr int MAX_HISTORY = 100;

    explicit AdaptiveCompressionController(const CompressionSettings& initialSettings,
                                           qint64 targetBytesPerDay = DEFAULT_TARGET_BYTES_PER_DAY);

    /**
     * Feed a completed chunk into the controller
     * @param chunk Chunk reported by the encoder
     * @return New settings if the multiplier changed, std::nullopt otherwise
     */
    std::optional<CompressionSettings> analyzeAndAdjust(const CompressedChunk& chunk);

    /**
     * Per-chunk size target for a chunk of the given duration
     */
    qint64 targetChunkBytes(double chunkDurationSeconds) const;

    const CompressionSettings& currentSettings() const { return m_settings; }
    double currentMultiplier() const { return m_settings.bitrateMultiplier; }
    const std::deque<AdjustmentRecord>& history() const { return m_history; }
    AdjustmentStatistics statistics() const;

    /**
     * Restore multiplier 1.0 and clear the analysis window; history is kept
     */
    void reset();

    void setStep(double step) { m_step = step; }
    void setTolerance(double tolerance) { m_tolerance = tolerance; }

private:
    CompressionSettings m_settings;
    qint64 m_targetBytesPerDay;
    int m_windowSize = DEFAULT_WINDOW_SIZE;
    double m_tolerance = DEFAULT_TOLERANCE;
    double m_step = DEFAULT_STEP;

    std::deque<qint64> m_recentChunkSizes;
    std::deque<AdjustmentRecord> m_history;
};

#endif // ADAPTIVECOMPRESSIONCONTROLLER_H
