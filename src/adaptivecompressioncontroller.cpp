#include "adaptivecompressioncontroller.h"
#include "diagnosticslog.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <iomanip>

double AdjustmentStatistics::stabilityScore() const
{
    if (averageMultiplier <= 0.0) {
        return 0.0;
    }
    double deviation = std::abs(currentMultiplier - averageMultiplier) / averageMultiplier;
    return std::max(0.0, 1.0 - deviation);
}

AdaptiveCompressionController::AdaptiveCompressionController(const CompressionSettings& initialSettings,
                                                             qint64 targetBytesPerDay)
    : m_settings(initialSettings),
      m_targetBytesPerDay(targetBytesPerDay > 0 ? targetBytesPerDay : DEFAULT_TARGET_BYTES_PER_DAY)
{
    m_settings.bitrateMultiplier = std::clamp(m_settings.bitrateMultiplier,
                                              CompressionSettings::MIN_MULTIPLIER,
                                              CompressionSettings::MAX_MULTIPLIER);
}

qint64 AdaptiveCompressionController::targetChunkBytes(double chunkDurationSeconds) const
{
    return static_cast<qint64>(static_cast<double>(m_targetBytesPerDay) *
                               (chunkDurationSeconds / RECORDING_SECONDS_PER_DAY));
}

std::optional<CompressionSettings> AdaptiveCompressionController::analyzeAndAdjust(const CompressedChunk& chunk)
{
    m_recentChunkSizes.push_back(chunk.sizeBytes);
    while (static_cast<int>(m_recentChunkSizes.size()) > m_windowSize) {
        m_recentChunkSizes.pop_front();
    }

    if (static_cast<int>(m_recentChunkSizes.size()) < m_windowSize) {
        LOG_DEBUG("AdaptiveCompression", "Collecting data (" + std::to_string(m_recentChunkSizes.size()) +
                  "/" + std::to_string(m_windowSize) + " chunks)");
        return std::nullopt;
    }

    qint64 target = targetChunkBytes(chunk.durationSeconds);
    if (target <= 0) {
        LOG_WARNING("AdaptiveCompression", "Ignoring chunk with non-positive duration");
        return std::nullopt;
    }

    qint64 total = std::accumulate(m_recentChunkSizes.begin(), m_recentChunkSizes.end(), qint64(0));
    qint64 average = total / static_cast<qint64>(m_recentChunkSizes.size());
    double deviation = static_cast<double>(average - target) / static_cast<double>(target);

    if (std::abs(deviation) <= m_tolerance) {
        return std::nullopt;
    }

    double previous = m_settings.bitrateMultiplier;
    double proposed = deviation > 0 ? previous - m_step : previous + m_step;
    double next = std::clamp(proposed, CompressionSettings::MIN_MULTIPLIER, CompressionSettings::MAX_MULTIPLIER);

    if (std::abs(next - previous) < 1e-9) {
        LOG_DEBUG("AdaptiveCompression", "Multiplier pinned at bound " + std::to_string(previous));
        return std::nullopt;
    }

    AdjustmentRecord record;
    record.timestamp = QDateTime::currentDateTime();
    record.previousMultiplier = previous;
    record.newMultiplier = next;
    record.deviation = deviation;
    record.averageChunkBytes = average;
    record.targetChunkBytes = target;
    record.reason = deviation > 0 ? "Oversized chunks" : "Undersized chunks";

    m_history.push_back(record);
    while (static_cast<int>(m_history.size()) > MAX_HISTORY) {
        m_history.pop_front();
    }

    m_settings = m_settings.withMultiplier(next);

    std::ostringstream oss;
    oss << "Bitrate multiplier " << std::fixed << std::setprecision(2) << previous << " -> " << next
        << " (" << record.reason.toStdString() << ", deviation " << std::setprecision(1)
        << deviation * 100.0 << "%, avg " << average / 1024 << " KB, target " << target / 1024 << " KB)";
    LOG_INFO("AdaptiveCompression", oss.str());

    return m_settings;
}

AdjustmentStatistics AdaptiveCompressionController::statistics() const
{
    AdjustmentStatistics stats;
    stats.currentMultiplier = m_settings.bitrateMultiplier;
    stats.totalAdjustments = static_cast<int>(m_history.size());

    if (m_history.empty()) {
        stats.averageMultiplier = stats.currentMultiplier;
        stats.minMultiplier = stats.currentMultiplier;
        stats.maxMultiplier = stats.currentMultiplier;
        return stats;
    }

    double sum = 0.0;
    stats.minMultiplier = m_history.front().newMultiplier;
    stats.maxMultiplier = m_history.front().newMultiplier;
    for (const auto& record : m_history) {
        if (record.newMultiplier > record.previousMultiplier) {
            stats.increasedCount++;
        } else if (record.newMultiplier < record.previousMultiplier) {
            stats.decreasedCount++;
        }
        sum += record.newMultiplier;
        stats.minMultiplier = std::min(stats.minMultiplier, record.newMultiplier);
        stats.maxMultiplier = std::max(stats.maxMultiplier, record.newMultiplier);
    }
    stats.averageMultiplier = sum / m_history.size();

    return stats;
}

void AdaptiveCompressionController::reset()
{
    m_settings.bitrateMultiplier = 1.0;
    m_recentChunkSizes.clear();
}
