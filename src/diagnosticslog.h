#ifndef DIAGNOSTICSLOG_H
#define DIAGNOSTICSLOG_H

#include <chrono>
#include <string>
#include <vector>
#include <deque>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <fstream>
#include <optional>
#include <QObject>

/**
 * Latency statistics for one named operation
 * Keeps a bounded window of recent samples so percentiles reflect current behaviour
 */
struct PerformanceStats {
    std::string name;
    std::string category;
    int count = 0;
    double totalTimeMs = 0.0;
    double averageTimeMs = 0.0;
    double minTimeMs = 0.0;
    double maxTimeMs = 0.0;
    std::deque<double> recentMeasurements;

    static constexpr size_t MAX_RECENT = 1000;

    void addMeasurement(double timeMs);

    /**
     * Percentile over the recent window
     * @param percentile Value in [0, 100]
     * @return Latency in milliseconds, 0 when no samples exist
     */
    double percentile(double percentile) const;
};

/**
 * RAII timer that reports its lifetime to DiagnosticsLog
 * Logs a warning when the measured duration exceeds warnThresholdMs (if > 0)
 */
class PerformanceTimer {
public:
    PerformanceTimer(const std::string& name, const std::string& category = "", double warnThresholdMs = 0.0);
    ~PerformanceTimer();

    PerformanceTimer(const PerformanceTimer&) = delete;
    PerformanceTimer& operator=(const PerformanceTimer&) = delete;

    /**
     * Stop the timer early
     * @return Elapsed milliseconds
     */
    double finish();

private:
    std::string m_name;
    std::string m_category;
    double m_warnThresholdMs;
    std::chrono::steady_clock::time_point m_start;
    bool m_finished = false;
    double m_elapsedMs = 0.0;
};

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error,
    Critical
};

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string category;
    std::string message;
    std::string threadId;
    std::unordered_map<std::string, std::string> context;
};

/**
 * Process-wide structured log and latency registry
 *
 * Used by every component for logging and for the latency contracts
 * (pool insertion, store operations, memory sampling). Components are
 * otherwise wired together explicitly; this is the only shared instance.
 */
class DiagnosticsLog : public QObject {
    Q_OBJECT

public:
    static DiagnosticsLog& getInstance();

    /**
     * Record one latency sample
     * @param name Operation name
     * @param category Grouping category
     * @param durationMs Measured duration
     */
    void recordLatency(const std::string& name, const std::string& category, double durationMs);

    /**
     * Get a copy of the statistics for an operation
     * @param name Operation name
     * @return Statistics, or std::nullopt if never measured
     */
    std::optional<PerformanceStats> getStats(const std::string& name) const;

    void log(LogLevel level, const std::string& category, const std::string& message,
             const std::unordered_map<std::string, std::string>& context = {});

    void logDebug(const std::string& category, const std::string& message,
                  const std::unordered_map<std::string, std::string>& context = {});
    void logInfo(const std::string& category, const std::string& message,
                 const std::unordered_map<std::string, std::string>& context = {});
    void logWarning(const std::string& category, const std::string& message,
                    const std::unordered_map<std::string, std::string>& context = {});
    void logError(const std::string& category, const std::string& message,
                  const std::unordered_map<std::string, std::string>& context = {});
    void logCritical(const std::string& category, const std::string& message,
                     const std::unordered_map<std::string, std::string>& context = {});

    void setMinLogLevel(LogLevel level);
    LogLevel getMinLogLevel() const;

    /**
     * Enable or disable appending entries to a file
     * @param enabled Whether to enable file logging
     * @param filePath Path to log file (empty keeps the current path)
     * @return true if the requested state is in effect
     */
    bool setFileLoggingEnabled(bool enabled, const std::string& filePath = "");

    void clearLatencyData();
    void clearLogEntries();

    /**
     * Export log entries and latency statistics to JSON
     * @param filePath Destination file
     * @param maxEntries Maximum number of log entries to export (0 = all)
     * @return true if export was successful
     */
    bool exportToJson(const std::string& filePath, int maxEntries = 0) const;

    /**
     * Get recent log entries, newest first
     */
    std::vector<LogEntry> getRecentLogEntries(int maxEntries = 100, LogLevel minLevel = LogLevel::Debug) const;

    static std::string logLevelToString(LogLevel level);
    static LogLevel stringToLogLevel(const std::string& levelStr);

    /**
     * Render an entry as one line: timestamp, level, category, thread, message, then sorted key=value context
     */
    static std::string formatEntry(const LogEntry& entry);

signals:
    void logEntryAdded(const LogEntry& entry);

private:
    DiagnosticsLog();
    ~DiagnosticsLog();

    DiagnosticsLog(const DiagnosticsLog&) = delete;
    DiagnosticsLog& operator=(const DiagnosticsLog&) = delete;

    void writeLogToFile(const LogEntry& entry);
    std::string getCurrentThreadId() const;

    std::unordered_map<std::string, PerformanceStats> m_latencyStats;

    std::deque<LogEntry> m_logEntries;
    LogLevel m_minLogLevel = LogLevel::Info;
    std::string m_logFilePath;
    std::unique_ptr<std::ofstream> m_logFile;
    bool m_fileLoggingEnabled = false;
    size_t m_maxLogEntries = 10000;

    mutable std::mutex m_latencyMutex;
    mutable std::mutex m_loggingMutex;
};

#define PERF_TIMER(name) PerformanceTimer _perf_timer(name)
#define PERF_TIMER_CAT(name, category) PerformanceTimer _perf_timer(name, category)
#define PERF_TIMER_WARN(name, category, thresholdMs) PerformanceTimer _perf_timer(name, category, thresholdMs)

#define LOG_DEBUG(category, message) DiagnosticsLog::getInstance().logDebug(category, message)
#define LOG_INFO(category, message) DiagnosticsLog::getInstance().logInfo(category, message)
#define LOG_WARNING(category, message) DiagnosticsLog::getInstance().logWarning(category, message)
#define LOG_ERROR(category, message) DiagnosticsLog::getInstance().logError(category, message)
#define LOG_CRITICAL(category, message) DiagnosticsLog::getInstance().logCritical(category, message)

#endif // DIAGNOSTICSLOG_H
