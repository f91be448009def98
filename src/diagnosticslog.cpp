#include "diagnosticslog.h"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cmath>
#include <thread>
#include <ctime>
#include <map>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include <QStandardPaths>
#include <QFile>
#include <QFileInfo>
#include <QDir>

namespace {

std::string formatTimestamp(std::chrono::system_clock::time_point timestamp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
    long millis = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()).count() % 1000);

    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);

    std::ostringstream oss;
    oss << buffer << '.' << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

QJsonObject statsToJson(const PerformanceStats& stats) {
    QJsonObject json;
    json["name"] = QString::fromStdString(stats.name);
    json["category"] = QString::fromStdString(stats.category);
    json["count"] = stats.count;
    json["averageMs"] = stats.averageTimeMs;
    json["minMs"] = stats.minTimeMs;
    json["maxMs"] = stats.maxTimeMs;
    json["p95Ms"] = stats.percentile(95.0);
    json["p99Ms"] = stats.percentile(99.0);
    return json;
}

QJsonObject entryToJson(const LogEntry& entry) {
    QJsonObject context;
    for (const auto& item : entry.context) {
        context.insert(QString::fromStdString(item.first), QString::fromStdString(item.second));
    }

    QJsonObject json;
    json["timestamp"] = QString::fromStdString(formatTimestamp(entry.timestamp));
    json["level"] = QString::fromStdString(DiagnosticsLog::logLevelToString(entry.level));
    json["category"] = QString::fromStdString(entry.category);
    json["message"] = QString::fromStdString(entry.message);
    json["thread"] = QString::fromStdString(entry.threadId);
    if (!context.isEmpty()) {
        json["context"] = context;
    }
    return json;
}

} // namespace

std::string DiagnosticsLog::formatEntry(const LogEntry& entry) {
    std::ostringstream line;
    line << formatTimestamp(entry.timestamp) << ' ' << std::left << std::setw(8) << logLevelToString(entry.level)
         << ' ' << entry.category << " [" << entry.threadId << "] " << entry.message;

    // Context keys in sorted order
    std::map<std::string, std::string> ordered(entry.context.begin(), entry.context.end());
    for (const auto& item : ordered) {
        line << ' ' << item.first << '=' << item.second;
    }
    return line.str();
}

// ============================================================================
// PerformanceStats Implementation
// ============================================================================

void PerformanceStats::addMeasurement(double timeMs) {
    if (count == 0) {
        minTimeMs = timeMs;
        maxTimeMs = timeMs;
    } else {
        minTimeMs = std::min(minTimeMs, timeMs);
        maxTimeMs = std::max(maxTimeMs, timeMs);
    }

    count++;
    totalTimeMs += timeMs;
    averageTimeMs = totalTimeMs / count;

    recentMeasurements.push_back(timeMs);
    if (recentMeasurements.size() > MAX_RECENT) {
        recentMeasurements.pop_front();
    }
}

double PerformanceStats::percentile(double percentile) const {
    if (recentMeasurements.empty()) {
        return 0.0;
    }

    std::vector<double> sorted(recentMeasurements.begin(), recentMeasurements.end());
    std::sort(sorted.begin(), sorted.end());

    double clamped = std::max(0.0, std::min(100.0, percentile));
    // Nearest-rank
    size_t rank = static_cast<size_t>(std::ceil(clamped / 100.0 * sorted.size()));
    if (rank == 0) {
        rank = 1;
    }
    return sorted[rank - 1];
}

// ============================================================================
// PerformanceTimer Implementation
// ============================================================================

PerformanceTimer::PerformanceTimer(const std::string& name, const std::string& category, double warnThresholdMs)
    : m_name(name), m_category(category), m_warnThresholdMs(warnThresholdMs),
      m_start(std::chrono::steady_clock::now()) {
}

PerformanceTimer::~PerformanceTimer() {
    if (!m_finished) {
        finish();
    }
}

double PerformanceTimer::finish() {
    if (m_finished) {
        return m_elapsedMs;
    }

    auto elapsed = std::chrono::steady_clock::now() - m_start;
    m_elapsedMs = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count() / 1000.0;
    m_finished = true;

    DiagnosticsLog& log = DiagnosticsLog::getInstance();
    log.recordLatency(m_name, m_category, m_elapsedMs);

    if (m_warnThresholdMs > 0.0 && m_elapsedMs > m_warnThresholdMs) {
        std::ostringstream oss;
        oss << "Slow operation: " << m_name << " took "
            << std::fixed << std::setprecision(2) << m_elapsedMs << " ms (threshold "
            << m_warnThresholdMs << " ms)";
        log.logWarning(m_category.empty() ? "Performance" : m_category, oss.str());
    }

    return m_elapsedMs;
}

// ============================================================================
// DiagnosticsLog Implementation
// ============================================================================

DiagnosticsLog& DiagnosticsLog::getInstance() {
    static DiagnosticsLog instance;
    return instance;
}

DiagnosticsLog::DiagnosticsLog() {
    QString appDataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (appDataDir.isEmpty()) {
        appDataDir = QDir::tempPath();
    }
    m_logFilePath = appDataDir.toStdString() + "/screenchronicle.log";
}

DiagnosticsLog::~DiagnosticsLog() {
    if (m_logFile && m_logFile->is_open()) {
        m_logFile->close();
    }
}

void DiagnosticsLog::recordLatency(const std::string& name, const std::string& category, double durationMs) {
    std::lock_guard<std::mutex> lock(m_latencyMutex);

    auto& stats = m_latencyStats[name];
    if (stats.name.empty()) {
        stats.name = name;
        stats.category = category;
    }
    stats.addMeasurement(durationMs);
}

std::optional<PerformanceStats> DiagnosticsLog::getStats(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_latencyMutex);

    auto it = m_latencyStats.find(name);
    if (it == m_latencyStats.end()) {
        return std::nullopt;
    }
    return it->second;
}

void DiagnosticsLog::log(LogLevel level, const std::string& category, const std::string& message,
                         const std::unordered_map<std::string, std::string>& context) {
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.threadId = getCurrentThreadId();
    entry.context = context;

    {
        std::lock_guard<std::mutex> lock(m_loggingMutex);

        if (level < m_minLogLevel) {
            return;
        }

        m_logEntries.push_back(entry);
        if (m_logEntries.size() > m_maxLogEntries) {
            m_logEntries.pop_front();
        }

        if (m_fileLoggingEnabled) {
            writeLogToFile(entry);
        }
    }

    emit logEntryAdded(entry);

    if (level >= LogLevel::Error) {
        std::cerr << formatEntry(entry) << std::endl;
    }
}

void DiagnosticsLog::logDebug(const std::string& category, const std::string& message,
                              const std::unordered_map<std::string, std::string>& context) {
    log(LogLevel::Debug, category, message, context);
}

void DiagnosticsLog::logInfo(const std::string& category, const std::string& message,
                             const std::unordered_map<std::string, std::string>& context) {
    log(LogLevel::Info, category, message, context);
}

void DiagnosticsLog::logWarning(const std::string& category, const std::string& message,
                                const std::unordered_map<std::string, std::string>& context) {
    log(LogLevel::Warning, category, message, context);
}

void DiagnosticsLog::logError(const std::string& category, const std::string& message,
                              const std::unordered_map<std::string, std::string>& context) {
    log(LogLevel::Error, category, message, context);
}

void DiagnosticsLog::logCritical(const std::string& category, const std::string& message,
                                 const std::unordered_map<std::string, std::string>& context) {
    log(LogLevel::Critical, category, message, context);
}

void DiagnosticsLog::setMinLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(m_loggingMutex);
    m_minLogLevel = level;
}

LogLevel DiagnosticsLog::getMinLogLevel() const {
    std::lock_guard<std::mutex> lock(m_loggingMutex);
    return m_minLogLevel;
}

bool DiagnosticsLog::setFileLoggingEnabled(bool enabled, const std::string& filePath) {
    std::lock_guard<std::mutex> lock(m_loggingMutex);

    if (!filePath.empty()) {
        m_logFilePath = filePath;
    }

    if (m_logFile) {
        m_logFile->close();
        m_logFile.reset();
    }
    m_fileLoggingEnabled = false;

    if (!enabled) {
        return true;
    }

    QDir().mkpath(QFileInfo(QString::fromStdString(m_logFilePath)).absolutePath());
    m_logFile = std::make_unique<std::ofstream>(m_logFilePath, std::ios::app);
    if (!m_logFile->is_open()) {
        std::cerr << "Failed to open log file: " << m_logFilePath << std::endl;
        m_logFile.reset();
        return false;
    }

    m_fileLoggingEnabled = true;
    return true;
}

void DiagnosticsLog::clearLatencyData() {
    std::lock_guard<std::mutex> lock(m_latencyMutex);
    m_latencyStats.clear();
}

void DiagnosticsLog::clearLogEntries() {
    std::lock_guard<std::mutex> lock(m_loggingMutex);
    m_logEntries.clear();
}

bool DiagnosticsLog::exportToJson(const std::string& filePath, int maxEntries) const {
    QJsonArray statsArray;
    {
        std::lock_guard<std::mutex> lock(m_latencyMutex);
        for (const auto& item : m_latencyStats) {
            statsArray.append(statsToJson(item.second));
        }
    }

    QJsonArray entriesArray;
    {
        std::lock_guard<std::mutex> lock(m_loggingMutex);
        size_t skip = 0;
        if (maxEntries > 0 && m_logEntries.size() > static_cast<size_t>(maxEntries)) {
            skip = m_logEntries.size() - static_cast<size_t>(maxEntries);
        }
        for (auto it = m_logEntries.begin() + static_cast<std::ptrdiff_t>(skip); it != m_logEntries.end(); ++it) {
            entriesArray.append(entryToJson(*it));
        }
    }

    QJsonObject root;
    root["latencyStats"] = statsArray;
    root["logEntries"] = entriesArray;

    QFile file(QString::fromStdString(filePath));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        std::cerr << "Cannot export diagnostics to " << filePath << ": " << file.errorString().toStdString() << std::endl;
        return false;
    }
    return file.write(QJsonDocument(root).toJson()) >= 0;
}

std::vector<LogEntry> DiagnosticsLog::getRecentLogEntries(int maxEntries, LogLevel minLevel) const {
    std::lock_guard<std::mutex> lock(m_loggingMutex);

    std::vector<LogEntry> result;
    int count = 0;
    for (auto it = m_logEntries.rbegin(); it != m_logEntries.rend() && count < maxEntries; ++it) {
        if (it->level >= minLevel) {
            result.push_back(*it);
            count++;
        }
    }

    return result;
}

std::string DiagnosticsLog::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

LogLevel DiagnosticsLog::stringToLogLevel(const std::string& levelStr) {
    if (levelStr == "DEBUG") return LogLevel::Debug;
    if (levelStr == "INFO") return LogLevel::Info;
    if (levelStr == "WARNING") return LogLevel::Warning;
    if (levelStr == "ERROR") return LogLevel::Error;
    if (levelStr == "CRITICAL") return LogLevel::Critical;
    return LogLevel::Info;
}

void DiagnosticsLog::writeLogToFile(const LogEntry& entry) {
    if (!m_logFile || !m_logFile->is_open()) {
        return;
    }
    *m_logFile << formatEntry(entry) << '\n';
    m_logFile->flush();
}

std::string DiagnosticsLog::getCurrentThreadId() const {
    std::ostringstream oss;
    oss << std::this_thread::get_id();
    return oss.str();
}
