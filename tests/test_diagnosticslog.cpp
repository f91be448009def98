#include <gtest/gtest.h>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <thread>
#include "diagnosticslog.h"

namespace {

class DiagnosticsLogTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        m_previousLevel = log().getMinLogLevel();
        log().setMinLogLevel(LogLevel::Debug);
        log().clearLogEntries();
        log().clearLatencyData();
    }

    void TearDown() override
    {
        log().setFileLoggingEnabled(false);
        log().clearLogEntries();
        log().setMinLogLevel(m_previousLevel);
    }

    static DiagnosticsLog& log() { return DiagnosticsLog::getInstance(); }

    LogLevel m_previousLevel = LogLevel::Warning;
};

} // namespace

TEST_F(DiagnosticsLogTest, EntriesBelowMinimumLevelAreDropped)
{
    log().setMinLogLevel(LogLevel::Warning);
    LOG_INFO("Test", "quiet");
    LOG_WARNING("Test", "loud");

    std::vector<LogEntry> entries = log().getRecentLogEntries();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message, "loud");
    EXPECT_EQ(entries[0].level, LogLevel::Warning);
    EXPECT_EQ(entries[0].category, "Test");
}

TEST_F(DiagnosticsLogTest, RecentEntriesAreNewestFirstAndFiltered)
{
    LOG_DEBUG("Test", "one");
    LOG_INFO("Test", "two");
    LOG_DEBUG("Test", "three");

    std::vector<LogEntry> all = log().getRecentLogEntries(2);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].message, "three");
    EXPECT_EQ(all[1].message, "two");

    std::vector<LogEntry> info = log().getRecentLogEntries(10, LogLevel::Info);
    ASSERT_EQ(info.size(), 1u);
    EXPECT_EQ(info[0].message, "two");
}

TEST_F(DiagnosticsLogTest, FormatEntryRendersContextInKeyOrder)
{
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.level = LogLevel::Error;
    entry.category = "Store";
    entry.message = "write failed";
    entry.threadId = "42";
    entry.context = {{"zeta", "2"}, {"alpha", "1"}};

    std::string line = DiagnosticsLog::formatEntry(entry);
    EXPECT_NE(line.find("ERROR"), std::string::npos);
    EXPECT_NE(line.find("Store [42] write failed"), std::string::npos);
    EXPECT_NE(line.find("alpha=1 zeta=2"), std::string::npos);
}

TEST_F(DiagnosticsLogTest, LevelNamesRoundTrip)
{
    EXPECT_EQ(DiagnosticsLog::logLevelToString(LogLevel::Critical), "CRITICAL");
    EXPECT_EQ(DiagnosticsLog::stringToLogLevel("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(DiagnosticsLog::stringToLogLevel("nonsense"), LogLevel::Info);
}

TEST_F(DiagnosticsLogTest, PerformanceTimerRecordsLatency)
{
    for (int i = 0; i < 3; ++i) {
        PERF_TIMER_CAT("Test::operation", "Test");
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }

    std::optional<PerformanceStats> stats = log().getStats("Test::operation");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->count, 3);
    EXPECT_EQ(stats->category, "Test");
    EXPECT_GE(stats->minTimeMs, 1.0);
    EXPECT_LE(stats->minTimeMs, stats->maxTimeMs);
    EXPECT_FALSE(log().getStats("Test::never").has_value());
}

TEST_F(DiagnosticsLogTest, SlowOperationLogsWarning)
{
    {
        PERF_TIMER_WARN("Test::slow", "Test", 0.5);
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    std::vector<LogEntry> warnings = log().getRecentLogEntries(10, LogLevel::Warning);
    ASSERT_FALSE(warnings.empty());
    EXPECT_NE(warnings[0].message.find("Test::slow"), std::string::npos);
}

TEST(PerformanceStatsTest, PercentileUsesNearestRank)
{
    PerformanceStats stats;
    EXPECT_DOUBLE_EQ(stats.percentile(95.0), 0.0);

    for (int i = 1; i <= 100; ++i) {
        stats.addMeasurement(static_cast<double>(i));
    }
    EXPECT_DOUBLE_EQ(stats.percentile(95.0), 95.0);
    EXPECT_DOUBLE_EQ(stats.percentile(99.0), 99.0);
    EXPECT_DOUBLE_EQ(stats.percentile(100.0), 100.0);
    EXPECT_DOUBLE_EQ(stats.averageTimeMs, 50.5);
}

TEST(PerformanceStatsTest, RecentWindowIsBounded)
{
    PerformanceStats stats;
    for (size_t i = 0; i < PerformanceStats::MAX_RECENT + 50; ++i) {
        stats.addMeasurement(1.0);
    }
    EXPECT_EQ(stats.recentMeasurements.size(), PerformanceStats::MAX_RECENT);
    EXPECT_EQ(stats.count, static_cast<int>(PerformanceStats::MAX_RECENT + 50));
}

TEST_F(DiagnosticsLogTest, FileLoggingAppendsLines)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    std::string path = dir.filePath("logs/chronicle.log").toStdString();

    ASSERT_TRUE(log().setFileLoggingEnabled(true, path));
    LOG_INFO("Test", "to file");
    log().setFileLoggingEnabled(false);

    QFile file(QString::fromStdString(path));
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    QString contents = QString::fromUtf8(file.readAll());
    EXPECT_TRUE(contents.contains("to file"));
    EXPECT_TRUE(contents.endsWith('\n'));
}

TEST_F(DiagnosticsLogTest, ExportWritesEntriesAndStats)
{
    LOG_INFO("Test", "first");
    LOG_INFO("Test", "second");
    log().recordLatency("Test::export", "Test", 3.0);

    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    QString path = dir.filePath("diagnostics.json");
    ASSERT_TRUE(log().exportToJson(path.toStdString(), 1));

    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::ReadOnly));
    QJsonObject root = QJsonDocument::fromJson(file.readAll()).object();

    QJsonArray entries = root["logEntries"].toArray();
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries[0].toObject()["message"].toString(), "second");
    EXPECT_EQ(entries[0].toObject()["level"].toString(), "INFO");

    QJsonArray stats = root["latencyStats"].toArray();
    ASSERT_EQ(stats.size(), 1);
    EXPECT_EQ(stats[0].toObject()["name"].toString(), "Test::export");
    EXPECT_DOUBLE_EQ(stats[0].toObject()["p95Ms"].toDouble(), 3.0);
}
