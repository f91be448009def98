#include <gtest/gtest.h>
#include "fakes.h"
#include "framebufferpool.h"
#include "memorymonitor.h"

namespace {

const QDateTime kEpoch = QDateTime::fromSecsSinceEpoch(1700000000);

MemorySnapshot snapshotAt(int secondsAfterEpoch, double usedMB, double availableMB = 10000.0)
{
    MemorySnapshot snapshot;
    snapshot.timestamp = kEpoch.addSecs(secondsAfterEpoch);
    snapshot.usedMemoryMB = usedMB;
    snapshot.availableMemoryMB = availableMB;
    snapshot.bufferCount = 7;
    return snapshot;
}

class MemoryMonitorTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        auto reader = std::make_unique<FakeMemoryReader>();
        m_reader = reader.get();
        m_monitor = std::make_unique<MemoryMonitor>(std::move(reader));
        m_monitor->onAlert([this](const MemoryAlert& alert) { m_alerts.push_back(alert); });
    }

    // 30 samples, 10 s apart, rising linearly from 500 to 585 MB
    void feedSteadyGrowth()
    {
        for (int i = 0; i < 30; ++i) {
            m_monitor->processSnapshot(snapshotAt(i * 10, 500.0 + 85.0 * i / 29.0));
        }
    }

    FakeMemoryReader* m_reader = nullptr;
    std::unique_ptr<MemoryMonitor> m_monitor;
    std::vector<MemoryAlert> m_alerts;
};

} // namespace

TEST(MemorySnapshotTest, PressureFollowsUsagePercent)
{
    EXPECT_EQ(snapshotAt(0, 740.0, 260.0).pressure(), MemoryPressure::Normal);
    EXPECT_EQ(snapshotAt(0, 750.0, 250.0).pressure(), MemoryPressure::Warning);
    EXPECT_EQ(snapshotAt(0, 899.0, 101.0).pressure(), MemoryPressure::Warning);
    EXPECT_EQ(snapshotAt(0, 900.0, 100.0).pressure(), MemoryPressure::Critical);
    EXPECT_DOUBLE_EQ(snapshotAt(0, 300.0, 700.0).memoryUsagePercent(), 30.0);
    EXPECT_DOUBLE_EQ(snapshotAt(0, 0.0, 0.0).memoryUsagePercent(), 0.0);
}

TEST_F(MemoryMonitorTest, CurrentSnapshotReadsCollaborators)
{
    FrameBufferPool pool(8);
    pool.add(FrameBuffer::fromMat(cv::Mat(4, 4, CV_8UC3, cv::Scalar::all(0))));
    pool.add(FrameBuffer::fromMat(cv::Mat(4, 4, CV_8UC3, cv::Scalar::all(0))));
    m_monitor->setFrameBufferPool(&pool);

    MemorySnapshot snapshot = m_monitor->currentSnapshot();
    EXPECT_DOUBLE_EQ(snapshot.usedMemoryMB, 4000.0);
    EXPECT_DOUBLE_EQ(snapshot.availableMemoryMB, 12000.0);
    EXPECT_EQ(snapshot.activeThreadCount, 4);
    EXPECT_EQ(snapshot.bufferCount, 2);
    EXPECT_FALSE(snapshot.databaseConnectionCount.has_value());
    EXPECT_TRUE(m_monitor->history().empty());
}

TEST_F(MemoryMonitorTest, UnreadableCountersGiveZeroUsage)
{
    m_reader->fail = true;
    MemorySnapshot snapshot = m_monitor->currentSnapshot();
    EXPECT_DOUBLE_EQ(snapshot.usedMemoryMB, 0.0);
    EXPECT_EQ(snapshot.pressure(), MemoryPressure::Normal);
}

TEST_F(MemoryMonitorTest, StartMonitoringSamplesImmediately)
{
    int snapshots = 0;
    QObject::connect(m_monitor.get(), &MemoryMonitor::snapshotTaken,
                     [&snapshots](const MemorySnapshot&) { snapshots++; });
    m_monitor->startMonitoring(5);

    EXPECT_TRUE(m_monitor->isMonitoring());
    EXPECT_EQ(m_monitor->intervalSeconds(), 5);
    EXPECT_EQ(snapshots, 1);
    EXPECT_EQ(m_monitor->history().size(), 1u);

    m_monitor->stopMonitoring();
    EXPECT_FALSE(m_monitor->isMonitoring());
}

TEST_F(MemoryMonitorTest, NonPositiveIntervalFallsBackToDefault)
{
    m_monitor->startMonitoring(0);
    EXPECT_EQ(m_monitor->intervalSeconds(), MemoryMonitor::DEFAULT_INTERVAL_SECONDS);
    m_monitor->stopMonitoring();
}

TEST_F(MemoryMonitorTest, HistoryIsBounded)
{
    for (int i = 0; i < MemoryMonitor::MAX_HISTORY + 40; ++i) {
        m_monitor->processSnapshot(snapshotAt(i * 10, 1000.0));
    }
    ASSERT_EQ(static_cast<int>(m_monitor->history().size()), MemoryMonitor::MAX_HISTORY);
    EXPECT_EQ(m_monitor->history().front().timestamp, kEpoch.addSecs(400));
}

TEST_F(MemoryMonitorTest, TrendReturnsRecentWindowOldestFirst)
{
    for (int i = 0; i < 60; ++i) {
        m_monitor->processSnapshot(snapshotAt(i * 10, 1000.0 + i));
    }

    std::vector<MemorySnapshot> lastTwoMinutes = m_monitor->trend(2);
    ASSERT_EQ(lastTwoMinutes.size(), 13u);
    EXPECT_EQ(lastTwoMinutes.front().timestamp, kEpoch.addSecs(470));
    EXPECT_EQ(lastTwoMinutes.back().timestamp, kEpoch.addSecs(590));
    EXPECT_TRUE(m_monitor->trend(0).empty());
}

TEST_F(MemoryMonitorTest, WarningThresholdRaisesWarning)
{
    m_monitor->processSnapshot(snapshotAt(0, 800.0, 200.0));

    ASSERT_EQ(m_alerts.size(), 1u);
    EXPECT_EQ(m_alerts[0].severity, AlertSeverity::Warning);
    EXPECT_TRUE(m_alerts[0].message.startsWith("High memory usage: 80.0%"));
    EXPECT_FALSE(m_alerts[0].growthRatePercent.has_value());
}

TEST_F(MemoryMonitorTest, CriticalThresholdRaisesCritical)
{
    m_monitor->processSnapshot(snapshotAt(0, 950.0, 50.0));

    ASSERT_EQ(m_alerts.size(), 1u);
    EXPECT_EQ(m_alerts[0].severity, AlertSeverity::Critical);
    EXPECT_TRUE(m_alerts[0].message.startsWith("Critical memory usage: 95.0%"));
    EXPECT_FALSE(m_alerts[0].recommendedAction.isEmpty());
}

TEST_F(MemoryMonitorTest, AlertsAreDebouncedPerSeverity)
{
    m_monitor->processSnapshot(snapshotAt(0, 950.0, 50.0));
    m_monitor->processSnapshot(snapshotAt(10, 950.0, 50.0));
    m_monitor->processSnapshot(snapshotAt(59, 950.0, 50.0));
    EXPECT_EQ(m_alerts.size(), 1u);

    // A different severity has its own debounce clock
    m_monitor->processSnapshot(snapshotAt(20, 800.0, 200.0));
    EXPECT_EQ(m_alerts.size(), 2u);

    m_monitor->processSnapshot(snapshotAt(60, 950.0, 50.0));
    ASSERT_EQ(m_alerts.size(), 3u);
    EXPECT_EQ(m_alerts[2].severity, AlertSeverity::Critical);
}

TEST_F(MemoryMonitorTest, NormalUsageRaisesNothing)
{
    for (int i = 0; i < 40; ++i) {
        m_monitor->processSnapshot(snapshotAt(i * 10, 500.0));
    }
    EXPECT_TRUE(m_alerts.empty());
}

TEST_F(MemoryMonitorTest, SteadyGrowthIsReportedAsLeak)
{
    feedSteadyGrowth();

    ASSERT_EQ(m_alerts.size(), 1u);
    const MemoryAlert& alert = m_alerts[0];
    EXPECT_EQ(alert.severity, AlertSeverity::Critical);
    ASSERT_TRUE(alert.growthRatePercent.has_value());
    EXPECT_NEAR(*alert.growthRatePercent, 17.0, 0.01);
    ASSERT_TRUE(alert.detectionWindowSeconds.has_value());
    EXPECT_DOUBLE_EQ(*alert.detectionWindowSeconds, 290.0);
    EXPECT_TRUE(alert.message.startsWith("Memory leak detected"));
    EXPECT_TRUE(alert.recommendedAction.contains("7 buffers"));
}

TEST_F(MemoryMonitorTest, LeakNeedsAFullWindow)
{
    for (int i = 0; i < 29; ++i) {
        m_monitor->processSnapshot(snapshotAt(i * 10, 500.0 + 10.0 * i));
    }
    EXPECT_TRUE(m_alerts.empty());

    m_monitor->processSnapshot(snapshotAt(290, 800.0));
    EXPECT_EQ(m_alerts.size(), 1u);
}

TEST_F(MemoryMonitorTest, SpikeThatFallsBackIsNotALeak)
{
    for (int i = 0; i <= 30; ++i) {
        double used = 500.0;
        if (i >= 10 && i < 20) {
            used = 900.0;
        } else if (i >= 20) {
            used = 560.0;
        }
        m_monitor->processSnapshot(snapshotAt(i * 10, used));
    }
    EXPECT_TRUE(m_alerts.empty());
}

TEST_F(MemoryMonitorTest, GrowthBelowThresholdIsNotALeak)
{
    for (int i = 0; i <= 30; ++i) {
        m_monitor->processSnapshot(snapshotAt(i * 10, 500.0 + 20.0 * i / 30.0));
    }
    EXPECT_TRUE(m_alerts.empty());
}

TEST_F(MemoryMonitorTest, LeakAlertSharesCriticalDebounce)
{
    feedSteadyGrowth();
    ASSERT_EQ(m_alerts.size(), 1u);

    for (int t = 300; t < 350; t += 10) {
        m_monitor->processSnapshot(snapshotAt(t, 590.0 + (t - 300)));
    }
    EXPECT_EQ(m_alerts.size(), 1u);

    m_monitor->processSnapshot(snapshotAt(350, 650.0));
    EXPECT_EQ(m_alerts.size(), 2u);
}

TEST(MemoryLeakDetectionTest, DetectLeakOnRawWindows)
{
    std::vector<MemorySnapshot> tooShort = {snapshotAt(0, 100.0), snapshotAt(10, 200.0)};
    EXPECT_FALSE(MemoryMonitor::detectLeak(tooShort).has_value());

    std::vector<MemorySnapshot> rising;
    for (int i = 0; i < 9; ++i) {
        rising.push_back(snapshotAt(i * 10, 100.0 + 5.0 * i));
    }
    std::optional<double> growth = MemoryMonitor::detectLeak(rising);
    ASSERT_TRUE(growth.has_value());
    EXPECT_NEAR(*growth, 40.0, 1e-9);

    std::vector<MemorySnapshot> falling(rising.rbegin(), rising.rend());
    EXPECT_FALSE(MemoryMonitor::detectLeak(falling).has_value());

    std::vector<MemorySnapshot> zeroStart = {snapshotAt(0, 0.0), snapshotAt(10, 10.0), snapshotAt(20, 20.0)};
    EXPECT_FALSE(MemoryMonitor::detectLeak(zeroStart).has_value());

    std::vector<MemorySnapshot> steadyClimb;
    std::vector<MemorySnapshot> spike;
    const double climbMB[] = {500.0, 520.0, 540.0, 555.0, 570.0, 585.0};
    const double spikeMB[] = {500.0, 600.0, 620.0, 550.0, 510.0, 505.0};
    for (int i = 0; i < 6; ++i) {
        steadyClimb.push_back(snapshotAt(i * 60, climbMB[i]));
        spike.push_back(snapshotAt(i * 60, spikeMB[i]));
    }
    std::optional<double> climbGrowth = MemoryMonitor::detectLeak(steadyClimb);
    ASSERT_TRUE(climbGrowth.has_value());
    EXPECT_NEAR(*climbGrowth, 17.0, 1e-9);
    EXPECT_FALSE(MemoryMonitor::detectLeak(spike).has_value());
}

TEST_F(MemoryMonitorTest, ForceCleanupReleasesPool)
{
    FrameBufferPool pool(8);
    for (int i = 0; i < 5; ++i) {
        pool.add(FrameBuffer::fromMat(cv::Mat(4, 4, CV_8UC3, cv::Scalar::all(0))));
    }
    m_monitor->setFrameBufferPool(&pool);

    EXPECT_EQ(m_monitor->forceCleanup(), 5);
    EXPECT_EQ(pool.count(), 0);
}

TEST_F(MemoryMonitorTest, AlertSubscriptionCanBeDisconnected)
{
    std::vector<MemoryAlert> extra;
    QMetaObject::Connection connection = m_monitor->onAlert([&extra](const MemoryAlert& alert) {
        extra.push_back(alert);
    });

    m_monitor->processSnapshot(snapshotAt(0, 800.0, 200.0));
    EXPECT_EQ(extra.size(), 1u);

    QObject::disconnect(connection);
    m_monitor->processSnapshot(snapshotAt(100, 800.0, 200.0));
    EXPECT_EQ(extra.size(), 1u);
    EXPECT_EQ(m_alerts.size(), 2u);
}
