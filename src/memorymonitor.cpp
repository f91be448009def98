#include "memorymonitor.h"
#include "diagnosticslog.h"
#include "framebufferpool.h"
#include "persistencecoordinator.h"
#include <QThread>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <numeric>
#include <sstream>
#include <string>

#ifdef __linux__
    #include <sys/sysinfo.h>
#endif
#ifdef __GLIBC__
    #include <malloc.h>
#endif

namespace {

constexpr double kBytesPerMB = 1024.0 * 1024.0;

QString formatPercent(double value)
{
    return QString::number(value, 'f', 1);
}

double averageUsage(const std::vector<MemorySnapshot>& window, size_t begin, size_t end)
{
    double sum = 0.0;
    for (size_t i = begin; i < end; ++i) {
        sum += window[i].usedMemoryMB;
    }
    return sum / static_cast<double>(end - begin);
}

} // namespace

double MemorySnapshot::memoryUsagePercent() const
{
    double total = totalMemoryMB();
    if (total <= 0.0) {
        return 0.0;
    }
    return usedMemoryMB / total * 100.0;
}

MemoryPressure MemorySnapshot::pressure() const
{
    double percent = memoryUsagePercent();
    if (percent >= MemoryMonitor::CRITICAL_THRESHOLD_PERCENT) {
        return MemoryPressure::Critical;
    }
    if (percent >= MemoryMonitor::WARNING_THRESHOLD_PERCENT) {
        return MemoryPressure::Warning;
    }
    return MemoryPressure::Normal;
}

// ============================================================================
// LinuxMemoryReader Implementation
// ============================================================================

bool LinuxMemoryReader::read(SystemMemoryInfo& info)
{
#ifdef __linux__
    struct sysinfo sys;
    if (sysinfo(&sys) != 0) {
        return false;
    }

    double totalMB = static_cast<double>(sys.totalram) * sys.mem_unit / kBytesPerMB;
    double availableMB = readAvailableFromMeminfo().value_or(
        static_cast<double>(sys.freeram + sys.bufferram) * sys.mem_unit / kBytesPerMB);

    info.availableMemoryMB = std::min(availableMB, totalMB);
    info.usedMemoryMB = totalMB - info.availableMemoryMB;
    info.threadCount = readThreadCount();
    return true;
#else
    Q_UNUSED(info);
    return false;
#endif
}

std::optional<double> LinuxMemoryReader::readAvailableFromMeminfo()
{
    std::ifstream meminfo("/proc/meminfo");
    std::string line;
    while (std::getline(meminfo, line)) {
        if (line.compare(0, 13, "MemAvailable:") == 0) {
            std::istringstream iss(line.substr(13));
            double kb = 0.0;
            if (iss >> kb) {
                return kb / 1024.0;
            }
        }
    }
    return std::nullopt;
}

int LinuxMemoryReader::readThreadCount()
{
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, 8, "Threads:") == 0) {
            return std::atoi(line.c_str() + 8);
        }
    }
    return QThread::idealThreadCount();
}

// ============================================================================
// MemoryMonitor Implementation
// ============================================================================

MemoryMonitor::MemoryMonitor(std::unique_ptr<SystemMemoryReader> reader, QObject* parent)
    : QObject(parent),
      m_reader(std::move(reader)),
      m_timer(new QTimer(this))
{
    qRegisterMetaType<MemorySnapshot>("MemorySnapshot");
    qRegisterMetaType<MemoryAlert>("MemoryAlert");

    connect(m_timer, &QTimer::timeout, this, &MemoryMonitor::onTimerTick);
}

MemoryMonitor::~MemoryMonitor()
{
    stopMonitoring();
}

void MemoryMonitor::startMonitoring(int intervalSeconds)
{
    if (intervalSeconds <= 0) {
        LOG_WARNING("MemoryMonitor", "Invalid interval " + std::to_string(intervalSeconds) +
                    "s, using default " + std::to_string(DEFAULT_INTERVAL_SECONDS) + "s");
        intervalSeconds = DEFAULT_INTERVAL_SECONDS;
    }

    m_intervalSeconds = intervalSeconds;
    m_timer->start(intervalSeconds * 1000);
    LOG_INFO("MemoryMonitor", "Monitoring started (interval " + std::to_string(intervalSeconds) + "s)");

    onTimerTick();
}

void MemoryMonitor::stopMonitoring()
{
    if (!m_timer->isActive()) {
        return;
    }
    m_timer->stop();
    LOG_INFO("MemoryMonitor", "Monitoring stopped");
}

bool MemoryMonitor::isMonitoring() const
{
    return m_timer->isActive();
}

MemorySnapshot MemoryMonitor::currentSnapshot() const
{
    PerformanceTimer timer("MemoryMonitor::sample", "MemoryMonitor", SLOW_SAMPLE_WARNING_MS);

    MemorySnapshot snapshot;
    snapshot.timestamp = QDateTime::currentDateTime();

    SystemMemoryInfo info;
    if (m_reader && m_reader->read(info)) {
        snapshot.usedMemoryMB = info.usedMemoryMB;
        snapshot.availableMemoryMB = info.availableMemoryMB;
        snapshot.activeThreadCount = info.threadCount;
    } else {
        LOG_WARNING("MemoryMonitor", "System memory counters unavailable");
    }

    if (m_pool) {
        snapshot.bufferCount = m_pool->diagnostics().currentCount;
    }
    if (m_store) {
        snapshot.databaseConnectionCount = m_store->connectionCount();
    }
    return snapshot;
}

void MemoryMonitor::onTimerTick()
{
    processSnapshot(currentSnapshot());
}

void MemoryMonitor::processSnapshot(const MemorySnapshot& snapshot)
{
    m_history.push_back(snapshot);
    while (static_cast<int>(m_history.size()) > MAX_HISTORY) {
        m_history.pop_front();
    }

    emit snapshotTaken(snapshot);

    checkThresholds(snapshot);
    checkForLeak(snapshot);
}

std::vector<MemorySnapshot> MemoryMonitor::window(const QDateTime& newest, int seconds) const
{
    QDateTime cutoff = newest.addSecs(-seconds);
    std::vector<MemorySnapshot> result;
    for (const MemorySnapshot& snapshot : m_history) {
        if (snapshot.timestamp >= cutoff && snapshot.timestamp <= newest) {
            result.push_back(snapshot);
        }
    }
    return result;
}

std::vector<MemorySnapshot> MemoryMonitor::trend(int lastMinutes) const
{
    if (m_history.empty() || lastMinutes <= 0) {
        return {};
    }
    return window(m_history.back().timestamp, lastMinutes * 60);
}

QMetaObject::Connection MemoryMonitor::onAlert(std::function<void(const MemoryAlert&)> handler)
{
    return connect(this, &MemoryMonitor::alertRaised, this, std::move(handler));
}

int MemoryMonitor::forceCleanup()
{
    int released = 0;
    if (m_pool) {
        released = m_pool->releaseAll();
    }

#ifdef __GLIBC__
    malloc_trim(0);
#endif

    LOG_INFO("MemoryMonitor", "Forced cleanup released " + std::to_string(released) + " frame buffers");
    return released;
}

// ============================================================================
// Alerting
// ============================================================================

bool MemoryMonitor::shouldRaise(AlertSeverity severity, const QDateTime& at)
{
    auto it = m_lastAlertAt.find(severity);
    if (it != m_lastAlertAt.end() && it->second.secsTo(at) < ALERT_DEBOUNCE_SECONDS) {
        return false;
    }
    m_lastAlertAt[severity] = at;
    return true;
}

void MemoryMonitor::raise(MemoryAlert alert)
{
    if (alert.severity == AlertSeverity::Critical) {
        LOG_CRITICAL("MemoryMonitor", alert.message.toStdString());
    } else {
        LOG_WARNING("MemoryMonitor", alert.message.toStdString());
    }
    emit alertRaised(alert);
}

void MemoryMonitor::checkThresholds(const MemorySnapshot& snapshot)
{
    MemoryPressure pressure = snapshot.pressure();
    if (pressure == MemoryPressure::Normal) {
        return;
    }

    AlertSeverity severity = pressure == MemoryPressure::Critical ? AlertSeverity::Critical
                                                                  : AlertSeverity::Warning;
    if (!shouldRaise(severity, snapshot.timestamp)) {
        return;
    }

    QString usage = QString("%1% (%2MB / %3MB)")
                        .arg(formatPercent(snapshot.memoryUsagePercent()))
                        .arg(static_cast<qint64>(snapshot.usedMemoryMB))
                        .arg(static_cast<qint64>(snapshot.totalMemoryMB()));

    MemoryAlert alert;
    alert.timestamp = snapshot.timestamp;
    alert.severity = severity;
    alert.snapshot = snapshot;
    if (severity == AlertSeverity::Critical) {
        alert.message = "Critical memory usage: " + usage;
        alert.recommendedAction = "Pause AI processing, clear buffer cache, or restart app to free memory";
    } else {
        alert.message = "High memory usage: " + usage;
        alert.recommendedAction =
            "Monitor memory usage. Consider pausing AI processing if usage continues to increase.";
    }
    raise(std::move(alert));
}

void MemoryMonitor::checkForLeak(const MemorySnapshot& snapshot)
{
    std::vector<MemorySnapshot> samples = window(snapshot.timestamp, LEAK_WINDOW_SECONDS);

    int required = static_cast<int>(std::ceil(static_cast<double>(LEAK_WINDOW_SECONDS) / m_intervalSeconds));
    if (static_cast<int>(samples.size()) < required) {
        return;
    }

    std::optional<double> growth = detectLeak(samples);
    if (!growth) {
        return;
    }

    if (!shouldRaise(AlertSeverity::Critical, snapshot.timestamp)) {
        return;
    }

    MemoryAlert alert;
    alert.timestamp = snapshot.timestamp;
    alert.severity = AlertSeverity::Critical;
    alert.snapshot = snapshot;
    alert.message = QString("Memory leak detected: %1% growth over 5 minutes").arg(formatPercent(*growth));
    alert.recommendedAction = QString("Memory leak detected. Check buffer count (%1 buffers) and restart app if necessary.")
                                  .arg(snapshot.bufferCount);
    alert.growthRatePercent = growth;
    alert.detectionWindowSeconds = static_cast<double>(samples.front().timestamp.secsTo(samples.back().timestamp));
    raise(std::move(alert));
}

std::optional<double> MemoryMonitor::detectLeak(const std::vector<MemorySnapshot>& window)
{
    if (window.size() < 3) {
        return std::nullopt;
    }

    size_t third = window.size() / 3;
    double first = averageUsage(window, 0, third);
    double middle = averageUsage(window, third, 2 * third);
    double last = averageUsage(window, 2 * third, window.size());

    // A spike that rises and falls inside the window is not a leak
    if (middle < first || last < middle) {
        return std::nullopt;
    }

    double start = window.front().usedMemoryMB;
    double end = window.back().usedMemoryMB;
    if (start <= 0.0) {
        return std::nullopt;
    }

    double growth = (end - start) / start * 100.0;
    if (growth <= LEAK_GROWTH_THRESHOLD_PERCENT) {
        return std::nullopt;
    }
    return growth;
}
