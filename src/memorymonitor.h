#ifndef MEMORYMONITOR_H
#define MEMORYMONITOR_H

#include <QObject>
#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QTimer>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

class FrameBufferPool;
class PersistenceCoordinator;

enum class MemoryPressure {
    Normal,
    Warning,
    Critical
};

enum class AlertSeverity {
    Warning,
    Critical
};

/**
 * One memory sample. Usage and pressure are derived from used/available.
 */
struct MemorySnapshot {
    QDateTime timestamp;
    double usedMemoryMB = 0.0;
    double availableMemoryMB = 0.0;
    int bufferCount = 0;
    int activeThreadCount = 0;
    std::optional<int> databaseConnectionCount;

    double totalMemoryMB() const { return usedMemoryMB + availableMemoryMB; }
    double memoryUsagePercent() const;
    MemoryPressure pressure() const;
};

struct MemoryAlert {
    QDateTime timestamp;
    AlertSeverity severity = AlertSeverity::Warning;
    MemorySnapshot snapshot;
    QString message;
    QString recommendedAction;

    // Leak alerts only
    std::optional<double> growthRatePercent;
    std::optional<double> detectionWindowSeconds;
};

Q_DECLARE_METATYPE(MemorySnapshot)
Q_DECLARE_METATYPE(MemoryAlert)

struct SystemMemoryInfo {
    double usedMemoryMB = 0.0;
    double availableMemoryMB = 0.0;
    int threadCount = 0;
};

/**
 * Source of system-wide memory counters
 */
class SystemMemoryReader
{
public:
    virtual ~SystemMemoryReader() = default;

    /**
     * @param info Filled on success
     * @return false if the counters could not be read
     */
    virtual bool read(SystemMemoryInfo& info) = 0;
};

/**
 * sysinfo() / /proc based reader
 */
class LinuxMemoryReader : public SystemMemoryReader
{
public:
    bool read(SystemMemoryInfo& info) override;

private:
    static int readThreadCount();
    static std::optional<double> readAvailableFromMeminfo();
};

/**
 * Periodic memory sampler with threshold and leak alerting.
 *
 * Samples on its own QTimer. The only shared state it reads is the pool's
 * atomic diagnostics and the store's atomic connection count, so sampling
 * never contends with the recording path.
 */
class MemoryMonitor : public QObject
{
    Q_OBJECT

public:
    static constexpr int DEFAULT_INTERVAL_SECONDS = 10;
    static constexpr int MAX_HISTORY = 360;
    static constexpr double WARNING_THRESHOLD_PERCENT = 75.0;
    static constexpr double CRITICAL_THRESHOLD_PERCENT = 90.0;
    static constexpr int ALERT_DEBOUNCE_SECONDS = 60;
    static constexpr int LEAK_WINDOW_SECONDS = 300;
    static constexpr double LEAK_GROWTH_THRESHOLD_PERCENT = 5.0;
    static constexpr double SLOW_SAMPLE_WARNING_MS = 10.0;

    explicit MemoryMonitor(std::unique_ptr<SystemMemoryReader> reader, QObject* parent = nullptr);
    ~MemoryMonitor() override;

    void setFrameBufferPool(FrameBufferPool* pool) { m_pool = pool; }
    void setPersistenceCoordinator(const PersistenceCoordinator* store) { m_store = store; }

    /**
     * Start periodic sampling. Restarts with the new interval if already running.
     * @param intervalSeconds Sampling interval, must be positive
     */
    void startMonitoring(int intervalSeconds = DEFAULT_INTERVAL_SECONDS);
    void stopMonitoring();
    bool isMonitoring() const;
    int intervalSeconds() const { return m_intervalSeconds; }

    /**
     * Take a fresh sample without recording it
     */
    MemorySnapshot currentSnapshot() const;

    /**
     * @param lastMinutes Window measured back from the newest snapshot
     * @return Snapshots in the window, oldest first
     */
    std::vector<MemorySnapshot> trend(int lastMinutes) const;
    const std::deque<MemorySnapshot>& history() const { return m_history; }

    /**
     * Subscribe a handler to alertRaised
     * @return Connection that can be passed to QObject::disconnect
     */
    QMetaObject::Connection onAlert(std::function<void(const MemoryAlert&)> handler);

    /**
     * Release every pooled frame and return freed heap to the OS
     * @return Number of frames released
     */
    int forceCleanup();

    /**
     * Record a snapshot and run threshold and leak analysis on it
     */
    void processSnapshot(const MemorySnapshot& snapshot);

    /**
     * Third-averaged leak test over a window of snapshots
     * @return Growth percentage if the window shows a leak, std::nullopt otherwise
     */
    static std::optional<double> detectLeak(const std::vector<MemorySnapshot>& window);

signals:
    void alertRaised(const MemoryAlert& alert);
    void snapshotTaken(const MemorySnapshot& snapshot);

private slots:
    void onTimerTick();

private:
    void checkThresholds(const MemorySnapshot& snapshot);
    void checkForLeak(const MemorySnapshot& snapshot);
    bool shouldRaise(AlertSeverity severity, const QDateTime& at);
    void raise(MemoryAlert alert);
    std::vector<MemorySnapshot> window(const QDateTime& newest, int seconds) const;

    std::unique_ptr<SystemMemoryReader> m_reader;
    FrameBufferPool* m_pool = nullptr;
    const PersistenceCoordinator* m_store = nullptr;

    QTimer* m_timer;
    int m_intervalSeconds = DEFAULT_INTERVAL_SECONDS;
    std::deque<MemorySnapshot> m_history;
    std::map<AlertSeverity, QDateTime> m_lastAlertAt;
};

#endif // MEMORYMONITOR_H
