#ifndef RETENTIONMANAGER_H
#define RETENTIONMANAGER_H

#include <QObject>
#include <QJsonObject>
#include <QTimer>
#include <optional>
#include "persistencecoordinator.h"

struct RetentionSettings {
    static constexpr int MIN_RETENTION_DAYS = 1;
    static constexpr int MAX_RETENTION_DAYS = 365;
    static constexpr int MIN_STORAGE_GB = 1;
    static constexpr int MAX_STORAGE_GB = 1000;
    static constexpr int MIN_INTERVAL_HOURS = 1;
    static constexpr int MAX_INTERVAL_HOURS = 24;

    bool enabled = true;
    int retentionDays = 3;
    int maxStorageGB = 10;
    int cleanupIntervalHours = 1;

    /**
     * Check every field against its range. Values are never clamped.
     * @param error Receives all violations, one per line
     */
    bool isValid(QString* error = nullptr) const;

    qint64 quotaBytes() const { return static_cast<qint64>(maxStorageGB) * 1024 * 1024 * 1024; }

    QJsonObject toJson() const;
    static bool fromJson(const QJsonObject& json, RetentionSettings& out);

    bool operator==(const RetentionSettings& other) const;
    bool operator!=(const RetentionSettings& other) const { return !(*this == other); }
};

/**
 * Periodic deletion of chunks past the retention window, plus storage quota checks.
 * Settings live in the store under the "retention" key.
 */
class RetentionManager : public QObject
{
    Q_OBJECT

public:
    static constexpr double QUOTA_WARNING_RATIO = 0.9;
    static const char* const SETTINGS_KEY;

    RetentionManager(PersistenceCoordinator& store, const QString& recordingsDirectory, QObject* parent = nullptr);
    ~RetentionManager() override;

    /**
     * Load settings from the store, falling back to defaults if missing or invalid
     */
    RetentionSettings loadSettings();
    RetentionSettings settings() const { return m_settings; }

    /**
     * Validate, persist and reschedule
     * @param error Receives the validation message on rejection
     * @return false if rejected; the previous settings stay in effect
     */
    bool applySettings(const RetentionSettings& settings, QString* error = nullptr);

    void startAutomaticCleanup();
    void stopAutomaticCleanup();
    bool isAutomaticCleanupActive() const;

    /**
     * Run one cleanup pass now
     * @return Statistics, or std::nullopt if disabled or the store failed
     */
    std::optional<CleanupStats> performCleanup();

    /**
     * @return Total bytes of files under the recordings directory
     */
    qint64 checkStorageUsage() const;
    double storageUsageRatio() const;
    bool isApproachingQuota() const;

signals:
    void cleanupFinished(const CleanupStats& stats);
    void quotaApproaching(qint64 usedBytes, qint64 quotaBytes);

private:
    PersistenceCoordinator& m_store;
    QString m_recordingsDirectory;
    RetentionSettings m_settings;
    QTimer* m_cleanupTimer;
};

#endif // RETENTIONMANAGER_H
