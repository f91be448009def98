#include "retentionmanager.h"
#include "diagnosticslog.h"
#include <QDirIterator>
#include <QElapsedTimer>
#include <QFileInfo>
#include <QStringList>
#include <sstream>
#include <iomanip>

const char* const RetentionManager::SETTINGS_KEY = "retention";

bool RetentionSettings::isValid(QString* error) const
{
    QStringList errors;

    if (retentionDays < MIN_RETENTION_DAYS || retentionDays > MAX_RETENTION_DAYS) {
        errors << QString("Retention days must be between %1 and %2 (got %3)")
                      .arg(MIN_RETENTION_DAYS).arg(MAX_RETENTION_DAYS).arg(retentionDays);
    }
    if (maxStorageGB < MIN_STORAGE_GB || maxStorageGB > MAX_STORAGE_GB) {
        errors << QString("Maximum storage must be between %1 and %2 GB (got %3)")
                      .arg(MIN_STORAGE_GB).arg(MAX_STORAGE_GB).arg(maxStorageGB);
    }
    if (cleanupIntervalHours < MIN_INTERVAL_HOURS || cleanupIntervalHours > MAX_INTERVAL_HOURS) {
        errors << QString("Cleanup interval must be between %1 and %2 hours (got %3)")
                      .arg(MIN_INTERVAL_HOURS).arg(MAX_INTERVAL_HOURS).arg(cleanupIntervalHours);
    }

    if (error) {
        *error = errors.join('\n');
    }
    return errors.isEmpty();
}

QJsonObject RetentionSettings::toJson() const
{
    QJsonObject json;
    json["enabled"] = enabled;
    json["retentionDays"] = retentionDays;
    json["maxStorageGB"] = maxStorageGB;
    json["cleanupIntervalHours"] = cleanupIntervalHours;
    return json;
}

bool RetentionSettings::fromJson(const QJsonObject& json, RetentionSettings& out)
{
    if (!json.value("enabled").isBool() || !json.value("retentionDays").isDouble() ||
        !json.value("maxStorageGB").isDouble() || !json.value("cleanupIntervalHours").isDouble()) {
        return false;
    }

    RetentionSettings parsed;
    parsed.enabled = json.value("enabled").toBool();
    parsed.retentionDays = json.value("retentionDays").toInt();
    parsed.maxStorageGB = json.value("maxStorageGB").toInt();
    parsed.cleanupIntervalHours = json.value("cleanupIntervalHours").toInt();
    out = parsed;
    return true;
}

bool RetentionSettings::operator==(const RetentionSettings& other) const
{
    return enabled == other.enabled &&
           retentionDays == other.retentionDays &&
           maxStorageGB == other.maxStorageGB &&
           cleanupIntervalHours == other.cleanupIntervalHours;
}

// ============================================================================
// RetentionManager Implementation
// ============================================================================

RetentionManager::RetentionManager(PersistenceCoordinator& store, const QString& recordingsDirectory,
                                   QObject* parent)
    : QObject(parent),
      m_store(store),
      m_recordingsDirectory(recordingsDirectory),
      m_cleanupTimer(new QTimer(this))
{
    qRegisterMetaType<CleanupStats>("CleanupStats");
    connect(m_cleanupTimer, &QTimer::timeout, this, [this]() { performCleanup(); });
}

RetentionManager::~RetentionManager()
{
    m_cleanupTimer->stop();
}

RetentionSettings RetentionManager::loadSettings()
{
    RetentionSettings loaded;
    QJsonValue stored = m_store.loadSetting(SETTINGS_KEY);

    if (stored.isUndefined() || stored.isNull()) {
        LOG_DEBUG("Retention", "No stored retention settings, using defaults");
    } else if (!stored.isObject() || !RetentionSettings::fromJson(stored.toObject(), loaded)) {
        LOG_WARNING("Retention", "Stored retention settings are malformed, using defaults");
        loaded = RetentionSettings();
    } else {
        QString error;
        if (!loaded.isValid(&error)) {
            LOG_WARNING("Retention", "Stored retention settings rejected (" + error.toStdString() + "), using defaults");
            loaded = RetentionSettings();
        }
    }

    m_settings = loaded;
    return m_settings;
}

bool RetentionManager::applySettings(const RetentionSettings& settings, QString* error)
{
    QString validationError;
    if (!settings.isValid(&validationError)) {
        LOG_WARNING("Retention", "Rejected retention settings: " + validationError.toStdString());
        if (error) {
            *error = validationError;
        }
        return false;
    }

    try {
        m_store.saveSetting(SETTINGS_KEY, settings.toJson());
    } catch (const PersistenceError& e) {
        LOG_ERROR("Retention", std::string("Could not persist retention settings: ") + e.what());
        if (error) {
            *error = QString::fromUtf8(e.what());
        }
        return false;
    }

    bool intervalChanged = settings.cleanupIntervalHours != m_settings.cleanupIntervalHours;
    bool enabledChanged = settings.enabled != m_settings.enabled;
    m_settings = settings;

    if (isAutomaticCleanupActive() || enabledChanged) {
        if (intervalChanged || enabledChanged) {
            startAutomaticCleanup();
        }
    }

    LOG_INFO("Retention", "Retention settings updated: " + std::to_string(settings.retentionDays) + " days, " +
             std::to_string(settings.maxStorageGB) + " GB, every " + std::to_string(settings.cleanupIntervalHours) + "h" +
             (settings.enabled ? "" : " (disabled)"));
    return true;
}

void RetentionManager::startAutomaticCleanup()
{
    m_cleanupTimer->stop();

    if (!m_settings.enabled) {
        LOG_INFO("Retention", "Automatic cleanup is disabled");
        return;
    }

    m_cleanupTimer->start(m_settings.cleanupIntervalHours * 3600 * 1000);
    LOG_INFO("Retention", "Automatic cleanup started (interval " + std::to_string(m_settings.cleanupIntervalHours) +
             "h, retention " + std::to_string(m_settings.retentionDays) + " days)");
}

void RetentionManager::stopAutomaticCleanup()
{
    if (m_cleanupTimer->isActive()) {
        m_cleanupTimer->stop();
        LOG_INFO("Retention", "Automatic cleanup stopped");
    }
}

bool RetentionManager::isAutomaticCleanupActive() const
{
    return m_cleanupTimer->isActive();
}

std::optional<CleanupStats> RetentionManager::performCleanup()
{
    if (!m_settings.enabled) {
        LOG_DEBUG("Retention", "Cleanup skipped (disabled)");
        return std::nullopt;
    }

    QElapsedTimer timer;
    timer.start();

    CleanupStats stats;
    try {
        stats = m_store.cleanupOldChunks(m_settings.retentionDays);
    } catch (const PersistenceError& e) {
        LOG_ERROR("Retention", std::string("Cleanup failed: ") + e.what());
        return std::nullopt;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (stats.chunksFound == 0) {
        oss << "Cleanup completed: no old chunks (" << timer.elapsed() / 1000.0 << "s)";
    } else {
        oss << "Cleanup completed: " << stats.chunksFound << " found, " << stats.filesDeleted << " files, "
            << stats.recordsDeleted << " records, " << stats.bytesFreed / (1024.0 * 1024.0) << " MB freed ("
            << timer.elapsed() / 1000.0 << "s)";
    }
    LOG_INFO("Retention", oss.str());

    emit cleanupFinished(stats);

    qint64 used = checkStorageUsage();
    if (used > m_settings.quotaBytes() * QUOTA_WARNING_RATIO) {
        LOG_WARNING("Retention", "Recordings use " + std::to_string(used / (1024 * 1024)) + " MB of " +
                    std::to_string(m_settings.maxStorageGB) + " GB quota");
        emit quotaApproaching(used, m_settings.quotaBytes());
    }
    return stats;
}

qint64 RetentionManager::checkStorageUsage() const
{
    qint64 total = 0;
    QDirIterator it(m_recordingsDirectory, QDir::Files | QDir::NoDotAndDotDot, QDirIterator::Subdirectories);
    while (it.hasNext()) {
        it.next();
        total += it.fileInfo().size();
    }
    return total;
}

double RetentionManager::storageUsageRatio() const
{
    return static_cast<double>(checkStorageUsage()) / static_cast<double>(m_settings.quotaBytes());
}

bool RetentionManager::isApproachingQuota() const
{
    return storageUsageRatio() > QUOTA_WARNING_RATIO;
}
