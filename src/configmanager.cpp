#include "configmanager.h"
#include <QStringList>

// Configuration keys
const QString ConfigManager::KEY_RECORDINGS_DIR = "recordingsDirectory";
const QString ConfigManager::KEY_DATABASE_PATH = "databasePath";
const QString ConfigManager::KEY_CAPTURE_SOURCE = "captureSource";
const QString ConfigManager::KEY_CAPTURE_INTERVAL_MS = "captureIntervalMs";
const QString ConfigManager::KEY_CHUNK_DURATION_SECONDS = "chunkDurationSeconds";
const QString ConfigManager::KEY_CODEC = "codec";
const QString ConfigManager::KEY_QUALITY = "quality";
const QString ConfigManager::KEY_CAPTURE_WIDTH = "captureWidth";
const QString ConfigManager::KEY_CAPTURE_HEIGHT = "captureHeight";
const QString ConfigManager::KEY_MONITOR_INTERVAL_SECONDS = "monitorIntervalSeconds";
const QString ConfigManager::KEY_MINIMUM_FREE_SPACE_MB = "minimumFreeSpaceMB";
const QString ConfigManager::KEY_LOG_LEVEL = "logLevel";
const QString ConfigManager::KEY_LOG_FILE_PATH = "logFilePath";

ConfigManager::ConfigManager(QObject *parent)
    : QObject(parent)
{
    // On Linux, this will use ~/.config/ScreenChronicle/ScreenChronicle.conf
    m_settings = new QSettings("ScreenChronicle", "ScreenChronicle", this);
}

ConfigManager::ConfigManager(const QString& filePath, QObject *parent)
    : QObject(parent)
{
    m_settings = new QSettings(filePath, QSettings::IniFormat, this);
}

AppConfig ConfigManager::loadConfig()
{
    AppConfig config;

    config.recordingsDirectory = m_settings->value(KEY_RECORDINGS_DIR, config.recordingsDirectory).toString();
    config.databasePath = m_settings->value(KEY_DATABASE_PATH, config.databasePath).toString();
    config.captureSource = m_settings->value(KEY_CAPTURE_SOURCE, config.captureSource).toString();
    config.captureIntervalMs = m_settings->value(KEY_CAPTURE_INTERVAL_MS, config.captureIntervalMs).toInt();
    config.chunkDurationSeconds = m_settings->value(KEY_CHUNK_DURATION_SECONDS, config.chunkDurationSeconds).toInt();

    QString codecName = m_settings->value(KEY_CODEC, CompressionSettings::codecName(config.codec)).toString();
    config.codec = CompressionSettings::codecFromName(codecName);
    QString qualityName = m_settings->value(KEY_QUALITY, CompressionSettings::qualityName(config.quality)).toString();
    config.quality = CompressionSettings::qualityFromName(qualityName);

    config.captureWidth = m_settings->value(KEY_CAPTURE_WIDTH, config.captureWidth).toInt();
    config.captureHeight = m_settings->value(KEY_CAPTURE_HEIGHT, config.captureHeight).toInt();
    config.monitorIntervalSeconds = m_settings->value(KEY_MONITOR_INTERVAL_SECONDS, config.monitorIntervalSeconds).toInt();
    config.minimumFreeSpaceMB = m_settings->value(KEY_MINIMUM_FREE_SPACE_MB, config.minimumFreeSpaceMB).toLongLong();

    QString levelName = m_settings->value(KEY_LOG_LEVEL,
                                          QString::fromStdString(DiagnosticsLog::logLevelToString(config.logLevel))).toString();
    config.logLevel = DiagnosticsLog::stringToLogLevel(levelName.toUpper().toStdString());
    config.logFilePath = m_settings->value(KEY_LOG_FILE_PATH, config.logFilePath).toString();

    return config;
}

void ConfigManager::saveConfig(const AppConfig& config)
{
    m_settings->setValue(KEY_RECORDINGS_DIR, config.recordingsDirectory);
    m_settings->setValue(KEY_DATABASE_PATH, config.databasePath);
    m_settings->setValue(KEY_CAPTURE_SOURCE, config.captureSource);
    m_settings->setValue(KEY_CAPTURE_INTERVAL_MS, config.captureIntervalMs);
    m_settings->setValue(KEY_CHUNK_DURATION_SECONDS, config.chunkDurationSeconds);
    m_settings->setValue(KEY_CODEC, CompressionSettings::codecName(config.codec));
    m_settings->setValue(KEY_QUALITY, CompressionSettings::qualityName(config.quality));
    m_settings->setValue(KEY_CAPTURE_WIDTH, config.captureWidth);
    m_settings->setValue(KEY_CAPTURE_HEIGHT, config.captureHeight);
    m_settings->setValue(KEY_MONITOR_INTERVAL_SECONDS, config.monitorIntervalSeconds);
    m_settings->setValue(KEY_MINIMUM_FREE_SPACE_MB, config.minimumFreeSpaceMB);
    m_settings->setValue(KEY_LOG_LEVEL, QString::fromStdString(DiagnosticsLog::logLevelToString(config.logLevel)));
    m_settings->setValue(KEY_LOG_FILE_PATH, config.logFilePath);

    m_settings->sync();
}

bool ConfigManager::validate(const AppConfig& config, QString* error)
{
    QString message;

    if (config.recordingsDirectory.isEmpty()) {
        message = "Recordings directory must not be empty";
    } else if (config.databasePath.isEmpty()) {
        message = "Database path must not be empty";
    } else if (config.captureIntervalMs < 1) {
        message = QString("Capture interval must be at least 1 ms (got %1)").arg(config.captureIntervalMs);
    } else if (config.chunkDurationSeconds < 1) {
        message = QString("Chunk duration must be at least 1 second (got %1)").arg(config.chunkDurationSeconds);
    } else if (config.captureWidth < 2 || config.captureHeight < 2) {
        message = QString("Capture size must be at least 2x2 (got %1x%2)")
                      .arg(config.captureWidth).arg(config.captureHeight);
    } else if (config.monitorIntervalSeconds < 1) {
        message = QString("Monitor interval must be at least 1 second (got %1)").arg(config.monitorIntervalSeconds);
    } else if (config.minimumFreeSpaceMB < 0) {
        message = QString("Minimum free space must not be negative (got %1)").arg(config.minimumFreeSpaceMB);
    }

    if (error) {
        *error = message;
    }
    return message.isEmpty();
}

QString ConfigManager::describe(const AppConfig& config)
{
    QStringList lines;
    lines << KEY_RECORDINGS_DIR + " = " + config.recordingsDirectory;
    lines << KEY_DATABASE_PATH + " = " + config.databasePath;
    lines << KEY_CAPTURE_SOURCE + " = " + config.captureSource;
    lines << KEY_CAPTURE_INTERVAL_MS + " = " + QString::number(config.captureIntervalMs);
    lines << KEY_CHUNK_DURATION_SECONDS + " = " + QString::number(config.chunkDurationSeconds);
    lines << KEY_CODEC + " = " + CompressionSettings::codecName(config.codec);
    lines << KEY_QUALITY + " = " + CompressionSettings::qualityName(config.quality);
    lines << KEY_CAPTURE_WIDTH + " = " + QString::number(config.captureWidth);
    lines << KEY_CAPTURE_HEIGHT + " = " + QString::number(config.captureHeight);
    lines << KEY_MONITOR_INTERVAL_SECONDS + " = " + QString::number(config.monitorIntervalSeconds);
    lines << KEY_MINIMUM_FREE_SPACE_MB + " = " + QString::number(config.minimumFreeSpaceMB);
    lines << KEY_LOG_LEVEL + " = " + QString::fromStdString(DiagnosticsLog::logLevelToString(config.logLevel));
    lines << KEY_LOG_FILE_PATH + " = " + (config.logFilePath.isEmpty() ? QString("(none)") : config.logFilePath);
    return lines.join('\n');
}
