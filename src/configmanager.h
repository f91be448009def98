#ifndef CONFIGMANAGER_H
#define CONFIGMANAGER_H

#include <QObject>
#include <QSettings>
#include <QString>
#include <QDir>
#include <QStandardPaths>
#include "compressionsettings.h"
#include "diagnosticslog.h"

struct AppConfig {
    QString recordingsDirectory;
    QString databasePath;
    QString captureSource;
    int captureIntervalMs;
    int chunkDurationSeconds;
    VideoCodec codec;
    CompressionQuality quality;
    int captureWidth;
    int captureHeight;
    int monitorIntervalSeconds;
    qint64 minimumFreeSpaceMB;
    LogLevel logLevel;
    QString logFilePath;

    // Default values
    AppConfig() :
        recordingsDirectory(defaultDataDirectory() + "/recordings"),
        databasePath(defaultDataDirectory() + "/chronicle.sqlite"),
        captureSource("0"),
        captureIntervalMs(1000),
        chunkDurationSeconds(900),
        codec(VideoCodec::H264),
        quality(CompressionQuality::Auto),
        captureWidth(1920),
        captureHeight(1080),
        monitorIntervalSeconds(10),
        minimumFreeSpaceMB(100),
        logLevel(LogLevel::Info)
    {}

    static QString defaultDataDirectory() {
        QString dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
        return dir.isEmpty() ? QDir::homePath() + "/.screenchronicle" : dir;
    }
};

class ConfigManager : public QObject
{
    Q_OBJECT

public:
    explicit ConfigManager(QObject *parent = nullptr);

    /**
     * Use an explicit settings file instead of the platform default location
     * @param filePath INI file path
     */
    explicit ConfigManager(const QString& filePath, QObject *parent = nullptr);

    /**
     * Load configuration from persistent storage
     * @return AppConfig structure with loaded settings
     */
    AppConfig loadConfig();

    /**
     * Save configuration to persistent storage
     * @param config Configuration to save
     */
    void saveConfig(const AppConfig& config);

    /**
     * Check ranges without clamping
     * @param config Configuration to check
     * @param error Receives the first violation
     * @return true if every value is usable
     */
    static bool validate(const AppConfig& config, QString* error = nullptr);

    /**
     * Render the configuration as "key = value" lines
     */
    static QString describe(const AppConfig& config);

private:
    QSettings* m_settings;

    // Configuration keys
    static const QString KEY_RECORDINGS_DIR;
    static const QString KEY_DATABASE_PATH;
    static const QString KEY_CAPTURE_SOURCE;
    static const QString KEY_CAPTURE_INTERVAL_MS;
    static const QString KEY_CHUNK_DURATION_SECONDS;
    static const QString KEY_CODEC;
    static const QString KEY_QUALITY;
    static const QString KEY_CAPTURE_WIDTH;
    static const QString KEY_CAPTURE_HEIGHT;
    static const QString KEY_MONITOR_INTERVAL_SECONDS;
    static const QString KEY_MINIMUM_FREE_SPACE_MB;
    static const QString KEY_LOG_LEVEL;
    static const QString KEY_LOG_FILE_PATH;
};

#endif // CONFIGMANAGER_H
