#include "recordingerror.h"

RecordingError RecordingError::fromCode(RecordingErrorCode code, const QString& detail)
{
    RecordingError error;
    error.code = code;
    error.timestamp = QDateTime::currentDateTime();

    switch (code) {
        case RecordingErrorCode::PermissionDenied:
            error.message = "Screen recording permission is required to capture your screen.";
            error.recoveryActions = {{"Open System Preferences", true}, {"Learn More", false}};
            break;
        case RecordingErrorCode::DisplayConfigurationChanged:
            error.message = "Display configuration changed. Recording will restart automatically.";
            error.recoveryActions = {{"Retry Now", true}, {"Dismiss", false}};
            break;
        case RecordingErrorCode::StorageSpaceLow:
            error.message = QString("Low disk space (%1 MB available). Recording may stop soon.")
                                .arg(detail.isEmpty() ? QString("0") : detail);
            error.recoveryActions = {{"Free Up Space", true}, {"Continue Anyway", false}};
            break;
        case RecordingErrorCode::CompressionFailed:
            error.message = "Video compression failed: " + detail;
            error.recoveryActions = {{"Retry", true}, {"Use Lower Quality", false}};
            break;
        case RecordingErrorCode::FrameCaptureTimeout:
            error.message = "Failed to capture frames within expected time. System may be under heavy load.";
            error.recoveryActions = {{"Retry", true}, {"Stop Recording", false}};
            break;
        case RecordingErrorCode::DatabaseWriteFailed:
            error.message = "Failed to save recording metadata: " + detail;
            error.recoveryActions = {{"Retry", true}, {"Continue Without Metadata", false}};
            break;
    }

    return error;
}

RecordingError RecordingError::storageSpaceLow(qint64 availableBytes)
{
    return fromCode(RecordingErrorCode::StorageSpaceLow, QString::number(availableBytes / (1024 * 1024)));
}

std::optional<RecoveryAction> RecordingError::primaryAction() const
{
    for (const RecoveryAction& action : recoveryActions) {
        if (action.isPrimary) {
            return action;
        }
    }
    return std::nullopt;
}

QString RecordingError::codeName(RecordingErrorCode code)
{
    switch (code) {
        case RecordingErrorCode::PermissionDenied: return "permission_denied";
        case RecordingErrorCode::DisplayConfigurationChanged: return "display_configuration_changed";
        case RecordingErrorCode::StorageSpaceLow: return "storage_space_low";
        case RecordingErrorCode::CompressionFailed: return "compression_failed";
        case RecordingErrorCode::FrameCaptureTimeout: return "frame_capture_timeout";
        case RecordingErrorCode::DatabaseWriteFailed: return "database_write_failed";
        default: return "unknown";
    }
}

std::optional<RecordingErrorCode> RecordingError::codeFromName(const QString& name)
{
    static const RecordingErrorCode codes[] = {
        RecordingErrorCode::PermissionDenied,
        RecordingErrorCode::DisplayConfigurationChanged,
        RecordingErrorCode::StorageSpaceLow,
        RecordingErrorCode::CompressionFailed,
        RecordingErrorCode::FrameCaptureTimeout,
        RecordingErrorCode::DatabaseWriteFailed
    };

    for (RecordingErrorCode code : codes) {
        if (codeName(code) == name) {
            return code;
        }
    }
    return std::nullopt;
}

QString RecordingError::displayName(RecordingErrorCode code)
{
    switch (code) {
        case RecordingErrorCode::PermissionDenied: return "Permission Denied";
        case RecordingErrorCode::DisplayConfigurationChanged: return "Display Configuration Changed";
        case RecordingErrorCode::StorageSpaceLow: return "Storage Space Low";
        case RecordingErrorCode::CompressionFailed: return "Compression Failed";
        case RecordingErrorCode::FrameCaptureTimeout: return "Frame Capture Timeout";
        case RecordingErrorCode::DatabaseWriteFailed: return "Database Write Failed";
        default: return "Unknown";
    }
}
