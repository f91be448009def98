#ifndef RECORDINGERROR_H
#define RECORDINGERROR_H

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <optional>
#include <vector>

enum class RecordingErrorCode {
    PermissionDenied,
    DisplayConfigurationChanged,
    StorageSpaceLow,
    CompressionFailed,
    FrameCaptureTimeout,
    DatabaseWriteFailed
};

struct RecoveryAction {
    QString title;
    bool isPrimary = false;

    bool operator==(const RecoveryAction& other) const {
        return title == other.title && isPrimary == other.isPrimary;
    }
};

/**
 * User-facing recording fault with the actions offered to recover from it
 */
struct RecordingError {
    RecordingErrorCode code = RecordingErrorCode::FrameCaptureTimeout;
    QString message;
    std::vector<RecoveryAction> recoveryActions;
    QDateTime timestamp;

    /**
     * Build the error for a code, attaching its message and recovery actions
     * @param code Error code
     * @param detail Failure reason (compression, database) or available MB (storage)
     */
    static RecordingError fromCode(RecordingErrorCode code, const QString& detail = QString());

    static RecordingError storageSpaceLow(qint64 availableBytes);

    std::optional<RecoveryAction> primaryAction() const;

    /**
     * Stable snake_case identifier, e.g. "permission_denied"
     */
    static QString codeName(RecordingErrorCode code);
    static std::optional<RecordingErrorCode> codeFromName(const QString& name);
    static QString displayName(RecordingErrorCode code);
};

Q_DECLARE_METATYPE(RecordingError)

#endif // RECORDINGERROR_H
