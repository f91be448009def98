#ifndef RECORDERSTATE_H
#define RECORDERSTATE_H

#include <QMetaType>
#include <QString>
#include <optional>
#include "recordingerror.h"

/**
 * Recorder lifecycle state. Recording carries the number of captured
 * displays, Error carries the fault code.
 */
class RecorderState
{
public:
    enum class Kind {
        Idle,
        Starting,
        Recording,
        Paused,
        Finishing,
        Stopping,
        Error
    };

    RecorderState() = default;

    static RecorderState idle() { return RecorderState(Kind::Idle); }
    static RecorderState starting() { return RecorderState(Kind::Starting); }
    static RecorderState recording(int displayCount);
    static RecorderState paused() { return RecorderState(Kind::Paused); }
    static RecorderState finishing() { return RecorderState(Kind::Finishing); }
    static RecorderState stopping() { return RecorderState(Kind::Stopping); }
    static RecorderState error(RecordingErrorCode code);

    Kind kind() const { return m_kind; }
    int displayCount() const { return m_displayCount; }
    std::optional<RecordingErrorCode> errorCode() const { return m_errorCode; }

    bool isRecording() const { return m_kind == Kind::Recording; }
    bool isError() const { return m_kind == Kind::Error; }

    /**
     * start() is accepted from idle, paused and error
     */
    bool canStart() const;

    /**
     * A capture worker is (or is about to be) running
     */
    bool isActive() const;

    QString description() const;

    bool operator==(const RecorderState& other) const;
    bool operator!=(const RecorderState& other) const { return !(*this == other); }

private:
    explicit RecorderState(Kind kind) : m_kind(kind) {}

    Kind m_kind = Kind::Idle;
    int m_displayCount = 0;
    std::optional<RecordingErrorCode> m_errorCode;
};

Q_DECLARE_METATYPE(RecorderState)

enum class DisplayChangeKind {
    Added,
    Removed,
    Reconfigured,
    Reconfiguring
};

struct DisplayChangeEvent {
    DisplayChangeKind kind = DisplayChangeKind::Reconfigured;
    int displayId = -1;
    int displayCount = 0;

    /**
     * Reconfiguring is a transition; the others mean the layout has settled
     */
    bool isSettled() const { return kind != DisplayChangeKind::Reconfiguring; }
    QString description() const;
};

Q_DECLARE_METATYPE(DisplayChangeEvent)

#endif // RECORDERSTATE_H
