#include "recorderstate.h"

RecorderState RecorderState::recording(int displayCount)
{
    RecorderState state(Kind::Recording);
    state.m_displayCount = displayCount;
    return state;
}

RecorderState RecorderState::error(RecordingErrorCode code)
{
    RecorderState state(Kind::Error);
    state.m_errorCode = code;
    return state;
}

bool RecorderState::canStart() const
{
    return m_kind == Kind::Idle || m_kind == Kind::Paused || m_kind == Kind::Error;
}

bool RecorderState::isActive() const
{
    return m_kind == Kind::Starting || m_kind == Kind::Recording || m_kind == Kind::Finishing;
}

QString RecorderState::description() const
{
    switch (m_kind) {
        case Kind::Idle: return "idle";
        case Kind::Starting: return "starting";
        case Kind::Recording:
            return QString("recording(%1 display%2)").arg(m_displayCount).arg(m_displayCount == 1 ? "" : "s");
        case Kind::Paused: return "paused";
        case Kind::Finishing: return "finishing";
        case Kind::Stopping: return "stopping";
        case Kind::Error:
            return QString("error(%1)").arg(m_errorCode ? RecordingError::codeName(*m_errorCode) : QString("unknown"));
        default: return "unknown";
    }
}

bool RecorderState::operator==(const RecorderState& other) const
{
    if (m_kind != other.m_kind) {
        return false;
    }
    if (m_kind == Kind::Recording) {
        return m_displayCount == other.m_displayCount;
    }
    if (m_kind == Kind::Error) {
        return m_errorCode == other.m_errorCode;
    }
    return true;
}

QString DisplayChangeEvent::description() const
{
    switch (kind) {
        case DisplayChangeKind::Added: return QString("Display added: %1").arg(displayId);
        case DisplayChangeKind::Removed: return QString("Display removed: %1").arg(displayId);
        case DisplayChangeKind::Reconfigured:
            return QString("Configuration changed: %1 display(s)").arg(displayCount);
        case DisplayChangeKind::Reconfiguring: return "Display configuration in progress...";
        default: return "unknown";
    }
}
