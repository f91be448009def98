#include <gtest/gtest.h>
#include "recorderstate.h"
#include "recordingerror.h"

TEST(RecorderStateTest, DefaultIsIdle)
{
    RecorderState state;
    EXPECT_EQ(state.kind(), RecorderState::Kind::Idle);
    EXPECT_EQ(state, RecorderState::idle());
    EXPECT_TRUE(state.canStart());
    EXPECT_FALSE(state.isActive());
}

TEST(RecorderStateTest, CanStartOnlyFromIdlePausedOrError)
{
    EXPECT_TRUE(RecorderState::idle().canStart());
    EXPECT_TRUE(RecorderState::paused().canStart());
    EXPECT_TRUE(RecorderState::error(RecordingErrorCode::FrameCaptureTimeout).canStart());

    EXPECT_FALSE(RecorderState::starting().canStart());
    EXPECT_FALSE(RecorderState::recording(1).canStart());
    EXPECT_FALSE(RecorderState::finishing().canStart());
    EXPECT_FALSE(RecorderState::stopping().canStart());
}

TEST(RecorderStateTest, ActiveStates)
{
    EXPECT_TRUE(RecorderState::starting().isActive());
    EXPECT_TRUE(RecorderState::recording(2).isActive());
    EXPECT_TRUE(RecorderState::finishing().isActive());
    EXPECT_FALSE(RecorderState::paused().isActive());
    EXPECT_FALSE(RecorderState::stopping().isActive());
}

TEST(RecorderStateTest, EqualityComparesPayload)
{
    EXPECT_EQ(RecorderState::recording(2), RecorderState::recording(2));
    EXPECT_NE(RecorderState::recording(1), RecorderState::recording(2));
    EXPECT_NE(RecorderState::error(RecordingErrorCode::PermissionDenied),
              RecorderState::error(RecordingErrorCode::StorageSpaceLow));
    EXPECT_NE(RecorderState::idle(), RecorderState::paused());
}

TEST(RecorderStateTest, Descriptions)
{
    EXPECT_EQ(RecorderState::recording(1).description(), "recording(1 display)");
    EXPECT_EQ(RecorderState::recording(3).description(), "recording(3 displays)");
    EXPECT_EQ(RecorderState::error(RecordingErrorCode::PermissionDenied).description(), "error(permission_denied)");
    EXPECT_EQ(RecorderState::recording(3).displayCount(), 3);
    EXPECT_EQ(RecorderState::error(RecordingErrorCode::StorageSpaceLow).errorCode(),
              RecordingErrorCode::StorageSpaceLow);
    EXPECT_FALSE(RecorderState::idle().errorCode().has_value());
}

TEST(DisplayChangeEventTest, OnlyReconfiguringIsUnsettled)
{
    DisplayChangeEvent event;
    event.kind = DisplayChangeKind::Reconfiguring;
    EXPECT_FALSE(event.isSettled());

    event.kind = DisplayChangeKind::Added;
    event.displayId = 2;
    EXPECT_TRUE(event.isSettled());
    EXPECT_EQ(event.description(), "Display added: 2");

    event.kind = DisplayChangeKind::Reconfigured;
    event.displayCount = 2;
    EXPECT_EQ(event.description(), "Configuration changed: 2 display(s)");
}

TEST(RecordingErrorTest, EveryCodeHasMessageAndOnePrimaryAction)
{
    const RecordingErrorCode codes[] = {
        RecordingErrorCode::PermissionDenied,
        RecordingErrorCode::DisplayConfigurationChanged,
        RecordingErrorCode::StorageSpaceLow,
        RecordingErrorCode::CompressionFailed,
        RecordingErrorCode::FrameCaptureTimeout,
        RecordingErrorCode::DatabaseWriteFailed
    };

    for (RecordingErrorCode code : codes) {
        RecordingError error = RecordingError::fromCode(code, "detail");
        EXPECT_FALSE(error.message.isEmpty()) << RecordingError::codeName(code).toStdString();
        EXPECT_TRUE(error.timestamp.isValid());

        int primaries = 0;
        for (const RecoveryAction& action : error.recoveryActions) {
            primaries += action.isPrimary ? 1 : 0;
        }
        EXPECT_EQ(primaries, 1) << RecordingError::codeName(code).toStdString();
        EXPECT_EQ(RecordingError::codeFromName(RecordingError::codeName(code)), code);
    }
}

TEST(RecordingErrorTest, MessagesCarryDetail)
{
    RecordingError compression = RecordingError::fromCode(RecordingErrorCode::CompressionFailed, "codec missing");
    EXPECT_EQ(compression.message, "Video compression failed: codec missing");
    EXPECT_EQ(compression.primaryAction()->title, "Retry");

    RecordingError storage = RecordingError::storageSpaceLow(50LL * 1024 * 1024);
    EXPECT_EQ(storage.code, RecordingErrorCode::StorageSpaceLow);
    EXPECT_EQ(storage.message, "Low disk space (50 MB available). Recording may stop soon.");
    EXPECT_EQ(storage.primaryAction()->title, "Free Up Space");

    RecordingError permission = RecordingError::fromCode(RecordingErrorCode::PermissionDenied);
    EXPECT_EQ(permission.primaryAction()->title, "Open System Preferences");
}

TEST(RecordingErrorTest, NamesAndUnknownLookup)
{
    EXPECT_EQ(RecordingError::codeName(RecordingErrorCode::FrameCaptureTimeout), "frame_capture_timeout");
    EXPECT_EQ(RecordingError::displayName(RecordingErrorCode::DatabaseWriteFailed), "Database Write Failed");
    EXPECT_FALSE(RecordingError::codeFromName("melted").has_value());
}
