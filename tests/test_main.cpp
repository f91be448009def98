#include <gtest/gtest.h>
#include <QCoreApplication>
#include "diagnosticslog.h"

// Queued signals and QTimer need a running application object
int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("ScreenChronicleTests");
    app.setApplicationName("ScreenChronicleTests");

    DiagnosticsLog::getInstance().setMinLogLevel(LogLevel::Warning);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
