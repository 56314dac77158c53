#include "gmock/gmock.h"
#include "arenaparams.h"
#include "fs.h"
#include "logging.h"
#include "util/system.h"

#include <sodium.h>

#include <fstream>
#include <iostream>

class LogGrabber : public ::testing::EmptyTestEventListener {
    fs::path logPath;

public:
    LogGrabber(fs::path logPathIn) : logPath(logPathIn) {}

    virtual void OnTestStart(const ::testing::TestInfo& test_info) {
        // Test logs are written synchronously, so we can clear the log file to
        // ensure that at the end of the test, the log lines are all related to
        // the test itself.
        std::ofstream logFile;
        logFile.open(logPath.string(), std::ofstream::out | std::ofstream::trunc);
        logFile.close();
    }

    virtual void OnTestEnd(const ::testing::TestInfo& test_info) {
        // If the test failed, print the test logs.
        auto result = test_info.result();
        if (result && result->Failed()) {
            std::cout << "\n--- Logs:";

            std::ifstream logFile;
            logFile.open(logPath.string(), std::ios::in | std::ios::ate);
            ASSERT_TRUE(logFile.is_open());
            logFile.seekg(0, logFile.beg);
            std::string line;
            while (logFile.good()) {
                std::getline(logFile, line);
                if (!line.empty()) {
                    std::cout << "\n  " << line;
                }
            }

            std::cout << "\n---" << std::endl;
        }
    }
};

int main(int argc, char **argv) {
    if (sodium_init() == -1) {
        std::cerr << "sodium_init failed" << std::endl;
        return 1;
    }

    // Log everything to a common test file.
    fs::path tmpPath = fs::temp_directory_path();
    fs::path tmpFilename = fs::unique_path("%%%%%%%%");
    fs::path logPath = tmpPath / tmpFilename;
    SoftSetArg("-debuglogfile", logPath.string());
    SoftSetArg("-debug", "1");
    fDebug = true;
    InitLogging();

    if (!SelectParams("main").has_value()) {
        std::cerr << "cannot select main parameters" << std::endl;
        return 1;
    }

    testing::InitGoogleMock(&argc, argv);

    ::testing::TestEventListeners& listeners =
        ::testing::UnitTest::GetInstance()->listeners();
    listeners.Append(new LogGrabber(logPath));

    auto ret = RUN_ALL_TESTS();

    fs::remove(logPath);
    return ret;
}
