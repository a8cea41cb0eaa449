#include <gtest/gtest.h>
#include <glog/logging.h>

int main(int argc, char** argv) {
    // Initialize Google Test
    ::testing::InitGoogleTest(&argc, argv);

    // Initialize Google Logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = true;

    // Each test starts its own stub registry server, no global environment needed
    return RUN_ALL_TESTS();
}
