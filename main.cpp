#include <iostream>
#include <gtest/gtest.h>
#include <glog/logging.h>

using namespace std;

int main(int argc, char** argv) {
    // keep test logs out of the working tree
    FLAGS_logtostderr = false;
    FLAGS_log_dir = "/tmp";
    // set log level to info
    FLAGS_v = google::INFO;
    FLAGS_stderrthreshold = google::ERROR;
    // init google logging
    google::InitGoogleLogging(argv[0]);

    // 启用gtest测试
    testing::InitGoogleTest(&argc, argv);
    // ::testing::GTEST_FLAG(filter) = "TransactionTest.*";
    // ::testing::GTEST_FLAG(filter) = "BenchmarkTest.*";

    int result = RUN_ALL_TESTS();

    if (result == 0) {
        cout << "All tests passed." << endl;
    } else {
        cout << "Some tests failed." << endl;
    }

    // 关闭glog
    google::ShutdownGoogleLogging();

    return result;
}
