#include <gtest/gtest.h>
#include <rmbench/workload/tpcc/Workload.h>

using namespace std;
using namespace rmbench;

TEST(WorkloadTest, ReadWriteOnly) {
    Random random(11);
    Workload workload(random, 1.0);
    for (int i = 0; i < 1000; i++) {
        auto type = workload.NextTransactionType();
        EXPECT_TRUE(type == TPCC::NEW_ORDER || type == TPCC::PAYMENT || type == TPCC::DELIVERY);
    }
}

TEST(WorkloadTest, ReadOnly) {
    Random random(11);
    Workload workload(random, 0.0);
    for (int i = 0; i < 1000; i++) {
        auto type = workload.NextTransactionType();
        EXPECT_TRUE(type == TPCC::ORDER_STATUS || type == TPCC::STOCK_LEVEL);
    }
}

TEST(WorkloadTest, EmptySliceFallsBack) {
    Random random(3);
    // 只读事务权重为 0，全部落到 NewOrder
    Workload workload(random, 0.0, {1, 0, 0, 0, 0});
    for (int i = 0; i < 200; i++) {
        EXPECT_EQ(workload.NextTransactionType(), TPCC::NEW_ORDER);
    }
    Workload readonly(random, 1.0, {0, 0, 0, 0, 2});
    for (int i = 0; i < 200; i++) {
        EXPECT_EQ(readonly.NextTransactionType(), TPCC::STOCK_LEVEL);
    }
}

TEST(WorkloadTest, ZeroWeightNeverChosen) {
    Random random(5);
    Workload workload(random, 0.5, {1, 0, 1, 0, 1});
    for (int i = 0; i < 1000; i++) {
        auto type = workload.NextTransactionType();
        EXPECT_NE(type, TPCC::PAYMENT);
        EXPECT_NE(type, TPCC::ORDER_STATUS);
    }
}

TEST(WorkloadTest, AllZeroWeightsRejected) {
    Random random(1);
    EXPECT_THROW(Workload(random, 0.5, {0, 0, 0, 0, 0}), std::invalid_argument);
}

TEST(WorkloadTest, DefaultMix) {
    Random random(2024);
    Workload workload(random, 0.5);
    EXPECT_EQ(workload.getWeights(), Workload::DEFAULT_WEIGHTS);
    EXPECT_DOUBLE_EQ(workload.getReadWriteRatio(), 0.5);

    const size_t n = 40000;
    array<size_t, TPCC::N_TRANSACTION_TYPES> counts{};
    for (size_t i = 0; i < n; i++) {
        counts[workload.NextTransactionType()]++;
    }
    // 0.5 * 0.45 / 0.92, 0.5 * 0.04 / 0.92, 0.5 * 0.5
    EXPECT_NEAR((double)counts[TPCC::NEW_ORDER] / n, 0.2446, 0.02);
    EXPECT_NEAR((double)counts[TPCC::DELIVERY] / n, 0.0217, 0.01);
    EXPECT_NEAR((double)counts[TPCC::ORDER_STATUS] / n, 0.25, 0.02);
    EXPECT_NEAR((double)counts[TPCC::STOCK_LEVEL] / n, 0.25, 0.02);
}
