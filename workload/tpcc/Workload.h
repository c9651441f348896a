#pragma once

#include <array>
#include <rmbench/workload/tpcc/Define.h>
#include <rmbench/workload/tpcc/Random.h>

namespace rmbench {

typedef std::array<double, TPCC::N_TRANSACTION_TYPES> TransactionWeights;

/* 负载类：按读写比例和五类事务权重选择下一个事务类型 */
class Workload {
    public:
        Workload(Random& random, double rw_ratio, const TransactionWeights& weights = DEFAULT_WEIGHTS);
        ~Workload() = default;

        // 读写事务取 NewOrder/Payment/Delivery 的权重，只读事务取 OrderStatus/StockLevel 的权重
        TPCC::TransactionType NextTransactionType();

        double getReadWriteRatio() const {return rw_ratio;}
        const TransactionWeights& getWeights() const {return weights;}

        static const TransactionWeights DEFAULT_WEIGHTS;
        static const size_t READ_WRITE_TYPES = 3;

    private:
        size_t pick(size_t begin, size_t end);
        double sum(size_t begin, size_t end) const;

        Random& random;
        double rw_ratio;
        TransactionWeights weights;
};

}
