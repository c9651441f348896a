#include <rmbench/workload/tpcc/Workload.h>
#include <numeric>
#include <stdexcept>

namespace rmbench {

const TransactionWeights Workload::DEFAULT_WEIGHTS = {0.45, 0.43, 0.04, 0.04, 0.04};

Workload::Workload(Random& random, double rw_ratio, const TransactionWeights& weights):
    random(random), rw_ratio(rw_ratio), weights(weights)
{
    if (sum(0, weights.size()) <= 0) {
        throw std::invalid_argument("transaction weights must not all be zero");
    }
}

double Workload::sum(size_t begin, size_t end) const {
    return std::accumulate(weights.begin() + begin, weights.begin() + end, 0.0);
}

/// @brief weighted choice inside [begin, end)
size_t Workload::pick(size_t begin, size_t end) {
    auto r = random.uniform_real(0.0, sum(begin, end));
    double acc = 0;
    size_t last = begin;
    for (size_t i = begin; i < end; i++) {
        if (weights[i] <= 0) continue;
        acc += weights[i];
        last = i;
        if (r < acc) return i;
    }
    return last;
}

TPCC::TransactionType Workload::NextTransactionType() {
    bool read_write = random.uniform_real(0.0, 1.0) < rw_ratio;
    size_t begin = read_write ? 0 : READ_WRITE_TYPES;
    size_t end = read_write ? READ_WRITE_TYPES : weights.size();
    // 该类权重全为 0 时退回另一类
    if (sum(begin, end) <= 0) {
        begin = read_write ? READ_WRITE_TYPES : 0;
        end = read_write ? weights.size() : READ_WRITE_TYPES;
    }
    return static_cast<TPCC::TransactionType>(pick(begin, end));
}

}
