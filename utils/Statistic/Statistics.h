#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <string>
#include <vector>
#include <rmbench/executor/TransactionExecutor.h>
#include <rmbench/workload/tpcc/Define.h>

namespace rmbench {

typedef std::array<size_t, TPCC::N_TRANSACTION_TYPES> TypeCounts;

/// @brief merged outcome of a benchmark run
struct BenchmarkResult {
    size_t total_transactions = 0;
    size_t successful_transactions = 0;
    size_t failed_transactions = 0;
    double avg_response_time = 0;   // seconds
    double throughput_tps = 0;
    double total_duration = 0;      // seconds
    double p50_response_time = 0;
    double p95_response_time = 0;
    double p99_response_time = 0;
    TypeCounts transaction_breakdown{};
    TypeCounts successful_breakdown{};
    std::vector<std::vector<TransactionResult>> per_worker_results;
    bool cancelled = false;

    double successRate() const {
        return total_transactions == 0 ? 0 : (double)successful_transactions / total_transactions * 100;
    }
};

class Statistics {

    private:
    std::atomic<size_t> count_commit{0};
    std::atomic<size_t> count_execution{0};
    std::atomic<size_t> count_rollback{0};
    std::atomic<size_t> count_retry{0};
    std::atomic<size_t> count_latency{0};
    std::chrono::steady_clock::time_point begin_time;

    public:
    Statistics() : begin_time(std::chrono::steady_clock::now()) {}
    Statistics(const Statistics& statistics) = delete;
    void JournalResult(const TransactionResult& result);
    void JournalCommit(size_t latency);
    void JournalExecute();
    void JournalRollback();
    void JournalRetry(size_t count);
    size_t Executed() const {return count_execution.load();}
    std::string Progress() const;

    static BenchmarkResult Aggregate(std::vector<std::vector<TransactionResult>> per_worker,
                                     double total_duration, bool cancelled = false);
    static std::string Print(const BenchmarkResult& result);

};

} // namespace rmbench
