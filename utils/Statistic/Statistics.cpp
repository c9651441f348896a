#include <rmbench/utils/Statistic/Statistics.h>
#include <fmt/core.h>
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <glog/logging.h>
#include <tbb/parallel_sort.h>
#include <cmath>
#include <ctime>

namespace rmbench {

/// @brief record one finished transaction in the live counters
void Statistics::JournalResult(const TransactionResult& result) {
    JournalExecute();
    if (result.success) {
        JournalCommit(static_cast<size_t>(result.execution_time * 1000000));
    } else {
        JournalRollback();
    }
    if (result.attempts > 1) {
        JournalRetry(result.attempts - 1);
    }
}

void Statistics::JournalCommit(size_t latency) {
    count_commit.fetch_add(1, std::memory_order_relaxed);
    count_latency.fetch_add(latency, std::memory_order_relaxed);
    DLOG(INFO) << "latency: " << latency << "us";
}

void Statistics::JournalExecute() {
    count_execution.fetch_add(1, std::memory_order_relaxed);
}

void Statistics::JournalRollback() {
    count_rollback.fetch_add(1, std::memory_order_relaxed);
}

void Statistics::JournalRetry(size_t count) {
    count_retry.fetch_add(count, std::memory_order_relaxed);
}

// nearest-rank percentile on a sorted vector
static double percentile(const std::vector<double>& sorted, double p) {
    if (sorted.empty()) return 0;
    auto rank = static_cast<size_t>(std::ceil(p / 100 * sorted.size()));
    return sorted[rank == 0 ? 0 : rank - 1];
}

/// @brief one line summary of the live counters
std::string Statistics::Progress() const {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin_time).count();
    auto executed = count_execution.load();
    auto committed = count_commit.load();
    return fmt::format(
        "progress: {} executed, {} committed, {} failed, {} retries, {:.2f} tx/s, avg latency {:.3f} ms",
        executed, committed, count_rollback.load(), count_retry.load(),
        elapsed > 0 ? executed / elapsed : 0.0,
        committed > 0 ? count_latency.load() / (double)committed / 1000 : 0.0);
}

/// @brief merge per-worker results into totals, rates and per-type counts
/// @param per_worker results grouped by worker id
/// @param total_duration wall clock seconds of the run
/// @param cancelled whether the run stopped early
BenchmarkResult Statistics::Aggregate(std::vector<std::vector<TransactionResult>> per_worker,
                                      double total_duration, bool cancelled) {
    BenchmarkResult result;
    result.total_duration = total_duration;
    result.cancelled = cancelled;

    std::vector<double> latencies;
    double latency_sum = 0;
    for (const auto& results : per_worker) {
        for (const auto& r : results) {
            result.total_transactions++;
            result.transaction_breakdown[r.type]++;
            if (r.success) {
                result.successful_transactions++;
                result.successful_breakdown[r.type]++;
            }
            latency_sum += r.execution_time;
            latencies.push_back(r.execution_time);
        }
    }
    result.failed_transactions = result.total_transactions - result.successful_transactions;
    if (result.total_transactions > 0) {
        result.avg_response_time = latency_sum / result.total_transactions;
    }
    if (total_duration > 0) {
        result.throughput_tps = result.total_transactions / total_duration;
    }

    tbb::parallel_sort(latencies.begin(), latencies.end());
    result.p50_response_time = percentile(latencies, 50);
    result.p95_response_time = percentile(latencies, 95);
    result.p99_response_time = percentile(latencies, 99);

    result.per_worker_results = std::move(per_worker);
    return result;
}

/// @brief human readable report of a merged result
std::string Statistics::Print(const BenchmarkResult& result) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::string breakdown;
    for (size_t type = 0; type < TPCC::N_TRANSACTION_TYPES; type++) {
        auto count = result.transaction_breakdown[type];
        double share = result.total_transactions > 0 ? (double)count / result.total_transactions * 100 : 0;
        breakdown += fmt::format("\n  {:<18} {:>8} ({:5.1f}%)  succeeded {}",
            TPCC::transactionTypeToString(static_cast<TPCC::TransactionType>(type)),
            count, share, result.successful_breakdown[type]);
    }

    return fmt::format(
        "{:%F %T}\n"
        "total transactions {}\n"
        "successful         {}\n"
        "failed             {}\n"
        "success rate       {:.2f}%\n"
        "duration           {:.2f} s\n"
        "avg response time  {:.2f} ms\n"
        "p50 / p95 / p99    {:.2f} / {:.2f} / {:.2f} ms\n"
        "throughput         {:.2f} tx/s\n"
        "workers            {}\n"
        "cancelled          {}\n"
        "transaction mix:{}",
        fmt::localtime(now),
        result.total_transactions,
        result.successful_transactions,
        result.failed_transactions,
        result.successRate(),
        result.total_duration,
        result.avg_response_time * 1000,
        result.p50_response_time * 1000, result.p95_response_time * 1000, result.p99_response_time * 1000,
        result.throughput_tps,
        result.per_worker_results.size(),
        result.cancelled,
        breakdown
    );
}

} // namespace rmbench
