#include <rmbench/executor/Benchmark.h>
#include <rmbench/thread/ThreadPool.h>
#include <condition_variable>
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <fmt/core.h>
#include <fmt/format.h>
#include <glog/logging.h>

namespace rmbench {

using namespace std::chrono;

/// @brief reject configurations the scheduler cannot run, throws std::invalid_argument
void BenchmarkConfig::Validate() const {
    if (scale < 1) {
        throw std::invalid_argument(fmt::format("scale must be at least 1, got {}", scale));
    }
    if (threads < 1) {
        throw std::invalid_argument(fmt::format("threads must be at least 1, got {}", threads));
    }
    if (rw_ratio < 0 || rw_ratio > 1) {
        throw std::invalid_argument(fmt::format("rw_ratio must be within [0, 1], got {}", rw_ratio));
    }
    double total = 0;
    for (auto w : weights) {
        if (w < 0) {
            throw std::invalid_argument(fmt::format("transaction weights must be non-negative, got {}", w));
        }
        total += w;
    }
    if (total <= 0) {
        throw std::invalid_argument("transaction weights must not all be zero");
    }
}

std::string BenchmarkConfig::Print() const {
    return fmt::format(
        "server             {}:{}\n"
        "scale              {}\n"
        "threads            {}\n"
        "transactions       {}\n"
        "rw ratio           {}\n"
        "weights            {}\n"
        "seed               {}",
        host, port, scale, threads,
        duration > 0 ? fmt::format("for {} s", duration) : fmt::format("{} per thread", transactions),
        rw_ratio,
        fmt::join(weights, ", "), seed);
}

BenchmarkExecutor::BenchmarkExecutor(Worker& worker, const BenchmarkConfig& config,
                                     Statistics& statistics, const CancellationToken& token):
    worker(worker),
    config(config),
    statistics(statistics),
    token(token),
    workload(worker.getRandom(), config.rw_ratio, config.weights),
    executor(config.scale, &token, config.backoff_unit)
{}

/// @brief run this worker's share, stops early on cancellation or a lost connection
/// @return results of every transaction that was started
std::vector<TransactionResult> BenchmarkExecutor::Run() {
    std::vector<TransactionResult> results;
    LOG(INFO) << "worker " << worker.getId() << " start";
    auto deadline = steady_clock::now() + seconds(config.duration);
    auto more = [&](size_t i) {
        return config.duration > 0 ? steady_clock::now() < deadline : i < config.transactions;
    };
    for (size_t i = 0; more(i); i++) {
        if (token.IsCancelled()) {
            LOG(INFO) << "worker " << worker.getId() << " cancelled after " << i << " transactions";
            break;
        }
        auto result = executor.Execute(workload.NextTransactionType(), worker);
        statistics.JournalResult(result);
        results.push_back(result);
        if (result.connection_lost) {
            LOG(ERROR) << "worker " << worker.getId() << " lost its connection, stopping";
            break;
        }
    }
    worker.Close();
    LOG(INFO) << "worker " << worker.getId() << " finished " << results.size() << " transactions";
    return results;
}

/// @brief set up the scheduler, workers are created in Run
/// @param config validated benchmark configuration
/// @param statistics live counters shared by all workers
/// @param factory transport factory handed to every worker
Benchmark::Benchmark(BenchmarkConfig config, Statistics& statistics, TransportFactory factory):
    config(std::move(config)),
    statistics(statistics),
    factory(std::move(factory))
{
    this->config.Validate();
    if (this->config.seed == 0) {
        this->config.seed = system_clock::now().time_since_epoch().count();
    }
    LOG(INFO) << fmt::format("Benchmark(threads={}, transactions={}, duration={}s, rw_ratio={}, scale={}, seed={})",
        this->config.threads, this->config.transactions, this->config.duration, this->config.rw_ratio,
        this->config.scale, this->config.seed);
}

void Benchmark::ReportProgress(std::stop_token stoken) {
    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock<std::mutex> lock(mutex);
    while (!stoken.stop_requested()) {
        cv.wait_for(lock, stoken, seconds(config.progress_interval), [] { return false; });
        if (stoken.stop_requested()) break;
        LOG(INFO) << statistics.Progress();
    }
}

/// @brief run every worker to completion or cancellation, then merge
BenchmarkResult Benchmark::Run() {
    workers.clear();
    for (size_t i = 0; i < config.threads; i++) {
        workers.push_back(std::make_unique<Worker>(i, factory, config.seed, config.backoff_unit));
    }

    std::jthread progress;
    if (config.progress_interval > 0) {
        progress = std::jthread([this](std::stop_token stoken) { ReportProgress(stoken); });
    }

    auto start = steady_clock::now();
    std::vector<std::vector<TransactionResult>> per_worker;
    {
        ThreadPool pool(config.threads);
        std::vector<std::future<std::vector<TransactionResult>>> futures;
        for (auto& worker : workers) {
            futures.push_back(pool.enqueue([this, w = worker.get()]() {
                BenchmarkExecutor executor(*w, config, statistics, token);
                return executor.Run();
            }));
        }
        for (auto& future : futures) {
            per_worker.push_back(future.get());
        }
    }
    auto duration = duration_cast<microseconds>(steady_clock::now() - start).count() / 1e6;

    for (auto& worker : workers) {
        worker->Close();
    }
    if (progress.joinable()) {
        progress.request_stop();
        progress.join();
    }

    if (token.IsCancelled()) {
        LOG(WARNING) << "benchmark cancelled, reporting partial results";
    }
    return Statistics::Aggregate(std::move(per_worker), duration, token.IsCancelled());
}

/// @brief prepare a sweep, throws std::invalid_argument for an empty list or a zero count
/// @param base configuration shared by every run, its thread count is replaced
/// @param thread_counts worker counts to run, in order
/// @param factory transport factory for every run
ThreadSweep::ThreadSweep(BenchmarkConfig base, std::vector<size_t> thread_counts, TransportFactory factory):
    base(std::move(base)),
    thread_counts(std::move(thread_counts)),
    factory(std::move(factory))
{
    if (this->thread_counts.empty()) {
        throw std::invalid_argument("thread sweep needs at least one thread count");
    }
    for (auto threads : this->thread_counts) {
        if (threads < 1) {
            throw std::invalid_argument("thread counts must be at least 1");
        }
    }
    this->base.Validate();
}

std::map<size_t, BenchmarkResult> ThreadSweep::Run(const Watch& watch) {
    std::map<size_t, BenchmarkResult> results;
    for (auto threads : thread_counts) {
        LOG(INFO) << "running test with " << threads << " threads";
        auto config = base;
        config.threads = threads;
        Statistics statistics;
        Benchmark benchmark(config, statistics, factory);
        if (watch) watch(&benchmark.getToken());
        auto result = benchmark.Run();
        if (watch) watch(nullptr);
        bool cancelled = result.cancelled;
        results[threads] = std::move(result);
        if (cancelled) {
            LOG(WARNING) << "thread sweep cancelled at " << threads << " threads";
            break;
        }
    }
    return results;
}

/// @brief one line per thread count
std::string ThreadSweep::Print(const std::map<size_t, BenchmarkResult>& results) {
    std::string text = fmt::format("{:>8} {:>10} {:>10} {:>12} {:>10} {:>10}",
                                   "threads", "total", "success", "tps", "avg ms", "p95 ms");
    for (const auto& [threads, r] : results) {
        text += fmt::format("\n{:>8} {:>10} {:>9.2f}% {:>12.2f} {:>10.2f} {:>10.2f}{}",
                            threads, r.total_transactions, r.successRate(), r.throughput_tps,
                            r.avg_response_time * 1000, r.p95_response_time * 1000,
                            r.cancelled ? "  (cancelled)" : "");
    }
    return text;
}

}
