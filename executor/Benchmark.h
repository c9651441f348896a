#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <stop_token>
#include <string>
#include <vector>
#include <cstdint>
#include <rmbench/common/common.h>
#include <rmbench/database/Transport.h>
#include <rmbench/executor/Worker.h>
#include <rmbench/executor/TransactionExecutor.h>
#include <rmbench/workload/tpcc/Workload.h>
#include <rmbench/utils/CancellationToken.h>
#include <rmbench/utils/Statistic/Statistics.h>

namespace rmbench {

struct BenchmarkConfig {
    std::string         host = DEFAULT_HOST;
    unsigned short      port = DEFAULT_PORT;
    size_t              scale = 1;
    size_t              threads = 1;
    size_t              transactions = 100;     // per worker
    size_t              duration = 0;           // seconds, when set it replaces the transaction count
    double              rw_ratio = 0.5;
    TransactionWeights  weights = Workload::DEFAULT_WEIGHTS;
    uint64_t            seed = 0;               // 0 draws a seed from the clock
    size_t              progress_interval = 5;  // seconds, 0 disables
    std::chrono::milliseconds backoff_unit{100};

    void Validate() const;
    std::string Print() const;
};

/// @brief one worker's transaction loop
class BenchmarkExecutor {
    public:
        BenchmarkExecutor(Worker& worker, const BenchmarkConfig& config,
                          Statistics& statistics, const CancellationToken& token);
        std::vector<TransactionResult> Run();

    private:
        Worker&                     worker;
        const BenchmarkConfig&      config;
        Statistics&                 statistics;
        const CancellationToken&    token;
        Workload                    workload;
        TransactionExecutor         executor;
};

/// @brief fans the workers out on a thread pool and merges their results
class Benchmark {
    public:
        Benchmark(BenchmarkConfig config, Statistics& statistics, TransportFactory factory);
        BenchmarkResult Run();
        void Stop() { token.Cancel(); }
        CancellationToken& getToken() {return token;}

    private:
        void ReportProgress(std::stop_token stoken);

        BenchmarkConfig         config;
        Statistics&             statistics;
        TransportFactory        factory;
        CancellationToken       token;
        std::vector<Worker::Ptr> workers;
};

/// @brief the same workload once per thread count, stops after a cancelled run
class ThreadSweep {
    public:
        // 每次运行开始前收到当前 benchmark 的 token
        using Watch = std::function<void(CancellationToken*)>;

        ThreadSweep(BenchmarkConfig base, std::vector<size_t> thread_counts, TransportFactory factory);
        std::map<size_t, BenchmarkResult> Run(const Watch& watch = nullptr);

        static std::string Print(const std::map<size_t, BenchmarkResult>& results);

    private:
        BenchmarkConfig         base;
        std::vector<size_t>     thread_counts;
        TransportFactory        factory;
};

}
