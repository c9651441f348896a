#include <rmbench/database/Connection.h>
#include <rmbench/database/Transport.h>
#include <rmbench/executor/Benchmark.h>
#include <rmbench/executor/ConsistencyChecker.h>
#include <rmbench/executor/LoadExecutor.h>
#include <rmbench/executor/SchemaManager.h>
#include <rmbench/workload/tpcc/Generator.h>
#include <rmbench/workload/tpcc/Random.h>
#include <rmbench/utils/Statistic/Statistics.h>
#include <rmbench/utils/UArgparse.hpp>
#include <rmbench/utils/Interrupt.h>
#include <filesystem>
#include <iostream>
#include <fmt/core.h>
#include <glog/logging.h>
#include <gflags/gflags.h>

DEFINE_string(host, "127.0.0.1", "RMDB server host");
DEFINE_int32(port, rmbench::DEFAULT_PORT, "RMDB server port");
DEFINE_int32(scale, 1, "scale factor (number of warehouses)");
DEFINE_bool(init, false, "create schema and indexes, then load data");
DEFINE_bool(check, false, "run consistency checks");
DEFINE_bool(stats, false, "show table row counts");
DEFINE_bool(benchmark, false, "run the concurrent benchmark");
DEFINE_int32(threads, 1, "number of concurrent workers");
DEFINE_int32(transactions, 100, "transactions per worker");
DEFINE_int32(duration, 0, "run each worker for this many seconds instead of a fixed count, 0 disables");
DEFINE_string(sweep, "", "comma separated thread counts, repeat the benchmark once per count (e.g. 1,2,4,8,16)");
DEFINE_double(rw_ratio, 0.5, "probability of drawing a read-write transaction");
DEFINE_string(txn_probs, "0.45,0.43,0.04,0.04,0.04", "NewOrder,Payment,Delivery,OrderStatus,StockLevel weights");
DEFINE_uint64(seed, 0, "base random seed, 0 for time based");
DEFINE_int32(progress_interval, 5, "seconds between progress lines, 0 disables");
DEFINE_bool(verbose, false, "trace every statement");

using namespace rmbench;

static BenchmarkConfig ParseConfig() {
    if (FLAGS_threads < 1 || FLAGS_transactions < 0 || FLAGS_duration < 0 || FLAGS_progress_interval < 0) {
        THROW("threads must be positive, transactions, duration and progress_interval non-negative");
    }
    if (FLAGS_port <= 0 || FLAGS_port > 65535) {
        THROW("port ({}) out of range", FLAGS_port);
    }
    BenchmarkConfig config;
    config.host = FLAGS_host;
    config.port = static_cast<unsigned short>(FLAGS_port);
    config.scale = FLAGS_scale;
    config.threads = FLAGS_threads;
    config.transactions = FLAGS_transactions;
    config.duration = FLAGS_duration;
    config.rw_ratio = FLAGS_rw_ratio;
    config.weights = ParseWeights(FLAGS_txn_probs);
    config.seed = FLAGS_seed;
    config.progress_interval = FLAGS_progress_interval;
    config.Validate();
    return config;
}

static std::vector<size_t> ParseThreadCounts(const std::string& arg) {
    std::vector<size_t> counts;
    for (const auto& tok : split(arg, ',')) {
        auto threads = to<int>(tok);
        if (threads < 1) THROW("thread count ({}) must be positive", tok);
        counts.push_back(threads);
    }
    return counts;
}

static int Run() {
    if (FLAGS_scale < 1) {
        LOG(ERROR) << "scale factor must be at least 1";
        return 1;
    }
    auto config = ParseConfig();
    // Ctrl-C ends every mode with status 0
    InterruptGuard interrupt;
    auto factory = TcpTransport::Factory(config.host, config.port);

    if (FLAGS_init || FLAGS_check || FLAGS_stats) {
        Connection conn(factory);
        auto status = conn.Connect();
        if (!status.ok()) {
            LOG(ERROR) << fmt::format("cannot connect to {}:{}: {}", config.host, config.port, status.toString());
            return 1;
        }
        if (FLAGS_init) {
            LOG(INFO) << "initializing TPC-C database with scale factor " << config.scale;
            SchemaManager schema(conn);
            schema.CreateSchema();
            schema.CreateIndexes();
            Random random(config.seed == 0 ? std::random_device{}() : config.seed);
            Generator generator(random, config.scale);
            LoadExecutor(conn).LoadAll(generator);
        }
        if (FLAGS_check) {
            ConsistencyChecker checker(conn, config.scale);
            auto checks = checker.RunConsistencyChecks();
            for (const auto& [name, ok] : checks) {
                if (!ok) {
                    LOG(ERROR) << "some consistency checks failed";
                    return 1;
                }
            }
            LOG(INFO) << "all consistency checks passed";
        }
        if (FLAGS_stats) {
            ConsistencyChecker checker(conn, config.scale);
            std::cout << "database statistics:" << std::endl;
            for (const auto& [table, count] : checker.GetDatabaseStats()) {
                std::cout << fmt::format("  {:<12} {}", table, count) << std::endl;
            }
        }
    }

    if (FLAGS_benchmark && !FLAGS_sweep.empty()) {
        LOG(INFO) << "starting TPC-C thread sweep...";
        ThreadSweep sweep(config, ParseThreadCounts(FLAGS_sweep), factory);
        auto results = sweep.Run([&interrupt](CancellationToken* token) { interrupt.Watch(token); });
        std::cout << std::string(60, '=') << "\n"
                  << "TPC-C THREAD SWEEP RESULTS\n"
                  << std::string(60, '=') << "\n"
                  << config.Print() << "\n\n"
                  << ThreadSweep::Print(results) << "\n"
                  << std::string(60, '=') << std::endl;
    } else if (FLAGS_benchmark) {
        LOG(INFO) << "starting TPC-C benchmark...";
        Statistics statistics;
        Benchmark benchmark(config, statistics, factory);
        interrupt.Watch(&benchmark.getToken());
        auto result = benchmark.Run();
        interrupt.Unwatch();
        std::cout << std::string(60, '=') << "\n"
                  << "TPC-C CONCURRENT BENCHMARK RESULTS\n"
                  << std::string(60, '=') << "\n"
                  << config.Print() << "\n\n"
                  << Statistics::Print(result) << "\n"
                  << std::string(60, '=') << std::endl;
        LOG(INFO) << "\n" << Statistics::Print(result);
    }

    if (!(FLAGS_init || FLAGS_check || FLAGS_stats || FLAGS_benchmark)) {
        LOG(WARNING) << "use --init to load data, --check for consistency checks, "
                        "--benchmark for the benchmark, or --stats for table counts";
    }
    return 0;
}

int main(int argc, char** argv) {
    gflags::SetUsageMessage("TPC-C benchmark client for RMDB");
    gflags::ParseCommandLineFlags(&argc, &argv, true);
    CHECK(argc == 1) << "unexpected positional arguments, we got " << argc - 1;

    /*  init glog  */
    if (FLAGS_log_dir.empty()) FLAGS_log_dir = "./log";
    std::error_code ec;
    std::filesystem::create_directories(FLAGS_log_dir, ec);
    if (ec) std::cerr << "cannot create log dir " << FLAGS_log_dir << ": " << ec.message() << std::endl;
    if (FLAGS_verbose) FLAGS_v = 1;
    // set error threshold to warning
    FLAGS_stderrthreshold = google::WARNING;
    google::InitGoogleLogging(argv[0]);

    int code = 0;
    try {
        code = Run();
    } catch (const std::exception& e) {
        LOG(ERROR) << "Error: " << e.what();
        code = 1;
    }
    // showdown glog
    google::ShutdownGoogleLogging();
    return code;
}
