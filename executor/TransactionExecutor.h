#pragma once

#include <chrono>
#include <functional>
#include <rmbench/common/Status.h>
#include <rmbench/executor/Worker.h>
#include <rmbench/workload/tpcc/Define.h>
#include <rmbench/utils/CancellationToken.h>

namespace rmbench {

/// @brief outcome of one transaction including all of its retries
struct TransactionResult {
    TPCC::TransactionType type;
    bool success = false;
    double execution_time = 0;      // seconds, first attempt to last
    std::chrono::system_clock::time_point timestamp;
    size_t worker_id = 0;
    size_t attempts = 0;
    bool connection_lost = false;   // the worker could not (re)connect
    bool cancelled = false;
};

/// @brief retry wrapper around the transaction profiles
class TransactionExecutor {
    public:
        using Attempt = std::function<Status(Connection&)>;

        TransactionExecutor(size_t n_warehouses, const CancellationToken* token = nullptr,
                            std::chrono::milliseconds backoff_unit = std::chrono::milliseconds(100));

        TransactionResult Execute(TPCC::TransactionType type, Worker& worker);
        TransactionResult Execute(TPCC::TransactionType type, Worker& worker, const Attempt& attempt);

        static bool IsContention(const Status& status);
        std::chrono::milliseconds Backoff(const Status& status, size_t attempt) const;

    private:
        size_t                      n_warehouses;
        const CancellationToken*    token;
        std::chrono::milliseconds   backoff_unit;
};

}
