#include <rmbench/executor/TransactionExecutor.h>
#include <rmbench/common/common.h>
#include <rmbench/database/Cursor.h>
#include <rmbench/workload/tpcc/Transaction.h>
#include <thread>
#include <fmt/core.h>
#include <glog/logging.h>

namespace rmbench {

using namespace std::chrono;

// 冲突类失败的退避倍数：0.5s 对 0.1s
static const int CONTENTION_BACKOFF_FACTOR = 5;

/// @brief create a retry wrapper
/// @param n_warehouses scale used to draw transaction inputs
/// @param token checked before every retry, may be null
/// @param backoff_unit short backoff per attempt, contention waits five units per attempt
TransactionExecutor::TransactionExecutor(size_t n_warehouses, const CancellationToken* token, milliseconds backoff_unit):
    n_warehouses(n_warehouses),
    token(token),
    backoff_unit(backoff_unit)
{}

/// @brief contention when tagged so or when the text mentions deadlock, timeout or lock
bool TransactionExecutor::IsContention(const Status& status) {
    return status.code() == StatusCode::CONTENTION || Cursor::IsContention(status.info());
}

milliseconds TransactionExecutor::Backoff(const Status& status, size_t attempt) const {
    auto unit = IsContention(status) ? backoff_unit * CONTENTION_BACKOFF_FACTOR : backoff_unit;
    return unit * attempt;
}

/// @brief run a freshly drawn profile of the given type with retries
TransactionResult TransactionExecutor::Execute(TPCC::TransactionType type, Worker& worker) {
    auto txn = TPCCTransaction::create(type, worker.getRandom(), n_warehouses);
    return Execute(type, worker, [&txn](Connection& conn) { return txn->execute(conn); });
}

/// @brief run one attempt function up to MAX_TXN_ATTEMPTS times
/// @param type transaction type recorded in the result
/// @param worker supplies the connection
/// @param attempt one try of the transaction
/// @return failed results carry the total elapsed time and the first attempt's timestamp
TransactionResult TransactionExecutor::Execute(TPCC::TransactionType type, Worker& worker, const Attempt& attempt) {
    TransactionResult result;
    result.type = type;
    result.worker_id = worker.getId();
    result.timestamp = system_clock::now();
    auto start = steady_clock::now();

    Status status;
    for (size_t n = 1; n <= MAX_TXN_ATTEMPTS; n++) {
        if (n > 1 && token && token->IsCancelled()) {
            result.cancelled = true;
            break;
        }
        result.attempts = n;
        Connection* conn = nullptr;
        status = worker.AcquireConnection(conn);
        if (!status.ok()) {
            // the worker already retried establishing, this is fatal for it
            result.connection_lost = true;
            break;
        }
        status = attempt(*conn);
        // a missing row has been rolled back by the profile and is not retried
        if (status.ok() || status.isLogic()) break;

        LOG(WARNING) << fmt::format("worker {} {} attempt {} failed: {}", worker.getId(),
                                    TPCC::transactionTypeToString(type), n, status.toString());
        if (status.isConnection()) {
            worker.Close();
        }
        if (n < MAX_TXN_ATTEMPTS) {
            if (IsContention(status)) {
                LOG(INFO) << "detected lock contention, backing off longer";
            }
            std::this_thread::sleep_for(Backoff(status, n));
        }
    }

    result.execution_time = duration<double>(steady_clock::now() - start).count();
    result.success = status.ok() && !result.cancelled;
    if (result.execution_time > SLOW_TXN_SECONDS) {
        LOG(WARNING) << fmt::format("{} took {:.2f}s", TPCC::transactionTypeToString(type), result.execution_time);
    }
    if (!result.success && !status.isLogic() && !result.cancelled) {
        LOG(ERROR) << fmt::format("worker {} {} failed after {} attempts: {}", worker.getId(),
                                  TPCC::transactionTypeToString(type), result.attempts, status.toString());
    } else if (status.isLogic()) {
        DLOG(INFO) << fmt::format("worker {} {} rolled back: {}", worker.getId(),
                                  TPCC::transactionTypeToString(type), status.info());
    }
    return result;
}

}
