#include <rmbench/executor/Worker.h>
#include <rmbench/common/common.h>
#include <thread>
#include <fmt/core.h>
#include <glog/logging.h>

namespace rmbench {

/// @brief create a worker, no connection is opened here
/// @param id worker id, also added to the seed
/// @param factory creates the transport on first use
/// @param seed base seed shared by all workers of a run
/// @param backoff unit of the linear connect backoff
Worker::Worker(size_t id, TransportFactory factory, uint64_t seed, std::chrono::milliseconds backoff):
    id(id),
    factory(std::move(factory)),
    random(seed + id),
    backoff(backoff)
{}

Worker::~Worker() {
    Close();
}

/// @brief connection of this worker, opened on first call with bounded retries
/// @param conn set to the open connection on success
/// @return OK, or CONNECTION once every attempt failed
Status Worker::AcquireConnection(Connection*& conn) {
    if (isConnected()) {
        conn = connection.get();
        return Status::OK();
    }
    Status status;
    for (size_t attempt = 1; attempt <= MAX_CONNECT_ATTEMPTS; attempt++) {
        connect_attempts++;
        auto candidate = std::make_unique<Connection>(factory);
        status = candidate->Connect();
        if (status.ok()) {
            connection = std::move(candidate);
            conn = connection.get();
            LOG(INFO) << "worker " << id << " connected";
            return status;
        }
        LOG(WARNING) << fmt::format("worker {} failed to connect (attempt {}/{}): {}",
                                    id, attempt, MAX_CONNECT_ATTEMPTS, status.info());
        if (attempt < MAX_CONNECT_ATTEMPTS) {
            std::this_thread::sleep_for(backoff * attempt);
        }
    }
    LOG(ERROR) << fmt::format("worker {} cannot connect after {} attempts", id, MAX_CONNECT_ATTEMPTS);
    conn = nullptr;
    return status;
}

void Worker::Close() {
    if (connection) {
        connection->Close();
        connection.reset();
        LOG(INFO) << "worker " << id << " connection closed";
    }
}

}
