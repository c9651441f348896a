#pragma once

#include <chrono>
#include <memory>
#include <rmbench/common/Status.h>
#include <rmbench/database/Connection.h>
#include <rmbench/workload/tpcc/Random.h>

namespace rmbench {

/// @brief per-worker context: id, private Random and one lazily opened connection
class Worker {
    public:
        typedef std::unique_ptr<Worker> Ptr;

        Worker(size_t id, TransportFactory factory, uint64_t seed,
               std::chrono::milliseconds backoff = std::chrono::milliseconds(100));
        ~Worker();
        Worker(const Worker&) = delete;
        Worker& operator=(const Worker&) = delete;

        Status AcquireConnection(Connection*& conn);
        void Close();

        size_t getId() const {return id;}
        Random& getRandom() {return random;}
        bool isConnected() const {return connection && connection->IsConnected();}
        size_t getConnectAttempts() const {return connect_attempts;}

    private:
        size_t                      id;
        TransportFactory            factory;
        Random                      random;
        std::chrono::milliseconds   backoff;
        Connection::Ptr             connection;
        size_t                      connect_attempts = 0;
};

}
