#include <rmbench/database/Connection.h>
#include <rmbench/common/common.h>
#include <chrono>
#include <fmt/core.h>
#include <glog/logging.h>

namespace rmbench {

using namespace std::chrono;

Connection::Connection(TransportFactory factory): factory(std::move(factory)) {}

Connection::~Connection() {
    Close();
}

/// @brief open the transport, one try
/// @return OK or CONNECTION
Status Connection::Connect() {
    if (IsConnected()) return Status::OK();
    try {
        auto t = factory();
        t->Connect();
        transport = std::move(t);
        cursor = std::make_unique<Cursor>(*transport);
    } catch (const TransportError& e) {
        transport.reset();
        cursor.reset();
        return Status::Connection(e.what());
    }
    return Status::OK();
}

void Connection::Close() {
    cursor.reset();
    if (transport) {
        transport->Close();
        transport.reset();
    }
}

bool Connection::IsConnected() const {
    return transport && transport->IsOpen();
}

/// @brief run a query and drain all rows
/// @param sql statement template
/// @param params positional parameters
/// @param rows receives the result rows, cleared first
Status Connection::ExecuteQuery(const std::string& sql, const Params& params, std::vector<Row>& rows) {
    rows.clear();
    if (!cursor) return Status::Connection("not connected");
    auto start = steady_clock::now();
    auto status = cursor->Execute(sql, params);
    auto elapsed = duration<double>(steady_clock::now() - start).count();
    if (elapsed > SLOW_QUERY_SECONDS) {
        LOG(WARNING) << fmt::format("slow query ({:.3f}s): {}", elapsed, sql);
    }
    if (status.ok()) rows = cursor->FetchAll();
    return status;
}

/// @brief run a statement whose result rows are not needed
Status Connection::ExecuteUpdate(const std::string& sql, const Params& params) {
    if (!cursor) return Status::Connection("not connected");
    auto start = steady_clock::now();
    auto status = cursor->Execute(sql, params);
    auto elapsed = duration<double>(steady_clock::now() - start).count();
    if (elapsed > SLOW_UPDATE_SECONDS) {
        LOG(WARNING) << fmt::format("slow update ({:.3f}s): {}", elapsed, sql);
    }
    return status;
}

Status Connection::ExecuteScript(const std::string& script) {
    if (!cursor) return Status::Connection("not connected");
    return cursor->ExecuteScript(script);
}

/// @brief best-effort rollback, failures are only logged
Status Connection::Rollback() {
    auto status = ExecuteUpdate("ROLLBACK");
    if (!status.ok()) {
        LOG(WARNING) << "rollback failed: " << status.toString();
    }
    return status;
}

}
