#pragma once

#include <memory>
#include <string>
#include <vector>
#include <rmbench/common/Status.h>
#include <rmbench/database/Cursor.h>
#include <rmbench/database/Transport.h>

namespace rmbench {

/// @brief one logical session with the server, owned by a single worker
class Connection {
    public:
        typedef std::unique_ptr<Connection> Ptr;

        explicit Connection(TransportFactory factory);
        ~Connection();
        Connection(const Connection&) = delete;
        Connection& operator=(const Connection&) = delete;

        Status Connect();
        void Close();
        bool IsConnected() const;

        Status ExecuteQuery(const std::string& sql, const Params& params, std::vector<Row>& rows);
        Status ExecuteUpdate(const std::string& sql, const Params& params = {});
        Status ExecuteScript(const std::string& script);

        Status Begin()    { return ExecuteUpdate("BEGIN"); }
        Status Commit()   { return ExecuteUpdate("COMMIT"); }
        Status Rollback();

    private:
        TransportFactory            factory;
        Transport::Ptr              transport;
        std::unique_ptr<Cursor>     cursor;
};

}
