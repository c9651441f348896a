#pragma once

#include <string>

namespace rmbench {

enum class StatusCode {
    OK,
    EMPTY,          // empty or "Error..." response, zero rows
    ABORT,          // server replied "abort..."
    CONTENTION,     // abort or error text mentioning deadlock / timeout / lock
    CONNECTION,     // transport or connect failure
    LOGIC           // expected record absent
};

std::string statusCodeToString(StatusCode code);

/// @brief result of a statement or transaction attempt, tagged by error kind
class Status {
    public:
        Status() : m_code(StatusCode::OK) {}
        Status(StatusCode code, std::string info = "") : m_code(code), m_info(std::move(info)) {}

        static Status OK() { return Status(); }
        static Status Empty(std::string info = "") { return Status(StatusCode::EMPTY, std::move(info)); }
        static Status Abort(std::string info) { return Status(StatusCode::ABORT, std::move(info)); }
        static Status Contention(std::string info) { return Status(StatusCode::CONTENTION, std::move(info)); }
        static Status Connection(std::string info) { return Status(StatusCode::CONNECTION, std::move(info)); }
        static Status Logic(std::string info) { return Status(StatusCode::LOGIC, std::move(info)); }

        // EMPTY counts as success
        bool ok() const { return m_code == StatusCode::OK || m_code == StatusCode::EMPTY; }
        bool isEmpty() const { return m_code == StatusCode::EMPTY; }
        bool isAbort() const { return m_code == StatusCode::ABORT || m_code == StatusCode::CONTENTION; }
        bool isConnection() const { return m_code == StatusCode::CONNECTION; }
        bool isLogic() const { return m_code == StatusCode::LOGIC; }

        StatusCode code() const { return m_code; }
        const std::string& info() const { return m_info; }

        std::string toString() const;

    private:
        StatusCode m_code;
        std::string m_info;
};

}
