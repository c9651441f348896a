#include <rmbench/common/Status.h>
#include <fmt/core.h>

namespace rmbench {

std::string statusCodeToString(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::EMPTY:
            return "EMPTY";
        case StatusCode::ABORT:
            return "ABORT";
        case StatusCode::CONTENTION:
            return "CONTENTION";
        case StatusCode::CONNECTION:
            return "CONNECTION";
        case StatusCode::LOGIC:
            return "LOGIC";
        default:
            return "UNKNOWN";
    }
}

std::string Status::toString() const {
    if (m_info.empty()) {
        return statusCodeToString(m_code);
    }
    return fmt::format("{}: {}", statusCodeToString(m_code), m_info);
}

}
