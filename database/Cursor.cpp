#include <rmbench/database/Cursor.h>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <fmt/core.h>
#include <glog/logging.h>

namespace rmbench {

namespace {

const char* const WHITESPACE = " \t\r\n\v\f";

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(WHITESPACE);
    if (first == std::string::npos) return "";
    auto last = s.find_last_not_of(WHITESPACE);
    return s.substr(first, last - first + 1);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

}

Cursor::Cursor(Transport& transport): transport(transport) {}

/// @brief render one parameter as a literal
/// @param param the parameter to render
/// @return quoted string, NULL, or the number as text
std::string Cursor::Quote(const Param& param) {
    if (std::holds_alternative<std::monostate>(param)) {
        return "NULL";
    }
    if (auto v = std::get_if<int64_t>(&param)) {
        return std::to_string(*v);
    }
    if (auto v = std::get_if<double>(&param)) {
        return fmt::format("{}", *v);
    }
    const auto& str = std::get<std::string>(param);
    std::string quoted;
    quoted.reserve(str.size() + 2);
    quoted.push_back('\'');
    for (char c : str) {
        if (c == '\'') quoted.push_back('\'');
        quoted.push_back(c);
    }
    quoted.push_back('\'');
    return quoted;
}

/// @brief substitute parameters into the earliest remaining %s or ? token
/// @param sql statement template
/// @param params parameters in supply order
/// @return statement text, inserted values are never rescanned
std::string Cursor::Substitute(const std::string& sql, const Params& params) {
    std::string query = sql;
    size_t pos = 0;
    for (const auto& param : params) {
        auto p1 = query.find("%s", pos);
        auto p2 = query.find('?', pos);
        auto at = std::min(p1, p2);
        if (at == std::string::npos) {
            LOG(WARNING) << "more parameters than placeholders in: " << sql;
            break;
        }
        auto width = (at == p1) ? 2 : 1;
        auto literal = Quote(param);
        query.replace(at, width, literal);
        pos = at + literal.size();
    }
    return query;
}

/// @brief split a grid line on '|', trim fields and drop empty tokens
std::vector<std::string> Cursor::SplitLine(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string token;
    while (std::getline(ss, token, '|')) {
        auto field = trim(token);
        if (!field.empty()) fields.push_back(std::move(field));
    }
    return fields;
}

/// @brief whether a failure text looks like lock contention
bool Cursor::IsContention(const std::string& text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower.find("deadlock") != std::string::npos
        || lower.find("timeout") != std::string::npos
        || lower.find("lock") != std::string::npos;
}

/// @brief send one statement and classify the response
/// @param sql statement template without the trailing ';'
/// @param params positional parameters
/// @return OK with rows buffered, EMPTY, ABORT/CONTENTION, or CONNECTION
Status Cursor::Execute(const std::string& sql, const Params& params) {
    Close();
    auto query = Substitute(sql, params) + ";";
    VLOG(1) << "send: " << query;

    std::string response;
    try {
        response = transport.SendCommand(query);
    } catch (const TransportError& e) {
        return Status::Connection(e.what());
    }

    if (startsWith(response, "abort")) {
        auto info = fmt::format("Query aborted: {}", response);
        if (IsContention(response)) return Status::Contention(std::move(info));
        return Status::Abort(std::move(info));
    }
    // empty and error replies are successful empty results
    if (response.empty() || startsWith(response, "Error")) {
        return Status::Empty(response);
    }
    ParseGrid(response);
    return Status::OK();
}

/// @brief run ';' separated statements, stops at the first failure
Status Cursor::ExecuteScript(const std::string& script) {
    std::stringstream ss(script);
    std::string statement;
    while (std::getline(ss, statement, ';')) {
        statement = trim(statement);
        if (statement.empty()) continue;
        auto status = Execute(statement);
        if (!status.ok()) return status;
    }
    return Status::OK();
}

void Cursor::ParseGrid(const std::string& response) {
    std::stringstream ss(trim(response));
    std::string line;
    bool header = true;
    while (std::getline(ss, line)) {
        if (!startsWith(line, "|")) continue;
        auto fields = SplitLine(line);
        if (header) {
            description = std::move(fields);
            header = false;
        } else if (fields.size() == description.size()) {
            rows.push_back(std::move(fields));
        }
    }
    rowcount = rows.size();
}

std::optional<Row> Cursor::FetchOne() {
    if (rows.empty()) return std::nullopt;
    auto row = std::move(rows.front());
    rows.pop_front();
    return row;
}

/// @brief take up to size rows, arraysize when size is 0
std::vector<Row> Cursor::FetchMany(size_t size) {
    if (size == 0) size = arraysize;
    std::vector<Row> result;
    while (!rows.empty() && result.size() < size) {
        result.push_back(std::move(rows.front()));
        rows.pop_front();
    }
    return result;
}

std::vector<Row> Cursor::FetchAll() {
    std::vector<Row> result(std::make_move_iterator(rows.begin()), std::make_move_iterator(rows.end()));
    rows.clear();
    return result;
}

void Cursor::Close() {
    rows.clear();
    description.clear();
    rowcount = 0;
}

}
