#pragma once

#include <deque>
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>
#include <rmbench/common/Status.h>
#include <rmbench/database/Transport.h>

namespace rmbench {

typedef std::vector<std::string> Row;

/// @brief positional statement parameter, monostate renders as NULL
typedef std::variant<std::monostate, int64_t, double, std::string> Param;
typedef std::vector<Param> Params;

/// @brief turns statements into protocol requests and responses into rows
class Cursor {
    public:
        explicit Cursor(Transport& transport);

        Status Execute(const std::string& sql, const Params& params = {});
        Status ExecuteScript(const std::string& script);

        std::optional<Row> FetchOne();
        std::vector<Row> FetchMany(size_t size = 0);
        std::vector<Row> FetchAll();

        const std::vector<std::string>& Description() const {return description;}
        size_t RowCount() const {return rowcount;}
        void Close();

        size_t arraysize = 1;

        static std::string Substitute(const std::string& sql, const Params& params);
        static std::string Quote(const Param& param);
        static std::vector<std::string> SplitLine(const std::string& line);
        static bool IsContention(const std::string& text);

    private:
        void ParseGrid(const std::string& response);

        Transport&                  transport;
        std::vector<std::string>    description;
        std::deque<Row>             rows;
        size_t                      rowcount = 0;
};

}
