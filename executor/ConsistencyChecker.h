#pragma once

#include <map>
#include <optional>
#include <string>
#include <rmbench/database/Connection.h>
#include <rmbench/executor/SchemaManager.h>

namespace rmbench {

/// @brief post-load and post-run validation of the TPC-C population
class ConsistencyChecker {
    public:
        ConsistencyChecker(Connection& conn, size_t n_warehouses):
            conn(conn), schema(conn), n_warehouses(n_warehouses) {}

        std::map<std::string, bool> RunConsistencyChecks();
        std::map<std::string, size_t> GetDatabaseStats();

    private:
        void checkTableCounts(std::map<std::string, bool>& checks);
        bool checkDistrictOrders();
        bool checkNewOrders();
        bool checkOrderLines();

        std::optional<long> scalar(const std::string& sql, size_t w_id, size_t d_id);

        Connection& conn;
        SchemaManager schema;
        size_t n_warehouses;
};

}
