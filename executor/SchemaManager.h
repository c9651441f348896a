#pragma once

#include <map>
#include <string>
#include <vector>
#include <rmbench/database/Connection.h>

namespace rmbench {

/// @brief DDL and row counts for the nine TPC-C tables
class SchemaManager {
    public:
        explicit SchemaManager(Connection& conn): conn(conn) {}

        void CreateSchema();
        void CreateIndexes();
        std::map<std::string, size_t> GetTableCounts();
        size_t CountRows(const std::string& table);
        void DropAllTables();

        static const std::vector<std::string> TABLES;
        static const char* CREATE_TABLES;
        static const char* CREATE_INDEXES;

    private:
        Connection& conn;
};

}
