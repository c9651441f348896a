#pragma once

#include <string>
#include <rmbench/database/Connection.h>
#include <rmbench/workload/tpcc/Generator.h>

namespace rmbench {

/// @brief streams generated rows into the server with one INSERT per row
class LoadExecutor {
    public:
        explicit LoadExecutor(Connection& conn, size_t progress_every = 10000):
            conn(conn), progress_every(progress_every) {}

        void LoadAll(Generator& generator);
        size_t getLoadedRows() const {return loaded;}

        static std::string InsertStatement(const char* table, size_t columns);

    private:
        template <typename Record>
        void insert(const Record& record, size_t& count);

        template <typename Record, typename Generate>
        void load(Generate&& generate);

        Connection& conn;
        size_t progress_every;
        size_t loaded = 0;
};

}
