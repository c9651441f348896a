#pragma once

#include <map>
#include <string>
#include <functional>
#include <rmbench/workload/tpcc/Random.h>
#include <rmbench/workload/tpcc/Tables.hpp>

namespace rmbench {

template <typename T>
using Sink = std::function<void(const T&)>;

/// @brief TPC-C initial population, rows are streamed to a sink in key order
class Generator {
    public:
        Generator(Random& random, size_t n_warehouses);

        void generateWarehouses(const Sink<TPCC::Warehouse>& sink);
        void generateDistricts(const Sink<TPCC::District>& sink);
        void generateCustomers(const Sink<TPCC::Customer>& sink);
        void generateItems(const Sink<TPCC::Item>& sink);
        void generateStock(const Sink<TPCC::Stock>& sink);
        void generateOrders(const Sink<TPCC::Order>& sink);
        void generateNewOrders(const Sink<TPCC::NewOrder>& sink);
        void generateHistory(const Sink<TPCC::History>& sink);
        void generateOrderLines(const Sink<TPCC::OrderLine>& sink);

        size_t getWarehouseNum() const {return n_warehouses;}

        // 各表装载后的期望行数
        static std::map<std::string, size_t> ExpectedCounts(size_t n_warehouses);

    private:
        std::string street();
        std::string city();
        std::string state();
        std::string zip();
        double tax();
        double price();
        std::string data();

        Random& random;
        size_t n_warehouses;
};

}
