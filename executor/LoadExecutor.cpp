#include <rmbench/executor/LoadExecutor.h>
#include <chrono>
#include <stdexcept>
#include <fmt/core.h>
#include <glog/logging.h>

namespace rmbench {

using namespace std::chrono;

/// @brief INSERT INTO table VALUES (?, ?, ...)
std::string LoadExecutor::InsertStatement(const char* table, size_t columns) {
    std::string placeholders;
    for (size_t i = 0; i < columns; i++) {
        placeholders += i == 0 ? "?" : ", ?";
    }
    return fmt::format("INSERT INTO {} VALUES ({})", table, placeholders);
}

template <typename Record>
void LoadExecutor::insert(const Record& record, size_t& count) {
    auto params = record.values();
    auto status = conn.ExecuteUpdate(InsertStatement(Record::TABLE, params.size()), params);
    if (!status.ok()) {
        throw std::runtime_error(fmt::format("failed to load {} after {} rows: {}",
                                             Record::TABLE, count, status.toString()));
    }
    count++;
    loaded++;
    if (progress_every > 0 && count % progress_every == 0) {
        LOG(INFO) << fmt::format("loading {}: {} rows", Record::TABLE, count);
    }
}

template <typename Record, typename Generate>
void LoadExecutor::load(Generate&& generate) {
    LOG(INFO) << "loading " << Record::TABLE << "...";
    auto start = steady_clock::now();
    size_t count = 0;
    generate([this, &count](const Record& record) { insert(record, count); });
    LOG(INFO) << fmt::format("loaded {} rows into {} in {:.2f}s", count, Record::TABLE,
                             duration<double>(steady_clock::now() - start).count());
}

/// @brief load all nine tables, referenced tables first
/// @param generator population source, its warehouse count decides the scale
void LoadExecutor::LoadAll(Generator& generator) {
    LOG(INFO) << "loading TPC-C data for " << generator.getWarehouseNum() << " warehouses";
    auto start = steady_clock::now();
    load<TPCC::Warehouse>([&](const auto& sink) { generator.generateWarehouses(sink); });
    load<TPCC::District>([&](const auto& sink) { generator.generateDistricts(sink); });
    load<TPCC::Item>([&](const auto& sink) { generator.generateItems(sink); });
    load<TPCC::Customer>([&](const auto& sink) { generator.generateCustomers(sink); });
    load<TPCC::Stock>([&](const auto& sink) { generator.generateStock(sink); });
    load<TPCC::Order>([&](const auto& sink) { generator.generateOrders(sink); });
    load<TPCC::NewOrder>([&](const auto& sink) { generator.generateNewOrders(sink); });
    load<TPCC::History>([&](const auto& sink) { generator.generateHistory(sink); });
    load<TPCC::OrderLine>([&](const auto& sink) { generator.generateOrderLines(sink); });
    LOG(INFO) << fmt::format("all TPC-C data loaded, {} rows in {:.2f}s", loaded,
                             duration<double>(steady_clock::now() - start).count());
}

}
