#include <rmbench/executor/SchemaManager.h>
#include <boost/lexical_cast.hpp>
#include <fmt/core.h>
#include <glog/logging.h>
#include <stdexcept>

namespace rmbench {

const std::vector<std::string> SchemaManager::TABLES = {
    "warehouse", "district", "customer", "item", "stock",
    "orders", "order_line", "new_orders", "history"
};

// RMDB 只支持 int / float / char(n) / datetime
const char* SchemaManager::CREATE_TABLES = R"(
create table warehouse (w_id int, w_name char(10), w_street_1 char(20), w_street_2 char(20), w_city char(20), w_state char(2), w_zip char(9), w_tax float, w_ytd float);
create table district (d_id int, d_w_id int, d_name char(10), d_street_1 char(20), d_street_2 char(20), d_city char(20), d_state char(2), d_zip char(9), d_tax float, d_ytd float, d_next_o_id int);
create table customer (c_id int, c_d_id int, c_w_id int, c_first char(16), c_middle char(2), c_last char(16), c_street_1 char(20), c_street_2 char(20), c_city char(20), c_state char(2), c_zip char(9), c_phone char(16), c_since char(30), c_credit char(2), c_credit_lim int, c_discount float, c_balance float, c_ytd_payment float, c_payment_cnt int, c_delivery_cnt int, c_data char(50));
create table history (h_c_id int, h_c_d_id int, h_c_w_id int, h_d_id int, h_w_id int, h_date datetime, h_amount float, h_data char(24));
create table new_orders (no_o_id int, no_d_id int, no_w_id int);
create table orders (o_id int, o_d_id int, o_w_id int, o_c_id int, o_entry_d datetime, o_carrier_id int, o_ol_cnt int, o_all_local int);
create table order_line (ol_o_id int, ol_d_id int, ol_w_id int, ol_number int, ol_i_id int, ol_supply_w_id int, ol_delivery_d char(30), ol_quantity int, ol_amount float, ol_dist_info char(24));
create table item (i_id int, i_im_id int, i_name char(24), i_price float, i_data char(50));
create table stock (s_i_id int, s_w_id int, s_quantity int, s_dist_01 char(24), s_dist_02 char(24), s_dist_03 char(24), s_dist_04 char(24), s_dist_05 char(24), s_dist_06 char(24), s_dist_07 char(24), s_dist_08 char(24), s_dist_09 char(24), s_dist_10 char(24), s_ytd float, s_order_cnt int, s_remote_cnt int, s_data char(50));
)";

const char* SchemaManager::CREATE_INDEXES = R"(
create index warehouse(w_id);
create index district(d_w_id, d_id);
create index customer(c_w_id, c_d_id, c_id);
create index new_orders(no_w_id, no_d_id, no_o_id);
create index orders(o_w_id, o_d_id, o_id);
create index order_line(ol_w_id, ol_d_id, ol_o_id, ol_number);
create index item(i_id);
create index stock(s_w_id, s_i_id);
)";

/// @brief create the nine tables, throws std::runtime_error on the first failed statement
void SchemaManager::CreateSchema() {
    auto status = conn.ExecuteScript(CREATE_TABLES);
    if (!status.ok()) {
        throw std::runtime_error(fmt::format("failed to create schema: {}", status.toString()));
    }
    LOG(INFO) << "TPC-C schema created";
}

void SchemaManager::CreateIndexes() {
    auto status = conn.ExecuteScript(CREATE_INDEXES);
    if (!status.ok()) {
        throw std::runtime_error(fmt::format("failed to create indexes: {}", status.toString()));
    }
    LOG(INFO) << "TPC-C indexes created";
}

/// @brief SELECT COUNT(*) on one table
/// @param table table name, not quoted
/// @return the row count, throws std::runtime_error when the server gives no usable answer
size_t SchemaManager::CountRows(const std::string& table) {
    std::vector<Row> rows;
    auto status = conn.ExecuteQuery(fmt::format("SELECT COUNT(*) as count FROM {}", table), {}, rows);
    if (!status.ok()) {
        throw std::runtime_error(fmt::format("failed to count {}: {}", table, status.toString()));
    }
    size_t count = 0;
    if (rows.empty() || rows[0].empty() || !boost::conversion::try_lexical_convert(rows[0][0], count)) {
        throw std::runtime_error(fmt::format("failed to count {}: no numeric result", table));
    }
    return count;
}

std::map<std::string, size_t> SchemaManager::GetTableCounts() {
    std::map<std::string, size_t> counts;
    for (const auto& table : TABLES) {
        counts[table] = CountRows(table);
    }
    return counts;
}

/// @brief drop every table, a table that is already gone is only logged
void SchemaManager::DropAllTables() {
    for (const auto& table : TABLES) {
        auto status = conn.ExecuteUpdate(fmt::format("drop table {}", table));
        if (!status.ok()) {
            LOG(WARNING) << "drop table " << table << " failed: " << status.toString();
        }
    }
    LOG(INFO) << "all TPC-C tables dropped";
}

}
