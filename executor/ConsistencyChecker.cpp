#include <rmbench/executor/ConsistencyChecker.h>
#include <rmbench/workload/tpcc/Define.h>
#include <rmbench/workload/tpcc/Generator.h>
#include <boost/lexical_cast.hpp>
#include <fmt/core.h>
#include <glog/logging.h>
#include <stdexcept>

namespace rmbench {

/// @brief run every check and log a summary
/// @return check name mapped to pass / fail
std::map<std::string, bool> ConsistencyChecker::RunConsistencyChecks() {
    LOG(INFO) << "running consistency checks...";
    std::map<std::string, bool> checks;
    checkTableCounts(checks);
    checks["district_order_consistency"] = checkDistrictOrders();
    checks["new_orders_consistency"] = checkNewOrders();
    checks["order_line_consistency"] = checkOrderLines();

    size_t passed = 0;
    for (const auto& [name, ok] : checks) {
        if (ok) passed++;
        else LOG(WARNING) << "check failed: " << name;
    }
    LOG(INFO) << fmt::format("consistency checks completed: {}/{} passed", passed, checks.size());
    return checks;
}

std::map<std::string, size_t> ConsistencyChecker::GetDatabaseStats() {
    LOG(INFO) << "collecting database statistics...";
    return schema.GetTableCounts();
}

void ConsistencyChecker::checkTableCounts(std::map<std::string, bool>& checks) {
    for (const auto& [table, expected] : Generator::ExpectedCounts(n_warehouses)) {
        auto name = table + "_count";
        try {
            auto actual = schema.CountRows(table);
            checks[name] = actual == expected;
            LOG(INFO) << fmt::format("{} count: {}/{} {}", table, actual, expected, checks[name] ? "ok" : "mismatch");
        } catch (const std::runtime_error& e) {
            checks[name] = false;
            LOG(ERROR) << table << " count check failed: " << e.what();
        }
    }
}

/// @brief single numeric cell of a per-district query, nullopt when absent
std::optional<long> ConsistencyChecker::scalar(const std::string& sql, size_t w_id, size_t d_id) {
    std::vector<Row> rows;
    auto status = conn.ExecuteQuery(sql, {(int64_t)w_id, (int64_t)d_id}, rows);
    if (!status.ok()) {
        LOG(ERROR) << fmt::format("district {}-{}: {}", w_id, d_id, status.toString());
        return std::nullopt;
    }
    long value = 0;
    if (rows.empty() || rows[0].empty()) return std::nullopt;
    // 聚合结果可能以浮点形式返回
    if (boost::conversion::try_lexical_convert(rows[0][0], value)) return value;
    double real = 0;
    if (boost::conversion::try_lexical_convert(rows[0][0], real)) return static_cast<long>(real);
    return std::nullopt;
}

// d_next_o_id - 1 == MAX(o_id) == MAX(no_o_id)
bool ConsistencyChecker::checkDistrictOrders() {
    bool consistent = true;
    for (size_t w_id = 1; w_id <= n_warehouses; w_id++) {
        for (size_t d_id = 1; d_id <= TPCC::N_DISTRICTS; d_id++) {
            auto next_o_id = scalar("SELECT d_next_o_id FROM district WHERE d_w_id = ? AND d_id = ?", w_id, d_id);
            auto max_o_id = scalar("SELECT MAX(o_id) as max_o_id FROM orders WHERE o_w_id = ? AND o_d_id = ?", w_id, d_id);
            auto max_no_o_id = scalar("SELECT MAX(no_o_id) as max_no_o_id FROM new_orders WHERE no_w_id = ? AND no_d_id = ?", w_id, d_id);
            if (!next_o_id || !max_o_id || !max_no_o_id) {
                LOG(WARNING) << fmt::format("district {}-{}: order ids not found", w_id, d_id);
                consistent = false;
                continue;
            }
            if (*next_o_id - 1 != *max_o_id || *next_o_id - 1 != *max_no_o_id) {
                LOG(WARNING) << fmt::format("district {}-{}: d_next_o_id={}, max_o_id={}, max_no_o_id={}",
                                            w_id, d_id, *next_o_id, *max_o_id, *max_no_o_id);
                consistent = false;
            }
        }
    }
    return consistent;
}

// new_orders ids of a district are contiguous
bool ConsistencyChecker::checkNewOrders() {
    bool consistent = true;
    for (size_t w_id = 1; w_id <= n_warehouses; w_id++) {
        for (size_t d_id = 1; d_id <= TPCC::N_DISTRICTS; d_id++) {
            auto count = scalar("SELECT COUNT(no_o_id) as count_no_o_id FROM new_orders WHERE no_w_id = ? AND no_d_id = ?", w_id, d_id);
            auto max_no_o_id = scalar("SELECT MAX(no_o_id) as max_no_o_id FROM new_orders WHERE no_w_id = ? AND no_d_id = ?", w_id, d_id);
            auto min_no_o_id = scalar("SELECT MIN(no_o_id) as min_no_o_id FROM new_orders WHERE no_w_id = ? AND no_d_id = ?", w_id, d_id);
            if (!count || !max_no_o_id || !min_no_o_id) {
                LOG(WARNING) << fmt::format("new orders {}-{} not found", w_id, d_id);
                consistent = false;
                continue;
            }
            if (*count != *max_no_o_id - *min_no_o_id + 1) {
                LOG(WARNING) << fmt::format("new orders {}-{}: count={}, max={}, min={}",
                                            w_id, d_id, *count, *max_no_o_id, *min_no_o_id);
                consistent = false;
            }
        }
    }
    return consistent;
}

// SUM(o_ol_cnt) == COUNT(ol_o_id)
bool ConsistencyChecker::checkOrderLines() {
    bool consistent = true;
    for (size_t w_id = 1; w_id <= n_warehouses; w_id++) {
        for (size_t d_id = 1; d_id <= TPCC::N_DISTRICTS; d_id++) {
            auto sum_ol_cnt = scalar("SELECT SUM(o_ol_cnt) as sum_o_ol_cnt FROM orders WHERE o_w_id = ? AND o_d_id = ?", w_id, d_id);
            auto count_ol = scalar("SELECT COUNT(ol_o_id) as count_ol_o_id FROM order_line WHERE ol_w_id = ? AND ol_d_id = ?", w_id, d_id);
            if (!sum_ol_cnt || !count_ol) {
                LOG(WARNING) << fmt::format("order lines {}-{} not found", w_id, d_id);
                consistent = false;
                continue;
            }
            if (*sum_ol_cnt != *count_ol) {
                LOG(WARNING) << fmt::format("order lines {}-{}: sum_o_ol_cnt={}, count_ol_o_id={}",
                                            w_id, d_id, *sum_ol_cnt, *count_ol);
                consistent = false;
            }
        }
    }
    return consistent;
}

}
