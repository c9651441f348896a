#include <rmbench/workload/tpcc/Transaction.h>
#include <rmbench/common/common.h>
#include <algorithm>
#include <ctime>
#include <stdexcept>
#include <fmt/core.h>
#include <fmt/chrono.h>
#include <glog/logging.h>
#include <boost/lexical_cast.hpp>

// 语句失败时回滚并返回该状态，连接断开时不再发送回滚
#define RETURN_ON_FAILURE(conn, X) do {                 \
    auto _status = (X);                                 \
    if (!_status.ok()) return abortWith(conn, _status); \
} while (0)

namespace rmbench {

namespace {

Status abortWith(Connection& conn, const Status& status) {
    if (!status.isConnection()) {
        conn.Rollback();
    }
    return status;
}

template<typename T>
bool parse(const std::string& field, T& out) {
    return boost::conversion::try_lexical_convert(field, out);
}

}

/// @brief current local time in the datetime column format
std::string currentTimestamp() {
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(std::time(nullptr)));
}

/// @brief build a profile of the given type bound to a worker's Random
TPCCTransaction::Ptr TPCCTransaction::create(TPCC::TransactionType type, Random& random, size_t n_warehouses) {
    switch (type) {
        case TPCC::NEW_ORDER:
            return std::make_shared<NewOrderTransaction>(random, n_warehouses);
        case TPCC::PAYMENT:
            return std::make_shared<PaymentTransaction>(random, n_warehouses);
        case TPCC::DELIVERY:
            return std::make_shared<DeliveryTransaction>(random, n_warehouses);
        case TPCC::ORDER_STATUS:
            return std::make_shared<OrderStatusTransaction>(random, n_warehouses);
        case TPCC::STOCK_LEVEL:
            return std::make_shared<StockLevelTransaction>(random, n_warehouses);
        default:
            throw std::invalid_argument(fmt::format("unknown transaction type {}", static_cast<int>(type)));
    }
}

/* ----------------------------- NewOrder ----------------------------- */

/// @brief random NewOrder input, 1% of lines come from another warehouse
NewOrderTransaction::Params NewOrderTransaction::makeParams() {
    Params params;
    params.w_id = randomWarehouse();
    params.d_id = randomDistrict();
    params.c_id = randomCustomer();
    params.o_entry_d = currentTimestamp();
    auto ol_cnt = random.uniform_dist(TPCC::MIN_OL_CNT, TPCC::MAX_OL_CNT);
    params.lines.reserve(ol_cnt);
    for (size_t i = 0; i < ol_cnt; i++) {
        OrderLineParams line;
        line.i_id = random.uniform_dist(1, TPCC::N_ITEMS);
        line.supply_w_id = random.chance(0.99) ? params.w_id : otherWarehouse(params.w_id);
        line.quantity = random.uniform_dist(1, TPCC::MAX_OL_QUANTITY);
        params.lines.push_back(line);
    }
    return params;
}

int64_t NewOrderTransaction::depleteStock(int64_t quantity, int64_t ordered) {
    if (quantity >= ordered + 10) {
        return quantity - ordered;
    }
    return quantity - ordered + 91;
}

/// @brief place one order, all reads and writes inside one begin/commit bracket
/// @param conn the worker's connection
/// @param p order input
/// @param output receives order id and total when not null
/// @return OK on commit, LOGIC when a referenced row is missing, statement failure otherwise
Status NewOrderTransaction::run(Connection& conn, const Params& p, Output* output) {
    std::vector<Row> rows;
    RETURN_ON_FAILURE(conn, conn.Begin());

    RETURN_ON_FAILURE(conn, conn.ExecuteQuery(
        "SELECT d_tax, d_next_o_id FROM district WHERE d_id = ? AND d_w_id = ?",
        {p.d_id, p.w_id}, rows));
    double d_tax;
    int64_t o_id;
    if (rows.empty() || rows[0].size() < 2 || !parse(rows[0][0], d_tax) || !parse(rows[0][1], o_id)) {
        return abortWith(conn, Status::Logic(fmt::format("district ({}, {}) not found", p.w_id, p.d_id)));
    }
    RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
        "UPDATE district SET d_next_o_id = d_next_o_id+1 WHERE d_id = ? AND d_w_id = ?",
        {p.d_id, p.w_id}));

    RETURN_ON_FAILURE(conn, conn.ExecuteQuery(
        "SELECT c_discount, c_last, c_credit, w_tax FROM customer, warehouse "
        "WHERE c_w_id = w_id AND c_d_id = ? AND c_id = ? AND w_id = ?",
        {p.d_id, p.c_id, p.w_id}, rows));
    double c_discount, w_tax;
    if (rows.empty() || rows[0].size() < 4 || !parse(rows[0][0], c_discount) || !parse(rows[0][3], w_tax)) {
        return abortWith(conn, Status::Logic(fmt::format("customer ({}, {}, {}) not found", p.w_id, p.d_id, p.c_id)));
    }

    bool all_local = std::all_of(p.lines.begin(), p.lines.end(),
        [&](const OrderLineParams& line) { return line.supply_w_id == p.w_id; });

    RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
        "INSERT INTO orders VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
        {o_id, p.d_id, p.w_id, p.c_id, p.o_entry_d, int64_t(TPCC::NEW_ORDER_CARRIER),
         int64_t(p.lines.size()), int64_t(all_local ? 1 : 0)}));
    RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
        "INSERT INTO new_orders VALUES (?, ?, ?)",
        {o_id, p.d_id, p.w_id}));

    auto stock_sql = fmt::format(
        "SELECT s_quantity, s_dist_{:02d}, s_ytd, s_order_cnt, s_remote_cnt, s_data "
        "FROM stock WHERE s_i_id = ? AND s_w_id = ?", p.d_id);
    double sum = 0;
    std::vector<std::string> brand_generic;
    for (size_t i = 0; i < p.lines.size(); i++) {
        const auto& line = p.lines[i];
        RETURN_ON_FAILURE(conn, conn.ExecuteQuery(
            "SELECT i_price, i_name, i_data FROM item WHERE i_id = ?",
            {line.i_id}, rows));
        double i_price;
        if (rows.empty() || rows[0].size() < 3 || !parse(rows[0][0], i_price)) {
            return abortWith(conn, Status::Logic(fmt::format("item {} not found", line.i_id)));
        }
        auto i_data = rows[0][2];

        RETURN_ON_FAILURE(conn, conn.ExecuteQuery(stock_sql, {line.i_id, line.supply_w_id}, rows));
        int64_t s_quantity, s_order_cnt, s_remote_cnt;
        double s_ytd;
        if (rows.empty() || rows[0].size() < 6
            || !parse(rows[0][0], s_quantity) || !parse(rows[0][2], s_ytd)
            || !parse(rows[0][3], s_order_cnt) || !parse(rows[0][4], s_remote_cnt)) {
            return abortWith(conn, Status::Logic(fmt::format("stock ({}, {}) not found", line.supply_w_id, line.i_id)));
        }
        const auto& dist_info = rows[0][1];
        const auto& s_data = rows[0][5];

        s_quantity = depleteStock(s_quantity, line.quantity);
        s_ytd += line.quantity;
        s_order_cnt += 1;
        if (line.supply_w_id != p.w_id) s_remote_cnt += 1;

        RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
            "UPDATE stock SET s_quantity = ?, s_ytd = ?, s_order_cnt = ?, s_remote_cnt = ? "
            "WHERE s_i_id = ? AND s_w_id = ?",
            {s_quantity, s_ytd, s_order_cnt, s_remote_cnt, line.i_id, line.supply_w_id}));

        double amount = line.quantity * i_price;
        sum += amount;
        RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
            "INSERT INTO order_line VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            {o_id, p.d_id, p.w_id, int64_t(i + 1), line.i_id, line.supply_w_id,
             UNDELIVERED_DATE, line.quantity, amount, dist_info}));

        bool original = i_data.find(TPCC::ORIGINAL) != std::string::npos
                     && s_data.find(TPCC::ORIGINAL) != std::string::npos;
        brand_generic.push_back(original ? "B" : "G");
    }

    double total = sum * (1 - c_discount) * (1 + w_tax + d_tax);
    RETURN_ON_FAILURE(conn, conn.Commit());

    DLOG(INFO) << fmt::format("new order {} in ({}, {}) total {:.2f}", o_id, p.w_id, p.d_id, total);
    if (output) {
        output->o_id = o_id;
        output->total_amount = total;
        output->all_local = all_local;
        output->brand_generic = std::move(brand_generic);
    }
    return Status::OK();
}

/* ----------------------------- Payment ----------------------------- */

/// @brief random Payment input, 85% of customers pay at their home warehouse
PaymentTransaction::Params PaymentTransaction::makeParams() {
    Params params;
    params.w_id = randomWarehouse();
    params.d_id = randomDistrict();
    if (random.uniform_dist(1, 100) <= 85 || n_warehouses == 1) {
        params.c_w_id = params.w_id;
        params.c_d_id = random.uniform_dist(1, 100) <= 15 ? randomDistrict() : params.d_id;
    } else {
        params.c_w_id = otherWarehouse(params.w_id);
        params.c_d_id = randomDistrict();
    }
    params.h_amount = random.uniform_real(TPCC::MIN_PAYMENT, TPCC::MAX_PAYMENT);
    params.by_last_name = !random.chance(0.6);
    if (params.by_last_name) {
        params.c_id = 0;
        params.c_last = random.rand_last_name();
    } else {
        params.c_id = randomCustomer();
    }
    params.h_date = currentTimestamp();
    return params;
}

/// @brief payment record prepended to a bad-credit customer's data
std::string PaymentTransaction::badCreditData(const Params& p, int64_t c_id, const std::string& c_data) {
    auto data = fmt::format("{}{}{}{}{}{:.2f}", c_id, p.c_d_id, p.c_w_id, p.d_id, p.w_id, p.h_amount) + c_data;
    if (data.size() > TPCC::MAX_C_DATA) {
        data.resize(TPCC::MAX_C_DATA);
    }
    return data;
}

/// @brief pay h_amount from a customer chosen by id or by the median of its last name
Status PaymentTransaction::run(Connection& conn, const Params& p, Output* output) {
    std::vector<Row> rows;
    RETURN_ON_FAILURE(conn, conn.Begin());

    RETURN_ON_FAILURE(conn, conn.ExecuteQuery(
        "SELECT w_name, w_street_1, w_street_2, w_city, w_state, w_zip, w_ytd "
        "FROM warehouse WHERE w_id = ?",
        {p.w_id}, rows));
    if (rows.empty() || rows[0].empty()) {
        return abortWith(conn, Status::Logic(fmt::format("warehouse {} not found", p.w_id)));
    }
    auto w_name = rows[0][0];
    RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
        "UPDATE warehouse SET w_ytd = w_ytd+? WHERE w_id = ?",
        {p.h_amount, p.w_id}));

    RETURN_ON_FAILURE(conn, conn.ExecuteQuery(
        "SELECT d_name, d_street_1, d_street_2, d_city, d_state, d_zip, d_ytd "
        "FROM district WHERE d_w_id = ? AND d_id = ?",
        {p.w_id, p.d_id}, rows));
    if (rows.empty() || rows[0].empty()) {
        return abortWith(conn, Status::Logic(fmt::format("district ({}, {}) not found", p.w_id, p.d_id)));
    }
    auto d_name = rows[0][0];
    RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
        "UPDATE district SET d_ytd = d_ytd+? WHERE d_w_id = ? AND d_id = ?",
        {p.h_amount, p.w_id, p.d_id}));

    static const size_t CUSTOMER_COLUMNS = 18;
    static const std::string customer_columns =
        "SELECT c_id, c_first, c_middle, c_last, c_street_1, c_street_2, "
        "c_city, c_state, c_zip, c_phone, c_since, c_credit, c_credit_lim, "
        "c_discount, c_balance, c_ytd_payment, c_payment_cnt, c_data FROM customer ";
    if (p.by_last_name) {
        RETURN_ON_FAILURE(conn, conn.ExecuteQuery(
            customer_columns + "WHERE c_w_id = ? AND c_d_id = ? AND c_last = ? ORDER BY c_first",
            {p.c_w_id, p.c_d_id, p.c_last}, rows));
        if (!rows.empty() && rows[0].size() < CUSTOMER_COLUMNS) {
            return abortWith(conn, Status::Logic("malformed customer row"));
        }
        // the server's ORDER BY is not relied upon
        std::stable_sort(rows.begin(), rows.end(),
            [](const Row& a, const Row& b) { return a[1] < b[1]; });
    } else {
        RETURN_ON_FAILURE(conn, conn.ExecuteQuery(
            customer_columns + "WHERE c_w_id = ? AND c_d_id = ? AND c_id = ?",
            {p.c_w_id, p.c_d_id, p.c_id}, rows));
    }
    if (rows.empty()) {
        return abortWith(conn, Status::Logic(p.by_last_name
            ? fmt::format("no customer named {} in ({}, {})", p.c_last, p.c_w_id, p.c_d_id)
            : fmt::format("customer ({}, {}, {}) not found", p.c_w_id, p.c_d_id, p.c_id)));
    }
    const auto& customer = p.by_last_name ? rows[rows.size() / 2] : rows[0];

    int64_t c_id, c_payment_cnt;
    double c_balance, c_ytd_payment;
    if (customer.size() < CUSTOMER_COLUMNS || !parse(customer[0], c_id) || !parse(customer[14], c_balance)
        || !parse(customer[15], c_ytd_payment) || !parse(customer[16], c_payment_cnt)) {
        return abortWith(conn, Status::Logic("malformed customer row"));
    }
    const auto& c_credit = customer[11];
    c_balance -= p.h_amount;
    c_ytd_payment += p.h_amount;
    c_payment_cnt += 1;

    bool bad_credit = c_credit == TPCC::BAD_CREDIT;
    std::string c_data = customer[17];
    if (bad_credit) {
        c_data = badCreditData(p, c_id, c_data);
        RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
            "UPDATE customer SET c_balance = ?, c_ytd_payment = ?, c_payment_cnt = ?, c_data = ? "
            "WHERE c_w_id = ? AND c_d_id = ? AND c_id = ?",
            {c_balance, c_ytd_payment, c_payment_cnt, c_data, p.c_w_id, p.c_d_id, c_id}));
    } else {
        RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
            "UPDATE customer SET c_balance = ?, c_ytd_payment = ?, c_payment_cnt = ? "
            "WHERE c_w_id = ? AND c_d_id = ? AND c_id = ?",
            {c_balance, c_ytd_payment, c_payment_cnt, p.c_w_id, p.c_d_id, c_id}));
    }

    auto h_data = w_name.substr(0, 10) + "    " + d_name.substr(0, 10);
    RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
        "INSERT INTO history VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
        {c_id, p.c_d_id, p.c_w_id, p.d_id, p.w_id, p.h_date, p.h_amount, h_data}));
    RETURN_ON_FAILURE(conn, conn.Commit());

    if (output) {
        output->c_id = c_id;
        output->c_balance = c_balance;
        output->bad_credit = bad_credit;
        output->c_data = std::move(c_data);
    }
    return Status::OK();
}

/* ----------------------------- Delivery ----------------------------- */

DeliveryTransaction::Params DeliveryTransaction::makeParams() {
    Params params;
    params.w_id = randomWarehouse();
    params.o_carrier_id = random.uniform_dist(1, TPCC::N_CARRIERS);
    params.ol_delivery_d = currentTimestamp();
    return params;
}

/// @brief deliver the oldest new order of every district of one warehouse
/// @param conn the worker's connection
/// @param p warehouse, carrier and delivery time
/// @param output per district order ids, 0 where nothing was pending
/// @return districts without pending orders are skipped, missing order data rolls back all
Status DeliveryTransaction::run(Connection& conn, const Params& p, Output* output) {
    std::vector<Row> rows;
    Output result;
    RETURN_ON_FAILURE(conn, conn.Begin());

    for (int64_t d_id = 1; d_id <= int64_t(TPCC::N_DISTRICTS); d_id++) {
        RETURN_ON_FAILURE(conn, conn.ExecuteQuery(
            "SELECT MIN(no_o_id) FROM new_orders WHERE no_d_id = ? AND no_w_id = ?",
            {d_id, p.w_id}, rows));
        int64_t o_id;
        // 无待配送订单，跳过该区域
        if (rows.empty() || rows[0].empty() || !parse(rows[0][0], o_id)) {
            result.skipped++;
            result.o_ids.push_back(0);
            continue;
        }

        RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
            "DELETE FROM new_orders WHERE no_o_id = ? AND no_d_id = ? AND no_w_id = ?",
            {o_id, d_id, p.w_id}));
        RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
            "UPDATE orders SET o_carrier_id = ? WHERE o_id = ? AND o_d_id = ? AND o_w_id = ?",
            {p.o_carrier_id, o_id, d_id, p.w_id}));
        RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
            "UPDATE order_line SET ol_delivery_d = ? WHERE ol_o_id = ? AND ol_d_id = ? AND ol_w_id = ?",
            {p.ol_delivery_d, o_id, d_id, p.w_id}));

        RETURN_ON_FAILURE(conn, conn.ExecuteQuery(
            "SELECT o_c_id FROM orders WHERE o_id = ? AND o_d_id = ? AND o_w_id = ?",
            {o_id, d_id, p.w_id}, rows));
        int64_t c_id;
        if (rows.empty() || rows[0].empty() || !parse(rows[0][0], c_id)) {
            return abortWith(conn, Status::Logic(fmt::format("order ({}, {}, {}) not found", p.w_id, d_id, o_id)));
        }

        RETURN_ON_FAILURE(conn, conn.ExecuteQuery(
            "SELECT SUM(ol_amount) FROM order_line WHERE ol_o_id = ? AND ol_d_id = ? AND ol_w_id = ?",
            {o_id, d_id, p.w_id}, rows));
        double total;
        if (rows.empty() || rows[0].empty() || !parse(rows[0][0], total)) {
            return abortWith(conn, Status::Logic(fmt::format("order lines of ({}, {}, {}) not found", p.w_id, d_id, o_id)));
        }

        RETURN_ON_FAILURE(conn, conn.ExecuteUpdate(
            "UPDATE customer SET c_balance = c_balance+?, c_delivery_cnt = c_delivery_cnt+1 "
            "WHERE c_id = ? AND c_d_id = ? AND c_w_id = ?",
            {total, c_id, d_id, p.w_id}));
        result.delivered++;
        result.o_ids.push_back(o_id);
    }

    RETURN_ON_FAILURE(conn, conn.Commit());
    if (output) *output = std::move(result);
    return Status::OK();
}

/* --------------------------- OrderStatus --------------------------- */

OrderStatusTransaction::Params OrderStatusTransaction::makeParams() {
    return {randomWarehouse(), randomDistrict(), randomCustomer()};
}

/// @brief read a customer's latest order, no transaction bracket
Status OrderStatusTransaction::run(Connection& conn, const Params& p, Output* output) {
    std::vector<Row> rows;
    auto status = conn.ExecuteQuery(
        "SELECT * FROM orders WHERE o_w_id = ? AND o_d_id = ? AND o_c_id = ? "
        "ORDER BY o_id DESC LIMIT 1",
        {p.w_id, p.d_id, p.c_id}, rows);
    if (!status.ok()) return status;
    if (rows.empty()) {
        return Status::Logic(fmt::format("customer ({}, {}, {}) has no order", p.w_id, p.d_id, p.c_id));
    }
    if (output) output->order = std::move(rows[0]);
    return Status::OK();
}

/* --------------------------- StockLevel --------------------------- */

StockLevelTransaction::Params StockLevelTransaction::makeParams() {
    Params params;
    params.w_id = randomWarehouse();
    params.threshold = random.uniform_dist(TPCC::MIN_STOCK_THRESHOLD, TPCC::MAX_STOCK_THRESHOLD);
    return params;
}

/// @brief count distinct items below threshold, a zero count still succeeds
Status StockLevelTransaction::run(Connection& conn, const Params& p, Output* output) {
    std::vector<Row> rows;
    auto status = conn.ExecuteQuery(
        "SELECT COUNT(DISTINCT s_i_id) FROM stock WHERE s_w_id = ? AND s_quantity < ?",
        {p.w_id, p.threshold}, rows);
    if (!status.ok()) return status;
    if (rows.empty()) {
        return Status::Logic(fmt::format("stock level of warehouse {} returned no row", p.w_id));
    }
    if (output && !rows[0].empty() && !parse(rows[0][0], output->low_stock)) {
        output->low_stock = -1;
    }
    return Status::OK();
}

}

#undef RETURN_ON_FAILURE
