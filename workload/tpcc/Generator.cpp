#include <rmbench/workload/tpcc/Generator.h>
#include <rmbench/workload/tpcc/Define.h>
#include <rmbench/common/common.h>
#include <cmath>
#include <fmt/core.h>

namespace rmbench {

static const std::string UPPER = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
static const std::string UPPER_DIGITS = "ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";
static const char* CITIES[] = {"Springfield", "Rivertown", "Oakland", "Madison", "Lincoln", "Franklin"};
static const char* STATES[] = {"CA", "NY", "TX", "FL", "IL", "PA", "OH", "GA", "NC", "MI"};
static const char* FIRST_NAMES[] = {"John", "Jane", "Bob", "Alice", "Charlie", "Diana", "Edward", "Fiona"};
static const char* ITEM_PREFIXES[] = {"Red", "Blue", "Green", "Large", "Small", "Premium", "Standard"};
static const char* ITEM_KINDS[] = {"Widget", "Gadget", "Tool", "Device", "Product", "Item"};
// 初始数据的时间跨度（天）
static const int TIMESTAMP_SPAN_DAYS = 730;

template <typename T, size_t N>
static const T& choose(Random& random, const T (&values)[N]) {
    return values[random.uniform_dist(0, N - 1)];
}

static double round_to(double value, int digits) {
    auto scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

Generator::Generator(Random& random, size_t n_warehouses): random(random), n_warehouses(n_warehouses) {}

std::string Generator::street() {
    return fmt::format("{} {} St", random.uniform_dist(1, 9999), random.rand_str(5, UPPER));
}

std::string Generator::city() { return choose(random, CITIES); }

std::string Generator::state() { return choose(random, STATES); }

std::string Generator::zip() {
    return fmt::format("{}{}", random.uniform_dist(10000, 99999), random.uniform_dist(1000, 9999));
}

double Generator::tax() { return round_to(random.uniform_real(0, 2000) / 10000, 4); }

double Generator::price() { return round_to(random.uniform_real(100, 10000) / 100, 2); }

/// @brief item or stock data, 10% carry ORIGINAL at a random position
std::string Generator::data() {
    auto s = random.a_string(26, 50);
    if (random.uniform_dist(0, 99) < 10) {
        auto pos = random.uniform_dist(0, s.size() - 8);
        s.replace(pos, 8, TPCC::ORIGINAL);
    }
    return s;
}

void Generator::generateWarehouses(const Sink<TPCC::Warehouse>& sink) {
    for (int64_t w_id = 1; w_id <= int64_t(n_warehouses); w_id++) {
        sink({w_id, fmt::format("W{:02d}", w_id), street(), street(), city(), state(), zip(), tax(), 300000.0});
    }
}

void Generator::generateDistricts(const Sink<TPCC::District>& sink) {
    for (int64_t w_id = 1; w_id <= int64_t(n_warehouses); w_id++) {
        for (int64_t d_id = 1; d_id <= int64_t(TPCC::N_DISTRICTS); d_id++) {
            sink({d_id, w_id, fmt::format("D{:02d}", d_id), street(), street(), city(), state(), zip(),
                  tax(), 30000.0, int64_t(TPCC::N_ORDERS + 1)});
        }
    }
}

void Generator::generateCustomers(const Sink<TPCC::Customer>& sink) {
    for (int64_t w_id = 1; w_id <= int64_t(n_warehouses); w_id++) {
        for (int64_t d_id = 1; d_id <= int64_t(TPCC::N_DISTRICTS); d_id++) {
            for (int64_t c_id = 1; c_id <= int64_t(TPCC::N_CUSTOMERS); c_id++) {
                TPCC::Customer c;
                c.c_id = c_id;
                c.c_d_id = d_id;
                c.c_w_id = w_id;
                c.c_first = choose(random, FIRST_NAMES);
                c.c_middle = "OE";
                c.c_last = Random::last_name(c_id);
                c.c_street_1 = street();
                c.c_street_2 = street();
                c.c_city = city();
                c.c_state = state();
                c.c_zip = zip();
                c.c_phone = fmt::format("({}) {}-{}", random.uniform_dist(100, 999),
                                        random.uniform_dist(100, 999), random.uniform_dist(1000, 9999));
                c.c_since = random.rand_timestamp(TIMESTAMP_SPAN_DAYS);
                c.c_credit = random.uniform_dist(0, 99) < 90 ? TPCC::GOOD_CREDIT : TPCC::BAD_CREDIT;
                c.c_credit_lim = 50000;
                c.c_discount = round_to(random.uniform_real(0, 5000) / 10000, 4);
                c.c_balance = -10.0;
                c.c_ytd_payment = 10.0;
                c.c_payment_cnt = 1;
                c.c_delivery_cnt = 0;
                // c_data is char(50)
                c.c_data = random.a_string(26, 50);
                sink(c);
            }
        }
    }
}

void Generator::generateItems(const Sink<TPCC::Item>& sink) {
    for (int64_t i_id = 1; i_id <= int64_t(TPCC::N_ITEMS); i_id++) {
        auto name = fmt::format("{} {}", choose(random, ITEM_PREFIXES), choose(random, ITEM_KINDS));
        sink({i_id, int64_t(random.uniform_dist(1, 10000)), name, price(), data()});
    }
}

void Generator::generateStock(const Sink<TPCC::Stock>& sink) {
    for (int64_t w_id = 1; w_id <= int64_t(n_warehouses); w_id++) {
        for (int64_t i_id = 1; i_id <= int64_t(TPCC::N_ITEMS); i_id++) {
            TPCC::Stock s;
            s.s_i_id = i_id;
            s.s_w_id = w_id;
            s.s_quantity = random.uniform_dist(10, 100);
            for (auto& dist : s.s_dist) dist = random.rand_str(24, UPPER_DIGITS);
            s.s_ytd = 0;
            s.s_order_cnt = 0;
            s.s_remote_cnt = 0;
            s.s_data = data();
            sink(s);
        }
    }
}

void Generator::generateOrders(const Sink<TPCC::Order>& sink) {
    for (int64_t w_id = 1; w_id <= int64_t(n_warehouses); w_id++) {
        for (int64_t d_id = 1; d_id <= int64_t(TPCC::N_DISTRICTS); d_id++) {
            for (int64_t o_id = 1; o_id <= int64_t(TPCC::N_ORDERS); o_id++) {
                int64_t carrier = o_id > int64_t(TPCC::N_DELIVERED_ORDERS)
                    ? TPCC::LOADED_UNDELIVERED_CARRIER
                    : int64_t(random.uniform_dist(1, TPCC::N_CARRIERS));
                sink({o_id, d_id, w_id, int64_t(random.uniform_dist(1, TPCC::N_CUSTOMERS)),
                      random.rand_timestamp(TIMESTAMP_SPAN_DAYS), carrier,
                      int64_t(TPCC::N_INITIAL_ORDER_LINES), 1});
            }
        }
    }
}

void Generator::generateNewOrders(const Sink<TPCC::NewOrder>& sink) {
    for (int64_t w_id = 1; w_id <= int64_t(n_warehouses); w_id++) {
        for (int64_t d_id = 1; d_id <= int64_t(TPCC::N_DISTRICTS); d_id++) {
            for (int64_t o_id = TPCC::N_DELIVERED_ORDERS + 1; o_id <= int64_t(TPCC::N_ORDERS); o_id++) {
                sink({o_id, d_id, w_id});
            }
        }
    }
}

void Generator::generateHistory(const Sink<TPCC::History>& sink) {
    for (int64_t w_id = 1; w_id <= int64_t(n_warehouses); w_id++) {
        for (int64_t d_id = 1; d_id <= int64_t(TPCC::N_DISTRICTS); d_id++) {
            for (int64_t c_id = 1; c_id <= int64_t(TPCC::N_CUSTOMERS); c_id++) {
                sink({c_id, d_id, w_id, d_id, w_id, random.rand_timestamp(TIMESTAMP_SPAN_DAYS), 10.0, "Initial deposit"});
            }
        }
    }
}

void Generator::generateOrderLines(const Sink<TPCC::OrderLine>& sink) {
    for (int64_t w_id = 1; w_id <= int64_t(n_warehouses); w_id++) {
        for (int64_t d_id = 1; d_id <= int64_t(TPCC::N_DISTRICTS); d_id++) {
            for (int64_t o_id = 1; o_id <= int64_t(TPCC::N_ORDERS); o_id++) {
                bool delivered = o_id <= int64_t(TPCC::N_DELIVERED_ORDERS);
                for (int64_t number = 1; number <= int64_t(TPCC::N_INITIAL_ORDER_LINES); number++) {
                    auto quantity = int64_t(random.uniform_dist(1, TPCC::MAX_OL_QUANTITY));
                    TPCC::OrderLine ol;
                    ol.ol_o_id = o_id;
                    ol.ol_d_id = d_id;
                    ol.ol_w_id = w_id;
                    ol.ol_number = number;
                    ol.ol_i_id = random.uniform_dist(1, TPCC::N_ITEMS);
                    ol.ol_supply_w_id = w_id;
                    ol.ol_delivery_d = delivered ? random.rand_timestamp(TIMESTAMP_SPAN_DAYS) : UNDELIVERED_DATE;
                    ol.ol_quantity = quantity;
                    ol.ol_amount = quantity * price();
                    ol.ol_dist_info = random.rand_str(24, UPPER_DIGITS);
                    sink(ol);
                }
            }
        }
    }
}

/// @brief row count of every table right after loading
std::map<std::string, size_t> Generator::ExpectedCounts(size_t n_warehouses) {
    return {
        {TPCC::Warehouse::TABLE, n_warehouses},
        {TPCC::District::TABLE, n_warehouses * TPCC::N_DISTRICTS},
        {TPCC::Customer::TABLE, n_warehouses * TPCC::N_DISTRICTS * TPCC::N_CUSTOMERS},
        {TPCC::History::TABLE, n_warehouses * TPCC::N_DISTRICTS * TPCC::N_CUSTOMERS},
        {TPCC::NewOrder::TABLE, n_warehouses * TPCC::N_DISTRICTS * TPCC::N_NEW_ORDERS},
        {TPCC::Order::TABLE, n_warehouses * TPCC::N_DISTRICTS * TPCC::N_ORDERS},
        {TPCC::OrderLine::TABLE, n_warehouses * TPCC::N_DISTRICTS * TPCC::N_ORDERS * TPCC::N_INITIAL_ORDER_LINES},
        {TPCC::Item::TABLE, TPCC::N_ITEMS},
        {TPCC::Stock::TABLE, n_warehouses * TPCC::N_ITEMS},
    };
}

}
