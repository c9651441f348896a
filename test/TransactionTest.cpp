#include <gtest/gtest.h>
#include <rmbench/workload/tpcc/Transaction.h>
#include <rmbench/test/FakeServer.h>

using namespace std;
using namespace rmbench;

static Row customerRow(const string& c_id, const string& first, const string& credit, const string& data) {
    return {c_id, first, "OE", "BARBARBAR", "1 A St", "2 B St", "Madison", "CA", "123451234",
            "5550001111", "2024-01-01 00:00:00", credit, "50000", "0.1", "-10", "10", "1", data};
}

static string customerGrid(initializer_list<Row> rows) {
    string grid = "| c_id | c_first | c_middle | c_last | c_street_1 | c_street_2 | c_city | c_state | c_zip "
                  "| c_phone | c_since | c_credit | c_credit_lim | c_discount | c_balance | c_ytd_payment "
                  "| c_payment_cnt | c_data |\n";
    for (const auto& row : rows) {
        grid += "|";
        for (const auto& f : row) grid += " " + f + " |";
        grid += "\n";
    }
    return grid;
}

// 3 行各 5 件、单价 10.00，库存 50
TEST(TransactionTest, NewOrderScenario) {
    FakeServer server([](const string& request) -> string {
        if (FakeServer::StartsWith(request, "SELECT d_tax"))
            return FakeServer::Grid({"d_tax", "d_next_o_id"}, {{"0.05", "3001"}});
        if (FakeServer::StartsWith(request, "SELECT c_discount"))
            return FakeServer::Grid({"c_discount", "c_last", "c_credit", "w_tax"}, {{"0.10", "BARBARBAR", "GC", "0.08"}});
        if (FakeServer::StartsWith(request, "SELECT i_price"))
            return FakeServer::Grid({"i_price", "i_name", "i_data"}, {{"10.00", "Widget", "plain item"}});
        if (FakeServer::StartsWith(request, "SELECT s_quantity"))
            return FakeServer::Grid({"s_quantity", "s_dist_01", "s_ytd", "s_order_cnt", "s_remote_cnt", "s_data"},
                                    {{"50", "dist-01-info", "0", "0", "0", "plain stock"}});
        return "";
    });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());

    NewOrderTransaction::Params params{1, 1, 42, "2024-01-01 00:00:00", {{101, 1, 5}, {102, 1, 5}, {103, 1, 5}}};
    NewOrderTransaction::Output output;
    auto status = NewOrderTransaction::run(conn, params, &output);
    ASSERT_TRUE(status.ok()) << status.toString();

    EXPECT_EQ(output.o_id, 3001);
    EXPECT_TRUE(output.all_local);
    EXPECT_NEAR(output.total_amount, 152.55, 1e-6);
    EXPECT_EQ(output.brand_generic, (vector<string>{"G", "G", "G"}));

    auto requests = server.Requests();
    EXPECT_EQ(requests.front(), "BEGIN;");
    EXPECT_EQ(requests.back(), "COMMIT;");
    EXPECT_EQ(server.Count("UPDATE district SET d_next_o_id = d_next_o_id+1 WHERE d_id = 1 AND d_w_id = 1;"), 1u);
    EXPECT_EQ(server.Count("INSERT INTO orders VALUES (3001, 1, 1, 42, '2024-01-01 00:00:00', -1, 3, 1);"), 1u);
    EXPECT_EQ(server.Count("INSERT INTO new_orders VALUES (3001, 1, 1);"), 1u);
    EXPECT_EQ(server.Count("UPDATE stock SET s_quantity = 45,"), 3u);
    EXPECT_EQ(server.Count("INSERT INTO order_line VALUES (3001, 1, 1, 1, 101, 1, '1970-01-01 00:00:00', 5, 50, 'dist-01-info');"), 1u);
    EXPECT_EQ(server.Count("INSERT INTO order_line"), 3u);
    EXPECT_EQ(server.Count("ROLLBACK"), 0u);
}

TEST(TransactionTest, NewOrderMissingItemRollsBack) {
    FakeServer server([](const string& request) -> string {
        if (FakeServer::StartsWith(request, "SELECT d_tax"))
            return FakeServer::Grid({"d_tax", "d_next_o_id"}, {{"0.05", "3001"}});
        if (FakeServer::StartsWith(request, "SELECT c_discount"))
            return FakeServer::Grid({"c_discount", "c_last", "c_credit", "w_tax"}, {{"0.10", "BARBARBAR", "GC", "0.08"}});
        // 商品不存在
        if (FakeServer::StartsWith(request, "SELECT i_price"))
            return FakeServer::Grid({"i_price", "i_name", "i_data"});
        return "";
    });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());

    NewOrderTransaction::Params params{1, 1, 42, "2024-01-01 00:00:00", {{100001, 1, 5}}};
    auto status = NewOrderTransaction::run(conn, params);
    EXPECT_TRUE(status.isLogic());
    EXPECT_EQ(server.Requests().back(), "ROLLBACK;");
    EXPECT_EQ(server.Count("COMMIT"), 0u);
    EXPECT_EQ(server.Count("INSERT INTO order_line"), 0u);
}

TEST(TransactionTest, NewOrderAbortRollsBack) {
    FakeServer server([](const string& request) -> string {
        if (FakeServer::StartsWith(request, "SELECT d_tax")) return "abort";
        return "";
    });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());

    NewOrderTransaction::Params params{1, 1, 42, "2024-01-01 00:00:00", {{1, 1, 5}}};
    auto status = NewOrderTransaction::run(conn, params);
    EXPECT_EQ(status.code(), StatusCode::ABORT);
    EXPECT_EQ(server.Requests(), (vector<string>{"BEGIN;", "SELECT d_tax, d_next_o_id FROM district WHERE d_id = 1 AND d_w_id = 1;", "ROLLBACK;"}));
}

TEST(TransactionTest, DepleteStock) {
    EXPECT_EQ(NewOrderTransaction::depleteStock(10, 10), 91);
    EXPECT_EQ(NewOrderTransaction::depleteStock(50, 5), 45);
    EXPECT_EQ(NewOrderTransaction::depleteStock(20, 10), 10);
    EXPECT_EQ(NewOrderTransaction::depleteStock(19, 10), 100);
    for (int64_t q = 10; q <= 100; q++) {
        for (int64_t r = 1; r <= 10; r++) {
            auto result = NewOrderTransaction::depleteStock(q, r);
            EXPECT_GE(result, 0);
            EXPECT_LE(result, 100);
        }
    }
}

// 5 个同姓客户按名字排序后取下标 2
TEST(TransactionTest, PaymentByLastNamePicksMedian) {
    FakeServer server([](const string& request) -> string {
        if (FakeServer::StartsWith(request, "SELECT w_name"))
            return FakeServer::Grid({"w_name", "w_street_1", "w_street_2", "w_city", "w_state", "w_zip", "w_ytd"},
                                    {{"W01", "a", "b", "c", "CA", "123451234", "300000"}});
        if (FakeServer::StartsWith(request, "SELECT d_name"))
            return FakeServer::Grid({"d_name", "d_street_1", "d_street_2", "d_city", "d_state", "d_zip", "d_ytd"},
                                    {{"D01", "a", "b", "c", "CA", "123451234", "30000"}});
        if (FakeServer::StartsWith(request, "SELECT c_id"))
            return customerGrid({customerRow("5", "Eve", "GC", "e"), customerRow("1", "Ann", "GC", "a"),
                                 customerRow("4", "Dan", "GC", "d"), customerRow("2", "Bob", "GC", "b"),
                                 customerRow("3", "Cid", "GC", "c")});
        return "";
    });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());

    PaymentTransaction::Params params{1, 1, 1, 1, true, 0, "BARBARBAR", 100.0, "2024-01-01 00:00:00"};
    PaymentTransaction::Output output;
    auto status = PaymentTransaction::run(conn, params, &output);
    ASSERT_TRUE(status.ok()) << status.toString();
    EXPECT_EQ(output.c_id, 3);
    EXPECT_FALSE(output.bad_credit);
    EXPECT_NEAR(output.c_balance, -110.0, 1e-9);
    EXPECT_EQ(server.Count("SELECT c_id, c_first"), 1u);
    EXPECT_EQ(server.Count("UPDATE customer SET c_balance = -110, c_ytd_payment = 110, c_payment_cnt = 2 WHERE c_w_id = 1 AND c_d_id = 1 AND c_id = 3;"), 1u);
    EXPECT_EQ(server.Count("INSERT INTO history VALUES (3, 1, 1, 1, 1, '2024-01-01 00:00:00', 100, 'W01    D01');"), 1u);
    EXPECT_EQ(server.Requests().back(), "COMMIT;");
}

TEST(TransactionTest, PaymentBadCreditData) {
    PaymentTransaction::Params params{1, 2, 3, 4, false, 5, "", 12.5, "2024-01-01 00:00:00"};
    // c_id, c_d_id, c_w_id, d_id, w_id, amount
    EXPECT_EQ(PaymentTransaction::badCreditData(params, 5, "old"), "5432112.50old");
    auto data = PaymentTransaction::badCreditData(params, 5, string(400, 'x'));
    EXPECT_EQ(data.size(), TPCC::MAX_C_DATA);
    EXPECT_EQ(data.substr(0, 10), "5432112.50");
}

TEST(TransactionTest, PaymentBadCreditUpdatesData) {
    FakeServer server([](const string& request) -> string {
        if (FakeServer::StartsWith(request, "SELECT w_name"))
            return FakeServer::Grid({"w_name", "w_street_1", "w_street_2", "w_city", "w_state", "w_zip", "w_ytd"},
                                    {{"W01", "a", "b", "c", "CA", "123451234", "300000"}});
        if (FakeServer::StartsWith(request, "SELECT d_name"))
            return FakeServer::Grid({"d_name", "d_street_1", "d_street_2", "d_city", "d_state", "d_zip", "d_ytd"},
                                    {{"D01", "a", "b", "c", "CA", "123451234", "30000"}});
        if (FakeServer::StartsWith(request, "SELECT c_id"))
            return customerGrid({customerRow("7", "Ann", "BC", "history")});
        return "";
    });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());

    PaymentTransaction::Params params{1, 1, 1, 1, false, 7, "", 10.0, "2024-01-01 00:00:00"};
    PaymentTransaction::Output output;
    ASSERT_TRUE(PaymentTransaction::run(conn, params, &output).ok());
    EXPECT_TRUE(output.bad_credit);
    EXPECT_EQ(output.c_data, "711110.00history");
    EXPECT_EQ(server.Count("UPDATE customer SET c_balance = -20, c_ytd_payment = 20, c_payment_cnt = 2, c_data = '711110.00history'"), 1u);
}

TEST(TransactionTest, PaymentMissingCustomerRollsBack) {
    FakeServer server([](const string& request) -> string {
        if (FakeServer::StartsWith(request, "SELECT w_name"))
            return FakeServer::Grid({"w_name", "w_street_1", "w_street_2", "w_city", "w_state", "w_zip", "w_ytd"},
                                    {{"W01", "a", "b", "c", "CA", "123451234", "300000"}});
        if (FakeServer::StartsWith(request, "SELECT d_name"))
            return FakeServer::Grid({"d_name", "d_street_1", "d_street_2", "d_city", "d_state", "d_zip", "d_ytd"},
                                    {{"D01", "a", "b", "c", "CA", "123451234", "30000"}});
        return "";
    });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());

    PaymentTransaction::Params params{1, 1, 1, 1, true, 0, "NOBODY", 10.0, "2024-01-01 00:00:00"};
    EXPECT_TRUE(PaymentTransaction::run(conn, params).isLogic());
    EXPECT_EQ(server.Requests().back(), "ROLLBACK;");
    EXPECT_EQ(server.Count("INSERT INTO history"), 0u);
}

// 区域 3 没有待配送订单
TEST(TransactionTest, DeliverySkipsEmptyDistrict) {
    FakeServer server([](const string& request) -> string {
        if (FakeServer::StartsWith(request, "SELECT MIN(no_o_id)")) {
            if (request.find("no_d_id = 3 ") != string::npos) return FakeServer::Grid({"MIN(no_o_id)"});
            return FakeServer::Grid({"MIN(no_o_id)"}, {{"2101"}});
        }
        if (FakeServer::StartsWith(request, "SELECT o_c_id"))
            return FakeServer::Grid({"o_c_id"}, {{"7"}});
        if (FakeServer::StartsWith(request, "SELECT SUM(ol_amount)"))
            return FakeServer::Grid({"SUM(ol_amount)"}, {{"120.5"}});
        return "";
    });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());

    DeliveryTransaction::Params params{1, 4, "2024-01-02 00:00:00"};
    DeliveryTransaction::Output output;
    auto status = DeliveryTransaction::run(conn, params, &output);
    ASSERT_TRUE(status.ok()) << status.toString();
    EXPECT_EQ(output.delivered, 9u);
    EXPECT_EQ(output.skipped, 1u);
    ASSERT_EQ(output.o_ids.size(), TPCC::N_DISTRICTS);
    EXPECT_EQ(output.o_ids[2], 0);
    EXPECT_EQ(output.o_ids[0], 2101);

    EXPECT_EQ(server.Count("SELECT MIN(no_o_id)"), 10u);
    EXPECT_EQ(server.Count("DELETE FROM new_orders"), 9u);
    EXPECT_EQ(server.Count("DELETE FROM new_orders WHERE no_o_id = 2101 AND no_d_id = 3"), 0u);
    EXPECT_EQ(server.Count("UPDATE orders SET o_carrier_id = 4"), 9u);
    EXPECT_EQ(server.Count("UPDATE customer SET c_balance = c_balance+120.5, c_delivery_cnt = c_delivery_cnt+1 WHERE c_id = 7"), 9u);
    EXPECT_EQ(server.Count("ROLLBACK"), 0u);
    EXPECT_EQ(server.Requests().back(), "COMMIT;");
}

TEST(TransactionTest, DeliveryMissingOrderRollsBack) {
    FakeServer server([](const string& request) -> string {
        if (FakeServer::StartsWith(request, "SELECT MIN(no_o_id)"))
            return FakeServer::Grid({"MIN(no_o_id)"}, {{"2101"}});
        if (FakeServer::StartsWith(request, "SELECT o_c_id"))
            return FakeServer::Grid({"o_c_id"});
        return "";
    });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());

    DeliveryTransaction::Params params{1, 4, "2024-01-02 00:00:00"};
    EXPECT_TRUE(DeliveryTransaction::run(conn, params).isLogic());
    EXPECT_EQ(server.Requests().back(), "ROLLBACK;");
    EXPECT_EQ(server.Count("COMMIT"), 0u);
}

TEST(TransactionTest, OrderStatus) {
    string orders = "";
    FakeServer server([&orders](const string&) { return orders; });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());

    OrderStatusTransaction::Params params{1, 2, 3};
    // 空结果视为缺失记录
    EXPECT_TRUE(OrderStatusTransaction::run(conn, params).isLogic());

    orders = FakeServer::Grid({"o_id", "o_d_id", "o_w_id", "o_c_id", "o_entry_d", "o_carrier_id", "o_ol_cnt", "o_all_local"},
                              {{"2999", "2", "1", "3", "2024-01-01 00:00:00", "5", "10", "1"}});
    OrderStatusTransaction::Output output;
    ASSERT_TRUE(OrderStatusTransaction::run(conn, params, &output).ok());
    EXPECT_EQ(output.order[0], "2999");
    EXPECT_EQ(server.Count("SELECT * FROM orders WHERE o_w_id = 1 AND o_d_id = 2 AND o_c_id = 3 ORDER BY o_id DESC LIMIT 1;"), 2u);
    EXPECT_EQ(server.Count("BEGIN"), 0u);
    EXPECT_EQ(server.Count("ROLLBACK"), 0u);
}

TEST(TransactionTest, StockLevel) {
    string reply = FakeServer::Grid({"COUNT(DISTINCT s_i_id)"}, {{"0"}});
    FakeServer server([&reply](const string&) { return reply; });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());

    StockLevelTransaction::Params params{1, 15};
    StockLevelTransaction::Output output;
    // 计数为 0 也算成功
    ASSERT_TRUE(StockLevelTransaction::run(conn, params, &output).ok());
    EXPECT_EQ(output.low_stock, 0);
    EXPECT_EQ(server.Requests().back(), "SELECT COUNT(DISTINCT s_i_id) FROM stock WHERE s_w_id = 1 AND s_quantity < 15;");

    reply = FakeServer::Grid({"COUNT(DISTINCT s_i_id)"});
    EXPECT_TRUE(StockLevelTransaction::run(conn, params).isLogic());
}

TEST(TransactionTest, RandomInputsInRange) {
    Random random(7);
    NewOrderTransaction newOrder(random, 4);
    PaymentTransaction payment(random, 1);
    StockLevelTransaction stockLevel(random, 4);
    for (int i = 0; i < 200; i++) {
        auto p = newOrder.makeParams();
        EXPECT_GE(p.w_id, 1); EXPECT_LE(p.w_id, 4);
        EXPECT_GE(p.lines.size(), TPCC::MIN_OL_CNT);
        EXPECT_LE(p.lines.size(), TPCC::MAX_OL_CNT);
        for (const auto& line : p.lines) {
            EXPECT_GE(line.quantity, 1); EXPECT_LE(line.quantity, int64_t(TPCC::MAX_OL_QUANTITY));
            EXPECT_GE(line.i_id, 1); EXPECT_LE(line.i_id, int64_t(TPCC::N_ITEMS));
        }
        // 单仓库时客户总在本仓库
        auto q = payment.makeParams();
        EXPECT_EQ(q.c_w_id, 1);
        EXPECT_GE(q.h_amount, TPCC::MIN_PAYMENT); EXPECT_LE(q.h_amount, TPCC::MAX_PAYMENT);
        EXPECT_EQ(q.by_last_name, !q.c_last.empty());

        auto s = stockLevel.makeParams();
        EXPECT_GE(s.threshold, int64_t(TPCC::MIN_STOCK_THRESHOLD));
        EXPECT_LE(s.threshold, int64_t(TPCC::MAX_STOCK_THRESHOLD));
    }
    EXPECT_THROW(TPCCTransaction::create(static_cast<TPCC::TransactionType>(9), random, 1), std::invalid_argument);
    EXPECT_EQ(TPCCTransaction::create(TPCC::DELIVERY, random, 1)->getType(), TPCC::DELIVERY);
}

// 4 个仓库下的远程仓库与按姓氏查找比例
TEST(TransactionTest, PaymentInputMix) {
    Random random(2024);
    PaymentTransaction payment(random, 4);
    const size_t n = 10000;
    size_t remote = 0, by_last_name = 0;
    for (size_t i = 0; i < n; i++) {
        auto p = payment.makeParams();
        EXPECT_GE(p.c_w_id, 1); EXPECT_LE(p.c_w_id, 4);
        EXPECT_GE(p.c_d_id, 1); EXPECT_LE(p.c_d_id, int64_t(TPCC::N_DISTRICTS));
        if (p.c_w_id != p.w_id) remote++;
        if (p.by_last_name) {
            by_last_name++;
            EXPECT_EQ(p.c_id, 0);
            EXPECT_FALSE(p.c_last.empty());
        } else {
            EXPECT_GE(p.c_id, 1); EXPECT_LE(p.c_id, int64_t(TPCC::N_CUSTOMERS));
        }
    }
    // 远程分支从不选回本仓库，所以远程比例就是分支比例
    EXPECT_NEAR((double)remote / n, 0.15, 0.015);
    EXPECT_NEAR((double)by_last_name / n, 0.4, 0.02);
}

TEST(TransactionTest, NewOrderRemoteSupply) {
    Random random(99);
    NewOrderTransaction newOrder(random, 4);
    size_t lines = 0, remote = 0;
    for (int i = 0; i < 10000; i++) {
        auto p = newOrder.makeParams();
        for (const auto& line : p.lines) {
            lines++;
            EXPECT_GE(line.supply_w_id, 1); EXPECT_LE(line.supply_w_id, 4);
            if (line.supply_w_id != p.w_id) remote++;
        }
    }
    EXPECT_NEAR((double)remote / lines, 0.01, 0.002);

    // 单仓库时所有订单行都在本仓库
    NewOrderTransaction local(random, 1);
    for (int i = 0; i < 1000; i++) {
        for (const auto& line : local.makeParams().lines) {
            EXPECT_EQ(line.supply_w_id, 1);
        }
    }
}
