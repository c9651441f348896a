#include <gtest/gtest.h>
#include <rmbench/executor/SchemaManager.h>
#include <rmbench/executor/LoadExecutor.h>
#include <rmbench/executor/ConsistencyChecker.h>
#include <rmbench/test/FakeServer.h>
#include <atomic>

using namespace std;
using namespace rmbench;

TEST(SchemaTest, CreateSchema) {
    FakeServer server([](const string&) { return string(); });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());
    SchemaManager schema(conn);
    schema.CreateSchema();
    EXPECT_EQ(server.Requests().size(), 9u);
    EXPECT_EQ(server.Count("create table"), 9u);
    EXPECT_EQ(server.Count("create table order_line (ol_o_id int"), 1u);
    schema.CreateIndexes();
    EXPECT_EQ(server.Count("create index"), 8u);
    EXPECT_EQ(server.Count("create index stock(s_w_id, s_i_id);"), 1u);
}

TEST(SchemaTest, CreateSchemaFails) {
    FakeServer server([](const string& request) {
        return FakeServer::StartsWith(request, "create table customer") ? string("abort") : string();
    });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());
    SchemaManager schema(conn);
    EXPECT_THROW(schema.CreateSchema(), std::runtime_error);
    // customer 之后的建表语句不再发送
    EXPECT_EQ(server.Requests().size(), 3u);
}

TEST(SchemaTest, CountRows) {
    string reply;
    FakeServer server([&reply](const string&) { return reply; });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());
    SchemaManager schema(conn);

    reply = FakeServer::Grid({"count"}, {{"42"}});
    EXPECT_EQ(schema.CountRows("item"), 42u);
    EXPECT_EQ(server.Requests().back(), "SELECT COUNT(*) as count FROM item;");

    auto counts = schema.GetTableCounts();
    EXPECT_EQ(counts.size(), SchemaManager::TABLES.size());
    EXPECT_EQ(counts["history"], 42u);

    reply = FakeServer::Grid({"count"}, {{"many"}});
    EXPECT_THROW(schema.CountRows("item"), std::runtime_error);
    reply = "Error: no such table";
    EXPECT_THROW(schema.CountRows("item"), std::runtime_error);
    reply = "abort";
    EXPECT_THROW(schema.CountRows("item"), std::runtime_error);
}

TEST(SchemaTest, DropAllTablesIgnoresFailures) {
    FakeServer server([](const string&) { return string("abort"); });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());
    SchemaManager schema(conn);
    EXPECT_NO_THROW(schema.DropAllTables());
    EXPECT_EQ(server.Count("drop table"), 9u);
    EXPECT_EQ(server.Count("drop table new_orders;"), 1u);
}

TEST(LoadExecutorTest, InsertStatement) {
    EXPECT_EQ(LoadExecutor::InsertStatement("new_orders", 3), "INSERT INTO new_orders VALUES (?, ?, ?)");
    EXPECT_EQ(LoadExecutor::InsertStatement("t", 1), "INSERT INTO t VALUES (?)");
}

TEST(LoadExecutorTest, StopsAtFirstFailedInsert) {
    atomic<size_t> n{0};
    // 1 个仓库、10 个区域之后，第 14 个商品插入失败
    FakeServer server([&n](const string&) { return ++n == 25 ? string("abort") : string(); });
    Connection conn(server.Factory());
    ASSERT_TRUE(conn.Connect().ok());
    Random random(1);
    Generator generator(random, 1);
    LoadExecutor loader(conn, 5);
    EXPECT_THROW(loader.LoadAll(generator), std::runtime_error);
    EXPECT_EQ(loader.getLoadedRows(), 24u);

    auto requests = server.Requests();
    ASSERT_EQ(requests.size(), 25u);
    EXPECT_TRUE(FakeServer::StartsWith(requests[0], "INSERT INTO warehouse VALUES (1, 'W01', '"));
    EXPECT_TRUE(FakeServer::StartsWith(requests[1], "INSERT INTO district VALUES (1, 1, 'D01', '"));
    EXPECT_TRUE(FakeServer::StartsWith(requests[10], "INSERT INTO district VALUES (10, 1, 'D10', '"));
    EXPECT_TRUE(FakeServer::StartsWith(requests[11], "INSERT INTO item VALUES (1, "));
    EXPECT_TRUE(FakeServer::StartsWith(requests[24], "INSERT INTO item VALUES (14, "));
}

// 按初始装载状态应答一致性检查的查询
class ConsistencyCheckerTest : public ::testing::Test {
    protected:
        ConsistencyCheckerTest(): server([this](const string& request) { return answer(request); }), conn(server.Factory()) {
            EXPECT_TRUE(conn.Connect().ok());
        }

        string answer(const string& request) {
            for (const auto& [table, count] : Generator::ExpectedCounts(1)) {
                if (request == "SELECT COUNT(*) as count FROM " + table + ";") {
                    if (table == broken_table) return "abort";
                    return FakeServer::Grid({"count"}, {{to_string(count)}});
                }
            }
            if (FakeServer::StartsWith(request, "SELECT d_next_o_id"))
                return FakeServer::Grid({"d_next_o_id"}, {{"3001"}});
            if (FakeServer::StartsWith(request, "SELECT MAX(o_id)"))
                return FakeServer::Grid({"max_o_id"}, {{"3000"}});
            if (FakeServer::StartsWith(request, "SELECT MAX(no_o_id)"))
                return FakeServer::Grid({"max_no_o_id"}, {{"3000"}});
            if (FakeServer::StartsWith(request, "SELECT MIN(no_o_id)"))
                return FakeServer::Grid({"min_no_o_id"}, {{min_no_o_id}});
            if (FakeServer::StartsWith(request, "SELECT COUNT(no_o_id)"))
                return FakeServer::Grid({"count_no_o_id"}, {{"900"}});
            if (FakeServer::StartsWith(request, "SELECT SUM(o_ol_cnt)"))
                return FakeServer::Grid({"sum_o_ol_cnt"}, {{"30000.000000"}});
            if (FakeServer::StartsWith(request, "SELECT COUNT(ol_o_id)"))
                return FakeServer::Grid({"count_ol_o_id"}, {{"30000"}});
            return "";
        }

        string broken_table;
        string min_no_o_id = "2101";
        FakeServer server;
        Connection conn;
};

TEST_F(ConsistencyCheckerTest, FreshLoadPasses) {
    ConsistencyChecker checker(conn, 1);
    auto checks = checker.RunConsistencyChecks();
    EXPECT_EQ(checks.size(), 12u);
    for (const auto& [name, ok] : checks) {
        EXPECT_TRUE(ok) << name;
    }
    EXPECT_TRUE(checks.count("order_line_count"));
    EXPECT_TRUE(checks.count("district_order_consistency"));
    EXPECT_EQ(server.Count("SELECT d_next_o_id FROM district WHERE d_w_id = 1 AND d_id = 10;"), 1u);
}

TEST_F(ConsistencyCheckerTest, DetectsViolations) {
    broken_table = "stock";
    min_no_o_id = "2100";
    ConsistencyChecker checker(conn, 1);
    auto checks = checker.RunConsistencyChecks();
    EXPECT_FALSE(checks["stock_count"]);
    EXPECT_FALSE(checks["new_orders_consistency"]);
    EXPECT_TRUE(checks["item_count"]);
    EXPECT_TRUE(checks["district_order_consistency"]);
    EXPECT_TRUE(checks["order_line_consistency"]);
}

TEST_F(ConsistencyCheckerTest, WrongScale) {
    // 按 2 个仓库检查时行数不符
    ConsistencyChecker checker(conn, 2);
    auto checks = checker.RunConsistencyChecks();
    EXPECT_FALSE(checks["warehouse_count"]);
    EXPECT_TRUE(checks["item_count"]);
    EXPECT_TRUE(checks["district_order_consistency"]);
}

TEST_F(ConsistencyCheckerTest, DatabaseStats) {
    ConsistencyChecker checker(conn, 1);
    auto stats = checker.GetDatabaseStats();
    EXPECT_EQ(stats.size(), 9u);
    EXPECT_EQ(stats["order_line"], 300000u);
    EXPECT_EQ(stats["new_orders"], 9000u);
}
