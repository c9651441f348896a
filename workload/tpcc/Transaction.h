#pragma once

#include <memory>
#include <string>
#include <vector>
#include <cstdint>
#include <rmbench/common/Status.h>
#include <rmbench/database/Connection.h>
#include <rmbench/workload/tpcc/Define.h>
#include <rmbench/workload/tpcc/Random.h>

namespace rmbench {

/// @brief base of the five TPC-C profiles, draws inputs from the caller's Random
class TPCCTransaction : public std::enable_shared_from_this<TPCCTransaction>
{
    public:
        typedef std::shared_ptr<TPCCTransaction> Ptr;

        TPCCTransaction(Random& random, size_t n_warehouses, TPCC::TransactionType type):
            random(random), n_warehouses(n_warehouses), m_type(type) {}

        virtual ~TPCCTransaction() = default;

        // 生成随机输入并在给定连接上执行一次
        virtual Status execute(Connection& conn) = 0;

        TPCC::TransactionType getType() const {return m_type;}

        static Ptr create(TPCC::TransactionType type, Random& random, size_t n_warehouses);

    protected:
        int64_t randomWarehouse() { return random.uniform_dist(1, n_warehouses); }
        int64_t randomDistrict() { return random.uniform_dist(1, TPCC::N_DISTRICTS); }
        int64_t randomCustomer() { return random.uniform_dist(1, TPCC::N_CUSTOMERS); }
        // 单仓库时只能返回 w_id 本身
        int64_t otherWarehouse(int64_t w_id) {
            if (n_warehouses == 1) return w_id;
            int64_t other;
            do {
                other = randomWarehouse();
            } while (other == w_id);
            return other;
        }

        Random& random;
        size_t n_warehouses;
        TPCC::TransactionType m_type;
};

class NewOrderTransaction : public TPCCTransaction
{
    public:
        struct OrderLineParams {
            int64_t i_id;
            int64_t supply_w_id;
            int64_t quantity;
        };

        struct Params {
            int64_t w_id;
            int64_t d_id;
            int64_t c_id;
            std::string o_entry_d;
            std::vector<OrderLineParams> lines;
        };

        struct Output {
            int64_t o_id = 0;
            double total_amount = 0;
            bool all_local = true;
            std::vector<std::string> brand_generic;
        };

        NewOrderTransaction(Random& random, size_t n_warehouses):
            TPCCTransaction(random, n_warehouses, TPCC::NEW_ORDER) {}

        Params makeParams();
        Status execute(Connection& conn) override { return run(conn, makeParams()); }
        static Status run(Connection& conn, const Params& params, Output* output = nullptr);

        // 库存扣减：不足 R+10 时补货 91
        static int64_t depleteStock(int64_t quantity, int64_t ordered);
};

class PaymentTransaction : public TPCCTransaction
{
    public:
        struct Params {
            int64_t w_id;
            int64_t d_id;
            int64_t c_w_id;
            int64_t c_d_id;
            bool by_last_name;
            int64_t c_id;           // used when !by_last_name
            std::string c_last;     // used when by_last_name
            double h_amount;
            std::string h_date;
        };

        struct Output {
            int64_t c_id = 0;
            double c_balance = 0;
            bool bad_credit = false;
            std::string c_data;
        };

        PaymentTransaction(Random& random, size_t n_warehouses):
            TPCCTransaction(random, n_warehouses, TPCC::PAYMENT) {}

        Params makeParams();
        Status execute(Connection& conn) override { return run(conn, makeParams()); }
        static Status run(Connection& conn, const Params& params, Output* output = nullptr);

        static std::string badCreditData(const Params& params, int64_t c_id, const std::string& c_data);
};

class DeliveryTransaction : public TPCCTransaction
{
    public:
        struct Params {
            int64_t w_id;
            int64_t o_carrier_id;
            std::string ol_delivery_d;
        };

        struct Output {
            size_t delivered = 0;
            size_t skipped = 0;
            std::vector<int64_t> o_ids;     // 0 for skipped districts
        };

        DeliveryTransaction(Random& random, size_t n_warehouses):
            TPCCTransaction(random, n_warehouses, TPCC::DELIVERY) {}

        Params makeParams();
        Status execute(Connection& conn) override { return run(conn, makeParams()); }
        static Status run(Connection& conn, const Params& params, Output* output = nullptr);
};

class OrderStatusTransaction : public TPCCTransaction
{
    public:
        struct Params {
            int64_t w_id;
            int64_t d_id;
            int64_t c_id;
        };

        struct Output {
            Row order;
        };

        OrderStatusTransaction(Random& random, size_t n_warehouses):
            TPCCTransaction(random, n_warehouses, TPCC::ORDER_STATUS) {}

        Params makeParams();
        Status execute(Connection& conn) override { return run(conn, makeParams()); }
        static Status run(Connection& conn, const Params& params, Output* output = nullptr);
};

class StockLevelTransaction : public TPCCTransaction
{
    public:
        struct Params {
            int64_t w_id;
            int64_t threshold;
        };

        struct Output {
            int64_t low_stock = 0;
        };

        StockLevelTransaction(Random& random, size_t n_warehouses):
            TPCCTransaction(random, n_warehouses, TPCC::STOCK_LEVEL) {}

        Params makeParams();
        Status execute(Connection& conn) override { return run(conn, makeParams()); }
        static Status run(Connection& conn, const Params& params, Output* output = nullptr);
};

std::string currentTimestamp();

}
