#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <rmbench/database/Cursor.h>

// 每个结构体的字段顺序与建表语句一致，values() 按列顺序给出插入参数
namespace TPCC {

using rmbench::Params;

struct Warehouse {
    static constexpr const char* TABLE = "warehouse";
    // Primary Key - w_id
    int64_t w_id;               // 仓库编号
    std::string w_name;
    std::string w_street_1;
    std::string w_street_2;
    std::string w_city;
    std::string w_state;
    std::string w_zip;
    double w_tax;               // 仓库税率
    double w_ytd;               // 仓库总收入

    Params values() const {
        return {w_id, w_name, w_street_1, w_street_2, w_city, w_state, w_zip, w_tax, w_ytd};
    }
};

struct District {
    static constexpr const char* TABLE = "district";
    // Primary Key - (d_id, d_w_id)
    // Foreign Key - (d_w_id) => (w_id)
    int64_t d_id;               // 区域编号
    int64_t d_w_id;             // 仓库编号
    std::string d_name;
    std::string d_street_1;
    std::string d_street_2;
    std::string d_city;
    std::string d_state;
    std::string d_zip;
    double d_tax;
    double d_ytd;               // 区域总收入
    int64_t d_next_o_id;        // 下一个订单编号

    Params values() const {
        return {d_id, d_w_id, d_name, d_street_1, d_street_2, d_city, d_state, d_zip,
                d_tax, d_ytd, d_next_o_id};
    }
};

struct Customer {
    static constexpr const char* TABLE = "customer";
    // Primary Key - (c_id, c_d_id, c_w_id)
    // Foreign Key - (c_d_id, c_w_id) => (d_id, w_id)
    int64_t c_id;               // 客户编号
    int64_t c_d_id;             // 区域编号
    int64_t c_w_id;             // 仓库编号
    std::string c_first;
    std::string c_middle;
    std::string c_last;         // 姓氏
    std::string c_street_1;
    std::string c_street_2;
    std::string c_city;
    std::string c_state;
    std::string c_zip;
    std::string c_phone;
    std::string c_since;
    std::string c_credit;       // GC 或 BC
    int64_t c_credit_lim;
    double c_discount;
    double c_balance;           // 余额
    double c_ytd_payment;
    int64_t c_payment_cnt;
    int64_t c_delivery_cnt;
    std::string c_data;

    Params values() const {
        return {c_id, c_d_id, c_w_id, c_first, c_middle, c_last, c_street_1, c_street_2,
                c_city, c_state, c_zip, c_phone, c_since, c_credit, c_credit_lim,
                c_discount, c_balance, c_ytd_payment, c_payment_cnt, c_delivery_cnt, c_data};
    }
};

struct History {
    static constexpr const char* TABLE = "history";
    // Primary Key - none
    // Foreign Key - (h_c_id, h_c_d_id, h_c_w_id) => (c_id, c_d_id, c_w_id)
    int64_t h_c_id;             // 客户编号
    int64_t h_c_d_id;           // 客户所在区域编号
    int64_t h_c_w_id;           // 客户所在仓库编号
    // Foreign Key - (h_d_id, h_w_id) => (d_id, d_w_id)
    int64_t h_d_id;             // 区域编号
    int64_t h_w_id;             // 仓库编号
    std::string h_date;
    double h_amount;            // 支付金额
    std::string h_data;

    Params values() const {
        return {h_c_id, h_c_d_id, h_c_w_id, h_d_id, h_w_id, h_date, h_amount, h_data};
    }
};

struct NewOrder {
    static constexpr const char* TABLE = "new_orders";
    // Primary Key - (no_o_id, no_d_id, no_w_id)
    // Foreign Key - (no_o_id, no_d_id, no_w_id) => Order(o_id, o_d_id, o_w_id)
    int64_t no_o_id;            // 订单编号
    int64_t no_d_id;            // 区域编号
    int64_t no_w_id;            // 仓库编号

    Params values() const {
        return {no_o_id, no_d_id, no_w_id};
    }
};

struct Order {
    static constexpr const char* TABLE = "orders";
    // Primary Key - (o_id, o_d_id, o_w_id)
    // Foreign Key - (o_d_id, o_w_id, o_c_id) => (c_d_id, c_w_id, c_id)
    int64_t o_id;               // 订单编号
    int64_t o_d_id;             // 区域编号
    int64_t o_w_id;             // 仓库编号
    int64_t o_c_id;             // 客户编号
    std::string o_entry_d;      // 订单日期
    int64_t o_carrier_id;       // 承运人编号
    int64_t o_ol_cnt;           // 订单中的商品数量
    int64_t o_all_local;

    Params values() const {
        return {o_id, o_d_id, o_w_id, o_c_id, o_entry_d, o_carrier_id, o_ol_cnt, o_all_local};
    }
};

struct OrderLine {
    static constexpr const char* TABLE = "order_line";
    // Primary Key - (ol_o_id, ol_d_id, ol_w_id, ol_number)
    // Foreign Key - (ol_o_id, ol_d_id, ol_w_id) => (o_id, o_d_id, o_w_id)
    int64_t ol_o_id;            // 订单编号
    int64_t ol_d_id;            // 区域编号
    int64_t ol_w_id;            // 仓库编号
    int64_t ol_number;          // 订单行号
    // Foreign Key - (ol_i_id, ol_supply_w_id) => (s_i_id, s_w_id)
    int64_t ol_i_id;            // 商品编号
    int64_t ol_supply_w_id;     // 供应仓库编号
    std::string ol_delivery_d;  // 交货日期
    int64_t ol_quantity;        // 商品数量
    double ol_amount;           // 商品金额
    std::string ol_dist_info;   // 区域信息

    Params values() const {
        return {ol_o_id, ol_d_id, ol_w_id, ol_number, ol_i_id, ol_supply_w_id,
                ol_delivery_d, ol_quantity, ol_amount, ol_dist_info};
    }
};

struct Item {
    static constexpr const char* TABLE = "item";
    // Primary Key - i_id
    int64_t i_id;               // 商品编号
    int64_t i_im_id;
    std::string i_name;
    double i_price;             // 商品价格
    std::string i_data;

    Params values() const {
        return {i_id, i_im_id, i_name, i_price, i_data};
    }
};

struct Stock {
    static constexpr const char* TABLE = "stock";
    // Primary Key - (s_i_id, s_w_id)
    // Foreign Key - (s_i_id) => (i_id)
    // Foreign Key - (s_w_id) => (w_id)
    int64_t s_i_id;             // 商品编号
    int64_t s_w_id;             // 仓库编号
    int64_t s_quantity;         // 商品数量
    std::array<std::string, 10> s_dist;    // s_dist_01 ... s_dist_10
    double s_ytd;               // 商品总销售数量
    int64_t s_order_cnt;        // 商品订单数量
    int64_t s_remote_cnt;
    std::string s_data;

    Params values() const {
        Params params{s_i_id, s_w_id, s_quantity};
        for (const auto& dist : s_dist) params.emplace_back(dist);
        params.emplace_back(s_ytd);
        params.emplace_back(s_order_cnt);
        params.emplace_back(s_remote_cnt);
        params.emplace_back(s_data);
        return params;
    }
};

}
