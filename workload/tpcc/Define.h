#pragma once

#include <string>
#include <cstddef>

namespace TPCC {

enum TransactionType {
    NEW_ORDER,
    PAYMENT,
    DELIVERY,
    ORDER_STATUS,
    STOCK_LEVEL
};

static const size_t N_TRANSACTION_TYPES = 5;

static std::string transactionTypeToString(TransactionType type) {
    switch (type) {
        case TransactionType::NEW_ORDER:
            return "NEW_ORDER";
        case TransactionType::PAYMENT:
            return "PAYMENT";
        case TransactionType::DELIVERY:
            return "DELIVERY";
        case TransactionType::ORDER_STATUS:
            return "ORDER_STATUS";
        case TransactionType::STOCK_LEVEL:
            return "STOCK_LEVEL";
        default:
            return "UNKNOWN";
    }
}

static const size_t N_DISTRICTS = 10;
static const size_t N_CUSTOMERS = 3000;
static const size_t N_ITEMS = 100000;
static const size_t N_ORDERS = 3000;
static const size_t N_NEW_ORDERS = 900;
static const size_t N_CARRIERS = 10;
// 初始订单中已配送的最大编号
static const size_t N_DELIVERED_ORDERS = 2100;
static const size_t N_INITIAL_ORDER_LINES = 10;

static const size_t MIN_OL_CNT = 5;
static const size_t MAX_OL_CNT = 15;
static const size_t MAX_OL_QUANTITY = 10;
static const size_t MIN_STOCK_THRESHOLD = 10;
static const size_t MAX_STOCK_THRESHOLD = 20;
static const size_t MAX_C_DATA = 300;

static const double MIN_PAYMENT = 1.0;
static const double MAX_PAYMENT = 5000.0;

// 新订单的配送商占位值，装载数据中为 0
static const int NEW_ORDER_CARRIER = -1;
static const int LOADED_UNDELIVERED_CARRIER = 0;

static const char* const BAD_CREDIT = "BC";
static const char* const GOOD_CREDIT = "GC";
static const char* const ORIGINAL = "ORIGINAL";

}
