#pragma once

#include <string>
#include <cstddef>

namespace rmbench {

// 服务端默认地址
static const std::string DEFAULT_HOST = "127.0.0.1";
static const unsigned short DEFAULT_PORT = 8765;

// 连接建立与事务重试的最大次数
static const size_t MAX_CONNECT_ATTEMPTS = 3;
static const size_t MAX_TXN_ATTEMPTS = 3;

// 慢语句告警阈值（秒）
static const double SLOW_QUERY_SECONDS = 10.0;
static const double SLOW_UPDATE_SECONDS = 5.0;
static const double SLOW_TXN_SECONDS = 60.0;

// time format used in every datetime column
static const char* const DATETIME_FORMAT = "%Y-%m-%d %H:%M:%S";

// 未配送订单行的时间占位值
static const std::string UNDELIVERED_DATE = "1970-01-01 00:00:00";

}
