#pragma once

#include <rmbench/workload/tpcc/Workload.h>
#include <ranges>
#include <sstream>
#include <string>
#include <string_view>
#include <stdexcept>
#include <vector>
#include <fmt/core.h>

// throw error
#define THROW(...)   throw std::runtime_error(std::string{fmt::format(__VA_ARGS__)})

namespace rmbench {

inline std::vector<std::string> split(std::basic_string_view<char> s, char delimiter = ',') {
    auto iter = s | std::ranges::views::split(delimiter);
    auto toks = std::vector<std::string>();
    for (auto&& x: iter) {
        toks.emplace_back(x.begin(), x.end());
    }
    return toks;
}

template<typename T>
inline T to(std::basic_string_view<char> s) {
    std::stringstream sstream(std::string{s});
    T result; sstream >> result;
    if (sstream.fail() || !(sstream >> std::ws).eof()) {
        THROW("cannot parse ({}) as a number", s);
    }
    return result;
}

template<>
inline bool to<bool>(std::basic_string_view<char> s) {
    if (s == "TRUE" || s == "true")    { return true; }
    if (s == "FALSE" || s == "false")  { return false; }
    THROW("cannot recognize ({}) as boolean should be either TRUE or FALSE", s);
}

/// @brief "w1,w2,w3,w4,w5" in NewOrder, Payment, Delivery, OrderStatus, StockLevel order
inline TransactionWeights ParseWeights(std::basic_string_view<char> arg) {
    auto toks = split(arg, ',');
    if (toks.size() != TPCC::N_TRANSACTION_TYPES) {
        THROW("expected {} transaction weights but found {} in ({})", TPCC::N_TRANSACTION_TYPES, toks.size(), arg);
    }
    TransactionWeights weights{};
    for (size_t i = 0; i < toks.size(); i++) {
        weights[i] = to<double>(toks[i]);
        if (weights[i] < 0) THROW("transaction weight ({}) must not be negative", toks[i]);
    }
    return weights;
}

}
