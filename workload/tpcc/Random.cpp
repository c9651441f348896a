#include <rmbench/workload/tpcc/Random.h>
#include <rmbench/workload/tpcc/Define.h>
#include <chrono>
#include <ctime>
#include <fmt/core.h>
#include <fmt/chrono.h>

namespace rmbench {

static const std::string ALPHANUM =
    "0123456789"
    "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
    "abcdefghijklmnopqrstuvwxyz";

uint64_t Random::uniform_dist(uint64_t min, uint64_t max) {
    std::uniform_int_distribution<uint64_t> dist(min, max);
    return dist(gen);
}

double Random::uniform_real(double min, double max) {
    std::uniform_real_distribution<double> dist(min, max);
    return dist(gen);
}

/// @brief true with probability p
bool Random::chance(double p) {
    return uniform_real(0.0, 1.0) < p;
}

std::string Random::rand_str(size_t length, const std::string& charset) {
    std::string s(length, ' ');
    for (auto& c : s) {
        c = charset[uniform_dist(0, charset.size() - 1)];
    }
    return s;
}

/// @brief alphanumeric string with length in [min_len, max_len]
std::string Random::a_string(size_t min_len, size_t max_len) {
    return rand_str(uniform_dist(min_len, max_len), ALPHANUM);
}

/// @brief last name of a uniformly chosen customer id
std::string Random::rand_last_name() {
    return last_name(uniform_dist(1, TPCC::N_CUSTOMERS));
}

/// @brief timestamp up to max_days_ago days before now
std::string Random::rand_timestamp(int max_days_ago) {
    auto days = uniform_dist(0, max_days_ago);
    auto t = std::chrono::system_clock::to_time_t(
        std::chrono::system_clock::now() - std::chrono::hours(24 * days));
    return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(t));
}

/// @brief syllable last name used by the loader
/// @param c_id customer id, ids below 1000 map to one syllable
std::string Random::last_name(uint64_t c_id) {
    static const char* syllables[] = {
        "BAR", "OUGHT", "ABLE", "PRI", "PRES",
        "ESE", "ANTI", "CALLY", "ATION", "EING"};
    if (c_id < 1000) {
        return syllables[c_id / 100];
    }
    return std::string(syllables[c_id % 1000 / 100]) + syllables[(c_id / 1000) % 10];
}

}
