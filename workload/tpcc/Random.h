#pragma once

#include <random>
#include <string>
#include <cstdint>

namespace rmbench {

/// @brief seeded generator for transaction inputs and population data
class Random {
    public:
        Random(uint64_t seed = 0) { set_seed(seed); }

        void set_seed(uint64_t seed) { this->seed = seed; gen.seed(seed); }
        uint64_t get_seed() const { return seed; }

        // [min, max] 闭区间
        uint64_t uniform_dist(uint64_t min, uint64_t max);
        double uniform_real(double min, double max);
        bool chance(double p);

        std::string rand_str(size_t length, const std::string& charset);
        std::string a_string(size_t min_len, size_t max_len);
        std::string rand_last_name();
        std::string rand_timestamp(int max_days_ago);

        static std::string last_name(uint64_t c_id);

    private:
        uint64_t seed;
        std::mt19937_64 gen;
};

}
