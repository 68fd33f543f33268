//
// Created by Giuseppe Francione on 07/10/25.
//

#include "../../include/random_utils.hpp"
#include <random>

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<unsigned long long> dist;
}

unsigned long long RandomUtils::next_u64() {
    return dist(rng);
}

std::string RandomUtils::random_hex(const std::size_t digits) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(digits);
    unsigned long long bits = 0;
    for (std::size_t i = 0; i < digits; ++i) {
        // 16 nibbles per draw
        if (i % 16 == 0) bits = next_u64();
        out.push_back(kHex[bits & 0x0F]);
        bits >>= 4;
    }
    return out;
}
