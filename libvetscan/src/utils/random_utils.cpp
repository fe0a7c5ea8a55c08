#include "../../include/random_utils.hpp"
#include <random>

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<unsigned long long> dist;
}

namespace vetscan::RandomUtils {

unsigned long long next_u64() {
    return dist(rng);
}

std::string random_suffix() {
    return std::to_string(next_u64());
}

std::string random_hex_id(const std::size_t length) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string id;
    id.reserve(length);
    unsigned long long bits = 0;
    for (std::size_t i = 0; i < length; ++i) {
        if (i % 16 == 0) bits = next_u64();
        id.push_back(kHex[bits & 0xF]);
        bits >>= 4;
    }
    return id;
}

} // namespace vetscan::RandomUtils
