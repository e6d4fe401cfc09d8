#include "../../include/random_utils.hpp"
#include <random>
#include <string_view>

namespace {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<unsigned long long> dist;

    constexpr std::string_view kAlphabet = "0123456789abcdefghijklmnopqrstuvwxyz";
}

unsigned long long RandomUtils::next_u64() {
    return dist(rng);
}

std::string RandomUtils::random_suffix(const std::size_t length) {
    std::string out;
    out.reserve(length);
    while (out.size() < length) {
        unsigned long long bits = next_u64();
        // 12 characters fit in one 64-bit draw (36^12 < 2^64)
        for (int i = 0; i < 12 && out.size() < length; ++i) {
            out.push_back(kAlphabet[bits % kAlphabet.size()]);
            bits /= kAlphabet.size();
        }
    }
    return out;
}
