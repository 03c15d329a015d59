// TOKENLEDGER - Integer Fraction Arithmetic Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/core/math.h"
#include "tokenledger/core/types.h"

#include <limits>

namespace tokenledger {

namespace {

constexpr __uint128_t U64_MAX = std::numeric_limits<uint64_t>::max();
constexpr __uint128_t U128_MAX = ~static_cast<__uint128_t>(0);

} // namespace

std::optional<uint64_t> MulDiv(uint64_t a, uint64_t b, uint64_t d) {
    if (d == 0) {
        return std::nullopt;
    }
    __uint128_t result = (static_cast<__uint128_t>(a) * b) / d;
    if (result > U64_MAX) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(result);
}

std::optional<uint64_t> MulMulDiv(uint64_t a, uint64_t b, uint64_t c, uint64_t d) {
    if (d == 0) {
        return std::nullopt;
    }

    // x = a*b fits in 128 bits. Split x = q*d + r so that
    // floor(x*c/d) = q*c + floor(r*c/d), with r*c < d*2^64 <= 2^128.
    __uint128_t x = static_cast<__uint128_t>(a) * b;
    __uint128_t q = x / d;
    __uint128_t r = x % d;

    if (q != 0 && c > U128_MAX / q) {
        return std::nullopt;
    }
    __uint128_t high = q * c;
    __uint128_t low = (r * c) / d;

    if (high > U64_MAX || low > U64_MAX - high) {
        return std::nullopt;
    }
    return static_cast<uint64_t>(high + low);
}

std::optional<uint64_t> CheckedAdd(uint64_t a, uint64_t b) {
    if (a > std::numeric_limits<uint64_t>::max() - b) {
        return std::nullopt;
    }
    return a + b;
}

std::optional<uint64_t> Elapsed(int64_t from, int64_t to) {
    if (to < from) {
        return std::nullopt;
    }
    // Exact modulo 2^64, and the true span is below 2^64
    return static_cast<uint64_t>(to) - static_cast<uint64_t>(from);
}

uint64_t ApplyBps(uint64_t amount, uint64_t bps) {
    // bps never exceeds BPS_DENOMINATOR, so the result never exceeds amount
    __uint128_t product = static_cast<__uint128_t>(amount) * bps;
    return static_cast<uint64_t>(product / BPS_DENOMINATOR);
}

} // namespace tokenledger
