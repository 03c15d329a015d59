// TOKENLEDGER - Integer Fraction Arithmetic
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Exact floor-division helpers for amount * rate products that exceed
// 64 bits. All results are floored; std::nullopt signals overflow of the
// 64-bit result or a zero divisor.

#ifndef TOKENLEDGER_CORE_MATH_H
#define TOKENLEDGER_CORE_MATH_H

#include <cstdint>
#include <optional>

namespace tokenledger {

/// floor(a * b / d) with a 128-bit intermediate
std::optional<uint64_t> MulDiv(uint64_t a, uint64_t b, uint64_t d);

/// floor(a * b * c / d) computed exactly
std::optional<uint64_t> MulMulDiv(uint64_t a, uint64_t b, uint64_t c, uint64_t d);

/// Checked addition
std::optional<uint64_t> CheckedAdd(uint64_t a, uint64_t b);

/// to - from as an unsigned span; empty when to precedes from
std::optional<uint64_t> Elapsed(int64_t from, int64_t to);

/// Apply basis points: floor(amount * bps / 10000)
uint64_t ApplyBps(uint64_t amount, uint64_t bps);

} // namespace tokenledger

#endif // TOKENLEDGER_CORE_MATH_H
