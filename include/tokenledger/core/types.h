// TOKENLEDGER - Core Types Header
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Amounts, timestamps, addresses and the reserved ledger accounts.

#ifndef TOKENLEDGER_CORE_TYPES_H
#define TOKENLEDGER_CORE_TYPES_H

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

namespace tokenledger {

using Byte = uint8_t;

/// Token quantity in base units
using Amount = uint64_t;

/// Caller-supplied Unix time in seconds
using Timestamp = int64_t;

/// Seconds
using Duration = int64_t;

constexpr Amount COIN = 100000000ULL;
constexpr Amount MAX_SUPPLY = 1000000000ULL * COIN;

/// 10000 basis points = 100%
constexpr uint64_t BPS_DENOMINATOR = 10000;

/// Fee distribution ratios are whole percents
constexpr uint64_t PERCENT_DENOMINATOR = 100;

/// Fixed-point scale of the per-second reward rate (1e18 = 1 token per token-second)
constexpr uint64_t REWARD_PRECISION = 1000000000000000000ULL;

constexpr Duration SECONDS_PER_DAY = 86400;

inline bool SupplyRange(Amount value) {
    return value <= MAX_SUPPLY;
}

// ============================================================================
// Fixed-Size Hashes
// ============================================================================

/**
 * BITS/8 raw bytes. Hex forms list the last byte first, so FromHex("0x..02")
 * sets byte 0 to 0x02. Ordering compares from the last byte down.
 */
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    BaseHash() noexcept { bytes_.fill(0); }

    explicit BaseHash(const std::array<Byte, SIZE>& bytes) noexcept : bytes_(bytes) {}

    /// Copies min(len, SIZE) bytes and zero-fills the rest
    BaseHash(const Byte* src, size_t len) noexcept {
        bytes_.fill(0);
        if (src) {
            std::memcpy(bytes_.data(), src, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (Byte b : bytes_) {
            if (b != 0) {
                return false;
            }
        }
        return true;
    }

    void SetNull() noexcept { bytes_.fill(0); }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t i) { return bytes_[i]; }
    const Byte& operator[](size_t i) const { return bytes_[i]; }

    Byte* data() noexcept { return bytes_.data(); }
    const Byte* data() const noexcept { return bytes_.data(); }

    const Byte* begin() const noexcept { return bytes_.data(); }
    const Byte* end() const noexcept { return bytes_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const BaseHash& other) const noexcept { return bytes_ != other.bytes_; }

    bool operator<(const BaseHash& other) const noexcept {
        return std::lexicographical_compare(bytes_.rbegin(), bytes_.rend(),
                                            other.bytes_.rbegin(), other.bytes_.rend());
    }

    std::string ToHex() const;

    /// Accepts an optional 0x prefix; throws std::invalid_argument otherwise
    static BaseHash FromHex(const std::string& hex);

private:
    std::array<Byte, SIZE> bytes_;
};

using Hash256 = BaseHash<256>;

/// Account key. The null address is the mint and burn sentinel.
using Address = BaseHash<160>;

// ============================================================================
// Reserved Internal Accounts
// ============================================================================

/// Holds staked principal and retained early-unstake fees
const Address& StakingPoolAddress();

/// Holds the rewards share of transfer fees; pays reward claims
const Address& RewardPoolAddress();

/// Holds tokens locked in vesting schedules
const Address& VestingEscrowAddress();

/// True for the null address and the reserved internal accounts
bool IsInternalAddress(const Address& addr);

} // namespace tokenledger

#endif // TOKENLEDGER_CORE_TYPES_H
