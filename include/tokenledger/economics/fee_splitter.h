// TOKENLEDGER - Transfer Fee Splitter
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Computes the fee charged on a gross transfer amount and splits it into
// burn, rewards and development buckets. All arithmetic is integer and
// floored; the rounding remainder is folded into the burn bucket so the
// parts always add back up to the gross amount.

#ifndef TOKENLEDGER_ECONOMICS_FEE_SPLITTER_H
#define TOKENLEDGER_ECONOMICS_FEE_SPLITTER_H

#include "tokenledger/core/status.h"
#include "tokenledger/core/types.h"

#include <cstdint>
#include <string>

namespace tokenledger {
namespace economics {

// ============================================================================
// Fee Constants
// ============================================================================

/// Upper bound on the transfer fee (10%)
constexpr uint64_t MAX_TRANSFER_FEE_BPS = 1000;

/// Default transfer fee (1%)
constexpr uint64_t DEFAULT_TRANSFER_FEE_BPS = 100;

/// Default distribution: 50% burn, 25% rewards, 25% development
constexpr uint32_t DEFAULT_BURN_RATIO = 50;
constexpr uint32_t DEFAULT_REWARDS_RATIO = 25;
constexpr uint32_t DEFAULT_DEV_RATIO = 25;

// ============================================================================
// Fee Distribution
// ============================================================================

/**
 * Percentages of the collected fee routed to each bucket.
 * Valid only when the three ratios sum to exactly 100.
 */
struct FeeDistribution {
    uint32_t burnRatio{DEFAULT_BURN_RATIO};
    uint32_t rewardsRatio{DEFAULT_REWARDS_RATIO};
    uint32_t devRatio{DEFAULT_DEV_RATIO};

    bool IsValid() const;

    bool operator==(const FeeDistribution& other) const {
        return burnRatio == other.burnRatio &&
               rewardsRatio == other.rewardsRatio &&
               devRatio == other.devRatio;
    }

    std::string ToString() const;
};

// ============================================================================
// Fee Split
// ============================================================================

/// Breakdown of one gross amount
struct FeeSplit {
    /// Amount credited to the recipient
    Amount net{0};

    /// Total fee withheld (burn + rewards + dev)
    Amount fee{0};

    /// Burned; includes the rounding dust
    Amount burn{0};

    /// Routed to the reward pool
    Amount rewards{0};

    /// Routed to the development wallet
    Amount dev{0};

    /// Remainder of the three floored shares, already included in burn
    Amount dust{0};
};

// ============================================================================
// Fee Splitter
// ============================================================================

/**
 * Stateless apart from its configuration. Configuration is validated when
 * it is set, so Apply never fails.
 */
class FeeSplitter {
public:
    FeeSplitter() = default;
    FeeSplitter(uint64_t feeBps, const FeeDistribution& distribution);

    /// Set the fee rate. InvalidAmount above MAX_TRANSFER_FEE_BPS.
    Status SetFeeBps(uint64_t feeBps);

    /// Set the distribution. InvalidRatio unless the ratios sum to 100.
    Status SetDistribution(const FeeDistribution& distribution);

    uint64_t GetFeeBps() const { return feeBps_; }
    const FeeDistribution& GetDistribution() const { return distribution_; }

    /// Compute the split of a gross amount; exempt transfers carry no fee
    FeeSplit Apply(Amount gross, bool exempt) const;

    /// Fee alone, floor(gross * feeBps / 10000)
    Amount ComputeFee(Amount gross) const;

private:
    uint64_t feeBps_{DEFAULT_TRANSFER_FEE_BPS};
    FeeDistribution distribution_;
};

} // namespace economics
} // namespace tokenledger

#endif // TOKENLEDGER_ECONOMICS_FEE_SPLITTER_H
