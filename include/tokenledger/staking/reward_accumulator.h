// TOKENLEDGER - Staking Reward Accumulator
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Per-account accrual of time-weighted, tier-multiplied staking rewards.
//
// Every mutation settles pending rewards first, so rewards accrue against
// the old stake and tier up to the moment of change and the new stake and
// tier only apply going forward:
//
//   base   = floor(staked * rate * elapsed / 1e18)
//   reward = floor(base * multiplierBps / 10000)

#ifndef TOKENLEDGER_STAKING_REWARD_ACCUMULATOR_H
#define TOKENLEDGER_STAKING_REWARD_ACCUMULATOR_H

#include "tokenledger/core/serialize.h"
#include "tokenledger/core/status.h"
#include "tokenledger/core/types.h"
#include "tokenledger/staking/tier_table.h"

#include <cstdint>
#include <string>

namespace tokenledger {
namespace staking {

// ============================================================================
// Staking Constants
// ============================================================================

/// Upper bound on the early-unstake fee (25%)
constexpr uint64_t MAX_EARLY_UNSTAKE_FEE_BPS = 2500;

/// Default early-unstake fee (5%)
constexpr uint64_t DEFAULT_EARLY_UNSTAKE_FEE_BPS = 500;

/// Default minimum staking duration (7 days)
constexpr Duration DEFAULT_MIN_STAKING_DURATION = 7 * SECONDS_PER_DAY;

/// Default reward rate per second per staked unit, scaled by 1e18
constexpr uint64_t DEFAULT_REWARD_RATE = 1000000000ULL;  // ~3.15% per year

// ============================================================================
// Staking Parameters
// ============================================================================

/**
 * Admin-mutable parameters read by every accrual.
 */
struct StakingParams {
    /// Reward per second per staked unit, scaled by REWARD_PRECISION
    uint64_t rewardRatePerSecondPerUnit{DEFAULT_REWARD_RATE};

    /// Stakes younger than this pay the early-unstake fee
    Duration minStakingDuration{DEFAULT_MIN_STAKING_DURATION};

    /// Early-unstake fee in basis points
    uint64_t earlyUnstakeFeeBps{DEFAULT_EARLY_UNSTAKE_FEE_BPS};
};

// ============================================================================
// Staker Info
// ============================================================================

/**
 * Staking position of one account. Created on first stake and never
 * deleted; a fully unstaked account keeps its record at zero.
 */
struct StakerInfo {
    /// Principal currently staked
    Amount stakedAmount{0};

    /// Time of the most recent stake or top-up
    Timestamp lastStakeTimestamp{0};

    /// Settled but unclaimed rewards
    Amount accumulatedRewards{0};

    /// Start of the current accrual window
    Timestamp lastClaimTimestamp{0};

    /// Tier resolved from stakedAmount
    uint32_t tierIndex{0};

    /// Lifetime claimed rewards
    Amount totalClaimed{0};

    bool IsStaking() const { return stakedAmount > 0; }

    bool operator==(const StakerInfo& other) const {
        return stakedAmount == other.stakedAmount &&
               lastStakeTimestamp == other.lastStakeTimestamp &&
               accumulatedRewards == other.accumulatedRewards &&
               lastClaimTimestamp == other.lastClaimTimestamp &&
               tierIndex == other.tierIndex &&
               totalClaimed == other.totalClaimed;
    }

    std::string ToString() const;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, stakedAmount);
        Serialize(s, lastStakeTimestamp);
        Serialize(s, accumulatedRewards);
        Serialize(s, lastClaimTimestamp);
        Serialize(s, tierIndex);
        Serialize(s, totalClaimed);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, stakedAmount);
        Unserialize(s, lastStakeTimestamp);
        Unserialize(s, accumulatedRewards);
        Unserialize(s, lastClaimTimestamp);
        Unserialize(s, tierIndex);
        Unserialize(s, totalClaimed);
    }
};

/// Outcome of an unstake
struct UnstakeResult {
    /// Principal returned to the staker
    Amount transferOut{0};

    /// Early-unstake fee retained by the staking pool
    Amount fee{0};
};

// ============================================================================
// Reward Accumulator
// ============================================================================

/**
 * Applies staking operations to a StakerInfo. Holds references to the
 * live parameters and tier table; neither is copied.
 *
 * Every operation either succeeds and updates the record, or fails and
 * leaves it untouched.
 */
class RewardAccumulator {
public:
    RewardAccumulator(const StakingParams& params, const TierTable& tiers)
        : params_(params), tiers_(tiers) {}

    /// Reward accrued since lastClaimTimestamp, not yet added to the record
    Status ComputeIncrement(const StakerInfo& info, Timestamp now, Amount* increment) const;

    /// Move accrued rewards into accumulatedRewards and restart the window.
    /// No-op while nothing is staked. Calling twice with the same now adds
    /// nothing the second time.
    Status Settle(StakerInfo& info, Timestamp now) const;

    /// Add principal. InvalidAmount for zero.
    Status Stake(StakerInfo& info, Amount amount, Timestamp now) const;

    /// Remove principal, charging the early-unstake fee when the stake is
    /// younger than minStakingDuration. InsufficientStake if amount exceeds
    /// the stake.
    Status Unstake(StakerInfo& info, Amount amount, Timestamp now, UnstakeResult* result) const;

    /// Settle, then pay out and zero accumulatedRewards. NothingToClaim if
    /// the settled total is zero.
    Status Claim(StakerInfo& info, Timestamp now, Amount* claimed) const;

    /// Read-only projection of accumulatedRewards after a Settle at now
    Status PendingRewards(const StakerInfo& info, Timestamp now, Amount* pending) const;

    const StakingParams& GetParams() const { return params_; }
    const TierTable& GetTierTable() const { return tiers_; }

private:
    /// Tier for a stake; a zero stake has no membership and maps to 0
    uint32_t ClassifyTier(Amount staked) const;

    const StakingParams& params_;
    const TierTable& tiers_;
};

} // namespace staking
} // namespace tokenledger

#endif // TOKENLEDGER_STAKING_REWARD_ACCUMULATOR_H
