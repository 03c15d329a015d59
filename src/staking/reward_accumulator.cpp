// TOKENLEDGER - Staking Reward Accumulator Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/staking/reward_accumulator.h"
#include "tokenledger/core/math.h"

#include <sstream>

namespace tokenledger {
namespace staking {

// ============================================================================
// StakerInfo
// ============================================================================

std::string StakerInfo::ToString() const {
    std::ostringstream ss;
    ss << "StakerInfo(staked=" << stakedAmount
       << ", tier=" << tierIndex
       << ", accumulated=" << accumulatedRewards
       << ", lastStake=" << lastStakeTimestamp
       << ", lastClaim=" << lastClaimTimestamp
       << ", claimed=" << totalClaimed << ")";
    return ss.str();
}

// ============================================================================
// RewardAccumulator
// ============================================================================

uint32_t RewardAccumulator::ClassifyTier(Amount staked) const {
    if (staked == 0) {
        return 0;
    }
    return static_cast<uint32_t>(tiers_.TierFor(staked));
}

Status RewardAccumulator::ComputeIncrement(const StakerInfo& info, Timestamp now,
                                           Amount* increment) const {
    *increment = 0;

    if (!info.IsStaking()) {
        return Status::Ok();
    }

    // A clock behind the window start accrues nothing
    auto elapsed = Elapsed(info.lastClaimTimestamp, now);
    if (!elapsed || *elapsed == 0) {
        return Status::Ok();
    }

    auto base = MulMulDiv(info.stakedAmount, params_.rewardRatePerSecondPerUnit,
                          *elapsed, REWARD_PRECISION);
    if (!base) {
        return Status::ArithmeticOverflow("base reward exceeds 64 bits");
    }

    auto reward = MulDiv(*base, tiers_.MultiplierFor(info.tierIndex), BPS_DENOMINATOR);
    if (!reward) {
        return Status::ArithmeticOverflow("multiplied reward exceeds 64 bits");
    }

    *increment = *reward;
    return Status::Ok();
}

Status RewardAccumulator::Settle(StakerInfo& info, Timestamp now) const {
    if (!info.IsStaking()) {
        return Status::Ok();
    }

    Amount increment = 0;
    Status status = ComputeIncrement(info, now, &increment);
    if (!status.ok()) {
        return status;
    }

    auto total = CheckedAdd(info.accumulatedRewards, increment);
    if (!total) {
        return Status::ArithmeticOverflow("accumulated rewards exceed 64 bits");
    }

    info.accumulatedRewards = *total;
    if (now > info.lastClaimTimestamp) {
        info.lastClaimTimestamp = now;
    }
    return Status::Ok();
}

Status RewardAccumulator::Stake(StakerInfo& info, Amount amount, Timestamp now) const {
    if (amount == 0) {
        return Status::InvalidAmount("stake amount is zero");
    }

    StakerInfo next = info;

    if (next.IsStaking()) {
        Status status = Settle(next, now);
        if (!status.ok()) {
            return status;
        }
    } else {
        // Opening a position starts the accrual window; nothing accrues
        // while the stake is zero
        next.lastClaimTimestamp = now;
    }

    auto staked = CheckedAdd(next.stakedAmount, amount);
    if (!staked) {
        return Status::ArithmeticOverflow("staked amount exceeds 64 bits");
    }

    next.stakedAmount = *staked;
    next.lastStakeTimestamp = now;
    next.tierIndex = ClassifyTier(next.stakedAmount);

    info = next;
    return Status::Ok();
}

Status RewardAccumulator::Unstake(StakerInfo& info, Amount amount, Timestamp now,
                                  UnstakeResult* result) const {
    if (amount == 0) {
        return Status::InvalidAmount("unstake amount is zero");
    }
    if (amount > info.stakedAmount) {
        return Status::InsufficientStake("unstake " + std::to_string(amount) +
                                         " exceeds stake " +
                                         std::to_string(info.stakedAmount));
    }

    StakerInfo next = info;
    Status status = Settle(next, now);
    if (!status.ok()) {
        return status;
    }

    UnstakeResult out;
    auto held = Elapsed(next.lastStakeTimestamp, now);
    if (!held || (params_.minStakingDuration > 0 &&
                  *held < static_cast<uint64_t>(params_.minStakingDuration))) {
        out.fee = ApplyBps(amount, params_.earlyUnstakeFeeBps);
    }
    out.transferOut = amount - out.fee;

    next.stakedAmount -= amount;
    next.tierIndex = ClassifyTier(next.stakedAmount);

    info = next;
    *result = out;
    return Status::Ok();
}

Status RewardAccumulator::Claim(StakerInfo& info, Timestamp now, Amount* claimed) const {
    StakerInfo next = info;
    Status status = Settle(next, now);
    if (!status.ok()) {
        return status;
    }

    if (next.accumulatedRewards == 0) {
        return Status::NothingToClaim();
    }

    auto lifetime = CheckedAdd(next.totalClaimed, next.accumulatedRewards);
    if (!lifetime) {
        return Status::ArithmeticOverflow("lifetime claims exceed 64 bits");
    }

    *claimed = next.accumulatedRewards;
    next.totalClaimed = *lifetime;
    next.accumulatedRewards = 0;
    if (now > next.lastClaimTimestamp) {
        next.lastClaimTimestamp = now;
    }

    info = next;
    return Status::Ok();
}

Status RewardAccumulator::PendingRewards(const StakerInfo& info, Timestamp now,
                                         Amount* pending) const {
    Amount increment = 0;
    Status status = ComputeIncrement(info, now, &increment);
    if (!status.ok()) {
        return status;
    }

    auto total = CheckedAdd(info.accumulatedRewards, increment);
    if (!total) {
        return Status::ArithmeticOverflow("pending rewards exceed 64 bits");
    }

    *pending = *total;
    return Status::Ok();
}

} // namespace staking
} // namespace tokenledger
