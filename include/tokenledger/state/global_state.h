// TOKENLEDGER - Global Ledger State
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#ifndef TOKENLEDGER_STATE_GLOBAL_STATE_H
#define TOKENLEDGER_STATE_GLOBAL_STATE_H

#include "tokenledger/core/serialize.h"
#include "tokenledger/core/types.h"
#include "tokenledger/economics/fee_splitter.h"
#include "tokenledger/staking/reward_accumulator.h"

#include <string>

namespace tokenledger {
namespace state {

/**
 * Process-wide totals and admin-mutable parameters. Stored as a single
 * record and read by every operation.
 */
struct GlobalState {
    // Totals
    Amount totalSupply{0};
    Amount totalBurned{0};
    Amount totalStaked{0};
    Amount totalVestingLocked{0};
    Amount totalEarlyUnstakeFees{0};
    Amount totalRewardsClaimed{0};

    // Staking parameters
    staking::StakingParams staking;

    // Transfer fee parameters
    uint64_t transferFeeBps{economics::DEFAULT_TRANSFER_FEE_BPS};
    economics::FeeDistribution feeDistribution;
    Address devWallet;

    /// Latest caller-supplied time accepted by a mutation
    Timestamp lastTimestamp{0};

    std::string ToString() const;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, totalSupply);
        Serialize(s, totalBurned);
        Serialize(s, totalStaked);
        Serialize(s, totalVestingLocked);
        Serialize(s, totalEarlyUnstakeFees);
        Serialize(s, totalRewardsClaimed);
        Serialize(s, staking.rewardRatePerSecondPerUnit);
        Serialize(s, staking.minStakingDuration);
        Serialize(s, staking.earlyUnstakeFeeBps);
        Serialize(s, transferFeeBps);
        Serialize(s, feeDistribution.burnRatio);
        Serialize(s, feeDistribution.rewardsRatio);
        Serialize(s, feeDistribution.devRatio);
        Serialize(s, devWallet);
        Serialize(s, lastTimestamp);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, totalSupply);
        Unserialize(s, totalBurned);
        Unserialize(s, totalStaked);
        Unserialize(s, totalVestingLocked);
        Unserialize(s, totalEarlyUnstakeFees);
        Unserialize(s, totalRewardsClaimed);
        Unserialize(s, staking.rewardRatePerSecondPerUnit);
        Unserialize(s, staking.minStakingDuration);
        Unserialize(s, staking.earlyUnstakeFeeBps);
        Unserialize(s, transferFeeBps);
        Unserialize(s, feeDistribution.burnRatio);
        Unserialize(s, feeDistribution.rewardsRatio);
        Unserialize(s, feeDistribution.devRatio);
        Unserialize(s, devWallet);
        Unserialize(s, lastTimestamp);
    }
};

} // namespace state
} // namespace tokenledger

#endif // TOKENLEDGER_STATE_GLOBAL_STATE_H
