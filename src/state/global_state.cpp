// TOKENLEDGER - Global Ledger State Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/state/global_state.h"

#include <sstream>

namespace tokenledger {
namespace state {

std::string GlobalState::ToString() const {
    std::ostringstream ss;
    ss << "GlobalState(supply=" << totalSupply
       << ", burned=" << totalBurned
       << ", staked=" << totalStaked
       << ", vesting=" << totalVestingLocked
       << ", earlyFees=" << totalEarlyUnstakeFees
       << ", claimed=" << totalRewardsClaimed
       << ", feeBps=" << transferFeeBps
       << ", " << feeDistribution.ToString()
       << ", rate=" << staking.rewardRatePerSecondPerUnit
       << ", minDuration=" << staking.minStakingDuration
       << ", earlyFeeBps=" << staking.earlyUnstakeFeeBps
       << ", time=" << lastTimestamp << ")";
    return ss.str();
}

} // namespace state
} // namespace tokenledger
