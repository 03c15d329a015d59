// TOKENLEDGER - Transfer Fee Splitter Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/economics/fee_splitter.h"
#include "tokenledger/core/math.h"

#include <sstream>

namespace tokenledger {
namespace economics {

// ============================================================================
// FeeDistribution
// ============================================================================

bool FeeDistribution::IsValid() const {
    uint64_t sum = static_cast<uint64_t>(burnRatio) + rewardsRatio + devRatio;
    return sum == PERCENT_DENOMINATOR;
}

std::string FeeDistribution::ToString() const {
    std::ostringstream ss;
    ss << "FeeDistribution(burn=" << burnRatio
       << "%, rewards=" << rewardsRatio
       << "%, dev=" << devRatio << "%)";
    return ss.str();
}

// ============================================================================
// FeeSplitter
// ============================================================================

FeeSplitter::FeeSplitter(uint64_t feeBps, const FeeDistribution& distribution)
    : feeBps_(feeBps), distribution_(distribution) {}

Status FeeSplitter::SetFeeBps(uint64_t feeBps) {
    if (feeBps > MAX_TRANSFER_FEE_BPS) {
        return Status::InvalidAmount("transfer fee " + std::to_string(feeBps) +
                                     " bps exceeds maximum " +
                                     std::to_string(MAX_TRANSFER_FEE_BPS));
    }
    feeBps_ = feeBps;
    return Status::Ok();
}

Status FeeSplitter::SetDistribution(const FeeDistribution& distribution) {
    if (!distribution.IsValid()) {
        return Status::InvalidRatio(distribution.ToString() + " does not sum to 100");
    }
    distribution_ = distribution;
    return Status::Ok();
}

Amount FeeSplitter::ComputeFee(Amount gross) const {
    return ApplyBps(gross, feeBps_);
}

FeeSplit FeeSplitter::Apply(Amount gross, bool exempt) const {
    FeeSplit split;

    if (exempt || feeBps_ == 0) {
        split.net = gross;
        return split;
    }

    split.fee = ComputeFee(gross);
    split.net = gross - split.fee;

    // Each ratio is at most 100, so every share fits in 64 bits
    split.burn = *MulDiv(split.fee, distribution_.burnRatio, PERCENT_DENOMINATOR);
    split.rewards = *MulDiv(split.fee, distribution_.rewardsRatio, PERCENT_DENOMINATOR);
    split.dev = *MulDiv(split.fee, distribution_.devRatio, PERCENT_DENOMINATOR);

    split.dust = split.fee - (split.burn + split.rewards + split.dev);
    split.burn += split.dust;

    return split;
}

} // namespace economics
} // namespace tokenledger
