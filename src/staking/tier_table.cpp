// TOKENLEDGER - Staking Tier Table Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/staking/tier_table.h"

#include <sstream>

namespace tokenledger {
namespace staking {

// ============================================================================
// Tier
// ============================================================================

std::string Tier::ToString() const {
    std::ostringstream ss;
    ss << "Tier(" << name
       << ", min=" << minimumStake
       << ", multiplier=" << rewardMultiplierBps << "bps"
       << ", caps=" << capabilities.size() << ")";
    return ss.str();
}

// ============================================================================
// TierTable
// ============================================================================

Status TierTable::ValidateTier(const Tier& tier) {
    if (tier.name.empty()) {
        return Status::InvalidTier("tier name is empty");
    }
    if (tier.rewardMultiplierBps < BASE_MULTIPLIER_BPS) {
        return Status::InvalidTier("multiplier " + std::to_string(tier.rewardMultiplierBps) +
                                   " bps is below 1.0x");
    }
    return Status::Ok();
}

Status TierTable::AddTier(const Tier& tier) {
    Status status = ValidateTier(tier);
    if (!status.ok()) {
        return status;
    }

    if (!tiers_.empty() && tier.minimumStake <= tiers_.back().minimumStake) {
        return Status::TierOrderingViolation(
            "minimum " + std::to_string(tier.minimumStake) +
            " does not exceed highest tier minimum " +
            std::to_string(tiers_.back().minimumStake));
    }

    tiers_.push_back(tier);
    return Status::Ok();
}

Status TierTable::UpdateTier(size_t index, const Tier& tier) {
    if (index >= tiers_.size()) {
        return Status::InvalidTier("no tier at index " + std::to_string(index));
    }

    Status status = ValidateTier(tier);
    if (!status.ok()) {
        return status;
    }

    if (index > 0 && tier.minimumStake <= tiers_[index - 1].minimumStake) {
        return Status::TierOrderingViolation("minimum must exceed the tier below");
    }
    if (index + 1 < tiers_.size() && tier.minimumStake >= tiers_[index + 1].minimumStake) {
        return Status::TierOrderingViolation("minimum must stay below the tier above");
    }

    tiers_[index] = tier;
    return Status::Ok();
}

size_t TierTable::TierFor(Amount stakedAmount) const {
    for (size_t i = tiers_.size(); i > 0; --i) {
        if (tiers_[i - 1].minimumStake <= stakedAmount) {
            return i - 1;
        }
    }
    return 0;
}

uint64_t TierTable::MultiplierFor(size_t index) const {
    if (index >= tiers_.size()) {
        return BASE_MULTIPLIER_BPS;
    }
    return tiers_[index].rewardMultiplierBps;
}

bool TierTable::HasCapability(size_t index, const std::string& flag) const {
    if (index >= tiers_.size()) {
        return false;
    }
    return tiers_[index].HasCapability(flag);
}

const Tier* TierTable::GetTier(size_t index) const {
    if (index >= tiers_.size()) {
        return nullptr;
    }
    return &tiers_[index];
}

bool TierTable::IsConsistent() const {
    for (size_t i = 0; i < tiers_.size(); ++i) {
        if (!ValidateTier(tiers_[i]).ok()) {
            return false;
        }
        if (i > 0 && tiers_[i].minimumStake <= tiers_[i - 1].minimumStake) {
            return false;
        }
    }
    return true;
}

} // namespace staking
} // namespace tokenledger
