// TOKENLEDGER - Staking Tier Table
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Ordered list of stake thresholds. Each tier grants a reward multiplier
// and a set of named capability flags. Tier 0 is always the lowest; the
// minimum stakes are strictly increasing.

#ifndef TOKENLEDGER_STAKING_TIER_TABLE_H
#define TOKENLEDGER_STAKING_TIER_TABLE_H

#include "tokenledger/core/serialize.h"
#include "tokenledger/core/status.h"
#include "tokenledger/core/types.h"

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace tokenledger {
namespace staking {

/// Multiplier of 1.0x in basis points; also the floor for every tier
constexpr uint64_t BASE_MULTIPLIER_BPS = BPS_DENOMINATOR;

// ============================================================================
// Tier
// ============================================================================

/**
 * A staking bracket.
 */
struct Tier {
    /// Display name, never empty
    std::string name;

    /// Smallest stake that qualifies for this tier
    Amount minimumStake{0};

    /// Reward multiplier in basis points (10000 = 1.0x)
    uint64_t rewardMultiplierBps{BASE_MULTIPLIER_BPS};

    /// Named feature flags unlocked by this tier
    std::set<std::string> capabilities;

    Tier() = default;
    Tier(std::string nameIn, Amount minimum, uint64_t multiplierBps,
         std::set<std::string> caps = {})
        : name(std::move(nameIn))
        , minimumStake(minimum)
        , rewardMultiplierBps(multiplierBps)
        , capabilities(std::move(caps)) {}

    bool HasCapability(const std::string& flag) const {
        return capabilities.count(flag) > 0;
    }

    bool operator==(const Tier& other) const {
        return name == other.name &&
               minimumStake == other.minimumStake &&
               rewardMultiplierBps == other.rewardMultiplierBps &&
               capabilities == other.capabilities;
    }

    std::string ToString() const;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, name);
        Serialize(s, minimumStake);
        Serialize(s, rewardMultiplierBps);
        Serialize(s, capabilities);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, name);
        Unserialize(s, minimumStake);
        Unserialize(s, rewardMultiplierBps);
        Unserialize(s, capabilities);
    }
};

// ============================================================================
// Tier Table
// ============================================================================

class TierTable {
public:
    TierTable() = default;

    /// Append a tier above the current highest.
    /// InvalidTier on an empty name or a multiplier below 1.0x;
    /// TierOrderingViolation unless the minimum exceeds the current highest.
    Status AddTier(const Tier& tier);

    /// Replace the tier at index, keeping the minimums strictly increasing.
    /// InvalidTier on a bad index, name or multiplier;
    /// TierOrderingViolation if the minimum leaves its neighbours' interval.
    Status UpdateTier(size_t index, const Tier& tier);

    /// Resolve a stake amount to a tier index. Amounts below tier 0's
    /// minimum, and every amount when the table is empty, map to 0.
    size_t TierFor(Amount stakedAmount) const;

    /// Multiplier of a tier; 1.0x for an index the table does not hold
    uint64_t MultiplierFor(size_t index) const;

    /// Whether a tier grants a capability; false for an unknown index
    bool HasCapability(size_t index, const std::string& flag) const;

    /// Tier at index, or nullptr
    const Tier* GetTier(size_t index) const;

    const std::vector<Tier>& GetTiers() const { return tiers_; }
    size_t Size() const { return tiers_.size(); }
    bool Empty() const { return tiers_.empty(); }

    /// Check that the stored tiers satisfy every ordering rule
    bool IsConsistent() const;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, tiers_);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, tiers_);
    }

private:
    static Status ValidateTier(const Tier& tier);

    std::vector<Tier> tiers_;
};

} // namespace staking
} // namespace tokenledger

#endif // TOKENLEDGER_STAKING_TIER_TABLE_H
