// TOKENLEDGER - Vesting Schedules
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Per-beneficiary cliff plus linear release. Nothing is releasable before
// startTime + cliffDuration; the whole amount is releasable from
// startTime + vestingDuration; in between the vested amount grows linearly
// from startTime.

#ifndef TOKENLEDGER_VESTING_VESTING_H
#define TOKENLEDGER_VESTING_VESTING_H

#include "tokenledger/core/serialize.h"
#include "tokenledger/core/status.h"
#include "tokenledger/core/types.h"

#include <string>

namespace tokenledger {
namespace vesting {

// ============================================================================
// Vesting Schedule
// ============================================================================

/**
 * One vesting schedule. All fields are fixed at creation except
 * amountReleased and revoked. A schedule with totalAmount == 0 does not
 * exist.
 */
struct VestingSchedule {
    /// Account that funded the schedule; receives the remainder on revoke
    Address issuer;

    Amount totalAmount{0};

    /// Monotonically non-decreasing, never above totalAmount
    Amount amountReleased{0};

    Timestamp startTime{0};
    Duration cliffDuration{0};
    Duration vestingDuration{0};

    bool revocable{false};
    bool revoked{false};

    bool Exists() const { return totalAmount > 0; }

    /// Tokens still held in escrow for this schedule
    Amount Locked() const { return totalAmount - amountReleased; }

    /// Released in full, either by vesting out or by revocation
    bool IsSettled() const { return amountReleased == totalAmount; }

    bool operator==(const VestingSchedule& other) const {
        return issuer == other.issuer &&
               totalAmount == other.totalAmount &&
               amountReleased == other.amountReleased &&
               startTime == other.startTime &&
               cliffDuration == other.cliffDuration &&
               vestingDuration == other.vestingDuration &&
               revocable == other.revocable &&
               revoked == other.revoked;
    }

    std::string ToString() const;

    template<typename Stream>
    void SerializeTo(Stream& s) const {
        Serialize(s, issuer);
        Serialize(s, totalAmount);
        Serialize(s, amountReleased);
        Serialize(s, startTime);
        Serialize(s, cliffDuration);
        Serialize(s, vestingDuration);
        Serialize(s, revocable);
        Serialize(s, revoked);
    }

    template<typename Stream>
    void UnserializeFrom(Stream& s) {
        Unserialize(s, issuer);
        Unserialize(s, totalAmount);
        Unserialize(s, amountReleased);
        Unserialize(s, startTime);
        Unserialize(s, cliffDuration);
        Unserialize(s, vestingDuration);
        Unserialize(s, revocable);
        Unserialize(s, revoked);
    }
};

/// Outcome of a revocation
struct RevokeResult {
    /// Vested amount paid to the beneficiary as part of the revocation
    Amount released{0};

    /// Unvested remainder returned to the issuer
    Amount returned{0};
};

// ============================================================================
// Vesting Operations
// ============================================================================

/// Amount vested at now, regardless of what was already released
Amount VestedAmount(const VestingSchedule& schedule, Timestamp now);

/// Amount that Release would pay at now. Zero for a missing or revoked
/// schedule and before the cliff.
Amount Releasable(const VestingSchedule& schedule, Timestamp now);

/// Advance amountReleased by the releasable amount.
/// NoSchedule if the schedule does not exist; NothingReleasable if zero.
Status Release(VestingSchedule& schedule, Timestamp now, Amount* released);

/// Release whatever is vested, then mark revoked and hand back the rest.
/// On success amountReleased == totalAmount.
Status Revoke(VestingSchedule& schedule, Timestamp now, RevokeResult* result);

/// Validate the parameters of a schedule about to be created
Status CheckNewSchedule(const Address& beneficiary, const VestingSchedule& schedule);

} // namespace vesting
} // namespace tokenledger

#endif // TOKENLEDGER_VESTING_VESTING_H
