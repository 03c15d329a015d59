// TOKENLEDGER - Vesting Schedules Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/vesting/vesting.h"
#include "tokenledger/core/math.h"

#include <sstream>

namespace tokenledger {
namespace vesting {

std::string VestingSchedule::ToString() const {
    std::ostringstream ss;
    ss << "VestingSchedule(total=" << totalAmount
       << ", released=" << amountReleased
       << ", start=" << startTime
       << ", cliff=" << cliffDuration
       << ", duration=" << vestingDuration
       << ", revocable=" << (revocable ? "yes" : "no")
       << ", revoked=" << (revoked ? "yes" : "no") << ")";
    return ss.str();
}

Amount VestedAmount(const VestingSchedule& schedule, Timestamp now) {
    if (!schedule.Exists() || schedule.vestingDuration <= 0) {
        return 0;
    }
    auto elapsed = Elapsed(schedule.startTime, now);
    if (!elapsed || (schedule.cliffDuration > 0 &&
                     *elapsed < static_cast<uint64_t>(schedule.cliffDuration))) {
        return 0;
    }
    uint64_t duration = static_cast<uint64_t>(schedule.vestingDuration);
    if (*elapsed >= duration) {
        return schedule.totalAmount;
    }

    // elapsed < vestingDuration, so the quotient is below totalAmount
    return *MulDiv(schedule.totalAmount, *elapsed, duration);
}

Amount Releasable(const VestingSchedule& schedule, Timestamp now) {
    if (!schedule.Exists() || schedule.revoked) {
        return 0;
    }

    Amount vested = VestedAmount(schedule, now);
    if (vested <= schedule.amountReleased) {
        return 0;
    }
    return vested - schedule.amountReleased;
}

Status Release(VestingSchedule& schedule, Timestamp now, Amount* released) {
    if (!schedule.Exists()) {
        return Status::NoSchedule();
    }

    Amount amount = Releasable(schedule, now);
    if (amount == 0) {
        return Status::NothingReleasable();
    }

    schedule.amountReleased += amount;
    *released = amount;
    return Status::Ok();
}

Status Revoke(VestingSchedule& schedule, Timestamp now, RevokeResult* result) {
    if (!schedule.Exists()) {
        return Status::NoSchedule();
    }
    if (!schedule.revocable) {
        return Status::NotRevocable();
    }
    if (schedule.revoked) {
        return Status::AlreadyRevoked();
    }

    RevokeResult out;
    out.released = Releasable(schedule, now);
    schedule.amountReleased += out.released;

    out.returned = schedule.totalAmount - schedule.amountReleased;
    schedule.amountReleased = schedule.totalAmount;
    schedule.revoked = true;

    *result = out;
    return Status::Ok();
}

Status CheckNewSchedule(const Address& beneficiary, const VestingSchedule& schedule) {
    if (IsInternalAddress(beneficiary)) {
        return Status::InvalidAddress("beneficiary must be an external account");
    }
    if (schedule.totalAmount == 0) {
        return Status::InvalidAmount("vesting amount is zero");
    }
    if (schedule.vestingDuration <= 0) {
        return Status::InvalidAmount("vesting duration must be positive");
    }
    if (schedule.cliffDuration < 0 || schedule.cliffDuration > schedule.vestingDuration) {
        return Status::InvalidAmount("cliff must lie within the vesting duration");
    }
    if (schedule.amountReleased != 0 || schedule.revoked) {
        return Status::InvalidAmount("new schedule must start unreleased");
    }
    return Status::Ok();
}

} // namespace vesting
} // namespace tokenledger
