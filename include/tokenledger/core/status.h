// TOKENLEDGER - Operation Status
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Result of every ledger operation. A non-OK status means the operation
// had no effect on state.

#ifndef TOKENLEDGER_CORE_STATUS_H
#define TOKENLEDGER_CORE_STATUS_H

#include <string>

namespace tokenledger {

/**
 * Status returned by ledger, staking, vesting and configuration operations.
 */
class Status {
public:
    enum Code {
        OK = 0,

        // Input errors
        INVALID_AMOUNT,
        INVALID_ADDRESS,
        INVALID_TIMESTAMP,
        INVALID_RATIO,
        INVALID_TIER,

        // Balance errors
        INSUFFICIENT_BALANCE,
        INSUFFICIENT_ALLOWANCE,
        INSUFFICIENT_STAKE,
        MAX_SUPPLY_EXCEEDED,
        ARITHMETIC_OVERFLOW,

        // Tier errors
        TIER_ORDERING_VIOLATION,

        // Vesting errors
        SCHEDULE_EXISTS,
        NO_SCHEDULE,
        ALREADY_REVOKED,
        NOT_REVOCABLE,
        NOTHING_RELEASABLE,

        // Reward errors
        NOTHING_TO_CLAIM,

        // Gate errors
        PAUSED,
        UNAUTHORIZED,
        REENTRANT_CALL,

        // Storage errors
        STORAGE_ERROR,
    };

private:
    Code code_;
    std::string message_;

public:
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status InvalidAmount(const std::string& msg = "") { return Status(INVALID_AMOUNT, msg); }
    static Status InvalidAddress(const std::string& msg = "") { return Status(INVALID_ADDRESS, msg); }
    static Status InvalidTimestamp(const std::string& msg = "") { return Status(INVALID_TIMESTAMP, msg); }
    static Status InvalidRatio(const std::string& msg = "") { return Status(INVALID_RATIO, msg); }
    static Status InvalidTier(const std::string& msg = "") { return Status(INVALID_TIER, msg); }
    static Status InsufficientBalance(const std::string& msg = "") { return Status(INSUFFICIENT_BALANCE, msg); }
    static Status InsufficientAllowance(const std::string& msg = "") { return Status(INSUFFICIENT_ALLOWANCE, msg); }
    static Status InsufficientStake(const std::string& msg = "") { return Status(INSUFFICIENT_STAKE, msg); }
    static Status MaxSupplyExceeded(const std::string& msg = "") { return Status(MAX_SUPPLY_EXCEEDED, msg); }
    static Status ArithmeticOverflow(const std::string& msg = "") { return Status(ARITHMETIC_OVERFLOW, msg); }
    static Status TierOrderingViolation(const std::string& msg = "") { return Status(TIER_ORDERING_VIOLATION, msg); }
    static Status ScheduleExists(const std::string& msg = "") { return Status(SCHEDULE_EXISTS, msg); }
    static Status NoSchedule(const std::string& msg = "") { return Status(NO_SCHEDULE, msg); }
    static Status AlreadyRevoked(const std::string& msg = "") { return Status(ALREADY_REVOKED, msg); }
    static Status NotRevocable(const std::string& msg = "") { return Status(NOT_REVOCABLE, msg); }
    static Status NothingReleasable(const std::string& msg = "") { return Status(NOTHING_RELEASABLE, msg); }
    static Status NothingToClaim(const std::string& msg = "") { return Status(NOTHING_TO_CLAIM, msg); }
    static Status Paused(const std::string& msg = "") { return Status(PAUSED, msg); }
    static Status Unauthorized(const std::string& msg = "") { return Status(UNAUTHORIZED, msg); }
    static Status ReentrantCall(const std::string& msg = "") { return Status(REENTRANT_CALL, msg); }
    static Status StorageError(const std::string& msg = "") { return Status(STORAGE_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    bool operator==(Code code) const { return code_ == code; }
    bool operator!=(Code code) const { return code_ != code; }

    std::string ToString() const;
};

/// Convert status code to its name
const char* StatusCodeToString(Status::Code code);

} // namespace tokenledger

#endif // TOKENLEDGER_CORE_STATUS_H
