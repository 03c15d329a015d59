// TOKENLEDGER - Operation Status Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/core/status.h"

namespace tokenledger {

const char* StatusCodeToString(Status::Code code) {
    switch (code) {
        case Status::OK: return "OK";
        case Status::INVALID_AMOUNT: return "InvalidAmount";
        case Status::INVALID_ADDRESS: return "InvalidAddress";
        case Status::INVALID_TIMESTAMP: return "InvalidTimestamp";
        case Status::INVALID_RATIO: return "InvalidRatio";
        case Status::INVALID_TIER: return "InvalidTier";
        case Status::INSUFFICIENT_BALANCE: return "InsufficientBalance";
        case Status::INSUFFICIENT_ALLOWANCE: return "InsufficientAllowance";
        case Status::INSUFFICIENT_STAKE: return "InsufficientStake";
        case Status::MAX_SUPPLY_EXCEEDED: return "MaxSupplyExceeded";
        case Status::ARITHMETIC_OVERFLOW: return "ArithmeticOverflow";
        case Status::TIER_ORDERING_VIOLATION: return "TierOrderingViolation";
        case Status::SCHEDULE_EXISTS: return "ScheduleExists";
        case Status::NO_SCHEDULE: return "NoSchedule";
        case Status::ALREADY_REVOKED: return "AlreadyRevoked";
        case Status::NOT_REVOCABLE: return "NotRevocable";
        case Status::NOTHING_RELEASABLE: return "NothingReleasable";
        case Status::NOTHING_TO_CLAIM: return "NothingToClaim";
        case Status::PAUSED: return "Paused";
        case Status::UNAUTHORIZED: return "Unauthorized";
        case Status::REENTRANT_CALL: return "ReentrantCall";
        case Status::STORAGE_ERROR: return "StorageError";
        default: return "Unknown";
    }
}

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result = StatusCodeToString(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

} // namespace tokenledger
