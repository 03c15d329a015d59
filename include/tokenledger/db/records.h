// TOKENLEDGER - Ledger Record Keys
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Key layout and value encoding for ledger records. Every key starts with a
// one-byte record kind, followed by the serialized account address(es).

#ifndef TOKENLEDGER_DB_RECORDS_H
#define TOKENLEDGER_DB_RECORDS_H

#include "tokenledger/core/serialize.h"

#include <ios>
#include <string>

namespace tokenledger {
namespace db {

enum class RecordKind : char {
    Balance = 'a',      // account -> Amount
    Allowance = 'l',    // owner, spender -> Amount
    FeeExempt = 'x',    // account -> bool
    Staker = 's',       // account -> StakerInfo
    Vesting = 'v',      // beneficiary -> VestingSchedule
    Tiers = 'T',        // singleton TierTable
    Globals = 'G',      // singleton GlobalState
};

inline std::string RecordKey(RecordKind kind) {
    return std::string(1, static_cast<char>(kind));
}

inline std::string RecordKey(RecordKind kind, const Address& account) {
    DataStream ss;
    ss << account;
    return RecordKey(kind) + ss.ToString();
}

inline std::string RecordKey(RecordKind kind, const Address& owner, const Address& spender) {
    DataStream ss;
    ss << owner << spender;
    return RecordKey(kind) + ss.ToString();
}

template<typename T>
std::string EncodeRecord(const T& record) {
    DataStream ss;
    ss << record;
    return ss.ToString();
}

/// False when the bytes are truncated or carry trailing data
template<typename T>
bool DecodeRecord(const std::string& bytes, T* record) {
    DataStream ss(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
    try {
        ss >> *record;
    } catch (const std::ios_base::failure&) {
        return false;
    }
    return ss.empty();
}

} // namespace db
} // namespace tokenledger

#endif // TOKENLEDGER_DB_RECORDS_H
