// TOKENLEDGER - Ledger State Views
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Typed access to persisted ledger records:
//
//   StateView       abstract read interface plus batch write
//   StateViewDB     records stored in a db::Database
//   StateViewCache  write-back overlay; Flush commits every change in one
//                   batch, Reset discards them
//
// Every ledger operation runs inside a fresh StateViewCache so that a
// failure leaves the backing view untouched.

#ifndef TOKENLEDGER_STATE_STATE_VIEW_H
#define TOKENLEDGER_STATE_STATE_VIEW_H

#include "tokenledger/core/status.h"
#include "tokenledger/core/types.h"
#include "tokenledger/db/database.h"
#include "tokenledger/staking/reward_accumulator.h"
#include "tokenledger/staking/tier_table.h"
#include "tokenledger/state/global_state.h"
#include "tokenledger/vesting/vesting.h"

#include <map>
#include <memory>
#include <optional>
#include <utility>

namespace tokenledger {
namespace state {

/// (owner, spender)
using AllowanceKey = std::pair<Address, Address>;

// ============================================================================
// StateChanges - Pending record writes
// ============================================================================

/**
 * Records modified by one or more operations, keyed the way they are
 * persisted. Zero balances, zero allowances and cleared exemptions are
 * deleted from the store rather than written.
 */
struct StateChanges {
    std::map<Address, Amount> balances;
    std::map<Address, staking::StakerInfo> stakers;
    std::map<Address, vesting::VestingSchedule> schedules;
    std::map<AllowanceKey, Amount> allowances;
    std::map<Address, bool> feeExempt;
    std::optional<staking::TierTable> tiers;
    std::optional<GlobalState> globals;

    bool Empty() const {
        return balances.empty() && stakers.empty() && schedules.empty() &&
               allowances.empty() && feeExempt.empty() && !tiers && !globals;
    }

    size_t Count() const {
        return balances.size() + stakers.size() + schedules.size() +
               allowances.size() + feeExempt.size() +
               (tiers ? 1 : 0) + (globals ? 1 : 0);
    }

    void Clear() { *this = StateChanges(); }
};

// ============================================================================
// StateView - Abstract interface
// ============================================================================

/**
 * Read access to ledger records. Missing balances, allowances and
 * exemptions read as zero/false; missing stakers and schedules read as
 * std::nullopt. A non-OK status means the store could not be read.
 */
class StateView {
public:
    virtual ~StateView() = default;

    virtual Status GetBalance(const Address& account, Amount* balance) const = 0;
    virtual Status GetStaker(const Address& account,
                             std::optional<staking::StakerInfo>* info) const = 0;
    virtual Status GetSchedule(const Address& beneficiary,
                               std::optional<vesting::VestingSchedule>* schedule) const = 0;
    virtual Status GetAllowance(const Address& owner, const Address& spender,
                                Amount* allowance) const = 0;
    virtual Status GetFeeExempt(const Address& account, bool* exempt) const = 0;
    virtual Status GetTiers(staking::TierTable* tiers) const = 0;

    /// std::nullopt until the ledger has been initialized
    virtual Status GetGlobals(std::optional<GlobalState>* globals) const = 0;

    /// Apply a set of changes atomically
    virtual Status BatchWrite(const StateChanges& changes) = 0;
};

// ============================================================================
// StateViewDB - Records stored in a key-value database
// ============================================================================

class StateViewDB : public StateView {
public:
    explicit StateViewDB(std::unique_ptr<db::Database> database);
    ~StateViewDB() override;

    StateViewDB(const StateViewDB&) = delete;
    StateViewDB& operator=(const StateViewDB&) = delete;

    Status GetBalance(const Address& account, Amount* balance) const override;
    Status GetStaker(const Address& account,
                     std::optional<staking::StakerInfo>* info) const override;
    Status GetSchedule(const Address& beneficiary,
                       std::optional<vesting::VestingSchedule>* schedule) const override;
    Status GetAllowance(const Address& owner, const Address& spender,
                        Amount* allowance) const override;
    Status GetFeeExempt(const Address& account, bool* exempt) const override;
    Status GetTiers(staking::TierTable* tiers) const override;
    Status GetGlobals(std::optional<GlobalState>* globals) const override;

    Status BatchWrite(const StateChanges& changes) override;

    /// SHA-256 over every key/value pair in key order
    Hash256 GetStateHash() const;

    /// Number of records written by successful batches
    uint64_t GetWriteCount() const { return nWrites_; }

    db::Database& GetDatabase() { return *db_; }

private:
    /// Read and decode one record; found is false when the key is absent
    template<typename T>
    Status ReadRecord(const std::string& key, T& record, bool* found) const;

    std::unique_ptr<db::Database> db_;
    uint64_t nWrites_{0};
};

// ============================================================================
// StateViewCache - Write-back overlay
// ============================================================================

class StateViewCache : public StateView {
public:
    explicit StateViewCache(StateView* base);

    StateViewCache(const StateViewCache&) = delete;
    StateViewCache& operator=(const StateViewCache&) = delete;

    // StateView interface: pending changes shadow the base
    Status GetBalance(const Address& account, Amount* balance) const override;
    Status GetStaker(const Address& account,
                     std::optional<staking::StakerInfo>* info) const override;
    Status GetSchedule(const Address& beneficiary,
                       std::optional<vesting::VestingSchedule>* schedule) const override;
    Status GetAllowance(const Address& owner, const Address& spender,
                        Amount* allowance) const override;
    Status GetFeeExempt(const Address& account, bool* exempt) const override;
    Status GetTiers(staking::TierTable* tiers) const override;
    Status GetGlobals(std::optional<GlobalState>* globals) const override;

    /// Merge another change set into this overlay
    Status BatchWrite(const StateChanges& changes) override;

    // Mutators
    void SetBalance(const Address& account, Amount balance);
    void SetStaker(const Address& account, const staking::StakerInfo& info);
    void SetSchedule(const Address& beneficiary, const vesting::VestingSchedule& schedule);
    void SetAllowance(const Address& owner, const Address& spender, Amount allowance);
    void SetFeeExempt(const Address& account, bool exempt);
    void SetTiers(const staking::TierTable& tiers);
    void SetGlobals(const GlobalState& globals);

    /// Write all pending changes to the base in one batch
    Status Flush();

    /// Discard all pending changes
    void Reset();

    const StateChanges& GetChanges() const { return changes_; }
    bool HasChanges() const { return !changes_.Empty(); }

private:
    StateView* base_;
    StateChanges changes_;
};

} // namespace state
} // namespace tokenledger

#endif // TOKENLEDGER_STATE_STATE_VIEW_H
