// TOKENLEDGER - Ledger State Views Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/state/state_view.h"
#include "tokenledger/crypto/sha256.h"
#include "tokenledger/db/records.h"
#include "tokenledger/util/logging.h"

namespace tokenledger {
namespace state {

// ============================================================================
// StateViewDB
// ============================================================================

StateViewDB::StateViewDB(std::unique_ptr<db::Database> database)
    : db_(std::move(database)) {}

StateViewDB::~StateViewDB() = default;

template<typename T>
Status StateViewDB::ReadRecord(const std::string& key, T& record, bool* found) const {
    *found = false;

    std::string value;
    db::Status s = db_->Get(key, &value);
    if (s.IsNotFound()) {
        return Status::Ok();
    }
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Read failed: " << s.ToString();
        return Status::StorageError(s.ToString());
    }

    if (!db::DecodeRecord(value, &record)) {
        LOG_ERROR(util::LogCategory::DB) << "Corrupt record under prefix '" << key[0] << "'";
        return Status::StorageError("corrupt record");
    }

    *found = true;
    return Status::Ok();
}

Status StateViewDB::GetBalance(const Address& account, Amount* balance) const {
    bool found = false;
    Amount value = 0;
    Status status = ReadRecord(db::RecordKey(db::RecordKind::Balance, account), value, &found);
    *balance = found ? value : 0;
    return status;
}

Status StateViewDB::GetStaker(const Address& account,
                              std::optional<staking::StakerInfo>* info) const {
    bool found = false;
    staking::StakerInfo record;
    Status status = ReadRecord(db::RecordKey(db::RecordKind::Staker, account), record, &found);
    *info = found ? std::optional<staking::StakerInfo>(record) : std::nullopt;
    return status;
}

Status StateViewDB::GetSchedule(const Address& beneficiary,
                                std::optional<vesting::VestingSchedule>* schedule) const {
    bool found = false;
    vesting::VestingSchedule record;
    Status status = ReadRecord(db::RecordKey(db::RecordKind::Vesting, beneficiary), record, &found);
    *schedule = found ? std::optional<vesting::VestingSchedule>(record) : std::nullopt;
    return status;
}

Status StateViewDB::GetAllowance(const Address& owner, const Address& spender,
                                 Amount* allowance) const {
    bool found = false;
    Amount value = 0;
    Status status = ReadRecord(db::RecordKey(db::RecordKind::Allowance, owner, spender), value, &found);
    *allowance = found ? value : 0;
    return status;
}

Status StateViewDB::GetFeeExempt(const Address& account, bool* exempt) const {
    bool found = false;
    bool value = false;
    Status status = ReadRecord(db::RecordKey(db::RecordKind::FeeExempt, account), value, &found);
    *exempt = found && value;
    return status;
}

Status StateViewDB::GetTiers(staking::TierTable* tiers) const {
    bool found = false;
    staking::TierTable record;
    Status status = ReadRecord(db::RecordKey(db::RecordKind::Tiers), record, &found);
    if (!status.ok()) {
        return status;
    }
    if (found && !record.IsConsistent()) {
        return Status::StorageError("stored tier list violates ordering");
    }
    *tiers = found ? record : staking::TierTable();
    return Status::Ok();
}

Status StateViewDB::GetGlobals(std::optional<GlobalState>* globals) const {
    bool found = false;
    GlobalState record;
    Status status = ReadRecord(db::RecordKey(db::RecordKind::Globals), record, &found);
    *globals = found ? std::optional<GlobalState>(record) : std::nullopt;
    return status;
}

Status StateViewDB::BatchWrite(const StateChanges& changes) {
    db::WriteBatch batch;

    for (const auto& [account, balance] : changes.balances) {
        std::string key = db::RecordKey(db::RecordKind::Balance, account);
        if (balance == 0) {
            batch.Delete(key);
        } else {
            batch.Put(key, db::EncodeRecord(balance));
        }
    }

    for (const auto& [account, info] : changes.stakers) {
        batch.Put(db::RecordKey(db::RecordKind::Staker, account), db::EncodeRecord(info));
    }

    for (const auto& [beneficiary, schedule] : changes.schedules) {
        batch.Put(db::RecordKey(db::RecordKind::Vesting, beneficiary), db::EncodeRecord(schedule));
    }

    for (const auto& [key, allowance] : changes.allowances) {
        std::string dbKey = db::RecordKey(db::RecordKind::Allowance, key.first, key.second);
        if (allowance == 0) {
            batch.Delete(dbKey);
        } else {
            batch.Put(dbKey, db::EncodeRecord(allowance));
        }
    }

    for (const auto& [account, exempt] : changes.feeExempt) {
        std::string key = db::RecordKey(db::RecordKind::FeeExempt, account);
        if (exempt) {
            batch.Put(key, db::EncodeRecord(true));
        } else {
            batch.Delete(key);
        }
    }

    if (changes.tiers) {
        batch.Put(db::RecordKey(db::RecordKind::Tiers), db::EncodeRecord(*changes.tiers));
    }

    if (changes.globals) {
        batch.Put(db::RecordKey(db::RecordKind::Globals), db::EncodeRecord(*changes.globals));
    }

    if (batch.Empty()) {
        return Status::Ok();
    }

    db::Status s = db_->Write(batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Batch write of " << batch.Count()
                                         << " records failed: " << s.ToString();
        return Status::StorageError(s.ToString());
    }

    nWrites_ += batch.Count();
    return Status::Ok();
}

Hash256 StateViewDB::GetStateHash() const {
    SHA256 hasher;
    DataStream frame;

    auto it = db_->NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        // Length-prefix both halves so adjacent records cannot alias
        frame << it->key() << it->value();
    }

    Byte digest[SHA256::OUTPUT_SIZE];
    hasher.Write(frame.data(), frame.size()).Finalize(digest);
    return Hash256(digest, SHA256::OUTPUT_SIZE);
}

// ============================================================================
// StateViewCache
// ============================================================================

StateViewCache::StateViewCache(StateView* base) : base_(base) {}

Status StateViewCache::GetBalance(const Address& account, Amount* balance) const {
    auto it = changes_.balances.find(account);
    if (it != changes_.balances.end()) {
        *balance = it->second;
        return Status::Ok();
    }
    return base_->GetBalance(account, balance);
}

Status StateViewCache::GetStaker(const Address& account,
                                 std::optional<staking::StakerInfo>* info) const {
    auto it = changes_.stakers.find(account);
    if (it != changes_.stakers.end()) {
        *info = it->second;
        return Status::Ok();
    }
    return base_->GetStaker(account, info);
}

Status StateViewCache::GetSchedule(const Address& beneficiary,
                                   std::optional<vesting::VestingSchedule>* schedule) const {
    auto it = changes_.schedules.find(beneficiary);
    if (it != changes_.schedules.end()) {
        *schedule = it->second;
        return Status::Ok();
    }
    return base_->GetSchedule(beneficiary, schedule);
}

Status StateViewCache::GetAllowance(const Address& owner, const Address& spender,
                                    Amount* allowance) const {
    auto it = changes_.allowances.find(AllowanceKey(owner, spender));
    if (it != changes_.allowances.end()) {
        *allowance = it->second;
        return Status::Ok();
    }
    return base_->GetAllowance(owner, spender, allowance);
}

Status StateViewCache::GetFeeExempt(const Address& account, bool* exempt) const {
    auto it = changes_.feeExempt.find(account);
    if (it != changes_.feeExempt.end()) {
        *exempt = it->second;
        return Status::Ok();
    }
    return base_->GetFeeExempt(account, exempt);
}

Status StateViewCache::GetTiers(staking::TierTable* tiers) const {
    if (changes_.tiers) {
        *tiers = *changes_.tiers;
        return Status::Ok();
    }
    return base_->GetTiers(tiers);
}

Status StateViewCache::GetGlobals(std::optional<GlobalState>* globals) const {
    if (changes_.globals) {
        *globals = changes_.globals;
        return Status::Ok();
    }
    return base_->GetGlobals(globals);
}

Status StateViewCache::BatchWrite(const StateChanges& changes) {
    for (const auto& [account, balance] : changes.balances) {
        changes_.balances[account] = balance;
    }
    for (const auto& [account, info] : changes.stakers) {
        changes_.stakers[account] = info;
    }
    for (const auto& [beneficiary, schedule] : changes.schedules) {
        changes_.schedules[beneficiary] = schedule;
    }
    for (const auto& [key, allowance] : changes.allowances) {
        changes_.allowances[key] = allowance;
    }
    for (const auto& [account, exempt] : changes.feeExempt) {
        changes_.feeExempt[account] = exempt;
    }
    if (changes.tiers) {
        changes_.tiers = changes.tiers;
    }
    if (changes.globals) {
        changes_.globals = changes.globals;
    }
    return Status::Ok();
}

void StateViewCache::SetBalance(const Address& account, Amount balance) {
    changes_.balances[account] = balance;
}

void StateViewCache::SetStaker(const Address& account, const staking::StakerInfo& info) {
    changes_.stakers[account] = info;
}

void StateViewCache::SetSchedule(const Address& beneficiary,
                                 const vesting::VestingSchedule& schedule) {
    changes_.schedules[beneficiary] = schedule;
}

void StateViewCache::SetAllowance(const Address& owner, const Address& spender,
                                  Amount allowance) {
    changes_.allowances[AllowanceKey(owner, spender)] = allowance;
}

void StateViewCache::SetFeeExempt(const Address& account, bool exempt) {
    changes_.feeExempt[account] = exempt;
}

void StateViewCache::SetTiers(const staking::TierTable& tiers) {
    changes_.tiers = tiers;
}

void StateViewCache::SetGlobals(const GlobalState& globals) {
    changes_.globals = globals;
}

Status StateViewCache::Flush() {
    if (changes_.Empty()) {
        return Status::Ok();
    }

    Status status = base_->BatchWrite(changes_);
    if (!status.ok()) {
        return status;
    }

    changes_.Clear();
    return Status::Ok();
}

void StateViewCache::Reset() {
    changes_.Clear();
}

} // namespace state
} // namespace tokenledger
