// TOKENLEDGER - Token Ledger
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Balance bookkeeping for the token. Composes the fee splitter, the tier
// table, the reward accumulator and vesting schedules over a persisted
// state view. Every mutating call is atomic: its changes are staged in a
// StateViewCache and flushed only when the whole operation succeeds.

#ifndef TOKENLEDGER_LEDGER_LEDGER_H
#define TOKENLEDGER_LEDGER_LEDGER_H

#include "tokenledger/core/status.h"
#include "tokenledger/core/types.h"
#include "tokenledger/economics/fee_splitter.h"
#include "tokenledger/ledger/collaborators.h"
#include "tokenledger/ledger/events.h"
#include "tokenledger/staking/reward_accumulator.h"
#include "tokenledger/staking/tier_table.h"
#include "tokenledger/state/global_state.h"
#include "tokenledger/state/state_view.h"
#include "tokenledger/vesting/vesting.h"

#include <optional>
#include <string>
#include <vector>

namespace tokenledger {
namespace ledger {

// ============================================================================
// Call Context
// ============================================================================

/// Identity and clock for one call. Time is always supplied by the caller.
struct CallContext {
    Address caller;
    Timestamp now{0};

    CallContext() = default;
    CallContext(const Address& caller_, Timestamp now_) : caller(caller_), now(now_) {}
};

// ============================================================================
// Initial Parameters
// ============================================================================

/// Parameters written to a fresh state by Ledger::Initialize
struct LedgerParams {
    uint64_t transferFeeBps{economics::DEFAULT_TRANSFER_FEE_BPS};
    economics::FeeDistribution feeDistribution;
    Address devWallet;
    staking::StakingParams staking;
    std::vector<staking::Tier> tiers;
    std::vector<Address> feeExempt;
};

// ============================================================================
// Ledger
// ============================================================================

/**
 * Token ledger.
 *
 * Mutating operations are checked in a fixed order: re-entrancy, pause,
 * clock, role, then the operation's own preconditions. Events raised by an
 * operation are buffered and handed to the EventSink only after the state
 * has been committed.
 *
 * Internal accounts (StakingPoolAddress, RewardPoolAddress,
 * VestingEscrowAddress) hold staked principal, undistributed rewards and
 * locked vesting funds. They cannot call the ledger and cannot be the
 * target of a transfer or mint.
 */
class Ledger {
public:
    /// The ledger does not own its collaborators. events may be null.
    Ledger(state::StateViewDB& state,
           const AccessControl& access,
           const PauseGate& pause,
           EventSink* events = nullptr);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    /// Write parameters, tiers and exemptions to an uninitialized state.
    /// Requires Admin. A state that already holds globals is left as is.
    Status Initialize(const CallContext& ctx, const LedgerParams& params);

    /// True once global state has been persisted
    bool IsInitialized() const;

    // ========================================================================
    // Tokens
    // ========================================================================

    Status Mint(const CallContext& ctx, const Address& to, Amount amount);
    Status Burn(const CallContext& ctx, Amount amount);
    Status Transfer(const CallContext& ctx, const Address& to, Amount amount);
    Status Approve(const CallContext& ctx, const Address& spender, Amount amount);
    Status TransferFrom(const CallContext& ctx, const Address& from,
                        const Address& to, Amount amount);

    /// Move tokens from the caller into the reward pool, fee free
    Status FundRewardPool(const CallContext& ctx, Amount amount);

    // ========================================================================
    // Staking
    // ========================================================================

    Status Stake(const CallContext& ctx, Amount amount);

    /// Early unstakes pay a fee that stays in the staking pool
    Status Unstake(const CallContext& ctx, Amount amount);

    /// Pay accumulated rewards out of the reward pool
    Status Claim(const CallContext& ctx);

    // ========================================================================
    // Vesting
    // ========================================================================

    /// Lock totalAmount of the caller's tokens for beneficiary
    Status CreateVestingSchedule(const CallContext& ctx, const Address& beneficiary,
                                 Amount totalAmount, Timestamp startTime,
                                 Duration cliffDuration, Duration vestingDuration,
                                 bool revocable);

    /// Release the caller's vested tokens
    Status Release(const CallContext& ctx);

    /// Revoke a schedule; vested tokens go to the beneficiary, the rest to the issuer
    Status Revoke(const CallContext& ctx, const Address& beneficiary);

    // ========================================================================
    // Administration
    // ========================================================================

    Status AddTier(const CallContext& ctx, const staking::Tier& tier);
    Status UpdateTier(const CallContext& ctx, size_t index, const staking::Tier& tier);
    Status SetRewardRate(const CallContext& ctx, uint64_t ratePerSecondPerUnit);
    Status SetMinStakingDuration(const CallContext& ctx, Duration duration);
    Status SetEarlyUnstakeFee(const CallContext& ctx, uint64_t feeBps);
    Status SetTransferFee(const CallContext& ctx, uint64_t feeBps);
    Status SetFeeDistribution(const CallContext& ctx,
                              const economics::FeeDistribution& distribution);
    Status SetDevWallet(const CallContext& ctx, const Address& wallet);
    Status SetFeeExempt(const CallContext& ctx, const Address& account, bool exempt);

    // ========================================================================
    // Queries
    // ========================================================================

    Status GetBalance(const Address& account, Amount* balance) const;
    Status GetAllowance(const Address& owner, const Address& spender, Amount* allowance) const;
    Status IsFeeExempt(const Address& account, bool* exempt) const;
    Status GetStakerInfo(const Address& account, std::optional<staking::StakerInfo>* info) const;
    Status GetPendingRewards(const Address& account, Timestamp now, Amount* pending) const;
    Status HasTierCapability(const Address& account, const std::string& flag, bool* has) const;
    Status GetSchedule(const Address& beneficiary,
                       std::optional<vesting::VestingSchedule>* schedule) const;
    Status GetReleasable(const Address& beneficiary, Timestamp now, Amount* releasable) const;
    Status GetTiers(staking::TierTable* tiers) const;

    /// Current globals; defaults when the state is uninitialized
    Status GetGlobalState(state::GlobalState* globals) const;

    /// SHA-256 over every persisted record
    Hash256 GetStateHash() const { return state_.GetStateHash(); }

private:
    /// Working set for one mutating operation
    struct Operation {
        const CallContext& ctx;
        state::StateViewCache cache;
        state::GlobalState globals;
        std::vector<LedgerEvent> events;

        Operation(const CallContext& context, state::StateView* base)
            : ctx(context), cache(base) {}

        void Emit(LedgerEvent event);
    };

    /// Run body inside a staged operation, committing on success
    template<typename Body>
    Status Execute(const char* name, const CallContext& ctx,
                   std::optional<Role> role, Body&& body);

    // Balance movements within an operation
    static Status Credit(Operation& op, const Address& account, Amount amount);
    static Status Debit(Operation& op, const Address& account, Amount amount);
    static Status Move(Operation& op, const Address& from, const Address& to, Amount amount);

    /// Transfer with fee handling
    static Status TransferWithFee(Operation& op, const Address& from,
                                  const Address& to, Amount gross);

    /// Shared setter plumbing for numeric parameters
    template<typename Apply>
    Status UpdateParameter(const CallContext& ctx, Role role, const char* name,
                           Amount value, Apply&& apply);

    static Status LoadGlobals(const state::StateView& view, state::GlobalState* globals);

    state::StateViewDB& state_;
    const AccessControl& access_;
    const PauseGate& pause_;
    EventSink* events_;
    bool inCall_{false};
};

} // namespace ledger
} // namespace tokenledger

#endif // TOKENLEDGER_LEDGER_LEDGER_H
