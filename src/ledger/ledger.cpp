// TOKENLEDGER - Token Ledger Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/ledger/ledger.h"
#include "tokenledger/core/math.h"
#include "tokenledger/util/logging.h"

namespace tokenledger {
namespace ledger {

namespace {

/// Marks the ledger busy for the lifetime of one mutating call
class CallGuard {
public:
    explicit CallGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~CallGuard() { flag_ = false; }

    CallGuard(const CallGuard&) = delete;
    CallGuard& operator=(const CallGuard&) = delete;

private:
    bool& flag_;
};

Status CheckCaller(const CallContext& ctx) {
    if (IsInternalAddress(ctx.caller)) {
        return Status::InvalidAddress("caller must be an external account");
    }
    return Status::Ok();
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Ledger::Ledger(state::StateViewDB& state,
               const AccessControl& access,
               const PauseGate& pause,
               EventSink* events)
    : state_(state), access_(access), pause_(pause), events_(events) {}

void Ledger::Operation::Emit(LedgerEvent event) {
    event.timestamp = ctx.now;
    events.push_back(std::move(event));
}

Status Ledger::LoadGlobals(const state::StateView& view, state::GlobalState* globals) {
    std::optional<state::GlobalState> stored;
    Status status = view.GetGlobals(&stored);
    if (!status.ok()) {
        return status;
    }
    *globals = stored ? *stored : state::GlobalState();
    return Status::Ok();
}

bool Ledger::IsInitialized() const {
    std::optional<state::GlobalState> stored;
    Status status = state_.GetGlobals(&stored);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << "Cannot read global state: " << status.ToString();
        return false;
    }
    return stored.has_value();
}

// ============================================================================
// Operation Pipeline
// ============================================================================

template<typename Body>
Status Ledger::Execute(const char* name, const CallContext& ctx,
                       std::optional<Role> role, Body&& body) {
    if (inCall_) {
        LOG_WARN(util::LogCategory::LEDGER) << name << " rejected: re-entrant call";
        return Status::ReentrantCall(std::string(name) + " called during another operation");
    }
    CallGuard guard(inCall_);

    if (pause_.IsPaused()) {
        LOG_DEBUG(util::LogCategory::LEDGER) << name << " rejected: ledger paused";
        return Status::Paused();
    }

    Operation op(ctx, &state_);
    Status status = LoadGlobals(op.cache, &op.globals);
    if (!status.ok()) {
        return status;
    }

    if (ctx.now < op.globals.lastTimestamp) {
        LOG_DEBUG(util::LogCategory::LEDGER) << name << " rejected: time " << ctx.now
                                             << " precedes " << op.globals.lastTimestamp;
        return Status::InvalidTimestamp("time moved backwards from " +
                                        std::to_string(op.globals.lastTimestamp));
    }

    if (role && !access_.HasRole(ctx.caller, *role)) {
        LOG_DEBUG(util::LogCategory::LEDGER) << name << " rejected: " << ctx.caller.ToHex()
                                             << " lacks role " << RoleToString(*role);
        return Status::Unauthorized(std::string("requires role ") + RoleToString(*role));
    }

    status = body(op);
    if (!status.ok()) {
        LOG_DEBUG(util::LogCategory::LEDGER) << name << " rejected: " << status.ToString();
        return status;
    }

    op.globals.lastTimestamp = ctx.now;
    op.cache.SetGlobals(op.globals);

    status = op.cache.Flush();
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::LEDGER) << name << " failed to commit: " << status.ToString();
        return status;
    }

    LOG_DEBUG(util::LogCategory::LEDGER) << name << " committed at " << ctx.now
                                         << " (" << op.events.size() << " events)";

    if (events_) {
        for (const auto& event : op.events) {
            events_->OnEvent(event);
        }
    }
    return Status::Ok();
}

// ============================================================================
// Balance Movements
// ============================================================================

Status Ledger::Credit(Operation& op, const Address& account, Amount amount) {
    if (amount == 0) {
        return Status::Ok();
    }

    Amount balance = 0;
    Status status = op.cache.GetBalance(account, &balance);
    if (!status.ok()) {
        return status;
    }

    auto updated = CheckedAdd(balance, amount);
    if (!updated) {
        return Status::ArithmeticOverflow("balance of " + account.ToHex() + " overflows");
    }
    op.cache.SetBalance(account, *updated);
    return Status::Ok();
}

Status Ledger::Debit(Operation& op, const Address& account, Amount amount) {
    if (amount == 0) {
        return Status::Ok();
    }

    Amount balance = 0;
    Status status = op.cache.GetBalance(account, &balance);
    if (!status.ok()) {
        return status;
    }

    if (balance < amount) {
        return Status::InsufficientBalance(account.ToHex() + " holds " + std::to_string(balance) +
                                           ", needs " + std::to_string(amount));
    }
    op.cache.SetBalance(account, balance - amount);
    return Status::Ok();
}

Status Ledger::Move(Operation& op, const Address& from, const Address& to, Amount amount) {
    Status status = Debit(op, from, amount);
    if (!status.ok()) {
        return status;
    }
    return Credit(op, to, amount);
}

Status Ledger::TransferWithFee(Operation& op, const Address& from,
                               const Address& to, Amount gross) {
    if (gross == 0) {
        return Status::InvalidAmount("transfer amount is zero");
    }
    if (IsInternalAddress(to)) {
        return Status::InvalidAddress("cannot transfer to " + to.ToHex());
    }

    bool fromExempt = false;
    bool toExempt = false;
    Status status = op.cache.GetFeeExempt(from, &fromExempt);
    if (!status.ok()) {
        return status;
    }
    status = op.cache.GetFeeExempt(to, &toExempt);
    if (!status.ok()) {
        return status;
    }

    bool exempt = IsInternalAddress(from) || fromExempt || toExempt;
    economics::FeeSplitter splitter(op.globals.transferFeeBps, op.globals.feeDistribution);
    economics::FeeSplit split = splitter.Apply(gross, exempt);

    status = Debit(op, from, gross);
    if (!status.ok()) {
        return status;
    }
    status = Credit(op, to, split.net);
    if (!status.ok()) {
        return status;
    }

    if (split.fee > 0) {
        Amount burned = split.burn;
        Amount dev = split.dev;

        // With no dev wallet configured the dev share is burned
        if (op.globals.devWallet.IsNull()) {
            burned += dev;
            dev = 0;
        }

        status = Credit(op, RewardPoolAddress(), split.rewards);
        if (!status.ok()) {
            return status;
        }
        status = Credit(op, op.globals.devWallet, dev);
        if (!status.ok()) {
            return status;
        }

        op.globals.totalSupply -= burned;
        op.globals.totalBurned += burned;

        LOG_TRACE(util::LogCategory::FEES) << "Fee " << split.fee << " on " << gross
                                           << ": burn=" << burned
                                           << " rewards=" << split.rewards
                                           << " dev=" << dev
                                           << " dust=" << split.dust;

        LedgerEvent fees;
        fees.type = EventType::FeeDistributed;
        fees.subject = from;
        fees.fee = split.fee;
        fees.burnAmount = burned;
        fees.rewardsAmount = split.rewards;
        fees.devAmount = dev;
        op.Emit(std::move(fees));
    }

    LedgerEvent transfer;
    transfer.type = EventType::Transfer;
    transfer.subject = from;
    transfer.counterparty = to;
    transfer.amount = split.net;
    transfer.fee = split.fee;
    op.Emit(std::move(transfer));
    return Status::Ok();
}

// ============================================================================
// Initialization
// ============================================================================

Status Ledger::Initialize(const CallContext& ctx, const LedgerParams& params) {
    bool alreadyInitialized = false;
    Status result = Execute("Initialize", ctx, Role::Admin, [&](Operation& op) {
        std::optional<state::GlobalState> stored;
        Status status = op.cache.GetGlobals(&stored);
        if (!status.ok()) {
            return status;
        }
        if (stored) {
            alreadyInitialized = true;
            return Status::Ok();
        }

        economics::FeeSplitter splitter;
        status = splitter.SetFeeBps(params.transferFeeBps);
        if (!status.ok()) {
            return status;
        }
        status = splitter.SetDistribution(params.feeDistribution);
        if (!status.ok()) {
            return status;
        }

        if (params.staking.earlyUnstakeFeeBps > staking::MAX_EARLY_UNSTAKE_FEE_BPS) {
            return Status::InvalidAmount("early unstake fee exceeds " +
                                         std::to_string(staking::MAX_EARLY_UNSTAKE_FEE_BPS) + " bps");
        }
        if (params.staking.minStakingDuration < 0) {
            return Status::InvalidAmount("minimum staking duration is negative");
        }
        if (!params.devWallet.IsNull() && IsInternalAddress(params.devWallet)) {
            return Status::InvalidAddress("dev wallet cannot be an internal account");
        }

        staking::TierTable tiers;
        for (const auto& tier : params.tiers) {
            status = tiers.AddTier(tier);
            if (!status.ok()) {
                return status;
            }
        }

        for (const auto& account : params.feeExempt) {
            if (account.IsNull()) {
                return Status::InvalidAddress("fee exemption for null address");
            }
            op.cache.SetFeeExempt(account, true);
        }

        op.globals.transferFeeBps = params.transferFeeBps;
        op.globals.feeDistribution = params.feeDistribution;
        op.globals.devWallet = params.devWallet;
        op.globals.staking = params.staking;
        op.cache.SetTiers(tiers);
        return Status::Ok();
    });

    if (result.ok() && alreadyInitialized) {
        LOG_INFO(util::LogCategory::LEDGER) << "State already initialized; keeping stored parameters";
    } else if (result.ok()) {
        LOG_INFO(util::LogCategory::LEDGER) << "Ledger initialized: fee=" << params.transferFeeBps
                                            << " bps, " << params.feeDistribution.ToString()
                                            << ", " << params.tiers.size() << " tiers, "
                                            << params.feeExempt.size() << " exempt accounts";
    }
    return result;
}

// ============================================================================
// Tokens
// ============================================================================

Status Ledger::Mint(const CallContext& ctx, const Address& to, Amount amount) {
    return Execute("Mint", ctx, Role::Minter, [&](Operation& op) {
        if (amount == 0) {
            return Status::InvalidAmount("mint amount is zero");
        }
        if (IsInternalAddress(to)) {
            return Status::InvalidAddress("cannot mint to " + to.ToHex());
        }

        auto supply = CheckedAdd(op.globals.totalSupply, amount);
        if (!supply || !SupplyRange(*supply)) {
            return Status::MaxSupplyExceeded("minting " + std::to_string(amount) +
                                             " exceeds the supply cap");
        }

        Status status = Credit(op, to, amount);
        if (!status.ok()) {
            return status;
        }
        op.globals.totalSupply = *supply;

        LedgerEvent event;
        event.type = EventType::Mint;
        event.subject = to;
        event.amount = amount;
        op.Emit(std::move(event));
        return Status::Ok();
    });
}

Status Ledger::Burn(const CallContext& ctx, Amount amount) {
    return Execute("Burn", ctx, std::nullopt, [&](Operation& op) {
        Status status = CheckCaller(ctx);
        if (!status.ok()) {
            return status;
        }
        if (amount == 0) {
            return Status::InvalidAmount("burn amount is zero");
        }

        status = Debit(op, ctx.caller, amount);
        if (!status.ok()) {
            return status;
        }
        op.globals.totalSupply -= amount;
        op.globals.totalBurned += amount;

        LedgerEvent event;
        event.type = EventType::Burn;
        event.subject = ctx.caller;
        event.amount = amount;
        op.Emit(std::move(event));
        return Status::Ok();
    });
}

Status Ledger::Transfer(const CallContext& ctx, const Address& to, Amount amount) {
    return Execute("Transfer", ctx, std::nullopt, [&](Operation& op) {
        Status status = CheckCaller(ctx);
        if (!status.ok()) {
            return status;
        }
        return TransferWithFee(op, ctx.caller, to, amount);
    });
}

Status Ledger::Approve(const CallContext& ctx, const Address& spender, Amount amount) {
    return Execute("Approve", ctx, std::nullopt, [&](Operation& op) {
        Status status = CheckCaller(ctx);
        if (!status.ok()) {
            return status;
        }
        if (IsInternalAddress(spender)) {
            return Status::InvalidAddress("cannot approve " + spender.ToHex());
        }

        op.cache.SetAllowance(ctx.caller, spender, amount);

        LedgerEvent event;
        event.type = EventType::Approval;
        event.subject = ctx.caller;
        event.counterparty = spender;
        event.amount = amount;
        op.Emit(std::move(event));
        return Status::Ok();
    });
}

Status Ledger::TransferFrom(const CallContext& ctx, const Address& from,
                            const Address& to, Amount amount) {
    return Execute("TransferFrom", ctx, std::nullopt, [&](Operation& op) {
        Status status = CheckCaller(ctx);
        if (!status.ok()) {
            return status;
        }
        if (IsInternalAddress(from)) {
            return Status::InvalidAddress("cannot spend from " + from.ToHex());
        }

        Amount allowance = 0;
        status = op.cache.GetAllowance(from, ctx.caller, &allowance);
        if (!status.ok()) {
            return status;
        }
        if (allowance < amount) {
            return Status::InsufficientAllowance("allowance " + std::to_string(allowance) +
                                                 " below " + std::to_string(amount));
        }

        status = TransferWithFee(op, from, to, amount);
        if (!status.ok()) {
            return status;
        }
        op.cache.SetAllowance(from, ctx.caller, allowance - amount);
        return Status::Ok();
    });
}

Status Ledger::FundRewardPool(const CallContext& ctx, Amount amount) {
    return Execute("FundRewardPool", ctx, std::nullopt, [&](Operation& op) {
        Status status = CheckCaller(ctx);
        if (!status.ok()) {
            return status;
        }
        if (amount == 0) {
            return Status::InvalidAmount("funding amount is zero");
        }

        status = Move(op, ctx.caller, RewardPoolAddress(), amount);
        if (!status.ok()) {
            return status;
        }

        LedgerEvent event;
        event.type = EventType::Transfer;
        event.subject = ctx.caller;
        event.counterparty = RewardPoolAddress();
        event.amount = amount;
        op.Emit(std::move(event));
        return Status::Ok();
    });
}

// ============================================================================
// Staking
// ============================================================================

Status Ledger::Stake(const CallContext& ctx, Amount amount) {
    return Execute("Stake", ctx, std::nullopt, [&](Operation& op) {
        Status status = CheckCaller(ctx);
        if (!status.ok()) {
            return status;
        }

        staking::TierTable tiers;
        status = op.cache.GetTiers(&tiers);
        if (!status.ok()) {
            return status;
        }

        std::optional<staking::StakerInfo> stored;
        status = op.cache.GetStaker(ctx.caller, &stored);
        if (!status.ok()) {
            return status;
        }
        staking::StakerInfo info = stored.value_or(staking::StakerInfo());

        staking::RewardAccumulator accumulator(op.globals.staking, tiers);
        status = accumulator.Stake(info, amount, ctx.now);
        if (!status.ok()) {
            return status;
        }

        status = Move(op, ctx.caller, StakingPoolAddress(), amount);
        if (!status.ok()) {
            return status;
        }

        op.cache.SetStaker(ctx.caller, info);
        op.globals.totalStaked += amount;

        LOG_DEBUG(util::LogCategory::STAKING) << ctx.caller.ToHex() << " staked " << amount
                                              << ", now " << info.ToString();

        LedgerEvent event;
        event.type = EventType::Staked;
        event.subject = ctx.caller;
        event.amount = amount;
        event.tierIndex = info.tierIndex;
        op.Emit(std::move(event));
        return Status::Ok();
    });
}

Status Ledger::Unstake(const CallContext& ctx, Amount amount) {
    return Execute("Unstake", ctx, std::nullopt, [&](Operation& op) {
        Status status = CheckCaller(ctx);
        if (!status.ok()) {
            return status;
        }

        std::optional<staking::StakerInfo> stored;
        status = op.cache.GetStaker(ctx.caller, &stored);
        if (!status.ok()) {
            return status;
        }
        if (!stored) {
            return Status::InsufficientStake(ctx.caller.ToHex() + " has never staked");
        }

        staking::TierTable tiers;
        status = op.cache.GetTiers(&tiers);
        if (!status.ok()) {
            return status;
        }

        staking::StakerInfo info = *stored;
        staking::UnstakeResult result;
        staking::RewardAccumulator accumulator(op.globals.staking, tiers);
        status = accumulator.Unstake(info, amount, ctx.now, &result);
        if (!status.ok()) {
            return status;
        }

        // The early fee stays in the pool
        status = Move(op, StakingPoolAddress(), ctx.caller, result.transferOut);
        if (!status.ok()) {
            return status;
        }

        op.cache.SetStaker(ctx.caller, info);
        op.globals.totalStaked -= amount;
        op.globals.totalEarlyUnstakeFees += result.fee;

        if (result.fee > 0) {
            LOG_DEBUG(util::LogCategory::STAKING) << ctx.caller.ToHex() << " paid early unstake fee "
                                                  << result.fee;
        }

        LedgerEvent event;
        event.type = EventType::Unstaked;
        event.subject = ctx.caller;
        event.amount = result.transferOut;
        event.fee = result.fee;
        event.tierIndex = info.tierIndex;
        op.Emit(std::move(event));
        return Status::Ok();
    });
}

Status Ledger::Claim(const CallContext& ctx) {
    return Execute("Claim", ctx, std::nullopt, [&](Operation& op) {
        Status status = CheckCaller(ctx);
        if (!status.ok()) {
            return status;
        }

        std::optional<staking::StakerInfo> stored;
        status = op.cache.GetStaker(ctx.caller, &stored);
        if (!status.ok()) {
            return status;
        }
        if (!stored) {
            return Status::NothingToClaim();
        }

        staking::TierTable tiers;
        status = op.cache.GetTiers(&tiers);
        if (!status.ok()) {
            return status;
        }

        staking::StakerInfo info = *stored;
        Amount claimed = 0;
        staking::RewardAccumulator accumulator(op.globals.staking, tiers);
        status = accumulator.Claim(info, ctx.now, &claimed);
        if (!status.ok()) {
            return status;
        }

        status = Move(op, RewardPoolAddress(), ctx.caller, claimed);
        if (!status.ok()) {
            LOG_WARN(util::LogCategory::STAKING) << "Reward pool cannot cover claim of " << claimed;
            return status;
        }

        op.cache.SetStaker(ctx.caller, info);
        op.globals.totalRewardsClaimed += claimed;

        LedgerEvent event;
        event.type = EventType::RewardsClaimed;
        event.subject = ctx.caller;
        event.amount = claimed;
        op.Emit(std::move(event));
        return Status::Ok();
    });
}

// ============================================================================
// Vesting
// ============================================================================

Status Ledger::CreateVestingSchedule(const CallContext& ctx, const Address& beneficiary,
                                     Amount totalAmount, Timestamp startTime,
                                     Duration cliffDuration, Duration vestingDuration,
                                     bool revocable) {
    return Execute("CreateVestingSchedule", ctx, Role::VestingManager, [&](Operation& op) {
        Status status = CheckCaller(ctx);
        if (!status.ok()) {
            return status;
        }

        std::optional<vesting::VestingSchedule> existing;
        status = op.cache.GetSchedule(beneficiary, &existing);
        if (!status.ok()) {
            return status;
        }
        if (existing && existing->Exists()) {
            return Status::ScheduleExists(beneficiary.ToHex() + " already has a schedule");
        }

        vesting::VestingSchedule schedule;
        schedule.issuer = ctx.caller;
        schedule.totalAmount = totalAmount;
        schedule.startTime = startTime;
        schedule.cliffDuration = cliffDuration;
        schedule.vestingDuration = vestingDuration;
        schedule.revocable = revocable;

        status = vesting::CheckNewSchedule(beneficiary, schedule);
        if (!status.ok()) {
            return status;
        }

        status = Move(op, ctx.caller, VestingEscrowAddress(), totalAmount);
        if (!status.ok()) {
            return status;
        }

        op.cache.SetSchedule(beneficiary, schedule);
        op.globals.totalVestingLocked += totalAmount;

        LOG_DEBUG(util::LogCategory::VESTING) << "Schedule for " << beneficiary.ToHex() << ": "
                                              << schedule.ToString();

        LedgerEvent event;
        event.type = EventType::VestingCreated;
        event.subject = beneficiary;
        event.counterparty = ctx.caller;
        event.amount = totalAmount;
        op.Emit(std::move(event));
        return Status::Ok();
    });
}

Status Ledger::Release(const CallContext& ctx) {
    return Execute("Release", ctx, std::nullopt, [&](Operation& op) {
        Status status = CheckCaller(ctx);
        if (!status.ok()) {
            return status;
        }

        std::optional<vesting::VestingSchedule> stored;
        status = op.cache.GetSchedule(ctx.caller, &stored);
        if (!status.ok()) {
            return status;
        }
        vesting::VestingSchedule schedule = stored.value_or(vesting::VestingSchedule());

        Amount released = 0;
        status = vesting::Release(schedule, ctx.now, &released);
        if (!status.ok()) {
            return status;
        }

        status = Move(op, VestingEscrowAddress(), ctx.caller, released);
        if (!status.ok()) {
            return status;
        }

        op.cache.SetSchedule(ctx.caller, schedule);
        op.globals.totalVestingLocked -= released;

        LedgerEvent event;
        event.type = EventType::TokensReleased;
        event.subject = ctx.caller;
        event.amount = released;
        op.Emit(std::move(event));
        return Status::Ok();
    });
}

Status Ledger::Revoke(const CallContext& ctx, const Address& beneficiary) {
    return Execute("Revoke", ctx, Role::VestingManager, [&](Operation& op) {
        std::optional<vesting::VestingSchedule> stored;
        Status status = op.cache.GetSchedule(beneficiary, &stored);
        if (!status.ok()) {
            return status;
        }
        vesting::VestingSchedule schedule = stored.value_or(vesting::VestingSchedule());

        vesting::RevokeResult result;
        status = vesting::Revoke(schedule, ctx.now, &result);
        if (!status.ok()) {
            return status;
        }

        status = Move(op, VestingEscrowAddress(), beneficiary, result.released);
        if (!status.ok()) {
            return status;
        }
        status = Move(op, VestingEscrowAddress(), schedule.issuer, result.returned);
        if (!status.ok()) {
            return status;
        }

        op.cache.SetSchedule(beneficiary, schedule);
        op.globals.totalVestingLocked -= result.released + result.returned;

        LOG_INFO(util::LogCategory::VESTING) << "Revoked schedule of " << beneficiary.ToHex()
                                             << ": released " << result.released
                                             << ", returned " << result.returned;

        if (result.released > 0) {
            LedgerEvent released;
            released.type = EventType::TokensReleased;
            released.subject = beneficiary;
            released.amount = result.released;
            op.Emit(std::move(released));
        }

        LedgerEvent event;
        event.type = EventType::VestingRevoked;
        event.subject = beneficiary;
        event.counterparty = schedule.issuer;
        event.amount = result.returned;
        op.Emit(std::move(event));
        return Status::Ok();
    });
}

// ============================================================================
// Administration
// ============================================================================

template<typename Apply>
Status Ledger::UpdateParameter(const CallContext& ctx, Role role, const char* name,
                               Amount value, Apply&& apply) {
    Status result = Execute(name, ctx, role, [&](Operation& op) {
        Status status = apply(op);
        if (!status.ok()) {
            return status;
        }

        LedgerEvent event;
        event.type = EventType::ParameterUpdated;
        event.subject = ctx.caller;
        event.detail = name;
        event.amount = value;
        op.Emit(std::move(event));
        return Status::Ok();
    });

    if (result.ok()) {
        LOG_INFO(util::LogCategory::LEDGER) << name << " set to " << value
                                            << " by " << ctx.caller.ToHex();
    }
    return result;
}

Status Ledger::AddTier(const CallContext& ctx, const staking::Tier& tier) {
    size_t index = 0;
    Status result = Execute("AddTier", ctx, Role::TierManager, [&](Operation& op) {
        staking::TierTable tiers;
        Status status = op.cache.GetTiers(&tiers);
        if (!status.ok()) {
            return status;
        }
        status = tiers.AddTier(tier);
        if (!status.ok()) {
            return status;
        }
        index = tiers.Size() - 1;
        op.cache.SetTiers(tiers);

        LedgerEvent event;
        event.type = EventType::TierAdded;
        event.tierIndex = static_cast<uint32_t>(index);
        event.amount = tier.minimumStake;
        event.detail = tier.name;
        op.Emit(std::move(event));
        return Status::Ok();
    });

    if (result.ok()) {
        LOG_INFO(util::LogCategory::STAKING) << "Added tier " << index << ": " << tier.ToString();
    }
    return result;
}

Status Ledger::UpdateTier(const CallContext& ctx, size_t index, const staking::Tier& tier) {
    Status result = Execute("UpdateTier", ctx, Role::TierManager, [&](Operation& op) {
        staking::TierTable tiers;
        Status status = op.cache.GetTiers(&tiers);
        if (!status.ok()) {
            return status;
        }
        status = tiers.UpdateTier(index, tier);
        if (!status.ok()) {
            return status;
        }
        op.cache.SetTiers(tiers);

        LedgerEvent event;
        event.type = EventType::TierUpdated;
        event.tierIndex = static_cast<uint32_t>(index);
        event.amount = tier.minimumStake;
        event.detail = tier.name;
        op.Emit(std::move(event));
        return Status::Ok();
    });

    if (result.ok()) {
        LOG_INFO(util::LogCategory::STAKING) << "Updated tier " << index << ": " << tier.ToString();
    }
    return result;
}

Status Ledger::SetRewardRate(const CallContext& ctx, uint64_t ratePerSecondPerUnit) {
    return UpdateParameter(ctx, Role::RateManager, "rewardRate", ratePerSecondPerUnit,
                           [&](Operation& op) {
        op.globals.staking.rewardRatePerSecondPerUnit = ratePerSecondPerUnit;
        return Status::Ok();
    });
}

Status Ledger::SetMinStakingDuration(const CallContext& ctx, Duration duration) {
    return UpdateParameter(ctx, Role::Admin, "minStakingDuration", static_cast<Amount>(duration),
                           [&](Operation& op) {
        if (duration < 0) {
            return Status::InvalidAmount("minimum staking duration is negative");
        }
        op.globals.staking.minStakingDuration = duration;
        return Status::Ok();
    });
}

Status Ledger::SetEarlyUnstakeFee(const CallContext& ctx, uint64_t feeBps) {
    return UpdateParameter(ctx, Role::Admin, "earlyUnstakeFeeBps", feeBps, [&](Operation& op) {
        if (feeBps > staking::MAX_EARLY_UNSTAKE_FEE_BPS) {
            return Status::InvalidAmount("early unstake fee exceeds " +
                                         std::to_string(staking::MAX_EARLY_UNSTAKE_FEE_BPS) + " bps");
        }
        op.globals.staking.earlyUnstakeFeeBps = feeBps;
        return Status::Ok();
    });
}

Status Ledger::SetTransferFee(const CallContext& ctx, uint64_t feeBps) {
    return UpdateParameter(ctx, Role::Admin, "transferFeeBps", feeBps, [&](Operation& op) {
        economics::FeeSplitter splitter(op.globals.transferFeeBps, op.globals.feeDistribution);
        Status status = splitter.SetFeeBps(feeBps);
        if (!status.ok()) {
            return status;
        }
        op.globals.transferFeeBps = splitter.GetFeeBps();
        return Status::Ok();
    });
}

Status Ledger::SetFeeDistribution(const CallContext& ctx,
                                  const economics::FeeDistribution& distribution) {
    return UpdateParameter(ctx, Role::Admin, "feeDistribution", distribution.burnRatio,
                           [&](Operation& op) {
        economics::FeeSplitter splitter(op.globals.transferFeeBps, op.globals.feeDistribution);
        Status status = splitter.SetDistribution(distribution);
        if (!status.ok()) {
            return status;
        }
        op.globals.feeDistribution = splitter.GetDistribution();
        return Status::Ok();
    });
}

Status Ledger::SetDevWallet(const CallContext& ctx, const Address& wallet) {
    Status result = Execute("SetDevWallet", ctx, Role::Admin, [&](Operation& op) {
        if (IsInternalAddress(wallet)) {
            return Status::InvalidAddress("dev wallet must be an external account");
        }
        op.globals.devWallet = wallet;

        LedgerEvent event;
        event.type = EventType::ParameterUpdated;
        event.subject = ctx.caller;
        event.counterparty = wallet;
        event.detail = "devWallet";
        op.Emit(std::move(event));
        return Status::Ok();
    });

    if (result.ok()) {
        LOG_INFO(util::LogCategory::FEES) << "Dev wallet set to " << wallet.ToHex();
    }
    return result;
}

Status Ledger::SetFeeExempt(const CallContext& ctx, const Address& account, bool exempt) {
    Status result = Execute("SetFeeExempt", ctx, Role::Admin, [&](Operation& op) {
        if (account.IsNull()) {
            return Status::InvalidAddress("cannot exempt the null address");
        }
        op.cache.SetFeeExempt(account, exempt);

        LedgerEvent event;
        event.type = EventType::ParameterUpdated;
        event.subject = ctx.caller;
        event.counterparty = account;
        event.detail = "feeExempt";
        event.amount = exempt ? 1 : 0;
        op.Emit(std::move(event));
        return Status::Ok();
    });

    if (result.ok()) {
        LOG_INFO(util::LogCategory::FEES) << account.ToHex()
                                          << (exempt ? " exempted from" : " subject to")
                                          << " transfer fees";
    }
    return result;
}

// ============================================================================
// Queries
// ============================================================================

Status Ledger::GetBalance(const Address& account, Amount* balance) const {
    return state_.GetBalance(account, balance);
}

Status Ledger::GetAllowance(const Address& owner, const Address& spender,
                            Amount* allowance) const {
    return state_.GetAllowance(owner, spender, allowance);
}

Status Ledger::IsFeeExempt(const Address& account, bool* exempt) const {
    return state_.GetFeeExempt(account, exempt);
}

Status Ledger::GetStakerInfo(const Address& account,
                             std::optional<staking::StakerInfo>* info) const {
    return state_.GetStaker(account, info);
}

Status Ledger::GetPendingRewards(const Address& account, Timestamp now, Amount* pending) const {
    *pending = 0;

    std::optional<staking::StakerInfo> info;
    Status status = state_.GetStaker(account, &info);
    if (!status.ok() || !info) {
        return status;
    }

    state::GlobalState globals;
    status = LoadGlobals(state_, &globals);
    if (!status.ok()) {
        return status;
    }

    staking::TierTable tiers;
    status = state_.GetTiers(&tiers);
    if (!status.ok()) {
        return status;
    }

    staking::RewardAccumulator accumulator(globals.staking, tiers);
    return accumulator.PendingRewards(*info, now, pending);
}

Status Ledger::HasTierCapability(const Address& account, const std::string& flag,
                                 bool* has) const {
    *has = false;

    std::optional<staking::StakerInfo> info;
    Status status = state_.GetStaker(account, &info);
    if (!status.ok() || !info || !info->IsStaking()) {
        return status;
    }

    staking::TierTable tiers;
    status = state_.GetTiers(&tiers);
    if (!status.ok()) {
        return status;
    }

    *has = tiers.HasCapability(info->tierIndex, flag);
    return Status::Ok();
}

Status Ledger::GetSchedule(const Address& beneficiary,
                           std::optional<vesting::VestingSchedule>* schedule) const {
    return state_.GetSchedule(beneficiary, schedule);
}

Status Ledger::GetReleasable(const Address& beneficiary, Timestamp now, Amount* releasable) const {
    std::optional<vesting::VestingSchedule> schedule;
    Status status = state_.GetSchedule(beneficiary, &schedule);
    if (!status.ok()) {
        return status;
    }
    *releasable = schedule ? vesting::Releasable(*schedule, now) : 0;
    return Status::Ok();
}

Status Ledger::GetTiers(staking::TierTable* tiers) const {
    return state_.GetTiers(tiers);
}

Status Ledger::GetGlobalState(state::GlobalState* globals) const {
    return LoadGlobals(state_, globals);
}

} // namespace ledger
} // namespace tokenledger
