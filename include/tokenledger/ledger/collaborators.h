// TOKENLEDGER - Ledger Collaborators
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Interfaces the ledger consults before and after each operation. Role
// storage, the pause switch and event consumers live outside the ledger.

#ifndef TOKENLEDGER_LEDGER_COLLABORATORS_H
#define TOKENLEDGER_LEDGER_COLLABORATORS_H

#include "tokenledger/core/types.h"

#include <map>
#include <set>

namespace tokenledger {
namespace ledger {

struct LedgerEvent;

// ============================================================================
// Roles
// ============================================================================

enum class Role {
    /// Fee, duration and exemption parameters
    Admin,

    /// Token issuance
    Minter,

    /// Tier list changes
    TierManager,

    /// Staking reward rate
    RateManager,

    /// Vesting schedule creation and revocation
    VestingManager
};

/// Convert role to string
const char* RoleToString(Role role);

// ============================================================================
// Collaborator Interfaces
// ============================================================================

class AccessControl {
public:
    virtual ~AccessControl() = default;
    virtual bool HasRole(const Address& caller, Role role) const = 0;
};

class PauseGate {
public:
    virtual ~PauseGate() = default;
    virtual bool IsPaused() const = 0;
};

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void OnEvent(const LedgerEvent& event) = 0;
};

// ============================================================================
// Basic Implementations
// ============================================================================

/// Grants every role to every caller
class AllowAllAccessControl : public AccessControl {
public:
    bool HasRole(const Address& /*caller*/, Role /*role*/) const override { return true; }
};

/// Explicit role assignments
class RoleTable : public AccessControl {
public:
    void Grant(const Address& account, Role role) { roles_[account].insert(role); }
    void Revoke(const Address& account, Role role);

    bool HasRole(const Address& caller, Role role) const override;

private:
    std::map<Address, std::set<Role>> roles_;
};

/// In-process pause flag
class PauseSwitch : public PauseGate {
public:
    void SetPaused(bool paused) { paused_ = paused; }
    bool IsPaused() const override { return paused_; }

private:
    bool paused_{false};
};

} // namespace ledger
} // namespace tokenledger

#endif // TOKENLEDGER_LEDGER_COLLABORATORS_H
