// TOKENLEDGER - Ledger Collaborators Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/ledger/collaborators.h"

namespace tokenledger {
namespace ledger {

const char* RoleToString(Role role) {
    switch (role) {
        case Role::Admin: return "Admin";
        case Role::Minter: return "Minter";
        case Role::TierManager: return "TierManager";
        case Role::RateManager: return "RateManager";
        case Role::VestingManager: return "VestingManager";
        default: return "Unknown";
    }
}

void RoleTable::Revoke(const Address& account, Role role) {
    auto it = roles_.find(account);
    if (it == roles_.end()) {
        return;
    }
    it->second.erase(role);
    if (it->second.empty()) {
        roles_.erase(it);
    }
}

bool RoleTable::HasRole(const Address& caller, Role role) const {
    auto it = roles_.find(caller);
    return it != roles_.end() && it->second.count(role) > 0;
}

} // namespace ledger
} // namespace tokenledger
