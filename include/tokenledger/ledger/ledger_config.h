// TOKENLEDGER - Ledger Configuration
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Maps configuration file keys onto initial ledger parameters.
//
// Example:
//   transferfeebps=100
//   burnratio=50
//   rewardsratio=25
//   devratio=25
//   devwallet=0x00112233445566778899aabbccddeeff00112233
//   feeexempt=0x...,0x...
//
//   [tier.0]
//   name=Bronze
//   minimumstake=100
//   multiplierbps=10000
//   capabilities=vote

#ifndef TOKENLEDGER_LEDGER_LEDGER_CONFIG_H
#define TOKENLEDGER_LEDGER_LEDGER_CONFIG_H

#include "tokenledger/core/status.h"
#include "tokenledger/ledger/ledger.h"
#include "tokenledger/util/config.h"

namespace tokenledger {
namespace ledger {

/// Register every ledger key with the manager's validator
void RegisterLedgerConfigKeys(util::ConfigManager& config);

/**
 * Build ledger parameters from configuration. Missing keys keep their
 * defaults; malformed values are reported as InvalidAmount, InvalidRatio,
 * InvalidAddress or InvalidTier. Tiers are read from [tier.N] sections in
 * ascending N.
 */
Status LoadLedgerConfig(const util::ConfigManager& config, LedgerParams* params);

/// Parse a 40 hex digit address, optionally 0x-prefixed
Status ParseAddress(const std::string& text, Address* address);

} // namespace ledger
} // namespace tokenledger

#endif // TOKENLEDGER_LEDGER_LEDGER_CONFIG_H
