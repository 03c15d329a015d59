// TOKENLEDGER - Ledger Configuration Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/ledger/ledger_config.h"
#include "tokenledger/util/logging.h"

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <stdexcept>
#include <utility>

namespace tokenledger {
namespace ledger {

namespace {

/// Read an unsigned key; absent keys leave *value untouched
Status ReadUInt(const util::ConfigManager& config, const std::string& key,
                const std::string& section, uint64_t* value) {
    if (!config.HasKey(key, section)) {
        return Status::Ok();
    }
    auto parsed = config.TryGetUInt(key, section);
    if (!parsed) {
        std::string where = section.empty() ? key : section + "." + key;
        return Status::InvalidAmount("'" + where + "' is not an unsigned integer");
    }
    *value = *parsed;
    return Status::Ok();
}

Status ReadRatio(const util::ConfigManager& config, const std::string& key, uint32_t* ratio) {
    uint64_t value = *ratio;
    Status status = ReadUInt(config, key, "", &value);
    if (!status.ok()) {
        return Status::InvalidRatio(status.message());
    }
    if (value > PERCENT_DENOMINATOR) {
        return Status::InvalidRatio("'" + key + "' exceeds 100");
    }
    *ratio = static_cast<uint32_t>(value);
    return Status::Ok();
}

Status ReadTier(const util::ConfigManager& config, const std::string& section,
                staking::Tier* tier) {
    tier->name = config.GetString(util::ConfigKeys::TIER_NAME, "", section);
    if (tier->name.empty()) {
        return Status::InvalidTier("[" + section + "] has no name");
    }

    uint64_t minimum = 0;
    Status status = ReadUInt(config, util::ConfigKeys::TIER_MINIMUMSTAKE, section, &minimum);
    if (!status.ok()) {
        return Status::InvalidTier(status.message());
    }
    tier->minimumStake = minimum;

    uint64_t multiplier = staking::BASE_MULTIPLIER_BPS;
    status = ReadUInt(config, util::ConfigKeys::TIER_MULTIPLIERBPS, section, &multiplier);
    if (!status.ok()) {
        return Status::InvalidTier(status.message());
    }
    tier->rewardMultiplierBps = multiplier;

    tier->capabilities.clear();
    for (const auto& flag : config.GetList(util::ConfigKeys::TIER_CAPABILITIES, section)) {
        if (!flag.empty()) {
            tier->capabilities.insert(flag);
        }
    }
    return Status::Ok();
}

} // namespace

Status ParseAddress(const std::string& text, Address* address) {
    try {
        *address = Address::FromHex(util::ConfigManager::Trim(text));
    } catch (const std::invalid_argument& e) {
        return Status::InvalidAddress("'" + text + "': " + e.what());
    }
    return Status::Ok();
}

void RegisterLedgerConfigKeys(util::ConfigManager& config) {
    using namespace util::ConfigKeys;

    for (const char* key : {CONF, DATADIR, DEBUG, LOGFILE, LOGLEVEL, PRINTTOCONSOLE,
                            TRANSFERFEEBPS, BURNRATIO, REWARDSRATIO, DEVRATIO,
                            DEVWALLET, FEEEXEMPT, REWARDRATE, MINSTAKINGDURATION,
                            EARLYUNSTAKEFEEBPS}) {
        config.AllowKey(key);
    }
    for (const char* key : {TIER_NAME, TIER_MINIMUMSTAKE, TIER_MULTIPLIERBPS,
                            TIER_CAPABILITIES}) {
        config.AllowSectionKey(TIER_SECTION_PREFIX, key);
    }
}

Status LoadLedgerConfig(const util::ConfigManager& config, LedgerParams* params) {
    using namespace util::ConfigKeys;

    LedgerParams result;

    // Fees
    Status status = ReadUInt(config, TRANSFERFEEBPS, "", &result.transferFeeBps);
    if (!status.ok()) {
        return status;
    }
    if (result.transferFeeBps > economics::MAX_TRANSFER_FEE_BPS) {
        return Status::InvalidAmount("transferfeebps exceeds " +
                                     std::to_string(economics::MAX_TRANSFER_FEE_BPS));
    }

    status = ReadRatio(config, BURNRATIO, &result.feeDistribution.burnRatio);
    if (status.ok()) status = ReadRatio(config, REWARDSRATIO, &result.feeDistribution.rewardsRatio);
    if (status.ok()) status = ReadRatio(config, DEVRATIO, &result.feeDistribution.devRatio);
    if (!status.ok()) {
        return status;
    }
    if (!result.feeDistribution.IsValid()) {
        return Status::InvalidRatio(result.feeDistribution.ToString() + " does not sum to 100");
    }

    if (auto wallet = config.TryGetString(DEVWALLET)) {
        status = ParseAddress(*wallet, &result.devWallet);
        if (!status.ok()) {
            return status;
        }
        if (IsInternalAddress(result.devWallet)) {
            return Status::InvalidAddress("devwallet must be an external account");
        }
    }

    for (const auto& entry : config.GetList(FEEEXEMPT)) {
        Address account;
        status = ParseAddress(entry, &account);
        if (!status.ok()) {
            return status;
        }
        result.feeExempt.push_back(account);
    }

    // Staking
    status = ReadUInt(config, REWARDRATE, "", &result.staking.rewardRatePerSecondPerUnit);
    if (!status.ok()) {
        return status;
    }

    uint64_t minDuration = static_cast<uint64_t>(result.staking.minStakingDuration);
    status = ReadUInt(config, MINSTAKINGDURATION, "", &minDuration);
    if (!status.ok()) {
        return status;
    }
    if (minDuration > static_cast<uint64_t>(INT64_MAX)) {
        return Status::InvalidAmount("minstakingduration out of range");
    }
    result.staking.minStakingDuration = static_cast<Duration>(minDuration);

    status = ReadUInt(config, EARLYUNSTAKEFEEBPS, "", &result.staking.earlyUnstakeFeeBps);
    if (!status.ok()) {
        return status;
    }
    if (result.staking.earlyUnstakeFeeBps > staking::MAX_EARLY_UNSTAKE_FEE_BPS) {
        return Status::InvalidAmount("earlyunstakefeebps exceeds " +
                                     std::to_string(staking::MAX_EARLY_UNSTAKE_FEE_BPS));
    }

    // Tiers, ordered by the numeric section suffix
    std::vector<std::pair<uint64_t, std::string>> tierSections;
    const std::string prefix = TIER_SECTION_PREFIX;
    for (const auto& section : config.GetSections()) {
        if (section.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        std::string suffix = section.substr(prefix.size());
        if (suffix.empty() ||
            !std::all_of(suffix.begin(), suffix.end(), [](char c) { return c >= '0' && c <= '9'; }) ||
            suffix.size() > 9) {
            return Status::InvalidTier("[" + section + "] must be numbered");
        }
        tierSections.emplace_back(std::stoull(suffix), section);
    }
    std::sort(tierSections.begin(), tierSections.end());

    staking::TierTable table;
    for (const auto& [index, section] : tierSections) {
        staking::Tier tier;
        status = ReadTier(config, section, &tier);
        if (!status.ok()) {
            return status;
        }
        status = table.AddTier(tier);
        if (!status.ok()) {
            return status;
        }
        result.tiers.push_back(tier);
    }

    LOG_DEBUG(util::LogCategory::CONFIG) << "Ledger config: fee=" << result.transferFeeBps
                                         << " bps, " << result.feeDistribution.ToString()
                                         << ", rate=" << result.staking.rewardRatePerSecondPerUnit
                                         << ", " << result.tiers.size() << " tiers";

    *params = std::move(result);
    return Status::Ok();
}

} // namespace ledger
} // namespace tokenledger
