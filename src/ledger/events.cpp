// TOKENLEDGER - Ledger Events Implementation
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License

#include "tokenledger/ledger/events.h"
#include "tokenledger/util/logging.h"

#include <sstream>

namespace tokenledger {
namespace ledger {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::Transfer: return "Transfer";
        case EventType::Approval: return "Approval";
        case EventType::Mint: return "Mint";
        case EventType::Burn: return "Burn";
        case EventType::FeeDistributed: return "FeeDistributed";
        case EventType::Staked: return "Staked";
        case EventType::Unstaked: return "Unstaked";
        case EventType::RewardsClaimed: return "RewardsClaimed";
        case EventType::TierAdded: return "TierAdded";
        case EventType::TierUpdated: return "TierUpdated";
        case EventType::VestingCreated: return "VestingCreated";
        case EventType::TokensReleased: return "TokensReleased";
        case EventType::VestingRevoked: return "VestingRevoked";
        case EventType::ParameterUpdated: return "ParameterUpdated";
        default: return "Unknown";
    }
}

std::string LedgerEvent::ToString() const {
    std::ostringstream ss;
    ss << EventTypeToString(type) << "(t=" << timestamp;

    switch (type) {
        case EventType::Transfer:
        case EventType::Approval:
        case EventType::VestingCreated:
        case EventType::VestingRevoked:
            ss << ", " << subject.ToHex() << " -> " << counterparty.ToHex()
               << ", amount=" << amount;
            if (fee > 0) {
                ss << ", fee=" << fee;
            }
            break;
        case EventType::FeeDistributed:
            ss << ", payer=" << subject.ToHex()
               << ", burn=" << burnAmount
               << ", rewards=" << rewardsAmount
               << ", dev=" << devAmount;
            break;
        case EventType::Staked:
        case EventType::Unstaked:
            ss << ", " << subject.ToHex() << ", amount=" << amount
               << ", fee=" << fee << ", tier=" << tierIndex;
            break;
        case EventType::TierAdded:
        case EventType::TierUpdated:
            ss << ", index=" << tierIndex << ", name=" << detail;
            break;
        case EventType::ParameterUpdated:
            ss << ", " << detail << "=" << amount;
            break;
        default:
            ss << ", " << subject.ToHex() << ", amount=" << amount;
            break;
    }

    ss << ")";
    return ss.str();
}

void LogEventSink::OnEvent(const LedgerEvent& event) {
    LOG_INFO(util::LogCategory::LEDGER) << event.ToString();
}

} // namespace ledger
} // namespace tokenledger
