// TOKENLEDGER - Ledger Events
// Copyright (c) 2024 TOKENLEDGER Developers
// MIT License
//
// Structured notifications emitted after an operation commits. Events are
// informational; nothing in the ledger depends on them being consumed.

#ifndef TOKENLEDGER_LEDGER_EVENTS_H
#define TOKENLEDGER_LEDGER_EVENTS_H

#include "tokenledger/core/types.h"
#include "tokenledger/ledger/collaborators.h"

#include <string>

namespace tokenledger {
namespace ledger {

enum class EventType {
    Transfer,
    Approval,
    Mint,
    Burn,
    FeeDistributed,
    Staked,
    Unstaked,
    RewardsClaimed,
    TierAdded,
    TierUpdated,
    VestingCreated,
    TokensReleased,
    VestingRevoked,
    ParameterUpdated
};

/// Convert event type to string
const char* EventTypeToString(EventType type);

/**
 * One ledger event. Fields that do not apply to a type stay zero.
 *
 *   Transfer          subject=from counterparty=to amount=net fee=fee
 *   Approval          subject=owner counterparty=spender amount=allowance
 *   Mint / Burn       subject=account amount
 *   FeeDistributed    subject=payer burn/rewards/dev amounts, fee=total
 *   Staked            subject=staker amount tierIndex
 *   Unstaked          subject=staker amount=paid out fee=early fee tierIndex
 *   RewardsClaimed    subject=staker amount
 *   TierAdded/Updated tierIndex detail=tier name
 *   VestingCreated    subject=beneficiary counterparty=issuer amount
 *   TokensReleased    subject=beneficiary amount
 *   VestingRevoked    subject=beneficiary counterparty=issuer amount=returned
 *   ParameterUpdated  detail=parameter name, amount=new value where numeric
 */
struct LedgerEvent {
    EventType type{EventType::Transfer};
    Address subject;
    Address counterparty;
    Amount amount{0};
    Amount fee{0};
    Amount burnAmount{0};
    Amount rewardsAmount{0};
    Amount devAmount{0};
    uint32_t tierIndex{0};
    std::string detail;
    Timestamp timestamp{0};

    std::string ToString() const;
};

/// Event sink that writes each event to the ledger log category
class LogEventSink : public EventSink {
public:
    void OnEvent(const LedgerEvent& event) override;
};

} // namespace ledger
} // namespace tokenledger

#endif // TOKENLEDGER_LEDGER_EVENTS_H
