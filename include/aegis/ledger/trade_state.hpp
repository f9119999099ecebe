#pragma once
// ============================================================================
// AEGIS TRADE CORE - Trade State Machine
// ============================================================================
// PENDING -> EXECUTING -> {FILLED | PARTIAL | FAILED | CANCELED}
// PENDING -> {FAILED | CANCELED}
// ============================================================================

#include "aegis/ledger/records.hpp"

namespace aegis::ledger {

[[nodiscard]] constexpr bool is_terminal(TradeStatus status) noexcept {
    return status == TradeStatus::Filled || status == TradeStatus::Partial ||
           status == TradeStatus::Failed || status == TradeStatus::Canceled;
}

[[nodiscard]] constexpr bool can_transition(TradeStatus from, TradeStatus to) noexcept {
    switch (from) {
        case TradeStatus::Pending:
            return to == TradeStatus::Executing || to == TradeStatus::Failed ||
                   to == TradeStatus::Canceled;
        case TradeStatus::Executing:
            return is_terminal(to);
        default:
            return false;
    }
}

/// Moves the trade to `to`; throws LedgerError on an illegal transition
void transition(Trade& trade, TradeStatus to);

}  // namespace aegis::ledger
