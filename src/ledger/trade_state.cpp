// ============================================================================
// AEGIS TRADE CORE - Trade State Machine Implementation
// ============================================================================

#include "aegis/ledger/trade_state.hpp"

#include "aegis/utils/logger.hpp"

namespace aegis::ledger {

void transition(Trade& trade, TradeStatus to) {
    if (!can_transition(trade.status, to)) {
        throw LedgerError(fmt::format("trade {}: illegal transition {} -> {}", trade.id,
                                      to_string(trade.status), to_string(to)));
    }
    LOG_DEBUG("Trade {} [{} {}] {} -> {}", trade.id, to_string(trade.operation),
              pair_name(trade.instrument), to_string(trade.status), to_string(to));
    trade.status = to;
}

}  // namespace aegis::ledger
