#pragma once
// ============================================================================
// AEGIS TRADE CORE - Protection Orders
// ============================================================================
// Stop-loss / take-profit trigger orders guarding an open long position.
// Placement is cancel-then-recreate: resting triggers for the instrument are
// cancelled before the new pair is submitted.
// ============================================================================

#include "aegis/exchange/gateway.hpp"

#include <optional>
#include <string>

namespace aegis::order {

struct ProtectionLevels {
    std::optional<double> stop_loss;
    std::optional<double> take_profit;

    [[nodiscard]] bool empty() const noexcept { return !stop_loss && !take_profit; }
};

struct ProtectionResult {
    std::string stop_loss_order_id;    // empty when not placed
    std::string take_profit_order_id;  // empty when not placed
    size_t canceled = 0;
};

class ProtectionOrderManager {
public:
    explicit ProtectionOrderManager(exchange::IExchangeGateway& gateway);

    /// Cancel resting triggers, then place reduce-only close-position orders
    /// for the supplied levels. Throws GatewayError.
    ProtectionResult replace(Instrument instrument, const ProtectionLevels& levels);

    /// Cancel every resting STOP_MARKET / TAKE_PROFIT_MARKET order; returns the count
    size_t cancel_all(Instrument instrument);

private:
    exchange::IExchangeGateway& gateway_;
};

}  // namespace aegis::order
