// ============================================================================
// AEGIS TRADE CORE - Protection Orders Implementation
// ============================================================================

#include "aegis/order/protection_orders.hpp"

#include "aegis/utils/logger.hpp"

namespace aegis::order {

namespace {

// Positions are long; protection closes with the opposite side
constexpr Side CLOSE_SIDE = Side::Sell;

bool is_trigger(OrderType type) {
    return type == OrderType::StopMarket || type == OrderType::TakeProfitMarket;
}

}  // namespace

ProtectionOrderManager::ProtectionOrderManager(exchange::IExchangeGateway& gateway)
    : gateway_(gateway) {}

size_t ProtectionOrderManager::cancel_all(Instrument instrument) {
    size_t canceled = 0;
    for (const auto& order : gateway_.fetch_open_orders(instrument)) {
        if (!is_trigger(order.type)) continue;
        gateway_.cancel_order(order.order_id, instrument);
        LOG_DEBUG("Canceled {} {} on {}", to_string(order.type), order.order_id, pair_name(instrument));
        ++canceled;
    }
    return canceled;
}

ProtectionResult ProtectionOrderManager::replace(Instrument instrument, const ProtectionLevels& levels) {
    ProtectionResult result;
    result.canceled = cancel_all(instrument);

    if (levels.stop_loss) {
        const auto order = gateway_.create_protection_order(
            instrument, OrderType::StopMarket, CLOSE_SIDE, Price::from_double(*levels.stop_loss), true);
        result.stop_loss_order_id = order.order_id;
        LOG_INFO("Stop loss for {} at {} ({})", pair_name(instrument), *levels.stop_loss, order.order_id);
    }

    if (levels.take_profit) {
        const auto order = gateway_.create_protection_order(
            instrument, OrderType::TakeProfitMarket, CLOSE_SIDE,
            Price::from_double(*levels.take_profit), true);
        result.take_profit_order_id = order.order_id;
        LOG_INFO("Take profit for {} at {} ({})", pair_name(instrument), *levels.take_profit,
                 order.order_id);
    }

    return result;
}

}  // namespace aegis::order
