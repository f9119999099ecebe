// ============================================================================
// AEGIS TRADE CORE - DRY_RUN Gateway Implementation
// ============================================================================

#include "aegis/exchange/dry_run_gateway.hpp"

#include "aegis/utils/logger.hpp"

#include <algorithm>
#include <iterator>

namespace aegis::exchange {

DryRunGateway::DryRunGateway(IExchangeGateway& inner) : inner_(inner) {}

// ============================================================================
// Reads
// ============================================================================

Balance DryRunGateway::fetch_balance(std::string_view asset) {
    return inner_.fetch_balance(asset);
}

std::vector<LivePosition> DryRunGateway::fetch_positions(std::span<const Instrument> instruments) {
    return inner_.fetch_positions(instruments);
}

Ticker DryRunGateway::fetch_ticker(Instrument instrument) {
    return inner_.fetch_ticker(instrument);
}

PriceSeries DryRunGateway::fetch_ohlcv(Instrument instrument, std::string_view timeframe, int limit) {
    return inner_.fetch_ohlcv(instrument, timeframe, limit);
}

OpenInterest DryRunGateway::fetch_open_interest(Instrument instrument) {
    return inner_.fetch_open_interest(instrument);
}

FundingRate DryRunGateway::fetch_funding_rate(Instrument instrument) {
    return inner_.fetch_funding_rate(instrument);
}

// ============================================================================
// Simulated mutations
// ============================================================================

void DryRunGateway::set_leverage(Instrument instrument, int leverage) {
    LOG_INFO("[DRY_RUN] set leverage {}x on {}", leverage, pair_name(instrument));
}

OrderResult DryRunGateway::create_market_order(Instrument instrument, Side side, Quantity amount,
                                               bool reduce_only) {
    const double price = inner_.fetch_ticker(instrument).last;

    OrderResult result;
    result.order_id = next_order_id();
    result.instrument = instrument;
    result.side = side;
    result.type = OrderType::Market;
    result.average_price = price;
    result.filled = amount.to_double();
    result.reduce_only = reduce_only;

    LOG_INFO("[DRY_RUN] {} {} {} @ {} -> {}", to_string(side), amount.to_double(),
             pair_name(instrument), price, result.order_id);
    return result;
}

OrderResult DryRunGateway::create_protection_order(Instrument instrument, OrderType type, Side side,
                                                   Price stop_price, bool reduce_only) {
    if (type == OrderType::Market) {
        throw GatewayError("create_protection_order: MARKET is not a trigger order type");
    }

    OrderResult result;
    result.order_id = next_order_id();
    result.instrument = instrument;
    result.side = side;
    result.type = type;
    result.stop_price = stop_price.to_double();
    result.reduce_only = reduce_only;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        book_.push_back(OpenOrder{result.order_id, instrument, side, type, result.stop_price, 0.0,
                                  reduce_only});
    }

    LOG_INFO("[DRY_RUN] {} {} {} trigger={} -> {}", to_string(type), to_string(side),
             pair_name(instrument), result.stop_price, result.order_id);
    return result;
}

std::vector<OpenOrder> DryRunGateway::fetch_open_orders(Instrument instrument) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OpenOrder> orders;
    std::copy_if(book_.begin(), book_.end(), std::back_inserter(orders),
                 [instrument](const OpenOrder& order) { return order.instrument == instrument; });
    return orders;
}

void DryRunGateway::cancel_order(const std::string& order_id, Instrument instrument) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = std::find_if(book_.begin(), book_.end(), [&](const OpenOrder& order) {
        return order.order_id == order_id && order.instrument == instrument;
    });
    if (it == book_.end()) {
        throw GatewayError("[DRY_RUN] unknown order " + order_id, 400);
    }
    book_.erase(it);
    LOG_INFO("[DRY_RUN] canceled {} on {}", order_id, pair_name(instrument));
}

std::string DryRunGateway::next_order_id() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::string(DRY_RUN_PREFIX) + std::to_string(to_epoch_ms(now())) + "_" +
           std::to_string(++sequence_);
}

}  // namespace aegis::exchange
