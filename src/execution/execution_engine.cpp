// ============================================================================
// AEGIS TRADE CORE - Execution Engine Implementation
// ============================================================================

#include "aegis/execution/execution_engine.hpp"

#include "aegis/ledger/trade_state.hpp"
#include "aegis/utils/logger.hpp"

#include <algorithm>

namespace aegis::execution {

using ledger::Operation;
using ledger::TradeStatus;

ExecutionEngine::ExecutionEngine(exchange::IExchangeGateway& gateway,
                                 ledger::ILedgerStore& ledger,
                                 ExecutionConfig config)
    : gateway_(gateway)
    , ledger_(ledger)
    , config_(config)
    , buy_guards_(make_buy_pipeline(config_.limits))
    , protection_(gateway) {}

// ============================================================================
// Entry Point
// ============================================================================

ExecutionResult ExecutionEngine::execute(const Decision& decision,
                                         Instrument instrument,
                                         const risk::AccountRiskProfile& profile,
                                         CycleBudget& budget) {
    require_operation_payload(decision);

    ledger::Trade trade;
    trade.id = ledger::generate_record_id("trade");
    trade.instrument = instrument;
    trade.operation = decision.operation;
    trade.chat = decision.chat;
    trade.stop_loss = decision.stop_loss();
    trade.take_profit = decision.take_profit();
    trade.created_at = now();
    if (decision.operation == Operation::Buy) {
        trade.pricing = decision.buy->pricing;
        trade.amount = decision.buy->amount;
        trade.leverage = decision.buy->leverage;
    } else if (decision.operation == Operation::Sell) {
        trade.percentage = decision.sell->percentage;
    }
    ledger_.create_trade(trade);

    ledger::transition(trade, TradeStatus::Executing);
    ledger_.update_trade(trade);

    try {
        switch (decision.operation) {
            case Operation::Buy: return buy(trade, decision, profile, budget);
            case Operation::Sell: return sell(trade, decision);
            case Operation::Hold: return hold(trade, decision);
        }
        return fail(trade, "Unsupported operation");
    } catch (const exchange::GatewayError& e) {
        LOG_ERROR("{} {} failed at the exchange (status {}): {}", to_string(trade.operation),
                  pair_name(instrument), e.status_code(), e.what());
        if (ledger::is_terminal(trade.status)) throw;
        return fail(trade, e.what());
    } catch (const std::exception& e) {
        LOG_ERROR("{} {} failed: {}", to_string(trade.operation), pair_name(instrument), e.what());
        if (ledger::is_terminal(trade.status)) throw;
        return fail(trade, e.what());
    }
}

// ============================================================================
// Buy
// ============================================================================

ExecutionResult ExecutionEngine::buy(ledger::Trade& trade,
                                     const Decision& decision,
                                     const risk::AccountRiskProfile& profile,
                                     CycleBudget& budget) {
    const auto& params = *decision.buy;
    const auto instrument = trade.instrument;

    BuyContext ctx;
    ctx.instrument = instrument;
    ctx.entry_price = gateway_.fetch_ticker(instrument).last;
    ctx.amount = params.amount;
    ctx.leverage = params.leverage;
    ctx.stop_loss = decision.stop_loss();
    ctx.take_profit = decision.take_profit();

    ctx.total_equity = budget.total_equity;
    ctx.free_cash = budget.free_cash;
    ctx.open_notional = budget.open_notional;

    const auto open = ledger_.open_positions();
    ctx.open_positions = open.size();
    ctx.has_open_position = std::any_of(open.begin(), open.end(), [instrument](const auto& p) {
        return p.instrument == instrument;
    });

    const auto at = now();
    ctx.daily_realized_pnl = realized_pnl_since(at - config_.daily_window);
    ctx.weekly_realized_pnl = realized_pnl_since(at - config_.weekly_window);

    ctx.trading_mode = profile.trading_mode;
    ctx.mode_max_leverage = profile.max_leverage;
    ctx.mode_max_risk = profile.max_risk_pct;
    ctx.mode_max_positions = profile.max_positions;

    if (auto rejection = buy_guards_.run(ctx)) {
        LOG_WARN("Buy {} rejected by guard {} ({}): {}", pair_name(instrument), rejection->index,
                 rejection->guard, rejection->reason);
        auto result = fail(trade, rejection->reason);
        result.rejection = std::move(*rejection);
        return result;
    }
    LOG_INFO("Buy {} admitted: {} @ ~{} with {}x, margin ${:.2f}", pair_name(instrument), ctx.amount,
             ctx.entry_price, ctx.leverage, ctx.margin());

    gateway_.set_leverage(instrument, params.leverage);
    const auto order =
        gateway_.create_market_order(instrument, Side::Buy, Quantity::from_double(params.amount), false);
    if (order.filled <= 0.0 || order.average_price <= 0.0) {
        throw exchange::GatewayError(fmt::format("market buy {} returned no fill", order.order_id));
    }

    const double notional = order.average_price * order.filled;
    budget.admit(notional / params.leverage, notional);

    trade.order_id = order.order_id;
    trade.executed_price = order.average_price;
    trade.executed_amount = order.filled;
    ledger_.update_trade(trade);

    ledger::Position position;
    position.id = ledger::generate_record_id("pos");
    position.instrument = instrument;
    position.entry_price = order.average_price;
    position.entry_amount = order.filled;
    position.entry_leverage = params.leverage;
    position.entry_order_id = order.order_id;
    position.current_stop_loss = ctx.stop_loss;
    position.current_take_profit = ctx.take_profit;
    position.opened_at = now();
    try {
        ledger_.create_position(position);
    } catch (const ledger::LedgerError& e) {
        LOG_CRITICAL("Buy {} filled by order {} ({} @ {}) but no position was recorded: {}",
                     pair_name(instrument), order.order_id, order.filled, order.average_price, e.what());
        throw ledger::LedgerError(
            fmt::format("Order {} filled without a position record: {}", order.order_id, e.what()));
    }

    trade.position_id = position.id;
    auto result = fill(trade);
    LOG_INFO("Bought {} {} @ {} ({}), position {}", order.filled, pair_name(instrument),
             order.average_price, order.order_id, position.id);

    const order::ProtectionLevels levels{ctx.stop_loss, ctx.take_profit};
    if (!levels.empty()) {
        try {
            protection_.replace(instrument, levels);
        } catch (const exchange::GatewayError& e) {
            LOG_ERROR("Protection orders for {} failed after fill: {}", pair_name(instrument), e.what());
            trade.error = fmt::format("Protection orders failed: {}", e.what());
            ledger_.update_trade(trade);
            result.error = trade.error;
        }
    }
    return result;
}

// ============================================================================
// Sell
// ============================================================================

ExecutionResult ExecutionEngine::sell(ledger::Trade& trade, const Decision& decision) {
    const auto instrument = trade.instrument;
    const auto position = ledger_.find_open_position(instrument);
    if (!position) {
        return fail(trade, fmt::format("No open position found for {}", pair_name(instrument)));
    }

    const double percentage = decision.sell->percentage;
    const auto held = Quantity::from_double(position->entry_amount);
    auto quantity = percentage >= 100.0 ? held
                                        : Quantity::from_double(position->entry_amount * percentage / 100.0);
    if (!quantity.is_valid()) {
        return fail(trade, fmt::format("Sell of {}% of {} {} rounds to zero", percentage,
                                       position->entry_amount, pair_name(instrument)));
    }
    if (quantity.raw() > held.raw()) quantity = held;

    const auto order = gateway_.create_market_order(instrument, Side::Sell, quantity, true);
    if (order.filled <= 0.0) {
        throw exchange::GatewayError(fmt::format("market sell {} returned no fill", order.order_id));
    }

    const double pnl = (order.average_price - position->entry_price) * order.filled * position->entry_leverage;

    // A remainder below one quantity step cannot be sold again and closes the position
    const auto remaining = held - Quantity::from_double(order.filled);
    const bool full_exit = !remaining.is_valid();

    auto updated = *position;
    updated.realized_pnl += pnl;
    if (full_exit) {
        updated.status = ledger::PositionStatus::Closed;
        updated.exit_price = order.average_price;
        updated.exit_amount = order.filled;
        updated.exit_order_id = order.order_id;
        updated.exit_reason = std::string(ledger::EXIT_REASON_MANUAL);
        updated.closed_at = now();
    } else {
        updated.entry_amount = remaining.to_double();
    }
    ledger_.update_position(updated);

    LOG_INFO("Sold {}% of {}: {} @ {} ({}), P&L {:+.2f}, {}", percentage, pair_name(instrument),
             order.filled, order.average_price, order.order_id, pnl,
             full_exit ? std::string("position closed") : fmt::format("{} remaining", updated.entry_amount));

    trade.order_id = order.order_id;
    trade.executed_price = order.average_price;
    trade.executed_amount = order.filled;
    trade.position_id = position->id;
    auto result = fill(trade);

    if (full_exit) {
        try {
            const auto canceled = protection_.cancel_all(instrument);
            LOG_DEBUG("Canceled {} protection orders for closed {}", canceled, pair_name(instrument));
        } catch (const exchange::GatewayError& e) {
            LOG_ERROR("Canceling protection orders for {} failed: {}", pair_name(instrument), e.what());
            trade.error = fmt::format("Protection order cleanup failed: {}", e.what());
            ledger_.update_trade(trade);
            result.error = trade.error;
        }
    }
    return result;
}

// ============================================================================
// Hold
// ============================================================================

ExecutionResult ExecutionEngine::hold(ledger::Trade& trade, const Decision& decision) {
    const auto instrument = trade.instrument;
    if (!decision.adjust_profit || decision.adjust_profit->empty()) {
        LOG_INFO("Hold {}: no action", pair_name(instrument));
        return fill(trade);
    }

    const auto position = ledger_.find_open_position(instrument);
    if (!position) {
        LOG_INFO("Hold {}: no open position, adjustment treated as wait", pair_name(instrument));
        trade.note = std::string(HOLD_WITHOUT_POSITION_NOTE);
        return fill(trade);
    }

    const auto& adjust = *decision.adjust_profit;
    const order::ProtectionLevels levels{
        adjust.stop_loss ? adjust.stop_loss : position->current_stop_loss,
        adjust.take_profit ? adjust.take_profit : position->current_take_profit};
    const auto placed = protection_.replace(instrument, levels);

    auto updated = *position;
    if (adjust.stop_loss) updated.current_stop_loss = adjust.stop_loss;
    if (adjust.take_profit) updated.current_take_profit = adjust.take_profit;
    ledger_.update_position(updated);

    LOG_INFO("Hold {}: protection updated (SL {}, TP {}, {} canceled)", pair_name(instrument),
             placed.stop_loss_order_id.empty() ? "-" : placed.stop_loss_order_id,
             placed.take_profit_order_id.empty() ? "-" : placed.take_profit_order_id, placed.canceled);

    trade.position_id = position->id;
    return fill(trade);
}

// ============================================================================
// Bookkeeping
// ============================================================================

std::string ExecutionEngine::record_failed(Instrument instrument, std::string_view reason) {
    ledger::Trade trade;
    trade.id = ledger::generate_record_id("trade");
    trade.instrument = instrument;
    trade.operation = Operation::Hold;
    trade.created_at = now();
    ledger_.create_trade(trade);

    ledger::transition(trade, TradeStatus::Failed);
    trade.error = std::string(reason);
    ledger_.update_trade(trade);
    return trade.id;
}

std::string ExecutionEngine::record_canceled(Instrument instrument, std::string_view reason) {
    ledger::Trade trade;
    trade.id = ledger::generate_record_id("trade");
    trade.instrument = instrument;
    trade.operation = Operation::Hold;
    trade.created_at = now();
    ledger_.create_trade(trade);

    ledger::transition(trade, TradeStatus::Canceled);
    trade.error = std::string(reason);
    ledger_.update_trade(trade);
    return trade.id;
}

ExecutionResult ExecutionEngine::fail(ledger::Trade& trade, std::string reason) {
    ledger::transition(trade, TradeStatus::Failed);
    trade.error = std::move(reason);
    ledger_.update_trade(trade);

    ExecutionResult result;
    result.trade_id = trade.id;
    result.error = trade.error;
    return result;
}

ExecutionResult ExecutionEngine::fill(ledger::Trade& trade) {
    ledger::transition(trade, TradeStatus::Filled);
    trade.executed_at = now();
    ledger_.update_trade(trade);

    ExecutionResult result;
    result.success = true;
    result.trade_id = trade.id;
    if (!trade.order_id.empty()) result.order_id = trade.order_id;
    result.executed_price = trade.executed_price;
    result.executed_amount = trade.executed_amount;
    if (!trade.error.empty()) result.error = trade.error;
    if (!trade.note.empty()) result.note = trade.note;
    return result;
}

double ExecutionEngine::realized_pnl_since(Timestamp since) {
    double total = 0.0;
    for (const auto& position : ledger_.closed_positions_since(since)) {
        total += position.realized_pnl;
    }
    return total;
}

}  // namespace aegis::execution
