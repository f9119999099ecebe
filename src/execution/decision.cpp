// ============================================================================
// AEGIS TRADE CORE - Trading Decision Parser
// ============================================================================

#include "aegis/execution/decision.hpp"

#include <fmt/format.h>
#include <simdjson.h>

#include <cmath>

namespace aegis::execution {

namespace {

using simdjson::dom::element;
using simdjson::dom::element_type;
using simdjson::dom::object;

[[noreturn]] void fail(std::string_view message) {
    throw DecisionInputError(std::string(message));
}

/// Member lookup; nullopt when missing or null
std::optional<element> member(const object& obj, std::string_view key) {
    element value;
    const auto error = obj.at_key(key).get(value);
    if (error == simdjson::NO_SUCH_FIELD) return std::nullopt;
    if (error) fail(fmt::format("{}: {}", key, simdjson::error_message(error)));
    if (value.is_null()) return std::nullopt;
    return value;
}

element required(const object& obj, std::string_view key, std::string_view path) {
    auto value = member(obj, key);
    if (!value) fail(fmt::format("{}.{} is required", path, key));
    return *value;
}

double as_number(const element& value, std::string_view name) {
    if (!value.is_number()) fail(fmt::format("{} must be a number", name));
    double number = 0.0;
    if (value.get_double().get(number)) fail(fmt::format("{} is not representable", name));
    if (!std::isfinite(number)) fail(fmt::format("{} must be finite", name));
    return number;
}

int as_integer(const element& value, std::string_view name) {
    const double number = as_number(value, name);
    if (std::floor(number) != number || std::abs(number) > 1e6) {
        fail(fmt::format("{} must be an integer, got {}", name, number));
    }
    return static_cast<int>(number);
}

object as_object(const element& value, std::string_view name) {
    object obj;
    if (value.get_object().get(obj)) fail(fmt::format("{} must be an object", name));
    return obj;
}

BuyParams parse_buy(const object& obj) {
    BuyParams buy;
    buy.pricing = as_number(required(obj, "pricing", "buy"), "buy.pricing");
    buy.amount = as_number(required(obj, "amount", "buy"), "buy.amount");
    buy.leverage = as_integer(required(obj, "leverage", "buy"), "buy.leverage");
    return buy;
}

SellParams parse_sell(const object& obj) {
    SellParams sell;
    sell.percentage = as_number(required(obj, "percentage", "sell"), "sell.percentage");
    if (sell.percentage <= 0.0 || sell.percentage > 100.0) {
        fail(fmt::format("sell.percentage must be in (0, 100], got {}", sell.percentage));
    }
    return sell;
}

AdjustProfit parse_adjust_profit(const object& obj) {
    AdjustProfit adjust;
    if (const auto sl = member(obj, "stopLoss")) {
        adjust.stop_loss = as_number(*sl, "adjustProfit.stopLoss");
    }
    if (const auto tp = member(obj, "takeProfit")) {
        adjust.take_profit = as_number(*tp, "adjustProfit.takeProfit");
    }
    return adjust;
}

}  // namespace

Decision parse_decision(std::string_view json) {
    simdjson::dom::parser parser;
    const simdjson::padded_string padded(json);

    element root;
    if (const auto error = parser.parse(padded).get(root)) {
        fail(fmt::format("invalid JSON: {}", simdjson::error_message(error)));
    }
    const auto obj = as_object(root, "decision");

    Decision decision;

    std::string_view operation;
    if (required(obj, "operation", "decision").get_string().get(operation)) {
        fail("decision.operation must be a string");
    }
    const auto parsed = ledger::parse_operation(operation);
    if (!parsed) fail(fmt::format("unknown operation '{}'", operation));
    decision.operation = *parsed;

    std::string_view chat;
    if (required(obj, "chat", "decision").get_string().get(chat)) {
        fail("decision.chat must be a string");
    }
    decision.chat = std::string(chat);

    if (const auto buy = member(obj, "buy")) {
        decision.buy = parse_buy(as_object(*buy, "buy"));
    }
    if (const auto sell = member(obj, "sell")) {
        decision.sell = parse_sell(as_object(*sell, "sell"));
    }
    if (const auto adjust = member(obj, "adjustProfit")) {
        decision.adjust_profit = parse_adjust_profit(as_object(*adjust, "adjustProfit"));
    }

    return decision;
}

void require_operation_payload(const Decision& decision) {
    if (decision.operation == ledger::Operation::Buy && !decision.buy) {
        fail("Buy operation missing buy object");
    }
    if (decision.operation == ledger::Operation::Sell && !decision.sell) {
        fail("Sell operation missing sell object");
    }
}

}  // namespace aegis::execution
