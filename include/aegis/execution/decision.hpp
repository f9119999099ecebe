#pragma once
// ============================================================================
// AEGIS TRADE CORE - Trading Decision
// ============================================================================
// Strictly parsed advisor decision:
// {operation, buy?: {pricing, amount, leverage}, sell?: {percentage},
//  adjustProfit?: {stopLoss?, takeProfit?}, chat}
// ============================================================================

#include "aegis/ledger/records.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace aegis::execution {

/// Malformed or incomplete decision input
class DecisionInputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct BuyParams {
    double pricing = 0.0;  // advisor's reference price, informational
    double amount = 0.0;   // base-asset quantity
    int leverage = 1;
};

struct SellParams {
    double percentage = 100.0;  // (0, 100]
};

struct AdjustProfit {
    std::optional<double> stop_loss;
    std::optional<double> take_profit;

    [[nodiscard]] bool empty() const noexcept { return !stop_loss && !take_profit; }
};

struct Decision {
    ledger::Operation operation = ledger::Operation::Hold;
    std::optional<BuyParams> buy;
    std::optional<SellParams> sell;
    std::optional<AdjustProfit> adjust_profit;
    std::string chat;

    [[nodiscard]] std::optional<double> stop_loss() const {
        return adjust_profit ? adjust_profit->stop_loss : std::nullopt;
    }
    [[nodiscard]] std::optional<double> take_profit() const {
        return adjust_profit ? adjust_profit->take_profit : std::nullopt;
    }
};

/// Type errors, unknown operations, non-integer leverage and a percentage
/// outside (0, 100] throw DecisionInputError. Unknown keys are ignored and
/// a null optional member counts as absent.
[[nodiscard]] Decision parse_decision(std::string_view json);

/// Throws DecisionInputError for a Buy without `buy` or a Sell without `sell`
void require_operation_payload(const Decision& decision);

}  // namespace aegis::execution
