#pragma once
// ============================================================================
// AEGIS TRADE CORE - Execution Engine
// ============================================================================
// Carries one decision through its Trade lifecycle:
//   Buy  - guard pipeline, leverage, market buy, Position, protection orders
//   Sell - partial or full reduce-only exit of the OPEN Position
//   Hold - optional stop-loss / take-profit adjustment
// Guard rejections and gateway faults end as FAILED Trades, never as
// exceptions. Ledger faults propagate.
// ============================================================================

#include "aegis/exchange/gateway.hpp"
#include "aegis/execution/buy_guards.hpp"
#include "aegis/execution/decision.hpp"
#include "aegis/ledger/ledger_store.hpp"
#include "aegis/order/protection_orders.hpp"
#include "aegis/risk/account_profiler.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace aegis::execution {

// ============================================================================
// Configuration
// ============================================================================

struct ExecutionConfig {
    SafetyLimits limits;
    Duration daily_window = std::chrono::hours(24);
    Duration weekly_window = std::chrono::hours(24 * 7);
};

// ============================================================================
// Cycle Budget
// ============================================================================

/// Account state shared by every symbol of one cycle. Admitted buys debit it
/// so later symbols see earlier admissions.
struct CycleBudget {
    double total_equity = 0.0;
    double free_cash = 0.0;
    double open_notional = 0.0;

    [[nodiscard]] static CycleBudget from_profile(const risk::AccountRiskProfile& profile) noexcept {
        return CycleBudget{profile.total_equity, profile.free_cash, profile.risk.total_notional};
    }

    void admit(double margin, double notional) noexcept {
        free_cash -= margin;
        open_notional += notional;
    }
};

// ============================================================================
// Result
// ============================================================================

struct ExecutionResult {
    bool success = false;
    std::string trade_id;
    std::optional<std::string> order_id;
    std::optional<double> executed_price;
    std::optional<double> executed_amount;
    std::optional<std::string> error;
    std::optional<std::string> note;  // informational, set on successful no-ops
    std::optional<GuardRejection> rejection;  // set when a buy guard refused
};

// ============================================================================
// Engine
// ============================================================================

/// Trade note for a Hold adjustment that found no OPEN Position
inline constexpr std::string_view HOLD_WITHOUT_POSITION_NOTE =
    "No open position to update. Treated as Wait.";

class ExecutionEngine {
public:
    /// `gateway` is the live client or its DRY_RUN decorator
    ExecutionEngine(exchange::IExchangeGateway& gateway,
                    ledger::ILedgerStore& ledger,
                    ExecutionConfig config = ExecutionConfig{});

    /// Creates the Trade and runs the operation's pipeline.
    /// Throws DecisionInputError before creating anything when the
    /// operation's payload is missing.
    ExecutionResult execute(const Decision& decision,
                            Instrument instrument,
                            const risk::AccountRiskProfile& profile,
                            CycleBudget& budget);

    /// FAILED Hold Trade for a symbol that failed before its decision ran
    /// (unparseable decision, market data fault)
    std::string record_failed(Instrument instrument, std::string_view reason);

    /// CANCELED Trade for a symbol the cycle never reached
    std::string record_canceled(Instrument instrument, std::string_view reason);

    [[nodiscard]] const ExecutionConfig& config() const noexcept { return config_; }

private:
    ExecutionResult buy(ledger::Trade& trade,
                        const Decision& decision,
                        const risk::AccountRiskProfile& profile,
                        CycleBudget& budget);
    ExecutionResult sell(ledger::Trade& trade, const Decision& decision);
    ExecutionResult hold(ledger::Trade& trade, const Decision& decision);

    ExecutionResult fail(ledger::Trade& trade, std::string reason);
    ExecutionResult fill(ledger::Trade& trade);

    [[nodiscard]] double realized_pnl_since(Timestamp since);

    exchange::IExchangeGateway& gateway_;
    ledger::ILedgerStore& ledger_;
    ExecutionConfig config_;
    GuardPipeline<BuyContext> buy_guards_;
    order::ProtectionOrderManager protection_;
};

}  // namespace aegis::execution
