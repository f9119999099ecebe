#pragma once
// ============================================================================
// AEGIS TRADE CORE - Ledger Records
// ============================================================================
// Position and Trade records persisted by the ledger store
// ============================================================================

#include "aegis/core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace aegis::ledger {

// ============================================================================
// Errors
// ============================================================================

/// Storage fault or illegal record mutation
class LedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ============================================================================
// Enumerations
// ============================================================================

enum class PositionStatus : uint8_t {
    Open,
    Closed,
    Liquidated
};

enum class TradeStatus : uint8_t {
    Pending,
    Executing,
    Filled,
    Partial,
    Failed,
    Canceled
};

enum class Operation : uint8_t {
    Buy,
    Sell,
    Hold
};

[[nodiscard]] std::string_view to_string(PositionStatus status) noexcept;
[[nodiscard]] std::string_view to_string(TradeStatus status) noexcept;
[[nodiscard]] std::string_view to_string(Operation operation) noexcept;

[[nodiscard]] std::optional<PositionStatus> parse_position_status(std::string_view text) noexcept;
[[nodiscard]] std::optional<TradeStatus> parse_trade_status(std::string_view text) noexcept;

/// Accepts "Buy", "Sell", "Hold"
[[nodiscard]] std::optional<Operation> parse_operation(std::string_view text) noexcept;

inline constexpr std::string_view EXIT_REASON_MANUAL = "MANUAL";

// ============================================================================
// Position
// ============================================================================

/// At most one OPEN Position exists per instrument
struct Position {
    std::string id;
    Instrument instrument = Instrument::BTC;
    PositionStatus status = PositionStatus::Open;

    double entry_price = 0.0;
    double entry_amount = 0.0;  // remaining size, decreases on partial exits
    int entry_leverage = 1;
    std::string entry_order_id;

    std::optional<double> current_stop_loss;
    std::optional<double> current_take_profit;

    std::optional<double> exit_price;
    std::optional<double> exit_amount;
    std::string exit_reason;
    std::string exit_order_id;

    double realized_pnl = 0.0;  // running total across partial exits

    Timestamp opened_at;
    std::optional<Timestamp> closed_at;

    [[nodiscard]] bool is_open() const noexcept { return status == PositionStatus::Open; }
};

// ============================================================================
// Trade
// ============================================================================

/// One advisor decision and its execution outcome
struct Trade {
    std::string id;
    Instrument instrument = Instrument::BTC;
    Operation operation = Operation::Hold;
    TradeStatus status = TradeStatus::Pending;

    // Requested parameters
    std::optional<double> pricing;
    std::optional<double> amount;
    std::optional<int> leverage;
    std::optional<double> percentage;
    std::optional<double> stop_loss;
    std::optional<double> take_profit;

    // Execution
    std::optional<double> executed_price;
    std::optional<double> executed_amount;
    std::optional<Timestamp> executed_at;
    std::string order_id;
    std::string position_id;  // empty when not linked
    std::string error;
    std::string note;  // outcome remark on a successful Trade

    std::string chat;  // advisor rationale
    Timestamp created_at;
};

/// Unique record id: <prefix>-<epoch ms>-<sequence>
[[nodiscard]] std::string generate_record_id(std::string_view prefix);

}  // namespace aegis::ledger
