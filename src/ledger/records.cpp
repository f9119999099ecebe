// ============================================================================
// AEGIS TRADE CORE - Ledger Records Implementation
// ============================================================================

#include "aegis/ledger/records.hpp"

#include <atomic>

namespace aegis::ledger {

std::string_view to_string(PositionStatus status) noexcept {
    switch (status) {
        case PositionStatus::Open: return "OPEN";
        case PositionStatus::Closed: return "CLOSED";
        case PositionStatus::Liquidated: return "LIQUIDATED";
    }
    return "OPEN";
}

std::string_view to_string(TradeStatus status) noexcept {
    switch (status) {
        case TradeStatus::Pending: return "PENDING";
        case TradeStatus::Executing: return "EXECUTING";
        case TradeStatus::Filled: return "FILLED";
        case TradeStatus::Partial: return "PARTIAL";
        case TradeStatus::Failed: return "FAILED";
        case TradeStatus::Canceled: return "CANCELED";
    }
    return "PENDING";
}

std::string_view to_string(Operation operation) noexcept {
    switch (operation) {
        case Operation::Buy: return "Buy";
        case Operation::Sell: return "Sell";
        case Operation::Hold: return "Hold";
    }
    return "Hold";
}

std::optional<PositionStatus> parse_position_status(std::string_view text) noexcept {
    for (auto status : {PositionStatus::Open, PositionStatus::Closed, PositionStatus::Liquidated}) {
        if (to_string(status) == text) return status;
    }
    return std::nullopt;
}

std::optional<TradeStatus> parse_trade_status(std::string_view text) noexcept {
    for (auto status : {TradeStatus::Pending, TradeStatus::Executing, TradeStatus::Filled,
                        TradeStatus::Partial, TradeStatus::Failed, TradeStatus::Canceled}) {
        if (to_string(status) == text) return status;
    }
    return std::nullopt;
}

std::optional<Operation> parse_operation(std::string_view text) noexcept {
    for (auto operation : {Operation::Buy, Operation::Sell, Operation::Hold}) {
        if (to_string(operation) == text) return operation;
    }
    return std::nullopt;
}

std::string generate_record_id(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    std::string id(prefix);
    id += '-';
    id += std::to_string(to_epoch_ms(now()));
    id += '-';
    id += std::to_string(counter.fetch_add(1, std::memory_order_relaxed) + 1);
    return id;
}

}  // namespace aegis::ledger
