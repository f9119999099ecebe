#pragma once
// ============================================================================
// AEGIS TRADE CORE - Ledger Store
// ============================================================================
// Persistent Trade/Position store contract and the in-memory implementation
// ============================================================================

#include "aegis/ledger/records.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace aegis::ledger {

// ============================================================================
// Store Interface
// ============================================================================

class ILedgerStore {
public:
    virtual ~ILedgerStore() = default;

    virtual void create_trade(const Trade& trade) = 0;
    virtual void update_trade(const Trade& trade) = 0;

    /// Throws LedgerError if the instrument already has an OPEN position
    virtual void create_position(const Position& position) = 0;
    virtual void update_position(const Position& position) = 0;

    [[nodiscard]] virtual std::optional<Position> find_open_position(Instrument instrument) = 0;
    [[nodiscard]] virtual std::vector<Position> open_positions() = 0;

    /// CLOSED and LIQUIDATED positions, oldest close first
    [[nodiscard]] virtual std::vector<Position> closed_positions() = 0;
    [[nodiscard]] virtual std::vector<Position> closed_positions_since(Timestamp since) = 0;

    [[nodiscard]] virtual std::optional<Trade> get_trade(const std::string& id) = 0;
    [[nodiscard]] virtual std::optional<Position> get_position(const std::string& id) = 0;

    /// All trades in creation order
    [[nodiscard]] virtual std::vector<Trade> trades() = 0;
};

// ============================================================================
// Ledger Snapshot
// ============================================================================

/// Materialized record set; enforces the store's integrity rules
class LedgerSnapshot {
public:
    void insert_trade(const Trade& trade);
    void replace_trade(const Trade& trade);
    void insert_position(const Position& position);
    void replace_position(const Position& position);

    /// Last write wins; used when replaying persisted history
    void upsert_trade(const Trade& trade);
    void upsert_position(const Position& position);

    [[nodiscard]] std::optional<Position> find_open_position(Instrument instrument) const;
    [[nodiscard]] std::vector<Position> open_positions() const;
    [[nodiscard]] std::vector<Position> closed_positions() const;
    [[nodiscard]] std::vector<Position> closed_positions_since(Timestamp since) const;
    [[nodiscard]] std::optional<Trade> get_trade(const std::string& id) const;
    [[nodiscard]] std::optional<Position> get_position(const std::string& id) const;
    [[nodiscard]] const std::vector<Trade>& trades() const noexcept { return trades_; }

private:
    void check_single_open(const Position& position) const;

    std::vector<Trade> trades_;
    std::vector<Position> positions_;
};

// ============================================================================
// In-Memory Store
// ============================================================================

class InMemoryLedgerStore : public ILedgerStore {
public:
    void create_trade(const Trade& trade) override;
    void update_trade(const Trade& trade) override;
    void create_position(const Position& position) override;
    void update_position(const Position& position) override;

    [[nodiscard]] std::optional<Position> find_open_position(Instrument instrument) override;
    [[nodiscard]] std::vector<Position> open_positions() override;
    [[nodiscard]] std::vector<Position> closed_positions() override;
    [[nodiscard]] std::vector<Position> closed_positions_since(Timestamp since) override;
    [[nodiscard]] std::optional<Trade> get_trade(const std::string& id) override;
    [[nodiscard]] std::optional<Position> get_position(const std::string& id) override;
    [[nodiscard]] std::vector<Trade> trades() override;

private:
    std::mutex mutex_;
    LedgerSnapshot snapshot_;
};

}  // namespace aegis::ledger
