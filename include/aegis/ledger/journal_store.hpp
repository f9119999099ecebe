#pragma once
// ============================================================================
// AEGIS TRADE CORE - Journal Ledger Store
// ============================================================================
// Append-only tab-separated journal. Each create/update appends one record;
// every query replays the file, the last record per id wins. Nothing is
// cached between calls so each cycle observes the persisted state.
// ============================================================================

#include "aegis/ledger/ledger_store.hpp"

#include <mutex>
#include <string>

namespace aegis::ledger {

class JournalLedgerStore : public ILedgerStore {
public:
    /// Creates the parent directory and the file if missing; throws LedgerError
    explicit JournalLedgerStore(std::string file_path);

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

    [[nodiscard]] const std::string& file_path() const noexcept { return file_path_; }

private:
    [[nodiscard]] LedgerSnapshot replay() const;
    void append_line(const std::string& line) const;

    std::string file_path_;
    std::mutex mutex_;
};

// ============================================================================
// Record codec
// ============================================================================

[[nodiscard]] std::string serialize_trade(const Trade& trade);
[[nodiscard]] std::string serialize_position(const Position& position);

/// Escapes backslash, tab, CR and LF so a field stays on one line
[[nodiscard]] std::string escape_field(std::string_view text);
[[nodiscard]] std::string unescape_field(std::string_view text);

}  // namespace aegis::ledger
