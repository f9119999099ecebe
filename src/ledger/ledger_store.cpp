// ============================================================================
// AEGIS TRADE CORE - Ledger Store Implementation
// ============================================================================

#include "aegis/ledger/ledger_store.hpp"

#include <algorithm>
#include <iterator>

namespace aegis::ledger {

namespace {

template <typename Record>
auto find_by_id(std::vector<Record>& records, const std::string& id) {
    return std::find_if(records.begin(), records.end(),
                        [&id](const Record& record) { return record.id == id; });
}

template <typename Record>
auto find_by_id(const std::vector<Record>& records, const std::string& id) {
    return std::find_if(records.begin(), records.end(),
                        [&id](const Record& record) { return record.id == id; });
}

bool is_closed(const Position& position) {
    return position.status != PositionStatus::Open && position.closed_at.has_value();
}

}  // namespace

// ============================================================================
// LedgerSnapshot
// ============================================================================

void LedgerSnapshot::insert_trade(const Trade& trade) {
    if (trade.id.empty()) {
        throw LedgerError("trade without id");
    }
    if (find_by_id(trades_, trade.id) != trades_.end()) {
        throw LedgerError("duplicate trade id " + trade.id);
    }
    trades_.push_back(trade);
}

void LedgerSnapshot::replace_trade(const Trade& trade) {
    auto it = find_by_id(trades_, trade.id);
    if (it == trades_.end()) {
        throw LedgerError("unknown trade id " + trade.id);
    }
    *it = trade;
}

void LedgerSnapshot::insert_position(const Position& position) {
    if (position.id.empty()) {
        throw LedgerError("position without id");
    }
    if (find_by_id(positions_, position.id) != positions_.end()) {
        throw LedgerError("duplicate position id " + position.id);
    }
    check_single_open(position);
    positions_.push_back(position);
}

void LedgerSnapshot::replace_position(const Position& position) {
    auto it = find_by_id(positions_, position.id);
    if (it == positions_.end()) {
        throw LedgerError("unknown position id " + position.id);
    }
    check_single_open(position);
    *it = position;
}

void LedgerSnapshot::upsert_trade(const Trade& trade) {
    auto it = find_by_id(trades_, trade.id);
    if (it == trades_.end()) {
        trades_.push_back(trade);
    } else {
        *it = trade;
    }
}

void LedgerSnapshot::upsert_position(const Position& position) {
    auto it = find_by_id(positions_, position.id);
    if (it == positions_.end()) {
        positions_.push_back(position);
    } else {
        *it = position;
    }
}

void LedgerSnapshot::check_single_open(const Position& position) const {
    if (!position.is_open()) return;
    for (const auto& existing : positions_) {
        if (existing.id != position.id && existing.is_open() &&
            existing.instrument == position.instrument) {
            throw LedgerError("instrument " + pair_name(position.instrument) +
                              " already has open position " + existing.id);
        }
    }
}

std::optional<Position> LedgerSnapshot::find_open_position(Instrument instrument) const {
    const auto it = std::find_if(positions_.begin(), positions_.end(), [instrument](const Position& p) {
        return p.is_open() && p.instrument == instrument;
    });
    if (it == positions_.end()) return std::nullopt;
    return *it;
}

std::vector<Position> LedgerSnapshot::open_positions() const {
    std::vector<Position> out;
    std::copy_if(positions_.begin(), positions_.end(), std::back_inserter(out),
                 [](const Position& p) { return p.is_open(); });
    return out;
}

std::vector<Position> LedgerSnapshot::closed_positions() const {
    std::vector<Position> out;
    std::copy_if(positions_.begin(), positions_.end(), std::back_inserter(out), is_closed);
    std::stable_sort(out.begin(), out.end(), [](const Position& a, const Position& b) {
        return *a.closed_at < *b.closed_at;
    });
    return out;
}

std::vector<Position> LedgerSnapshot::closed_positions_since(Timestamp since) const {
    auto out = closed_positions();
    out.erase(std::remove_if(out.begin(), out.end(),
                             [since](const Position& p) { return *p.closed_at < since; }),
              out.end());
    return out;
}

std::optional<Trade> LedgerSnapshot::get_trade(const std::string& id) const {
    const auto it = find_by_id(trades_, id);
    if (it == trades_.end()) return std::nullopt;
    return *it;
}

std::optional<Position> LedgerSnapshot::get_position(const std::string& id) const {
    const auto it = find_by_id(positions_, id);
    if (it == positions_.end()) return std::nullopt;
    return *it;
}

// ============================================================================
// InMemoryLedgerStore
// ============================================================================

void InMemoryLedgerStore::create_trade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_.insert_trade(trade);
}

void InMemoryLedgerStore::update_trade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_.replace_trade(trade);
}

void InMemoryLedgerStore::create_position(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_.insert_position(position);
}

void InMemoryLedgerStore::update_position(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshot_.replace_position(position);
}

std::optional<Position> InMemoryLedgerStore::find_open_position(Instrument instrument) {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_.find_open_position(instrument);
}

std::vector<Position> InMemoryLedgerStore::open_positions() {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_.open_positions();
}

std::vector<Position> InMemoryLedgerStore::closed_positions() {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_.closed_positions();
}

std::vector<Position> InMemoryLedgerStore::closed_positions_since(Timestamp since) {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_.closed_positions_since(since);
}

std::optional<Trade> InMemoryLedgerStore::get_trade(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_.get_trade(id);
}

std::optional<Position> InMemoryLedgerStore::get_position(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_.get_position(id);
}

std::vector<Trade> InMemoryLedgerStore::trades() {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_.trades();
}

}  // namespace aegis::ledger
