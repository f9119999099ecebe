// ============================================================================
// AEGIS TRADE CORE - Journal Ledger Store Implementation
// ============================================================================
// Record layout (one per line, tab separated, empty field = absent):
//   TRADE    id instrument operation status pricing amount leverage
//            percentage stop_loss take_profit executed_price executed_amount
//            executed_at order_id position_id error note chat
//            created_at
//   POSITION id instrument status entry_price entry_amount entry_leverage
//            entry_order_id stop_loss take_profit exit_price exit_amount
//            exit_reason exit_order_id realized_pnl opened_at closed_at
// Timestamps are nanoseconds since the Unix epoch.
// ============================================================================

#include "aegis/ledger/journal_store.hpp"

#include "aegis/utils/logger.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace aegis::ledger {

namespace {

constexpr std::string_view TRADE_TAG = "TRADE";
constexpr std::string_view POSITION_TAG = "POSITION";
constexpr size_t TRADE_FIELDS = 20;
constexpr size_t POSITION_FIELDS = 17;

// ============================================================================
// Field writers
// ============================================================================

class RecordWriter {
public:
    explicit RecordWriter(std::string_view tag) : line_(tag) {}

    RecordWriter& text(std::string_view value) {
        line_ += '\t';
        line_ += escape_field(value);
        return *this;
    }

    RecordWriter& number(double value) {
        line_ += '\t';
        line_ += fmt::format("{}", value);
        return *this;
    }

    RecordWriter& number(std::optional<double> value) {
        if (!value) return text("");
        return number(*value);
    }

    RecordWriter& integer(std::optional<int64_t> value) {
        line_ += '\t';
        if (value) line_ += std::to_string(*value);
        return *this;
    }

    RecordWriter& time(std::optional<Timestamp> value) {
        if (!value) return integer(std::nullopt);
        return integer(value->time_since_epoch().count());
    }

    [[nodiscard]] std::string str() const { return line_; }

private:
    std::string line_;
};

// ============================================================================
// Field readers
// ============================================================================

std::vector<std::string_view> split_tabs(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        const auto tab = line.find('\t', start);
        if (tab == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, tab - start));
        start = tab + 1;
    }
    return fields;
}

class RecordReader {
public:
    RecordReader(const std::vector<std::string_view>& fields, size_t line_no)
        : fields_(fields), line_no_(line_no) {}

    std::string text() { return unescape_field(next()); }

    double number() {
        const auto value = optional_number();
        if (!value) fail("missing numeric field");
        return *value;
    }

    std::optional<double> optional_number() {
        const auto field = next();
        if (field.empty()) return std::nullopt;
        try {
            return std::stod(std::string(field));
        } catch (const std::exception&) {
            fail("bad number '" + std::string(field) + "'");
        }
    }

    std::optional<int64_t> optional_integer() {
        const auto field = next();
        if (field.empty()) return std::nullopt;
        try {
            return std::stoll(std::string(field));
        } catch (const std::exception&) {
            fail("bad integer '" + std::string(field) + "'");
        }
    }

    std::optional<Timestamp> optional_time() {
        const auto ns = optional_integer();
        if (!ns) return std::nullopt;
        return Timestamp{Duration{*ns}};
    }

    Timestamp time() {
        const auto value = optional_time();
        if (!value) fail("missing timestamp");
        return *value;
    }

    Instrument instrument() {
        const auto field = next();
        const auto parsed = parse_instrument(field);
        if (!parsed) fail("unknown instrument '" + std::string(field) + "'");
        return *parsed;
    }

    template <typename Enum, typename Parser>
    Enum enumeration(Parser parser, std::string_view what) {
        const auto field = next();
        const auto parsed = parser(field);
        if (!parsed) fail("unknown " + std::string(what) + " '" + std::string(field) + "'");
        return *parsed;
    }

    [[noreturn]] void fail(const std::string& reason) const {
        throw LedgerError(fmt::format("journal line {}: {}", line_no_, reason));
    }

private:
    std::string_view next() {
        if (index_ >= fields_.size()) fail("truncated record");
        return fields_[index_++];
    }

    const std::vector<std::string_view>& fields_;
    size_t line_no_;
    size_t index_ = 1;  // skip tag
};

Trade parse_trade(RecordReader& in) {
    Trade trade;
    trade.id = in.text();
    trade.instrument = in.instrument();
    trade.operation = in.enumeration<Operation>(parse_operation, "operation");
    trade.status = in.enumeration<TradeStatus>(parse_trade_status, "trade status");
    trade.pricing = in.optional_number();
    trade.amount = in.optional_number();
    if (const auto leverage = in.optional_integer()) trade.leverage = static_cast<int>(*leverage);
    trade.percentage = in.optional_number();
    trade.stop_loss = in.optional_number();
    trade.take_profit = in.optional_number();
    trade.executed_price = in.optional_number();
    trade.executed_amount = in.optional_number();
    trade.executed_at = in.optional_time();
    trade.order_id = in.text();
    trade.position_id = in.text();
    trade.error = in.text();
    trade.note = in.text();
    trade.chat = in.text();
    trade.created_at = in.time();
    return trade;
}

Position parse_position(RecordReader& in) {
    Position position;
    position.id = in.text();
    position.instrument = in.instrument();
    position.status = in.enumeration<PositionStatus>(parse_position_status, "position status");
    position.entry_price = in.number();
    position.entry_amount = in.number();
    const auto leverage = in.optional_integer();
    if (!leverage) in.fail("missing leverage");
    position.entry_leverage = static_cast<int>(*leverage);
    position.entry_order_id = in.text();
    position.current_stop_loss = in.optional_number();
    position.current_take_profit = in.optional_number();
    position.exit_price = in.optional_number();
    position.exit_amount = in.optional_number();
    position.exit_reason = in.text();
    position.exit_order_id = in.text();
    position.realized_pnl = in.number();
    position.opened_at = in.time();
    position.closed_at = in.optional_time();
    return position;
}

}  // namespace

// ============================================================================
// Record codec
// ============================================================================

std::string escape_field(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string unescape_field(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        if (text[i] != '\\' || i + 1 == text.size()) {
            out += text[i];
            continue;
        }
        switch (text[++i]) {
            case 't': out += '\t'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            default: out += text[i]; break;
        }
    }
    return out;
}

std::string serialize_trade(const Trade& trade) {
    std::optional<int64_t> leverage;
    if (trade.leverage) leverage = *trade.leverage;

    return RecordWriter(TRADE_TAG)
        .text(trade.id)
        .text(pair_name(trade.instrument))
        .text(to_string(trade.operation))
        .text(to_string(trade.status))
        .number(trade.pricing)
        .number(trade.amount)
        .integer(leverage)
        .number(trade.percentage)
        .number(trade.stop_loss)
        .number(trade.take_profit)
        .number(trade.executed_price)
        .number(trade.executed_amount)
        .time(trade.executed_at)
        .text(trade.order_id)
        .text(trade.position_id)
        .text(trade.error)
        .text(trade.note)
        .text(trade.chat)
        .time(trade.created_at)
        .str();
}

std::string serialize_position(const Position& position) {
    return RecordWriter(POSITION_TAG)
        .text(position.id)
        .text(pair_name(position.instrument))
        .text(to_string(position.status))
        .number(position.entry_price)
        .number(position.entry_amount)
        .integer(position.entry_leverage)
        .text(position.entry_order_id)
        .number(position.current_stop_loss)
        .number(position.current_take_profit)
        .number(position.exit_price)
        .number(position.exit_amount)
        .text(position.exit_reason)
        .text(position.exit_order_id)
        .number(position.realized_pnl)
        .time(position.opened_at)
        .time(position.closed_at)
        .str();
}

// ============================================================================
// JournalLedgerStore
// ============================================================================

JournalLedgerStore::JournalLedgerStore(std::string file_path) : file_path_(std::move(file_path)) {
    const std::filesystem::path path(file_path_);
    const auto parent = path.parent_path();
    std::error_code ec;
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw LedgerError("cannot create journal directory " + parent.string() + ": " + ec.message());
        }
    }

    std::ofstream touch(file_path_, std::ios::app);
    if (!touch.is_open()) {
        throw LedgerError("cannot open journal " + file_path_);
    }
    LOG_INFO("Ledger journal: {}", file_path_);
}

LedgerSnapshot JournalLedgerStore::replay() const {
    std::ifstream in(file_path_);
    if (!in.is_open()) {
        throw LedgerError("cannot read journal " + file_path_);
    }

    LedgerSnapshot snapshot;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        const auto fields = split_tabs(line);
        RecordReader reader(fields, line_no);
        if (fields.front() == TRADE_TAG) {
            if (fields.size() != TRADE_FIELDS) reader.fail("trade record field count");
            snapshot.upsert_trade(parse_trade(reader));
        } else if (fields.front() == POSITION_TAG) {
            if (fields.size() != POSITION_FIELDS) reader.fail("position record field count");
            snapshot.upsert_position(parse_position(reader));
        } else {
            reader.fail("unknown record type '" + std::string(fields.front()) + "'");
        }
    }
    if (in.bad()) {
        throw LedgerError("I/O error reading journal " + file_path_);
    }
    return snapshot;
}

void JournalLedgerStore::append_line(const std::string& line) const {
    std::ofstream out(file_path_, std::ios::app);
    if (!out.is_open()) {
        throw LedgerError("cannot open journal " + file_path_);
    }
    out << line << '\n';
    out.flush();
    if (!out.good()) {
        throw LedgerError("write to journal " + file_path_ + " failed");
    }
}

void JournalLedgerStore::create_trade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    replay().insert_trade(trade);
    append_line(serialize_trade(trade));
}

void JournalLedgerStore::update_trade(const Trade& trade) {
    std::lock_guard<std::mutex> lock(mutex_);
    replay().replace_trade(trade);
    append_line(serialize_trade(trade));
}

void JournalLedgerStore::create_position(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    replay().insert_position(position);
    append_line(serialize_position(position));
}

void JournalLedgerStore::update_position(const Position& position) {
    std::lock_guard<std::mutex> lock(mutex_);
    replay().replace_position(position);
    append_line(serialize_position(position));
}

std::optional<Position> JournalLedgerStore::find_open_position(Instrument instrument) {
    std::lock_guard<std::mutex> lock(mutex_);
    return replay().find_open_position(instrument);
}

std::vector<Position> JournalLedgerStore::open_positions() {
    std::lock_guard<std::mutex> lock(mutex_);
    return replay().open_positions();
}

std::vector<Position> JournalLedgerStore::closed_positions() {
    std::lock_guard<std::mutex> lock(mutex_);
    return replay().closed_positions();
}

std::vector<Position> JournalLedgerStore::closed_positions_since(Timestamp since) {
    std::lock_guard<std::mutex> lock(mutex_);
    return replay().closed_positions_since(since);
}

std::optional<Trade> JournalLedgerStore::get_trade(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return replay().get_trade(id);
}

std::optional<Position> JournalLedgerStore::get_position(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return replay().get_position(id);
}

std::vector<Trade> JournalLedgerStore::trades() {
    std::lock_guard<std::mutex> lock(mutex_);
    return replay().trades();
}

}  // namespace aegis::ledger
