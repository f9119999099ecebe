// ============================================================================
// AEGIS TRADE CORE - Binance Futures Client Implementation
// ============================================================================
// REST gateway: account, market data and order endpoints
// ============================================================================

#include "aegis/exchange/binance/client.hpp"

#include "aegis/utils/logger.hpp"

#include <simdjson.h>

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <optional>
#include <sstream>

namespace aegis::exchange::binance {

namespace {

// ============================================================================
// JSON Parsing Helpers
// ============================================================================

/// Binance sends most decimals as strings
double to_number(simdjson::ondemand::value value) {
    if (value.type().value() == simdjson::ondemand::json_type::string) {
        return std::stod(std::string(value.get_string().value()));
    }
    return value.get_double().value();
}

Side parse_side(std::string_view str) {
    return str == "BUY" ? Side::Buy : Side::Sell;
}

std::optional<OrderType> parse_order_type(std::string_view str) {
    if (str == "MARKET") return OrderType::Market;
    if (str == "STOP_MARKET") return OrderType::StopMarket;
    if (str == "TAKE_PROFIT_MARKET") return OrderType::TakeProfitMarket;
    return std::nullopt;
}

bool parse_flag(simdjson::ondemand::value value) {
    if (value.type().value() == simdjson::ondemand::json_type::string) {
        return value.get_string().value() == "true";
    }
    return value.get_bool().value();
}

/// Order ids arrive as JSON integers or strings depending on the endpoint
std::string to_id(simdjson::ondemand::value value) {
    if (value.type().value() == simdjson::ondemand::json_type::string) {
        return std::string(value.get_string().value());
    }
    return std::to_string(value.get_int64().value());
}

std::string truncate(std::string text, size_t limit = 512) {
    if (text.size() > limit) text.resize(limit);
    return text;
}

}  // namespace

std::string format_number(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(8) << value;
    std::string s = oss.str();
    s.erase(s.find_last_not_of('0') + 1, std::string::npos);
    if (!s.empty() && s.back() == '.') {
        s.pop_back();
    }
    return s;
}

// ============================================================================
// Binance Client Implementation
// ============================================================================

struct BinanceClient::Impl {
    BinanceConfig config_;
    std::unique_ptr<network::IRestClient> rest_client_;

    Impl(const BinanceConfig& config, std::unique_ptr<network::IRestClient> rest_client)
        : config_(config), rest_client_(std::move(rest_client)) {
        if (!rest_client_) {
            network::RestClientConfig rest_config;
            rest_config.base_url = config_.rest_url();
            rest_config.api_key = config_.api_key;
            rest_config.secret_key = config_.secret_key;
            rest_config.requests_per_minute = config_.requests_per_minute;
            rest_client_ = std::make_unique<network::RestClient>(rest_config);
        }
    }

    network::HttpRequest make_request(network::HttpMethod method, std::string path, bool sign) const {
        network::HttpRequest req;
        req.method = method;
        req.path = std::move(path);
        req.sign = sign;
        req.recv_window = config_.recv_window_ms;
        return req;
    }

    /// Executes the request; any non-2xx answer becomes a GatewayError
    std::string send(const network::HttpRequest& req, std::string_view operation) {
        auto response = rest_client_->request(req);
        if (response.status_code == -1) {
            throw GatewayError(fmt::format("{}: transport failure: {}", operation, response.body), -1);
        }
        if (!response.is_success()) {
            throw GatewayError(fmt::format("{} failed ({}): {}", operation, response.status_code,
                                           truncate(response.body)),
                               response.status_code);
        }
        return std::move(response.body);
    }

    /// Runs a simdjson visitor over a response body, converting parse failures
    template <typename Fn>
    auto parse(const std::string& body, std::string_view operation, Fn&& visit) {
        try {
            // Parser per call: the gateway is shared by concurrent cycle workers
            simdjson::ondemand::parser parser;
            simdjson::padded_string padded(body);
            simdjson::ondemand::document doc = parser.iterate(padded);
            return visit(doc);
        } catch (const GatewayError&) {
            throw;
        } catch (const std::exception& e) {
            throw GatewayError(fmt::format("{}: malformed response: {}", operation, e.what()));
        }
    }

    // ========================================================================
    // Account
    // ========================================================================

    Balance fetch_balance(std::string_view asset) {
        const auto body = send(make_request(network::HttpMethod::GET, "/fapi/v2/balance", true),
                               "fetch_balance");

        auto found = parse(body, "fetch_balance", [&](simdjson::ondemand::document& doc) {
            std::optional<Balance> result;
            for (auto entry : doc.get_array()) {
                auto obj = entry.get_object().value();
                if (obj["asset"].get_string().value() != asset) continue;

                const double wallet = to_number(obj["balance"].value());
                const double unrealized = to_number(obj["crossUnPnl"].value());
                const double available = to_number(obj["availableBalance"].value());
                result = Balance{std::string(asset), available, wallet + unrealized};
            }
            return result;
        });

        if (!found) {
            throw GatewayError(fmt::format("fetch_balance: no {} balance on account", asset));
        }
        return *found;
    }

    std::vector<LivePosition> fetch_positions(std::span<const Instrument> instruments) {
        const auto body = send(make_request(network::HttpMethod::GET, "/fapi/v2/positionRisk", true),
                               "fetch_positions");

        return parse(body, "fetch_positions", [&](simdjson::ondemand::document& doc) {
            std::vector<LivePosition> positions;
            for (auto entry : doc.get_array()) {
                auto obj = entry.get_object().value();

                const auto instrument = parse_instrument(obj["symbol"].get_string().value());
                if (!instrument) continue;
                if (std::find(instruments.begin(), instruments.end(), *instrument) == instruments.end()) {
                    continue;
                }

                const double amount = to_number(obj["positionAmt"].value());
                if (std::abs(amount) < 1e-9) continue;  // flat

                LivePosition position;
                position.instrument = *instrument;
                position.side = amount > 0 ? Side::Buy : Side::Sell;
                position.contracts = std::abs(amount);
                position.entry_price = to_number(obj["entryPrice"].value());
                position.mark_price = to_number(obj["markPrice"].value());
                position.unrealized_pnl = to_number(obj["unRealizedProfit"].value());
                position.liquidation_price = to_number(obj["liquidationPrice"].value());
                position.leverage = to_number(obj["leverage"].value());
                position.notional = std::abs(to_number(obj["notional"].value()));
                position.initial_margin =
                    position.leverage > 0.0 ? position.notional / position.leverage : position.notional;
                positions.push_back(position);
            }
            return positions;
        });
    }

    // ========================================================================
    // Market Data
    // ========================================================================

    Ticker fetch_ticker(Instrument instrument) {
        auto req = make_request(network::HttpMethod::GET, "/fapi/v1/ticker/price", false);
        req.query_params["symbol"] = exchange_symbol(instrument);
        const auto body = send(req, "fetch_ticker");

        return parse(body, "fetch_ticker", [&](simdjson::ondemand::document& doc) {
            Ticker ticker;
            ticker.instrument = instrument;
            ticker.last = to_number(doc["price"].value());
            ticker.timestamp = from_epoch_ms(doc["time"].get_int64().value());
            return ticker;
        });
    }

    PriceSeries fetch_ohlcv(Instrument instrument, std::string_view timeframe, int limit) {
        auto req = make_request(network::HttpMethod::GET, "/fapi/v1/klines", false);
        req.query_params["symbol"] = exchange_symbol(instrument);
        req.query_params["interval"] = std::string(timeframe);
        req.query_params["limit"] = std::to_string(limit);
        const auto body = send(req, "fetch_ohlcv");

        return parse(body, "fetch_ohlcv", [&](simdjson::ondemand::document& doc) {
            PriceSeries series;
            series.reserve(static_cast<size_t>(std::max(limit, 0)));
            for (auto row : doc.get_array()) {
                // [openTime, open, high, low, close, volume, closeTime, ...]
                Candle candle;
                size_t column = 0;
                for (auto field : row.get_array()) {
                    auto value = field.value();
                    switch (column) {
                        case 0: candle.open_time = from_epoch_ms(value.get_int64().value()); break;
                        case 1: candle.open = to_number(value); break;
                        case 2: candle.high = to_number(value); break;
                        case 3: candle.low = to_number(value); break;
                        case 4: candle.close = to_number(value); break;
                        case 5: candle.volume = to_number(value); break;
                        default: break;
                    }
                    ++column;
                }
                if (column < 6) {
                    throw GatewayError(fmt::format("fetch_ohlcv: kline with {} columns", column));
                }
                series.push_back(candle);
            }
            return series;
        });
    }

    OpenInterest fetch_open_interest(Instrument instrument) {
        auto req = make_request(network::HttpMethod::GET, "/fapi/v1/openInterest", false);
        req.query_params["symbol"] = exchange_symbol(instrument);
        const auto body = send(req, "fetch_open_interest");

        return parse(body, "fetch_open_interest", [&](simdjson::ondemand::document& doc) {
            OpenInterest oi;
            oi.instrument = instrument;
            oi.amount = to_number(doc["openInterest"].value());
            oi.timestamp = from_epoch_ms(doc["time"].get_int64().value());
            return oi;
        });
    }

    FundingRate fetch_funding_rate(Instrument instrument) {
        auto req = make_request(network::HttpMethod::GET, "/fapi/v1/premiumIndex", false);
        req.query_params["symbol"] = exchange_symbol(instrument);
        const auto body = send(req, "fetch_funding_rate");

        return parse(body, "fetch_funding_rate", [&](simdjson::ondemand::document& doc) {
            FundingRate funding;
            funding.instrument = instrument;
            funding.rate = to_number(doc["lastFundingRate"].value());
            funding.next_funding_time = from_epoch_ms(doc["nextFundingTime"].get_int64().value());
            return funding;
        });
    }

    // ========================================================================
    // Trading
    // ========================================================================

    void set_leverage(Instrument instrument, int leverage) {
        auto req = make_request(network::HttpMethod::POST, "/fapi/v1/leverage", true);
        req.query_params["symbol"] = exchange_symbol(instrument);
        req.query_params["leverage"] = std::to_string(leverage);
        send(req, "set_leverage");
    }

    OrderResult create_market_order(Instrument instrument, Side side, Quantity amount, bool reduce_only) {
        auto req = make_request(network::HttpMethod::POST, "/fapi/v1/order", true);
        req.query_params["symbol"] = exchange_symbol(instrument);
        req.query_params["side"] = std::string(to_string(side));
        req.query_params["type"] = "MARKET";
        req.query_params["quantity"] = format_number(amount.to_double());
        req.query_params["newOrderRespType"] = "RESULT";
        if (reduce_only) {
            req.query_params["reduceOnly"] = "true";
        }

        LOG_DEBUG("Placing MARKET {} {} qty={}", to_string(side), exchange_symbol(instrument),
                  format_number(amount.to_double()));
        const auto body = send(req, "create_market_order");

        auto result = parse(body, "create_market_order", [&](simdjson::ondemand::document& doc) {
            OrderResult order;
            order.order_id = to_id(doc["orderId"].value());
            order.instrument = instrument;
            order.side = side;
            order.type = OrderType::Market;
            order.average_price = to_number(doc["avgPrice"].value());
            order.filled = to_number(doc["executedQty"].value());
            order.reduce_only = reduce_only;
            return order;
        });

        // Testnet occasionally reports avgPrice 0 for an immediate fill
        if (result.average_price <= 0.0) {
            result.average_price = fetch_ticker(instrument).last;
            LOG_WARN("Order {} returned no average price, using ticker {}", result.order_id,
                     result.average_price);
        }
        return result;
    }

    OrderResult create_protection_order(Instrument instrument, OrderType type, Side side,
                                        Price stop_price, bool reduce_only) {
        if (type == OrderType::Market) {
            throw GatewayError("create_protection_order: MARKET is not a trigger order type");
        }

        // Conditional orders are served by the algo order service
        auto req = make_request(network::HttpMethod::POST, "/fapi/v1/algoOrder", true);
        req.query_params["symbol"] = exchange_symbol(instrument);
        req.query_params["side"] = std::string(to_string(side));
        req.query_params["type"] = std::string(to_string(type));
        req.query_params["algoType"] = "CONDITIONAL";
        req.query_params["triggerPrice"] = format_number(stop_price.to_double());
        if (reduce_only) {
            // closePosition implies reduce-only and excludes the reduceOnly flag
            req.query_params["closePosition"] = "true";
        }

        LOG_DEBUG("Placing {} {} {} trigger={}", to_string(type), to_string(side),
                  exchange_symbol(instrument), format_number(stop_price.to_double()));
        const auto body = send(req, "create_protection_order");

        return parse(body, "create_protection_order", [&](simdjson::ondemand::document& doc) {
            OrderResult order;
            order.order_id = std::string(ALGO_ORDER_PREFIX) + to_id(doc["algoId"].value());
            order.instrument = instrument;
            order.side = side;
            order.type = type;
            order.stop_price = stop_price.to_double();
            order.reduce_only = reduce_only;
            return order;
        });
    }

    std::vector<OpenOrder> fetch_open_orders(Instrument instrument) {
        std::vector<OpenOrder> orders;

        auto regular = make_request(network::HttpMethod::GET, "/fapi/v1/openOrders", true);
        regular.query_params["symbol"] = exchange_symbol(instrument);
        append_open_orders(send(regular, "fetch_open_orders"), instrument, false, orders);

        auto algo = make_request(network::HttpMethod::GET, "/fapi/v1/openAlgoOrders", true);
        algo.query_params["symbol"] = exchange_symbol(instrument);
        append_open_orders(send(algo, "fetch_open_algo_orders"), instrument, true, orders);

        return orders;
    }

    void cancel_order(const std::string& order_id, Instrument instrument) {
        const bool is_algo = order_id.rfind(ALGO_ORDER_PREFIX, 0) == 0;

        auto req = make_request(network::HttpMethod::DEL,
                                is_algo ? "/fapi/v1/algoOrder" : "/fapi/v1/order", true);
        if (is_algo) {
            req.query_params["algoId"] = order_id.substr(ALGO_ORDER_PREFIX.size());
        } else {
            req.query_params["symbol"] = exchange_symbol(instrument);
            req.query_params["orderId"] = order_id;
        }
        send(req, "cancel_order");
    }

private:
    void append_open_orders(const std::string& body, Instrument instrument, bool algo,
                            std::vector<OpenOrder>& out) {
        parse(body, algo ? "fetch_open_algo_orders" : "fetch_open_orders",
              [&](simdjson::ondemand::document& doc) {
            for (auto entry : doc.get_array()) {
                OpenOrder order;
                order.instrument = instrument;
                std::optional<OrderType> type;
                bool close_position = false;

                // Field names differ between the two services; walk whatever is present
                for (auto field : entry.get_object()) {
                    const std::string_view key = field.unescaped_key().value();
                    auto value = field.value().value();
                    if (key == "orderId" || key == "algoId") {
                        order.order_id = to_id(value);
                    } else if (key == "side") {
                        order.side = parse_side(value.get_string().value());
                    } else if (key == "type" || key == "orderType") {
                        type = parse_order_type(value.get_string().value());
                    } else if (key == "stopPrice" || key == "triggerPrice") {
                        order.stop_price = to_number(value);
                    } else if (key == "origQty" || key == "quantity") {
                        order.amount = to_number(value);
                    } else if (key == "reduceOnly") {
                        order.reduce_only = parse_flag(value);
                    } else if (key == "closePosition") {
                        close_position = parse_flag(value);
                    }
                }

                if (!type) continue;
                order.type = *type;
                order.reduce_only = order.reduce_only || close_position;
                if (algo) {
                    order.order_id = std::string(ALGO_ORDER_PREFIX) + order.order_id;
                }
                out.push_back(std::move(order));
            }
            return true;
        });
    }
};

// ============================================================================
// BinanceClient Public Interface
// ============================================================================

BinanceClient::BinanceClient(const BinanceConfig& config)
    : impl_(std::make_unique<Impl>(config, nullptr)) {}

BinanceClient::BinanceClient(const BinanceConfig& config,
                             std::unique_ptr<network::IRestClient> rest_client)
    : impl_(std::make_unique<Impl>(config, std::move(rest_client))) {}

BinanceClient::~BinanceClient() = default;

Balance BinanceClient::fetch_balance(std::string_view asset) {
    return impl_->fetch_balance(asset);
}

std::vector<LivePosition> BinanceClient::fetch_positions(std::span<const Instrument> instruments) {
    return impl_->fetch_positions(instruments);
}

Ticker BinanceClient::fetch_ticker(Instrument instrument) {
    return impl_->fetch_ticker(instrument);
}

PriceSeries BinanceClient::fetch_ohlcv(Instrument instrument, std::string_view timeframe, int limit) {
    return impl_->fetch_ohlcv(instrument, timeframe, limit);
}

OpenInterest BinanceClient::fetch_open_interest(Instrument instrument) {
    return impl_->fetch_open_interest(instrument);
}

FundingRate BinanceClient::fetch_funding_rate(Instrument instrument) {
    return impl_->fetch_funding_rate(instrument);
}

void BinanceClient::set_leverage(Instrument instrument, int leverage) {
    impl_->set_leverage(instrument, leverage);
}

OrderResult BinanceClient::create_market_order(Instrument instrument, Side side, Quantity amount,
                                               bool reduce_only) {
    return impl_->create_market_order(instrument, side, amount, reduce_only);
}

OrderResult BinanceClient::create_protection_order(Instrument instrument, OrderType type, Side side,
                                                   Price stop_price, bool reduce_only) {
    return impl_->create_protection_order(instrument, type, side, stop_price, reduce_only);
}

std::vector<OpenOrder> BinanceClient::fetch_open_orders(Instrument instrument) {
    return impl_->fetch_open_orders(instrument);
}

void BinanceClient::cancel_order(const std::string& order_id, Instrument instrument) {
    impl_->cancel_order(order_id, instrument);
}

}  // namespace aegis::exchange::binance
