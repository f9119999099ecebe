// ============================================================================
// AEGIS TRADE CORE - Decision File Advisor
// ============================================================================

#include "aegis/engine/advisor.hpp"

#include "aegis/utils/logger.hpp"

#include <simdjson.h>

namespace aegis::engine {

namespace {

constexpr std::string_view DEFAULT_HOLD = R"({"operation":"Hold","chat":"No decision supplied"})";

}  // namespace

DecisionFileAdvisor::DecisionFileAdvisor(std::filesystem::path path) : path_(std::move(path)) {}

std::string DecisionFileAdvisor::advise(Instrument instrument,
                                        const strategy::MarketSnapshot& snapshot,
                                        const risk::AccountRiskProfile& profile) {
    simdjson::padded_string content;
    if (const auto error = simdjson::padded_string::load(path_.string()).get(content)) {
        throw AdvisorError(fmt::format("cannot read decision file {}: {}", path_.string(),
                                       simdjson::error_message(error)));
    }

    simdjson::dom::parser parser;
    simdjson::dom::object decisions;
    if (const auto error = parser.parse(content).get(decisions)) {
        throw AdvisorError(fmt::format("decision file {} is not a JSON object: {}", path_.string(),
                                       simdjson::error_message(error)));
    }

    for (const auto& key : {pair_name(instrument), exchange_symbol(instrument)}) {
        simdjson::dom::element entry;
        if (decisions.at_key(key).get(entry) == simdjson::SUCCESS) {
            LOG_DEBUG("Decision for {} at price {} in {} mode", pair_name(instrument), snapshot.price(),
                      risk::to_string(profile.trading_mode));
            return simdjson::minify(entry);
        }
    }

    LOG_INFO("No decision for {} in {}, holding", pair_name(instrument), path_.string());
    return std::string(DEFAULT_HOLD);
}

}  // namespace aegis::engine
