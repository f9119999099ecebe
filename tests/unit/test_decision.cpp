// ============================================================================
// AEGIS TRADE CORE - Decision Parser Unit Tests
// ============================================================================

#include "aegis/execution/decision.hpp"

#include <gtest/gtest.h>

using namespace aegis;
using namespace aegis::execution;
using aegis::ledger::Operation;

// ============================================================================
// Accepted Input
// ============================================================================

TEST(DecisionTest, ParsesBuy) {
    const auto d = parse_decision(R"({
        "operation": "Buy",
        "buy": {"pricing": 50000, "amount": 0.002, "leverage": 5},
        "adjustProfit": {"stopLoss": 49000, "takeProfit": 52000},
        "chat": "Breakout with volume"
    })");

    EXPECT_EQ(d.operation, Operation::Buy);
    ASSERT_TRUE(d.buy.has_value());
    EXPECT_DOUBLE_EQ(d.buy->pricing, 50000.0);
    EXPECT_DOUBLE_EQ(d.buy->amount, 0.002);
    EXPECT_EQ(d.buy->leverage, 5);
    EXPECT_EQ(d.stop_loss(), 49000.0);
    EXPECT_EQ(d.take_profit(), 52000.0);
    EXPECT_EQ(d.chat, "Breakout with volume");
}

TEST(DecisionTest, ParsesSell) {
    const auto d = parse_decision(R"({"operation":"Sell","sell":{"percentage":40},"chat":"trim"})");
    EXPECT_EQ(d.operation, Operation::Sell);
    ASSERT_TRUE(d.sell.has_value());
    EXPECT_DOUBLE_EQ(d.sell->percentage, 40.0);
    EXPECT_FALSE(d.buy.has_value());
}

TEST(DecisionTest, ParsesHoldWithPartialAdjustment) {
    const auto d = parse_decision(R"({"operation":"Hold","adjustProfit":{"stopLoss":48500},"chat":"trail"})");
    EXPECT_EQ(d.operation, Operation::Hold);
    ASSERT_TRUE(d.adjust_profit.has_value());
    EXPECT_EQ(d.stop_loss(), 48500.0);
    EXPECT_FALSE(d.take_profit().has_value());
    EXPECT_FALSE(d.adjust_profit->empty());
}

TEST(DecisionTest, NullMembersAreAbsent) {
    const auto d = parse_decision(
        R"({"operation":"Hold","buy":null,"sell":null,"adjustProfit":{"stopLoss":null},"chat":""})");
    EXPECT_FALSE(d.buy.has_value());
    EXPECT_FALSE(d.sell.has_value());
    ASSERT_TRUE(d.adjust_profit.has_value());
    EXPECT_TRUE(d.adjust_profit->empty());
}

TEST(DecisionTest, UnknownKeysIgnored) {
    const auto d = parse_decision(R"({"operation":"Hold","chat":"wait","confidence":0.7,"extra":{"a":1}})");
    EXPECT_EQ(d.operation, Operation::Hold);
}

TEST(DecisionTest, IntegralLeverageWrittenAsFloat) {
    const auto d = parse_decision(
        R"({"operation":"Buy","buy":{"pricing":1,"amount":10,"leverage":3.0},"chat":""})");
    EXPECT_EQ(d.buy->leverage, 3);
}

TEST(DecisionTest, FullSellAllowed) {
    const auto d = parse_decision(R"({"operation":"Sell","sell":{"percentage":100},"chat":"exit"})");
    EXPECT_DOUBLE_EQ(d.sell->percentage, 100.0);
}

// ============================================================================
// Rejected Input
// ============================================================================

TEST(DecisionTest, RejectsMalformedJson) {
    EXPECT_THROW(static_cast<void>(parse_decision("{\"operation\": ")), DecisionInputError);
    EXPECT_THROW(static_cast<void>(parse_decision("")), DecisionInputError);
}

TEST(DecisionTest, RejectsNonObject) {
    EXPECT_THROW(static_cast<void>(parse_decision("[1, 2]")), DecisionInputError);
}

TEST(DecisionTest, RejectsMissingOperation) {
    EXPECT_THROW(static_cast<void>(parse_decision(R"({"chat":"x"})")), DecisionInputError);
}

TEST(DecisionTest, RejectsUnknownOperation) {
    try {
        static_cast<void>(parse_decision(R"({"operation":"Wait","chat":"x"})"));
        FAIL() << "expected DecisionInputError";
    } catch (const DecisionInputError& e) {
        EXPECT_NE(std::string(e.what()).find("Wait"), std::string::npos);
    }
}

TEST(DecisionTest, OperationIsCaseSensitive) {
    EXPECT_THROW(static_cast<void>(parse_decision(R"({"operation":"buy","chat":"x"})")), DecisionInputError);
}

TEST(DecisionTest, RejectsMissingChat) {
    EXPECT_THROW(static_cast<void>(parse_decision(R"({"operation":"Hold"})")), DecisionInputError);
}

TEST(DecisionTest, RejectsFractionalLeverage) {
    EXPECT_THROW(static_cast<void>(parse_decision(
                     R"({"operation":"Buy","buy":{"pricing":1,"amount":1,"leverage":2.5},"chat":""})")),
                 DecisionInputError);
}

TEST(DecisionTest, RejectsStringNumbers) {
    EXPECT_THROW(static_cast<void>(parse_decision(
                     R"({"operation":"Buy","buy":{"pricing":"50000","amount":1,"leverage":2},"chat":""})")),
                 DecisionInputError);
}

TEST(DecisionTest, RejectsIncompleteBuy) {
    EXPECT_THROW(static_cast<void>(parse_decision(
                     R"({"operation":"Buy","buy":{"pricing":1,"leverage":2},"chat":""})")),
                 DecisionInputError);
}

TEST(DecisionTest, RejectsPercentageOutOfRange) {
    EXPECT_THROW(static_cast<void>(parse_decision(R"({"operation":"Sell","sell":{"percentage":0},"chat":""})")),
                 DecisionInputError);
    EXPECT_THROW(static_cast<void>(parse_decision(R"({"operation":"Sell","sell":{"percentage":150},"chat":""})")),
                 DecisionInputError);
    EXPECT_THROW(static_cast<void>(parse_decision(R"({"operation":"Sell","sell":{"percentage":-5},"chat":""})")),
                 DecisionInputError);
}

TEST(DecisionTest, RejectsNonObjectPayload) {
    EXPECT_THROW(static_cast<void>(parse_decision(R"({"operation":"Sell","sell":50,"chat":""})")),
                 DecisionInputError);
}

// ============================================================================
// Operation Payload
// ============================================================================

TEST(DecisionTest, PayloadCheckedSeparatelyFromParsing) {
    const auto buy = parse_decision(R"({"operation":"Buy","chat":"no payload"})");
    EXPECT_THROW(require_operation_payload(buy), DecisionInputError);

    const auto sell = parse_decision(R"({"operation":"Sell","chat":"no payload"})");
    EXPECT_THROW(require_operation_payload(sell), DecisionInputError);

    const auto hold = parse_decision(R"({"operation":"Hold","chat":"nothing"})");
    EXPECT_NO_THROW(require_operation_payload(hold));
}

TEST(DecisionTest, PayloadErrorNamesMissingObject) {
    Decision d;
    d.operation = Operation::Sell;
    try {
        require_operation_payload(d);
        FAIL() << "expected DecisionInputError";
    } catch (const DecisionInputError& e) {
        EXPECT_STREQ(e.what(), "Sell operation missing sell object");
    }
}
