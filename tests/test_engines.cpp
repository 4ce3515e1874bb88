/**
 * @file test_engines.cpp
 * @brief 账户、买入引擎、卖出引擎与结构性止损测试
 */

#include <gtest/gtest.h>
#include "lbt/buy_engine.hpp"
#include "lbt/ledger.hpp"
#include "lbt/sell_engine.hpp"

using namespace lbt;

namespace {

const std::vector<Value> kBuyLevels{-0.04, -0.08, -0.13, -0.19, -0.26};
const std::vector<Value> kBuyRatios{0.10, 0.15, 0.20, 0.25, 0.30};
const std::vector<Value> kSellThresholds{0.08, 0.12, 0.18};
const std::vector<Value> kSellRatios{0.30, 0.30, 0.40};
const std::vector<Value> kFallingMa{101.0, 100.5, 100.0};

} // namespace

// ============================================================================
// Ledger
// ============================================================================

class LedgerTest : public ::testing::Test {
protected:
    Ledger ledger{100000.0};
    Date day{2024, 1, 5};
};

TEST_F(LedgerTest, BuyAndSellMoveCash) {
    ledger.buy(day, 50.0, 100, 0);
    EXPECT_DOUBLE_EQ(ledger.cash(), 95000.0);
    EXPECT_EQ(ledger.shares(), 100u);
    EXPECT_DOUBLE_EQ(ledger.value(60.0), 101000.0);

    TradeRecord t = ledger.sell(day, 60.0, 40, 0, ExitReason::Ladder);
    EXPECT_DOUBLE_EQ(t.cashFlow, 2400.0);
    EXPECT_FALSE(t.closesPosition);
    EXPECT_EQ(ledger.shares(), 60u);
    EXPECT_EQ(ledger.trades().size(), 2u);
    EXPECT_EQ(t.ref, 2u);
}

TEST_F(LedgerTest, CyclePnlOnClose) {
    ledger.buy(day, 10.0, 1000, 0);
    ledger.buy(day, 8.0, 1000, 1);
    ledger.sell(day, 12.0, 500, 0, ExitReason::Ladder);
    TradeRecord last = ledger.liquidate(day, 9.0, 1, ExitReason::Ladder);

    EXPECT_TRUE(last.closesPosition);
    // 6000 + 13500 - 18000
    EXPECT_DOUBLE_EQ(last.pnl, 1500.0);
    EXPECT_EQ(ledger.closedCycles(), 1u);
    EXPECT_DOUBLE_EQ(ledger.cash(), 101500.0);
    EXPECT_TRUE(ledger.isFlat());
}

TEST_F(LedgerTest, RejectsInvalidOrders) {
    EXPECT_THROW(ledger.buy(day, 10.0, 0, 0), std::invalid_argument);
    EXPECT_THROW(ledger.buy(day, 0.0, 10, 0), std::invalid_argument);
    EXPECT_THROW(ledger.buy(day, 1000.0, 101, 0), std::invalid_argument);
    EXPECT_THROW(ledger.sell(day, 10.0, 1, 0, ExitReason::Ladder), std::invalid_argument);
    EXPECT_THROW(Ledger(-1.0), std::invalid_argument);
    EXPECT_TRUE(ledger.trades().empty());
}

TEST_F(LedgerTest, TradeCallback) {
    std::vector<Size> refs;
    ledger.setTradeCallback([&](const TradeRecord& t) { refs.push_back(t.ref); });
    ledger.buy(day, 10.0, 10, 0);
    ledger.sell(day, 11.0, 10, 0, ExitReason::EndOfSeries);
    ASSERT_EQ(refs.size(), 2u);
    EXPECT_EQ(refs[1], 2u);
    EXPECT_EQ(ledger.trades().back().reason, ExitReason::EndOfSeries);
}

TEST(AffordableSharesTest, WholeShares) {
    EXPECT_EQ(affordableShares(10000.0, 96.0), 104u);
    EXPECT_EQ(affordableShares(99.0, 100.0), 0u);
    EXPECT_EQ(affordableShares(100.0, 0.0), 0u);
    EXPECT_EQ(affordableShares(-5.0, 10.0), 0u);
}

// ============================================================================
// Buy engine
// ============================================================================

TEST(BuyEngineTest, FirstTier) {
    BuyDecision d = decideBuy(96.0, 100.0, 0, kBuyLevels, kBuyRatios, 100000.0);
    ASSERT_TRUE(d.accept);
    EXPECT_EQ(d.tier, 0);
    EXPECT_DOUBLE_EQ(d.spendAmount, 10000.0);
    EXPECT_EQ(d.shares, 104u);
}

TEST(BuyEngineTest, SecondTierAfterFirst) {
    Value cash = 100000.0 - 104 * 96.0;
    BuyDecision d = decideBuy(90.0, 100.0, 1, kBuyLevels, kBuyRatios, cash);
    ASSERT_TRUE(d.accept);
    EXPECT_EQ(d.tier, 1);
    EXPECT_DOUBLE_EQ(d.spendAmount, cash * 0.15);
}

TEST(BuyEngineTest, TakesFirstSatisfiedTier) {
    // 跌幅 20% 满足从 tier 0 开始的所有档，只取第一个
    BuyDecision d = decideBuy(80.0, 100.0, 0, kBuyLevels, kBuyRatios, 100000.0);
    ASSERT_TRUE(d.accept);
    EXPECT_EQ(d.tier, 0);
}

TEST(BuyEngineTest, Declines) {
    // 跌幅不够
    EXPECT_FALSE(decideBuy(97.0, 100.0, 0, kBuyLevels, kBuyRatios, 100000.0).accept);
    // 现金不足
    EXPECT_FALSE(decideBuy(90.0, 100.0, 0, kBuyLevels, kBuyRatios, 99.0).accept);
    // 均线未定义
    EXPECT_FALSE(decideBuy(90.0, NaN, 0, kBuyLevels, kBuyRatios, 100000.0).accept);
    EXPECT_FALSE(decideBuy(90.0, 0.0, 0, kBuyLevels, kBuyRatios, 100000.0).accept);
    // 所有档位已用完
    EXPECT_FALSE(decideBuy(50.0, 100.0, 5, kBuyLevels, kBuyRatios, 100000.0).accept);
    // 买不到一股
    EXPECT_FALSE(decideBuy(5000.0, 6000.0, 0, kBuyLevels, kBuyRatios, 1000.0).accept);
}

TEST(BuyEngineTest, NextTierHelpers) {
    // 跌 1%，还没到第一档
    EXPECT_FALSE(nextBuyTier(99.0, 100.0, 0, kBuyLevels).has_value());
    EXPECT_EQ(nextBuyTier(96.0, 100.0, 0, kBuyLevels), std::optional<Size>(0));
    // 已买两档，跌 14% 对应第三档
    EXPECT_EQ(nextBuyTier(86.0, 100.0, 2, kBuyLevels), std::optional<Size>(2));
    EXPECT_FALSE(nextBuyTier(90.0, 100.0, 2, kBuyLevels).has_value());
    EXPECT_FALSE(nextBuyTier(50.0, 100.0, 5, kBuyLevels).has_value());
    EXPECT_FALSE(nextBuyTier(90.0, NaN, 0, kBuyLevels).has_value());
    EXPECT_FALSE(nextBuyTier(90.0, 0.0, 0, kBuyLevels).has_value());
    EXPECT_NEAR(nextBuyPrice(100.0, 1, kBuyLevels), 92.0, 1e-9);
    EXPECT_TRUE(std::isnan(nextBuyPrice(NaN, 0, kBuyLevels)));
}

TEST(BuyEngineTest, PullbackEntry) {
    BuyDecision d = decidePullbackEntry(102.0, 100.0, true, 100000.0);
    ASSERT_TRUE(d.accept);
    EXPECT_EQ(d.shares, 980u);

    EXPECT_FALSE(decidePullbackEntry(102.0, 100.0, false, 100000.0).accept);
    EXPECT_FALSE(decidePullbackEntry(99.0, 100.0, true, 100000.0).accept);
    EXPECT_FALSE(decidePullbackEntry(106.0, 100.0, true, 100000.0).accept);
    EXPECT_TRUE(decidePullbackEntry(105.0, 100.0, true, 100000.0).accept);
}

// ============================================================================
// Sell engine
// ============================================================================

TEST(SellEngineTest, MaRising) {
    EXPECT_TRUE(isMaRising({1.0, 2.0, 2.0}, 3));
    EXPECT_FALSE(isMaRising({1.0, 2.0, 1.5}, 3));
    EXPECT_FALSE(isMaRising({1.0, 2.0}, 3));
    EXPECT_FALSE(isMaRising({NaN, 2.0, 3.0}, 3));

    EXPECT_TRUE(isMaFallingOrFlat({3.0, 2.0}, 2));
    EXPECT_FALSE(isMaFallingOrFlat({2.0, 3.0}, 2));
    EXPECT_TRUE(isMaFallingOrFlat({2.0}, 2));
}

TEST(SellEngineTest, FirstTierSellsRatio) {
    SellDecision d = decideSell(109.0, 100.0, 0, 1000, kFallingMa, kSellThresholds, kSellRatios);
    ASSERT_TRUE(d.accept);
    EXPECT_EQ(d.shares, 300u);
    EXPECT_EQ(d.tier, 0);
    EXPECT_FALSE(d.liquidates);
}

TEST(SellEngineTest, RisingMaBlocksSell) {
    SellDecision d = decideSell(130.0, 100.0, 0, 1000, {99.0, 100.0, 101.0},
                                kSellThresholds, kSellRatios);
    EXPECT_FALSE(d.accept);
}

TEST(SellEngineTest, LastTierLiquidates) {
    SellDecision d = decideSell(119.0, 100.0, 2, 490, kFallingMa, kSellThresholds, kSellRatios);
    ASSERT_TRUE(d.accept);
    EXPECT_EQ(d.shares, 490u);
    EXPECT_TRUE(d.liquidates);

    EXPECT_FALSE(decideSell(117.0, 100.0, 2, 490, kFallingMa, kSellThresholds, kSellRatios).accept);
}

TEST(SellEngineTest, MinimumShares) {
    // 持仓不足 100 股
    EXPECT_FALSE(decideSell(130.0, 100.0, 0, 50, kFallingMa, kSellThresholds, kSellRatios).accept);
    // 30% 只有 90 股
    EXPECT_FALSE(decideSell(130.0, 100.0, 0, 300, kFallingMa, kSellThresholds, kSellRatios).accept);
    // 档位用完
    EXPECT_FALSE(decideSell(130.0, 100.0, 3, 1000, kFallingMa, kSellThresholds, kSellRatios).accept);
    EXPECT_FALSE(nextSellThreshold(3, kSellThresholds).has_value());
}

// ============================================================================
// Structural stop
// ============================================================================

class StructuralStopTest : public ::testing::Test {
protected:
    StructureInputs week(Value high, Value low, Value close, Value prevClose,
                         bool trendUp = true) const {
        StructureInputs in;
        in.daily.high = high;
        in.daily.low = low;
        in.daily.close = close;
        in.weeklyClose = close;
        in.prevWeeklyClose = prevClose;
        in.holding = true;
        in.trendUp = trendUp;
        in.ma20 = 100.0;
        in.slope = 1.0;
        return in;
    }

    StructuralStop stop;
};

TEST_F(StructuralStopTest, HighBrokenSetsLow) {
    stop.onEntry();
    EXPECT_EQ(stop.observe(week(110, 100, 105, 100)), StructuralEvent::None);
    EXPECT_DOUBLE_EQ(stop.state().lastDailyHigh, 110.0);

    EXPECT_EQ(stop.observe(week(108, 101, 103, 105)), StructuralEvent::HighBroken);
    EXPECT_TRUE(stop.state().highBroken);
    EXPECT_DOUBLE_EQ(stop.state().structuralLow, 101.0);
    EXPECT_EQ(stop.state().phase, TrendPhase::HighBroken);

    EXPECT_TRUE(stop.shouldExit(100.5));
    EXPECT_FALSE(stop.shouldExit(101.0));
}

TEST_F(StructuralStopTest, LowerHighWithHigherCloseIsNotBreak) {
    stop.onEntry();
    stop.observe(week(110, 100, 105, 100));
    EXPECT_EQ(stop.observe(week(108, 101, 106, 105)), StructuralEvent::None);
    EXPECT_FALSE(stop.state().highBroken);
    EXPECT_FALSE(stop.shouldExit(50.0));
}

TEST_F(StructuralStopTest, RestoreRatchetsUp) {
    stop.onEntry();
    stop.observe(week(110, 100, 105, 100));
    stop.observe(week(108, 101, 103, 105));

    // 趋势标志关闭，收盘仍在均线上方且斜率为正 -> 结构恢复
    EXPECT_EQ(stop.observe(week(109, 102, 104, 103, false)), StructuralEvent::Restored);
    EXPECT_FALSE(stop.state().highBroken);
    EXPECT_DOUBLE_EQ(stop.state().structuralLow, 102.0);
    EXPECT_EQ(stop.state().phase, TrendPhase::Holding);
    EXPECT_FALSE(stop.shouldExit(90.0));
}

TEST_F(StructuralStopTest, LowNeverMovesDown) {
    stop.onEntry();
    stop.observe(week(110, 100, 105, 100));
    stop.observe(week(108, 104, 106, 107));   // broken at 104
    ASSERT_DOUBLE_EQ(stop.state().structuralLow, 104.0);

    stop.observe(week(109, 101, 104, 106, false));   // restored, low stays 104
    EXPECT_DOUBLE_EQ(stop.state().structuralLow, 104.0);
}

TEST_F(StructuralStopTest, FreezeBelowMa) {
    stop.onEntry();
    stop.observe(week(110, 100, 105, 100));
    stop.observe(week(108, 101, 103, 105));

    EXPECT_EQ(stop.observe(week(107, 96, 99, 103, false)), StructuralEvent::Frozen);
    EXPECT_EQ(stop.state().phase, TrendPhase::StructureFrozen);
    EXPECT_DOUBLE_EQ(stop.state().structuralLow, 101.0);
    EXPECT_TRUE(stop.shouldExit(99.0));
}

TEST_F(StructuralStopTest, FlatNeverBreaks) {
    StructureInputs a = week(110, 100, 105, 100);
    StructureInputs b = week(108, 101, 103, 105);
    a.holding = false;
    b.holding = false;
    stop.observe(a);
    EXPECT_EQ(stop.observe(b), StructuralEvent::None);
    EXPECT_FALSE(stop.state().hasStructuralLow());
    // 空仓时仍然记录上一周的日线高点
    EXPECT_DOUBLE_EQ(stop.state().lastDailyHigh, 108.0);

    stop.setFlatPhase(true);
    EXPECT_EQ(stop.state().phase, TrendPhase::TrendConfirmed);
}

TEST_F(StructuralStopTest, ExitClearsState) {
    stop.onEntry();
    stop.observe(week(110, 100, 105, 100));
    stop.observe(week(108, 101, 103, 105));
    stop.onExit();
    EXPECT_EQ(stop.state().phase, TrendPhase::Liquidated);
    EXPECT_FALSE(stop.state().hasStructuralLow());
    EXPECT_FALSE(stop.state().highBroken);
    EXPECT_TRUE(std::isnan(stop.state().lastDailyHigh));
}

TEST_F(StructuralStopTest, InvalidWeekIgnored) {
    StructureInputs in = week(NaN, NaN, NaN, 100);
    EXPECT_EQ(stop.observe(in), StructuralEvent::None);
    EXPECT_TRUE(std::isnan(stop.state().lastDailyHigh));
}
