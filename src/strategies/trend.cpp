/**
 * @file strategies/trend.cpp
 * @brief 趋势策略实现
 */

#include "lbt/strategies/trend.hpp"
#include "lbt/buy_engine.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lbt {

void TrendConfig::validate() const {
    if (maPeriod <= 0 || slopeLag <= 0 || trendWindow <= 0) {
        throw std::invalid_argument("ma_period, slope_lag and trend_window must be positive");
    }
    if (!(pullbackBand >= 1.0)) {
        throw std::invalid_argument("pullback_band must be >= 1");
    }
    if (!(deviationFloor > 0.0) || deviationFloor > 1.0) {
        throw std::invalid_argument("deviation_floor must be in (0, 1]");
    }
    if (!(entryRatio > 0.0) || entryRatio > 1.0) {
        throw std::invalid_argument("entry_ratio must be in (0, 1]");
    }
    if (warmupWeeks == 0 || minBars == 0) {
        throw std::invalid_argument("warmup_weeks and min_bars must be positive");
    }
    if (minCash < 0.0) {
        throw std::invalid_argument("min_cash must not be negative");
    }
}

TrendConfig TrendConfig::fromParams(const Params& params) {
    TrendConfig c;
    c.maPeriod = static_cast<int>(params.getInteger("ma_period"));
    c.maPolicy = parseWarmupPolicy(params.get<std::string>("ma_policy"));
    c.slopeLag = static_cast<int>(params.getInteger("slope_lag"));
    c.trendWindow = static_cast<int>(params.getInteger("trend_window"));
    c.pullbackBand = params.getNumber("pullback_band");
    c.deviationFloor = params.getNumber("deviation_floor");
    c.entryRatio = params.getNumber("entry_ratio");
    c.warmupWeeks = params.getCount("warmup_weeks");
    c.minBars = params.getCount("min_bars");
    c.minDailyBars = params.getCount("min_daily_bars");
    c.minCash = params.getNumber("min_cash");
    return c;
}

TrendStrategy::TrendStrategy(TrendConfig config)
    : config_(std::move(config)),
      stop_(StructuralStop::Params{config_.deviationFloor}) {
    config_.validate();
}

void TrendStrategy::init() {
    ma_ = makeIndicator<SMA>(&weekly_->close(), config_.maPeriod, config_.maPolicy);
    ma_->precompute();
    slope_ = makeIndicator<Slope>(&ma_->lines0(), config_.slopeLag);
    slope_->precompute();
    trend_ = makeIndicator<TrendUp>(&slope_->lines0(), config_.trendWindow);
    trend_->precompute();

    addIndicator(ma_);
    addIndicator(slope_);
    addIndicator(trend_);

    setMinPeriod(config_.warmupWeeks);
}

void TrendStrategy::start() {
    dailyEnabled_ = hasDaily() && daily_->size() >= config_.minDailyBars;
    dailyPos_ = 0;
    stop_ = StructuralStop(StructuralStop::Params{config_.deviationFloor});
    week_ = WeekStructure{};
    dailyClose_ = NaN;
}

WeekStructure TrendStrategy::collectWeek() {
    WeekStructure ws;
    if (!dailyEnabled_) return ws;

    const long weekDays = static_cast<long>(weekly_->date().at(barIndex_));
    const LineBuffer& dates = daily_->date();
    // 游标之前的日线已属于上一周
    while (dailyPos_ < daily_->size() && static_cast<long>(dates.at(dailyPos_)) <= weekDays) {
        Value h = daily_->high().at(dailyPos_);
        Value l = daily_->low().at(dailyPos_);
        ws.high = isnan(ws.high) ? h : std::max(ws.high, h);
        ws.low = isnan(ws.low) ? l : std::min(ws.low, l);
        ws.close = daily_->close().at(dailyPos_);
        ++dailyPos_;
    }
    return ws;
}

void TrendStrategy::observeStructure() {
    week_ = collectWeek();
    Value weeklyClose = close();
    dailyClose_ = week_.valid() ? week_.close : weeklyClose;
    step_.markPrice = dailyClose_;

    Value ma = ma_->value();
    step_.ma = ma;
    // 均线未定义的周不参与结构判断
    if (isnan(ma)) {
        describe(StructuralEvent::None);
        return;
    }

    StructureInputs in;
    in.daily = week_;
    in.weeklyClose = weeklyClose;
    in.prevWeeklyClose = barIndex_ > 0 ? close(1) : weeklyClose;
    in.holding = !ledger().isFlat();
    in.trendUp = trend_->isUp();
    in.ma20 = ma;
    in.slope = slope_->value();

    StructuralEvent event = stop_.observe(in);
    if (ledger().isFlat()) {
        stop_.setFlatPhase(in.trendUp);
    }
    describe(event);
}

void TrendStrategy::prenext() {
    observeStructure();
}

void TrendStrategy::next() {
    observeStructure();

    Value ma = ma_->value();
    if (isnan(ma)) return;

    if (ledger().isFlat()) {
        Value price = close();
        BuyDecision d = decidePullbackEntry(price, ma, trend_->isUp(), ledger().cash(),
                                            config_.pullbackBand, config_.entryRatio,
                                            config_.minCash);
        if (d.accept) {
            ladder_.reset();
            ladder_.entryPrice = price;
            ladder_.entryHigh = price;
            buy(price, d.shares, d.tier, "BUY " + std::to_string(d.shares));
            ladder_.buyCount = 1;
            stop_.onEntry();
            describe(StructuralEvent::None);
        }
        return;
    }

    if (stop_.shouldExit(dailyClose_)) {
        std::ostringstream label;
        label << std::fixed << std::setprecision(2)
              << "STOP below " << stop_.state().structuralLow;
        TradeRecord trade = sell(dailyClose_, ledger().shares(), 0,
                                 ExitReason::StructuralStop, label.str());
        std::ostringstream pnl;
        pnl << std::fixed << std::setprecision(0) << "pnl " << trade.pnl;
        note(pnl.str());
        ladder_.reset();
        stop_.onExit();
        describe(StructuralEvent::None);
    }
}

void TrendStrategy::describe(StructuralEvent event) {
    const StructuralLowState& s = stop_.state();
    std::ostringstream oss;
    oss << (trend_ && trend_->isUp() ? "up " : "down ") << trendPhaseName(s.phase);
    if (s.hasStructuralLow()) {
        oss << std::fixed << std::setprecision(2) << " low=" << s.structuralLow;
    }
    switch (event) {
        case StructuralEvent::HighBroken: oss << " [high broken]"; break;
        case StructuralEvent::Restored: oss << " [restored]"; break;
        case StructuralEvent::Frozen: oss << " [frozen]"; break;
        case StructuralEvent::None: break;
    }
    step_.state = oss.str();
}

} // namespace lbt
