/**
 * @file strategies/trend.hpp
 * @brief 趋势策略 - 回踩均线介入，日线结构性低点止损
 *
 * 状态机: 无趋势 → 趋势确认 → 介入 → 持有 → 高点失效/冻结 → 退出
 *
 * 每根周线用本周的日线 (上一周日期, 本周日期] 计算周内最高、最低、收盘，
 * 交给 StructuralStop 维护结构性低点。
 */

#pragma once

#include "lbt/strategy.hpp"
#include "lbt/buy_engine.hpp"
#include "lbt/sell_engine.hpp"
#include "lbt/indicators/sma.hpp"
#include "lbt/indicators/trend.hpp"

namespace lbt {

struct TrendConfig {
    int maPeriod = 20;
    WarmupPolicy maPolicy = WarmupPolicy::Strict;
    int slopeLag = 5;
    int trendWindow = 5;
    Value pullbackBand = 1.05;    ///< entry when ma <= close <= ma * band
    Value deviationFloor = 0.92;  ///< re-validation below ma * floor
    Value entryRatio = 1.0;       ///< fraction of cash spent on entry
    Size warmupWeeks = 25;        ///< first week (1-based) that may trade
    Size minBars = 25;
    Size minDailyBars = 60;       ///< below this the daily structure is off
    Value minCash = MIN_TRADE_CASH;

    void validate() const;
    static TrendConfig fromParams(const Params& params);
};

class TrendStrategy : public Strategy {
public:
    LBT_PARAMS_BEGIN()
        LBT_PARAM(ma_period, 20)
        LBT_PARAM(ma_policy, std::string("strict"))
        LBT_PARAM(slope_lag, 5)
        LBT_PARAM(trend_window, 5)
        LBT_PARAM(pullback_band, 1.05)
        LBT_PARAM(deviation_floor, 0.92)
        LBT_PARAM(entry_ratio, 1.0)
        LBT_PARAM(warmup_weeks, 25)
        LBT_PARAM(min_bars, 25)
        LBT_PARAM(min_daily_bars, 60)
        LBT_PARAM(min_cash, 100.0)
    LBT_PARAMS_END()

    explicit TrendStrategy(TrendConfig config = {});

    std::string name() const override { return "trend"; }
    Size minBars() const override { return config_.minBars; }
    bool needsDaily() const override { return true; }

    void init() override;
    void start() override;
    void prenext() override;
    void next() override;

    const TrendConfig& config() const { return config_; }
    const StructuralStop& structure() const { return stop_; }

    /** 日线结构是否可用（日线数量不少于 min_daily_bars） */
    bool dailyEnabled() const { return dailyEnabled_; }

    /** 最近一根周线对应的日线聚合 */
    const WeekStructure& lastWeek() const { return week_; }

private:
    /**
     * @brief 取本周日线 (prevDate, date]，并推进日线游标
     */
    WeekStructure collectWeek();

    /**
     * @brief 观察本周结构，并确定本周用于止损和估值的收盘价
     */
    void observeStructure();
    void describe(StructuralEvent event);

    const TrendConfig config_;
    StructuralStop stop_;
    std::shared_ptr<SMA> ma_;
    std::shared_ptr<Slope> slope_;
    std::shared_ptr<TrendUp> trend_;

    bool dailyEnabled_ = false;
    Size dailyPos_ = 0;
    WeekStructure week_;
    Value dailyClose_ = NaN;
};

} // namespace lbt
