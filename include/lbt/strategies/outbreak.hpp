/**
 * @file strategies/outbreak.hpp
 * @brief 趋势爆发策略 - 分三段建仓，分档止盈，跌破均线清仓
 *
 * - B1: 均线连续两周上升，买入 50%
 * - B2: 首次回踩 (close > MA 且 close < B1 价 * 1.05)，买入 30%
 * - B3: 再创新高 (close > entryHigh)，买入 20%
 * - 止盈: 高于 B1 价 +30% 卖 30%，+60% 再卖 30%
 * - 止损: 收盘跌破 MA 清仓，重新等待
 */

#pragma once

#include "lbt/strategy.hpp"
#include "lbt/indicators/sma.hpp"

namespace lbt {

struct OutbreakConfig {
    int maPeriod = 20;
    WarmupPolicy maPolicy = WarmupPolicy::Strict;
    Size minBars = 21;
    std::vector<Value> stageRatios{0.5, 0.3, 0.2};   ///< B1, B2, B3
    Value pullbackBand = 1.05;
    std::vector<Value> takeProfitLevels{0.30, 0.60};  ///< rise above the B1 price
    std::vector<Value> takeProfitRatios{0.3, 0.3};    ///< fraction of shares held

    void validate() const;
    static OutbreakConfig fromParams(const Params& params);
};

class OutbreakStrategy : public Strategy {
public:
    LBT_PARAMS_BEGIN()
        LBT_PARAM(ma_period, 20)
        LBT_PARAM(ma_policy, std::string("strict"))
        LBT_PARAM(min_bars, 21)
        LBT_PARAM(stage_ratios, std::vector<double>({0.5, 0.3, 0.2}))
        LBT_PARAM(pullback_band, 1.05)
        LBT_PARAM(take_profit_levels, std::vector<double>({0.30, 0.60}))
        LBT_PARAM(take_profit_ratios, std::vector<double>({0.3, 0.3}))
    LBT_PARAMS_END()

    explicit OutbreakStrategy(OutbreakConfig config = {});

    std::string name() const override { return "outbreak"; }
    Size minBars() const override { return config_.minBars; }
    StepOrder stepOrder() const override { return StepOrder::BuyThenSell; }

    void init() override;
    void start() override;
    void next() override;

    const OutbreakConfig& config() const { return config_; }

    bool armed() const { return armed_; }
    bool takeProfitDone(Size tier) const { return tier < tpDone_.size() && tpDone_[tier]; }

private:
    /** MA[i] > MA[i-1] > MA[i-2] */
    bool maRisingTwice() const;

    void tryStage(Value price, Value ma);
    void tryTakeProfit(Value price);
    void disarm();
    void describe();

    const OutbreakConfig config_;
    std::shared_ptr<SMA> ma_;
    bool armed_ = false;
    std::vector<bool> tpDone_;
};

} // namespace lbt
