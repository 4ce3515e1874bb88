/**
 * @file strategies/threshold.hpp
 * @brief Ladder strategy: buy in tiers below the MA, sell in tiers above it
 */

#pragma once

#include "lbt/strategy.hpp"
#include "lbt/indicators/sma.hpp"

namespace lbt {

struct ThresholdConfig {
    LadderConfig ladder;
    int maPeriod = 20;
    WarmupPolicy maPolicy = WarmupPolicy::Lenient;
    Size minBars = 21;   ///< also the first week (1-based) with decisions

    void validate() const;

    /**
     * @brief Build from the "thresholds" parameter schema
     */
    static ThresholdConfig fromParams(const Params& params);
};

class ThresholdStrategy : public Strategy {
public:
    LBT_PARAMS_BEGIN()
        LBT_PARAM(buy_levels, std::vector<double>({-0.04, -0.08, -0.13, -0.19, -0.26}))
        LBT_PARAM(buy_ratios, std::vector<double>({0.10, 0.15, 0.20, 0.25, 0.30}))
        LBT_PARAM(sell_thresholds, std::vector<double>({0.08, 0.12, 0.18}))
        LBT_PARAM(sell_ratios, std::vector<double>({0.30, 0.30, 0.40}))
        LBT_PARAM(ma_period, 20)
        LBT_PARAM(ma_policy, std::string("lenient"))
        LBT_PARAM(min_bars, 21)
        LBT_PARAM(min_cash, 100.0)
        LBT_PARAM(min_sell_shares, 100)
        LBT_PARAM(rising_window, 3)
    LBT_PARAMS_END()

    explicit ThresholdStrategy(ThresholdConfig config = {});

    std::string name() const override { return "thresholds"; }
    Size minBars() const override { return config_.minBars; }

    void init() override;
    void prenext() override;
    void next() override;

    const ThresholdConfig& config() const { return config_; }

private:
    void describe();
    bool trySell(Value price, Value ma);
    bool tryBuy(Value price, Value ma);

    const ThresholdConfig config_;
    std::shared_ptr<SMA> ma_;
};

} // namespace lbt
