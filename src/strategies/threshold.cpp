/**
 * @file strategies/threshold.cpp
 * @brief Ladder strategy
 */

#include "lbt/strategies/threshold.hpp"
#include "lbt/buy_engine.hpp"
#include "lbt/sell_engine.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace lbt {

namespace {

std::string percent(Value ratio) {
    std::ostringstream oss;
    oss << static_cast<long>(std::lround(ratio * 100.0)) << "%";
    return oss.str();
}

} // namespace

void ThresholdConfig::validate() const {
    ladder.validate();
    if (maPeriod <= 0) {
        throw std::invalid_argument("ma_period must be positive");
    }
    if (minBars == 0) {
        throw std::invalid_argument("min_bars must be positive");
    }
}

ThresholdConfig ThresholdConfig::fromParams(const Params& params) {
    ThresholdConfig c;
    c.ladder.buyLevels = params.getList("buy_levels");
    c.ladder.buyRatios = params.getList("buy_ratios");
    c.ladder.sellThresholds = params.getList("sell_thresholds");
    c.ladder.sellRatios = params.getList("sell_ratios");
    c.ladder.minCash = params.getNumber("min_cash");
    c.ladder.minSellShares = params.getCount("min_sell_shares");
    c.ladder.risingWindow = params.getCount("rising_window");
    c.maPeriod = static_cast<int>(params.getInteger("ma_period"));
    c.maPolicy = parseWarmupPolicy(params.get<std::string>("ma_policy"));
    c.minBars = params.getCount("min_bars");
    return c;
}

ThresholdStrategy::ThresholdStrategy(ThresholdConfig config) : config_(std::move(config)) {
    config_.validate();
}

void ThresholdStrategy::init() {
    ma_ = makeIndicator<SMA>(&weekly_->close(), config_.maPeriod, config_.maPolicy);
    ma_->precompute();
    addIndicator(ma_);
    setMinPeriod(config_.minBars);
}

void ThresholdStrategy::prenext() {
    step_.ma = ma_->value();
    describe();
}

void ThresholdStrategy::next() {
    Value price = close();
    Value ma = ma_->value();
    step_.ma = ma;

    if (isnan(ma)) {
        describe();
        return;
    }

    bool sold = false;
    if (!ledger().isFlat()) {
        sold = trySell(price, ma);
    }
    if (!sold) {
        tryBuy(price, ma);
    }
    describe();
}

bool ThresholdStrategy::trySell(Value price, Value ma) {
    const LadderConfig& lc = config_.ladder;
    std::vector<Value> history = recent(ma_->lines0(), lc.risingWindow);

    SellDecision d = decideSell(price, ma, ladder_.sellCount, ledger().shares(), history,
                                lc.sellThresholds, lc.sellRatios,
                                lc.minSellShares, lc.risingWindow);
    if (!d.accept) return false;

    std::string label = d.liquidates
        ? "LIQUIDATE " + std::to_string(d.shares)
        : "REDUCE " + percent(lc.sellRatios[static_cast<Size>(d.tier)]) + " " + std::to_string(d.shares);
    sell(price, d.shares, d.tier, ExitReason::Ladder, label);

    ladder_.sellCount += 1;
    if (ledger().isFlat()) {
        ladder_.reset();
    }
    return true;
}

bool ThresholdStrategy::tryBuy(Value price, Value ma) {
    const LadderConfig& lc = config_.ladder;
    if (ladder_.buyCount >= lc.buyLevels.size()) return false;

    BuyDecision d = decideBuy(price, ma, ladder_.buyCount, lc.buyLevels, lc.buyRatios,
                              ledger().cash(), lc.minCash);
    if (!d.accept) return false;

    bool opening = ledger().isFlat();
    if (opening) {
        ladder_.reset();
        ladder_.entryPrice = price;
    }
    std::string label = (opening ? "BUY " : "ADD ") +
                        percent(lc.buyRatios[static_cast<Size>(d.tier)]) + " " +
                        std::to_string(d.shares);
    buy(price, d.shares, d.tier, label);
    ladder_.buyCount = static_cast<Size>(d.tier) + 1;
    return true;
}

void ThresholdStrategy::describe() {
    step_.state = "b" + std::to_string(ladder_.buyCount) + "/s" + std::to_string(ladder_.sellCount);
}

} // namespace lbt
