/**
 * @file strategies/outbreak.cpp
 * @brief 趋势爆发策略实现
 */

#include "lbt/strategies/outbreak.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace lbt {

namespace {

const char* const STAGE_NAMES[] = {"B1", "B2", "B3"};

std::string percent(Value ratio) {
    return std::to_string(static_cast<long>(std::lround(ratio * 100.0))) + "%";
}

} // namespace

void OutbreakConfig::validate() const {
    if (maPeriod <= 0) {
        throw std::invalid_argument("ma_period must be positive");
    }
    if (minBars == 0) {
        throw std::invalid_argument("min_bars must be positive");
    }
    if (stageRatios.size() != 3) {
        throw std::invalid_argument("stage_ratios needs exactly three entries (B1, B2, B3)");
    }
    for (Value r : stageRatios) {
        if (!(r > 0.0) || r > 1.0) {
            throw std::invalid_argument("stage ratios must be in (0, 1]");
        }
    }
    if (!(pullbackBand >= 1.0)) {
        throw std::invalid_argument("pullback_band must be >= 1");
    }
    if (takeProfitLevels.size() != takeProfitRatios.size()) {
        throw std::invalid_argument("take_profit_levels and take_profit_ratios differ in length");
    }
    for (Size i = 0; i < takeProfitLevels.size(); ++i) {
        if (!(takeProfitLevels[i] > 0.0)) {
            throw std::invalid_argument("take profit levels must be positive");
        }
        if (i > 0 && !(takeProfitLevels[i] > takeProfitLevels[i - 1])) {
            throw std::invalid_argument("take profit levels must be strictly increasing");
        }
        if (!(takeProfitRatios[i] > 0.0) || takeProfitRatios[i] > 1.0) {
            throw std::invalid_argument("take profit ratios must be in (0, 1]");
        }
    }
}

OutbreakConfig OutbreakConfig::fromParams(const Params& params) {
    OutbreakConfig c;
    c.maPeriod = static_cast<int>(params.getInteger("ma_period"));
    c.maPolicy = parseWarmupPolicy(params.get<std::string>("ma_policy"));
    c.minBars = params.getCount("min_bars");
    c.stageRatios = params.getList("stage_ratios");
    c.pullbackBand = params.getNumber("pullback_band");
    c.takeProfitLevels = params.getList("take_profit_levels");
    c.takeProfitRatios = params.getList("take_profit_ratios");
    return c;
}

OutbreakStrategy::OutbreakStrategy(OutbreakConfig config) : config_(std::move(config)) {
    config_.validate();
}

void OutbreakStrategy::init() {
    ma_ = makeIndicator<SMA>(&weekly_->close(), config_.maPeriod, config_.maPolicy);
    ma_->precompute();
    addIndicator(ma_);
    // 从第一根 bar 起就可以判断，min_bars 只用于数据量检查
    setMinPeriod(1);
}

void OutbreakStrategy::start() {
    armed_ = false;
    tpDone_.assign(config_.takeProfitLevels.size(), false);
    ladder_.reset();
}

bool OutbreakStrategy::maRisingTwice() const {
    // 越界或未定义为 NaN，比较为 false
    return ma_->value(0) > ma_->value(1) && ma_->value(1) > ma_->value(2);
}

void OutbreakStrategy::next() {
    Value price = close();
    Value ma = ma_->value();
    step_.ma = ma;
    if (isnan(ma)) {
        describe();
        return;
    }

    const bool armedAtStart = armed_;

    if (!armed_ && maRisingTwice()) {
        armed_ = true;
        ladder_.reset();
        ladder_.entryHigh = price;
        tpDone_.assign(config_.takeProfitLevels.size(), false);
        note("ARM");
    }

    if (armed_) {
        tryStage(price, ma);
    }

    if (armedAtStart && ladder_.buyCount >= 1) {
        const Value highBefore = ladder_.entryHigh;
        tryTakeProfit(price);

        if (price < ma && !ledger().isFlat()) {
            sell(price, ledger().shares(), -1, ExitReason::TrendBreak,
                 "LIQUIDATE " + std::to_string(ledger().shares()));
            disarm();
        } else if (price > highBefore) {
            ladder_.entryHigh = price;
        }
    }
    describe();
}

void OutbreakStrategy::tryStage(Value price, Value ma) {
    const Size stage = ladder_.buyCount;
    if (stage >= config_.stageRatios.size()) return;

    bool trigger = false;
    switch (stage) {
        case 0:
            trigger = true;
            break;
        case 1:
            trigger = price > ma && price < ladder_.entryPrice * config_.pullbackBand;
            break;
        default:
            trigger = price > ladder_.entryHigh;
            break;
    }
    if (!trigger) return;

    Value ratio = config_.stageRatios[stage];
    Size shares = affordableShares(ledger().cash() * ratio, price);
    if (shares == 0) return;

    buy(price, shares, static_cast<int>(stage),
        std::string(STAGE_NAMES[stage]) + " " + percent(ratio) + " " + std::to_string(shares));
    if (stage == 0) {
        ladder_.entryPrice = price;
        ladder_.entryHigh = price;
    } else if (stage == 2) {
        ladder_.entryHigh = price;
    }
    ladder_.buyCount = stage + 1;
}

void OutbreakStrategy::tryTakeProfit(Value price) {
    // 每根 bar 最多一档：第一个满足条件且未执行的档位
    for (Size k = 0; k < config_.takeProfitLevels.size(); ++k) {
        if (tpDone_[k] || !(price > ladder_.entryPrice * (1.0 + config_.takeProfitLevels[k]))) {
            continue;
        }
        Size shares = static_cast<Size>(
            std::floor(static_cast<Value>(ledger().shares()) * config_.takeProfitRatios[k]));
        if (shares > 0) {
            sell(price, shares, static_cast<int>(k), ExitReason::Ladder,
                 "TP" + std::to_string(k + 1) + " " + percent(config_.takeProfitRatios[k]) +
                 " " + std::to_string(shares));
            tpDone_[k] = true;
            ladder_.sellCount += 1;
            if (k == 0) {
                ladder_.entryHigh = price;
            }
        }
        return;
    }
}

void OutbreakStrategy::disarm() {
    armed_ = false;
    ladder_.reset();
    tpDone_.assign(config_.takeProfitLevels.size(), false);
}

void OutbreakStrategy::describe() {
    if (!armed_) {
        step_.state = ledger().isFlat() ? "flat" : "holding";
        return;
    }
    std::string s;
    for (Size i = 0; i < ladder_.buyCount && i < 3; ++i) {
        if (!s.empty()) s += "+";
        s += STAGE_NAMES[i];
    }
    for (Size k = 0; k < tpDone_.size(); ++k) {
        if (!tpDone_[k]) continue;
        if (!s.empty()) s += "+";
        s += "TP" + std::to_string(k + 1);
    }
    step_.state = s.empty() ? "armed" : s;
}

} // namespace lbt
