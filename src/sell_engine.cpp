/**
 * @file sell_engine.cpp
 * @brief Sell-side decision functions and structural stop
 */

#include "lbt/sell_engine.hpp"
#include <algorithm>
#include <cmath>

namespace lbt {

const char* trendPhaseName(TrendPhase phase) {
    switch (phase) {
        case TrendPhase::NoTrend: return "NoTrend";
        case TrendPhase::TrendConfirmed: return "TrendConfirmed";
        case TrendPhase::Holding: return "Holding";
        case TrendPhase::HighBroken: return "HighBroken";
        case TrendPhase::StructureFrozen: return "StructureFrozen";
        case TrendPhase::Liquidated: return "Liquidated";
    }
    return "";
}

bool isMaRising(const std::vector<Value>& maHistory, Size window) {
    if (window == 0 || maHistory.size() < window) {
        return false;
    }
    Size first = maHistory.size() - window;
    for (Size i = first; i + 1 < maHistory.size(); ++i) {
        // NaN compares false, so an undefined MA never counts as rising
        if (!(maHistory[i + 1] >= maHistory[i])) {
            return false;
        }
    }
    return true;
}

bool isMaFallingOrFlat(const std::vector<Value>& maHistory, Size window) {
    if (window == 0 || maHistory.size() < window) {
        return true;
    }
    return maHistory.back() <= maHistory[maHistory.size() - window];
}

SellDecision decideSell(Value price, Value ma20, Size sellCount, Size shares,
                        const std::vector<Value>& maHistory,
                        const std::vector<Value>& sellThresholds,
                        const std::vector<Value>& sellRatios,
                        Size minShares, Size risingWindow) {
    SellDecision decision;
    if (shares < minShares || shares == 0) {
        return decision;
    }
    Size tiers = std::min(sellThresholds.size(), sellRatios.size());
    if (sellCount >= tiers) {
        return decision;
    }
    if (isnan(ma20) || !(ma20 > 0.0) || isnan(price)) {
        return decision;
    }
    if (isMaRising(maHistory, risingWindow)) {
        return decision;
    }

    Value threshold = sellThresholds[sellCount];
    if (price < ma20 * (1.0 + threshold)) {
        return decision;
    }

    Size sellShares = 0;
    bool lastTier = sellCount + 1 == tiers;
    if (lastTier) {
        sellShares = shares;
    } else {
        sellShares = static_cast<Size>(std::floor(static_cast<Value>(shares) * sellRatios[sellCount]));
        sellShares = std::min(sellShares, shares);
    }
    if (sellShares < minShares || sellShares == 0) {
        return decision;
    }

    decision.accept = true;
    decision.shares = sellShares;
    decision.tier = static_cast<int>(sellCount);
    decision.liquidates = sellShares == shares;
    return decision;
}

std::optional<Value> nextSellThreshold(Size sellCount, const std::vector<Value>& sellThresholds) {
    if (sellCount >= sellThresholds.size()) return std::nullopt;
    return sellThresholds[sellCount];
}

// ==================== StructuralStop ====================

StructuralEvent StructuralStop::observe(const StructureInputs& in) {
    StructuralEvent event = StructuralEvent::None;
    if (!in.daily.valid()) {
        return event;
    }

    if (in.holding && !state_.highBroken && !isnan(state_.lastDailyHigh) &&
        in.daily.high < state_.lastDailyHigh && in.weeklyClose < in.prevWeeklyClose) {
        state_.highBroken = true;
        state_.structuralLow = state_.hasStructuralLow()
            ? std::max(state_.structuralLow, in.daily.low)
            : in.daily.low;
        state_.phase = TrendPhase::HighBroken;
        event = StructuralEvent::HighBroken;
    }

    state_.lastDailyHigh = in.daily.high;
    state_.lastDailyClose = in.daily.close;

    bool weakening = !in.trendUp || in.daily.close < in.ma20 * params_.deviationFloor;
    if (in.holding && weakening && state_.highBroken) {
        bool valid = in.daily.close > in.ma20 && in.slope > 0.0;
        if (valid) {
            state_.structuralLow = state_.hasStructuralLow()
                ? std::max(state_.structuralLow, in.daily.low)
                : in.daily.low;
            state_.highBroken = false;
            state_.phase = TrendPhase::Holding;
            event = StructuralEvent::Restored;
        } else {
            state_.phase = TrendPhase::StructureFrozen;
            event = StructuralEvent::Frozen;
        }
    }
    return event;
}

bool StructuralStop::shouldExit(Value close) const {
    return state_.highBroken && state_.hasStructuralLow() && close < state_.structuralLow;
}

void StructuralStop::onEntry() {
    clear();
    state_.phase = TrendPhase::Holding;
}

void StructuralStop::onExit() {
    clear();
    state_.phase = TrendPhase::Liquidated;
}

void StructuralStop::setFlatPhase(bool trendUp) {
    state_.phase = trendUp ? TrendPhase::TrendConfirmed : TrendPhase::NoTrend;
}

} // namespace lbt
