/**
 * @file buy_engine.cpp
 * @brief Buy-side decision functions
 */

#include "lbt/buy_engine.hpp"
#include "lbt/ledger.hpp"
#include <algorithm>
#include <cmath>

namespace lbt {

namespace {

bool cashUsable(Value cash, Value minCash) {
    return std::isfinite(cash) && cash >= 0.0 && cash >= minCash;
}

} // namespace

Value priceDropRate(Value price, Value ma20) {
    if (isnan(ma20) || !(ma20 > 0.0) || isnan(price)) {
        return NaN;
    }
    return (ma20 - price) / ma20;
}

BuyDecision decideBuy(Value price, Value ma20, Size buyCount,
                      const std::vector<Value>& buyLevels,
                      const std::vector<Value>& buyRatios,
                      Value availableCash, Value minCash) {
    BuyDecision decision;
    if (!cashUsable(availableCash, minCash) || !(price > 0.0)) {
        return decision;
    }

    Value dropRate = priceDropRate(price, ma20);
    if (isnan(dropRate)) {
        return decision;
    }

    Size tiers = std::min(buyLevels.size(), buyRatios.size());
    for (Size i = buyCount; i < tiers; ++i) {
        if (dropRate < std::fabs(buyLevels[i])) continue;

        // first satisfied tier only; a zero-share tier declines outright
        Value spend = availableCash * buyRatios[i];
        Size shares = affordableShares(spend, price);
        if (shares == 0) {
            return decision;
        }
        decision.accept = true;
        decision.tier = static_cast<int>(i);
        decision.spendAmount = spend;
        decision.shares = shares;
        return decision;
    }
    return decision;
}

std::optional<Size> nextBuyTier(Value price, Value ma20, Size buyCount,
                                const std::vector<Value>& buyLevels) {
    Value dropRate = priceDropRate(price, ma20);
    if (isnan(dropRate)) return std::nullopt;
    for (Size i = buyCount; i < buyLevels.size(); ++i) {
        if (dropRate >= std::fabs(buyLevels[i])) return i;
    }
    return std::nullopt;
}

Value nextBuyPrice(Value ma20, Size buyCount, const std::vector<Value>& buyLevels) {
    if (buyCount >= buyLevels.size() || isnan(ma20) || !(ma20 > 0.0)) return NaN;
    return ma20 * (1.0 - std::fabs(buyLevels[buyCount]));
}

BuyDecision decidePullbackEntry(Value price, Value ma20, bool trendUp, Value availableCash,
                                Value band, Value ratio, Value minCash) {
    BuyDecision decision;
    if (!trendUp || !cashUsable(availableCash, minCash)) {
        return decision;
    }
    if (isnan(ma20) || !(ma20 > 0.0) || !(price > 0.0)) {
        return decision;
    }
    if (price < ma20 || price > ma20 * band) {
        return decision;
    }

    Value spend = availableCash * ratio;
    Size shares = affordableShares(spend, price);
    if (shares == 0) {
        return decision;
    }
    decision.accept = true;
    decision.tier = 0;
    decision.spendAmount = spend;
    decision.shares = shares;
    return decision;
}

} // namespace lbt
