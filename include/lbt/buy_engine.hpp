/**
 * @file buy_engine.hpp
 * @brief Buy-side decision functions
 *
 * All functions are pure: they look at prices, the ladder position and the
 * available cash and answer accept/decline. The caller executes the trade on
 * the Ledger and advances the LadderState.
 */

#pragma once

#include "lbt/common.hpp"
#include <optional>
#include <vector>

namespace lbt {

/**
 * @brief Minimum cash needed before any buy is considered
 */
constexpr Value MIN_TRADE_CASH = 100.0;

struct BuyDecision {
    bool accept = false;
    int tier = -1;            ///< tier index that triggered, -1 on decline
    Value spendAmount = 0.0;  ///< cash allotted to the tier
    Size shares = 0;          ///< whole shares affordable with spendAmount
};

/**
 * @brief (ma20 - price) / ma20, NaN when ma20 is undefined or not positive
 */
Value priceDropRate(Value price, Value ma20);

/**
 * @brief Ladder buy decision
 *
 * Scans tiers from buyCount upward and takes the first one whose
 * |buyLevels[i]| is reached by the drop below ma20. Declines when cash is
 * below minCash, ma20 is undefined or <= 0, or the tier buys zero shares.
 *
 * @param buyLevels  negative fractions, increasing in magnitude
 * @param buyRatios  fraction of the available cash spent by each tier
 */
BuyDecision decideBuy(Value price, Value ma20, Size buyCount,
                      const std::vector<Value>& buyLevels,
                      const std::vector<Value>& buyRatios,
                      Value availableCash,
                      Value minCash = MIN_TRADE_CASH);

/**
 * @brief First tier from buyCount upward whose level the drop below ma20 reaches
 *
 * Empty when no such tier exists or ma20 is undefined or <= 0. Unlike
 * decideBuy this ignores cash and ratios.
 */
std::optional<Size> nextBuyTier(Value price, Value ma20, Size buyCount,
                                const std::vector<Value>& buyLevels);

/**
 * @brief Price at which tier buyCount would trigger for the given ma20
 */
Value nextBuyPrice(Value ma20, Size buyCount, const std::vector<Value>& buyLevels);

/**
 * @brief Pullback entry inside a confirmed uptrend
 *
 * Accepts when trendUp and ma20 <= price <= ma20 * band, spending
 * availableCash * ratio in whole shares.
 */
BuyDecision decidePullbackEntry(Value price, Value ma20, bool trendUp, Value availableCash,
                                Value band = 1.05, Value ratio = 1.0,
                                Value minCash = MIN_TRADE_CASH);

} // namespace lbt
