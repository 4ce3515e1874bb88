/**
 * @file ladder.hpp
 * @brief Per-position ladder and structural-low state
 */

#pragma once

#include "lbt/common.hpp"
#include <vector>

namespace lbt {

/**
 * @brief Progress through the buy/sell tiers of one position cycle
 *
 * buyCount is the next unused buy tier, sellCount the next unused sell
 * tier. Both go back to zero together, only when the position is flat.
 */
struct LadderState {
    Size buyCount = 0;
    Size sellCount = 0;
    Value entryPrice = NaN;   ///< price of the first buy of the cycle
    Value entryHigh = NaN;    ///< highest close seen since entry

    void reset() { *this = LadderState{}; }

    bool fresh() const { return buyCount == 0 && sellCount == 0; }
};

/**
 * @brief Buy/sell tier definition of a ladder strategy
 */
struct LadderConfig {
    std::vector<Value> buyLevels{-0.04, -0.08, -0.13, -0.19, -0.26};
    std::vector<Value> buyRatios{0.10, 0.15, 0.20, 0.25, 0.30};
    std::vector<Value> sellThresholds{0.08, 0.12, 0.18};
    std::vector<Value> sellRatios{0.30, 0.30, 0.40};
    Value minCash = 100.0;
    Size minSellShares = 100;
    Size risingWindow = 3;

    /**
     * @throws std::invalid_argument on mismatched or unordered tiers
     */
    void validate() const;
};

/**
 * @brief Phases of the structural-low trailing stop
 */
enum class TrendPhase {
    NoTrend,          ///< flat, no confirmed uptrend
    TrendConfirmed,   ///< flat, trend_up holds, waiting for a pullback entry
    Holding,          ///< in position, weekly high structure intact
    HighBroken,       ///< in position, lower high + lower close recorded
    StructureFrozen,  ///< broken and re-validation failed, stop level frozen
    Liquidated        ///< position closed by the structural stop
};

const char* trendPhaseName(TrendPhase phase);

/**
 * @brief Intraweek structure tracked by the trend strategy
 */
struct StructuralLowState {
    Value structuralLow = NaN;   ///< trailing stop level, NaN when undefined
    bool highBroken = false;
    Value lastDailyHigh = NaN;   ///< previous week's intraweek high
    Value lastDailyClose = NaN;  ///< previous week's last daily close
    TrendPhase phase = TrendPhase::NoTrend;

    void reset() { *this = StructuralLowState{}; }

    bool hasStructuralLow() const { return !isnan(structuralLow); }
};

} // namespace lbt
