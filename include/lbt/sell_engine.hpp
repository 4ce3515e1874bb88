/**
 * @file sell_engine.hpp
 * @brief Sell-side decision functions
 *
 * Two variants:
 * - threshold ladder (decideSell): take profit in tiers above the moving average
 * - structural low (StructuralStop): trailing stop driven by the intraweek
 *   daily high/low structure, used by the trend strategy
 */

#pragma once

#include "lbt/ladder.hpp"
#include <optional>
#include <vector>

namespace lbt {

/**
 * @brief Smallest sell order, also the smallest holding that may be sold from
 */
constexpr Size MIN_SELL_SHARES = 100;

struct SellDecision {
    bool accept = false;
    Size shares = 0;
    int tier = -1;
    bool liquidates = false;  ///< sells the whole holding
};

/**
 * @brief True when the last `window` MA observations are non-decreasing
 */
bool isMaRising(const std::vector<Value>& maHistory, Size window = 3);

/**
 * @brief True when the MA did not rise over the last `window` observations
 *
 * Fewer observations than `window` count as flat.
 */
bool isMaFallingOrFlat(const std::vector<Value>& maHistory, Size window = 2);

/**
 * @brief Threshold ladder sell decision
 *
 * Declines when shares < minShares, all tiers are used, the MA is undefined
 * or <= 0, or the MA is still rising. Otherwise tier sellCount triggers at
 * price >= ma20 * (1 + sellThresholds[sellCount]); the last tier sells the
 * whole holding.
 */
SellDecision decideSell(Value price, Value ma20, Size sellCount, Size shares,
                        const std::vector<Value>& maHistory,
                        const std::vector<Value>& sellThresholds,
                        const std::vector<Value>& sellRatios,
                        Size minShares = MIN_SELL_SHARES,
                        Size risingWindow = 3);

/**
 * @brief Rise above ma20 needed by the next sell tier, if any remains
 */
std::optional<Value> nextSellThreshold(Size sellCount, const std::vector<Value>& sellThresholds);

/**
 * @brief Intraweek aggregate of the daily bars belonging to one week
 */
struct WeekStructure {
    Value high = NaN;
    Value low = NaN;
    Value close = NaN;

    bool valid() const { return !isnan(high) && !isnan(low) && !isnan(close); }
};

/**
 * @brief Inputs of one weekly step of the structural stop
 */
struct StructureInputs {
    WeekStructure daily;
    Value weeklyClose = NaN;
    Value prevWeeklyClose = NaN;
    bool holding = false;
    bool trendUp = false;
    Value ma20 = NaN;
    Value slope = NaN;
};

enum class StructuralEvent {
    None,
    HighBroken,   ///< lower intraweek high and lower weekly close
    Restored,     ///< structure valid again, stop ratcheted up
    Frozen        ///< re-validation failed while broken
};

/**
 * @brief Structural-low trailing stop state machine
 *
 * While holding, a week whose intraweek high is below the previous week's
 * and whose weekly close is below the previous close marks the structure as
 * broken and records the week's low as the stop. Re-validation only runs
 * when the trend flag is off or the close sits more than (1 - deviationFloor)
 * below the MA. The stop level never moves down.
 */
class StructuralStop {
public:
    struct Params {
        Value deviationFloor = 0.92;
    };

    StructuralStop() = default;
    explicit StructuralStop(const Params& params) : params_(params) {}

    /**
     * @brief Process one week of daily structure
     *
     * Updates lastDailyHigh / lastDailyClose whether or not a position is held.
     */
    StructuralEvent observe(const StructureInputs& in);

    /**
     * @brief Exit condition: broken and the close below the structural low
     */
    bool shouldExit(Value close) const;

    /**
     * @brief A position was opened; all structure is cleared
     */
    void onEntry();

    /**
     * @brief The position was closed by the stop; all structure is cleared
     */
    void onExit();

    /**
     * @brief Drop every structural field, keep the phase
     */
    void clear() {
        TrendPhase phase = state_.phase;
        state_.reset();
        state_.phase = phase;
    }

    /**
     * @brief Phase while flat: NoTrend or TrendConfirmed
     */
    void setFlatPhase(bool trendUp);

    const StructuralLowState& state() const { return state_; }
    const Params& params() const { return params_; }

private:
    Params params_;
    StructuralLowState state_;
};

} // namespace lbt
