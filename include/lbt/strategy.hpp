/**
 * @file strategy.hpp
 * @brief Strategy framework
 *
 * A Strategy reads the weekly series (and optionally the daily series) up to
 * the current bar, consults the buy/sell engines and executes on the Ledger.
 *
 * Lifecycle (driven by Backtester):
 * 1. init()      - build indicators over the loaded series
 * 2. start()     - before the first bar
 * 3. prenext()   - bars before minPeriod is reached
 * 4. nextstart() - first bar with minPeriod reached
 * 5. next()      - every later bar
 * 6. stop()      - after the last bar
 */

#pragma once

#include "lbt/indicator.hpp"
#include "lbt/ledger.hpp"
#include "lbt/ladder.hpp"
#include <memory>
#include <string>
#include <vector>

namespace lbt {

/**
 * @brief Evaluation order when a step could both sell and buy
 */
enum class StepOrder {
    SellThenBuy,  ///< an executed sell suppresses buys in the same step
    BuyThenSell   ///< buy stages first, then take-profit and stop checks
};

/**
 * @brief What happened on one bar, for analyzers and writers
 */
struct StepRecord {
    Size barIndex = 0;
    Date date;
    Value close = NaN;
    Value ma = NaN;
    Value markPrice = NaN;  ///< price used to value the holding
    Size shares = 0;
    Value cash = 0.0;
    Value totalAsset = 0.0;
    std::string state;
    std::string operation;
    bool traded = false;
};

class Strategy {
public:
    virtual ~Strategy() = default;

    virtual std::string name() const = 0;

    // ==================== Lifecycle Methods ====================

    virtual void init() {}
    virtual void start() {}
    virtual void prenext() {}
    virtual void nextstart() { next(); }
    virtual void next() {}
    virtual void stop() {}

    virtual StepOrder stepOrder() const { return StepOrder::SellThenBuy; }

    /**
     * @brief Fewest weekly bars for which a run produces a result
     */
    virtual Size minBars() const { return minPeriod_; }

    /**
     * @brief Whether the daily series must be loaded for this strategy
     */
    virtual bool needsDaily() const { return false; }

    /**
     * @brief Current ladder progress
     */
    const LadderState& ladder() const { return ladder_; }

    // ==================== Setup (called by Backtester) ====================

    void setLedger(Ledger* ledger) { ledger_ = ledger; }
    void setData(PriceSeries* weekly, PriceSeries* daily = nullptr) {
        weekly_ = weekly;
        daily_ = daily;
    }

    /**
     * @brief Position the weekly series and all indicators at bar idx
     */
    void moveTo(Size idx);

    /**
     * @brief Clear the step record before the bar is processed
     */
    void beginStep();

    StepRecord& step() { return step_; }
    const StepRecord& step() const { return step_; }

    void setMinPeriod(Size p) { minPeriod_ = p; }
    Size minPeriod() const { return minPeriod_; }

    Size barIndex() const { return barIndex_; }
    void setBarLength(Size len) { barLength_ = len; }
    Size barLength() const { return barLength_; }

protected:
    // ==================== Data Access ====================

    Value close(Index ago = 0) const { return weekly_->close()[ago]; }
    Date date() const { return weekly_->dateAt(barIndex_); }
    bool hasDaily() const { return daily_ != nullptr && !daily_->empty(); }

    Ledger& ledger() const;

    void addIndicator(const IndicatorPtr& ind) { indicators_.push_back(ind); }

    /**
     * @brief Last n values of a line up to the current bar
     */
    static std::vector<Value> recent(const LineBuffer& line, Size n);

    // ==================== Trading Methods ====================

    TradeRecord buy(Value price, Size shares, int tier, const std::string& label);
    TradeRecord sell(Value price, Size shares, int tier, ExitReason reason, const std::string& label);

    void note(const std::string& text);

    Ledger* ledger_ = nullptr;
    PriceSeries* weekly_ = nullptr;
    PriceSeries* daily_ = nullptr;
    std::vector<IndicatorPtr> indicators_;
    LadderState ladder_;
    StepRecord step_;
    Size minPeriod_ = 1;
    Size barIndex_ = 0;
    Size barLength_ = 0;
};

using StrategyPtr = std::unique_ptr<Strategy>;

} // namespace lbt
