/**
 * @file ledger.hpp
 * @brief Position ledger
 *
 * Single-symbol cash account. Cash and shares only change through buy() and
 * sell(); every execution is appended to the trade log and never modified.
 */

#pragma once

#include "lbt/datafeed.hpp"
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace lbt {

enum class Side {
    Buy,
    Sell
};

/**
 * @brief Why shares were sold
 */
enum class ExitReason {
    None,            ///< buys
    Ladder,          ///< threshold / take-profit tier
    StructuralStop,  ///< close below the structural low
    TrendBreak,      ///< close below the moving average
    EndOfSeries      ///< forced sale at the last bar, reporting only
};

const char* sideName(Side side);
const char* exitReasonName(ExitReason reason);

/**
 * @brief Immutable trade log entry
 */
struct TradeRecord {
    Size ref = 0;
    Date date;
    Side side = Side::Buy;
    Value price = 0.0;
    Size shares = 0;
    int tier = -1;
    ExitReason reason = ExitReason::None;
    Value cashFlow = 0.0;        ///< signed: negative for buys
    bool closesPosition = false; ///< shares went to zero with this sell
    Value pnl = 0.0;             ///< cycle profit, set when closesPosition

    bool isBuy() const { return side == Side::Buy; }
};

/**
 * @brief Largest whole share count whose cost does not exceed amount
 */
Size affordableShares(Value amount, Value price);

class Ledger {
public:
    using TradeCallback = std::function<void(const TradeRecord&)>;

    explicit Ledger(Value cash = 100000.0);

    // ==================== Account ====================

    Value cash() const { return cash_; }
    Value startCash() const { return startCash_; }
    Size shares() const { return shares_; }
    bool isFlat() const { return shares_ == 0; }

    /**
     * @brief cash + shares * price
     */
    Value value(Value price) const;

    // ==================== Execution ====================

    /**
     * @throws std::invalid_argument zero shares, non-positive price or cost above cash
     */
    TradeRecord buy(const Date& date, Value price, Size shares, int tier);

    /**
     * @throws std::invalid_argument zero shares, non-positive price or more than held
     */
    TradeRecord sell(const Date& date, Value price, Size shares, int tier, ExitReason reason);

    /**
     * @brief Sell everything held
     */
    TradeRecord liquidate(const Date& date, Value price, int tier, ExitReason reason) {
        return sell(date, price, shares_, tier, reason);
    }

    // ==================== Position cycle ====================

    /** Buy costs since the position was last opened from flat */
    Value cycleCost() const { return cycleCost_; }
    /** Sell proceeds since the position was last opened from flat */
    Value cycleProceeds() const { return cycleProceeds_; }
    /** Number of completed flat -> flat cycles */
    Size closedCycles() const { return closedCycles_; }
    Value realizedPnl() const { return realizedPnl_; }

    const std::vector<TradeRecord>& trades() const { return trades_; }

    void setTradeCallback(TradeCallback cb) { tradeCb_ = std::move(cb); }

    void reset();

private:
    TradeRecord record(TradeRecord trade);

    Value cash_;
    Value startCash_;
    Size shares_ = 0;
    Value cycleCost_ = 0.0;
    Value cycleProceeds_ = 0.0;
    Size closedCycles_ = 0;
    Value realizedPnl_ = 0.0;
    std::vector<TradeRecord> trades_;
    TradeCallback tradeCb_;
};

} // namespace lbt
