/**
 * @file analyzer.hpp
 * @brief Analyzer System
 *
 * Analyzers receive every step record and every executed trade of a run and
 * turn them into statistics.
 *
 * Lifecycle (driven by Backtester):
 * - start(startCash) - before the first bar
 * - next(step)       - every bar, warm-up bars included
 * - notifyTrade()    - every executed buy/sell
 * - stop(endValue)   - after end-of-series liquidation
 */

#pragma once

#include "lbt/ledger.hpp"
#include "lbt/strategy.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace lbt {

class Analyzer {
public:
    virtual ~Analyzer() = default;

    virtual std::string name() const = 0;

    // Lifecycle methods
    virtual void start(Value startCash) { (void)startCash; }
    virtual void next(const StepRecord& step) { (void)step; }
    virtual void notifyTrade(const TradeRecord& trade) { (void)trade; }
    virtual void stop(Value endValue) { (void)endValue; }

    /**
     * @brief Get analysis results
     * @return Map of analysis name to value
     */
    const std::map<std::string, Value>& getAnalysis() const { return analysis_; }

protected:
    std::map<std::string, Value> analysis_;
};

using AnalyzerPtr = std::shared_ptr<Analyzer>;

/**
 * @brief 年度资产区间
 */
struct YearBucket {
    int year = 0;
    Value startAsset = 0.0;
    Value endAsset = 0.0;

    /** (end - start) / start * 100，start <= 0 时为 0 */
    Value returnPct() const {
        return startAsset > 0.0 ? (endAsset - startAsset) / startAsset * 100.0 : 0.0;
    }
};

/**
 * @brief Annual Return analyzer
 *
 * 按自然年记录起止总资产。第一年的起点是初始资金，之后每年的起点等于
 * 上一年的终点；每根 bar 都会更新当年的终点。
 */
class AnnualReturn : public Analyzer {
public:
    std::string name() const override { return "annual_return"; }

    void start(Value startCash) override;
    void next(const StepRecord& step) override;
    void stop(Value endValue) override;

    const std::vector<YearBucket>& buckets() const { return buckets_; }

    /** year -> return pct */
    std::map<int, Value> yearlyReturns() const;

private:
    std::vector<YearBucket> buckets_;
    Value prevYearEnd_ = 0.0;
};

/**
 * @brief Trade Analyzer
 *
 * A closed trade is one position cycle, from the first buy after flat to the
 * sell that brings the holding back to zero.
 */
class TradeAnalyzer : public Analyzer {
public:
    std::string name() const override { return "trades"; }

    void start(Value startCash) override;
    void notifyTrade(const TradeRecord& trade) override;
    void stop(Value endValue) override;

    Size buys() const { return buys_; }
    Size sells() const { return sells_; }
    Size closedTrades() const { return closedTrades_; }
    Size wonTrades() const { return wonTrades_; }
    Size lostTrades() const { return lostTrades_; }

private:
    Size buys_ = 0;
    Size sells_ = 0;
    Size closedTrades_ = 0;
    Size wonTrades_ = 0;
    Size lostTrades_ = 0;
    Size forcedExits_ = 0;
    Value grossProfit_ = 0;
    Value grossLoss_ = 0;
    Size currentStreak_ = 0;
    Size maxWinStreak_ = 0;
    Size maxLossStreak_ = 0;
    bool lastWasWin_ = false;
};

/**
 * @brief Drawdown analyzer
 */
class DrawDown : public Analyzer {
public:
    std::string name() const override { return "drawdown"; }

    void start(Value startCash) override;
    void next(const StepRecord& step) override;
    void stop(Value endValue) override;

private:
    void update(Value value);

    Value maxValue_ = 0;
    Value maxDrawdown_ = 0;
    Value maxDrawdownPct_ = 0;
    Size drawdownLen_ = 0;
    Size maxDrawdownLen_ = 0;
};

} // namespace lbt
