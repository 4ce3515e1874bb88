/**
 * @file backtester.hpp
 * @brief Backtester - single-symbol weekly backtest engine
 *
 * The Backtester coordinates:
 * - the weekly (and optionally daily) price series
 * - one strategy, created fresh for every run
 * - the ledger
 * - analyzers and writers
 *
 * Usage:
 * @code
 * lbt::Backtester bt;
 * bt.setCash(100000);
 * bt.setData(weeklyBars);
 * bt.addStrategy<lbt::ThresholdStrategy>();
 * lbt::BacktestResult result = bt.run();
 * @endcode
 */

#pragma once

#include "lbt/analyzer.hpp"
#include "lbt/provider.hpp"
#include "lbt/result.hpp"
#include "lbt/strategy.hpp"
#include "lbt/writer.hpp"
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace lbt {

class StrategyRegistry;

class Backtester {
public:
    using StrategyFactory = std::function<StrategyPtr()>;

    LBT_PARAMS_BEGIN()
        LBT_PARAM(cash, 100000.0)
        LBT_PARAM(liquidate_at_end, true)  // 期末按最后收盘价清仓
    LBT_PARAMS_END()

    Backtester() : params_(getDefaultParams()) {}

    LBT_DISABLE_COPY(Backtester)

    // ==================== Setup ====================

    void setCash(Value cash) { params_.set("cash", cash); }
    Value cash() const { return params_.getNumber("cash"); }

    void setSymbol(std::string symbol) { symbol_ = std::move(symbol); }
    const std::string& symbol() const { return symbol_; }

    /**
     * @brief 周线必需；日线只有需要日线结构的策略才会用到
     */
    void setData(std::vector<Bar> weekly, std::vector<Bar> daily = {}) {
        weeklyBars_ = std::move(weekly);
        dailyBars_ = std::move(daily);
    }

    /**
     * @brief Add a strategy class to be instantiated at run time
     */
    template<typename T, typename... Args>
    void addStrategy(Args&&... args) {
        // Capture args by value to avoid dangling references
        factory_ = [args...]() -> StrategyPtr {
            return std::make_unique<T>(args...);
        };
    }

    void setStrategyFactory(StrategyFactory factory, std::string strategyId = "") {
        factory_ = std::move(factory);
        strategyId_ = std::move(strategyId);
    }

    /**
     * @brief Add an analyzer; its results appear in BacktestResult::analyses
     */
    template<typename T, typename... Args>
    std::shared_ptr<T> addAnalyzer(Args&&... args) {
        auto analyzer = std::make_shared<T>(std::forward<Args>(args)...);
        analyzers_.push_back(analyzer);
        return analyzer;
    }

    void addWriter(WriterPtr writer) { writers_.push_back(std::move(writer)); }

    Params& p() { return params_; }
    const Params& p() const { return params_; }

    // ==================== Run ====================

    /**
     * @brief One forward pass over the weekly series
     *
     * Returns an empty totalReturnPct when the series is shorter than the
     * strategy's minimum bars. Every call starts from a fresh strategy and
     * ledger, so repeated runs give identical results.
     *
     * @throws std::logic_error no strategy was added
     */
    BacktestResult run();

    /**
     * @brief Ledger of the last run
     */
    const Ledger& ledger() const { return ledger_; }

private:
    void notifyTrade(const TradeRecord& trade);

    Params params_;
    std::string symbol_;
    std::string strategyId_;
    std::vector<Bar> weeklyBars_;
    std::vector<Bar> dailyBars_;
    StrategyFactory factory_;
    std::vector<AnalyzerPtr> analyzers_;
    std::vector<WriterPtr> writers_;

    // per-run state
    std::vector<AnalyzerPtr> active_;
    Ledger ledger_;
};

/**
 * @brief Fetch the series, build the strategy from the registry and run it
 *
 * @param params overrides of the strategy's default parameters
 * @throws std::out_of_range unknown strategy id
 * @throws std::invalid_argument bad parameters
 * @throws ProviderError data could not be fetched
 */
BacktestResult runBacktest(DataProvider& provider, const std::string& symbol,
                           Value initialCapital, const std::string& strategyId,
                           const Params& params = {},
                           const std::vector<WriterPtr>& writers = {});

BacktestResult runBacktest(DataProvider& provider, const std::string& symbol,
                           Value initialCapital, const std::string& strategyId,
                           const Params& params, const std::vector<WriterPtr>& writers,
                           const StrategyRegistry& registry);

} // namespace lbt
