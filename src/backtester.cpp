/**
 * @file backtester.cpp
 * @brief Backtester implementation
 */

#include "lbt/backtester.hpp"
#include "lbt/registry.hpp"
#include <stdexcept>

namespace lbt {

void Backtester::notifyTrade(const TradeRecord& trade) {
    for (auto& analyzer : active_) {
        analyzer->notifyTrade(trade);
    }
    for (auto& writer : writers_) {
        writer->notifyTrade(trade);
    }
}

BacktestResult Backtester::run() {
    if (!factory_) {
        throw std::logic_error("Backtester has no strategy");
    }
    StrategyPtr strategy = factory_();

    BacktestResult result;
    result.symbol = symbol_;
    result.strategyId = strategyId_.empty() ? strategy->name() : strategyId_;
    result.startCash = cash();
    result.endValue = result.startCash;
    result.totalBars = weeklyBars_.size();

    ledger_ = Ledger(result.startCash);

    // Not enough data: no result, no exception
    if (weeklyBars_.size() < strategy->minBars() || weeklyBars_.empty()) {
        for (auto& writer : writers_) {
            writer->stop(result);
        }
        return result;
    }

    PriceSeries weekly(weeklyBars_);
    PriceSeries daily(dailyBars_);

    // 内置分析器：年度收益与交易统计总会计算
    auto annual = std::make_shared<AnnualReturn>();
    auto trades = std::make_shared<TradeAnalyzer>();
    active_.clear();
    active_.push_back(annual);
    active_.push_back(trades);
    active_.insert(active_.end(), analyzers_.begin(), analyzers_.end());

    ledger_.setTradeCallback([this](const TradeRecord& t) { notifyTrade(t); });

    strategy->setLedger(&ledger_);
    strategy->setData(&weekly, strategy->needsDaily() && !daily.empty() ? &daily : nullptr);
    strategy->setBarLength(weekly.size());
    strategy->init();

    for (auto& analyzer : active_) {
        analyzer->start(result.startCash);
    }
    for (auto& writer : writers_) {
        writer->start(symbol_, result.strategyId, result.startCash);
    }

    strategy->start();

    Size minPeriod = strategy->minPeriod();
    if (minPeriod == 0) minPeriod = 1;
    bool calledNextStart = false;

    // Main loop
    for (Size bar = 0; bar < weekly.size(); ++bar) {
        strategy->moveTo(bar);
        strategy->beginStep();

        if (bar < minPeriod - 1) {
            strategy->prenext();
        } else if (!calledNextStart) {
            strategy->nextstart();
            calledNextStart = true;
        } else {
            strategy->next();
        }

        StepRecord& step = strategy->step();
        step.shares = ledger_.shares();
        step.cash = ledger_.cash();
        step.totalAsset = ledger_.value(step.markPrice);

        for (auto& analyzer : active_) {
            analyzer->next(step);
        }
        for (auto& writer : writers_) {
            writer->next(step);
        }
    }

    strategy->stop();

    const Size last = weekly.size() - 1;
    const Value lastClose = weekly.close().at(last);
    if (!ledger_.isFlat() && params_.get<bool>("liquidate_at_end")) {
        ledger_.liquidate(weekly.dateAt(last), lastClose, -1, ExitReason::EndOfSeries);
    }
    result.endValue = ledger_.value(lastClose);

    for (auto& analyzer : active_) {
        analyzer->stop(result.endValue);
        result.analyses[analyzer->name()] = analyzer->getAnalysis();
    }

    result.totalReturnPct = (result.endValue / result.startCash - 1.0) * 100.0;
    result.yearlyReturns = annual->yearlyReturns();
    result.years = annual->buckets();
    result.trades = ledger_.trades();

    for (auto& writer : writers_) {
        writer->stop(result);
    }

    ledger_.setTradeCallback(nullptr);
    active_.clear();
    return result;
}

BacktestResult runBacktest(DataProvider& provider, const std::string& symbol,
                           Value initialCapital, const std::string& strategyId,
                           const Params& params, const std::vector<WriterPtr>& writers) {
    return runBacktest(provider, symbol, initialCapital, strategyId, params, writers,
                       builtinRegistry());
}

BacktestResult runBacktest(DataProvider& provider, const std::string& symbol,
                           Value initialCapital, const std::string& strategyId,
                           const Params& params, const std::vector<WriterPtr>& writers,
                           const StrategyRegistry& registry) {
    const StrategyDescriptor& descriptor = registry.get(strategyId);

    // 参数错误要在取数之前暴露
    Params resolved = descriptor.resolve(params);
    descriptor.create(resolved);

    std::vector<Bar> weekly = provider.getWeeklySeries(symbol);
    std::vector<Bar> daily;
    if (descriptor.needsDaily) {
        daily = provider.getDailySeries(symbol);
    }

    Backtester bt;
    bt.setCash(initialCapital);
    bt.setSymbol(symbol);
    bt.setData(std::move(weekly), std::move(daily));
    bt.setStrategyFactory([&descriptor, resolved]() { return descriptor.create(resolved); },
                          descriptor.id);
    for (const auto& writer : writers) {
        bt.addWriter(writer);
    }
    bt.addAnalyzer<DrawDown>();
    return bt.run();
}

} // namespace lbt
