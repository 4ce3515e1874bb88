/**
 * @file analyzer.cpp
 * @brief Analyzer implementations
 */

#include "lbt/analyzer.hpp"
#include <algorithm>
#include <cmath>

namespace lbt {

// ==================== AnnualReturn ====================

void AnnualReturn::start(Value startCash) {
    buckets_.clear();
    analysis_.clear();
    prevYearEnd_ = startCash;
}

void AnnualReturn::next(const StepRecord& step) {
    const int year = step.date.year;
    if (buckets_.empty() || buckets_.back().year != year) {
        if (!buckets_.empty()) {
            prevYearEnd_ = buckets_.back().endAsset;
        }
        YearBucket bucket;
        bucket.year = year;
        bucket.startAsset = prevYearEnd_;
        bucket.endAsset = prevYearEnd_;
        buckets_.push_back(bucket);
    }
    buckets_.back().endAsset = step.totalAsset;
}

void AnnualReturn::stop(Value endValue) {
    // 期末强制平仓后的资产计入最后一年
    if (!buckets_.empty()) {
        buckets_.back().endAsset = endValue;
    }
    for (const auto& b : buckets_) {
        analysis_["return_" + std::to_string(b.year)] = b.returnPct();
    }
    analysis_["years"] = static_cast<Value>(buckets_.size());
}

std::map<int, Value> AnnualReturn::yearlyReturns() const {
    std::map<int, Value> result;
    for (const auto& b : buckets_) {
        result[b.year] = b.returnPct();
    }
    return result;
}

// ==================== TradeAnalyzer ====================

void TradeAnalyzer::start(Value startCash) {
    (void)startCash;
    analysis_.clear();
    buys_ = 0;
    sells_ = 0;
    closedTrades_ = 0;
    wonTrades_ = 0;
    lostTrades_ = 0;
    forcedExits_ = 0;
    grossProfit_ = 0;
    grossLoss_ = 0;
    currentStreak_ = 0;
    maxWinStreak_ = 0;
    maxLossStreak_ = 0;
    lastWasWin_ = false;
}

void TradeAnalyzer::notifyTrade(const TradeRecord& trade) {
    if (trade.isBuy()) {
        buys_++;
        return;
    }
    sells_++;
    if (trade.reason == ExitReason::EndOfSeries) {
        forcedExits_++;
    }
    if (!trade.closesPosition) return;  // Only count closed cycles

    closedTrades_++;

    if (trade.pnl > 0) {
        wonTrades_++;
        grossProfit_ += trade.pnl;

        if (lastWasWin_) {
            currentStreak_++;
        } else {
            currentStreak_ = 1;
            lastWasWin_ = true;
        }
        maxWinStreak_ = std::max(maxWinStreak_, currentStreak_);

    } else if (trade.pnl < 0) {
        lostTrades_++;
        grossLoss_ += std::abs(trade.pnl);

        if (!lastWasWin_) {
            currentStreak_++;
        } else {
            currentStreak_ = 1;
            lastWasWin_ = false;
        }
        maxLossStreak_ = std::max(maxLossStreak_, currentStreak_);
    }
}

void TradeAnalyzer::stop(Value endValue) {
    (void)endValue;
    analysis_["buys"] = static_cast<Value>(buys_);
    analysis_["sells"] = static_cast<Value>(sells_);
    analysis_["total_trades"] = static_cast<Value>(closedTrades_);
    analysis_["won_trades"] = static_cast<Value>(wonTrades_);
    analysis_["lost_trades"] = static_cast<Value>(lostTrades_);
    analysis_["forced_exits"] = static_cast<Value>(forcedExits_);
    analysis_["gross_profit"] = grossProfit_;
    analysis_["gross_loss"] = grossLoss_;
    analysis_["net_profit"] = grossProfit_ - grossLoss_;
    analysis_["max_win_streak"] = static_cast<Value>(maxWinStreak_);
    analysis_["max_loss_streak"] = static_cast<Value>(maxLossStreak_);

    if (closedTrades_ > 0) {
        analysis_["win_rate"] = static_cast<Value>(wonTrades_) / closedTrades_ * 100.0;
        analysis_["avg_trade"] = (grossProfit_ - grossLoss_) / closedTrades_;
    } else {
        analysis_["win_rate"] = 0.0;
        analysis_["avg_trade"] = 0.0;
    }
}

// ==================== DrawDown ====================

void DrawDown::start(Value startCash) {
    analysis_.clear();
    maxValue_ = startCash;
    maxDrawdown_ = 0;
    maxDrawdownPct_ = 0;
    drawdownLen_ = 0;
    maxDrawdownLen_ = 0;
}

void DrawDown::next(const StepRecord& step) {
    update(step.totalAsset);
}

void DrawDown::update(Value value) {
    // Update peak
    maxValue_ = std::max(maxValue_, value);

    Value drawdown = maxValue_ - value;
    Value drawdownPct = maxValue_ > 0 ? drawdown / maxValue_ : 0;

    maxDrawdown_ = std::max(maxDrawdown_, drawdown);
    maxDrawdownPct_ = std::max(maxDrawdownPct_, drawdownPct);

    // Track duration
    if (drawdown > 0) {
        drawdownLen_++;
        maxDrawdownLen_ = std::max(maxDrawdownLen_, drawdownLen_);
    } else {
        drawdownLen_ = 0;
    }
}

void DrawDown::stop(Value endValue) {
    analysis_["max_drawdown"] = maxDrawdownPct_ * 100.0;
    analysis_["max_moneydown"] = maxDrawdown_;
    analysis_["max_len"] = static_cast<Value>(maxDrawdownLen_);
    analysis_["end_value"] = endValue;
}

} // namespace lbt
