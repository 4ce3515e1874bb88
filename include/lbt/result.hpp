/**
 * @file result.hpp
 * @brief 单次回测结果
 */

#pragma once

#include "lbt/analyzer.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lbt {

struct BacktestResult {
    std::string symbol;
    std::string strategyId;

    /**
     * @brief (endValue / startCash - 1) * 100
     *
     * 为空表示周线数量不足策略的最少 bar 数，此时 yearlyReturns 也为空
     */
    std::optional<Value> totalReturnPct;
    std::map<int, Value> yearlyReturns;

    std::vector<YearBucket> years;
    std::vector<TradeRecord> trades;
    Value startCash = 0.0;
    Value endValue = 0.0;
    Size totalBars = 0;

    /** analyzer name -> analysis */
    std::map<std::string, std::map<std::string, Value>> analyses;

    bool hasResult() const { return totalReturnPct.has_value(); }

    /**
     * @brief 某个分析器的某项结果，不存在时为 NaN
     */
    Value analysis(const std::string& analyzer, const std::string& key) const {
        auto it = analyses.find(analyzer);
        if (it == analyses.end()) return NaN;
        auto jt = it->second.find(key);
        return jt == it->second.end() ? NaN : jt->second;
    }
};

} // namespace lbt
