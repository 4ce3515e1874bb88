/**
 * @file batch.hpp
 * @brief 批量回测：股票 × 策略，互相独立的运行并行执行
 */

#pragma once

#include "lbt/backtester.hpp"
#include <functional>
#include <string>
#include <vector>

namespace lbt {

/**
 * @brief 一次 (symbol, strategy) 运行的结果
 *
 * 出错时 error 非空，result 只带 symbol / strategyId
 */
struct BatchEntry {
    BacktestResult result;
    std::string error;

    bool ok() const { return error.empty(); }
    bool hasResult() const { return ok() && result.hasResult(); }
};

struct BatchProgress {
    Size completed = 0;
    Size total = 0;
    const BatchEntry* last = nullptr;  ///< 刚完成的一项
};

struct BatchOptions {
    Value initialCapital = 100000.0;
    Size threads = 0;                  ///< 0 = 硬件线程数
    Params params;                     ///< 对所有策略生效的覆盖项（按各自 schema 过滤）
    std::function<void(const BatchProgress&)> onProgress;  ///< 在调用线程里回调
};

/**
 * @brief 对每个股票运行每个策略
 *
 * 单个运行的异常（数据源失败、参数错误）记录在 BatchEntry::error 中，不影响
 * 其他运行。结果按 symbols 再按 strategyIds 的顺序排列。
 *
 * @throws std::out_of_range strategyIds 中有未注册的策略
 */
std::vector<BatchEntry> runBatch(DataProvider& provider,
                                 const std::vector<std::string>& symbols,
                                 const std::vector<std::string>& strategyIds,
                                 const BatchOptions& options = {});

std::vector<BatchEntry> runBatch(DataProvider& provider,
                                 const std::vector<std::string>& symbols,
                                 const std::vector<std::string>& strategyIds,
                                 const BatchOptions& options,
                                 const StrategyRegistry& registry);

/**
 * @brief 只保留 schema 中存在的键
 */
Params paramsForSchema(const Params& overrides, const Params& schema);

} // namespace lbt
