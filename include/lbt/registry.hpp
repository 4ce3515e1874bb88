/**
 * @file registry.hpp
 * @brief 策略注册表
 *
 * 策略 id -> 描述符（默认参数、最少 bar 数、是否需要日线、工厂函数）。
 * 内置策略：thresholds, trend, outbreak。
 */

#pragma once

#include "lbt/params.hpp"
#include "lbt/strategy.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace lbt {

struct StrategyDescriptor {
    using Factory = std::function<StrategyPtr(const Params&)>;

    std::string id;
    std::string name;          ///< 展示名
    std::string description;
    Params defaults;           ///< 参数 schema，同时也是默认值
    Size minBars = 1;
    bool needsDaily = false;
    Factory factory;

    /**
     * @brief 默认参数加上覆盖项
     * @throws std::invalid_argument 未知参数或类型不符
     */
    Params resolve(const Params& overrides) const;

    /**
     * @brief 用已合并的完整参数创建策略
     * @throws std::invalid_argument 参数不合法
     */
    StrategyPtr create(const Params& resolved) const;
};

class StrategyRegistry {
public:
    /**
     * @throws std::invalid_argument id 重复或工厂为空
     */
    void add(StrategyDescriptor descriptor);

    const StrategyDescriptor* find(const std::string& id) const;

    /**
     * @throws std::out_of_range 未注册的 id
     */
    const StrategyDescriptor& get(const std::string& id) const;

    bool has(const std::string& id) const { return find(id) != nullptr; }

    /** 已排序 */
    std::vector<std::string> ids() const;

    Size size() const { return descriptors_.size(); }

private:
    std::map<std::string, StrategyDescriptor> descriptors_;
};

/**
 * @brief 内置策略注册表（进程内只构建一次）
 */
const StrategyRegistry& builtinRegistry();

} // namespace lbt
