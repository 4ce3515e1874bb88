/**
 * @file common.hpp
 * @brief ladder_backtest 通用定义和宏
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <cmath>
#include <string>

namespace lbt {

// 版本信息
constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

inline std::string version() {
    return std::to_string(VERSION_MAJOR) + "." +
           std::to_string(VERSION_MINOR) + "." +
           std::to_string(VERSION_PATCH);
}

// 基础类型别名
using Size = std::size_t;
using Index = std::ptrdiff_t;  // 支持负索引
using Value = double;          // 价格/金额类型

// 特殊值
constexpr Value NaN = std::numeric_limits<Value>::quiet_NaN();

inline bool isnan(Value v) { return std::isnan(v); }

// 禁用拷贝宏
#define LBT_DISABLE_COPY(Class) \
    Class(const Class&) = delete; \
    Class& operator=(const Class&) = delete;

// 默认移动宏
#define LBT_DEFAULT_MOVE(Class) \
    Class(Class&&) = default; \
    Class& operator=(Class&&) = default;

} // namespace lbt
