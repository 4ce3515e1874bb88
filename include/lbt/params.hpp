/**
 * @file params.hpp
 * @brief 参数系统 - 策略配置的统一存储
 *
 * - 支持默认值 (LBT_PARAMS_BEGIN / LBT_PARAM / LBT_PARAMS_END)
 * - 支持 merge / override
 * - 支持从文本 "key=value" 解析（命令行 --set 与配置文件）
 */

#pragma once

#include "lbt/common.hpp"
#include <string>
#include <vector>
#include <unordered_map>
#include <variant>
#include <stdexcept>
#include <type_traits>

namespace lbt {

/**
 * @brief 参数值类型
 *
 * 阶梯参数（买入档位、卖出档位）使用 std::vector<double>
 */
using ParamValue = std::variant<
    bool,
    int,
    long,
    double,
    std::string,
    std::vector<double>
>;

/**
 * @brief 参数存储容器
 */
class Params {
public:
    Params() = default;

    template<typename T>
    void set(const std::string& name, T value) {
        params_[name] = ParamValue(std::move(value));
    }

    void set(const std::string& name, const char* value) {
        params_[name] = ParamValue(std::string(value));
    }

    void setValue(const std::string& name, ParamValue value) {
        params_[name] = std::move(value);
    }

    /**
     * @brief 获取参数，类型不符时抛出 std::invalid_argument
     */
    template<typename T>
    T get(const std::string& name) const {
        const ParamValue& v = raw(name);
        if (const T* p = std::get_if<T>(&v)) {
            return *p;
        }
        throw std::invalid_argument("Parameter has unexpected type: " + name);
    }

    /**
     * @brief 获取参数（带默认值）
     */
    template<typename T>
    T get(const std::string& name, T defaultValue) const {
        auto it = params_.find(name);
        if (it == params_.end()) {
            return defaultValue;
        }
        if (const T* p = std::get_if<T>(&it->second)) {
            return *p;
        }
        return defaultValue;
    }

    /**
     * @brief 数值参数，int/long/double 均可
     */
    double getNumber(const std::string& name) const;

    /**
     * @brief 整数参数，接受整数值的 double
     */
    long getInteger(const std::string& name) const;

    /**
     * @brief 非负整数参数（窗口、股数、bar 数）
     * @throws std::invalid_argument 负数或非整数
     */
    Size getCount(const std::string& name) const;

    /**
     * @brief 列表参数，单个数值视为一个元素的列表
     */
    std::vector<double> getList(const std::string& name) const;

    const ParamValue& raw(const std::string& name) const {
        auto it = params_.find(name);
        if (it == params_.end()) {
            throw std::runtime_error("Parameter not found: " + name);
        }
        return it->second;
    }

    bool has(const std::string& name) const {
        return params_.find(name) != params_.end();
    }

    /**
     * @brief 合并另一个参数集（已有的键保留）
     */
    void merge(const Params& other) {
        for (const auto& [key, value] : other.params_) {
            if (params_.find(key) == params_.end()) {
                params_[key] = value;
            }
        }
    }

    /**
     * @brief 覆盖参数
     */
    void override(const Params& other) {
        for (const auto& [key, value] : other.params_) {
            params_[key] = value;
        }
    }

    std::vector<std::string> keys() const;

    Size size() const { return params_.size(); }
    bool empty() const { return params_.empty(); }

    /**
     * @brief 解析单个赋值 "key=value"
     *
     * 值的推断顺序：true/false → 整数 → 浮点 → 逗号分隔的浮点列表 → 字符串
     */
    void parseAssignment(const std::string& assignment);

    /**
     * @brief 按 schema 中已有键的类型检查覆盖项
     * @throws std::invalid_argument 未知键或类型不兼容
     */
    void overrideChecked(const Params& overrides);

    static ParamValue parseValue(const std::string& text);

private:
    std::unordered_map<std::string, ParamValue> params_;
};

/**
 * @brief 参数值转文本（日志、报告用）
 */
std::string toString(const ParamValue& value);

/**
 * @brief 读取参数文件，每行一个 key=value，'#' 开头为注释
 * @throws std::runtime_error 文件无法打开或某行无法解析
 */
Params loadParamsFile(const std::string& path);

/**
 * @brief 参数构建器 - 流式 API 设置参数
 */
class ParamsBuilder {
public:
    ParamsBuilder() = default;

    template<typename T>
    ParamsBuilder& add(const std::string& name, T value) {
        params_.set(name, std::move(value));
        return *this;
    }

    Params build() const { return params_; }

    operator Params() const { return params_; }

private:
    Params params_;
};

// 便捷宏：定义默认参数
#define LBT_PARAMS_BEGIN() \
    static ::lbt::Params getDefaultParams() { \
        return ::lbt::ParamsBuilder()

#define LBT_PARAM(name, value) \
        .add(#name, value)

#define LBT_PARAMS_END() \
        .build(); \
    }

} // namespace lbt
