/**
 * @file indicators/sma.hpp
 * @brief 简单移动平均 (Simple Moving Average)
 *
 * 计算公式: SMA = sum(close, period) / period
 *
 * 预热期有两种策略：
 * - Strict:  不足 period 个样本时输出 NaN
 * - Lenient: 不足 period 个样本时输出已有样本的均值
 */

#pragma once

#include "lbt/indicator.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace lbt {

enum class WarmupPolicy {
    Strict,
    Lenient
};

inline WarmupPolicy parseWarmupPolicy(const std::string& name) {
    if (name == "strict") return WarmupPolicy::Strict;
    if (name == "lenient") return WarmupPolicy::Lenient;
    throw std::invalid_argument("Unknown ma_policy: " + name);
}

inline const char* warmupPolicyName(WarmupPolicy policy) {
    return policy == WarmupPolicy::Strict ? "strict" : "lenient";
}

namespace indicators {

class SMA : public Indicator {
public:
    LBT_PARAMS_BEGIN()
        LBT_PARAM(period, 20)
        LBT_PARAM(policy, std::string("strict"))
    LBT_PARAMS_END()

    SMA(const LineBuffer* input, int period, WarmupPolicy policy = WarmupPolicy::Strict)
        : period_(period), policy_(policy) {
        if (period <= 0) {
            throw std::invalid_argument("SMA period must be positive");
        }
        params_ = getDefaultParams();
        params_.set("period", period);
        params_.set("policy", std::string(warmupPolicyName(policy)));
        bindData(input);
        addLine("sma");
        setMinperiod(policy == WarmupPolicy::Strict ? static_cast<Size>(period) : 1);
    }

    Value next(Size i) const override {
        Size n = static_cast<Size>(period_);
        if (i + 1 < n) {
            if (policy_ == WarmupPolicy::Strict) return NaN;
            n = i + 1;
        }
        Value sum = 0.0;
        for (Size k = i + 1 - n; k <= i; ++k) {
            sum += inputAt(k);
        }
        return sum / static_cast<Value>(n);
    }

    int period() const { return period_; }
    WarmupPolicy policy() const { return policy_; }

private:
    int period_;
    WarmupPolicy policy_;
};

} // namespace indicators

using SMA = indicators::SMA;

/**
 * @brief 对一组收盘价计算移动平均
 */
inline std::vector<Value> movingAverage(const std::vector<Value>& closes, int window = 20,
                                        WarmupPolicy policy = WarmupPolicy::Strict) {
    LineBuffer input;
    input.extend(closes);
    SMA sma(&input, window, policy);
    sma.precompute();
    return sma.lines0().data();
}

} // namespace lbt
