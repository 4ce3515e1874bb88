/**
 * @file indicators/trend.hpp
 * @brief 均线斜率与趋势确认
 *
 * Slope:   slope[i] = ma[i] - ma[i - lag]
 * TrendUp: 最近 window 个 slope 全部 > 0 时为 1，否则为 0
 */

#pragma once

#include "lbt/indicator.hpp"
#include <stdexcept>

namespace lbt {
namespace indicators {

class Slope : public Indicator {
public:
    LBT_PARAMS_BEGIN()
        LBT_PARAM(lag, 5)
    LBT_PARAMS_END()

    Slope(const LineBuffer* input, int lag = 5) : lag_(lag) {
        if (lag <= 0) {
            throw std::invalid_argument("Slope lag must be positive");
        }
        params_ = getDefaultParams();
        params_.set("lag", lag);
        bindData(input);
        addLine("slope");
    }

    Value next(Size i) const override {
        Size lag = static_cast<Size>(lag_);
        if (i < lag) return NaN;
        // NaN 会自然传播
        return inputAt(i) - inputAt(i - lag);
    }

private:
    int lag_;
};

class TrendUp : public Indicator {
public:
    LBT_PARAMS_BEGIN()
        LBT_PARAM(window, 5)
    LBT_PARAMS_END()

    TrendUp(const LineBuffer* slope, int window = 5) : window_(window) {
        if (window <= 0) {
            throw std::invalid_argument("TrendUp window must be positive");
        }
        params_ = getDefaultParams();
        params_.set("window", window);
        bindData(slope);
        addLine("trend_up");
    }

    Value next(Size i) const override {
        Size w = static_cast<Size>(window_);
        if (i + 1 < w) return 0.0;
        for (Size k = i + 1 - w; k <= i; ++k) {
            Value s = inputAt(k);
            if (isnan(s) || !(s > 0.0)) return 0.0;
        }
        return 1.0;
    }

    bool isUp(Index ago = 0) const { return value(ago) > 0.5; }

private:
    int window_;
};

} // namespace indicators

using Slope = indicators::Slope;
using TrendUp = indicators::TrendUp;

} // namespace lbt
