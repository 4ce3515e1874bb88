/**
 * @file indicator.hpp
 * @brief 指标基类
 *
 * 指标绑定一条输入线，输出线与输入逐点对齐（预热期内为 NaN）。
 * 第 i 个输出只依赖输入的 [0, i]。
 */

#pragma once

#include "lbt/lineseries.hpp"
#include "lbt/params.hpp"
#include <memory>

namespace lbt {

class Indicator : public LineSeries {
public:
    Indicator() = default;

    /**
     * @brief 绑定输入线
     */
    void bindData(const LineBuffer* input) { input_ = input; }
    const LineBuffer* input() const { return input_; }

    /**
     * @brief 计算第 i 个输出值（绝对位置）
     */
    virtual Value next(Size i) const = 0;

    /**
     * @brief 批量计算 [start, end)
     */
    virtual void once(Size start, Size end) {
        for (Size i = start; i < end; ++i) {
            lines0().push(next(i));
        }
    }

    /**
     * @brief 预计算所有值
     */
    void precompute() {
        for (auto& l : lines_) l->reset();
        if (!input_) return;
        once(0, input_->length());
    }

    /**
     * @brief 当前值，[1] 为上一根
     */
    Value value(Index ago = 0) const { return lines0()[ago]; }

    Value valueAt(Size i) const {
        return i < lines0().length() ? lines0().at(i) : NaN;
    }

    Params& p() { return params_; }
    const Params& p() const { return params_; }

protected:
    Value inputAt(Size i) const { return input_->at(i); }

    const LineBuffer* input_ = nullptr;
    Params params_;
};

using IndicatorPtr = std::shared_ptr<Indicator>;

template<typename T, typename... Args>
std::shared_ptr<T> makeIndicator(Args&&... args) {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace lbt
