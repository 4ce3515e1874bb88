/**
 * @file linebuffer.hpp
 * @brief 时间序列缓冲区
 *
 * LineBuffer 保存一条完整的历史序列，并带有一个游标：
 * - [0] 表示游标所在的"当前"值
 * - [1], [2]... 表示过去的值
 * - 越界读取（包括游标之后的值）返回 NaN，策略在第 i 根 bar 上看不到 i 之后的数据
 */

#pragma once

#include "lbt/common.hpp"
#include <vector>
#include <stdexcept>

namespace lbt {

class LineBuffer {
public:
    LineBuffer() = default;

    LBT_DEFAULT_MOVE(LineBuffer)
    LBT_DISABLE_COPY(LineBuffer)

    /**
     * @brief 相对游标的索引 - [0] 当前，[1] 上一根
     */
    Value operator[](Index ago) const {
        Index actual = pos_ - ago;
        if (ago < 0 || actual < 0 || actual >= static_cast<Index>(data_.size())) {
            return NaN;
        }
        return data_[static_cast<Size>(actual)];
    }

    /**
     * @brief 绝对索引访问（指标预计算使用）
     */
    Value at(Size idx) const {
        if (idx >= data_.size()) {
            throw std::out_of_range("LineBuffer index out of range");
        }
        return data_[idx];
    }

    void push(Value v) { data_.push_back(v); }

    void extend(const std::vector<Value>& values) {
        data_.insert(data_.end(), values.begin(), values.end());
    }

    /**
     * @brief 将游标移动到绝对位置
     */
    void seek(Size idx) {
        if (idx >= data_.size()) {
            throw std::out_of_range("LineBuffer seek out of range");
        }
        pos_ = static_cast<Index>(idx);
    }

    void advance() {
        if (pos_ < static_cast<Index>(data_.size()) - 1) {
            ++pos_;
        }
    }

    void home() { pos_ = 0; }

    Index position() const { return pos_; }
    Size length() const { return data_.size(); }
    bool empty() const { return data_.empty(); }

    Size minperiod() const { return minperiod_; }
    void setMinperiod(Size mp) { minperiod_ = mp; }

    void reset() {
        data_.clear();
        pos_ = 0;
    }

    void reserve(Size n) { data_.reserve(n); }

    Value current() const { return (*this)[0]; }

    /**
     * @brief 截至游标（含）的历史，不包含未来值
     */
    std::vector<Value> history() const {
        if (data_.empty()) return {};
        return std::vector<Value>(data_.begin(), data_.begin() + pos_ + 1);
    }

    const std::vector<Value>& data() const { return data_; }

private:
    std::vector<Value> data_;
    Index pos_ = 0;
    Size minperiod_ = 1;
};

} // namespace lbt
