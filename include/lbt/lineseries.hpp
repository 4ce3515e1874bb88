/**
 * @file lineseries.hpp
 * @brief 多线对象容器
 *
 * LineSeries 是包含多个 LineBuffer 的容器：
 * - 行情序列有 date, open, high, low, close, volume 六条线
 * - 指标有一条或多条输出线
 */

#pragma once

#include "lbt/linebuffer.hpp"
#include "lbt/datafeed.hpp"
#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace lbt {

/**
 * @brief LineSeries - 多线容器
 */
class LineSeries {
public:
    LineSeries() = default;
    virtual ~LineSeries() = default;

    LBT_DEFAULT_MOVE(LineSeries)
    LBT_DISABLE_COPY(LineSeries)

    /**
     * @brief 添加一条新线
     */
    Size addLine(const std::string& name) {
        Size idx = lines_.size();
        lines_.push_back(std::make_unique<LineBuffer>());
        lineNames_[name] = idx;
        return idx;
    }

    LineBuffer& line(Size idx) {
        if (idx >= lines_.size()) throw std::out_of_range("Line index out of range");
        return *lines_[idx];
    }

    const LineBuffer& line(Size idx) const {
        if (idx >= lines_.size()) throw std::out_of_range("Line index out of range");
        return *lines_[idx];
    }

    LineBuffer& line(const std::string& name) { return *lines_[indexOf(name)]; }
    const LineBuffer& line(const std::string& name) const { return *lines_[indexOf(name)]; }

    /**
     * @throws std::runtime_error 没有这条线
     */
    Size indexOf(const std::string& name) const {
        auto it = lineNames_.find(name);
        if (it == lineNames_.end()) {
            throw std::runtime_error("Line not found: " + name);
        }
        return it->second;
    }

    bool hasLine(const std::string& name) const {
        return lineNames_.find(name) != lineNames_.end();
    }

    Size numLines() const { return lines_.size(); }

    /**
     * @brief 第一条线（默认输出）
     */
    LineBuffer& lines0() { return line(0); }
    const LineBuffer& lines0() const { return line(0); }

    /**
     * @brief 所有线的游标移到绝对位置
     */
    void seek(Size idx) {
        for (auto& l : lines_) {
            if (l->length() > idx) l->seek(idx);
        }
    }

    void home() {
        for (auto& l : lines_) {
            l->home();
        }
    }

    Size minperiod() const {
        Size mp = 1;
        for (const auto& l : lines_) {
            mp = std::max(mp, l->minperiod());
        }
        return mp;
    }

    void setMinperiod(Size mp) {
        for (auto& l : lines_) {
            l->setMinperiod(mp);
        }
    }

protected:
    std::vector<std::unique_ptr<LineBuffer>> lines_;
    std::unordered_map<std::string, Size> lineNames_;
};

/**
 * @brief 行情序列 - 日期 + OHLCV
 *
 * 日期线存放 Date::toDays() 的值。序列在一次回测中只读。
 */
class PriceSeries : public LineSeries {
public:
    static constexpr Size DATE = 0;
    static constexpr Size OPEN = 1;
    static constexpr Size HIGH = 2;
    static constexpr Size LOW = 3;
    static constexpr Size CLOSE = 4;
    static constexpr Size VOLUME = 5;

    PriceSeries() {
        addLine("date");
        addLine("open");
        addLine("high");
        addLine("low");
        addLine("close");
        addLine("volume");
    }

    explicit PriceSeries(const std::vector<Bar>& bars) : PriceSeries() {
        for (const auto& b : bars) addBar(b);
    }

    LineBuffer& date() { return line(DATE); }
    LineBuffer& open() { return line(OPEN); }
    LineBuffer& high() { return line(HIGH); }
    LineBuffer& low() { return line(LOW); }
    LineBuffer& close() { return line(CLOSE); }
    LineBuffer& volume() { return line(VOLUME); }

    const LineBuffer& date() const { return line(DATE); }
    const LineBuffer& open() const { return line(OPEN); }
    const LineBuffer& high() const { return line(HIGH); }
    const LineBuffer& low() const { return line(LOW); }
    const LineBuffer& close() const { return line(CLOSE); }
    const LineBuffer& volume() const { return line(VOLUME); }

    void addBar(const Bar& b) {
        date().push(static_cast<Value>(b.date.toDays()));
        open().push(b.open);
        high().push(b.high);
        low().push(b.low);
        close().push(b.close);
        volume().push(b.volume);
    }

    Size size() const { return close().length(); }
    bool empty() const { return size() == 0; }

    /**
     * @brief 按绝对位置取出一根 K 线
     */
    Bar bar(Size idx) const {
        Bar b;
        b.date = dateAt(idx);
        b.open = open().at(idx);
        b.high = high().at(idx);
        b.low = low().at(idx);
        b.close = close().at(idx);
        b.volume = volume().at(idx);
        return b;
    }

    Date dateAt(Size idx) const {
        return Date::fromDays(static_cast<long>(date().at(idx)));
    }

    std::vector<Bar> bars() const {
        std::vector<Bar> result;
        result.reserve(size());
        for (Size i = 0; i < size(); ++i) {
            result.push_back(bar(i));
        }
        return result;
    }
};

} // namespace lbt
