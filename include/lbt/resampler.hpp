/**
 * @file resampler.hpp
 * @brief Daily -> weekly resampling
 *
 * Daily bars are bucketed by their ISO (year, week) key. A weekly bar takes
 * the first open, the max high, the min low, the last close, the summed
 * volume and the date of the last daily bar in the bucket.
 */

#pragma once

#include "lbt/datafeed.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include <vector>

namespace lbt {

/**
 * @brief Bar being built from daily updates
 */
struct WeeklyBar {
    Bar bar;
    std::pair<int, int> key{0, 0};
    bool open = false;

    void start(const Bar& daily) {
        bar = daily;
        key = daily.date.isoWeek();
        open = true;
    }

    void update(const Bar& daily) {
        bar.high = std::max(bar.high, daily.high);
        bar.low = std::min(bar.low, daily.low);
        bar.close = daily.close;
        bar.volume += daily.volume;
        bar.date = daily.date;
    }

    void reset() {
        bar = Bar{};
        key = {0, 0};
        open = false;
    }
};

/**
 * @brief Weekly resampler
 *
 * Feed daily bars in ascending date order; a weekly bar is completed when the
 * first daily bar of the next ISO week arrives, or on flush().
 */
class WeeklyResampler {
public:
    /**
     * @brief Process one daily bar
     * @return true if a weekly bar was completed by this call
     * @throws std::invalid_argument if dates are not strictly ascending
     */
    bool process(const Bar& daily) {
        if (current_.open && daily.date <= current_.bar.date) {
            throw std::invalid_argument("Daily bars out of order at " + daily.date.toString());
        }

        if (!current_.open) {
            current_.start(daily);
            return false;
        }

        if (daily.date.isoWeek() == current_.key) {
            current_.update(daily);
            return false;
        }

        completed_.push_back(current_.bar);
        current_.start(daily);
        return true;
    }

    /**
     * @brief Close the pending bar (end of data)
     */
    bool flush() {
        if (!current_.open) return false;
        completed_.push_back(current_.bar);
        current_.reset();
        return true;
    }

    const std::vector<Bar>& completedBars() const { return completed_; }

    std::vector<Bar> takeCompletedBars() {
        std::vector<Bar> result = std::move(completed_);
        completed_.clear();
        return result;
    }

    bool hasPendingBar() const { return current_.open; }
    const Bar& pendingBar() const { return current_.bar; }

    void reset() {
        current_.reset();
        completed_.clear();
    }

private:
    WeeklyBar current_;
    std::vector<Bar> completed_;
};

/**
 * @brief Resample a whole daily series
 */
inline std::vector<Bar> resampleWeekly(const std::vector<Bar>& daily) {
    WeeklyResampler resampler;
    for (const auto& b : daily) {
        resampler.process(b);
    }
    resampler.flush();
    return resampler.takeCompletedBars();
}

} // namespace lbt
