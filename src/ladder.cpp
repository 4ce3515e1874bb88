/**
 * @file ladder.cpp
 * @brief Ladder configuration checks
 */

#include "lbt/ladder.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace lbt {

namespace {

void checkRatios(const std::vector<Value>& ratios, const char* what) {
    for (Size i = 0; i < ratios.size(); ++i) {
        if (!(ratios[i] > 0.0) || ratios[i] > 1.0) {
            throw std::invalid_argument(std::string(what) + "[" + std::to_string(i) +
                                        "] must be in (0, 1]");
        }
    }
}

} // namespace

void LadderConfig::validate() const {
    if (buyLevels.empty()) {
        throw std::invalid_argument("buy_levels must not be empty");
    }
    if (buyLevels.size() != buyRatios.size()) {
        throw std::invalid_argument("buy_levels and buy_ratios must have the same length");
    }
    if (sellThresholds.size() != sellRatios.size()) {
        throw std::invalid_argument("sell_thresholds and sell_ratios must have the same length");
    }
    for (Size i = 0; i < buyLevels.size(); ++i) {
        if (!(buyLevels[i] < 0.0)) {
            throw std::invalid_argument("buy_levels must be negative fractions");
        }
        if (i > 0 && !(std::fabs(buyLevels[i]) > std::fabs(buyLevels[i - 1]))) {
            throw std::invalid_argument("buy_levels must be strictly increasing in magnitude");
        }
    }
    for (Size i = 0; i < sellThresholds.size(); ++i) {
        if (!(sellThresholds[i] > 0.0)) {
            throw std::invalid_argument("sell_thresholds must be positive fractions");
        }
        if (i > 0 && !(sellThresholds[i] > sellThresholds[i - 1])) {
            throw std::invalid_argument("sell_thresholds must be strictly increasing");
        }
    }
    checkRatios(buyRatios, "buy_ratios");
    checkRatios(sellRatios, "sell_ratios");
    if (risingWindow < 2) {
        throw std::invalid_argument("rising_window must be at least 2");
    }
    if (!(minCash >= 0.0)) {
        throw std::invalid_argument("min_cash must be non-negative");
    }
}

} // namespace lbt
