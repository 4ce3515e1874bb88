/**
 * @file registry.cpp
 * @brief 策略注册表实现
 */

#include "lbt/registry.hpp"
#include "lbt/strategies/outbreak.hpp"
#include "lbt/strategies/threshold.hpp"
#include "lbt/strategies/trend.hpp"
#include <stdexcept>
#include <utility>

namespace lbt {

Params StrategyDescriptor::resolve(const Params& overrides) const {
    Params p = defaults;
    p.overrideChecked(overrides);
    return p;
}

StrategyPtr StrategyDescriptor::create(const Params& resolved) const {
    return factory(resolved);
}

void StrategyRegistry::add(StrategyDescriptor descriptor) {
    if (descriptor.id.empty() || !descriptor.factory) {
        throw std::invalid_argument("Strategy descriptor needs an id and a factory");
    }
    if (descriptors_.count(descriptor.id) > 0) {
        throw std::invalid_argument("Strategy already registered: " + descriptor.id);
    }
    std::string id = descriptor.id;
    descriptors_.emplace(std::move(id), std::move(descriptor));
}

const StrategyDescriptor* StrategyRegistry::find(const std::string& id) const {
    auto it = descriptors_.find(id);
    return it == descriptors_.end() ? nullptr : &it->second;
}

const StrategyDescriptor& StrategyRegistry::get(const std::string& id) const {
    const StrategyDescriptor* d = find(id);
    if (!d) {
        throw std::out_of_range("Unknown strategy: " + id);
    }
    return *d;
}

std::vector<std::string> StrategyRegistry::ids() const {
    std::vector<std::string> result;
    result.reserve(descriptors_.size());
    for (const auto& kv : descriptors_) {
        result.push_back(kv.first);
    }
    return result;
}

namespace {

StrategyRegistry makeBuiltinRegistry() {
    StrategyRegistry registry;

    StrategyDescriptor thresholds;
    thresholds.id = "thresholds";
    thresholds.name = "Threshold ladder";
    thresholds.description = "Buy in tiers below MA20, take profit in tiers above it";
    thresholds.defaults = ThresholdStrategy::getDefaultParams();
    thresholds.minBars = ThresholdConfig{}.minBars;
    thresholds.factory = [](const Params& p) -> StrategyPtr {
        return std::make_unique<ThresholdStrategy>(ThresholdConfig::fromParams(p));
    };
    registry.add(std::move(thresholds));

    StrategyDescriptor trend;
    trend.id = "trend";
    trend.name = "Trend pullback";
    trend.description = "Enter on a pullback to MA20 in an uptrend, exit below the structural low";
    trend.defaults = TrendStrategy::getDefaultParams();
    trend.minBars = TrendConfig{}.minBars;
    trend.needsDaily = true;
    trend.factory = [](const Params& p) -> StrategyPtr {
        return std::make_unique<TrendStrategy>(TrendConfig::fromParams(p));
    };
    registry.add(std::move(trend));

    StrategyDescriptor outbreak;
    outbreak.id = "outbreak";
    outbreak.name = "Trend outbreak";
    outbreak.description = "Three-stage entry on a rising MA20, staged take profit, exit below MA20";
    outbreak.defaults = OutbreakStrategy::getDefaultParams();
    outbreak.minBars = OutbreakConfig{}.minBars;
    outbreak.factory = [](const Params& p) -> StrategyPtr {
        return std::make_unique<OutbreakStrategy>(OutbreakConfig::fromParams(p));
    };
    registry.add(std::move(outbreak));

    return registry;
}

} // namespace

const StrategyRegistry& builtinRegistry() {
    static const StrategyRegistry registry = makeBuiltinRegistry();
    return registry;
}

} // namespace lbt
