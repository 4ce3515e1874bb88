/**
 * @file example_ladder.cpp
 * @brief 用合成行情跑三个内置策略
 */

#include <cmath>
#include <iomanip>
#include <iostream>
#include <memory>
#include "lbt/lbt.hpp"

namespace {

/**
 * @brief 两年工作日日线：缓慢上涨 + 周期波动
 */
std::vector<lbt::Bar> syntheticDaily() {
    std::vector<lbt::Bar> bars;
    lbt::Date d(2022, 1, 3);
    double price = 20.0;
    for (int i = 0; bars.size() < 520; ++i, d = d.addDays(1)) {
        if (d.isoWeekday() > 5) continue;
        double drift = 0.0006;
        double wave = 0.018 * std::sin(static_cast<double>(i) / 23.0);
        price *= 1.0 + drift + wave * 0.3;
        lbt::Bar b;
        b.date = d;
        b.open = price * 0.995;
        b.high = price * 1.01;
        b.low = price * 0.985;
        b.close = price;
        b.volume = 100000.0 + (i % 7) * 5000.0;
        bars.push_back(b);
    }
    return bars;
}

} // namespace

int main() {
    std::cout << "=== ladder_backtest example ===" << std::endl;
    std::cout << "Version: " << lbt::version() << std::endl << std::endl;

    lbt::MemoryDataProvider provider;
    provider.add("DEMO", syntheticDaily());

    // 周线上的 MA20 与趋势标志
    std::vector<lbt::Bar> weekly = provider.getWeeklySeries("DEMO");
    lbt::PriceSeries series(weekly);
    lbt::SMA ma(&series.close(), 20, lbt::WarmupPolicy::Strict);
    ma.precompute();
    lbt::Slope slope(&ma.lines0(), 5);
    slope.precompute();
    lbt::TrendUp trend(&slope.lines0(), 5);
    trend.precompute();

    std::cout << weekly.size() << " weekly bars, last 5:" << std::endl;
    std::cout << std::fixed << std::setprecision(2);
    for (lbt::Size i = weekly.size() - 5; i < weekly.size(); ++i) {
        std::cout << "  " << weekly[i].date.toString() << "  close " << weekly[i].close
                  << "  ma20 " << ma.valueAt(i)
                  << "  trend " << (trend.valueAt(i) > 0.5 ? "up" : "down") << std::endl;
    }
    std::cout << std::endl;

    auto summary = std::make_shared<lbt::SummaryWriter>(std::cout);
    for (const auto& id : lbt::builtinRegistry().ids()) {
        lbt::BacktestResult r = lbt::runBacktest(provider, "DEMO", 100000.0, id, {}, {summary});
        if (r.hasResult()) {
            std::cout << id << ": " << std::showpos << *r.totalReturnPct << "%"
                      << std::noshowpos << std::endl << std::endl;
        }
    }
    return 0;
}
