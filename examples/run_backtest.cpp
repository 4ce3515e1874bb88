/**
 * @file run_backtest.cpp
 * @brief 单只股票回测
 *
 * 用法:
 *   run_backtest <symbol> [--strategy thresholds|trend|outbreak] [--data DIR]
 *                [--cache DIR] [--capital N] [--config FILE] [--set key=value]...
 *                [--trades-only] [--list]
 *
 * 数据文件为 DIR/<symbol>.csv（Date,Open,High,Low,Close,Volume 日线）。
 * 指定 --cache 时先读本地缓存，过期（1 天）才重新读取数据目录。
 */

#include "lbt/lbt.hpp"
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " <symbol> [--strategy ID] [--data DIR] [--cache DIR]\n"
              << "       [--capital N] [--config FILE] [--set key=value]... [--trades-only]\n"
              << "       " << argv0 << " --list\n";
}

void listStrategies() {
    const lbt::StrategyRegistry& registry = lbt::builtinRegistry();
    for (const auto& id : registry.ids()) {
        const lbt::StrategyDescriptor& d = registry.get(id);
        std::cout << id << "  (" << d.name << ", min " << d.minBars << " weeks"
                  << (d.needsDaily ? ", daily bars" : "") << ")\n"
                  << "    " << d.description << "\n";
        for (const auto& key : d.defaults.keys()) {
            std::cout << "    " << key << " = " << lbt::toString(d.defaults.raw(key)) << "\n";
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string symbol;
    std::string strategyId = "thresholds";
    std::string dataDir = "data";
    std::string cacheDir;
    double capital = 100000.0;
    bool tradesOnly = false;
    lbt::Params overrides;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--list") {
                listStrategies();
                return 0;
            } else if (arg == "--strategy") {
                strategyId = value();
            } else if (arg == "--data") {
                dataDir = value();
            } else if (arg == "--cache") {
                cacheDir = value();
            } else if (arg == "--capital") {
                capital = std::stod(value());
            } else if (arg == "--config") {
                overrides.override(lbt::loadParamsFile(value()));
            } else if (arg == "--set") {
                overrides.parseAssignment(value());
            } else if (arg == "--trades-only") {
                tradesOnly = true;
            } else if (arg == "-h" || arg == "--help") {
                usage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] == '-') {
                throw std::invalid_argument("Unknown option " + arg);
            } else {
                symbol = arg;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (symbol.empty()) {
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    std::shared_ptr<lbt::DataProvider> provider = std::make_shared<lbt::CsvDataProvider>(dataDir);
    if (!cacheDir.empty()) {
        provider = std::make_shared<lbt::CachedDataProvider>(provider, cacheDir);
    }

    auto log = std::make_shared<lbt::StepLogWriter>(std::cout);
    log->setTradesOnly(tradesOnly);
    auto summary = std::make_shared<lbt::SummaryWriter>(std::cout);

    try {
        lbt::BacktestResult result = lbt::runBacktest(*provider, symbol, capital, strategyId,
                                                      overrides, {log, summary});
        if (!result.hasResult()) {
            return 2;
        }
        std::cout << "Total return: " << *result.totalReturnPct << "%\n";
    } catch (const std::exception& e) {
        std::cerr << "Backtest failed: " << e.what() << "\n";
        return EXIT_FAILURE;
    }
    return 0;
}
