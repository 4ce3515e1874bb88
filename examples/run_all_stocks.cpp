/**
 * @file run_all_stocks.cpp
 * @brief 对数据目录（或缓存目录）中的所有股票批量回测，结果写入 CSV
 *
 * 用法:
 *   run_all_stocks [--data DIR] [--cache DIR] [--strategy ID[,ID...]]
 *                  [--threads N] [--capital N] [--out DIR]
 *                  [--config FILE] [--set key=value]... [symbol...]
 *
 * 每个策略生成一个 results_<strategy>.csv。
 */

#include "lbt/lbt.hpp"
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

std::vector<std::string> splitList(const std::string& text) {
    std::vector<std::string> items;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty()) items.push_back(item);
    }
    return items;
}

void usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [--data DIR] [--cache DIR] [--strategy ID[,ID...]]\n"
              << "       [--threads N] [--capital N] [--out DIR] [--config FILE]\n"
              << "       [--set key=value]... [symbol...]\n";
}

} // namespace

int main(int argc, char** argv) {
    std::string dataDir = "data";
    std::string cacheDir;
    std::string outDir = ".";
    std::vector<std::string> strategyIds{"thresholds", "outbreak"};
    std::vector<std::string> symbols;
    lbt::BatchOptions options;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("Missing value for " + arg);
                }
                return argv[++i];
            };

            if (arg == "--data") {
                dataDir = value();
            } else if (arg == "--cache") {
                cacheDir = value();
            } else if (arg == "--strategy") {
                strategyIds = splitList(value());
            } else if (arg == "--threads") {
                options.threads = static_cast<lbt::Size>(std::stoul(value()));
            } else if (arg == "--capital") {
                options.initialCapital = std::stod(value());
            } else if (arg == "--out") {
                outDir = value();
            } else if (arg == "--config") {
                options.params.override(lbt::loadParamsFile(value()));
            } else if (arg == "--set") {
                options.params.parseAssignment(value());
            } else if (arg == "-h" || arg == "--help") {
                usage(argv[0]);
                return 0;
            } else if (!arg.empty() && arg[0] == '-') {
                throw std::invalid_argument("Unknown option " + arg);
            } else {
                symbols.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        usage(argv[0]);
        return EXIT_FAILURE;
    }

    auto csv = std::make_shared<lbt::CsvDataProvider>(dataDir);
    std::shared_ptr<lbt::DataProvider> provider = csv;
    std::shared_ptr<lbt::CachedDataProvider> cached;
    if (!cacheDir.empty()) {
        cached = std::make_shared<lbt::CachedDataProvider>(csv, cacheDir);
        provider = cached;
    }

    std::vector<lbt::BatchEntry> entries;
    try {
        if (symbols.empty()) {
            symbols = cached ? cached->cachedSymbols() : std::vector<std::string>{};
            if (symbols.empty()) symbols = csv->symbols();
        }
        std::cout << "Running " << strategyIds.size() << " strategies on "
                  << symbols.size() << " symbols\n";

        options.onProgress = [](const lbt::BatchProgress& p) {
            const lbt::BatchEntry& e = *p.last;
            std::cout << "[" << p.completed << "/" << p.total << "] "
                      << e.result.strategyId << " " << e.result.symbol << ": ";
            if (!e.ok()) {
                std::cout << "failed - " << e.error << "\n";
            } else if (!e.result.hasResult()) {
                std::cout << "insufficient data, skipped\n";
            } else {
                std::cout << std::showpos << std::fixed << std::setprecision(2)
                          << *e.result.totalReturnPct << "%" << std::noshowpos << "\n";
            }
        };
        entries = lbt::runBatch(*provider, symbols, strategyIds, options);
    } catch (const std::exception& e) {
        std::cerr << "Batch failed: " << e.what() << "\n";
        return EXIT_FAILURE;
    }

    for (const auto& id : strategyIds) {
        lbt::ResultsCsvWriter writer;
        for (const auto& e : entries) {
            if (e.ok() && e.result.strategyId == id) writer.add(e.result);
        }
        const std::string path = outDir + "/results_" + id + ".csv";
        try {
            writer.writeFile(path);
            std::cout << "Wrote " << writer.size() << " rows to " << path << "\n";
        } catch (const std::exception& e) {
            std::cerr << e.what() << "\n";
            return EXIT_FAILURE;
        }
    }
    return 0;
}
