/**
 * @file batch.cpp
 * @brief 批量回测
 */

#include "lbt/batch.hpp"
#include "lbt/registry.hpp"
#include "lbt/threadpool.hpp"
#include <exception>
#include <future>

namespace lbt {

Params paramsForSchema(const Params& overrides, const Params& schema) {
    Params result;
    for (const auto& key : overrides.keys()) {
        if (schema.has(key)) {
            result.setValue(key, overrides.raw(key));
        }
    }
    return result;
}

std::vector<BatchEntry> runBatch(DataProvider& provider,
                                 const std::vector<std::string>& symbols,
                                 const std::vector<std::string>& strategyIds,
                                 const BatchOptions& options) {
    return runBatch(provider, symbols, strategyIds, options, builtinRegistry());
}

std::vector<BatchEntry> runBatch(DataProvider& provider,
                                 const std::vector<std::string>& symbols,
                                 const std::vector<std::string>& strategyIds,
                                 const BatchOptions& options,
                                 const StrategyRegistry& registry) {
    struct Job {
        std::string symbol;
        const StrategyDescriptor* descriptor;
    };

    std::vector<Job> jobs;
    jobs.reserve(symbols.size() * strategyIds.size());
    for (const auto& symbol : symbols) {
        for (const auto& id : strategyIds) {
            jobs.push_back(Job{symbol, &registry.get(id)});
        }
    }

    ThreadPool pool(options.threads);
    std::vector<std::future<BatchEntry>> futures;
    futures.reserve(jobs.size());

    for (const auto& job : jobs) {
        futures.push_back(pool.submit([&provider, &options, &registry, job]() {
            BatchEntry entry;
            entry.result.symbol = job.symbol;
            entry.result.strategyId = job.descriptor->id;
            entry.result.startCash = options.initialCapital;
            try {
                Params overrides = paramsForSchema(options.params, job.descriptor->defaults);
                entry.result = runBacktest(provider, job.symbol, options.initialCapital,
                                           job.descriptor->id, overrides, {}, registry);
            } catch (const std::exception& e) {
                // 单个运行失败只记录，不影响其他股票
                entry.error = e.what();
            }
            return entry;
        }));
    }

    std::vector<BatchEntry> entries;
    entries.reserve(futures.size());
    BatchProgress progress;
    progress.total = futures.size();
    for (auto& future : futures) {
        entries.push_back(future.get());
        ++progress.completed;
        if (options.onProgress) {
            progress.last = &entries.back();
            options.onProgress(progress);
        }
    }
    return entries;
}

} // namespace lbt
