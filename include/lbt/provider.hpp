/**
 * @file provider.hpp
 * @brief 行情数据源
 *
 * - DataProvider: 按股票代码与日期区间返回升序日线/周线
 * - MemoryDataProvider: 内存数据（测试、Python）
 * - CsvDataProvider: 目录下的 <symbol>.csv
 * - CachedDataProvider: 本地缓存（默认 1 天过期）+ 指数退避重试
 */

#pragma once

#include "lbt/datafeed.hpp"
#include "lbt/resampler.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace lbt {

/**
 * @brief 数据源失败，回测中止
 */
class ProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief 可重试的失败（网络抖动、文件暂时不可用等）
 */
class TransientProviderError : public ProviderError {
public:
    using ProviderError::ProviderError;
};

class DataProvider {
public:
    virtual ~DataProvider() = default;

    /**
     * @brief 升序日线，start/end 为默认构造的 Date 时表示不限
     * @throws ProviderError
     */
    virtual std::vector<Bar> getDailySeries(const std::string& symbol,
                                            const Date& start = {},
                                            const Date& end = {}) = 0;

    /**
     * @brief 升序周线，默认由日线按 ISO 周聚合
     */
    virtual std::vector<Bar> getWeeklySeries(const std::string& symbol,
                                             const Date& start = {},
                                             const Date& end = {}) {
        return resampleWeekly(getDailySeries(symbol, start, end));
    }
};

using DataProviderPtr = std::shared_ptr<DataProvider>;

/**
 * @brief 截取 [start, end]，无效日期表示不限
 */
std::vector<Bar> filterRange(const std::vector<Bar>& bars, const Date& start, const Date& end);

/**
 * @brief 按日期排序并检查重复
 * @throws ProviderError 同一日期出现两次
 */
void sortBars(std::vector<Bar>& bars, const std::string& symbol);

// ==================== MemoryDataProvider ====================

class MemoryDataProvider : public DataProvider {
public:
    void add(const std::string& symbol, std::vector<Bar> daily);

    /**
     * @brief 直接提供周线，不再由日线聚合
     */
    void addWeekly(const std::string& symbol, std::vector<Bar> weekly);

    bool has(const std::string& symbol) const;
    std::vector<std::string> symbols() const;

    std::vector<Bar> getDailySeries(const std::string& symbol,
                                    const Date& start = {},
                                    const Date& end = {}) override;

    std::vector<Bar> getWeeklySeries(const std::string& symbol,
                                     const Date& start = {},
                                     const Date& end = {}) override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<Bar>> daily_;
    std::map<std::string, std::vector<Bar>> weekly_;
};

// ==================== CsvDataProvider ====================

class CsvDataProvider : public DataProvider {
public:
    explicit CsvDataProvider(std::string directory, CsvFormat format = {});

    std::string pathFor(const std::string& symbol) const;

    /** 目录下所有 .csv 文件对应的代码，已排序 */
    std::vector<std::string> symbols() const;

    std::vector<Bar> getDailySeries(const std::string& symbol,
                                    const Date& start = {},
                                    const Date& end = {}) override;

private:
    std::string directory_;
    CsvFormat format_;
};

// ==================== CachedDataProvider ====================

/**
 * @brief 有界指数退避
 *
 * 第 k 次重试前等待 min(initialDelay * multiplier^(k-1), maxDelay)
 */
struct RetryPolicy {
    int maxAttempts = 3;
    std::chrono::milliseconds initialDelay{500};
    double multiplier = 2.0;
    std::chrono::milliseconds maxDelay{8000};

    std::chrono::milliseconds delayFor(int retry) const;
};

/**
 * @brief 按 policy 调用 fn，只重试 TransientProviderError
 * @throws ProviderError 最后一次仍失败
 */
template<typename Fn>
auto withRetry(const RetryPolicy& policy,
               const std::function<void(std::chrono::milliseconds)>& sleeper,
               Fn&& fn) -> decltype(fn()) {
    const int attempts = policy.maxAttempts < 1 ? 1 : policy.maxAttempts;
    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        } catch (const TransientProviderError& e) {
            if (attempt >= attempts) {
                throw ProviderError(std::string(e.what()) + " (gave up after " +
                                    std::to_string(attempts) + " attempts)");
            }
        }
        if (sleeper) sleeper(policy.delayFor(attempt));
    }
}

class CachedDataProvider : public DataProvider {
public:
    using Clock = std::chrono::system_clock;
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using Now = std::function<Clock::time_point()>;

    struct Options {
        std::chrono::hours expiry{24};
        RetryPolicy retry;
        Sleeper sleeper;   ///< 默认 std::this_thread::sleep_for
        Now now;           ///< 默认 system_clock::now
    };

    CachedDataProvider(DataProviderPtr upstream, std::string cacheDir);
    CachedDataProvider(DataProviderPtr upstream, std::string cacheDir, Options options);

    std::vector<Bar> getDailySeries(const std::string& symbol,
                                    const Date& start = {},
                                    const Date& end = {}) override;

    std::string cachePath(const std::string& symbol) const;

    /**
     * @brief 缓存是否存在且未过期
     */
    bool isFresh(const std::string& symbol) const;

    /**
     * @brief 缓存目录里已有的代码（*_daily.csv），已排序
     */
    std::vector<std::string> cachedSymbols() const;

    /** 访问上游的次数（含失败的尝试） */
    Size upstreamCalls() const;

private:
    std::vector<Bar> refresh(const std::string& symbol);
    bool readCache(const std::string& symbol, std::vector<Bar>& bars,
                   Clock::time_point& cachedAt) const;
    void writeCache(const std::string& symbol, const std::vector<Bar>& bars) const;

    /** 同一代码的读写串行，不同代码互不阻塞 */
    std::shared_ptr<std::mutex> symbolMutex(const std::string& symbol) const;

    DataProviderPtr upstream_;
    std::string cacheDir_;
    Options options_;
    mutable std::mutex locksMutex_;
    mutable std::map<std::string, std::shared_ptr<std::mutex>> symbolLocks_;
    std::atomic<Size> upstreamCalls_{0};
};

} // namespace lbt
