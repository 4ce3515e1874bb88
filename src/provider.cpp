/**
 * @file provider.cpp
 * @brief 行情数据源实现
 */

#include "lbt/provider.hpp"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

namespace lbt {

namespace {

const char* const CACHE_TIME_TAG = "# cache_time=";
const char* const CACHE_SUFFIX = "_daily.csv";

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::vector<Bar> filterRange(const std::vector<Bar>& bars, const Date& start, const Date& end) {
    std::vector<Bar> result;
    result.reserve(bars.size());
    for (const auto& b : bars) {
        if (start.valid() && b.date < start) continue;
        if (end.valid() && b.date > end) continue;
        result.push_back(b);
    }
    return result;
}

void sortBars(std::vector<Bar>& bars, const std::string& symbol) {
    std::stable_sort(bars.begin(), bars.end(),
                     [](const Bar& a, const Bar& b) { return a.date < b.date; });
    for (Size i = 1; i < bars.size(); ++i) {
        if (bars[i].date == bars[i - 1].date) {
            throw ProviderError(symbol + ": duplicate bar for " + bars[i].date.toString());
        }
    }
}

// ==================== MemoryDataProvider ====================

void MemoryDataProvider::add(const std::string& symbol, std::vector<Bar> daily) {
    sortBars(daily, symbol);
    std::lock_guard<std::mutex> lock(mutex_);
    daily_[symbol] = std::move(daily);
}

void MemoryDataProvider::addWeekly(const std::string& symbol, std::vector<Bar> weekly) {
    sortBars(weekly, symbol);
    std::lock_guard<std::mutex> lock(mutex_);
    weekly_[symbol] = std::move(weekly);
}

bool MemoryDataProvider::has(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return daily_.count(symbol) > 0 || weekly_.count(symbol) > 0;
}

std::vector<std::string> MemoryDataProvider::symbols() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& kv : daily_) result.push_back(kv.first);
    for (const auto& kv : weekly_) {
        if (daily_.count(kv.first) == 0) result.push_back(kv.first);
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<Bar> MemoryDataProvider::getDailySeries(const std::string& symbol,
                                                    const Date& start, const Date& end) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = daily_.find(symbol);
    if (it == daily_.end()) {
        // 只有周线的代码没有日线
        if (weekly_.count(symbol) > 0) return {};
        throw ProviderError("Unknown symbol: " + symbol);
    }
    return filterRange(it->second, start, end);
}

std::vector<Bar> MemoryDataProvider::getWeeklySeries(const std::string& symbol,
                                                     const Date& start, const Date& end) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = weekly_.find(symbol);
        if (it != weekly_.end()) {
            return filterRange(it->second, start, end);
        }
    }
    return DataProvider::getWeeklySeries(symbol, start, end);
}

// ==================== CsvDataProvider ====================

CsvDataProvider::CsvDataProvider(std::string directory, CsvFormat format)
    : directory_(std::move(directory)), format_(format) {}

std::string CsvDataProvider::pathFor(const std::string& symbol) const {
    return (fs::path(directory_) / (symbol + ".csv")).string();
}

std::vector<std::string> CsvDataProvider::symbols() const {
    std::vector<std::string> result;
    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        throw ProviderError("Cannot list data directory " + directory_ + ": " + ec.message());
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file()) continue;
        const fs::path& p = entry.path();
        if (p.extension() == ".csv") {
            result.push_back(p.stem().string());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

std::vector<Bar> CsvDataProvider::getDailySeries(const std::string& symbol,
                                                 const Date& start, const Date& end) {
    const std::string path = pathFor(symbol);
    if (!fs::exists(path)) {
        throw ProviderError("No data file for " + symbol + ": " + path);
    }
    std::vector<Bar> bars;
    try {
        bars = readBarsCsvFile(path, format_);
    } catch (const std::runtime_error& e) {
        throw ProviderError(e.what());
    }
    sortBars(bars, symbol);
    return filterRange(bars, start, end);
}

// ==================== RetryPolicy ====================

std::chrono::milliseconds RetryPolicy::delayFor(int retry) const {
    if (retry < 1) retry = 1;
    double ms = static_cast<double>(initialDelay.count()) * std::pow(multiplier, retry - 1);
    ms = std::min(ms, static_cast<double>(maxDelay.count()));
    return std::chrono::milliseconds(static_cast<long long>(ms));
}

// ==================== CachedDataProvider ====================

CachedDataProvider::CachedDataProvider(DataProviderPtr upstream, std::string cacheDir)
    : CachedDataProvider(std::move(upstream), std::move(cacheDir), Options{}) {}

CachedDataProvider::CachedDataProvider(DataProviderPtr upstream, std::string cacheDir,
                                       Options options)
    : upstream_(std::move(upstream)), cacheDir_(std::move(cacheDir)), options_(std::move(options)) {
    if (!upstream_) {
        throw std::invalid_argument("CachedDataProvider needs an upstream provider");
    }
    if (!options_.sleeper) {
        options_.sleeper = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
    if (!options_.now) {
        options_.now = [] { return Clock::now(); };
    }
}

std::string CachedDataProvider::cachePath(const std::string& symbol) const {
    return (fs::path(cacheDir_) / (symbol + CACHE_SUFFIX)).string();
}

Size CachedDataProvider::upstreamCalls() const {
    return upstreamCalls_.load();
}

bool CachedDataProvider::readCache(const std::string& symbol, std::vector<Bar>& bars,
                                   Clock::time_point& cachedAt) const {
    std::ifstream file(cachePath(symbol));
    if (!file.is_open()) return false;

    std::string first;
    if (!std::getline(file, first) || first.rfind(CACHE_TIME_TAG, 0) != 0) {
        return false;
    }
    long long seconds = 0;
    std::istringstream iss(first.substr(std::string(CACHE_TIME_TAG).size()));
    if (!(iss >> seconds)) return false;
    cachedAt = Clock::time_point(std::chrono::seconds(seconds));

    try {
        bars = readBarsCsv(file);
    } catch (const std::runtime_error&) {
        // 损坏的缓存按过期处理，下面会重新拉取并覆盖
        return false;
    }
    return true;
}

void CachedDataProvider::writeCache(const std::string& symbol, const std::vector<Bar>& bars) const {
    std::error_code ec;
    fs::create_directories(cacheDir_, ec);
    if (ec) {
        throw ProviderError("Cannot create cache directory " + cacheDir_ + ": " + ec.message());
    }

    // 先写临时文件再改名，读者不会看到半个文件
    const std::string path = cachePath(symbol);
    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp);
        if (!out.is_open()) {
            throw ProviderError("Cannot write cache file " + tmp);
        }
        auto secs = std::chrono::duration_cast<std::chrono::seconds>(
            options_.now().time_since_epoch()).count();
        out << CACHE_TIME_TAG << secs << "\n";
        writeBarsCsv(out, bars);
    }
    fs::rename(tmp, path, ec);
    if (ec) {
        throw ProviderError("Cannot move cache file into place: " + ec.message());
    }
}

std::shared_ptr<std::mutex> CachedDataProvider::symbolMutex(const std::string& symbol) const {
    std::lock_guard<std::mutex> lock(locksMutex_);
    auto& m = symbolLocks_[symbol];
    if (!m) m = std::make_shared<std::mutex>();
    return m;
}

bool CachedDataProvider::isFresh(const std::string& symbol) const {
    auto m = symbolMutex(symbol);
    std::lock_guard<std::mutex> lock(*m);
    std::vector<Bar> bars;
    Clock::time_point cachedAt;
    if (!readCache(symbol, bars, cachedAt)) return false;
    return options_.now() - cachedAt < options_.expiry;
}

std::vector<Bar> CachedDataProvider::refresh(const std::string& symbol) {
    std::vector<Bar> bars = withRetry(options_.retry, options_.sleeper, [&] {
        ++upstreamCalls_;
        return upstream_->getDailySeries(symbol);
    });
    sortBars(bars, symbol);
    writeCache(symbol, bars);
    return bars;
}

std::vector<Bar> CachedDataProvider::getDailySeries(const std::string& symbol,
                                                    const Date& start, const Date& end) {
    // 只锁这个代码：拉取和退避等待不会挡住其他代码的缓存命中
    auto m = symbolMutex(symbol);
    std::lock_guard<std::mutex> lock(*m);
    std::vector<Bar> bars;
    Clock::time_point cachedAt;
    if (!readCache(symbol, bars, cachedAt) || options_.now() - cachedAt >= options_.expiry) {
        bars = refresh(symbol);
    }
    return filterRange(bars, start, end);
}

std::vector<std::string> CachedDataProvider::cachedSymbols() const {
    std::vector<std::string> result;
    std::error_code ec;
    if (!fs::exists(cacheDir_, ec)) return result;
    fs::directory_iterator it(cacheDir_, ec);
    if (ec) {
        throw ProviderError("Cannot list cache directory " + cacheDir_ + ": " + ec.message());
    }
    const std::string suffix = CACHE_SUFFIX;
    for (const auto& entry : it) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (endsWith(name, suffix)) {
            result.push_back(name.substr(0, name.size() - suffix.size()));
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace lbt
