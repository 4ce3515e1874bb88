/**
 * @file test_provider.cpp
 * @brief 数据源测试 - 内存、CSV 目录、本地缓存与重试
 */

#include <gtest/gtest.h>
#include "lbt/provider.hpp"
#include "test_helpers.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <future>

using namespace lbt;
using lbt::testing::dailyFromWeeklyCloses;

namespace fs = std::filesystem;

namespace {

/**
 * @brief 计数的上游，前 failures 次抛出 TransientProviderError
 */
class ScriptedProvider : public DataProvider {
public:
    explicit ScriptedProvider(std::vector<Bar> bars, int failures = 0, bool permanent = false)
        : bars_(std::move(bars)), failures_(failures), permanent_(permanent) {}

    std::vector<Bar> getDailySeries(const std::string& symbol, const Date& start,
                                    const Date& end) override {
        ++calls;
        if (calls <= failures_) {
            if (permanent_) throw ProviderError("permanent failure for " + symbol);
            throw TransientProviderError("timeout for " + symbol);
        }
        return filterRange(bars_, start, end);
    }

    int calls = 0;

private:
    std::vector<Bar> bars_;
    int failures_;
    bool permanent_;
};

/**
 * @brief 对 gated 代码的请求会停住，直到 release()
 */
class GatedProvider : public DataProvider {
public:
    GatedProvider(std::vector<Bar> bars, std::string gated)
        : bars_(std::move(bars)), gated_(std::move(gated)), gate_(release_.get_future().share()) {}

    std::vector<Bar> getDailySeries(const std::string& symbol, const Date& start,
                                    const Date& end) override {
        ++calls;
        if (symbol == gated_) {
            entered_.set_value();
            gate_.wait();
        }
        return filterRange(bars_, start, end);
    }

    void waitUntilEntered() { entered_.get_future().wait(); }
    void release() { release_.set_value(); }

    std::atomic<int> calls{0};

private:
    std::vector<Bar> bars_;
    std::string gated_;
    std::promise<void> entered_;
    std::promise<void> release_;
    std::shared_future<void> gate_;
};

class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir = fs::path(::testing::TempDir()) /
              (std::string("lbt_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(dir);
        fs::create_directories(dir);
        bars = dailyFromWeeklyCloses({10.0, 11.0, 12.0});
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    std::vector<Bar> bars;
};

} // namespace

// ============================================================================
// MemoryDataProvider
// ============================================================================

TEST(MemoryProviderTest, DailyAndWeekly) {
    MemoryDataProvider provider;
    provider.add("AAA", dailyFromWeeklyCloses({10.0, 11.0, 12.0}));

    EXPECT_TRUE(provider.has("AAA"));
    EXPECT_EQ(provider.getDailySeries("AAA").size(), 15u);
    auto weekly = provider.getWeeklySeries("AAA");
    ASSERT_EQ(weekly.size(), 3u);
    EXPECT_DOUBLE_EQ(weekly[2].close, 12.0);

    auto range = provider.getDailySeries("AAA", Date(2024, 1, 8), Date(2024, 1, 12));
    EXPECT_EQ(range.size(), 5u);
}

TEST(MemoryProviderTest, UnknownSymbol) {
    MemoryDataProvider provider;
    EXPECT_THROW(provider.getDailySeries("ZZZ"), ProviderError);
    EXPECT_THROW(provider.getWeeklySeries("ZZZ"), ProviderError);
}

TEST(MemoryProviderTest, SortsAndRejectsDuplicates) {
    auto bars = dailyFromWeeklyCloses({10.0});
    std::swap(bars[0], bars[4]);

    MemoryDataProvider provider;
    provider.add("AAA", bars);
    auto daily = provider.getDailySeries("AAA");
    EXPECT_EQ(daily.front().date, Date(2024, 1, 1));

    bars.push_back(bars[0]);
    EXPECT_THROW(provider.add("BBB", bars), ProviderError);
}

TEST(MemoryProviderTest, WeeklyOnlySymbol) {
    MemoryDataProvider provider;
    provider.addWeekly("W", dailyFromWeeklyCloses({10.0}));
    EXPECT_TRUE(provider.getDailySeries("W").empty());
    EXPECT_EQ(provider.getWeeklySeries("W").size(), 5u);
    EXPECT_EQ(provider.symbols(), std::vector<std::string>{"W"});
}

// ============================================================================
// CsvDataProvider
// ============================================================================

using CsvProviderTest = TempDirTest;

TEST_F(CsvProviderTest, ReadsDirectory) {
    for (const char* symbol : {"600519", "000001"}) {
        std::ofstream out(dir / (std::string(symbol) + ".csv"));
        writeBarsCsv(out, bars);
    }
    std::ofstream(dir / "notes.txt") << "ignored\n";

    CsvDataProvider provider(dir.string());
    auto symbols = provider.symbols();
    ASSERT_EQ(symbols.size(), 2u);
    EXPECT_EQ(symbols[0], "000001");

    auto daily = provider.getDailySeries("600519");
    ASSERT_EQ(daily.size(), bars.size());
    EXPECT_EQ(daily.back().date, bars.back().date);
}

TEST_F(CsvProviderTest, MissingAndMalformed) {
    CsvDataProvider provider(dir.string());
    EXPECT_THROW(provider.getDailySeries("NOPE"), ProviderError);

    std::ofstream(dir / "BAD.csv") << "Date,Open,High,Low,Close,Volume\n2024-01-02,a,b,c,d,e\n";
    EXPECT_THROW(provider.getDailySeries("BAD"), ProviderError);

    CsvDataProvider nowhere((dir / "missing").string());
    EXPECT_THROW(nowhere.symbols(), ProviderError);
}

// ============================================================================
// RetryPolicy
// ============================================================================

TEST(RetryPolicyTest, BoundedExponentialDelay) {
    RetryPolicy policy;
    EXPECT_EQ(policy.delayFor(1).count(), 500);
    EXPECT_EQ(policy.delayFor(2).count(), 1000);
    EXPECT_EQ(policy.delayFor(5).count(), 8000);
    EXPECT_EQ(policy.delayFor(9).count(), 8000);
}

TEST(RetryPolicyTest, RetriesTransientOnly) {
    std::vector<long long> sleeps;
    auto sleeper = [&](std::chrono::milliseconds d) { sleeps.push_back(d.count()); };

    int calls = 0;
    int value = withRetry(RetryPolicy{}, sleeper, [&] {
        if (++calls < 3) throw TransientProviderError("flaky");
        return 7;
    });
    EXPECT_EQ(value, 7);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(sleeps, (std::vector<long long>{500, 1000}));

    calls = 0;
    EXPECT_THROW(withRetry(RetryPolicy{}, sleeper, [&]() -> int {
        ++calls;
        throw ProviderError("bad symbol");
    }), ProviderError);
    EXPECT_EQ(calls, 1);
}

// ============================================================================
// CachedDataProvider
// ============================================================================

class CachedProviderTest : public TempDirTest {
protected:
    CachedDataProvider::Options options() {
        CachedDataProvider::Options o;
        o.now = [this] { return now; };
        o.sleeper = [this](std::chrono::milliseconds d) { sleeps.push_back(d); };
        return o;
    }

    CachedDataProvider::Clock::time_point now{std::chrono::seconds(1700000000)};
    std::vector<std::chrono::milliseconds> sleeps;
};

TEST_F(CachedProviderTest, FetchesOnceWhileFresh) {
    auto upstream = std::make_shared<ScriptedProvider>(bars);
    CachedDataProvider cached(upstream, dir.string(), options());

    EXPECT_FALSE(cached.isFresh("AAA"));
    auto first = cached.getDailySeries("AAA");
    EXPECT_EQ(first.size(), bars.size());
    EXPECT_TRUE(fs::exists(cached.cachePath("AAA")));
    EXPECT_TRUE(cached.isFresh("AAA"));

    now += std::chrono::hours(23);
    auto second = cached.getDailySeries("AAA");
    EXPECT_EQ(second.size(), bars.size());
    EXPECT_DOUBLE_EQ(second.back().close, bars.back().close);
    EXPECT_EQ(upstream->calls, 1);
    EXPECT_EQ(cached.cachedSymbols(), std::vector<std::string>{"AAA"});
}

TEST_F(CachedProviderTest, RefetchesAfterExpiry) {
    auto upstream = std::make_shared<ScriptedProvider>(bars);
    CachedDataProvider cached(upstream, dir.string(), options());

    cached.getDailySeries("AAA");
    now += std::chrono::hours(24);
    EXPECT_FALSE(cached.isFresh("AAA"));
    cached.getDailySeries("AAA");
    EXPECT_EQ(upstream->calls, 2);
    EXPECT_EQ(cached.upstreamCalls(), 2u);
}

TEST_F(CachedProviderTest, CorruptCacheIsStale) {
    auto upstream = std::make_shared<ScriptedProvider>(bars);
    CachedDataProvider cached(upstream, dir.string(), options());

    std::ofstream(cached.cachePath("AAA")) << "garbage\n";
    EXPECT_FALSE(cached.isFresh("AAA"));
    EXPECT_EQ(cached.getDailySeries("AAA").size(), bars.size());
    EXPECT_EQ(upstream->calls, 1);
    EXPECT_TRUE(cached.isFresh("AAA"));
}

TEST_F(CachedProviderTest, RetriesTransientFailures) {
    auto upstream = std::make_shared<ScriptedProvider>(bars, 2);
    CachedDataProvider cached(upstream, dir.string(), options());

    EXPECT_EQ(cached.getDailySeries("AAA").size(), bars.size());
    EXPECT_EQ(upstream->calls, 3);
    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(sleeps[1].count(), 1000);
}

TEST_F(CachedProviderTest, GivesUpAfterMaxAttempts) {
    auto upstream = std::make_shared<ScriptedProvider>(bars, 10);
    CachedDataProvider cached(upstream, dir.string(), options());

    EXPECT_THROW(cached.getDailySeries("AAA"), ProviderError);
    EXPECT_EQ(upstream->calls, 3);
    EXPECT_FALSE(fs::exists(cached.cachePath("AAA")));
}

TEST_F(CachedProviderTest, PermanentFailureIsNotRetried) {
    auto upstream = std::make_shared<ScriptedProvider>(bars, 1, true);
    CachedDataProvider cached(upstream, dir.string(), options());

    EXPECT_THROW(cached.getDailySeries("AAA"), ProviderError);
    EXPECT_EQ(upstream->calls, 1);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(CachedProviderTest, SlowFetchDoesNotBlockOtherSymbols) {
    auto upstream = std::make_shared<GatedProvider>(bars, "SLOW");
    CachedDataProvider cached(upstream, dir.string(), options());
    cached.getDailySeries("FAST");

    auto slow = std::async(std::launch::async, [&] { return cached.getDailySeries("SLOW"); });
    upstream->waitUntilEntered();

    // SLOW 还卡在上游，FAST 走缓存应该立即返回
    auto fast = std::async(std::launch::async, [&] { return cached.getDailySeries("FAST"); });
    bool fastDone = fast.wait_for(std::chrono::seconds(5)) == std::future_status::ready;
    upstream->release();

    EXPECT_TRUE(fastDone);
    EXPECT_EQ(fast.get().size(), bars.size());
    EXPECT_EQ(slow.get().size(), bars.size());
    EXPECT_EQ(upstream->calls.load(), 2);
    EXPECT_EQ(cached.upstreamCalls(), 2u);
}

TEST_F(CachedProviderTest, RejectsNullUpstream) {
    EXPECT_THROW(CachedDataProvider bad(nullptr, dir.string()), std::invalid_argument);
}
