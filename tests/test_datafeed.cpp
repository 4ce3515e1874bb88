/**
 * @file test_datafeed.cpp
 * @brief 日期、CSV 读写与周线聚合测试
 */

#include <gtest/gtest.h>
#include "lbt/datafeed.hpp"
#include "lbt/resampler.hpp"
#include <sstream>

using namespace lbt;

// ==================== Date ====================

TEST(DateTest, DaysRoundTrip) {
    EXPECT_EQ(Date(1970, 1, 1).toDays(), 0);
    EXPECT_EQ(Date::fromDays(0), Date(1970, 1, 1));
    Date d(2024, 2, 29);
    EXPECT_EQ(Date::fromDays(d.toDays()), d);
    EXPECT_EQ(d.addDays(1), Date(2024, 3, 1));
}

TEST(DateTest, IsoWeekday) {
    EXPECT_EQ(Date(2024, 1, 1).isoWeekday(), 1);   // 周一
    EXPECT_EQ(Date(2024, 1, 7).isoWeekday(), 7);   // 周日
    EXPECT_EQ(Date(1970, 1, 1).isoWeekday(), 4);
}

TEST(DateTest, IsoWeekAcrossYearBoundary) {
    // 2021-01-01 (周五) 属于 2020 年第 53 周
    EXPECT_EQ(Date(2021, 1, 1).isoWeek(), std::make_pair(2020, 53));
    // 2024-12-30 (周一) 属于 2025 年第 1 周
    EXPECT_EQ(Date(2024, 12, 30).isoWeek(), std::make_pair(2025, 1));
    EXPECT_EQ(Date(2024, 6, 14).isoWeek(), std::make_pair(2024, 24));
}

TEST(DateTest, Parse) {
    EXPECT_EQ(Date::parse("2024-03-15"), Date(2024, 3, 15));
    EXPECT_EQ(Date::parse("2024/03/15"), Date(2024, 3, 15));
    EXPECT_EQ(Date::parse("20240315"), Date(2024, 3, 15));
    EXPECT_EQ(Date::parse("2024-03-15 15:00:00"), Date(2024, 3, 15));
    EXPECT_EQ(Date(2024, 3, 5).toString(), "2024-03-05");

    EXPECT_THROW(Date::parse("2024-3"), std::invalid_argument);
    EXPECT_THROW(Date::parse("2024-13-01"), std::invalid_argument);
    EXPECT_THROW(Date::parse("abc"), std::invalid_argument);
}

// ==================== CSV ====================

TEST(CsvTest, ReadBars) {
    std::istringstream in(
        "Date,Open,High,Low,Close,Volume\n"
        "2024-01-02,10,11,9.5,10.5,1000\n"
        "\n"
        "# comment\n"
        "2024-01-03,10.5,12,10,11.8,2000\n");
    auto bars = readBarsCsv(in);
    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[1].date, Date(2024, 1, 3));
    EXPECT_DOUBLE_EQ(bars[1].close, 11.8);
    EXPECT_DOUBLE_EQ(bars[0].volume, 1000.0);
}

TEST(CsvTest, CustomColumns) {
    std::istringstream in("20240102;10.5;10;11;9.5\n");
    CsvFormat fmt;
    fmt.header = 0;
    fmt.separator = ';';
    fmt.close = 1;
    fmt.open = 2;
    fmt.high = 3;
    fmt.low = 4;
    fmt.volume = -1;
    auto bars = readBarsCsv(in, fmt);
    ASSERT_EQ(bars.size(), 1u);
    EXPECT_DOUBLE_EQ(bars[0].close, 10.5);
    EXPECT_DOUBLE_EQ(bars[0].volume, 0.0);
}

TEST(CsvTest, MalformedLineReportsLineNumber) {
    std::istringstream in(
        "Date,Open,High,Low,Close,Volume\n"
        "2024-01-02,10,11,9.5,10.5,1000\n"
        "2024-01-03,10,x,9.5,10.5,1000\n");
    try {
        readBarsCsv(in);
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos);
    }
}

TEST(CsvTest, WriteThenRead) {
    std::vector<Bar> bars(1);
    bars[0].date = Date(2024, 5, 6);
    bars[0].open = 1.25;
    bars[0].high = 1.5;
    bars[0].low = 1.0;
    bars[0].close = 1.375;
    bars[0].volume = 7;

    std::stringstream ss;
    writeBarsCsv(ss, bars);
    auto back = readBarsCsv(ss);
    ASSERT_EQ(back.size(), 1u);
    EXPECT_EQ(back[0].date, bars[0].date);
    EXPECT_DOUBLE_EQ(back[0].close, 1.375);
}

TEST(CsvTest, MissingFile) {
    EXPECT_THROW(readBarsCsvFile("/nonexistent/lbt/none.csv"), std::runtime_error);
}

// ==================== 周线聚合 ====================

class ResamplerTest : public ::testing::Test {
protected:
    static Bar daily(Date d, Value o, Value h, Value l, Value c, Value v = 100.0) {
        Bar b;
        b.date = d;
        b.open = o;
        b.high = h;
        b.low = l;
        b.close = c;
        b.volume = v;
        return b;
    }
};

TEST_F(ResamplerTest, AggregatesOneWeek) {
    // 2024-01-08 周一 ... 2024-01-12 周五
    std::vector<Bar> days = {
        daily(Date(2024, 1, 8), 10, 11, 9, 10.5),
        daily(Date(2024, 1, 9), 10.5, 13, 10, 12),
        daily(Date(2024, 1, 10), 12, 12.5, 8, 9),
        daily(Date(2024, 1, 12), 9, 10, 8.5, 9.5),
    };
    auto weeks = resampleWeekly(days);
    ASSERT_EQ(weeks.size(), 1u);
    const Bar& w = weeks[0];
    EXPECT_EQ(w.date, Date(2024, 1, 12));
    EXPECT_DOUBLE_EQ(w.open, 10.0);
    EXPECT_DOUBLE_EQ(w.high, 13.0);
    EXPECT_DOUBLE_EQ(w.low, 8.0);
    EXPECT_DOUBLE_EQ(w.close, 9.5);
    EXPECT_DOUBLE_EQ(w.volume, 400.0);
}

TEST_F(ResamplerTest, SplitsOnIsoWeek) {
    std::vector<Bar> days = {
        daily(Date(2024, 12, 27), 1, 1, 1, 1),   // 2024-W52
        daily(Date(2024, 12, 30), 2, 2, 2, 2),   // 2025-W01
        daily(Date(2024, 12, 31), 3, 3, 3, 3),
        daily(Date(2025, 1, 2), 4, 4, 4, 4),
        daily(Date(2025, 1, 6), 5, 5, 5, 5),     // 2025-W02
    };
    auto weeks = resampleWeekly(days);
    ASSERT_EQ(weeks.size(), 3u);
    EXPECT_EQ(weeks[0].date, Date(2024, 12, 27));
    EXPECT_EQ(weeks[1].date, Date(2025, 1, 2));
    EXPECT_DOUBLE_EQ(weeks[1].open, 2.0);
    EXPECT_DOUBLE_EQ(weeks[1].close, 4.0);
    EXPECT_EQ(weeks[2].date, Date(2025, 1, 6));
}

TEST_F(ResamplerTest, IncrementalProcess) {
    WeeklyResampler r;
    EXPECT_FALSE(r.process(daily(Date(2024, 1, 8), 1, 1, 1, 1)));
    EXPECT_FALSE(r.process(daily(Date(2024, 1, 9), 1, 2, 1, 2)));
    EXPECT_TRUE(r.process(daily(Date(2024, 1, 15), 3, 3, 3, 3)));
    EXPECT_EQ(r.completedBars().size(), 1u);
    EXPECT_TRUE(r.hasPendingBar());
    EXPECT_TRUE(r.flush());
    EXPECT_EQ(r.completedBars().size(), 2u);
    EXPECT_FALSE(r.flush());
}

TEST_F(ResamplerTest, RejectsUnorderedInput) {
    WeeklyResampler r;
    r.process(daily(Date(2024, 1, 9), 1, 1, 1, 1));
    EXPECT_THROW(r.process(daily(Date(2024, 1, 8), 1, 1, 1, 1)), std::invalid_argument);
}

TEST_F(ResamplerTest, EmptyInput) {
    EXPECT_TRUE(resampleWeekly({}).empty());
}
