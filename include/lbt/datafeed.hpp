/**
 * @file datafeed.hpp
 * @brief 日期、K 线与 CSV 行情读写
 */

#pragma once

#include "lbt/common.hpp"
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace lbt {

/**
 * @brief 公历日期
 *
 * 内部换算使用自 1970-01-01 起的天数，与本地时区无关。
 */
struct Date {
    int year = 0;
    int month = 0;
    int day = 0;

    Date() = default;
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    bool valid() const { return year != 0 && month >= 1 && month <= 12 && day >= 1 && day <= 31; }

    /** 自 1970-01-01 起的天数 */
    long toDays() const;
    static Date fromDays(long days);

    Date addDays(long n) const { return fromDays(toDays() + n); }

    /** ISO 星期几，周一 = 1 ... 周日 = 7 */
    int isoWeekday() const;

    /** ISO 8601 周编号 (ISO 年, 周) */
    std::pair<int, int> isoWeek() const;

    /**
     * @brief 解析 "YYYY-MM-DD"、"YYYY/MM/DD" 或 "YYYYMMDD"
     * @throws std::invalid_argument 格式错误
     */
    static Date parse(const std::string& str);

    std::string toString() const;

    bool operator==(const Date& o) const { return year == o.year && month == o.month && day == o.day; }
    bool operator!=(const Date& o) const { return !(*this == o); }
    bool operator<(const Date& o) const {
        if (year != o.year) return year < o.year;
        if (month != o.month) return month < o.month;
        return day < o.day;
    }
    bool operator<=(const Date& o) const { return !(o < *this); }
    bool operator>(const Date& o) const { return o < *this; }
    bool operator>=(const Date& o) const { return !(*this < o); }
};

/**
 * @brief 单根 K 线（日线或周线）
 */
struct Bar {
    Date date;
    Value open = 0.0;
    Value high = 0.0;
    Value low = 0.0;
    Value close = 0.0;
    Value volume = 0.0;
};

/**
 * @brief CSV 列映射
 */
struct CsvFormat {
    int date = 0;
    int open = 1;
    int high = 2;
    int low = 3;
    int close = 4;
    int volume = 5;     // -1 = 不存在
    int header = 1;     // 跳过的表头行数
    char separator = ',';
};

/**
 * @brief 从流中读取 K 线
 * @throws std::runtime_error 某一行无法解析（带行号）
 */
std::vector<Bar> readBarsCsv(std::istream& in, const CsvFormat& format = {});

/**
 * @brief 从文件读取 K 线
 * @throws std::runtime_error 文件无法打开或内容有误
 */
std::vector<Bar> readBarsCsvFile(const std::string& path, const CsvFormat& format = {});

/**
 * @brief 以 Date,Open,High,Low,Close,Volume 格式写出
 */
void writeBarsCsv(std::ostream& out, const std::vector<Bar>& bars);

} // namespace lbt
