/**
 * @file datafeed.cpp
 * @brief Date arithmetic and CSV bar parsing
 */

#include "lbt/datafeed.hpp"
#include <cctype>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace lbt {

// civil <-> days conversion, proleptic Gregorian calendar
long Date::toDays() const {
    long y = year;
    const long m = month;
    const long d = day;
    y -= m <= 2 ? 1 : 0;
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = y - era * 400;
    const long doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

Date Date::fromDays(long days) {
    long z = days + 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const long doe = z - era * 146097;
    const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long y = yoe + era * 400;
    const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long mp = (5 * doy + 2) / 153;
    const long d = doy - (153 * mp + 2) / 5 + 1;
    const long m = mp < 10 ? mp + 3 : mp - 9;
    return Date(static_cast<int>(y + (m <= 2 ? 1 : 0)), static_cast<int>(m), static_cast<int>(d));
}

int Date::isoWeekday() const {
    // 1970-01-01 是周四
    long wd = ((toDays() % 7) + 7) % 7;
    return static_cast<int>((wd + 3) % 7 + 1);
}

std::pair<int, int> Date::isoWeek() const {
    const long days = toDays();
    const long thursday = days + (4 - isoWeekday());
    const int isoYear = fromDays(thursday).year;
    const long jan1 = Date(isoYear, 1, 1).toDays();
    const int week = static_cast<int>((thursday - jan1) / 7 + 1);
    return {isoYear, week};
}

Date Date::parse(const std::string& str) {
    std::string digits;
    for (char c : str) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        } else if (c == ' ' || c == 'T') {
            break;  // 忽略时间部分
        } else if (c != '-' && c != '/') {
            throw std::invalid_argument("Invalid date: " + str);
        }
    }
    if (digits.size() != 8) {
        throw std::invalid_argument("Invalid date: " + str);
    }
    Date d(std::stoi(digits.substr(0, 4)),
           std::stoi(digits.substr(4, 2)),
           std::stoi(digits.substr(6, 2)));
    if (!d.valid()) {
        throw std::invalid_argument("Invalid date: " + str);
    }
    return d;
}

std::string Date::toString() const {
    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << year << "-"
        << std::setw(2) << month << "-"
        << std::setw(2) << day;
    return oss.str();
}

namespace {

std::vector<std::string> split(const std::string& str, char sep) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, sep)) {
        size_t start = item.find_first_not_of(" \t\r\n");
        size_t end = item.find_last_not_of(" \t\r\n");
        if (start != std::string::npos) {
            result.push_back(item.substr(start, end - start + 1));
        } else {
            result.push_back("");
        }
    }
    return result;
}

Value column(const std::vector<std::string>& cols, int idx) {
    if (idx < 0 || idx >= static_cast<int>(cols.size())) {
        throw std::invalid_argument("missing column " + std::to_string(idx));
    }
    return std::stod(cols[static_cast<size_t>(idx)]);
}

} // namespace

std::vector<Bar> readBarsCsv(std::istream& in, const CsvFormat& format) {
    std::vector<Bar> bars;
    std::string line;
    int lineNo = 0;

    for (int i = 0; i < format.header && std::getline(in, line); ++i) {
        ++lineNo;
    }

    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty() || line[0] == '#' || line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        std::vector<std::string> cols = split(line, format.separator);
        try {
            if (format.date < 0 || format.date >= static_cast<int>(cols.size())) {
                throw std::invalid_argument("missing date column");
            }
            Bar bar;
            bar.date = Date::parse(cols[static_cast<size_t>(format.date)]);
            bar.open = column(cols, format.open);
            bar.high = column(cols, format.high);
            bar.low = column(cols, format.low);
            bar.close = column(cols, format.close);
            bar.volume = format.volume >= 0 ? column(cols, format.volume) : 0.0;
            bars.push_back(bar);
        } catch (const std::logic_error& e) {
            // std::invalid_argument / std::out_of_range from parsing
            throw std::runtime_error("Malformed CSV line " + std::to_string(lineNo) + ": " + e.what());
        }
    }
    return bars;
}

std::vector<Bar> readBarsCsvFile(const std::string& path, const CsvFormat& format) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open data file: " + path);
    }
    try {
        return readBarsCsv(file, format);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(path + ": " + e.what());
    }
}

void writeBarsCsv(std::ostream& out, const std::vector<Bar>& bars) {
    out << "Date,Open,High,Low,Close,Volume\n";
    out << std::setprecision(10);
    for (const auto& b : bars) {
        out << b.date.toString() << ','
            << b.open << ','
            << b.high << ','
            << b.low << ','
            << b.close << ','
            << b.volume << '\n';
    }
}

} // namespace lbt
