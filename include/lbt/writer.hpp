/**
 * @file writer.hpp
 * @brief Writer System
 *
 * Provides output functionality for backtest runs:
 * - StepLogWriter: one table row per weekly bar
 * - SummaryWriter: capital, total return, yearly table, trade statistics
 * - ResultsCsvWriter: one CSV row per (symbol, strategy) for batch runs
 *
 * Writers follow the same lifecycle as analyzers and never own the stream
 * they were given; a filename opens a stream owned by the writer.
 */

#pragma once

#include "lbt/result.hpp"
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace lbt {

/**
 * @brief Base Writer class
 */
class Writer {
public:
    virtual ~Writer() = default;

    // Lifecycle methods
    virtual void start(const std::string& symbol, const std::string& strategy, Value startCash) {
        (void)symbol; (void)strategy; (void)startCash;
    }
    virtual void next(const StepRecord& step) { (void)step; }
    virtual void notifyTrade(const TradeRecord& trade) { (void)trade; }
    virtual void stop(const BacktestResult& result) { (void)result; }
};

using WriterPtr = std::shared_ptr<Writer>;

/**
 * @brief Writer bound to an output stream or a file
 */
class WriterFile : public Writer {
public:
    /** 写到 std::cout */
    WriterFile() : out_(&std::cout) {}

    explicit WriterFile(std::ostream& out) : out_(&out) {}

    /**
     * @throws std::runtime_error 文件无法打开
     */
    explicit WriterFile(const std::string& filename)
        : file_(std::make_unique<std::ofstream>(filename)) {
        if (!file_->is_open()) {
            throw std::runtime_error("Cannot open output file: " + filename);
        }
        out_ = file_.get();
    }

    /**
     * @brief Write a raw line
     */
    void writeLine(const std::string& line) {
        *out_ << line << "\n";
    }

    void writeSeparator(char c = '=', Size width = 80) {
        writeLine(std::string(width, c));
    }

    std::ostream& out() { return *out_; }

protected:
    static std::string fixed(Value v, int precision = 2) {
        if (isnan(v)) return "";
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(precision) << v;
        return oss.str();
    }

    static std::string signedPct(Value v) {
        std::ostringstream oss;
        oss << std::showpos << std::fixed << std::setprecision(2) << v << "%";
        return oss.str();
    }

private:
    std::unique_ptr<std::ofstream> file_;
    std::ostream* out_ = nullptr;
};

/**
 * @brief 每周一行的回测日志
 *
 * 列：周序号 日期 收盘 MA 持股 现金 总资产 状态 操作
 */
class StepLogWriter : public WriterFile {
public:
    using WriterFile::WriterFile;

    /** 只输出有成交的周 */
    void setTradesOnly(bool v) { tradesOnly_ = v; }

    void start(const std::string& symbol, const std::string& strategy, Value startCash) override {
        writeSeparator();
        writeLine("Symbol:   " + symbol);
        writeLine("Strategy: " + strategy);
        writeLine("Capital:  " + fixed(startCash));
        writeSeparator();

        std::ostringstream oss;
        oss << std::left << std::setw(6) << "Week"
            << std::setw(12) << "Date"
            << std::right << std::setw(10) << "Close"
            << std::setw(10) << "MA"
            << std::setw(10) << "Shares"
            << std::setw(14) << "Cash"
            << std::setw(14) << "Total"
            << "  " << std::left << std::setw(28) << "State"
            << "Operation";
        writeLine(oss.str());
        writeSeparator('-', 130);
    }

    void next(const StepRecord& step) override {
        if (tradesOnly_ && !step.traded) return;
        std::ostringstream oss;
        oss << std::left << std::setw(6) << (step.barIndex + 1)
            << std::setw(12) << step.date.toString()
            << std::right << std::setw(10) << fixed(step.close)
            << std::setw(10) << fixed(step.ma)
            << std::setw(10) << step.shares
            << std::setw(14) << fixed(step.cash)
            << std::setw(14) << fixed(step.totalAsset)
            << "  " << std::left << std::setw(28) << step.state
            << step.operation;
        writeLine(oss.str());
    }

    void notifyTrade(const TradeRecord& trade) override {
        if (trade.reason != ExitReason::EndOfSeries) return;
        // 期末平仓不属于任何一周的决策，单独一行
        writeLine("END   " + trade.date.toString() + "  sell " + std::to_string(trade.shares) +
                  " @ " + fixed(trade.price) + " (end_of_series)");
    }

private:
    bool tradesOnly_ = false;
};

/**
 * @brief 回测结束后的汇总
 */
class SummaryWriter : public WriterFile {
public:
    using WriterFile::WriterFile;

    void stop(const BacktestResult& r) override {
        writeSeparator();
        writeLine("Symbol:       " + r.symbol + "  [" + r.strategyId + "]");
        if (!r.hasResult()) {
            writeLine("Insufficient data: " + std::to_string(r.totalBars) + " weekly bars");
            writeSeparator();
            return;
        }
        writeLine("Start cash:   " + fixed(r.startCash));
        writeLine("Final asset:  " + fixed(r.endValue));
        writeLine("Total return: " + signedPct(*r.totalReturnPct));
        writeSeparator('-', 60);

        for (const auto& y : r.years) {
            std::ostringstream oss;
            oss << y.year << ": " << fixed(y.startAsset) << " -> " << fixed(y.endAsset)
                << " (" << signedPct(y.returnPct()) << ")";
            writeLine(oss.str());
        }
        writeSeparator('-', 60);

        Size buys = 0;
        for (const auto& t : r.trades) {
            if (!t.isBuy()) continue;
            ++buys;
            writeLine("  BUY  #" + std::to_string(buys) + " " + t.date.toString() + " " +
                      std::to_string(t.shares) + " @ " + fixed(t.price) +
                      " tier " + std::to_string(t.tier));
        }
        Size sells = 0;
        for (const auto& t : r.trades) {
            if (t.isBuy()) continue;
            ++sells;
            std::string line = "  SELL #" + std::to_string(sells) + " " + t.date.toString() + " " +
                               std::to_string(t.shares) + " @ " + fixed(t.price) + " " +
                               exitReasonName(t.reason);
            if (t.closesPosition) {
                line += " pnl " + fixed(t.pnl, 0);
            }
            writeLine(line);
        }

        Value closed = r.analysis("trades", "total_trades");
        if (!isnan(closed)) {
            writeSeparator('-', 60);
            writeLine("Closed trades: " + fixed(closed, 0) +
                      "  won " + fixed(r.analysis("trades", "won_trades"), 0) +
                      "  lost " + fixed(r.analysis("trades", "lost_trades"), 0) +
                      "  win rate " + fixed(r.analysis("trades", "win_rate")) + "%");
        }
        Value dd = r.analysis("drawdown", "max_drawdown");
        if (!isnan(dd)) {
            writeLine("Max drawdown:  " + fixed(dd) + "%");
        }
        writeSeparator();
    }
};

/**
 * @brief 批量结果导出
 *
 * symbol,strategy,total_return,<year>... 每个收益率都是百分数。
 * 数据不足或失败的股票不输出；缺失的年份留空。
 */
class ResultsCsvWriter {
public:
    void add(const BacktestResult& result) {
        if (!result.hasResult()) return;
        for (const auto& [year, pct] : result.yearlyReturns) {
            (void)pct;
            years_.insert(year);
        }
        rows_.push_back(result);
    }

    Size size() const { return rows_.size(); }

    void write(std::ostream& out) const {
        out << "symbol,strategy,total_return";
        for (int y : years_) out << "," << y;
        out << "\n";

        out << std::fixed << std::setprecision(4);
        for (const auto& r : rows_) {
            out << r.symbol << "," << r.strategyId << "," << *r.totalReturnPct;
            for (int y : years_) {
                out << ",";
                auto it = r.yearlyReturns.find(y);
                if (it != r.yearlyReturns.end()) out << it->second;
            }
            out << "\n";
        }
    }

    /**
     * @throws std::runtime_error 文件无法打开
     */
    void writeFile(const std::string& path) const {
        std::ofstream file(path);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open output file: " + path);
        }
        write(file);
    }

private:
    std::set<int> years_;
    std::vector<BacktestResult> rows_;
};

} // namespace lbt
