/**
 * @file bindings.cpp
 * @brief Python 绑定 (pybind11)
 *
 * 将回测核心暴露给 Python：行情、参数、决策函数、run_backtest 与注册表
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include "lbt/lbt.hpp"

namespace py = pybind11;

namespace {

lbt::Params toParams(const std::map<std::string, lbt::ParamValue>& values) {
    lbt::Params p;
    for (const auto& [key, value] : values) {
        p.setValue(key, value);
    }
    return p;
}

} // namespace

PYBIND11_MODULE(_ladder_backtest, m) {
    m.doc() = "Weekly ladder backtester core";

    // 版本信息
    m.def("version", &lbt::version, "Get library version");

    // ==================== Date / Bar ====================
    py::class_<lbt::Date>(m, "Date")
        .def(py::init<>())
        .def(py::init<int, int, int>(), py::arg("year"), py::arg("month"), py::arg("day"))
        .def_static("parse", &lbt::Date::parse)
        .def_readwrite("year", &lbt::Date::year)
        .def_readwrite("month", &lbt::Date::month)
        .def_readwrite("day", &lbt::Date::day)
        .def("iso_week", &lbt::Date::isoWeek)
        .def("__str__", &lbt::Date::toString)
        .def("__repr__", [](const lbt::Date& d) { return "Date(" + d.toString() + ")"; })
        .def(py::self == py::self)
        .def(py::self < py::self);

    py::class_<lbt::Bar>(m, "Bar")
        .def(py::init<>())
        .def(py::init([](const lbt::Date& date, double o, double h, double l, double c, double v) {
                 lbt::Bar b;
                 b.date = date;
                 b.open = o;
                 b.high = h;
                 b.low = l;
                 b.close = c;
                 b.volume = v;
                 return b;
             }),
             py::arg("date"), py::arg("open"), py::arg("high"), py::arg("low"),
             py::arg("close"), py::arg("volume") = 0.0)
        .def_readwrite("date", &lbt::Bar::date)
        .def_readwrite("open", &lbt::Bar::open)
        .def_readwrite("high", &lbt::Bar::high)
        .def_readwrite("low", &lbt::Bar::low)
        .def_readwrite("close", &lbt::Bar::close)
        .def_readwrite("volume", &lbt::Bar::volume);

    m.def("resample_weekly", &lbt::resampleWeekly, py::arg("daily"));
    m.def("read_bars_csv", [](const std::string& path) { return lbt::readBarsCsvFile(path); },
          py::arg("path"));

    // ==================== Params ====================
    py::class_<lbt::Params>(m, "Params")
        .def(py::init<>())
        .def(py::init(&toParams))
        .def("set", &lbt::Params::setValue)
        .def("get", &lbt::Params::raw)
        .def("has", &lbt::Params::has)
        .def("keys", &lbt::Params::keys)
        .def("parse_assignment", &lbt::Params::parseAssignment)
        .def("__len__", &lbt::Params::size);

    // ==================== Indicators ====================
    m.def("moving_average",
          [](const std::vector<double>& closes, int window, const std::string& policy) {
              return lbt::movingAverage(closes, window, lbt::parseWarmupPolicy(policy));
          },
          py::arg("closes"), py::arg("window") = 20, py::arg("policy") = "strict");

    // ==================== Engines ====================
    py::class_<lbt::BuyDecision>(m, "BuyDecision")
        .def_readonly("accept", &lbt::BuyDecision::accept)
        .def_readonly("tier", &lbt::BuyDecision::tier)
        .def_readonly("spend_amount", &lbt::BuyDecision::spendAmount)
        .def_readonly("shares", &lbt::BuyDecision::shares);

    py::class_<lbt::SellDecision>(m, "SellDecision")
        .def_readonly("accept", &lbt::SellDecision::accept)
        .def_readonly("shares", &lbt::SellDecision::shares)
        .def_readonly("tier", &lbt::SellDecision::tier)
        .def_readonly("liquidates", &lbt::SellDecision::liquidates);

    m.def("decide_buy", &lbt::decideBuy,
          py::arg("price"), py::arg("ma20"), py::arg("buy_count"),
          py::arg("buy_levels"), py::arg("buy_ratios"), py::arg("cash"),
          py::arg("min_cash") = lbt::MIN_TRADE_CASH);

    m.def("decide_sell", &lbt::decideSell,
          py::arg("price"), py::arg("ma20"), py::arg("sell_count"), py::arg("shares"),
          py::arg("ma_history"), py::arg("sell_thresholds"), py::arg("sell_ratios"),
          py::arg("min_shares") = lbt::MIN_SELL_SHARES, py::arg("rising_window") = 3);

    // ==================== Results ====================
    py::class_<lbt::TradeRecord>(m, "TradeRecord")
        .def_readonly("ref", &lbt::TradeRecord::ref)
        .def_readonly("date", &lbt::TradeRecord::date)
        .def_property_readonly("side", [](const lbt::TradeRecord& t) {
            return std::string(lbt::sideName(t.side));
        })
        .def_readonly("price", &lbt::TradeRecord::price)
        .def_readonly("shares", &lbt::TradeRecord::shares)
        .def_readonly("tier", &lbt::TradeRecord::tier)
        .def_property_readonly("reason", [](const lbt::TradeRecord& t) {
            return std::string(lbt::exitReasonName(t.reason));
        })
        .def_readonly("cash_flow", &lbt::TradeRecord::cashFlow)
        .def_readonly("closes_position", &lbt::TradeRecord::closesPosition)
        .def_readonly("pnl", &lbt::TradeRecord::pnl);

    py::class_<lbt::YearBucket>(m, "YearBucket")
        .def_readonly("year", &lbt::YearBucket::year)
        .def_readonly("start_asset", &lbt::YearBucket::startAsset)
        .def_readonly("end_asset", &lbt::YearBucket::endAsset)
        .def("return_pct", &lbt::YearBucket::returnPct);

    py::class_<lbt::BacktestResult>(m, "BacktestResult")
        .def_readonly("symbol", &lbt::BacktestResult::symbol)
        .def_readonly("strategy", &lbt::BacktestResult::strategyId)
        .def_readonly("total_return_pct", &lbt::BacktestResult::totalReturnPct)
        .def_readonly("yearly_returns", &lbt::BacktestResult::yearlyReturns)
        .def_readonly("years", &lbt::BacktestResult::years)
        .def_readonly("trades", &lbt::BacktestResult::trades)
        .def_readonly("start_cash", &lbt::BacktestResult::startCash)
        .def_readonly("end_value", &lbt::BacktestResult::endValue)
        .def_readonly("total_bars", &lbt::BacktestResult::totalBars)
        .def_readonly("analyses", &lbt::BacktestResult::analyses);

    // ==================== Providers ====================
    py::class_<lbt::DataProvider, std::shared_ptr<lbt::DataProvider>>(m, "DataProvider")
        .def("daily", &lbt::DataProvider::getDailySeries,
             py::arg("symbol"), py::arg("start") = lbt::Date{}, py::arg("end") = lbt::Date{})
        .def("weekly", &lbt::DataProvider::getWeeklySeries,
             py::arg("symbol"), py::arg("start") = lbt::Date{}, py::arg("end") = lbt::Date{});

    py::class_<lbt::MemoryDataProvider, lbt::DataProvider,
               std::shared_ptr<lbt::MemoryDataProvider>>(m, "MemoryDataProvider")
        .def(py::init<>())
        .def("add", &lbt::MemoryDataProvider::add, py::arg("symbol"), py::arg("daily"))
        .def("add_weekly", &lbt::MemoryDataProvider::addWeekly,
             py::arg("symbol"), py::arg("weekly"))
        .def("symbols", &lbt::MemoryDataProvider::symbols);

    py::class_<lbt::CsvDataProvider, lbt::DataProvider,
               std::shared_ptr<lbt::CsvDataProvider>>(m, "CsvDataProvider")
        .def(py::init<std::string>(), py::arg("directory"))
        .def("symbols", &lbt::CsvDataProvider::symbols);

    py::class_<lbt::CachedDataProvider, lbt::DataProvider,
               std::shared_ptr<lbt::CachedDataProvider>>(m, "CachedDataProvider")
        .def(py::init<lbt::DataProviderPtr, std::string>(),
             py::arg("upstream"), py::arg("cache_dir"))
        .def("cached_symbols", &lbt::CachedDataProvider::cachedSymbols)
        .def("is_fresh", &lbt::CachedDataProvider::isFresh);

    py::register_exception<lbt::ProviderError>(m, "ProviderError", PyExc_RuntimeError);

    // ==================== Entry points ====================
    m.def("strategy_ids", []() { return lbt::builtinRegistry().ids(); });

    m.def("default_params", [](const std::string& id) {
        return lbt::builtinRegistry().get(id).defaults;
    }, py::arg("strategy"));

    m.def("run_backtest",
          [](lbt::DataProvider& provider, const std::string& symbol, double capital,
             const std::string& strategy, const std::map<std::string, lbt::ParamValue>& params) {
              py::gil_scoped_release release;
              return lbt::runBacktest(provider, symbol, capital, strategy, toParams(params));
          },
          py::arg("provider"), py::arg("symbol"), py::arg("initial_capital") = 100000.0,
          py::arg("strategy") = "thresholds",
          py::arg("params") = std::map<std::string, lbt::ParamValue>{});
}
