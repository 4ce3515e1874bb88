/**
 * @file ledger.cpp
 * @brief Ledger implementation
 */

#include "lbt/ledger.hpp"
#include <cmath>
#include <stdexcept>

namespace lbt {

const char* sideName(Side side) {
    return side == Side::Buy ? "BUY" : "SELL";
}

const char* exitReasonName(ExitReason reason) {
    switch (reason) {
        case ExitReason::None: return "";
        case ExitReason::Ladder: return "ladder";
        case ExitReason::StructuralStop: return "structural_stop";
        case ExitReason::TrendBreak: return "trend_break";
        case ExitReason::EndOfSeries: return "end_of_series";
    }
    return "";
}

Size affordableShares(Value amount, Value price) {
    if (!(amount > 0.0) || !(price > 0.0) || !std::isfinite(amount) || !std::isfinite(price)) {
        return 0;
    }
    Size shares = static_cast<Size>(std::floor(amount / price));
    // floor(amount / price) * price can land one ulp above amount
    while (shares > 0 && static_cast<Value>(shares) * price > amount) {
        --shares;
    }
    return shares;
}

Ledger::Ledger(Value cash) : cash_(cash), startCash_(cash) {
    if (!std::isfinite(cash) || cash < 0.0) {
        throw std::invalid_argument("Initial cash must be a non-negative finite number");
    }
}

Value Ledger::value(Value price) const {
    if (shares_ == 0) return cash_;
    return cash_ + static_cast<Value>(shares_) * price;
}

TradeRecord Ledger::buy(const Date& date, Value price, Size shares, int tier) {
    if (shares == 0) {
        throw std::invalid_argument("Buy of zero shares");
    }
    if (!(price > 0.0)) {
        throw std::invalid_argument("Buy price must be positive");
    }
    Value cost = static_cast<Value>(shares) * price;
    if (cost > cash_) {
        throw std::invalid_argument("Buy of " + std::to_string(shares) + " shares costs more than available cash");
    }

    if (shares_ == 0) {
        cycleCost_ = 0.0;
        cycleProceeds_ = 0.0;
    }
    cash_ -= cost;
    shares_ += shares;
    cycleCost_ += cost;

    TradeRecord trade;
    trade.date = date;
    trade.side = Side::Buy;
    trade.price = price;
    trade.shares = shares;
    trade.tier = tier;
    trade.cashFlow = -cost;
    return record(trade);
}

TradeRecord Ledger::sell(const Date& date, Value price, Size shares, int tier, ExitReason reason) {
    if (shares == 0) {
        throw std::invalid_argument("Sell of zero shares");
    }
    if (shares > shares_) {
        throw std::invalid_argument("Sell of " + std::to_string(shares) + " shares exceeds holding");
    }
    if (!(price > 0.0)) {
        throw std::invalid_argument("Sell price must be positive");
    }

    Value proceeds = static_cast<Value>(shares) * price;
    cash_ += proceeds;
    shares_ -= shares;
    cycleProceeds_ += proceeds;

    TradeRecord trade;
    trade.date = date;
    trade.side = Side::Sell;
    trade.price = price;
    trade.shares = shares;
    trade.tier = tier;
    trade.reason = reason;
    trade.cashFlow = proceeds;

    if (shares_ == 0) {
        trade.closesPosition = true;
        trade.pnl = cycleProceeds_ - cycleCost_;
        realizedPnl_ += trade.pnl;
        ++closedCycles_;
        cycleCost_ = 0.0;
        cycleProceeds_ = 0.0;
    }
    return record(trade);
}

TradeRecord Ledger::record(TradeRecord trade) {
    trade.ref = trades_.size() + 1;
    trades_.push_back(trade);
    if (tradeCb_) tradeCb_(trade);
    return trade;
}

void Ledger::reset() {
    cash_ = startCash_;
    shares_ = 0;
    cycleCost_ = 0.0;
    cycleProceeds_ = 0.0;
    closedCycles_ = 0;
    realizedPnl_ = 0.0;
    trades_.clear();
}

} // namespace lbt
