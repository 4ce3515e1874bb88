/**
 * @file strategy.cpp
 * @brief Strategy base implementation
 */

#include "lbt/strategy.hpp"
#include <stdexcept>

namespace lbt {

void Strategy::moveTo(Size idx) {
    barIndex_ = idx;
    if (weekly_) weekly_->seek(idx);
    for (auto& ind : indicators_) {
        ind->seek(idx);
    }
}

void Strategy::beginStep() {
    step_ = StepRecord{};
    step_.barIndex = barIndex_;
    if (weekly_ && barIndex_ < weekly_->size()) {
        step_.date = weekly_->dateAt(barIndex_);
        step_.close = weekly_->close().at(barIndex_);
        step_.markPrice = step_.close;
    }
}

Ledger& Strategy::ledger() const {
    if (!ledger_) {
        throw std::logic_error("Strategy " + name() + " has no ledger attached");
    }
    return *ledger_;
}

std::vector<Value> Strategy::recent(const LineBuffer& line, Size n) {
    std::vector<Value> values;
    values.reserve(n);
    for (Size ago = n; ago-- > 0;) {
        Value v = line[static_cast<Index>(ago)];
        // before the first bar there is nothing to report
        if (line.position() >= static_cast<Index>(ago)) {
            values.push_back(v);
        }
    }
    return values;
}

TradeRecord Strategy::buy(Value price, Size shares, int tier, const std::string& label) {
    TradeRecord trade = ledger().buy(date(), price, shares, tier);
    step_.traded = true;
    note(label);
    return trade;
}

TradeRecord Strategy::sell(Value price, Size shares, int tier, ExitReason reason,
                           const std::string& label) {
    TradeRecord trade = ledger().sell(date(), price, shares, tier, reason);
    step_.traded = true;
    note(label);
    return trade;
}

void Strategy::note(const std::string& text) {
    if (text.empty()) return;
    if (!step_.operation.empty()) step_.operation += "; ";
    step_.operation += text;
}

} // namespace lbt
