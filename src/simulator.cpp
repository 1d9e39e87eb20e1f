#include "simulator.hpp"
#include "errors.hpp"
#include "time_util.hpp"
#include <cmath>
#include <limits>
#include <string>

namespace smacross {

namespace {

void checkAccount(const Account& a, const Bar& bar) {
    if (!std::isfinite(a.cash) || a.cash < 0 || !std::isfinite(a.holdings) || a.holdings < 0) {
        throw InvariantViolation("account invalid at " + formatTimestamp(bar.time)
                                 + ": cash=" + std::to_string(a.cash)
                                 + " holdings=" + std::to_string(a.holdings));
    }
}

} // namespace

StepResult applyPositionChange(const Bar& bar, PositionChange change, const Account& account) {
    StepResult r;
    r.account = account;
    const double price = bar.close;
    const double rate = account.commission_rate;

    if (change == PositionChange::Enter && !account.isLong() && account.cash > 0 && price > 0) {
        // Commission comes off the cash side before buying
        double commission = account.cash * rate;
        double quantity = (account.cash - commission) / price;
        r.account.holdings = quantity;
        r.account.cash = 0;

        Trade t;
        t.time = bar.time;
        t.side = Side::Buy;
        t.price = price;
        t.quantity = quantity;
        t.commission = commission;
        t.cash_after = 0;
        r.trade = t;
    } else if (change == PositionChange::Exit && account.isLong()) {
        double gross = account.holdings * price;
        double commission = gross * rate;
        r.account.cash = account.cash + (gross - commission);
        r.account.holdings = 0;

        Trade t;
        t.time = bar.time;
        t.side = Side::Sell;
        t.price = price;
        t.quantity = account.holdings;
        t.commission = commission;
        t.cash_after = r.account.cash;
        r.trade = t;
    }

    checkAccount(r.account, bar);
    return r;
}

Simulator::Simulator(double initial_cash, double commission_rate)
    : initial_cash_(initial_cash)
    , equity_(initial_cash)
    , last_close_(0)
    , last_time_(std::numeric_limits<std::int64_t>::min())
{
    if (!(initial_cash > 0) || !std::isfinite(initial_cash))
        throw InvalidParameter("initial cash must be > 0");
    if (!(commission_rate >= 0 && commission_rate < 1))
        throw InvalidParameter("commission rate must be in [0, 1)");
    account_.cash = initial_cash;
    account_.commission_rate = commission_rate;
}

std::optional<Trade> Simulator::step(const Bar& bar, PositionChange change) {
    if (bar.time <= last_time_) {
        throw InvariantViolation("bar at " + formatTimestamp(bar.time)
                                 + " is not after the previous simulated bar");
    }

    StepResult r = applyPositionChange(bar, change, account_);
    account_ = r.account;
    if (r.trade) trades_.push_back(*r.trade);

    last_close_ = bar.close;
    last_time_ = bar.time;
    equity_ = account_.markToMarket(bar.close);
    equity_curve_.push_back(EquityPoint{bar.time, equity_});
    return r.trade;
}

} // namespace smacross
