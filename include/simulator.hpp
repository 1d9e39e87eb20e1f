#pragma once

#include "bar.hpp"
#include "order.hpp"
#include "signal_rule.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace smacross {

/// Simulated single-asset account. cash and holdings are never negative.
struct Account {
    double cash{0};
    double holdings{0};          // units of the asset
    double commission_rate{0};   // fraction of traded value, in [0, 1)

    bool isLong() const { return holdings > 0; }
    double markToMarket(double price) const { return cash + holdings * price; }
};

/// Single executed fill.
struct Trade {
    std::int64_t time{0};
    Side side{Side::Buy};
    double price{0};
    double quantity{0};
    double commission{0};
    double cash_after{0};

    /// Cash paid for a buy (notional + commission), or received for a sell (notional - commission).
    double cashFlow() const {
        return side == Side::Buy ? price * quantity + commission : price * quantity - commission;
    }
};

/// Account value at a bar's close.
struct EquityPoint {
    std::int64_t time{0};
    double equity{0};
};

struct StepResult {
    Account account;
    std::optional<Trade> trade;
};

/// Execute one position change against the account at the bar's close. All-or-nothing sizing:
///  - Enter while flat with cash > 0: commission = cash * rate, holdings = cash * (1 - rate) / close, cash = 0.
///  - Exit while long: cash += holdings * close * (1 - rate), holdings = 0.
/// Anything else (None, Enter while long, Exit while flat, Enter at a non-positive close) returns
/// the account unchanged and no trade. Throws InvariantViolation if the result is negative or non-finite.
StepResult applyPositionChange(const Bar& bar, PositionChange change, const Account& account);

/// Owns the account for one simulation pass: applies position changes bar by bar,
/// records every fill and one equity point per bar (at the bar's close).
class Simulator {
public:
    /// Throws InvalidParameter if initial_cash <= 0 or commission_rate outside [0, 1).
    Simulator(double initial_cash = 10000.0, double commission_rate = 0.0);

    /// Apply change at bar's close, then record equity. Bars must arrive in ascending time order.
    std::optional<Trade> step(const Bar& bar, PositionChange change);

    const Account& account() const { return account_; }
    double cash() const { return account_.cash; }
    double holdings() const { return account_.holdings; }
    bool isLong() const { return account_.isLong(); }
    double equity() const { return equity_; }
    double lastClose() const { return last_close_; }
    double initialCash() const { return initial_cash_; }
    const std::vector<Trade>& trades() const { return trades_; }
    const std::vector<EquityPoint>& equityCurve() const { return equity_curve_; }

private:
    double initial_cash_;
    Account account_;
    double equity_;
    double last_close_;
    std::int64_t last_time_;

    std::vector<Trade> trades_;
    std::vector<EquityPoint> equity_curve_;
};

} // namespace smacross
