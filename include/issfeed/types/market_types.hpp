#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace issfeed {
namespace types {

using Symbol = std::string;
using Price = double;
using EpochSeconds = std::int64_t;

// Normalized quote; built fresh per fetch and not mutated afterwards
struct Quote {
    Symbol symbol;          // symbol as passed by the caller
    std::string name;
    std::string long_name;
    Price last_trade_price = 0.0;
    Price change = 0.0;
    double change_percent = 0.0;
    Price open = 0.0;
    Price day_high = 0.0;
    Price day_low = 0.0;
    Price previous_close = 0.0;
    long long volume = 0;
    std::string currency_code;
    std::string exchange;
    std::string market_state;
    bool tradeable = false;
};

// One OHLCV bar as delivered by the source; begin/end keep the wire format
struct Candle {
    double open = 0.0;
    double close = 0.0;
    double high = 0.0;
    double low = 0.0;
    long long volume = 0;
    std::string begin;
    std::string end;
};

struct ChartPoint {
    EpochSeconds timestamp = 0;
    double high = 0.0;
    double low = 0.0;
    double open = 0.0;
    double close = 0.0;
};

// Time-ordered points plus the two reference values change is derived from
struct ChartSeries {
    Symbol symbol;
    std::vector<ChartPoint> points;
    double previous_value = 0.0;
    double current_value = 0.0;

    double change() const { return current_value - previous_value; }

    double change_percent() const {
        if (previous_value == 0.0) {
            return 0.0;
        }
        return change() / previous_value * 100.0;
    }
};

struct ChartStats {
    double change = 0.0;
    double change_percent = 0.0;
    bool is_up = false;
    bool is_down = false;
};

} // namespace types
} // namespace issfeed
