#pragma once

#include "issfeed/types/market_types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace issfeed {
namespace chart {

enum class ChartRange {
    ONE_DAY,
    TWO_WEEKS,
    ONE_MONTH,
    THREE_MONTH,
    ONE_YEAR,
    FIVE_YEARS,
    MAX
};

// ISS candle interval codes
enum class CandleInterval : int {
    MINUTE_1 = 1,
    MINUTE_10 = 10,
    HOUR_1 = 60,
    DAY_1 = 24,
    WEEK_1 = 7,
    MONTH_1 = 31
};

struct RangeSpec {
    std::chrono::hours lookback;
    CandleInterval interval;
};

// Exchange local time is a fixed UTC+3
constexpr std::chrono::hours EXCHANGE_UTC_OFFSET{3};

RangeSpec map_range(ChartRange range);

// Short codes: 1d, 2w, 1m, 3m, 1y, 5y, max
std::optional<ChartRange> parse_range(const std::string& code);
std::string range_code(ChartRange range);

// Exchange-local calendar date of `now - lookback` as yyyy-MM-dd
std::string from_date(ChartRange range, std::chrono::system_clock::time_point now);

std::string format_date(types::EpochSeconds epoch);

// "yyyy-MM-dd HH:mm:ss" in exchange local time to epoch seconds
std::optional<types::EpochSeconds> parse_exchange_time(const std::string& text);

// Drops candles with unparsable begin times; points sorted by timestamp
types::ChartSeries build_chart_series(const std::string& symbol,
                                      const std::vector<types::Candle>& candles);

// Throws InsufficientData for an empty series
types::ChartStats derive_chart_stats(const types::ChartSeries& series);

std::string format_signed(double value, int precision);
std::string format_percent_signed(double percent);

} // namespace chart
} // namespace issfeed
