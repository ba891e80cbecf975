#include "issfeed/chart/chart_range.hpp"
#include "issfeed/core/exceptions.hpp"
#include "issfeed/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace issfeed {
namespace chart {

namespace {

constexpr std::int64_t SECONDS_PER_DAY = 86400;

// Days since 1970-01-01 for a proleptic Gregorian date
std::int64_t days_from_civil(std::int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

void civil_from_days(std::int64_t z, std::int64_t& y, unsigned& m, unsigned& d) {
    z += 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    y = static_cast<std::int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y += m <= 2;
}

bool is_leap(std::int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned days_in_month(std::int64_t y, unsigned m) {
    static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    return (m == 2 && is_leap(y)) ? 29 : days[m - 1];
}

std::chrono::hours days(int n) {
    return std::chrono::hours(24 * n);
}

} // namespace

RangeSpec map_range(ChartRange range) {
    switch (range) {
        case ChartRange::ONE_DAY:     return {days(1), CandleInterval::MINUTE_10};
        case ChartRange::TWO_WEEKS:   return {days(14), CandleInterval::HOUR_1};
        case ChartRange::ONE_MONTH:   return {days(30), CandleInterval::DAY_1};
        case ChartRange::THREE_MONTH: return {days(90), CandleInterval::DAY_1};
        case ChartRange::ONE_YEAR:    return {days(365), CandleInterval::WEEK_1};
        case ChartRange::FIVE_YEARS:  return {days(5 * 365), CandleInterval::MONTH_1};
        case ChartRange::MAX:         return {days(20 * 365), CandleInterval::MONTH_1};
    }
    return {days(30), CandleInterval::DAY_1};
}

std::optional<ChartRange> parse_range(const std::string& code) {
    std::string lower = code;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "1d") return ChartRange::ONE_DAY;
    if (lower == "2w" || lower == "14d") return ChartRange::TWO_WEEKS;
    if (lower == "1m" || lower == "1mo") return ChartRange::ONE_MONTH;
    if (lower == "3m" || lower == "3mo") return ChartRange::THREE_MONTH;
    if (lower == "1y") return ChartRange::ONE_YEAR;
    if (lower == "5y") return ChartRange::FIVE_YEARS;
    if (lower == "max") return ChartRange::MAX;
    return std::nullopt;
}

std::string range_code(ChartRange range) {
    switch (range) {
        case ChartRange::ONE_DAY:     return "1d";
        case ChartRange::TWO_WEEKS:   return "2w";
        case ChartRange::ONE_MONTH:   return "1m";
        case ChartRange::THREE_MONTH: return "3m";
        case ChartRange::ONE_YEAR:    return "1y";
        case ChartRange::FIVE_YEARS:  return "5y";
        case ChartRange::MAX:         return "max";
    }
    return "1m";
}

std::string format_date(types::EpochSeconds epoch) {
    std::int64_t day = epoch / SECONDS_PER_DAY;
    if (epoch % SECONDS_PER_DAY < 0) {
        --day;
    }
    std::int64_t y = 0;
    unsigned m = 0;
    unsigned d = 0;
    civil_from_days(day, y, m, d);

    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04lld-%02u-%02u", static_cast<long long>(y), m, d);
    return buffer;
}

std::string from_date(ChartRange range, std::chrono::system_clock::time_point now) {
    auto local = now + EXCHANGE_UTC_OFFSET - map_range(range).lookback;
    auto epoch = std::chrono::duration_cast<std::chrono::seconds>(local.time_since_epoch()).count();
    return format_date(static_cast<types::EpochSeconds>(epoch));
}

std::optional<types::EpochSeconds> parse_exchange_time(const std::string& text) {
    std::istringstream in(text);
    std::tm tm{};
    in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }
    in >> std::ws;
    if (!in.eof()) {
        return std::nullopt;
    }

    const std::int64_t year = static_cast<std::int64_t>(tm.tm_year) + 1900;
    const unsigned month = static_cast<unsigned>(tm.tm_mon + 1);
    const unsigned day = static_cast<unsigned>(tm.tm_mday);
    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month)) {
        return std::nullopt;
    }
    if (tm.tm_hour < 0 || tm.tm_hour > 23 || tm.tm_min < 0 || tm.tm_min > 59 ||
        tm.tm_sec < 0 || tm.tm_sec > 59) {
        return std::nullopt;
    }

    std::int64_t seconds = days_from_civil(year, month, day) * SECONDS_PER_DAY +
                           tm.tm_hour * 3600 + tm.tm_min * 60 + tm.tm_sec;
    seconds -= std::chrono::duration_cast<std::chrono::seconds>(EXCHANGE_UTC_OFFSET).count();
    return seconds;
}

types::ChartSeries build_chart_series(const std::string& symbol,
                                      const std::vector<types::Candle>& candles) {
    types::ChartSeries series;
    series.symbol = symbol;
    series.points.reserve(candles.size());

    for (const auto& c : candles) {
        auto ts = parse_exchange_time(c.begin);
        if (!ts) {
            ISSFEED_LOG_DEBUG("Skipping candle of {} with unparsable begin '{}'", symbol, c.begin);
            continue;
        }
        series.points.push_back(types::ChartPoint{*ts, c.high, c.low, c.open, c.close});
    }

    std::stable_sort(series.points.begin(), series.points.end(),
                     [](const types::ChartPoint& a, const types::ChartPoint& b) {
                         return a.timestamp < b.timestamp;
                     });

    if (!series.points.empty()) {
        series.previous_value = series.points.front().open;
        series.current_value = series.points.back().close;
    }
    return series;
}

types::ChartStats derive_chart_stats(const types::ChartSeries& series) {
    if (series.points.empty()) {
        throw InsufficientData("chart series for '" + series.symbol + "' has no points");
    }

    const double first_open = series.points.front().open;
    const double last_close = series.points.back().close;

    types::ChartStats stats;
    stats.change = last_close - first_open;
    stats.change_percent = first_open != 0.0 ? stats.change / first_open * 100.0 : 0.0;
    stats.is_up = stats.change > 0.0;
    stats.is_down = stats.change < 0.0;
    return stats;
}

std::string format_signed(double value, int precision) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(precision);
    if (value >= 0.0) {
        out << '+';
    }
    out << value;
    return out.str();
}

std::string format_percent_signed(double percent) {
    return format_signed(percent, 2) + "%";
}

} // namespace chart
} // namespace issfeed
