#include "issfeed/quote/quote_resolver.hpp"
#include "issfeed/core/exceptions.hpp"
#include "issfeed/utils/logger.hpp"

#include <optional>

namespace issfeed {
namespace quote {

namespace {

bool usable(const std::optional<double>& value) {
    return value.has_value() && *value != 0.0;
}

double first_usable(const std::optional<double>& preferred, double fallback) {
    return usable(preferred) ? *preferred : fallback;
}

} // namespace

QuoteResolver::QuoteResolver(ResolverSettings settings)
    : settings_(std::move(settings)) {
}

const table::Row& QuoteResolver::select_board_row(const std::string& symbol,
                                                  const table::ColumnTable& table) const {
    if (const table::Row* row = table.find_row_where(columns::BOARD_ID, settings_.primary_board)) {
        return *row;
    }
    if (table.empty()) {
        throw EmptyTable(table.name());
    }
    utils::FeedLogger::log_degraded_board(symbol, table.name(), settings_.primary_board);
    return table.row(0);
}

types::Quote QuoteResolver::resolve(const std::string& input_symbol,
                                    const table::ColumnTable& reference,
                                    const table::ColumnTable& market) const {
    const table::Row& ref_row = select_board_row(input_symbol, reference);
    const table::Row& md_row = select_board_row(input_symbol, market);

    const auto live_last = market.get_double(md_row, columns::LAST);
    const auto session_close = market.get_double(md_row, columns::LAST_CLOSE_PRICE);
    const auto prev_price = reference.get_double(ref_row, columns::PREV_PRICE);

    double last = 0.0;
    if (usable(live_last)) {
        last = *live_last;
    } else if (usable(session_close)) {
        last = *session_close;
    } else if (usable(prev_price)) {
        last = *prev_price;
    } else {
        throw NoPriceAvailable(input_symbol);
    }

    const double previous_close = prev_price.value_or(0.0);

    types::Quote q;
    q.symbol = input_symbol;
    q.last_trade_price = last;
    q.previous_close = previous_close;
    q.open = first_usable(market.get_double(md_row, columns::OPEN), last);
    q.day_high = first_usable(market.get_double(md_row, columns::HIGH), last);
    q.day_low = first_usable(market.get_double(md_row, columns::LOW), last);
    q.change = previous_close != 0.0 ? last - previous_close : 0.0;

    if (auto pct = market.get_double(md_row, columns::LAST_TO_PREV_PRICE)) {
        q.change_percent = *pct;
    } else if (previous_close != 0.0) {
        q.change_percent = q.change / previous_close * 100.0;
    }

    q.volume = market.get_long(md_row, columns::VOLUME_TODAY).value_or(0);

    auto sec_name = reference.get_string(ref_row, columns::SEC_NAME);
    auto short_name = reference.get_string(ref_row, columns::SHORT_NAME);
    if (sec_name && !sec_name->empty()) {
        q.name = *sec_name;
    } else if (short_name && !short_name->empty()) {
        q.name = *short_name;
    } else {
        q.name = input_symbol;
    }
    q.long_name = q.name;

    q.currency_code = settings_.currency;
    q.exchange = settings_.exchange;
    q.market_state = settings_.market_state;
    q.tradeable = true;

    utils::FeedLogger::log_quote_resolved(input_symbol, q.last_trade_price, q.previous_close,
                                          q.change, q.change_percent, q.volume);
    return q;
}

} // namespace quote
} // namespace issfeed
