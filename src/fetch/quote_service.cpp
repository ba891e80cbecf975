#include "issfeed/fetch/quote_service.hpp"
#include "issfeed/candle/candle_resolver.hpp"
#include "issfeed/core/exceptions.hpp"
#include "issfeed/table/column_table.hpp"
#include "issfeed/utils/logger.hpp"

namespace issfeed {
namespace fetch {

namespace {
const std::string SECURITIES_BLOCK = "securities";
const std::string MARKETDATA_BLOCK = "marketdata";
const std::string CANDLES_BLOCK = "candles";
} // namespace

QuoteService::QuoteService(network::TableSource& source,
                           symbol::InstrumentClassifier classifier,
                           quote::QuoteResolver resolver)
    : source_(source), classifier_(std::move(classifier)), resolver_(std::move(resolver)) {
}

bool QuoteService::is_eligible(const std::string& symbol) const {
    return classifier_.is_eligible(symbol);
}

void QuoteService::require_eligible(const std::string& symbol) const {
    if (!classifier_.is_eligible(symbol)) {
        throw IneligibleSymbol(symbol);
    }
}

types::Quote QuoteService::fetch_quote(const std::string& symbol) const {
    require_eligible(symbol);

    const std::string canonical = symbol::InstrumentClassifier::canonicalize(symbol);
    ISSFEED_LOG_DEBUG("Fetching quote for {} as {}", symbol, canonical);

    nlohmann::json document = source_.get_raw_table(canonical);
    auto reference = table::ColumnTable::decode(document, SECURITIES_BLOCK);
    auto market = table::ColumnTable::decode(document, MARKETDATA_BLOCK);

    return resolver_.resolve(symbol, reference, market);
}

types::ChartSeries QuoteService::fetch_candles(const std::string& symbol, chart::ChartRange range,
                                               std::chrono::system_clock::time_point now) const {
    require_eligible(symbol);

    const std::string canonical = symbol::InstrumentClassifier::canonicalize(symbol);
    const chart::RangeSpec window = chart::map_range(range);
    const std::string from = chart::from_date(range, now);

    ISSFEED_LOG_DEBUG("Fetching {} candles for {} from {} interval {}",
                      chart::range_code(range), canonical, from, static_cast<int>(window.interval));

    nlohmann::json document = source_.get_raw_candle_table(
        canonical, from, static_cast<int>(window.interval), std::nullopt);
    auto table = table::ColumnTable::decode(document, CANDLES_BLOCK, true);

    auto candles = candle::resolve_candles(table);
    auto series = chart::build_chart_series(symbol, candles);
    if (series.points.empty()) {
        throw InsufficientData("no candles for '" + symbol + "' in range " + chart::range_code(range));
    }
    return series;
}

} // namespace fetch
} // namespace issfeed
