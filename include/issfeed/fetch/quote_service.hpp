#pragma once

#include "issfeed/chart/chart_range.hpp"
#include "issfeed/network/table_source.hpp"
#include "issfeed/quote/quote_resolver.hpp"
#include "issfeed/symbol/instrument_classifier.hpp"
#include "issfeed/types/market_types.hpp"

#include <chrono>
#include <string>

namespace issfeed {
namespace fetch {

/**
 * Single-symbol retrieval path: table fetch -> decode -> resolve.
 *
 * Every failure reaches the caller as a typed exception. The service keeps
 * no per-call state, so one instance may serve concurrent callers as long
 * as the TableSource does.
 */
class QuoteService {
public:
    QuoteService(network::TableSource& source,
                 symbol::InstrumentClassifier classifier = symbol::InstrumentClassifier{},
                 quote::QuoteResolver resolver = quote::QuoteResolver{});

    // Throws IneligibleSymbol for symbols outside this source
    types::Quote fetch_quote(const std::string& symbol) const;

    // Throws InsufficientData when no candle of the window survives
    types::ChartSeries fetch_candles(const std::string& symbol, chart::ChartRange range,
                                     std::chrono::system_clock::time_point now =
                                         std::chrono::system_clock::now()) const;

    bool is_eligible(const std::string& symbol) const;

    const symbol::InstrumentClassifier& classifier() const { return classifier_; }

private:
    void require_eligible(const std::string& symbol) const;

    network::TableSource& source_;
    symbol::InstrumentClassifier classifier_;
    quote::QuoteResolver resolver_;
};

} // namespace fetch
} // namespace issfeed
