#pragma once

#include "issfeed/table/column_table.hpp"
#include "issfeed/types/market_types.hpp"

#include <string>

namespace issfeed {
namespace quote {

// Column names of the ISS securities/marketdata blocks
namespace columns {
inline const std::string BOARD_ID = "BOARDID";
inline const std::string LAST = "LAST";
inline const std::string LAST_CLOSE_PRICE = "LCLOSEPRICE";
inline const std::string PREV_PRICE = "PREVPRICE";
inline const std::string OPEN = "OPEN";
inline const std::string HIGH = "HIGH";
inline const std::string LOW = "LOW";
inline const std::string LAST_TO_PREV_PRICE = "LASTTOPREVPRICE";
inline const std::string VOLUME_TODAY = "VOLTODAY";
inline const std::string SEC_NAME = "SECNAME";
inline const std::string SHORT_NAME = "SHORTNAME";
} // namespace columns

struct ResolverSettings {
    std::string primary_board = "TQBR";
    std::string currency = "RUB";
    std::string exchange = "MOEX";
    std::string market_state = "REGULAR";
};

class QuoteResolver {
public:
    explicit QuoteResolver(ResolverSettings settings = ResolverSettings{});

    /**
     * Builds one Quote from the reference (securities) and market
     * (marketdata) tables.
     *
     * Last price falls back LAST -> LCLOSEPRICE -> PREVPRICE, skipping absent
     * and zero values; throws NoPriceAvailable when all three are empty.
     * The returned symbol is `input_symbol` unchanged.
     */
    types::Quote resolve(const std::string& input_symbol,
                         const table::ColumnTable& reference,
                         const table::ColumnTable& market) const;

    // Row on the primary board, else row 0 (logged as a degraded match)
    const table::Row& select_board_row(const std::string& symbol,
                                       const table::ColumnTable& table) const;

    const ResolverSettings& settings() const { return settings_; }

private:
    ResolverSettings settings_;
};

} // namespace quote
} // namespace issfeed
