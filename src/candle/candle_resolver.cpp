#include "issfeed/candle/candle_resolver.hpp"
#include "issfeed/core/exceptions.hpp"
#include "issfeed/utils/logger.hpp"

#include <algorithm>

namespace issfeed {
namespace candle {

namespace {

table::ColumnIndex require_column(const table::ColumnTable& candles, const std::string& name) {
    auto index = candles.column_index(name);
    if (!index) {
        throw DecodeError("table '" + candles.name() + "' lacks column '" + name + "'");
    }
    return index;
}

} // namespace

std::vector<types::Candle> resolve_candles(const table::ColumnTable& candles) {
    using table::ColumnTable;

    const auto oi = require_column(candles, columns::OPEN);
    const auto hi = require_column(candles, columns::HIGH);
    const auto li = require_column(candles, columns::LOW);
    const auto ci = require_column(candles, columns::CLOSE);
    const auto vi = candles.column_index(columns::VOLUME);
    const auto bi = candles.column_index(columns::BEGIN);
    const auto ei = candles.column_index(columns::END);

    std::vector<types::Candle> out;
    out.reserve(candles.row_count());
    size_t dropped = 0;

    for (size_t i = 0; i < candles.row_count(); ++i) {
        const table::Row& r = candles.row(i);

        auto open = ColumnTable::as_double(r, oi);
        auto high = ColumnTable::as_double(r, hi);
        auto low = ColumnTable::as_double(r, li);
        auto close = ColumnTable::as_double(r, ci);
        if (!open || !high || !low || !close) {
            ++dropped;
            continue;
        }

        types::Candle c;
        c.open = *open;
        c.high = *high;
        c.low = *low;
        c.close = *close;
        c.volume = ColumnTable::as_long(r, vi).value_or(0);
        c.begin = ColumnTable::as_string(r, bi).value_or("");
        c.end = ColumnTable::as_string(r, ei).value_or("");
        out.push_back(std::move(c));
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const types::Candle& a, const types::Candle& b) { return a.begin < b.begin; });

    ISSFEED_LOG_DEBUG("Resolved {} candles ({} incomplete rows dropped)", out.size(), dropped);
    return out;
}

} // namespace candle
} // namespace issfeed
