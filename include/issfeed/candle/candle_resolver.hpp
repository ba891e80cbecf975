#pragma once

#include "issfeed/table/column_table.hpp"
#include "issfeed/types/market_types.hpp"

#include <string>
#include <vector>

namespace issfeed {
namespace candle {

// The candle block uses lower-case column names
namespace columns {
inline const std::string OPEN = "open";
inline const std::string CLOSE = "close";
inline const std::string HIGH = "high";
inline const std::string LOW = "low";
inline const std::string VOLUME = "volume";
inline const std::string BEGIN = "begin";
inline const std::string END = "end";
} // namespace columns

/**
 * Turns a decoded candle table into a series ordered by `begin`.
 *
 * Rows missing any of open/high/low/close, or holding a value that does not
 * coerce to a number, are dropped whole. Survivors are stable-sorted by the
 * begin string ("yyyy-MM-dd HH:mm:ss" sorts lexicographically). An empty
 * result means "no data"; a table without the OHLC columns is a DecodeError.
 */
std::vector<types::Candle> resolve_candles(const table::ColumnTable& candles);

} // namespace candle
} // namespace issfeed
