#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace issfeed {
namespace network {

// Raw JSON documents from the upstream source, one request per call
class TableSource {
public:
    virtual ~TableSource() = default;

    // Document carrying the "securities" and "marketdata" blocks
    virtual nlohmann::json get_raw_table(const std::string& symbol) = 0;

    // Document carrying the "candles" block; dates are yyyy-MM-dd
    virtual nlohmann::json get_raw_candle_table(const std::string& symbol,
                                                const std::string& from_date,
                                                int interval,
                                                const std::optional<std::string>& till_date) = 0;
};

} // namespace network
} // namespace issfeed
