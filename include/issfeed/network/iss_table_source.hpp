#pragma once

#include "issfeed/config/config_manager.hpp"
#include "issfeed/network/rest_client.hpp"
#include "issfeed/network/table_source.hpp"

#include <string>

namespace issfeed {
namespace network {

/**
 * TableSource over the ISS REST API.
 *
 * Non-2xx answers throw HttpStatusException; a body that is not JSON throws
 * DecodeError. Transport errors from RestClient pass through unchanged.
 */
class IssTableSource : public TableSource {
public:
    IssTableSource(RestClient& client, config::SourceConfig config);

    nlohmann::json get_raw_table(const std::string& symbol) override;

    nlohmann::json get_raw_candle_table(const std::string& symbol,
                                        const std::string& from_date,
                                        int interval,
                                        const std::optional<std::string>& till_date) override;

    std::string quote_url(const std::string& symbol) const;
    std::string candle_url(const std::string& symbol, const std::string& from_date,
                           int interval, const std::optional<std::string>& till_date) const;

private:
    nlohmann::json fetch_json(const std::string& url);

    RestClient& client_;
    config::SourceConfig config_;
};

} // namespace network
} // namespace issfeed
