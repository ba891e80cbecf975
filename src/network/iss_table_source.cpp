#include "issfeed/network/iss_table_source.hpp"
#include "issfeed/core/exceptions.hpp"
#include "issfeed/network/network_exception.hpp"
#include "issfeed/utils/logger.hpp"

#include <map>

namespace issfeed {
namespace network {

IssTableSource::IssTableSource(RestClient& client, config::SourceConfig config)
    : client_(client), config_(std::move(config)) {
}

nlohmann::json IssTableSource::get_raw_table(const std::string& symbol) {
    return fetch_json(quote_url(symbol));
}

nlohmann::json IssTableSource::get_raw_candle_table(const std::string& symbol,
                                                    const std::string& from_date,
                                                    int interval,
                                                    const std::optional<std::string>& till_date) {
    return fetch_json(candle_url(symbol, from_date, interval, till_date));
}

std::string IssTableSource::quote_url(const std::string& symbol) const {
    return RestClient::BuildUrl(
        config_.base_url,
        "/engines/stock/markets/shares/securities/" + RestClient::UrlEncode(symbol) + ".json",
        {{"iss.meta", "off"}, {"iss.only", "securities,marketdata"}});
}

std::string IssTableSource::candle_url(const std::string& symbol, const std::string& from_date,
                                       int interval,
                                       const std::optional<std::string>& till_date) const {
    std::map<std::string, std::string> params{
        {"from", from_date},
        {"interval", std::to_string(interval)},
        {"iss.meta", "off"}
    };
    if (till_date) {
        params["till"] = *till_date;
    }
    return RestClient::BuildUrl(
        config_.base_url,
        "/engines/stock/markets/shares/boards/" + RestClient::UrlEncode(config_.candle_board) +
            "/securities/" + RestClient::UrlEncode(symbol) + "/candles.json",
        params);
}

nlohmann::json IssTableSource::fetch_json(const std::string& url) {
    HttpResponse response = client_.Get(url);
    if (!response.IsSuccess()) {
        throw HttpStatusException(response.status_code, url);
    }

    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        ISSFEED_LOG_WARN("Unparsable body from {}: {}", url, e.what());
        throw DecodeError("response from " + url + " is not valid JSON: " + e.what());
    }
}

} // namespace network
} // namespace issfeed
