#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace issfeed {
namespace testing {

// Quote document shaped like the ISS securities endpoint: one TQBR row in
// each block, prices as given. A zero price is written as null.
inline nlohmann::json quote_document(const std::string& secid, double last, double prev,
                                     const std::string& name = "") {
    using nlohmann::json;
    auto price = [](double v) { return v == 0.0 ? json(nullptr) : json(v); };
    json doc;
    doc["securities"]["columns"] = json::array({"SECID", "BOARDID", "SHORTNAME", "PREVPRICE", "SECNAME"});
    doc["securities"]["data"] = json::array({
        json::array({secid, "TQBR", secid, price(prev), name.empty() ? json(nullptr) : json(name)})
    });
    doc["marketdata"]["columns"] = json::array({"SECID", "BOARDID", "LAST", "OPEN", "HIGH", "LOW",
                                                "LCLOSEPRICE", "VOLTODAY"});
    doc["marketdata"]["data"] = json::array({
        json::array({secid, "TQBR", price(last), nullptr, nullptr, nullptr, nullptr, 1000})
    });
    return doc;
}

inline nlohmann::json candle_document(const nlohmann::json& rows) {
    nlohmann::json doc;
    doc["candles"]["columns"] = nlohmann::json::array({"open", "close", "high", "low", "value",
                                                       "volume", "begin", "end"});
    doc["candles"]["data"] = rows;
    return doc;
}

} // namespace testing
} // namespace issfeed
