#pragma once

#include "issfeed/network/table_source.hpp"
#include <gmock/gmock.h>

namespace issfeed {
namespace testing {

class MockTableSource : public network::TableSource {
public:
    MOCK_METHOD(nlohmann::json, get_raw_table, (const std::string&), (override));
    MOCK_METHOD(nlohmann::json, get_raw_candle_table,
                (const std::string&, const std::string&, int, const std::optional<std::string>&),
                (override));
};

} // namespace testing
} // namespace issfeed
