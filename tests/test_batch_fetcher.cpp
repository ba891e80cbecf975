#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "issfeed/fetch/batch_fetcher.hpp"
#include "issfeed/core/exceptions.hpp"
#include "issfeed/network/network_exception.hpp"
#include "mocks/mock_table_source.hpp"
#include "iss_documents.hpp"
#include "stalled_server.hpp"
#include "issfeed/network/iss_table_source.hpp"
#include "issfeed/network/rest_client.hpp"
#include <memory>

using namespace issfeed;
using namespace issfeed::fetch;
using issfeed::testing::MockTableSource;
using issfeed::testing::quote_document;
using nlohmann::json;
using ::testing::_;
using ::testing::Eq;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

class BatchFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        service = std::make_unique<QuoteService>(source);
        fetcher = std::make_unique<BatchFetcher>(*service);
    }

    void serve(const std::string& secid, double last, double prev) {
        ON_CALL(source, get_raw_table(Eq(secid)))
            .WillByDefault(Return(quote_document(secid, last, prev)));
    }

    static std::vector<std::string> symbols_of(const std::vector<types::Quote>& quotes) {
        std::vector<std::string> out;
        for (const auto& q : quotes) {
            out.push_back(q.symbol);
        }
        return out;
    }

    NiceMock<MockTableSource> source;
    std::unique_ptr<QuoteService> service;
    std::unique_ptr<BatchFetcher> fetcher;
};

TEST_F(BatchFetcherTest, PreservesInputOrderAndDropsItemFailures) {
    serve("SBER", 310.0, 300.0);
    serve("GAZP", 0.0, 0.0);
    serve("LKOH", 7000.0, 6900.0);

    auto quotes = fetcher->fetch_many({"SBER", "GAZP", "LKOH"});

    ASSERT_EQ(quotes.size(), 2u);
    EXPECT_EQ(symbols_of(quotes), (std::vector<std::string>{"SBER", "LKOH"}));
    EXPECT_DOUBLE_EQ(quotes[0].last_trade_price, 310.0);
    EXPECT_DOUBLE_EQ(quotes[1].last_trade_price, 7000.0);
}

TEST_F(BatchFetcherTest, OrderFollowsInputNotCompletion) {
    serve("SBER", 310.0, 300.0);
    serve("GAZP", 160.0, 150.0);
    serve("LKOH", 7000.0, 6900.0);
    serve("ROSN", 550.0, 540.0);

    const std::vector<std::string> input{"ROSN", "lkoh", "SBER.ME", "GAZP"};
    auto quotes = fetcher->fetch_many(input);

    EXPECT_EQ(symbols_of(quotes), input);
}

TEST_F(BatchFetcherTest, DuplicatesAreReturnedTwice) {
    serve("SBER", 310.0, 300.0);
    serve("GAZP", 160.0, 150.0);

    auto quotes = fetcher->fetch_many({"SBER", "GAZP", "SBER"});

    ASSERT_EQ(quotes.size(), 3u);
    EXPECT_EQ(quotes[0].symbol, "SBER");
    EXPECT_EQ(quotes[1].symbol, "GAZP");
    EXPECT_EQ(quotes[2].symbol, "SBER");
    EXPECT_DOUBLE_EQ(quotes[2].last_trade_price, 310.0);
}

TEST_F(BatchFetcherTest, IneligibleSymbolIsDroppedInsideBatch) {
    serve("SBER", 310.0, 300.0);
    EXPECT_CALL(source, get_raw_table(Eq("AAPL"))).Times(0);

    auto quotes = fetcher->fetch_many({"AAPL", "SBER"});
    EXPECT_EQ(symbols_of(quotes), (std::vector<std::string>{"SBER"}));
}

TEST_F(BatchFetcherTest, ItemLocalTransportErrorsAreDropped) {
    serve("SBER", 310.0, 300.0);
    ON_CALL(source, get_raw_table(Eq("GAZP")))
        .WillByDefault(Throw(HttpStatusException(404, "https://iss.moex.com/iss/...")));
    ON_CALL(source, get_raw_table(Eq("LKOH")))
        .WillByDefault(Throw(TransferException("connection reset mid-body")));

    auto quotes = fetcher->fetch_many({"GAZP", "SBER", "LKOH"});
    EXPECT_EQ(symbols_of(quotes), (std::vector<std::string>{"SBER"}));
}

TEST_F(BatchFetcherTest, AllSystemicFailuresRaiseSystemicFetchError) {
    ON_CALL(source, get_raw_table(_))
        .WillByDefault(Throw(ConnectionException("Could not resolve host")));

    try {
        fetcher->fetch_many({"SBER", "GAZP", "LKOH"});
        FAIL() << "expected SystemicFetchError";
    } catch (const SystemicFetchError& e) {
        EXPECT_EQ(e.symbol(), "SBER");
        EXPECT_THROW(e.rethrow_cause(), ConnectionException);
    }
}

TEST_F(BatchFetcherTest, OneTimeoutFailsTheWholeBatch) {
    serve("SBER", 310.0, 300.0);
    serve("LKOH", 7000.0, 6900.0);
    ON_CALL(source, get_raw_table(Eq("GAZP")))
        .WillByDefault(Throw(TimeoutException("Connection timed out")));

    EXPECT_THROW(fetcher->fetch_many({"SBER", "GAZP", "LKOH"}), SystemicFetchError);
}

TEST_F(BatchFetcherTest, SystemicWinsOverItemLocal) {
    serve("SBER", 0.0, 0.0);
    ON_CALL(source, get_raw_table(Eq("GAZP")))
        .WillByDefault(Throw(ConnectionException("Connection refused")));

    EXPECT_THROW(fetcher->fetch_many({"SBER", "GAZP"}), SystemicFetchError);
}

TEST_F(BatchFetcherTest, AllItemLocalFailuresRaiseAllFetchesFailed) {
    serve("SBER", 0.0, 0.0);
    ON_CALL(source, get_raw_table(Eq("GAZP")))
        .WillByDefault(Return(json{{"marketdata", json::object()}}));

    try {
        fetcher->fetch_many({"SBER", "GAZP", "AAPL"});
        FAIL() << "expected AllFetchesFailed";
    } catch (const AllFetchesFailed& e) {
        EXPECT_EQ(e.requested(), 3u);
    }
}

TEST_F(BatchFetcherTest, EmptyInputGivesEmptyOutput) {
    EXPECT_CALL(source, get_raw_table(_)).Times(0);
    EXPECT_TRUE(fetcher->fetch_many({}).empty());
}

TEST_F(BatchFetcherTest, FetchEachReportsEveryItem) {
    serve("SBER", 310.0, 300.0);
    serve("GAZP", 0.0, 0.0);

    auto results = fetcher->fetch_each({"GAZP", "SBER", "AAPL"});

    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results[0].first, "GAZP");
    ASSERT_TRUE(results[0].second.is_error());
    EXPECT_THAT(results[0].second.error(), ::testing::HasSubstr("No Price Available"));

    EXPECT_EQ(results[1].first, "SBER");
    ASSERT_TRUE(results[1].second.is_success());
    EXPECT_DOUBLE_EQ(results[1].second.value().last_trade_price, 310.0);

    EXPECT_EQ(results[2].first, "AAPL");
    ASSERT_TRUE(results[2].second.is_error());
    EXPECT_THAT(results[2].second.error(), ::testing::HasSubstr("Ineligible Symbol"));
}

TEST_F(BatchFetcherTest, FetchEachStillFailsFastOnOutage) {
    ON_CALL(source, get_raw_table(_))
        .WillByDefault(Throw(TimeoutException("Connection timed out")));

    EXPECT_THROW(fetcher->fetch_each({"SBER"}), SystemicFetchError);
}

namespace {

// Serves GAZP from a real HTTP source and everything else from canned documents
class OneSlowSymbolSource : public network::TableSource {
public:
    explicit OneSlowSymbolSource(network::TableSource& slow) : slow_(slow) {}

    json get_raw_table(const std::string& symbol) override {
        if (symbol == "GAZP") {
            return slow_.get_raw_table(symbol);
        }
        return quote_document(symbol, 310.0, 300.0);
    }

    json get_raw_candle_table(const std::string& symbol, const std::string& from_date, int interval,
                              const std::optional<std::string>& till_date) override {
        return slow_.get_raw_candle_table(symbol, from_date, interval, till_date);
    }

private:
    network::TableSource& slow_;
};

} // namespace

TEST(BatchFetcherTimeoutTest, SlowSymbolIsDroppedAndOthersSurvive) {
    issfeed::testing::StalledServer server;

    config::HttpConfig http;
    http.connect_timeout_ms = 2000;
    http.request_timeout_ms = 300;
    network::RestClient client(http);

    config::SourceConfig source_config;
    source_config.base_url = server.base_url();
    network::IssTableSource iss(client, source_config);

    OneSlowSymbolSource source(iss);
    QuoteService service(source);
    BatchFetcher fetcher(service);

    std::vector<types::Quote> quotes;
    ASSERT_NO_THROW(quotes = fetcher.fetch_many({"SBER", "GAZP", "LKOH"}));

    std::vector<std::string> symbols;
    for (const auto& q : quotes) {
        symbols.push_back(q.symbol);
    }
    EXPECT_EQ(symbols, (std::vector<std::string>{"SBER", "LKOH"}));
}
