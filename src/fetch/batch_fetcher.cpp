#include "issfeed/fetch/batch_fetcher.hpp"
#include "issfeed/core/exceptions.hpp"
#include "issfeed/network/network_exception.hpp"
#include "issfeed/symbol/instrument_classifier.hpp"
#include "issfeed/utils/logger.hpp"

#include <chrono>
#include <exception>
#include <future>
#include <unordered_map>

namespace issfeed {
namespace fetch {

BatchFetcher::BatchFetcher(const QuoteService& service)
    : service_(service) {
}

BatchFetcher::TaskOutcome BatchFetcher::fetch_one(const std::string& symbol) const {
    try {
        return TaskOutcome{service_.fetch_quote(symbol), std::string()};
    } catch (const FeedException& e) {
        if (is_systemic(e)) {
            throw;
        }
        utils::FeedLogger::log_item_dropped(symbol, e.what());
        return TaskOutcome{std::nullopt, e.what()};
    }
}

std::vector<BatchFetcher::TaskOutcome> BatchFetcher::run_tasks(
    const std::vector<std::string>& symbols) const {

    std::vector<std::future<TaskOutcome>> futures;
    futures.reserve(symbols.size());
    for (const auto& symbol : symbols) {
        futures.push_back(std::async(std::launch::async, [this, symbol]() {
            return fetch_one(symbol);
        }));
    }

    for (auto& future : futures) {
        future.wait();
    }

    std::vector<TaskOutcome> outcomes;
    outcomes.reserve(futures.size());

    std::exception_ptr systemic;
    std::string systemic_symbol;
    std::string systemic_reason;
    std::exception_ptr unexpected;

    for (size_t i = 0; i < futures.size(); ++i) {
        try {
            outcomes.push_back(futures[i].get());
        } catch (const std::exception& e) {
            if (is_systemic(e)) {
                if (!systemic) {
                    systemic = std::current_exception();
                    systemic_symbol = symbols[i];
                    systemic_reason = e.what();
                }
            } else if (!unexpected) {
                unexpected = std::current_exception();
            }
        }
    }

    if (systemic) {
        utils::FeedLogger::log_systemic_outage(systemic_symbol, systemic_reason);
        throw SystemicFetchError(systemic_symbol, systemic, systemic_reason);
    }
    if (unexpected) {
        std::rethrow_exception(unexpected);
    }
    return outcomes;
}

std::vector<types::Quote> BatchFetcher::fetch_many(const std::vector<std::string>& symbols) const {
    ISSFEED_SCOPED_TIMER("fetch_many");
    auto start_time = std::chrono::steady_clock::now();

    auto outcomes = run_tasks(symbols);

    // First success per canonical symbol wins, in input order
    std::unordered_map<std::string, types::Quote> by_symbol;
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i].quote) {
            by_symbol.emplace(symbol::InstrumentClassifier::canonicalize(symbols[i]),
                              std::move(*outcomes[i].quote));
        }
    }

    if (by_symbol.empty() && !symbols.empty()) {
        utils::FeedLogger::log_batch_summary(symbols.size(), 0,
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start_time).count());
        throw AllFetchesFailed(symbols.size());
    }

    std::vector<types::Quote> ordered;
    ordered.reserve(symbols.size());
    for (const auto& input : symbols) {
        auto it = by_symbol.find(symbol::InstrumentClassifier::canonicalize(input));
        if (it != by_symbol.end()) {
            ordered.push_back(it->second);
        }
    }

    utils::FeedLogger::log_batch_summary(symbols.size(), ordered.size(),
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time).count());
    return ordered;
}

std::vector<std::pair<std::string, Result<types::Quote>>> BatchFetcher::fetch_each(
    const std::vector<std::string>& symbols) const {
    ISSFEED_SCOPED_TIMER("fetch_each");

    auto outcomes = run_tasks(symbols);

    std::vector<std::pair<std::string, Result<types::Quote>>> results;
    results.reserve(outcomes.size());
    for (size_t i = 0; i < outcomes.size(); ++i) {
        if (outcomes[i].quote) {
            results.emplace_back(symbols[i], Result<types::Quote>::success(std::move(*outcomes[i].quote)));
        } else {
            results.emplace_back(symbols[i], Result<types::Quote>::error(outcomes[i].error));
        }
    }
    return results;
}

} // namespace fetch
} // namespace issfeed
