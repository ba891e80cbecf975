#pragma once

#include "issfeed/core/result.hpp"
#include "issfeed/fetch/quote_service.hpp"
#include "issfeed/types/market_types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace issfeed {
namespace fetch {

/**
 * Concurrent per-symbol quote retrieval with caller ordering preserved.
 *
 * One std::async task per input symbol, duplicates included. Item-local
 * failures are logged and drop the item; a systemic failure (source
 * unreachable) in any task fails the whole call with SystemicFetchError once
 * every task has settled. Results are matched back to the input by canonical
 * symbol, never by completion order.
 */
class BatchFetcher {
public:
    explicit BatchFetcher(const QuoteService& service);

    // Output may be shorter than the input; throws AllFetchesFailed when a
    // non-empty input yields nothing
    std::vector<types::Quote> fetch_many(const std::vector<std::string>& symbols) const;

    // One entry per input symbol, in input order, carrying the quote or the
    // reason it failed. Systemic failures still throw.
    std::vector<std::pair<std::string, Result<types::Quote>>> fetch_each(
        const std::vector<std::string>& symbols) const;

private:
    struct TaskOutcome {
        std::optional<types::Quote> quote;
        std::string error;
    };

    TaskOutcome fetch_one(const std::string& symbol) const;

    // Outcomes in input order, after all tasks joined
    std::vector<TaskOutcome> run_tasks(const std::vector<std::string>& symbols) const;

    const QuoteService& service_;
};

} // namespace fetch
} // namespace issfeed
