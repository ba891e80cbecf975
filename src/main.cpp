#include "issfeed/chart/chart_range.hpp"
#include "issfeed/config/config_manager.hpp"
#include "issfeed/core/exceptions.hpp"
#include "issfeed/fetch/batch_fetcher.hpp"
#include "issfeed/fetch/quote_service.hpp"
#include "issfeed/network/iss_table_source.hpp"
#include "issfeed/network/rest_client.hpp"
#include "issfeed/utils/logger.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FETCH_FAILED = 1;
constexpr int EXIT_USAGE = 2;

struct CommandLine {
    std::string config_path;
    std::string command;
    std::vector<std::string> operands;
};

void print_usage(std::ostream& out) {
    out << "Usage:\n"
        << "  issfeed [--config FILE] quote SYMBOL [SYMBOL...]\n"
        << "  issfeed [--config FILE] chart SYMBOL RANGE\n"
        << "\n"
        << "RANGE is one of 1d, 2w, 1m, 3m, 1y, 5y, max\n";
}

std::optional<CommandLine> parse_command_line(int argc, char* argv[]) {
    CommandLine cli;
    int i = 1;
    while (i < argc) {
        std::string arg = argv[i];
        if (arg == "--config") {
            if (i + 1 >= argc) {
                return std::nullopt;
            }
            cli.config_path = argv[i + 1];
            i += 2;
        } else if (arg == "-h" || arg == "--help") {
            return std::nullopt;
        } else {
            break;
        }
    }

    if (i >= argc) {
        return std::nullopt;
    }
    cli.command = argv[i++];
    for (; i < argc; ++i) {
        cli.operands.emplace_back(argv[i]);
    }

    if (cli.command == "quote" && !cli.operands.empty()) {
        return cli;
    }
    if (cli.command == "chart" && cli.operands.size() == 2) {
        return cli;
    }
    return std::nullopt;
}

nlohmann::json quote_to_json(const issfeed::types::Quote& q) {
    return nlohmann::json{
        {"symbol", q.symbol},
        {"name", q.name},
        {"long_name", q.long_name},
        {"last", q.last_trade_price},
        {"change", q.change},
        {"change_percent", q.change_percent},
        {"change_display", issfeed::chart::format_signed(q.change, 2)},
        {"change_percent_display", issfeed::chart::format_percent_signed(q.change_percent)},
        {"open", q.open},
        {"high", q.day_high},
        {"low", q.day_low},
        {"previous_close", q.previous_close},
        {"volume", q.volume},
        {"currency", q.currency_code},
        {"exchange", q.exchange},
        {"market_state", q.market_state},
        {"tradeable", q.tradeable}
    };
}

nlohmann::json chart_to_json(const issfeed::types::ChartSeries& series,
                             issfeed::chart::ChartRange range) {
    auto stats = issfeed::chart::derive_chart_stats(series);

    nlohmann::json points = nlohmann::json::array();
    for (const auto& p : series.points) {
        points.push_back({
            {"timestamp", p.timestamp},
            {"open", p.open},
            {"high", p.high},
            {"low", p.low},
            {"close", p.close}
        });
    }

    return nlohmann::json{
        {"symbol", series.symbol},
        {"range", issfeed::chart::range_code(range)},
        {"previous_value", series.previous_value},
        {"current_value", series.current_value},
        {"change", stats.change},
        {"change_percent", stats.change_percent},
        {"change_display", issfeed::chart::format_signed(stats.change, 2)},
        {"change_percent_display", issfeed::chart::format_percent_signed(stats.change_percent)},
        {"is_up", stats.is_up},
        {"is_down", stats.is_down},
        {"points", points}
    };
}

std::string join_errors(const std::vector<std::string>& errors) {
    std::string joined;
    for (const auto& e : errors) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += e;
    }
    return joined;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace issfeed;

    auto cli = parse_command_line(argc, argv);
    if (!cli) {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    std::optional<chart::ChartRange> range;
    if (cli->command == "chart") {
        range = chart::parse_range(cli->operands[1]);
        if (!range) {
            std::cerr << "Unknown range: " << cli->operands[1] << "\n";
            print_usage(std::cerr);
            return EXIT_USAGE;
        }
    }

    config::ConfigManager config_manager;

    try {
        if (!cli->config_path.empty() && !config_manager.load_config(cli->config_path)) {
            throw ConfigurationError("cannot load " + cli->config_path);
        }
        config_manager.load_env_overrides();

        auto errors = config_manager.get_validation_errors();
        if (!errors.empty()) {
            throw ConfigurationError(join_errors(errors));
        }

        auto logging = config_manager.get_logging_config();
        utils::Logger::initialize(logging.file_path, utils::parse_log_level(logging.level),
                                  logging.max_file_size, logging.max_files, logging.console_output);

        auto source_config = config_manager.get_source_config();

        quote::ResolverSettings settings;
        settings.primary_board = source_config.primary_board;
        settings.currency = source_config.currency;
        settings.exchange = source_config.exchange;
        settings.market_state = source_config.market_state;

        // One pooled transport for the whole process
        network::RestClient client(config_manager.get_http_config());
        network::IssTableSource source(client, source_config);
        fetch::QuoteService service(source,
                                    symbol::InstrumentClassifier(source_config.extra_tickers),
                                    quote::QuoteResolver(settings));

        nlohmann::json output;
        if (cli->command == "quote") {
            output = nlohmann::json::array();
            if (cli->operands.size() == 1) {
                output.push_back(quote_to_json(service.fetch_quote(cli->operands[0])));
            } else {
                fetch::BatchFetcher fetcher(service);
                for (const auto& q : fetcher.fetch_many(cli->operands)) {
                    output.push_back(quote_to_json(q));
                }
            }
        } else {
            auto series = service.fetch_candles(cli->operands[0], *range);
            output = chart_to_json(series, *range);
        }

        std::cout << output.dump(2) << std::endl;
        client.LogStatistics();

    } catch (const FeedException& e) {
        ISSFEED_LOG_ERROR("{} failed: {}", cli->command, e.what());
        std::cerr << e.what() << std::endl;
        utils::Logger::shutdown();
        return EXIT_FETCH_FAILED;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        utils::Logger::shutdown();
        return EXIT_FETCH_FAILED;
    }

    utils::Logger::shutdown();
    return EXIT_OK;
}
