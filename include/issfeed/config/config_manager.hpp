#pragma once

#include <nlohmann/json.hpp>

#include <mutex>
#include <string>
#include <vector>

namespace issfeed {
namespace config {

struct SourceConfig {
    std::string base_url;
    std::string primary_board;
    std::string candle_board;
    std::string currency;
    std::string exchange;
    std::string market_state;
    std::vector<std::string> extra_tickers;

    SourceConfig() : base_url("https://iss.moex.com/iss"), primary_board("TQBR"),
                     candle_board("TQBR"), currency("RUB"), exchange("MOEX"),
                     market_state("REGULAR") {}
};

struct HttpConfig {
    std::string user_agent;
    long connect_timeout_ms;
    long request_timeout_ms;
    long max_host_connections;
    bool verify_ssl;

    HttpConfig() : user_agent("issfeed/1.0"), connect_timeout_ms(8000),
                   request_timeout_ms(10000), max_host_connections(2),
                   verify_ssl(true) {}
};

struct LoggingConfig {
    std::string level;
    std::string file_path;
    size_t max_file_size;
    size_t max_files;
    bool console_output;

    LoggingConfig() : level("INFO"), file_path("logs/issfeed.log"),
                      max_file_size(10 * 1024 * 1024), max_files(3),
                      console_output(true) {}
};

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Missing sections and keys keep their defaults
    bool load_config(const std::string& config_file_path);
    bool load_from_string(const std::string& json_text);
    bool save_config(const std::string& config_file_path) const;

    SourceConfig get_source_config() const;
    void set_source_config(const SourceConfig& config);

    HttpConfig get_http_config() const;
    void set_http_config(const HttpConfig& config);

    LoggingConfig get_logging_config() const;
    void set_logging_config(const LoggingConfig& config);

    // ISSFEED_BASE_URL, ISSFEED_LOG_LEVEL, ISSFEED_PRIMARY_BOARD
    std::string get_env_var(const std::string& var_name, const std::string& default_value = "") const;
    void load_env_overrides();

    bool validate_config() const;
    std::vector<std::string> get_validation_errors() const;

    nlohmann::json to_json() const;

private:
    void apply_json(const nlohmann::json& root);

    mutable std::mutex config_mutex_;
    std::string config_file_path_;
    SourceConfig source_config_;
    HttpConfig http_config_;
    LoggingConfig logging_config_;
};

} // namespace config
} // namespace issfeed
