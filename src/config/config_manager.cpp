#include "issfeed/config/config_manager.hpp"
#include "issfeed/utils/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace issfeed {
namespace config {

namespace {

template<typename T>
void read_value(const nlohmann::json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

} // namespace

ConfigManager::ConfigManager() = default;

ConfigManager::~ConfigManager() = default;

bool ConfigManager::load_config(const std::string& config_file_path) {
    std::ifstream file(config_file_path);
    if (!file.is_open()) {
        ISSFEED_LOG_ERROR("Cannot open config file {}", config_file_path);
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (!load_from_string(buffer.str())) {
        ISSFEED_LOG_ERROR("Config file {} could not be applied", config_file_path);
        return false;
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    config_file_path_ = config_file_path;
    ISSFEED_LOG_INFO("Configuration loaded from {}", config_file_path);
    return true;
}

bool ConfigManager::load_from_string(const std::string& json_text) {
    try {
        auto root = nlohmann::json::parse(json_text);
        if (!root.is_object()) {
            ISSFEED_LOG_ERROR("Configuration root must be a JSON object");
            return false;
        }
        apply_json(root);
        return true;
    } catch (const nlohmann::json::exception& e) {
        ISSFEED_LOG_ERROR("Invalid configuration JSON: {}", e.what());
        return false;
    }
}

void ConfigManager::apply_json(const nlohmann::json& root) {
    // Parse into copies so a type error leaves the current config intact
    SourceConfig source;
    HttpConfig http;
    LoggingConfig logging;
    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        source = source_config_;
        http = http_config_;
        logging = logging_config_;
    }

    if (auto it = root.find("source"); it != root.end() && it->is_object()) {
        read_value(*it, "base_url", source.base_url);
        read_value(*it, "primary_board", source.primary_board);
        read_value(*it, "candle_board", source.candle_board);
        read_value(*it, "currency", source.currency);
        read_value(*it, "exchange", source.exchange);
        read_value(*it, "market_state", source.market_state);
        read_value(*it, "extra_tickers", source.extra_tickers);
    }

    if (auto it = root.find("http"); it != root.end() && it->is_object()) {
        read_value(*it, "user_agent", http.user_agent);
        read_value(*it, "connect_timeout_ms", http.connect_timeout_ms);
        read_value(*it, "request_timeout_ms", http.request_timeout_ms);
        read_value(*it, "max_host_connections", http.max_host_connections);
        read_value(*it, "verify_ssl", http.verify_ssl);
    }

    if (auto it = root.find("logging"); it != root.end() && it->is_object()) {
        read_value(*it, "level", logging.level);
        read_value(*it, "file_path", logging.file_path);
        read_value(*it, "max_file_size", logging.max_file_size);
        read_value(*it, "max_files", logging.max_files);
        read_value(*it, "console_output", logging.console_output);
    }

    std::lock_guard<std::mutex> lock(config_mutex_);
    source_config_ = std::move(source);
    http_config_ = std::move(http);
    logging_config_ = std::move(logging);
}

bool ConfigManager::save_config(const std::string& config_file_path) const {
    std::ofstream file(config_file_path);
    if (!file.is_open()) {
        ISSFEED_LOG_ERROR("Cannot write config file {}", config_file_path);
        return false;
    }
    file << to_json().dump(4) << std::endl;
    return file.good();
}

nlohmann::json ConfigManager::to_json() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return nlohmann::json{
        {"source", {
            {"base_url", source_config_.base_url},
            {"primary_board", source_config_.primary_board},
            {"candle_board", source_config_.candle_board},
            {"currency", source_config_.currency},
            {"exchange", source_config_.exchange},
            {"market_state", source_config_.market_state},
            {"extra_tickers", source_config_.extra_tickers}
        }},
        {"http", {
            {"user_agent", http_config_.user_agent},
            {"connect_timeout_ms", http_config_.connect_timeout_ms},
            {"request_timeout_ms", http_config_.request_timeout_ms},
            {"max_host_connections", http_config_.max_host_connections},
            {"verify_ssl", http_config_.verify_ssl}
        }},
        {"logging", {
            {"level", logging_config_.level},
            {"file_path", logging_config_.file_path},
            {"max_file_size", logging_config_.max_file_size},
            {"max_files", logging_config_.max_files},
            {"console_output", logging_config_.console_output}
        }}
    };
}

SourceConfig ConfigManager::get_source_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return source_config_;
}

void ConfigManager::set_source_config(const SourceConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    source_config_ = config;
}

HttpConfig ConfigManager::get_http_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return http_config_;
}

void ConfigManager::set_http_config(const HttpConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    http_config_ = config;
}

LoggingConfig ConfigManager::get_logging_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return logging_config_;
}

void ConfigManager::set_logging_config(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    logging_config_ = config;
}

std::string ConfigManager::get_env_var(const std::string& var_name, const std::string& default_value) const {
    const char* value = std::getenv(var_name.c_str());
    return value ? std::string(value) : default_value;
}

void ConfigManager::load_env_overrides() {
    std::string base_url = get_env_var("ISSFEED_BASE_URL");
    std::string log_level = get_env_var("ISSFEED_LOG_LEVEL");
    std::string board = get_env_var("ISSFEED_PRIMARY_BOARD");

    std::lock_guard<std::mutex> lock(config_mutex_);
    if (!base_url.empty()) {
        source_config_.base_url = base_url;
    }
    if (!board.empty()) {
        source_config_.primary_board = board;
    }
    if (!log_level.empty()) {
        logging_config_.level = log_level;
    }
}

bool ConfigManager::validate_config() const {
    return get_validation_errors().empty();
}

std::vector<std::string> ConfigManager::get_validation_errors() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    std::vector<std::string> errors;

    if (source_config_.base_url.rfind("http://", 0) != 0 &&
        source_config_.base_url.rfind("https://", 0) != 0) {
        errors.push_back("source.base_url must start with http:// or https://");
    }
    if (source_config_.primary_board.empty()) {
        errors.push_back("source.primary_board must not be empty");
    }
    if (source_config_.candle_board.empty()) {
        errors.push_back("source.candle_board must not be empty");
    }
    if (http_config_.connect_timeout_ms <= 0) {
        errors.push_back("http.connect_timeout_ms must be positive");
    }
    if (http_config_.request_timeout_ms <= 0) {
        errors.push_back("http.request_timeout_ms must be positive");
    }
    if (http_config_.max_host_connections <= 0) {
        errors.push_back("http.max_host_connections must be positive");
    }
    if (logging_config_.max_files == 0) {
        errors.push_back("logging.max_files must be at least 1");
    }

    if (!utils::try_parse_log_level(logging_config_.level)) {
        errors.push_back("logging.level '" + logging_config_.level + "' is not a known level");
    }

    return errors;
}

} // namespace config
} // namespace issfeed
