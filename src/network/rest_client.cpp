#include "issfeed/network/rest_client.hpp"
#include "issfeed/network/network_exception.hpp"
#include "issfeed/utils/logger.hpp"

#include <cctype>
#include <chrono>
#include <iomanip>
#include <memory>
#include <sstream>

namespace issfeed {
namespace network {

std::mutex CurlGlobal::init_mutex_;
int CurlGlobal::ref_count_ = 0;

CurlGlobal::CurlGlobal() {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (ref_count_ == 0) {
        CURLcode result = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (result != CURLE_OK) {
            ISSFEED_LOG_ERROR("Failed to initialize libcurl: {}", curl_easy_strerror(result));
            throw TransferException(std::string("libcurl initialization failed: ") +
                                    curl_easy_strerror(result));
        }
        ISSFEED_LOG_DEBUG("libcurl initialized");
    }
    ++ref_count_;
}

CurlGlobal::~CurlGlobal() {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (--ref_count_ == 0) {
        curl_global_cleanup();
    }
}

RestClient::RestClient(const config::HttpConfig& config)
    : config_(config)
    , share_handle_(nullptr)
    , total_requests_(0)
    , successful_requests_(0)
    , failed_requests_(0)
    , average_response_time_ms_(0.0) {

    share_handle_ = curl_share_init();
    if (!share_handle_) {
        throw TransferException("Failed to create curl share handle");
    }
    curl_share_setopt(share_handle_, CURLSHOPT_LOCKFUNC, RestClient::LockShare);
    curl_share_setopt(share_handle_, CURLSHOPT_UNLOCKFUNC, RestClient::UnlockShare);
    curl_share_setopt(share_handle_, CURLSHOPT_USERDATA, this);
    curl_share_setopt(share_handle_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(share_handle_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_handle_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);

    ISSFEED_LOG_DEBUG("RestClient ready (connect {} ms, request {} ms, pool {})",
                      config_.connect_timeout_ms, config_.request_timeout_ms,
                      config_.max_host_connections);
}

RestClient::~RestClient() {
    if (share_handle_) {
        curl_share_cleanup(share_handle_);
    }
}

void RestClient::LockShare(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    auto* self = static_cast<RestClient*>(userptr);
    self->share_mutexes_[data].lock();
}

void RestClient::UnlockShare(CURL*, curl_lock_data data, void* userptr) {
    auto* self = static_cast<RestClient*>(userptr);
    self->share_mutexes_[data].unlock();
}

HttpResponse RestClient::Get(const std::string& url,
                             const std::unordered_map<std::string, std::string>& headers) {
    auto start_time = std::chrono::steady_clock::now();
    total_requests_.fetch_add(1);

    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        failed_requests_.fetch_add(1);
        ISSFEED_LOG_ERROR("Failed to initialize CURL handle");
        throw TransferException("Failed to initialize CURL handle");
    }

    HttpResponse response;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SHARE, share_handle_);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, RestClient::WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, config_.request_timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, config_.connect_timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_MAXCONNECTS, config_.max_host_connections);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, config_.user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, config_.verify_ssl ? 1L : 0L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, config_.verify_ssl ? 2L : 0L);

    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(nullptr, &curl_slist_free_all);
    curl_slist* raw_list = curl_slist_append(nullptr, "Accept: application/json");
    for (const auto& header : headers) {
        std::string header_str = header.first + ": " + header.second;
        raw_list = curl_slist_append(raw_list, header_str.c_str());
    }
    header_list.reset(raw_list);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());

    CURLcode result = curl_easy_perform(curl.get());

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    response.response_time_ms = static_cast<long>(duration.count());
    UpdateStatistics(response.response_time_ms);

    if (result != CURLE_OK) {
        failed_requests_.fetch_add(1);
        std::string error_message = curl_easy_strerror(result);
        ISSFEED_LOG_ERROR("GET {} failed: {} ({})", url, error_message, static_cast<int>(result));

        switch (result) {
            case CURLE_COULDNT_RESOLVE_HOST:
            case CURLE_COULDNT_RESOLVE_PROXY:
            case CURLE_COULDNT_CONNECT:
                throw ConnectionException("Cannot reach " + url + ": " + error_message);
            case CURLE_OPERATION_TIMEDOUT: {
                // Zero connect time means the connection never came up
                curl_off_t connect_time_us = 0;
                if (curl_easy_getinfo(curl.get(), CURLINFO_CONNECT_TIME_T, &connect_time_us) == CURLE_OK &&
                    connect_time_us > 0) {
                    throw TransferException("Response timed out: " + url + ": " + error_message);
                }
                throw TimeoutException("Connect timed out: " + url + ": " + error_message);
            }
            default:
                throw TransferException("Request failed: " + url + ": " + error_message);
        }
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    successful_requests_.fetch_add(1);

    if (!response.IsSuccess()) {
        ISSFEED_LOG_WARN("HTTP error {}: {}", response.status_code, url);
    }
    ISSFEED_LOG_DEBUG("HTTP GET {} -> {} ({} bytes, {} ms)", url, response.status_code,
                      response.body.length(), response.response_time_ms);

    return response;
}

size_t RestClient::WriteCallback(void* contents, size_t size, size_t nmemb, std::string* data) {
    size_t total_size = size * nmemb;
    data->append(static_cast<char*>(contents), total_size);
    return total_size;
}

void RestClient::UpdateStatistics(long response_time_ms) {
    std::lock_guard<std::mutex> lock(stats_mutex_);

    // Exponential moving average
    if (total_requests_.load() == 1) {
        average_response_time_ms_ = response_time_ms;
    } else {
        const double alpha = 0.1;
        average_response_time_ms_ = alpha * response_time_ms +
                                    (1.0 - alpha) * average_response_time_ms_;
    }
}

long long RestClient::GetTotalRequests() const {
    return total_requests_.load();
}

long long RestClient::GetSuccessfulRequests() const {
    return successful_requests_.load();
}

long long RestClient::GetFailedRequests() const {
    return failed_requests_.load();
}

double RestClient::GetAverageResponseTime() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return average_response_time_ms_;
}

double RestClient::GetSuccessRate() const {
    long long total = total_requests_.load();
    if (total == 0) return 0.0;
    return static_cast<double>(successful_requests_.load()) / total * 100.0;
}

void RestClient::LogStatistics() const {
    ISSFEED_LOG_INFO("HTTP requests total={} ok={} failed={} avg={:.1f}ms",
                     GetTotalRequests(), GetSuccessfulRequests(), GetFailedRequests(),
                     GetAverageResponseTime());
}

std::string RestClient::BuildUrl(const std::string& base, const std::string& endpoint,
                                 const std::map<std::string, std::string>& params) {
    std::string url = base;
    if (!url.empty() && url.back() == '/') {
        url.pop_back();
    }

    if (!endpoint.empty()) {
        if (endpoint[0] != '/') {
            url += "/";
        }
        url += endpoint;
    }

    bool first = true;
    for (const auto& pair : params) {
        url += first ? "?" : "&";
        url += UrlEncode(pair.first) + "=" + UrlEncode(pair.second);
        first = false;
    }

    return url;
}

std::string RestClient::UrlEncode(const std::string& value) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == ',') {
            oss << c;
        } else {
            oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return oss.str();
}

} // namespace network
} // namespace issfeed
