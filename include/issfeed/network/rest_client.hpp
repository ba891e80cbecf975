#pragma once

#include "issfeed/config/config_manager.hpp"

#include <curl/curl.h>

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

namespace issfeed {
namespace network {

struct HttpResponse {
    long status_code = 0;
    std::string body;
    long response_time_ms = 0;

    bool IsSuccess() const { return status_code >= 200 && status_code < 300; }
    bool IsClientError() const { return status_code >= 400 && status_code < 500; }
    bool IsServerError() const { return status_code >= 500; }
};

// Process-wide curl_global_init/cleanup, reference counted
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal&) = delete;
    CurlGlobal& operator=(const CurlGlobal&) = delete;

private:
    static std::mutex init_mutex_;
    static int ref_count_;
};

/**
 * Blocking HTTP GET client over libcurl.
 *
 * Each request uses its own easy handle; connections, DNS results and TLS
 * sessions are shared through one curl share handle so concurrent requests
 * reuse a small pool. Safe to call Get from several threads at once.
 *
 * Transport failures throw: ConnectionException when the host cannot be
 * resolved or reached, TimeoutException on timeout, TransferException for
 * anything else. HTTP status codes are returned, not thrown.
 */
class RestClient {
public:
    explicit RestClient(const config::HttpConfig& config = config::HttpConfig{});
    ~RestClient();

    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    HttpResponse Get(const std::string& url,
                     const std::unordered_map<std::string, std::string>& headers = {});

    // Statistics
    long long GetTotalRequests() const;
    long long GetSuccessfulRequests() const;
    long long GetFailedRequests() const;
    double GetAverageResponseTime() const;
    double GetSuccessRate() const;
    void LogStatistics() const;

    const config::HttpConfig& GetConfig() const { return config_; }

    static std::string BuildUrl(const std::string& base, const std::string& endpoint,
                                const std::map<std::string, std::string>& params = {});
    static std::string UrlEncode(const std::string& value);

private:
    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* data);
    static void LockShare(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
    static void UnlockShare(CURL* handle, curl_lock_data data, void* userptr);

    void UpdateStatistics(long response_time_ms);

    CurlGlobal curl_global_;
    config::HttpConfig config_;

    CURLSH* share_handle_;
    std::mutex share_mutexes_[CURL_LOCK_DATA_LAST];

    std::atomic<long long> total_requests_;
    std::atomic<long long> successful_requests_;
    std::atomic<long long> failed_requests_;
    mutable std::mutex stats_mutex_;
    double average_response_time_ms_;
};

} // namespace network
} // namespace issfeed
