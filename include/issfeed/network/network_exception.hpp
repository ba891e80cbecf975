#pragma once

#include "issfeed/core/exceptions.hpp"

#include <exception>
#include <string>

namespace issfeed {

// Base for transport failures; on its own it is specific to one request
class NetworkException : public FeedException {
public:
    explicit NetworkException(const std::string& message)
        : FeedException(message) {}
};

// Server answered with a non-2xx status
class HttpStatusException : public NetworkException {
public:
    HttpStatusException(long status_code, const std::string& url)
        : NetworkException("HTTP " + std::to_string(status_code) + " for " + url),
          status_code_(status_code) {}

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

// Connection was up but the transfer broke
class TransferException : public NetworkException {
public:
    explicit TransferException(const std::string& message)
        : NetworkException(message) {}
};

// Host could not be resolved or reached
class ConnectionException : public NetworkException {
public:
    explicit ConnectionException(const std::string& message)
        : NetworkException(message) {}
};

// Timed out before a connection was established
class TimeoutException : public NetworkException {
public:
    explicit TimeoutException(const std::string& message)
        : NetworkException(message) {}
};

// True when the error means the whole source is down rather than one item
inline bool is_systemic(const std::exception& e) {
    return dynamic_cast<const ConnectionException*>(&e) != nullptr ||
           dynamic_cast<const TimeoutException*>(&e) != nullptr;
}

} // namespace issfeed
