#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace issfeed {

class FeedException : public std::runtime_error {
public:
    explicit FeedException(const std::string& message) : std::runtime_error(message) {}
    explicit FeedException(const char* message) : std::runtime_error(message) {}
};

// Malformed or absent table shape
class DecodeError : public FeedException {
public:
    explicit DecodeError(const std::string& message)
        : FeedException("Decode Error: " + message) {}

protected:
    DecodeError(const std::string& prefix, const std::string& message)
        : FeedException(prefix + message) {}
};

// A required table decoded fine but carries no rows
class EmptyTable : public DecodeError {
public:
    explicit EmptyTable(const std::string& table_name)
        : DecodeError("Empty Table: ", table_name), table_name_(table_name) {}

    const std::string& table_name() const { return table_name_; }

private:
    std::string table_name_;
};

class OutOfRangeError : public FeedException {
public:
    explicit OutOfRangeError(const std::string& message)
        : FeedException("Out Of Range: " + message) {}
};

class NoPriceAvailable : public FeedException {
public:
    explicit NoPriceAvailable(const std::string& symbol)
        : FeedException("No Price Available: " + symbol), symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

class InsufficientData : public FeedException {
public:
    explicit InsufficientData(const std::string& message)
        : FeedException("Insufficient Data: " + message) {}
};

class IneligibleSymbol : public FeedException {
public:
    explicit IneligibleSymbol(const std::string& symbol)
        : FeedException("Ineligible Symbol: " + symbol), symbol_(symbol) {}

    const std::string& symbol() const { return symbol_; }

private:
    std::string symbol_;
};

class ConfigurationError : public FeedException {
public:
    explicit ConfigurationError(const std::string& message)
        : FeedException("Configuration Error: " + message) {}
};

// Every item of a non-empty batch failed item-locally
class AllFetchesFailed : public FeedException {
public:
    explicit AllFetchesFailed(size_t requested)
        : FeedException("All Fetches Failed: none of " + std::to_string(requested) +
                        " requested symbols resolved"),
          requested_(requested) {}

    size_t requested() const { return requested_; }

private:
    size_t requested_;
};

// The upstream source is unreachable; wraps the transport error that said so
class SystemicFetchError : public FeedException {
public:
    SystemicFetchError(const std::string& symbol, std::exception_ptr cause, const std::string& reason)
        : FeedException("Systemic Fetch Error: " + reason + " (while fetching " + symbol + ")"),
          symbol_(symbol), cause_(std::move(cause)) {}

    const std::string& symbol() const { return symbol_; }
    std::exception_ptr cause() const { return cause_; }

    [[noreturn]] void rethrow_cause() const { std::rethrow_exception(cause_); }

private:
    std::string symbol_;
    std::exception_ptr cause_;
};

} // namespace issfeed
