#pragma once

#include <string>
#include <utility>
#include <variant>

namespace issfeed {

template<typename T>
class Result {
private:
    std::variant<T, std::string> value_;

    struct ErrorTag {};
    Result(ErrorTag, std::string error) : value_(std::in_place_index<1>, std::move(error)) {}

public:
    explicit Result(T value) : value_(std::in_place_index<0>, std::move(value)) {}

    static Result<T> success(T value) {
        return Result<T>(std::move(value));
    }

    static Result<T> error(std::string error) {
        return Result<T>(ErrorTag{}, std::move(error));
    }

    bool is_success() const {
        return value_.index() == 0;
    }

    bool is_error() const {
        return value_.index() == 1;
    }

    const T& value() const {
        return std::get<0>(value_);
    }

    T& value() {
        return std::get<0>(value_);
    }

    const std::string& error() const {
        return std::get<1>(value_);
    }
};

} // namespace issfeed
