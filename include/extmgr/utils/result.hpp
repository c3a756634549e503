#pragma once
#include <string>
#include <utility>
#include <variant>

namespace extmgr {
namespace utils {

/**
 * @brief Error payload of a Result. Kept as its own type so that
 * Result<std::string> stays unambiguous.
 */
struct Error {
    std::string message;
};

inline Error make_error(std::string message) {
    return Error{std::move(message)};
}

// Holds either a value of type T or an error message, for operations whose
// failure is reported to the caller instead of thrown.
template <typename T>
class Result {
public:
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const { return std::holds_alternative<T>(data_); }
    bool has_error() const { return std::holds_alternative<Error>(data_); }
    explicit operator bool() const { return has_value(); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const std::string& error() const { return std::get<Error>(data_).message; }

    T value_or(T fallback) const {
        return has_value() ? std::get<T>(data_) : std::move(fallback);
    }

private:
    std::variant<T, Error> data_;
};

template <>
class Result<void> {
public:
    Result() : success_(true) {}
    Result(Error error) : success_(false), error_(std::move(error.message)) {}

    bool has_value() const { return success_; }
    bool has_error() const { return !success_; }
    explicit operator bool() const { return success_; }
    const std::string& error() const { return error_; }

private:
    bool success_ = false;
    std::string error_;
};

} // namespace utils

using utils::Result;

} // namespace extmgr
