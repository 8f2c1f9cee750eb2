#pragma once

#include <expected>
#include <string>
#include <type_traits>
#include <utility>

namespace ycard {

//=============================================================================
// Error - message carried by a failed Result
//
// Chained errors read "outer: inner" so the call path that failed is visible
// in a single log line.
//=============================================================================
class Error {
public:
    Error() = default;
    explicit Error(std::string message) : _message(std::move(message)) {}
    Error(std::string message, const Error& cause)
        : _message(std::move(message)) {
        if (!cause._message.empty()) {
            _message += ": ";
            _message += cause._message;
        }
    }

    const std::string& message() const { return _message; }

private:
    std::string _message;
};

template<typename T>
using Result = std::expected<T, Error>;

inline Result<void> Ok() { return {}; }

template<typename T>
Result<std::decay_t<T>> Ok(T&& value) {
    return Result<std::decay_t<T>>(std::forward<T>(value));
}

template<typename T = void>
Result<T> Err(std::string message) {
    return std::unexpected(Error(std::move(message)));
}

template<typename T = void, typename U>
Result<T> Err(std::string message, const Result<U>& cause) {
    return std::unexpected(Error(std::move(message), cause.error()));
}

template<typename T>
std::string error_msg(const Result<T>& res) {
    if (res) return {};
    return res.error().message();
}

} // namespace ycard
