/**
 * @file result.hpp
 * @brief Error and Result<T> for fallible bridge operations
 *
 * Operations that can fail return a Result instead of throwing. Engine
 * exceptions are converted into an Error at the call site that caught
 * them.
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "types.hpp"

namespace scenebridge {

// ============================================================================
// Error
// ============================================================================

/// Error code plus an optional human-readable message
class Error {
public:
    Error() = default;
    explicit Error(ErrorCode code) : m_code(code) {}
    Error(ErrorCode code, std::string message)
        : m_code(code), m_message(std::move(message)) {}

    ErrorCode code() const { return m_code; }
    const std::string& message() const { return m_message; }

    /// Message if one was given, otherwise the code's description
    const char* what() const {
        return m_message.empty() ? errorCodeToString(m_code) : m_message.c_str();
    }

    /// Re-classify under a new code, prefixing this error's text with context
    Error wrap(ErrorCode code, const std::string& context) const {
        return Error(code, context + ": " + what());
    }

    bool operator==(const Error& other) const {
        return m_code == other.m_code && m_message == other.m_message;
    }

private:
    ErrorCode m_code = ErrorCode::Unknown;
    std::string m_message;
};

// ============================================================================
// Result<T>
// ============================================================================

/**
 * @brief A value of type T or an Error
 *
 * Reading the wrong side throws std::logic_error; check ok() first.
 */
template<typename T, typename E = Error>
class Result {
public:
    Result(T value) : m_data(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_data(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool ok() const { return m_data.index() == 0; }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<0>(checked()); }
    const T& value() const& { return std::get<0>(checked()); }
    T&& value() && { return std::get<0>(std::move(checked())); }

    const E& error() const& {
        if (ok()) throw std::logic_error("Result holds a value, not an error");
        return std::get<1>(m_data);
    }

private:
    std::variant<T, E>& checked() {
        if (!ok()) throw std::logic_error(std::string("Result holds an error: ") + std::get<1>(m_data).what());
        return m_data;
    }
    const std::variant<T, E>& checked() const {
        if (!ok()) throw std::logic_error(std::string("Result holds an error: ") + std::get<1>(m_data).what());
        return m_data;
    }

    std::variant<T, E> m_data;
};

/// Success without a value, or an Error
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool ok() const { return !m_error; }
    explicit operator bool() const { return ok(); }

    const E& error() const& {
        if (ok()) throw std::logic_error("Result holds no error");
        return *m_error;
    }

private:
    std::optional<E> m_error;
};

// ============================================================================
// Helpers
// ============================================================================

template<typename T>
inline Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return {};
}

template<typename T = void>
inline Result<T> Err(ErrorCode code, std::string message = {}) {
    return Result<T>(Error(code, std::move(message)));
}

template<typename T = void>
inline Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

} // namespace scenebridge
