/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for error handling without exceptions
 *
 * Design Philosophy:
 * - Distinguishes between success (T) and expected failures (E)
 * - Forces explicit error handling at call sites
 * - No implicit conversions to bool (prevents accidental misuse)
 * - [[nodiscard]] prevents ignoring errors
 * - An error carries the enum, an optional numeric code and a human-readable message
 *   (for protocol errors the code/message are the ones the TV sent verbatim)
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace lgtv::utils
{

/**
 * @class Result
 * @brief Generic Result<T, E> type for operations that can fail in expected ways
 *
 * @tparam T Success value type
 * @tparam E Error enum type (should be an enum or enum class)
 *
 * Usage:
 * @code
 * Result<int, ErrorCode> compute() {
 *     if (condition) {
 *         return Result<int, ErrorCode>::ok(42);
 *     }
 *     return Result<int, ErrorCode>::error(ErrorCode::InvalidInput, 0, "bad input");
 * }
 *
 * auto result = compute();
 * if (result.is_ok()) {
 *     int value = result.content();
 * } else {
 *     ErrorCode err = result.error();
 * }
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    // ====================================================================
    // Construction - Use static factory methods for clarity
    // ====================================================================

    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /// @brief Success for valueless results (`Status<E>`).
    [[nodiscard]] static Result ok()
        requires std::is_same_v<T, std::monostate>
    {
        Result result;
        result.m_data = std::monostate{};
        return result;
    }

    /**
     * @brief Create a failed Result containing an error
     * @param err The error enum value
     * @param code Optional detailed error code (default 0)
     * @param message Optional human-readable detail
     */
    [[nodiscard]] static Result error(E err, int code = 0, std::string message = {})
    {
        Result result;
        result.m_data = ErrorData{err, code, std::move(message)};
        return result;
    }

    /// @brief Re-wraps the error of another (failed) Result with a different value type.
    template <typename U> [[nodiscard]] static Result propagate(const Result<U, E> &other)
    {
        return error(other.error(), other.error_code(), other.error_message());
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}, 0, {}}) {}

    // Movable but not copyable (to avoid accidental copies of large values)
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    // ====================================================================
    // State Queries
    // ====================================================================

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }
    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    // ====================================================================
    // Value Access
    // ====================================================================

    /**
     * @brief Get the success content (mutable reference)
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    // ====================================================================
    // Error Access
    // ====================================================================

    /**
     * @brief Get the error enum value
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] E error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).error_enum;
    }

    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<ErrorData>(m_data).error_code;
    }

    [[nodiscard]] const std::string &error_message() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_message() called on success state");
        }
        return std::get<ErrorData>(m_data).message;
    }

  private:
    struct ErrorData
    {
        E error_enum;
        int error_code;
        std::string message;
    };

    std::variant<T, ErrorData> m_data;
};

/// @brief Result for operations with no success value.
template <typename E> using Status = Result<std::monostate, E>;

} // namespace lgtv::utils
