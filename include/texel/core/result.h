// texel - image asset loading for engine pipelines
// Copyright (c) 2025 texel Contributors
// SPDX-License-Identifier: MIT OR Apache-2.0

#pragma once

#include <source_location>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace texel::core {

// Error class - represents failures with context
class Error {
public:
    std::string Message;
    std::source_location Location;

    Error(std::string message,
          std::source_location location = std::source_location::current())
        : Message(std::move(message)), Location(location) {}

    const char* What() const noexcept { return Message.c_str(); }

    // Prefixes the message, keeping the original location
    Error WithContext(const std::string& context) const {
        return Error(context + ": " + Message, Location);
    }
};

// Helper to create errors
inline Error MakeError(const std::string& message,
                       std::source_location location = std::source_location::current()) {
    return Error(message, location);
}

namespace detail {

template<typename E>
std::string DescribeError(const E& error) {
    if constexpr (std::is_same_v<E, Error>) {
        return error.Message;
    } else {
        return error.Message();
    }
}

} // namespace detail

/**
 * @brief Value-or-error return type.
 *
 * E defaults to Error (message + source location). Domain errors (TextureError,
 * ImageLoaderError, ...) plug in as E and must expose `std::string Message() const`.
 *
 * Usage:
 *   Result<int> foo() {
 *     if (failed) return Result<int>::Err("error message");
 *     return Result<int>::Ok(42);
 *   }
 */
template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    using ValueType = T;
    using ErrorType = E;

    // Constructors
    Result(T value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : data_(std::in_place_index<1>, std::move(error)) {}

    // Factory methods
    static Result Ok(T value) { return Result(std::move(value)); }
    static Result Err(E error) { return Result(std::move(error)); }
    static Result Err(const std::string& message)
        requires std::is_same_v<E, Error>
    {
        return Result(MakeError(message));
    }

    // Check state
    bool IsOk() const noexcept { return data_.index() == 0; }
    bool IsErr() const noexcept { return data_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    // Access value (throws if error)
    T& Value() & {
        if (IsErr()) {
            throw std::runtime_error(detail::DescribeError(GetError()));
        }
        return std::get<0>(data_);
    }

    T&& Value() && {
        if (IsErr()) {
            throw std::runtime_error(detail::DescribeError(GetError()));
        }
        return std::get<0>(std::move(data_));
    }

    const T& Value() const & {
        if (IsErr()) {
            throw std::runtime_error(detail::DescribeError(GetError()));
        }
        return std::get<0>(data_);
    }

    // Access error (undefined if ok)
    E& GetError() & { return std::get<1>(data_); }
    const E& GetError() const & { return std::get<1>(data_); }
    E&& GetError() && { return std::get<1>(std::move(data_)); }

    // Get value or default
    T ValueOr(T default_value) const & {
        return IsOk() ? Value() : std::move(default_value);
    }

    T ValueOr(T default_value) && {
        return IsOk() ? std::move(*this).Value() : std::move(default_value);
    }

    // Unwrap (throws on error)
    T Unwrap() && {
        if (IsErr()) {
            throw std::runtime_error(detail::DescribeError(GetError()));
        }
        return std::get<0>(std::move(data_));
    }

    // Expect with custom message
    T Expect(const std::string& message) && {
        if (IsErr()) {
            throw std::runtime_error(message + ": " + detail::DescribeError(GetError()));
        }
        return std::get<0>(std::move(data_));
    }

    // Map the value if Ok
    template<typename F>
    auto Map(F&& func) && -> Result<std::invoke_result_t<F, T&&>, E> {
        using U = std::invoke_result_t<F, T&&>;
        if (IsOk()) {
            return Result<U, E>::Ok(func(std::get<0>(std::move(data_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(data_)));
    }

    // Map the error if Err
    template<typename F>
    auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E&&>> {
        using U = std::invoke_result_t<F, E&&>;
        if (IsErr()) {
            return Result<T, U>::Err(func(std::get<1>(std::move(data_))));
        }
        return Result<T, U>::Ok(std::get<0>(std::move(data_)));
    }

    // Add context to error
    Result WithContext(const std::string& context) &&
        requires std::is_same_v<E, Error>
    {
        if (IsErr()) {
            return Result::Err(GetError().WithContext(context));
        }
        return std::move(*this);
    }
};

// Specialization for Result<void>
template<typename E>
class Result<void, E> {
private:
    std::variant<std::monostate, E> data_;

public:
    using ValueType = void;
    using ErrorType = E;

    // Constructors
    Result() : data_(std::monostate{}) {}
    Result(E error) : data_(std::move(error)) {}

    // Factory methods
    static Result Ok() { return Result(); }
    static Result Err(E error) { return Result(std::move(error)); }
    static Result Err(const std::string& message)
        requires std::is_same_v<E, Error>
    {
        return Result(MakeError(message));
    }

    // Check state
    bool IsOk() const noexcept { return std::holds_alternative<std::monostate>(data_); }
    bool IsErr() const noexcept { return std::holds_alternative<E>(data_); }
    explicit operator bool() const noexcept { return IsOk(); }

    // Access error (undefined if ok)
    E& GetError() & { return std::get<E>(data_); }
    const E& GetError() const & { return std::get<E>(data_); }
    E&& GetError() && { return std::get<E>(std::move(data_)); }

    // Unwrap (throws on error)
    void Unwrap() const {
        if (IsErr()) {
            throw std::runtime_error(detail::DescribeError(GetError()));
        }
    }

    // Expect with custom message
    void Expect(const std::string& message) const {
        if (IsErr()) {
            throw std::runtime_error(message + ": " + detail::DescribeError(GetError()));
        }
    }

    // Add context to error
    Result WithContext(const std::string& context) &&
        requires std::is_same_v<E, Error>
    {
        if (IsErr()) {
            return Result::Err(GetError().WithContext(context));
        }
        return std::move(*this);
    }
};

} // namespace texel::core
