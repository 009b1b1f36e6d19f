#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

#include "core/error_code.hpp"

namespace rally {

/**
 * Error - a failure with a taxonomy code and a human-readable message.
 */
struct Error {
    std::string message;
    ErrorCode code{ErrorCode::None};

    Error() = default;
    explicit Error(std::string msg, ErrorCode c = ErrorCode::None)
        : message(std::move(msg)), code(c) {}

    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }
};

[[nodiscard]] inline Error make_error(ErrorCode code, std::string message) {
    return Error{std::move(message), code};
}

namespace detail {

template<typename E>
[[noreturn]] void throw_unwrap_error(const E& error) {
    if constexpr (std::is_same_v<E, Error>) {
        throw std::runtime_error("Result::unwrap() called on error: " +
                                 std::string(error_code_name(error.code)) + ": " + error.message);
    } else {
        throw std::runtime_error("Result::unwrap() called on error");
    }
}

[[noreturn]] inline void throw_unwrap_err_on_ok() {
    throw std::runtime_error("Result::unwrap_err() called on success");
}

} // namespace detail

/**
 * Result<T, E> - either a value (ok) or an error (err).
 *
 *   Result<int> parse_port(const QString& s);
 *   auto port = parse_port(text)
 *       .and_then([](int p) { return check_range(p); })
 *       .value_or(0);
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    /**
     * Access the value. Throws std::runtime_error when this holds an error,
     * so callers check is_ok() first outside of tests.
     */
    [[nodiscard]] T& unwrap() & {
        if (is_err()) detail::throw_unwrap_error(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) detail::throw_unwrap_error(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) detail::throw_unwrap_error(std::get<1>(data_));
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) detail::throw_unwrap_err_on_ok();
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) detail::throw_unwrap_err_on_ok();
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    [[nodiscard]] T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(data_)) : std::move(fallback);
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_err()) return Result<U, E>::err(std::get<1>(data_));
        if constexpr (std::is_void_v<U>) {
            std::invoke(std::forward<F>(f), std::get<0>(data_));
            return Result<void, E>::ok();
        } else {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
    }

    /**
     * map_err : Result<T, E> -> (E -> F) -> Result<T, F>
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (is_err()) return Result<T, NewE>::err(std::invoke(std::forward<F>(f), std::get<1>(data_)));
        return Result<T, NewE>::ok(std::get<0>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_err()) return ResultU::err(std::get<1>(data_));
        return std::invoke(std::forward<F>(f), std::get<0>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_err()) return ResultU::err(std::get<1>(std::move(data_)));
        return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
    }

    /**
     * or_else : Result<T, E> -> (E -> Result<T, E>) -> Result<T, E>
     */
    template<typename F>
    [[nodiscard]] Result or_else(F&& f) const& {
        if (is_ok()) return *this;
        return std::invoke(std::forward<F>(f), std::get<1>(data_));
    }

    template<typename F>
    const Result& inspect(F&& f) const& {
        if (is_ok()) std::invoke(std::forward<F>(f), std::get<0>(data_));
        return *this;
    }

    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) std::invoke(std::forward<F>(f), std::get<1>(data_));
        return *this;
    }

    template<typename OnOk, typename OnErr>
    auto match(OnOk&& on_ok, OnErr&& on_err) const& {
        if (is_ok()) return std::invoke(std::forward<OnOk>(on_ok), std::get<0>(data_));
        return std::invoke(std::forward<OnErr>(on_err), std::get<1>(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success without a value, or an error.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(); }
    [[nodiscard]] static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return !failed_; }
    [[nodiscard]] bool is_err() const noexcept { return failed_; }

    void unwrap() const {
        if (failed_) detail::throw_unwrap_error(error_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (!failed_) detail::throw_unwrap_err_on_ok();
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (failed_) return ResultU::err(error_);
        return std::invoke(std::forward<F>(f));
    }

    template<typename F>
    [[nodiscard]] Result or_else(F&& f) const {
        if (!failed_) return *this;
        return std::invoke(std::forward<F>(f), error_);
    }

    template<typename F>
    const Result& inspect_err(F&& f) const {
        if (failed_) std::invoke(std::forward<F>(f), error_);
        return *this;
    }

    template<typename OnOk, typename OnErr>
    auto match(OnOk&& on_ok, OnErr&& on_err) const {
        if (!failed_) return std::invoke(std::forward<OnOk>(on_ok));
        return std::invoke(std::forward<OnErr>(on_err), error_);
    }

private:
    Result() = default;
    explicit Result(E error) : failed_(true), error_(std::move(error)) {}

    bool failed_ = false;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace rally
