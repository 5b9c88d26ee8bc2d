#pragma once

#include "core/errors.hpp"
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace daybook {

/**
 * Thrown by unwrap()/unwrap_err() on the wrong side of a Result. Production
 * code branches on is_ok()/is_err() instead; tests unwrap freely.
 */
class BadResultAccess : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

namespace detail {

// "IO: disk full" for the kinded errors, the bare message for storage errors.
template<typename E>
std::string describe_error(const E& error) {
    if constexpr (requires { to_string(error.kind); }) {
        return std::string(to_string(error.kind)) + ": " + error.message;
    } else if constexpr (requires { error.message; }) {
        return error.message;
    } else {
        return "error";
    }
}

template<typename E>
[[noreturn]] void throw_unwrap_on_error(const E& error) {
    throw BadResultAccess("unwrap() on error result (" + describe_error(error) + ")");
}

[[noreturn]] inline void throw_unwrap_err_on_ok() {
    throw BadResultAccess("unwrap_err() on ok result");
}

} // namespace detail

/**
 * Result<T, E> - value or error, returned by every fallible call.
 *
 * Storage returns Result<T, Error>; repositories lift that to
 * RepositoryError and the sync engine reports SyncError. Chains use
 * and_then/map; callbacks that only need a fallback use value_or.
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

    [[nodiscard]] bool is_ok() const noexcept { return state_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return state_.index() == 1; }

    [[nodiscard]] T& unwrap() & {
        if (is_err()) detail::throw_unwrap_on_error(std::get<1>(state_));
        return std::get<0>(state_);
    }

    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) detail::throw_unwrap_on_error(std::get<1>(state_));
        return std::get<0>(state_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) detail::throw_unwrap_on_error(std::get<1>(state_));
        return std::get<0>(std::move(state_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) detail::throw_unwrap_err_on_ok();
        return std::get<1>(state_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) detail::throw_unwrap_err_on_ok();
        return std::get<1>(state_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(state_) : std::move(fallback);
    }

    [[nodiscard]] T value_or(T fallback) && {
        return is_ok() ? std::get<0>(std::move(state_)) : std::move(fallback);
    }

    /**
     * Result<U, E> holding f(value), or the same error.
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using Mapped = Result<std::invoke_result_t<F, const T&>, E>;
        if (is_err()) return Mapped::err(std::get<1>(state_));
        return Mapped::ok(std::invoke(std::forward<F>(f), std::get<0>(state_)));
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using Mapped = Result<std::invoke_result_t<F, T>, E>;
        if (is_err()) return Mapped::err(std::get<1>(std::move(state_)));
        return Mapped::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(state_))));
    }

    /**
     * f(value) when ok; f must itself return a Result with error type E.
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using Next = std::invoke_result_t<F, const T&>;
        if (is_err()) return Next::err(std::get<1>(state_));
        return std::invoke(std::forward<F>(f), std::get<0>(state_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        if (is_err()) return Next::err(std::get<1>(std::move(state_)));
        return std::invoke(std::forward<F>(f), std::get<0>(std::move(state_)));
    }

    template<typename F>
    [[nodiscard]] auto or_else(F&& f) const& -> std::invoke_result_t<F, const E&> {
        using Recovered = std::invoke_result_t<F, const E&>;
        if (is_ok()) return Recovered::ok(std::get<0>(state_));
        return std::invoke(std::forward<F>(f), std::get<1>(state_));
    }

    template<typename F>
    const Result& inspect(F&& f) const& {
        if (is_ok()) std::invoke(std::forward<F>(f), std::get<0>(state_));
        return *this;
    }

    template<typename OnOk, typename OnErr>
    [[nodiscard]] auto match(OnOk&& on_ok, OnErr&& on_err) const& {
        if (is_ok()) return std::invoke(std::forward<OnOk>(on_ok), std::get<0>(state_));
        return std::invoke(std::forward<OnErr>(on_err), std::get<1>(state_));
    }

private:
    template<size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg) : state_(index, std::forward<Arg>(arg)) {}

    // Index 0 holds the value, index 1 the error; T and E may be the same type.
    std::variant<T, E> state_;
};

/**
 * Result<void, E> - success carries nothing; used for writes and pushes.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(std::nullopt); }
    [[nodiscard]] static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }

    void unwrap() const {
        if (error_) detail::throw_unwrap_on_error(*error_);
    }

    [[nodiscard]] E& unwrap_err() & {
        if (!error_) detail::throw_unwrap_err_on_ok();
        return *error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (!error_) detail::throw_unwrap_err_on_ok();
        return *error_;
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) const -> Result<std::invoke_result_t<F>, E> {
        using U = std::invoke_result_t<F>;
        if (error_) return Result<U, E>::err(*error_);
        if constexpr (std::is_void_v<U>) {
            std::invoke(std::forward<F>(f));
            return Result<void, E>::ok();
        } else {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f)));
        }
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using Next = std::invoke_result_t<F>;
        if (error_) return Next::err(*error_);
        return std::invoke(std::forward<F>(f));
    }

    template<typename F>
    [[nodiscard]] auto or_else(F&& f) const -> std::invoke_result_t<F, const E&> {
        if (error_) return std::invoke(std::forward<F>(f), *error_);
        return std::invoke_result_t<F, const E&>::ok();
    }

private:
    explicit Result(std::optional<E> error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

} // namespace daybook
