#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
namespace arisen::vault {

/// Value type for operations that succeed without producing anything
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};

/**
 * @brief Value or failure returned by every fallible vault operation
 *
 * Unwrap on an Err (or UnwrapErr on an Ok) is a programming error and throws
 * std::logic_error; callers check IsOk / IsErr first.
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    static Result Ok(T value) {
        return Result(std::in_place_index<kValue>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<kError>, std::move(error));
    }
    static Result FromOptional(std::optional<T> value, E error_if_empty) {
        if (!value.has_value()) {
            return Err(std::move(error_if_empty));
        }
        return Ok(std::move(*value));
    }

    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result() = default;

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == kValue; }
    [[nodiscard]] bool IsErr() const noexcept { return state_.index() == kError; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<kValue>(state_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<kValue>(state_);
    }
    [[nodiscard]] T&& Unwrap() && {
        RequireOk();
        return std::get<kValue>(std::move(state_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<kError>(state_);
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<kError>(state_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        RequireErr();
        return std::get<kError>(std::move(state_));
    }

    [[nodiscard]] T UnwrapOr(T fallback) && {
        return IsOk() ? std::get<kValue>(std::move(state_)) : std::move(fallback);
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using Mapped = Result<T, std::invoke_result_t<F, E>>;
        if (IsOk()) {
            return Mapped::Ok(std::get<kValue>(std::move(state_)));
        }
        return Mapped::Err(std::invoke(std::forward<F>(func), std::get<kError>(std::move(state_))));
    }

    /// Chain another fallible step; the step must fail with the same error type
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind step must fail with the same error type");
        if (IsErr()) {
            return Next::Err(std::get<kError>(std::move(state_)));
        }
        return std::invoke(std::forward<F>(func), std::get<kValue>(std::move(state_)));
    }

private:
    static constexpr std::size_t kValue = 0;
    static constexpr std::size_t kError = 1;

    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg)
        : state_(index, std::forward<Arg>(arg)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
    }
    void RequireErr() const {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
    }

    std::variant<T, E> state_;
};
}
