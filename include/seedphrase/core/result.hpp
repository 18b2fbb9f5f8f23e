#pragma once

#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace seedphrase {

/// Success value of operations that only report failure
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};

inline constexpr Unit unit{};

/**
 * @brief Either a value of type T or a failure of type E
 *
 * Every fallible operation in the library returns one of these instead of
 * throwing. Callers check IsOk()/IsErr() before unwrapping; unwrapping the
 * wrong side throws std::logic_error.
 *
 * @example
 * ```cpp
 * auto words = codec.ToMnemonic(entropy);
 * if (words.IsErr()) {
 *     return Result<Seed, MnemonicFailure>::Err(std::move(words).UnwrapErr());
 * }
 * const std::string& sentence = words.Unwrap();
 * ```
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<VALUE_INDEX>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<ERROR_INDEX>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return state_.index() == VALUE_INDEX; }

    [[nodiscard]] bool IsErr() const noexcept { return state_.index() == ERROR_INDEX; }

    [[nodiscard]] T& Unwrap() & {
        RequireValue();
        return std::get<VALUE_INDEX>(state_);
    }

    [[nodiscard]] const T& Unwrap() const& {
        RequireValue();
        return std::get<VALUE_INDEX>(state_);
    }

    [[nodiscard]] T&& Unwrap() && {
        RequireValue();
        return std::get<VALUE_INDEX>(std::move(state_));
    }

    [[nodiscard]] const E& UnwrapErr() const& {
        RequireError();
        return std::get<ERROR_INDEX>(state_);
    }

    [[nodiscard]] E&& UnwrapErr() && {
        RequireError();
        return std::get<ERROR_INDEX>(std::move(state_));
    }

    /// Value on success, @p fallback otherwise
    [[nodiscard]] T UnwrapOr(T fallback) && {
        if (IsErr()) {
            return fallback;
        }
        return std::get<VALUE_INDEX>(std::move(state_));
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using Mapped = Result<std::invoke_result_t<F, T>, E>;
        if (IsErr()) {
            return Mapped::Err(std::get<ERROR_INDEX>(std::move(state_)));
        }
        return Mapped::Ok(std::forward<F>(func)(std::get<VALUE_INDEX>(std::move(state_))));
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using Mapped = Result<T, std::invoke_result_t<F, E>>;
        if (IsOk()) {
            return Mapped::Ok(std::get<VALUE_INDEX>(std::move(state_)));
        }
        return Mapped::Err(std::forward<F>(func)(std::get<ERROR_INDEX>(std::move(state_))));
    }

private:
    static constexpr std::size_t VALUE_INDEX = 0;
    static constexpr std::size_t ERROR_INDEX = 1;

    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg)
        : state_(index, std::forward<Arg>(arg)) {}

    void RequireValue() const {
        if (IsErr()) {
            throw std::logic_error("Result::Unwrap() called on a failed result");
        }
    }

    void RequireError() const {
        if (IsOk()) {
            throw std::logic_error("Result::UnwrapErr() called on a successful result");
        }
    }

    std::variant<T, E> state_;
};

} // namespace seedphrase
