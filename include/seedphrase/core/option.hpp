#pragma once

#include <optional>
#include <type_traits>
#include <utility>

namespace seedphrase {

/// Lookup result that is either present or absent, with no failure reason
template<typename T>
using Option = std::optional<T>;

template<typename T>
[[nodiscard]] constexpr Option<std::decay_t<T>> Some(T&& value) {
    return Option<std::decay_t<T>>{std::forward<T>(value)};
}

template<typename T>
[[nodiscard]] constexpr Option<T> None() noexcept {
    return std::nullopt;
}

} // namespace seedphrase
