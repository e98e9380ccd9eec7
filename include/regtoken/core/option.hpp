#pragma once
#include <optional>
#include <type_traits>
#include <utility>
namespace regtoken {
template<typename T>
using Option = std::optional<T>;
template<typename T>
[[nodiscard]] constexpr Option<std::decay_t<T>> Some(T&& value) {
    return Option<std::decay_t<T>>{std::forward<T>(value)};
}
template<typename T>
[[nodiscard]] constexpr Option<T> None() {
    return std::nullopt;
}
}
