#pragma once
#include "type_traits.hpp"
#include <type_traits>

namespace oc {

////////////////
// sign aware comparison
////////////////

// integers of different signedness compare by their mathematical value,
// everything else uses the operators of the compared types, so a NaN
// operand makes every comparison false
template <typename T, typename U>
constexpr bool mixed_sign_v =
    is_safe_integral_v<T> && is_safe_integral_v<U> &&
    (std::is_signed_v<T> != std::is_signed_v<U>);

template <typename T, typename U>
[[nodiscard]] constexpr bool cmp_equal(const T& t, const U& u) {
    if constexpr (mixed_sign_v<T, U>) {
        if constexpr (std::is_signed_v<T>) {
            return t >= 0 && std::make_unsigned_t<T>(t) == u;
        } else {
            return u >= 0 && std::make_unsigned_t<U>(u) == t;
        }
    } else {
        return t == u;
    }
}

template <typename T, typename U>
[[nodiscard]] constexpr bool cmp_less(const T& t, const U& u) {
    if constexpr (mixed_sign_v<T, U>) {
        if constexpr (std::is_signed_v<T>) {
            return t < 0 || std::make_unsigned_t<T>(t) < u;
        } else {
            return u >= 0 && t < std::make_unsigned_t<U>(u);
        }
    } else {
        return t < u;
    }
}

template <typename T, typename U>
[[nodiscard]] constexpr bool cmp_greater(const T& t, const U& u) {
    if constexpr (mixed_sign_v<T, U>) {
        return cmp_less(u, t);
    } else {
        return t > u;
    }
}

template <typename T, typename U>
[[nodiscard]] constexpr bool cmp_less_equal(const T& t, const U& u) {
    if constexpr (mixed_sign_v<T, U>) {
        return !cmp_less(u, t);
    } else {
        return t <= u;
    }
}

template <typename T, typename U>
[[nodiscard]] constexpr bool cmp_greater_equal(const T& t, const U& u) {
    if constexpr (mixed_sign_v<T, U>) {
        return !cmp_less(t, u);
    } else {
        return t >= u;
    }
}

} /* namespace oc */
