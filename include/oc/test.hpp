#pragma once
#include "common.hpp"
#include "type_traits.hpp"
#include <memory>
#include <optional>
#include <type_traits>
#include <typeinfo>

namespace oc {
namespace test {

////////////////
// none
////////////////

template <typename T>
[[nodiscard]] bool none(const T& value) {
    if constexpr (std::is_null_pointer_v<T> ||
                  std::is_same_v<T, std::nullopt_t>) {
        return true;
    } else if constexpr (is_optional_v<T>) {
        return !value.has_value();
    } else if constexpr (is_nullable_v<T>) {
        return value == nullptr;
    } else {
        return false;
    }
}

////////////////
// specific type
////////////////

// compares the type tag of the value, which is the dynamic type for
// polymorphic values, derived types do not match
template <typename U>
[[nodiscard]] bool specific_type(const U& value,
                                 const std::type_info& value_type) {
    return typeid(value) == value_type;
}

template <typename T, typename U>
[[nodiscard]] bool specific_type(const U& value) {
    return specific_type(value, typeid(T));
}

template <typename U>
[[nodiscard]] bool type(const U& value, const std::type_info& value_type) {
    return specific_type(value, value_type);
}

template <typename T, typename U>
[[nodiscard]] bool type(const U& value) {
    return specific_type(value, typeid(T));
}

////////////////
// instance
////////////////

// 'T' itself or any type publicly derived from it
template <typename T, typename U>
[[nodiscard]] bool instance(const U& value) {
    static_assert(!std::is_void_v<T>, "cannot test for an instance of void");

    if constexpr (std::is_convertible_v<const U*, const T*>) {
        return true;
    } else if constexpr (std::is_polymorphic_v<U> && std::is_class_v<T>) {
        return dynamic_cast<const T*>(std::addressof(value)) != nullptr;
    } else {
        return false;
    }
}

////////////////
// sign
////////////////

template <typename T>
[[nodiscard]] bool zero(const T& value) {
    return oc::cmp_equal(value, 0);
}

template <typename T>
[[nodiscard]] bool positive(const T& value) {
    return oc::cmp_greater(value, 0);
}

template <typename T>
[[nodiscard]] bool negative(const T& value) {
    return oc::cmp_less(value, 0);
}

////////////////
// range
////////////////

// an empty range (minimum > maximum) contains nothing
template <typename T, typename Min, typename Max>
[[nodiscard]] bool range_inclusive(const T& value, const Min& minimum,
                                   const Max& maximum) {
    return oc::cmp_less_equal(minimum, value) &&
           oc::cmp_less_equal(value, maximum);
}

template <typename T, typename Min, typename Max>
[[nodiscard]] bool range_non_inclusive(const T& value, const Min& minimum,
                                       const Max& maximum) {
    return oc::cmp_less(minimum, value) && oc::cmp_less(value, maximum);
}

////////////////
// equal to
// greater than
// greater than or equal to
// less than
// less than or equal to
////////////////

template <typename T, typename U>
[[nodiscard]] bool eq(const T& first, const U& second) {
    return oc::cmp_equal(first, second);
}

template <typename T, typename U>
[[nodiscard]] bool gt(const T& first, const U& second) {
    return oc::cmp_greater(first, second);
}

template <typename T, typename U>
[[nodiscard]] bool gte(const T& first, const U& second) {
    return oc::cmp_greater_equal(first, second);
}

template <typename T, typename U>
[[nodiscard]] bool lt(const T& first, const U& second) {
    return oc::cmp_less(first, second);
}

template <typename T, typename U>
[[nodiscard]] bool lte(const T& first, const U& second) {
    return oc::cmp_less_equal(first, second);
}

} /* namespace test */
} /* namespace oc */
