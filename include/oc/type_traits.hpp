#pragma once
#include <optional>
#include <ostream>
#include <string_view>
#include <type_traits>
#include <utility>

namespace oc {

////////////////
// is optional
////////////////

template <typename T>
struct is_optional : std::false_type {};

template <typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template <typename T>
constexpr bool is_optional_v = is_optional<T>::value;

////////////////
// is string like
////////////////

template <typename T>
struct is_string_like
    : std::bool_constant<std::is_convertible_v<const T&, std::string_view> &&
                         !std::is_pointer_v<T>> {};

template <typename T>
constexpr bool is_string_like_v = is_string_like<T>::value;

////////////////
// has operator
////////////////

#define OC_INIT_HAS_OPERATOR(name, expression)                                 \
    template <typename T>                                                      \
    class has_##name {                                                         \
        template <typename C>                                                  \
        static auto test(int) -> decltype(void(expression), std::true_type{}); \
                                                                               \
        template <typename C>                                                  \
        static std::false_type test(...);                                      \
                                                                               \
    public:                                                                    \
        constexpr static bool value = decltype(test<T>(0))::value;             \
    };                                                                         \
                                                                               \
    template <typename T>                                                      \
    constexpr bool has_##name##_v = has_##name<T>::value;

OC_INIT_HAS_OPERATOR(null_comparison, std::declval<const C&>() == nullptr)
OC_INIT_HAS_OPERATOR(dereference, *std::declval<const C&>())
OC_INIT_HAS_OPERATOR(ostream_insertion,
                     std::declval<std::ostream&>() << std::declval<const C&>())

#undef OC_INIT_HAS_OPERATOR

////////////////
// is nullable
////////////////

// types which can hold an absent value: nullptr, nullopt, pointers,
// optionals and classes testable as bool which compare against nullptr
// (smart pointers, std::function), strings excluded since they only convert
// from a null character pointer
template <typename T>
struct is_nullable
    : std::disjunction<
          std::is_null_pointer<T>, std::is_same<T, std::nullopt_t>,
          std::is_pointer<T>, std::is_member_pointer<T>, is_optional<T>,
          std::bool_constant<std::is_class_v<T> && !is_string_like_v<T> &&
                             std::is_constructible_v<bool, const T&> &&
                             has_null_comparison_v<T>>> {};

template <typename T>
constexpr bool is_nullable_v = is_nullable<T>::value;

////////////////
// is safe integral
////////////////

// integral types which take part in sign aware comparisons
template <typename T>
struct is_safe_integral
    : std::bool_constant<std::is_integral_v<T> && !std::is_same_v<T, bool>> {
};

template <typename T>
constexpr bool is_safe_integral_v = is_safe_integral<T>::value;

} /* namespace oc */
