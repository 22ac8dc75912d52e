#pragma once
#include "test.hpp"
#include "type_traits.hpp"
#include <array>
#include <charconv>
#include <cstdlib>
#include <limits>
#include <memory>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <typeinfo>

#if !defined(ONECONDITION_DISABLE_DEMANGLE) && defined(__GNUG__)
#include <cxxabi.h>
#endif

namespace oc {

////////////////
// type name
////////////////

[[nodiscard]] inline std::string type_name(const std::type_info& info) {
#if !defined(ONECONDITION_DISABLE_DEMANGLE) && defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled{
        abi::__cxa_demangle(info.name(), nullptr, nullptr, &status),
        &std::free};

    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return info.name();
}

template <typename T>
[[nodiscard]] std::string type_name() {
    return type_name(typeid(T));
}

////////////////
// number repr
////////////////

namespace detail {

template <typename T>
[[nodiscard]] std::string stream_repr(const T& value) {
    std::ostringstream out;
    if constexpr (std::is_floating_point_v<T>) {
        out.precision(std::numeric_limits<T>::max_digits10);
    }
    out << value;
    return out.str();
}

template <typename T>
[[nodiscard]] std::string number_repr(T value) {
    constexpr static auto buff_size = 128;
    std::array<char, buff_size> buff;

    auto to_chars = [&buff](auto number) {
        return std::to_chars(buff.data(), buff.data() + buff.size(), number);
    };

    // widen integers so that character types print as numbers
    using number_type =
        std::conditional_t<std::is_floating_point_v<T>, T,
                           std::conditional_t<std::is_signed_v<T>, long long,
                                              unsigned long long>>;

    auto [ptr, ec] = to_chars(static_cast<number_type>(value));
    if (ec != std::errc()) {
        return stream_repr(value);
    }

    std::string ret{buff.data(), ptr};
    if constexpr (std::is_floating_point_v<T>) {
        // keep whole floating point values apart from integers, 42.0 not 42
        if (ret.find_first_not_of("-0123456789") == std::string::npos) {
            ret.append(".0");
        }
    }
    return ret;
}

} /* namespace detail */

////////////////
// repr
////////////////

// text of a value as it appears inside validation error messages
template <typename T>
[[nodiscard]] std::string repr(const T& value) {
    if constexpr (is_nullable_v<T>) {
        if (test::none(value)) {
            return "None";
        }
    }

    if constexpr (std::is_null_pointer_v<T> ||
                  std::is_same_v<T, std::nullopt_t>) {
        return "None";
    } else if constexpr (std::is_same_v<T, bool>) {
        return value ? "True" : "False";
    } else if constexpr (std::is_same_v<T, char>) {
        return std::string(1, value);
    } else if constexpr (is_string_like_v<T>) {
        return std::string{std::string_view{value}};
    } else if constexpr (std::is_same_v<T, const char*> ||
                         std::is_same_v<T, char*>) {
        return std::string{value};
    } else if constexpr (std::is_arithmetic_v<T>) {
        return detail::number_repr(value);
    } else if constexpr (std::is_enum_v<T>) {
        return repr(static_cast<std::underlying_type_t<T>>(value));
    } else if constexpr (is_optional_v<T>) {
        return repr(*value);
    } else if constexpr (std::is_pointer_v<T> &&
                         !std::is_void_v<std::remove_pointer_t<T>> &&
                         !std::is_function_v<std::remove_pointer_t<T>>) {
        return repr(*value);
    } else if constexpr (std::is_class_v<T> && is_nullable_v<T> &&
                         has_dereference_v<T>) {
        return repr(*value);
    } else if constexpr (has_ostream_insertion_v<T>) {
        return detail::stream_repr(value);
    } else {
        return "<" + type_name(typeid(value)) + " object>";
    }
}

} /* namespace oc */
