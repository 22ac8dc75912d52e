#pragma once
#include "exception.hpp"
#include "repr.hpp"
#include "test.hpp"
#include <string>
#include <typeinfo>

namespace oc {
namespace validate {

////////////////
// error messages
////////////////

namespace detail {

// Value '<value>' must [not] be
template <typename T>
[[nodiscard]] std::string value_must_be(const T& value, bool negate) {
    std::string msg{"Value '"};
    msg.append(oc::repr(value)).append("' must ");
    if (negate) {
        msg.append("not ");
    }
    return msg.append("be ");
}

template <typename T>
[[noreturn]] void fail(const T& value, bool negate,
                       const std::string& condition) {
    throw validation_error{value_must_be(value, negate).append(condition)};
}

template <typename T, typename Min, typename Max>
[[noreturn]] void fail_range(const T& value, const Min& minimum,
                             const Max& maximum, bool negate,
                             const char* const bounds) {
    fail(value, negate,
         "between " + oc::repr(minimum) + " and " + oc::repr(maximum) +
             " (" + bounds + ")");
}

template <typename T, typename U>
[[noreturn]] void fail_relation(const T& first, const U& second, bool negate,
                                const char* const relation) {
    fail(first, negate, relation + (" '" + oc::repr(second) + "'"));
}

} /* namespace detail */

////////////////
// none
////////////////

template <typename T>
void none(const T& value) {
    if (!test::none(value)) {
        detail::fail(value, false, "None");
    }
}

template <typename T>
void not_none(const T& value) {
    if (test::none(value)) {
        throw validation_error{"Value must not be None"};
    }
}

////////////////
// specific type
////////////////

template <typename U>
void specific_type(const U& value, const std::type_info& value_type) {
    if (!test::specific_type(value, value_type)) {
        detail::fail(value, false,
                     "of type " + type_name(value_type) + ", not " +
                         type_name(typeid(value)));
    }
}

template <typename T, typename U>
void specific_type(const U& value) {
    specific_type(value, typeid(T));
}

template <typename U>
void not_specific_type(const U& value, const std::type_info& value_type) {
    if (test::specific_type(value, value_type)) {
        detail::fail(value, true, "of type " + type_name(value_type));
    }
}

template <typename T, typename U>
void not_specific_type(const U& value) {
    not_specific_type(value, typeid(T));
}

template <typename U>
void type(const U& value, const std::type_info& value_type) {
    specific_type(value, value_type);
}

template <typename T, typename U>
void type(const U& value) {
    specific_type(value, typeid(T));
}

template <typename U>
void not_type(const U& value, const std::type_info& value_type) {
    not_specific_type(value, value_type);
}

template <typename T, typename U>
void not_type(const U& value) {
    not_specific_type(value, typeid(T));
}

////////////////
// instance
////////////////

template <typename T, typename U>
void instance(const U& value) {
    if (!test::instance<T>(value)) {
        detail::fail(value, false,
                     "an instance of " + type_name<T>() + ", not a " +
                         type_name(typeid(value)));
    }
}

template <typename T, typename U>
void not_instance(const U& value) {
    if (test::instance<T>(value)) {
        detail::fail(value, true, "an instance of " + type_name<T>());
    }
}

////////////////
// sign
////////////////

template <typename T>
void zero(const T& value) {
    if (!test::zero(value)) {
        detail::fail(value, false, "zero");
    }
}

template <typename T>
void not_zero(const T& value) {
    if (test::zero(value)) {
        detail::fail(value, true, "zero");
    }
}

template <typename T>
void positive(const T& value) {
    if (!test::positive(value)) {
        detail::fail(value, false, "positive (non-zero)");
    }
}

template <typename T>
void not_positive(const T& value) {
    if (test::positive(value)) {
        detail::fail(value, true, "positive (non-zero)");
    }
}

template <typename T>
void negative(const T& value) {
    if (!test::negative(value)) {
        detail::fail(value, false, "negative (non-zero)");
    }
}

template <typename T>
void not_negative(const T& value) {
    if (test::negative(value)) {
        detail::fail(value, true, "negative (non-zero)");
    }
}

////////////////
// range
////////////////

template <typename T, typename Min, typename Max>
void range_inclusive(const T& value, const Min& minimum, const Max& maximum) {
    if (!test::range_inclusive(value, minimum, maximum)) {
        detail::fail_range(value, minimum, maximum, false, "inclusive");
    }
}

template <typename T, typename Min, typename Max>
void not_range_inclusive(const T& value, const Min& minimum,
                         const Max& maximum) {
    if (test::range_inclusive(value, minimum, maximum)) {
        detail::fail_range(value, minimum, maximum, true, "inclusive");
    }
}

template <typename T, typename Min, typename Max>
void range_non_inclusive(const T& value, const Min& minimum,
                         const Max& maximum) {
    if (!test::range_non_inclusive(value, minimum, maximum)) {
        detail::fail_range(value, minimum, maximum, false, "non-inclusive");
    }
}

template <typename T, typename Min, typename Max>
void not_range_non_inclusive(const T& value, const Min& minimum,
                             const Max& maximum) {
    if (test::range_non_inclusive(value, minimum, maximum)) {
        detail::fail_range(value, minimum, maximum, true, "non-inclusive");
    }
}

////////////////
// equal to
////////////////

template <typename T, typename U>
void eq(const T& first, const U& second) {
    if (!test::eq(first, second)) {
        detail::fail_relation(first, second, false, "equal to");
    }
}

template <typename T, typename U>
void neq(const T& first, const U& second) {
    if (test::eq(first, second)) {
        detail::fail_relation(first, second, true, "equal to");
    }
}

////////////////
// greater than
// greater than or equal to
////////////////

template <typename T, typename U>
void gt(const T& first, const U& second) {
    if (!test::gt(first, second)) {
        detail::fail_relation(first, second, false, "greater than");
    }
}

template <typename T, typename U>
void not_gt(const T& first, const U& second) {
    if (test::gt(first, second)) {
        detail::fail_relation(first, second, true, "greater than");
    }
}

template <typename T, typename U>
void gte(const T& first, const U& second) {
    if (!test::gte(first, second)) {
        detail::fail_relation(first, second, false,
                              "greater than or equal to");
    }
}

template <typename T, typename U>
void not_gte(const T& first, const U& second) {
    if (test::gte(first, second)) {
        detail::fail_relation(first, second, true, "greater than or equal to");
    }
}

////////////////
// less than
// less than or equal to
////////////////

template <typename T, typename U>
void lt(const T& first, const U& second) {
    if (!test::lt(first, second)) {
        detail::fail_relation(first, second, false, "less than");
    }
}

template <typename T, typename U>
void not_lt(const T& first, const U& second) {
    if (test::lt(first, second)) {
        detail::fail_relation(first, second, true, "less than");
    }
}

template <typename T, typename U>
void lte(const T& first, const U& second) {
    if (!test::lte(first, second)) {
        detail::fail_relation(first, second, false, "less than or equal to");
    }
}

template <typename T, typename U>
void not_lte(const T& first, const U& second) {
    if (test::lte(first, second)) {
        detail::fail_relation(first, second, true, "less than or equal to");
    }
}

} /* namespace validate */
} /* namespace oc */
