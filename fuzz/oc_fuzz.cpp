#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <oc/validate.hpp>

template <typename T>
T take(const uint8_t*& data, size_t& size) {
    T value{};
    auto n = std::min(sizeof(T), size);
    std::memcpy(&value, data, n);
    data += n;
    size -= n;
    return value;
}

template <typename Predicate, typename Validator>
void check_duality(bool negated, const char* name, Predicate&& predicate,
                   Validator&& validator) {
    bool holds = predicate();
    bool threw = false;
    try {
        validator();
    } catch (oc::validation_error& e) {
        threw = true;
        if (!e.has_message()) {
            std::cerr << name << ": validation error without message"
                      << std::endl;
            std::abort();
        }
    }

    if (threw != (negated ? holds : !holds)) {
        std::cerr << name << ": validator disagrees with predicate"
                  << std::endl;
        std::abort();
    }
}

#define FUZZ_CHECK(predicate, validator, negated, ...)                         \
    check_duality(                                                             \
        negated, #validator,                                                   \
        [&] { return oc::test::predicate(__VA_ARGS__); },                      \
        [&] { oc::validate::validator(__VA_ARGS__); })

template <typename T, typename U>
void fuzz_values(const T& a, const U& b, const U& c) {
    FUZZ_CHECK(zero, zero, false, a);
    FUZZ_CHECK(zero, not_zero, true, a);
    FUZZ_CHECK(positive, positive, false, a);
    FUZZ_CHECK(positive, not_positive, true, a);
    FUZZ_CHECK(negative, negative, false, a);
    FUZZ_CHECK(negative, not_negative, true, a);

    FUZZ_CHECK(range_inclusive, range_inclusive, false, a, b, c);
    FUZZ_CHECK(range_inclusive, not_range_inclusive, true, a, b, c);
    FUZZ_CHECK(range_non_inclusive, range_non_inclusive, false, a, b, c);
    FUZZ_CHECK(range_non_inclusive, not_range_non_inclusive, true, a, b, c);

    FUZZ_CHECK(eq, eq, false, a, b);
    FUZZ_CHECK(eq, neq, true, a, b);
    FUZZ_CHECK(gt, gt, false, a, b);
    FUZZ_CHECK(gt, not_gt, true, a, b);
    FUZZ_CHECK(gte, gte, false, a, b);
    FUZZ_CHECK(gte, not_gte, true, a, b);
    FUZZ_CHECK(lt, lt, false, a, b);
    FUZZ_CHECK(lt, not_lt, true, a, b);
    FUZZ_CHECK(lte, lte, false, a, b);
    FUZZ_CHECK(lte, not_lte, true, a, b);
}

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto d0 = take<double>(data, size);
    auto d1 = take<double>(data, size);
    auto d2 = take<double>(data, size);
    auto i0 = take<int64_t>(data, size);
    auto u0 = take<uint32_t>(data, size);
    auto u1 = take<uint32_t>(data, size);

    fuzz_values(d0, d1, d2);
    fuzz_values(i0, u0, u1);
    fuzz_values(d0, i0, i0);

    return 0;
}
