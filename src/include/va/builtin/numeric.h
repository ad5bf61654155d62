#pragma once

#include <string>
#include <type_traits>

#include "va/builtin/equatable.h"
#include "va/describe.h"
#include "va/validator.h"

namespace va {

template <typename Value>
Validator<Value> isExactly(Value amount) {
    static_assert(std::is_integral_v<Value>, "isExactly expects an integer type");
    std::string message = "must be exactly " + describe(amount);
    return isEqualTo(amount).mapErrors([message](const std::string&) { return message; });
}

// Any non-zero remainder counts as odd, so negative odd numbers pass too.
// Testing for a remainder of exactly 1 would reject -3.
template <typename Value = int>
Validator<Value> isOdd() {
    static_assert(std::is_integral_v<Value>, "isOdd expects an integer type");
    return Validator<Value>([](const Value& value) {
        if (value % 2 != 0) return Validated<Value, std::string>::valid(value);
        return Validated<Value, std::string>::error("must be odd");
    });
}

template <typename Value = int>
Validator<Value> isEven() {
    static_assert(std::is_integral_v<Value>, "isEven expects an integer type");
    return Validator<Value>([](const Value& value) {
        if (value % 2 == 0) return Validated<Value, std::string>::valid(value);
        return Validated<Value, std::string>::error("must be even");
    });
}

}  // namespace va
