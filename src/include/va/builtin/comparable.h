#pragma once

#include <string>

#include "va/describe.h"
#include "va/validator.h"

namespace va {

template <typename Value>
Validator<Value> isGreaterThan(Value lowerBound) {
    return Validator<Value>([lowerBound](const Value& value) {
        if (value > lowerBound) return Validated<Value, std::string>::valid(value);
        return Validated<Value, std::string>::error("must be greater than " + describe(lowerBound));
    });
}

template <typename Value>
Validator<Value> isLessThan(Value upperBound) {
    return Validator<Value>([upperBound](const Value& value) {
        if (value < upperBound) return Validated<Value, std::string>::valid(value);
        return Validated<Value, std::string>::error("must be less than " + describe(upperBound));
    });
}

template <typename Value>
Validator<Value> isAtLeast(Value minimum) {
    return Validator<Value>([minimum](const Value& value) {
        if (value >= minimum) return Validated<Value, std::string>::valid(value);
        return Validated<Value, std::string>::error("must be at least " + describe(minimum));
    });
}

template <typename Value>
Validator<Value> isAtMost(Value maximum) {
    return Validator<Value>([maximum](const Value& value) {
        if (value <= maximum) return Validated<Value, std::string>::valid(value);
        return Validated<Value, std::string>::error("must be at most " + describe(maximum));
    });
}

// Closed range: lower <= value <= upper.
template <typename Value>
Validator<Value> isInRange(Value lower, Value upper) {
    return Validator<Value>([lower, upper](const Value& value) {
        if (lower <= value && value <= upper) return Validated<Value, std::string>::valid(value);
        return Validated<Value, std::string>::error("must be in range " + describe(lower) + "..." + describe(upper));
    });
}

// Half-open range: lower <= value < upper.
template <typename Value>
Validator<Value> isInHalfOpenRange(Value lower, Value upper) {
    return Validator<Value>([lower, upper](const Value& value) {
        if (lower <= value && value < upper) return Validated<Value, std::string>::valid(value);
        return Validated<Value, std::string>::error("must be in range " + describe(lower) + "..<" + describe(upper));
    });
}

}  // namespace va
