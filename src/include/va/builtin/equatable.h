#pragma once

#include <string>

#include "va/describe.h"
#include "va/validator.h"

namespace va {

template <typename Value>
Validator<Value> isEqualTo(Value other) {
    return Validator<Value>([other](const Value& value) {
        if (value == other) return Validated<Value, std::string>::valid(value);
        return Validated<Value, std::string>::error("must be equal to '" + describe(other) + "'");
    });
}

}  // namespace va
