#pragma once

#include <algorithm>
#include <initializer_list>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

#include "va/describe.h"
#include "va/validator.h"

namespace va {

// Membership in a list. The error names the list: "must be included in [1, 2, 3]".
template <typename Value>
Validator<Value> isIncluded(std::vector<Value> list) {
    std::string message = "must be included in " + describe(list);
    return Validator<Value>([list = std::move(list), message](const Value& value) {
        if (std::find(list.begin(), list.end(), value) != list.end()) {
            return Validated<Value, std::string>::valid(value);
        }
        return Validated<Value, std::string>::error(message);
    });
}

template <typename Value>
Validator<Value> isIncluded(std::initializer_list<Value> list) {
    return isIncluded(std::vector<Value>(list));
}

template <typename Value>
Validator<Value> isExcluded(std::vector<Value> list) {
    std::string message = "must be excluded from " + describe(list);
    return isIncluded(std::move(list)).negated(message);
}

template <typename Value>
Validator<Value> isExcluded(std::initializer_list<Value> list) {
    return isExcluded(std::vector<Value>(list));
}

// Set membership. Sets are unordered in spirit, so the error does not list them.
template <typename Value>
Validator<Value> isIncluded(std::set<Value> set) {
    return Validator<Value>([set = std::move(set)](const Value& value) {
        if (set.count(value) != 0) return Validated<Value, std::string>::valid(value);
        return Validated<Value, std::string>::error("must be included in set");
    });
}

template <typename Value>
Validator<Value> isIncluded(std::unordered_set<Value> set) {
    return Validator<Value>([set = std::move(set)](const Value& value) {
        if (set.count(value) != 0) return Validated<Value, std::string>::valid(value);
        return Validated<Value, std::string>::error("must be included in set");
    });
}

template <typename Value>
Validator<Value> isExcluded(std::set<Value> set) {
    return isIncluded(std::move(set)).negated("must be excluded from set");
}

template <typename Value>
Validator<Value> isExcluded(std::unordered_set<Value> set) {
    return isIncluded(std::move(set)).negated("must be excluded from set");
}

}  // namespace va
