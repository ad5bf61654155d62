#pragma once

#include <algorithm>
#include <iterator>
#include <string>

#include "va/describe.h"
#include "va/validator.h"

namespace va {

// Validates the element count of a collection, e.g.
// hasLengthOf<std::vector<int>>(isAtLeast(2)).
template <typename Collection, typename Count>
Validator<Collection> hasLengthOf(const Validator<Count>& validator) {
    return validator.template pullback<Collection>(
        [](const Collection& c) { return static_cast<Count>(std::size(c)); });
}

template <typename Collection>
Validator<Collection> contains(typename Collection::value_type element) {
    return Validator<Collection>([element](const Collection& value) {
        if (std::find(std::begin(value), std::end(value), element) != std::end(value)) {
            return Validated<Collection, std::string>::valid(value);
        }
        return Validated<Collection, std::string>::error("must contain " + describe(element));
    });
}

}  // namespace va
