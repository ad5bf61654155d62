#pragma once

#include <cstddef>
#include <string>

#include "va/validator.h"

namespace va {

// How matchesPattern interprets its pattern.
enum class MatchMode {
    RegularExpression,                 // ECMAScript regex found anywhere in the value
    CaseInsensitiveRegularExpression,  // same, ignoring case
    Literal,                           // plain substring
    CaseInsensitiveLiteral,            // plain substring, ignoring ASCII case
    Anchored                           // regex that must match at the start of the value
};

// Number of Unicode code points in a UTF-8 string. Continuation bytes are
// not counted, so "héllo" has 5 characters.
std::size_t characterCount(const std::string& value);

Validator<std::string> beginsWith(std::string prefix);
Validator<std::string> endsWith(std::string suffix);

// Validates the character count; errors are prefixed with "length ".
Validator<std::string> itsLength(const Validator<int>& validator);

// Shorthand for itsLength(isExactly(length)).
Validator<std::string> hasLengthOf(int length);

// Throws std::invalid_argument when 'pattern' is not a valid regular
// expression for the regex based modes.
Validator<std::string> matchesPattern(const std::string& pattern, MatchMode mode = MatchMode::RegularExpression);

Validator<std::string> isEmpty();
Validator<std::string> isNotEmpty();

}  // namespace va
