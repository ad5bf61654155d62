#include "va/builtin/string.h"
#include "va/builtin/numeric.h"

#include <algorithm>
#include <cctype>
#include <memory>
#include <regex>
#include <stdexcept>

namespace va {

using StringResult = Validated<std::string, std::string>;

static std::string to_lower_ascii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::shared_ptr<const std::regex> compile_pattern(const std::string& pattern, bool ignoreCase) {
    auto flags = std::regex::ECMAScript;
    if (ignoreCase) flags |= std::regex::icase;
    try {
        return std::make_shared<const std::regex>(pattern, flags);
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("invalid pattern '" + pattern + "': " + e.what());
    }
}

std::size_t characterCount(const std::string& value) {
    std::size_t count = 0;
    for (unsigned char c : value) {
        if ((c & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

Validator<std::string> beginsWith(std::string prefix) {
    return Validator<std::string>([prefix = std::move(prefix)](const std::string& value) {
        if (value.compare(0, prefix.size(), prefix) == 0) return StringResult::valid(value);
        return StringResult::error("must begin with '" + prefix + "'");
    });
}

Validator<std::string> endsWith(std::string suffix) {
    return Validator<std::string>([suffix = std::move(suffix)](const std::string& value) {
        if (value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0) {
            return StringResult::valid(value);
        }
        return StringResult::error("must end with '" + suffix + "'");
    });
}

Validator<std::string> itsLength(const Validator<int>& validator) {
    return validator
        .pullback<std::string>([](const std::string& s) { return static_cast<int>(characterCount(s)); })
        .mapErrors([](const std::string& error) { return "length " + error; });
}

Validator<std::string> hasLengthOf(int length) {
    return itsLength(isExactly(length));
}

Validator<std::string> matchesPattern(const std::string& pattern, MatchMode mode) {
    switch (mode) {
        case MatchMode::Literal:
            return Validator<std::string>([pattern](const std::string& value) {
                if (value.find(pattern) != std::string::npos) return StringResult::valid(value);
                return StringResult::error("must match pattern");
            });
        case MatchMode::CaseInsensitiveLiteral: {
            std::string needle = to_lower_ascii(pattern);
            return Validator<std::string>([needle](const std::string& value) {
                if (to_lower_ascii(value).find(needle) != std::string::npos) return StringResult::valid(value);
                return StringResult::error("must match pattern");
            });
        }
        case MatchMode::RegularExpression:
        case MatchMode::CaseInsensitiveRegularExpression:
        case MatchMode::Anchored:
            break;
    }

    auto re = compile_pattern(pattern, mode == MatchMode::CaseInsensitiveRegularExpression);
    auto flags = (mode == MatchMode::Anchored) ? std::regex_constants::match_continuous
                                               : std::regex_constants::match_default;
    return Validator<std::string>([re, flags](const std::string& value) {
        if (std::regex_search(value, *re, flags)) return StringResult::valid(value);
        return StringResult::error("must match pattern");
    });
}

Validator<std::string> isEmpty() {
    return Validator<std::string>([](const std::string& value) {
        if (value.empty()) return StringResult::valid(value);
        return StringResult::error("must be empty");
    });
}

Validator<std::string> isNotEmpty() {
    return isEmpty().negated("must not be empty");
}

}  // namespace va
