#include "va/builtin/bool.h"

namespace va {

Validator<bool> isTrue() {
    return Validator<bool>([](const bool& value) {
        if (value) return Validated<bool, std::string>::valid(value);
        return Validated<bool, std::string>::error("must be true");
    });
}

Validator<bool> isFalse() {
    return isTrue().negated("must be false");
}

}  // namespace va
