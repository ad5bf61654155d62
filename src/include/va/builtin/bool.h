#pragma once

#include "va/validator.h"

namespace va {

Validator<bool> isTrue();
Validator<bool> isFalse();

}  // namespace va
