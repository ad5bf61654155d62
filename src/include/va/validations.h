// Public header for the validations library
#pragma once

#include "va/non_empty.h"
#include "va/validated.h"
#include "va/validator.h"
#include "va/validating.h"
#include "va/builtin.h"
