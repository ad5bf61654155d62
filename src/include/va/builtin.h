#pragma once

// Catalog of ready-made validators. Each one returns the input unchanged on
// success and a single human-readable error otherwise.

#include "va/builtin/bool.h"
#include "va/builtin/collection.h"
#include "va/builtin/comparable.h"
#include "va/builtin/element.h"
#include "va/builtin/equatable.h"
#include "va/builtin/numeric.h"
#include "va/builtin/string.h"
