#pragma once

#include <string>

namespace va {
namespace debug {

// True when the VA_VALIDATE_DEBUG environment variable is set. The variable
// is read once, on first use.
bool enabled();

// Writes "va: <message>" to stderr when tracing is enabled.
void log(const std::string& message);

}  // namespace debug
}  // namespace va
