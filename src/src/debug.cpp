#include "va/debug.h"

#include <cstdlib>
#include <iostream>

namespace va {
namespace debug {

bool enabled() {
    static const bool on = std::getenv("VA_VALIDATE_DEBUG") != nullptr;
    return on;
}

void log(const std::string& message) {
    if (!enabled()) return;
    std::cerr << "va: " << message << "\n";
}

}  // namespace debug
}  // namespace va
