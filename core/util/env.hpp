#pragma once

#include <string>

namespace metatot {

// Environment lookups for config overlays. A missing or empty variable
// yields the fallback; a malformed one is logged and also falls back.

int envInt(const char* name, int fallback);
double envDouble(const char* name, double fallback);
bool envBool(const char* name, bool fallback);
std::string envString(const char* name, const std::string& fallback);

} // namespace metatot
