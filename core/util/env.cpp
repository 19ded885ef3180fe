#include "util/env.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace metatot {

namespace {

const char* lookup(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

void warnMalformed(const char* name, const char* value) {
    Logger::warn("config", std::string("Ignoring malformed ") + name + "=" + value);
}

} // namespace

int envInt(const char* name, int fallback) {
    const char* v = lookup(name);
    if (!v) return fallback;
    try {
        size_t used = 0;
        int parsed = std::stoi(v, &used);
        if (v[used] != '\0') throw std::invalid_argument("trailing characters");
        return parsed;
    } catch (const std::exception&) {
        warnMalformed(name, v);
        return fallback;
    }
}

double envDouble(const char* name, double fallback) {
    const char* v = lookup(name);
    if (!v) return fallback;
    try {
        size_t used = 0;
        double parsed = std::stod(v, &used);
        if (v[used] != '\0') throw std::invalid_argument("trailing characters");
        return parsed;
    } catch (const std::exception&) {
        warnMalformed(name, v);
        return fallback;
    }
}

bool envBool(const char* name, bool fallback) {
    const char* v = lookup(name);
    if (!v) return fallback;
    std::string s = v;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    warnMalformed(name, v);
    return fallback;
}

std::string envString(const char* name, const std::string& fallback) {
    const char* v = lookup(name);
    return v ? std::string(v) : fallback;
}

} // namespace metatot
