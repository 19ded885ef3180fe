#pragma once

#include <chrono>
#include <string>

namespace metatot {

/// Random RFC 4122 version-4 UUID, lowercase hex with dashes.
std::string generateUuid();

/// ISO-8601 UTC timestamp with millisecond precision ("2026-01-02T03:04:05.678Z").
std::string formatTimestamp(std::chrono::system_clock::time_point tp);

} // namespace metatot
