#pragma once

#include <chrono>
#include <string>

namespace weave {

using Timestamp = std::chrono::system_clock::time_point;

/// Current wall-clock time truncated to milliseconds, so that every
/// timestamp survives an ISO-8601 round trip unchanged.
Timestamp now();

/// Format as "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC).
std::string toIso8601(Timestamp t);

/// Parse "YYYY-MM-DDTHH:MM:SS[.fff]" followed by "Z" or "+HH:MM"/"-HH:MM".
/// Throws WeaveError on malformed input.
Timestamp fromIso8601(const std::string& text);

/// Hours elapsed from `then` to `reference` (negative if `then` is later).
double hoursBetween(Timestamp then, Timestamp reference);

} // namespace weave
