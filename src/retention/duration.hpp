#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace keepsake {

/**
 * Parse a duration such as "1h30m", "1.5h", "90s" or "-2m".
 *
 * The text is an optional sign followed by one or more decimal numbers, each
 * with a unit suffix: ns, us (or µs), ms, s, m, h. A bare "0" is accepted.
 * Returns nullopt for malformed text or values beyond the nanosecond range.
 */
std::optional<std::chrono::nanoseconds> parseDuration(const std::string &text);

// Render whole seconds compactly: 45 -> "45s", 90 -> "1m30s", 3600 -> "1h",
// 5400 -> "1h30m", 3605 -> "1h0m5s". The output is accepted by parseDuration.
std::string formatDuration(long long seconds);

} // namespace keepsake
