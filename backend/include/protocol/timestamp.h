#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace beacon {

/// UTC ISO-8601 with millisecond precision, e.g. "2025-03-01T08:15:30.250Z".
std::string format_iso8601(std::chrono::system_clock::time_point tp);

/// Accepts "YYYY-MM-DDTHH:MM:SS" with optional fractional seconds and an
/// optional "Z" or "+HH:MM" / "-HH:MM" suffix. A missing zone is read as UTC.
std::optional<std::chrono::system_clock::time_point> parse_iso8601(std::string_view text);

} // namespace beacon
