#pragma once

#include <string>
#include <cstdint>
#include "types.hpp"

// Round half away from zero: 2.5 -> 3, -2.5 -> -3, 2.4 -> 2.
int64_t round_half_away_from_zero(double x);

// Split a non-negative number of seconds into years, months (30 days) and days.
// Days are never reported as 30 or more; they roll over into a month.
RemainingDuration decompose_remaining(int64_t secs_to_go);

// Render remaining time as " 1 year 2 months 3 days". Zero fields are omitted,
// so 0 seconds (or anything under a day) renders as "".
std::string format_remaining(int64_t secs_to_go);

// Parse an RFC 3339 timestamp (YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM)).
Result<Instant> parse_rfc3339(const std::string& text);

// Format an instant as UTC "YYYY-MM-DDTHH:MM:SSZ" (log output).
std::string format_rfc3339(Instant t);
