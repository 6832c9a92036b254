#pragma once
#include <cstdint>
#include <string>

using Timestamp = std::int64_t;  // seconds since the Unix epoch, UTC

constexpr Timestamp SECONDS_PER_DAY = 86400;

// Accepts YYYY-MM-DD, YYYY-MM-DDTHH:MM[:SS][Z] (space also allowed as the
// separator) or integer epoch seconds. Throws ValidationError.
Timestamp parse_timestamp(const std::string& text);

std::string format_timestamp(Timestamp t, const std::string& fmt);
