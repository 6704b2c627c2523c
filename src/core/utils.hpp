#pragma once

#include <string>
#include <cstdint>
#include "types.hpp"

// Parse a decimal number ("25.00", "-1.5e2"). The whole string must be consumed.
Result<double> parse_decimal(const std::string& s);

// Parse a base-10 integer. The whole string must be consumed.
Result<int64_t> parse_integer(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
