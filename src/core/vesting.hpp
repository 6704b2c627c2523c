#pragma once

#include <cstdint>
#include "types.hpp"

// Compute vested fraction and the share/value figures derived from it.
// vest_end must be strictly after vest_start. The fraction is not clamped.
VestingReport compute_vesting_report(Instant now,
                                     Instant vest_start,
                                     Instant vest_end,
                                     int64_t total_shares,
                                     int64_t shares_sold,
                                     double strike_price,
                                     double current_price);

VestingReport compute_vesting_report(const GrantParameters& grant,
                                     double current_price,
                                     Instant now);

// Whole seconds from now until vest_end, rounded half away from zero.
// Negative once vest_end has passed.
int64_t seconds_to_go(Instant now, Instant vest_end);
