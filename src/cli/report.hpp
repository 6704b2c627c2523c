#pragma once

#include <string>
#include <core/config.hpp>
#include <core/types.hpp>
#include <quote/quote_provider.hpp>

// Text of the vesting report for one point in time.
// A fully vested grant ends after the "100% vested" line; the remaining
// time is only computed while some shares are still unvested.
std::string render_report(const GrantParameters& grant,
                          const MoneyFormat& money,
                          double price,
                          Instant now);

// Fetch the current price and render the report.
Result<std::string> run_report(const Config& config, QuoteProvider& quotes, Instant now);
