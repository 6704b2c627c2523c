#pragma once

#include <cstdint>

constexpr const char* WORTH_VERSION = "1.0.0";

// ── Calendar ────────────────────────────────────────────────
// Remaining time is reported with fixed-length years and months.
constexpr int64_t DAYS_PER_YEAR = 365;

// ── Quote provider ──────────────────────────────────────────
constexpr const char* ALPHA_VANTAGE_URL    = "https://www.alphavantage.co/query";
constexpr const char* ALPHA_VANTAGE_FUNC   = "GLOBAL_QUOTE";
constexpr long QUOTE_TIMEOUT_SECS          = 10;

// ── Grant defaults ──────────────────────────────────────────
constexpr double DEFAULT_STRIKE_PRICE      = 0.0;
constexpr int64_t DEFAULT_SHARES           = 1;
constexpr int64_t DEFAULT_SHARES_SOLD      = 0;
constexpr const char* DEFAULT_CURRENCY     = "$";
constexpr int DEFAULT_CURRENCY_PRECISION   = 2;
