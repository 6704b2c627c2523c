#pragma once

#include <string>
#include <chrono>
#include <cstdint>
#include <utility>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

using Clock = std::chrono::system_clock;
using Instant = Clock::time_point;

// How money amounts are rendered ("$1,234.56")
struct MoneyFormat {
    std::string symbol = "$";
    int precision = 2;
    std::string thousand = ",";
    std::string decimal = ".";
};

// A single stock grant and its vesting window
struct GrantParameters {
    std::string ticker;
    int64_t total_shares = 1;
    int64_t shares_sold = 0;          // not checked against total_shares
    double strike_price = 0.0;
    Instant vest_start;
    Instant vest_end;                 // strictly after vest_start
};

// Latest price for a ticker as returned by the quote provider
struct Quote {
    std::string symbol;
    double price = 0.0;
    std::string latest_trading_day;   // informational only
};

// Vesting figures computed for one point in time.
// portion_done is raw: below 0 before vest_start, above 1 after vest_end.
struct VestingReport {
    double portion_done = 0.0;
    double vested_shares = 0.0;
    double unvested_shares = 0.0;
    double vested_unsold_shares = 0.0;
    double per_share_value = 0.0;     // current price minus strike, may be negative
    double total_unsold_value = 0.0;  // all shares, vested or not

    bool fully_vested() const { return portion_done >= 1.0; }

    int64_t percent_vested() const { return static_cast<int64_t>(portion_done * 100); }

    double vested_unsold_value() const { return vested_unsold_shares * per_share_value; }

    // What leaving today gives up
    double forfeit_value() const { return unvested_shares * per_share_value; }
};

// Remaining time split into calendar-like fields (12 months/year, 30 days/month)
struct RemainingDuration {
    int64_t seconds = 0;
    int64_t years = 0;
    int64_t months = 0;   // 0..12, 360-364 days stay as 12 months
    int64_t days = 0;     // 0..29
};
