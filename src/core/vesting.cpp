#include "vesting.hpp"
#include "time_utils.hpp"

static double seconds_between(Instant from, Instant to) {
    return std::chrono::duration<double>(to - from).count();
}

VestingReport compute_vesting_report(Instant now,
                                     Instant vest_start,
                                     Instant vest_end,
                                     int64_t total_shares,
                                     int64_t shares_sold,
                                     double strike_price,
                                     double current_price) {
    VestingReport r;
    r.portion_done = seconds_between(vest_start, now) / seconds_between(vest_start, vest_end);

    const double shares = static_cast<double>(total_shares);
    r.vested_shares = shares * r.portion_done;
    r.unvested_shares = shares - r.vested_shares;
    r.vested_unsold_shares = r.vested_shares - static_cast<double>(shares_sold);

    // Take-away value per share after paying the strike
    r.per_share_value = current_price - strike_price;
    r.total_unsold_value = shares * r.per_share_value;
    return r;
}

VestingReport compute_vesting_report(const GrantParameters& grant,
                                     double current_price,
                                     Instant now) {
    return compute_vesting_report(now, grant.vest_start, grant.vest_end,
                                  grant.total_shares, grant.shares_sold,
                                  grant.strike_price, current_price);
}

int64_t seconds_to_go(Instant now, Instant vest_end) {
    return round_half_away_from_zero(seconds_between(now, vest_end));
}
