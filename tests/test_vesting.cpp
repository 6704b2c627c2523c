#include <gtest/gtest.h>
#include <core/vesting.hpp>
#include <core/time_utils.hpp>

using std::chrono::seconds;
using std::chrono::milliseconds;

static constexpr int64_t DAY = 86400;

static Instant at(const std::string& ts) {
    auto r = parse_rfc3339(ts);
    EXPECT_TRUE(r.is_ok()) << r.error;
    return r.value;
}

// Four 365-day years: 2021-01-01 .. 2024-12-31
class VestingTest : public ::testing::Test {
protected:
    Instant start = at("2021-01-01T00:00:00Z");
    Instant end = start + seconds(4 * 365 * DAY);

    VestingReport report_at(Instant now, int64_t shares = 1000, int64_t sold = 0,
                            double strike = 10.0, double price = 25.0) {
        return compute_vesting_report(now, start, end, shares, sold, strike, price);
    }
};

TEST_F(VestingTest, NothingVestedAtStart) {
    auto r = report_at(start);
    EXPECT_DOUBLE_EQ(r.portion_done, 0.0);
    EXPECT_DOUBLE_EQ(r.vested_shares, 0.0);
    EXPECT_DOUBLE_EQ(r.unvested_shares, 1000.0);
    EXPECT_FALSE(r.fully_vested());
}

TEST_F(VestingTest, FullyVestedAtEnd) {
    auto r = report_at(end);
    EXPECT_DOUBLE_EQ(r.portion_done, 1.0);
    EXPECT_DOUBLE_EQ(r.vested_shares, 1000.0);
    EXPECT_DOUBLE_EQ(r.unvested_shares, 0.0);
    EXPECT_TRUE(r.fully_vested());
}

TEST_F(VestingTest, StrictlyBetweenWhileVesting) {
    for (int64_t d = 1; d < 4 * 365; d += 37) {
        auto r = report_at(start + seconds(d * DAY));
        EXPECT_GT(r.portion_done, 0.0) << "day " << d;
        EXPECT_LT(r.portion_done, 1.0) << "day " << d;
    }
}

TEST_F(VestingTest, OneYearIntoFourYearGrant) {
    auto r = report_at(at("2022-01-01T00:00:00Z"));
    EXPECT_DOUBLE_EQ(r.portion_done, 0.25);
    EXPECT_DOUBLE_EQ(r.vested_shares, 250.0);
    EXPECT_DOUBLE_EQ(r.unvested_shares, 750.0);
    EXPECT_DOUBLE_EQ(r.vested_unsold_shares, 250.0);
    EXPECT_DOUBLE_EQ(r.per_share_value, 15.0);
    EXPECT_DOUBLE_EQ(r.total_unsold_value, 15000.0);
    EXPECT_DOUBLE_EQ(r.vested_unsold_value(), 3750.0);
    EXPECT_DOUBLE_EQ(r.forfeit_value(), 11250.0);
    EXPECT_EQ(r.percent_vested(), 25);
}

TEST_F(VestingTest, BeforeStartIsNegative) {
    auto r = report_at(start - seconds(365 * DAY));
    EXPECT_DOUBLE_EQ(r.portion_done, -0.25);
    EXPECT_DOUBLE_EQ(r.vested_shares, -250.0);
    EXPECT_DOUBLE_EQ(r.unvested_shares, 1250.0);
}

TEST_F(VestingTest, PastEndExceedsOne) {
    auto r = report_at(end + seconds(365 * DAY));
    EXPECT_DOUBLE_EQ(r.portion_done, 1.25);
    EXPECT_TRUE(r.fully_vested());
}

TEST_F(VestingTest, VestedPlusUnvestedIsTotal) {
    for (int64_t d = -400; d < 2000; d += 53) {
        auto r = report_at(start + seconds(d * DAY + 1234), 777);
        EXPECT_NEAR(r.vested_shares + r.unvested_shares, 777.0, 1e-9) << "day " << d;
    }
}

TEST_F(VestingTest, SoldSharesReduceVestedUnsold) {
    auto r = report_at(at("2022-01-01T00:00:00Z"), 1000, 100);
    EXPECT_DOUBLE_EQ(r.vested_unsold_shares, 150.0);
    EXPECT_DOUBLE_EQ(r.vested_unsold_value(), 2250.0);
    // Total value still counts every share
    EXPECT_DOUBLE_EQ(r.total_unsold_value, 15000.0);
}

TEST_F(VestingTest, SoldMoreThanVestedGoesNegative) {
    auto r = report_at(at("2022-01-01T00:00:00Z"), 1000, 400);
    EXPECT_DOUBLE_EQ(r.vested_unsold_shares, -150.0);
}

TEST_F(VestingTest, UnderwaterGrant) {
    auto r = report_at(at("2022-01-01T00:00:00Z"), 1000, 0, 30.0, 25.0);
    EXPECT_DOUBLE_EQ(r.per_share_value, -5.0);
    EXPECT_DOUBLE_EQ(r.total_unsold_value, -5000.0);
    EXPECT_DOUBLE_EQ(r.forfeit_value(), -3750.0);
}

TEST_F(VestingTest, PercentTruncates) {
    auto r = report_at(end - seconds(1));
    EXPECT_EQ(r.percent_vested(), 99);
}

TEST_F(VestingTest, GrantOverload) {
    GrantParameters g;
    g.ticker = "ACME";
    g.total_shares = 1000;
    g.shares_sold = 0;
    g.strike_price = 10.0;
    g.vest_start = start;
    g.vest_end = end;

    auto r = compute_vesting_report(g, 25.0, at("2022-01-01T00:00:00Z"));
    EXPECT_DOUBLE_EQ(r.portion_done, 0.25);
    EXPECT_DOUBLE_EQ(r.total_unsold_value, 15000.0);
}

// ── seconds_to_go ───────────────────────────────────────────

TEST(SecondsToGo, WholeSeconds) {
    Instant end = at("2024-01-01T00:00:00Z");
    EXPECT_EQ(seconds_to_go(end - seconds(3 * 365 * DAY), end), 3 * 365 * DAY);
}

TEST(SecondsToGo, RoundsHalfAwayFromZero) {
    Instant end = at("2024-01-01T00:00:00Z");
    EXPECT_EQ(seconds_to_go(end - milliseconds(1500), end), 2);
    EXPECT_EQ(seconds_to_go(end - milliseconds(1400), end), 1);
}

TEST(SecondsToGo, NegativeAfterEnd) {
    Instant end = at("2024-01-01T00:00:00Z");
    EXPECT_EQ(seconds_to_go(end + milliseconds(2500), end), -3);
}
