#include "report.hpp"
#include <core/log.hpp>
#include <core/money.hpp>
#include <core/time_utils.hpp>
#include <core/vesting.hpp>
#include <fmt/format.h>

std::string render_report(const GrantParameters& grant,
                          const MoneyFormat& money,
                          double price,
                          Instant now) {
    VestingReport r = compute_vesting_report(grant, price, now);

    std::string out;
    out += fmt::format("Today's {} price is {}; ", grant.ticker, format_money(price, money));
    out += fmt::format("your total unsold shares are worth {}.\n", format_money(r.total_unsold_value, money));

    if (r.fully_vested()) {
        out += "You are 100% vested.  Why are you still here?\n\n";
        return out;
    }

    int64_t secs = seconds_to_go(now, grant.vest_end);
    out += fmt::format("You are {}% vested, for a total of ", r.percent_vested());
    out += fmt::format("{} vested unsold shares ({})\n",
                       static_cast<int64_t>(r.vested_unsold_shares),
                       format_money(r.vested_unsold_value(), money));
    out += fmt::format("But if you quit today, you will walk away from {}\n",
                       format_money(r.forfeit_value(), money));
    out += "Hang in there, little trooper! Only";
    out += fmt::format("{} to go!\n", format_remaining(secs));
    return out;
}

Result<std::string> run_report(const Config& config, QuoteProvider& quotes, Instant now) {
    const GrantParameters& grant = config.grant();

    auto quote = quotes.fetch(grant.ticker);
    if (quote.is_err()) {
        return Result<std::string>::Err(quote.error);
    }
    worth_log(fmt::format("report: {} at {} (trading day {}), now {}",
                          grant.ticker, quote.value.price,
                          quote.value.latest_trading_day, format_rfc3339(now)));

    return Result<std::string>::Ok(render_report(grant, config.money(), quote.value.price, now));
}
