#include <iostream>
#include <vector>
#include <string>
#include <fmt/format.h>
#include "cli/report.hpp"
#include "cli/theme.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/log.hpp"
#include "quote/alpha_vantage.hpp"

void print_usage() {
    std::cout << "\n" << theme::color::GREEN << theme::color::BOLD << "  worth"
              << theme::color::RESET << theme::color::DIM
              << "  Find out the value of your stock, and how much longer\n"
              << "         you have to wait until you're fully vested."
              << theme::color::RESET << "\n";
    std::cout << theme::section("Usage");
    std::cout << theme::color::GREEN << "    worth "
              << theme::color::RESET << theme::color::GOLD << "[flags]"
              << theme::color::RESET << "\n";
    std::cout << theme::section("Flags");
    std::cout << theme::flag("--config <path>", "config file (default " + get_default_config_path().string() + ")");
    std::cout << theme::flag("--ticker <symbol>", "ticker symbol");
    std::cout << theme::flag("--apikey <key>", "Alpha Vantage API key");
    std::cout << theme::flag("--strike-price <price>", "strike price (default 0.0)");
    std::cout << theme::flag("--shares <n>", "number of shares (default 1)");
    std::cout << theme::flag("--shares-sold <n>", "number of shares sold (default 0)");
    std::cout << theme::flag("--vest-start <time>", "vesting start date (RFC3339)");
    std::cout << theme::flag("--vest-end <time>", "vesting end date (RFC3339)");
    std::cout << theme::flag("--currency-symbol <s>", "currency symbol (default $)");
    std::cout << theme::flag("--currency-precision <n>", "digits after the decimal point (default 2)");
    std::cout << "\n";
    std::cout << theme::dim("    Every flag can also be set in the config file (e.g. 'vest-start: ...')\n"
                            "    or the environment (e.g. VEST_START).") << "\n";
    std::cout << theme::color::DIM
              << "    worth --version        Show version\n"
              << "    worth --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);

        auto opts = parse_cli_args(args);
        if (opts.is_err()) {
            std::cout << theme::fail(opts.error);
            std::cout << theme::step("Run 'worth --help' for usage.");
            return 1;
        }
        if (opts.value.show_help) {
            print_usage();
            return 0;
        }
        if (opts.value.show_version) {
            std::cout << theme::color::GREEN << theme::color::BOLD << "worth"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << WORTH_VERSION << theme::color::RESET << "\n";
            return 0;
        }

        auto config = Config::load(opts.value);
        if (config.is_err()) {
            worth_log("error: " + config.error);
            std::cout << theme::fail(config.error);
            return 1;
        }

        worth_log("config: using " + config.value.source_path().string());

        AlphaVantageProvider provider(config.value.api_key());
        auto report = run_report(config.value, provider, Clock::now());
        if (report.is_err()) {
            worth_log("error: " + report.error);
            std::cout << theme::fail(report.error);
            return 1;
        }

        std::cout << report.value;
        return 0;
    } catch (const std::exception& e) {
        worth_log(fmt::format("error: {}", e.what()));
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
