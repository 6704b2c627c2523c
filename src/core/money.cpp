#include "money.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

// Insert the thousands separator every three digits from the right
static std::string group_thousands(const std::string& digits, const std::string& sep) {
    if (sep.empty() || digits.size() <= 3) return digits;

    std::string out;
    size_t lead = digits.size() % 3;
    if (lead == 0) lead = 3;
    out += digits.substr(0, lead);
    for (size_t i = lead; i < digits.size(); i += 3) {
        out += sep;
        out += digits.substr(i, 3);
    }
    return out;
}

std::string format_money(double amount, const MoneyFormat& style) {
    int precision = std::max(style.precision, 0);
    std::string fixed = fmt::format("{:.{}f}", std::fabs(amount), precision);

    std::string int_part = fixed;
    std::string frac_part;
    auto dot = fixed.find('.');
    if (dot != std::string::npos) {
        int_part = fixed.substr(0, dot);
        frac_part = fixed.substr(dot + 1);
    }

    // "-0.00" reads badly; only mark amounts that survive rounding
    bool negative = amount < 0 &&
        fixed.find_first_not_of("0.") != std::string::npos;

    std::string out = style.symbol;
    if (negative) out += "-";
    out += group_thousands(int_part, style.thousand);
    if (!frac_part.empty()) {
        out += style.decimal;
        out += frac_part;
    }
    return out;
}
