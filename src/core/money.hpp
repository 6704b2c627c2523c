#pragma once

#include <string>
#include "types.hpp"

// Format an amount as "$1,234.56" (or "$-1,234.56" when negative) using the
// symbol, precision and separators in style. Amounts that round to zero carry no sign.
std::string format_money(double amount, const MoneyFormat& style = MoneyFormat{});
