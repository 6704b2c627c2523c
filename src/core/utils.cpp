#include "utils.hpp"
#include <fmt/format.h>
#include <cmath>
#include <stdexcept>

Result<double> parse_decimal(const std::string& s) {
    std::string text = s;
    trim(text);
    if (text.empty()) {
        return Result<double>::Err("empty number");
    }

    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        if (used != text.size() || !std::isfinite(v)) {
            return Result<double>::Err(fmt::format("\"{}\" is not a valid number", s));
        }
        return Result<double>::Ok(v);
    } catch (const std::invalid_argument&) {
        return Result<double>::Err(fmt::format("\"{}\" is not a valid number", s));
    } catch (const std::out_of_range&) {
        return Result<double>::Err(fmt::format("\"{}\" is out of range", s));
    }
}

Result<int64_t> parse_integer(const std::string& s) {
    std::string text = s;
    trim(text);
    if (text.empty()) {
        return Result<int64_t>::Err("empty number");
    }

    try {
        size_t used = 0;
        long long v = std::stoll(text, &used, 10);
        if (used != text.size()) {
            return Result<int64_t>::Err(fmt::format("\"{}\" is not a whole number", s));
        }
        return Result<int64_t>::Ok(static_cast<int64_t>(v));
    } catch (const std::invalid_argument&) {
        return Result<int64_t>::Err(fmt::format("\"{}\" is not a whole number", s));
    } catch (const std::out_of_range&) {
        return Result<int64_t>::Err(fmt::format("\"{}\" is out of range", s));
    }
}
