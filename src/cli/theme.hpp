#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string GREEN     = "\033[38;2;46;139;87m";
    const std::string GOLD      = "\033[38;2;184;134;11m";
    const std::string RED       = "\033[91m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }

// Section header with a blank line on each side
inline std::string section(const std::string& title) {
    return "\n" + color::GOLD + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// Flag row for usage output
inline std::string flag(const std::string& name, const std::string& help) {
    return color::GREEN + fmt::format("    {:<26}", name) + color::RESET
         + color::DIM + help + color::RESET + "\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::GOLD + "    > " + color::RESET + msg + "\n";
}

} // namespace theme
