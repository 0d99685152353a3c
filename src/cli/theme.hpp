#pragma once

#include <string>
#include <fmt/format.h>
#include <core/constants.hpp>

namespace theme {

// Flutter palette (ANSI truecolor escape sequences)
// Flutter Blue: #0175C2
// Flutter Sky:  #13B9FD
namespace color {
    const std::string BLUE      = "\033[38;2;1;117;194m";
    const std::string SKY       = "\033[38;2;19;185;253m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s) { return color::DIM + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string banner() {
    return "\n" + color::BLUE + color::BOLD
        + "  FLX CLI - Flutter Clean Architecture Generator\n"
        + color::RESET + color::DIM + "  v" + FLX_VERSION + color::RESET + "\n";
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::SKY + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::SKY + "    > " + color::RESET + msg + "\n";
}

// Key-value row for status panels
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<22}", key) + color::RESET + value + "\n";
}

// Command row for help listings
inline std::string usage(const std::string& command, const std::string& description) {
    return color::BLUE + fmt::format("    {:<28}", command) + color::RESET
         + color::DIM + description + color::RESET + "\n";
}

} // namespace theme
