#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences used by the zklock CLI
namespace color {
    const std::string BLUE   = "\033[38;2;62;120;178m";
    const std::string BROWN  = "\033[38;2;128;99;58m";
    const std::string RED    = "\033[91m";
    const std::string GREEN  = "\033[92m";
    const std::string YELLOW = "\033[93m";
    const std::string BOLD   = "\033[1m";
    const std::string DIM    = "\033[2m";
    const std::string RESET  = "\033[0m";
}

inline std::string paint(const std::string& code, const std::string& s) {
    return code + s + color::RESET;
}

inline std::string blue(const std::string& s) { return paint(color::BLUE, s); }
inline std::string bold(const std::string& s) { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)  { return paint(color::DIM, s); }

// ── Layout ──────────────────────────────────────────────

inline std::string section(const std::string& title) {
    return "\n" + paint(color::BROWN + color::BOLD, "  " + title) + "\n\n";
}

// Status line: colored marker, message, newline
inline std::string status(const std::string& code, char marker, const std::string& msg) {
    return paint(code, fmt::format("    {} ", marker)) + msg + "\n";
}

inline std::string ok(const std::string& msg)   { return status(color::GREEN, '+', msg); }
inline std::string fail(const std::string& msg) { return status(color::RED, 'x', msg); }
inline std::string warn(const std::string& msg) { return status(color::YELLOW, '!', msg); }
inline std::string info(const std::string& msg) { return status(color::BLUE, '~', msg); }
inline std::string step(const std::string& msg) { return status(color::BROWN, '>', msg); }

// Key-value row for `zklock status`
inline std::string kv(const std::string& key, const std::string& value) {
    return paint(color::DIM, fmt::format("    {:<10}", key)) + value + "\n";
}

} // namespace theme
