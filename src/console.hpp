#pragma once

#include <string>
#include <iostream>

namespace helpfmt {

// ========== ANSI Escape Codes ==========

// ANSI escape codes for terminal colors.
namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
}

/**
 * Terminal output helper for the CLI.
 *
 * Rendered help text goes to stdout untouched; diagnostics go to stderr and
 * are colored only when stderr belongs to a terminal that supports it.
 */
class Console {
public:
    // Creates a Console instance and detects color support.
    Console();

    // ========== Basic Output ==========

    // Prints text followed by a newline on stdout.
    void println(const std::string& text = "") const;

    // ========== Diagnostics ==========

    // Prints error message in red on stderr.
    void print_error(const std::string& text) const;

    // Prints success message in green with a checkmark prefix on stderr.
    void print_success(const std::string& text) const;

private:
    bool colors_enabled_;  // True if terminal supports ANSI colors.

    // Detects and enables color support based on terminal capabilities.
    void enable_colors();
};

} // namespace helpfmt
