#pragma once

namespace helpfmt {
namespace terminal {

/**
 * Get the terminal width in columns.
 * Falls back to the COLUMNS environment variable, then to
 * DEFAULT_TERMINAL_WIDTH (78) if width cannot be determined.
 */
int get_width();

/**
 * Check if stdout is a TTY (interactive terminal).
 */
bool is_tty();

} // namespace terminal
} // namespace helpfmt
