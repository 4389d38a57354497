#pragma once

/**
 * Application configuration constants.
 *
 * Defines layout defaults and file paths for the helpfmt CLI.
 */

namespace helpfmt {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".helpfmt.json";  // Local settings file.

// ========== Layout Defaults ==========

constexpr int DEFAULT_TERMINAL_WIDTH = 78;           // Used when the terminal cannot be queried.
constexpr int DEFAULT_INDENT = 2;                    // Indent step for nested blocks.
constexpr const char* DEFAULT_SEPARATOR = "   ";     // Space between table columns.
constexpr int DEFAULT_MIN_WIDTH = 2;                 // Minimum width of every column.
constexpr double DEFAULT_FIRST_COLUMN_MAX = 0.25;    // Share of the width the first column may take.

} // namespace helpfmt
