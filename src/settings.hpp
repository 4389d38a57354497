#pragma once

/**
 * Settings persistence for the helpfmt CLI.
 *
 * Handles loading and saving of layout preferences to a local JSON file.
 * Command-line flags take precedence over anything stored here.
 */

#include "config.hpp"

#include <optional>
#include <string>

namespace helpfmt {

/**
 * Layout settings stored in .helpfmt.json.
 */
struct Settings {
    std::optional<int> width;                   // Output width; unset = terminal width.
    int indent = DEFAULT_INDENT;                // Indent of section bodies.
    std::string separator = DEFAULT_SEPARATOR;  // Space between table columns.
    std::optional<double> first_column_max;     // Cap on the first column, as a share of the width.
};

// Loads settings from a JSON file. Returns empty optional if the file doesn't
// exist or can't be parsed.
std::optional<Settings> load_settings(const std::string& path = SETTINGS_FILE);

// Saves settings to a JSON file. Throws std::runtime_error if it can't be written.
void save_settings(const Settings& settings, const std::string& path = SETTINGS_FILE);

} // namespace helpfmt
