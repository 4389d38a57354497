#pragma once

/**
 * Verbose logging for the helpfmt CLI.
 *
 * With -v/--verbose, settings loading, document parsing, the chosen output
 * width and every computed set of column widths are reported on stderr,
 * one timestamped line each, tagged with the part of the pipeline that
 * produced it.
 */

#include <string>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <ctime>

#include <unistd.h>

namespace helpfmt {

// Parts of the pipeline that log.
enum class LogCategory { Layout, Columns, Settings, Document };

inline const char* category_name(LogCategory category) {
    switch (category) {
        case LogCategory::Layout: return "layout";
        case LogCategory::Columns: return "columns";
        case LogCategory::Settings: return "settings";
        case LogCategory::Document: return "document";
    }
    return "helpfmt";
}

inline bool g_verbose = false;

inline void set_verbose(bool enabled) {
    g_verbose = enabled;
}

/**
 * Get current timestamp as HH:MM:SS.mmm.
 */
inline std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_now;
    localtime_r(&time_t_now, &tm_now);

    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

// Writes one log line; the tag is colored only when stderr is a terminal.
inline void write_log(LogCategory category, const char* color, const char* suffix,
                      const std::string& message) {
    static const bool colored = isatty(STDERR_FILENO) != 0;
    std::cerr << (colored ? "\033[90m" : "") << "[" << timestamp() << "] "
              << (colored ? color : "") << "[" << category_name(category) << suffix << "]"
              << (colored ? "\033[0m" : "") << " " << message << std::endl;
}

/**
 * Log a verbose message for a category.
 */
inline void verbose_log(LogCategory category, const std::string& message) {
    if (!g_verbose) return;
    write_log(category, "\033[36m", "", message);
}

/**
 * Log a recoverable failure (a settings file that can't be used, etc).
 */
inline void verbose_err(LogCategory category, const std::string& message) {
    if (!g_verbose) return;
    write_log(category, "\033[31m", " ERR", message);
}

/**
 * Shorten long document text for a log line.
 */
inline std::string truncate(const std::string& s, size_t max_len = 200) {
    if (s.length() <= max_len) return s;
    return s.substr(0, max_len) + "... (" + std::to_string(s.length()) + " bytes total)";
}

} // namespace helpfmt
