#pragma once

/**
 * Help documents: the structured description of a command's help text that
 * the CLI reads from JSON and lays out with a Formatter.
 *
 * Document shape:
 *   {
 *     "usage": "prog [OPTIONS] FILE",
 *     "description": ["First paragraph.", "Second paragraph."],
 *     "sections": [
 *       { "title": "Options:",
 *         "text": ["Optional paragraphs above the table."],
 *         "rows": [["-h, --help", "Show this message and exit."]] }
 *     ],
 *     "footer": ["See the manual for more."]
 *   }
 *
 * "description" and "footer" also accept a single string.
 */

#include "column_layout.hpp"
#include "settings.hpp"

#include <istream>
#include <stdexcept>
#include <string>
#include <vector>

namespace helpfmt {

class Formatter;

// Raised when a document is not valid JSON or has the wrong shape.
class DocumentError : public std::runtime_error {
public:
    explicit DocumentError(const std::string& message) : std::runtime_error(message) {}
};

struct HelpSection {
    std::string title;
    std::vector<std::string> text;               // Paragraphs before the table.
    std::vector<std::vector<std::string>> rows;  // Table rows, all the same length.
};

struct HelpDocument {
    std::string usage;
    std::vector<std::string> description;
    std::vector<HelpSection> sections;
    std::vector<std::string> footer;
};

// Parses a document from JSON text.
HelpDocument parse_help_document(const std::string& json_text);

// Reads and parses a document from a stream.
HelpDocument load_help_document(std::istream& in);

// Reads and parses a document from a file.
HelpDocument load_help_document(const std::string& path);

// Column options for a section table with `count` columns.
ColumnOptions table_options(const Settings& settings, size_t count);

// Appends the whole document to `formatter`.
void render_help(const HelpDocument& doc, Formatter& formatter, const Settings& settings);

} // namespace helpfmt
