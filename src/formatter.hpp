#pragma once

#include "column_layout.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace helpfmt {

class Formatter;

/**
 * Raises a Formatter's indentation for as long as the scope lives.
 *
 * Usage:
 *   {
 *       auto scope = formatter.indent();
 *       formatter.append("indented by two");
 *   }
 *   formatter.append("back at the previous level");
 */
class IndentScope {
public:
    IndentScope(Formatter& formatter, int amount);
    ~IndentScope();

    IndentScope(const IndentScope&) = delete;
    IndentScope& operator=(const IndentScope&) = delete;

private:
    Formatter& formatter_;
    int amount_;
};

/**
 * Handle on a table being filled in a Formatter.
 *
 * Each appended row is recorded in the formatter at the indentation current
 * at append time. The table is closed, and its column widths frozen, by
 * close() or when the handle goes out of scope.
 */
class ColumnScope {
public:
    ColumnScope(Formatter& formatter, std::shared_ptr<ColumnLayout> layout);
    ~ColumnScope();

    ColumnScope(const ColumnScope&) = delete;
    ColumnScope& operator=(const ColumnScope&) = delete;

    void append(std::vector<std::string> cells);
    void close();

    const ColumnLayout& layout() const { return *layout_; }

private:
    Formatter& formatter_;
    std::shared_ptr<ColumnLayout> layout_;
};

/**
 * Line buffer for help text.
 *
 * Text appended with append() is word-wrapped to the space left by the
 * current indentation. Rows of a table are stored as render hooks and only
 * turned into text by str(), once their table knows its column widths.
 *
 * Usage:
 *   Formatter f(78);
 *   f.append("Usage: prog [OPTIONS]");
 *   f.new_paragraph();
 *   {
 *       auto scope = f.indent();
 *       auto table = f.columns();
 *       table.append({"-h, --help", "Show this message and exit."});
 *   }
 *   std::cout << f.str() << std::endl;
 */
class Formatter {
public:
    using RenderFn = std::function<std::vector<std::string>()>;

    // One stored line: plain text, or a hook producing display lines.
    struct Line {
        int indent = 0;
        std::string text;
        RenderFn render;

        bool is_blank() const { return !render && text.empty(); }
        std::vector<std::string> expand() const;
    };

    static constexpr const char* DELIMITER = "\n";

    /**
     * @param max_width Total output width. 0 = use the terminal width
     * @throws WidthError if max_width is negative
     */
    explicit Formatter(int max_width = 0);

    /**
     * Wrap text to the width left after indentation and append each line.
     * @throws WidthError if no width is left
     */
    void append(const std::string& text, int indent = 0);

    // Append one line verbatim. An empty line acts as new_paragraph().
    // Throws WidthError if the resulting indent would be negative.
    void append_raw(const std::string& line, int indent = 0);

    // Append a line whose text is produced at output time. An empty hook
    // acts as new_paragraph().
    void append_raw(RenderFn render, int indent = 0);

    // Start a new paragraph: at most one blank line, never at the start.
    void new_paragraph();

    // Append the lines of another formatter, keeping their indentation
    // relative to the current level.
    void extend(const Formatter& other);
    void extend(const std::vector<Line>& lines);
    void extend(const std::vector<std::string>& lines);

    // Indent everything appended while the returned scope lives.
    IndentScope indent(int amount = 2);

    // Start a table laid out within max_width().
    ColumnScope columns(ColumnOptions options = {});

    int get_width(int indent = 0) const { return max_width_ - indent_ - indent; }
    int max_width() const { return max_width_; }
    int indent_level() const { return indent_; }
    const std::vector<Line>& lines() const { return lines_; }

    // Render the buffer. Does not modify the formatter.
    std::string str() const;

private:
    friend class IndentScope;

    int max_width_;
    int indent_ = 0;
    std::vector<Line> lines_;

    void check_indent(int resolved) const;
    void add_line(Line line);
};

} // namespace helpfmt
