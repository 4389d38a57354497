#pragma once

#include "width_spec.hpp"

#include <optional>
#include <string>
#include <vector>

namespace helpfmt {

enum class Align { Left, Right, Center };

/**
 * Construction options for a ColumnLayout.
 *
 * Empty vectors select the defaults: every column left-aligned, the first
 * column kept on one line while the others wrap, a minimum of two characters
 * per column, and the first column capped at a quarter of the table.
 * Non-empty vectors must hold exactly `count` entries.
 */
struct ColumnOptions {
    size_t count = 2;
    std::string separator = "   ";
    std::vector<Align> align;
    std::vector<bool> wrap;
    std::vector<WidthSpec> min_widths;
    std::vector<std::optional<WidthSpec>> max_widths;
};

/**
 * Table of text cells whose column widths are derived from the cells.
 *
 * Rows are collected while the layout is open. close() computes one width
 * per column, after which rows can be rendered into aligned display lines.
 * A cell too long for a column that does not wrap spills over the columns to
 * its right on a line of its own, and the remaining cells of that row
 * continue on the next line.
 *
 * Usage:
 *   ColumnLayout table(80, ColumnOptions{});
 *   table.append({"-h, --help", "Show this message and exit."});
 *   table.close();
 *   for (const auto& line : table.format_row(0)) { ... }
 */
class ColumnLayout {
public:
    /**
     * @param max_width Total width the table may occupy
     * @param options Column count, separator and per-column policies
     * @throws ShapeError if count is zero or an option list has the wrong size
     */
    ColumnLayout(int max_width, ColumnOptions options);

    /**
     * Add a row. Returns its index.
     * @throws ShapeError if cells.size() != column_count()
     * @throws StateError if the layout is closed
     */
    size_t append(std::vector<std::string> cells);

    // Freeze the widths. Further calls have no effect.
    void close();

    bool is_closed() const { return closed_; }
    size_t column_count() const { return options_.count; }
    size_t row_count() const { return rows_.size(); }
    int max_width() const { return max_width_; }
    const std::string& separator() const { return options_.separator; }

    // Computed widths. Throws StateError while open.
    const std::vector<int>& widths() const;

    // Display lines of an appended row, right-trimmed.
    std::vector<std::string> format_row(size_t row) const;

    // Display lines for arbitrary cells laid out with this table's widths.
    std::vector<std::string> format_cells(const std::vector<std::string>& cells) const;

private:
    int max_width_;
    ColumnOptions options_;
    std::vector<std::vector<std::string>> rows_;
    std::vector<int> widths_;
    bool closed_ = false;

    std::vector<int> compute_widths() const;
    std::vector<std::string> format_cell(size_t column, const std::string& cell) const;
    std::vector<std::vector<std::string>> match_lines(const std::vector<std::optional<std::string>>& cells) const;
    std::string pad(const std::string& text, Align align, int width) const;
};

} // namespace helpfmt
