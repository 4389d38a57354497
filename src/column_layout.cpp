#include "column_layout.hpp"
#include "config.hpp"
#include "layout_error.hpp"
#include "text_wrap.hpp"
#include "verbose.hpp"

#include <algorithm>
#include <numeric>

namespace helpfmt {

namespace {
    std::string shape_message(const char* what, size_t expected, size_t got) {
        return std::string("expected ") + std::to_string(expected) + " " + what +
               " but got " + std::to_string(got);
    }

    std::string join_widths(const std::vector<int>& widths) {
        std::string result;
        for (size_t i = 0; i < widths.size(); i++) {
            if (i > 0) result += ", ";
            result += std::to_string(widths[i]);
        }
        return result;
    }
}

ColumnLayout::ColumnLayout(int max_width, ColumnOptions options)
    : max_width_(max_width)
    , options_(std::move(options))
{
    const size_t n = options_.count;
    if (n == 0) {
        throw ShapeError("a column layout needs at least one column");
    }

    // Fill in defaults for any policy left unspecified
    if (options_.align.empty()) {
        options_.align.assign(n, Align::Left);
    } else if (options_.align.size() != n) {
        throw ShapeError(shape_message("alignment flags", n, options_.align.size()));
    }

    if (options_.wrap.empty()) {
        options_.wrap.assign(n, true);
        options_.wrap[0] = false;
    } else if (options_.wrap.size() != n) {
        throw ShapeError(shape_message("wrap flags", n, options_.wrap.size()));
    }

    if (options_.min_widths.empty()) {
        options_.min_widths.assign(n, WidthSpec::absolute(DEFAULT_MIN_WIDTH));
    } else if (options_.min_widths.size() != n) {
        throw ShapeError(shape_message("minimum widths", n, options_.min_widths.size()));
    }

    if (options_.max_widths.empty()) {
        options_.max_widths.assign(n, std::nullopt);
        options_.max_widths[0] = WidthSpec::fraction(DEFAULT_FIRST_COLUMN_MAX);
    } else if (options_.max_widths.size() != n) {
        throw ShapeError(shape_message("maximum widths", n, options_.max_widths.size()));
    }
}

size_t ColumnLayout::append(std::vector<std::string> cells) {
    if (closed_) {
        throw StateError("cannot append a row to a closed column layout");
    }
    if (cells.size() != options_.count) {
        throw ShapeError(shape_message("cells", options_.count, cells.size()));
    }
    rows_.push_back(std::move(cells));
    return rows_.size() - 1;
}

void ColumnLayout::close() {
    if (closed_) {
        return;
    }
    widths_ = compute_widths();
    closed_ = true;
    verbose_log(LogCategory::Columns, std::to_string(rows_.size()) + " rows, widths [" +
                join_widths(widths_) + "] within " + std::to_string(max_width_));
}

const std::vector<int>& ColumnLayout::widths() const {
    if (!closed_) {
        throw StateError("column widths are only known once the layout is closed");
    }
    return widths_;
}

std::vector<int> ColumnLayout::compute_widths() const {
    const size_t n = options_.count;
    int used = static_cast<int>(options_.separator.length() * (n - 1));
    const int space_left = max_width_ - used;

    std::vector<int> min_widths(n);
    std::vector<std::optional<int>> max_widths(n);
    for (size_t i = 0; i < n; i++) {
        min_widths[i] = options_.min_widths[i].resolve(space_left);
        if (options_.max_widths[i]) {
            max_widths[i] = options_.max_widths[i]->resolve(space_left);
        }
    }

    std::vector<int> widths;
    widths.reserve(n);
    for (size_t i = 0; i < n; i++) {
        // Reserve the minimum of every column to the right
        int reserved = std::accumulate(min_widths.begin() + i + 1, min_widths.end(), 0);
        int capacity = bound(std::nullopt, max_width_ - used - reserved, max_widths[i]);

        std::vector<int> lengths;
        lengths.reserve(rows_.size());
        for (const auto& row : rows_) {
            lengths.push_back(static_cast<int>(row[i].length()));
        }
        std::sort(lengths.begin(), lengths.end());

        if (lengths.empty()) {
            lengths.push_back(min_widths[i]);
        } else if (!options_.wrap[i]) {
            // Drop outliers one at a time; they overflow when rendered
            while (lengths.back() > capacity) {
                lengths.pop_back();
                if (lengths.empty()) {
                    lengths.push_back(min_widths[i]);
                    break;
                }
            }
        }

        int width = bound(min_widths[i], lengths.back(), capacity);
        used += width;
        widths.push_back(width);
    }
    return widths;
}

std::vector<std::string> ColumnLayout::format_row(size_t row) const {
    if (row >= rows_.size()) {
        throw ShapeError("row " + std::to_string(row) + " out of range (" +
                         std::to_string(rows_.size()) + " rows)");
    }
    return format_cells(rows_[row]);
}

std::vector<std::string> ColumnLayout::format_cells(const std::vector<std::string>& cells) const {
    if (!closed_) {
        throw StateError("cannot render rows before the column layout is closed");
    }
    if (cells.size() != options_.count) {
        throw ShapeError(shape_message("cells", options_.count, cells.size()));
    }

    std::vector<std::vector<std::string>> wrapped;
    size_t depth = 0;
    for (size_t i = 0; i < cells.size(); i++) {
        wrapped.push_back(format_cell(i, cells[i]));
        depth = std::max(depth, wrapped.back().size());
    }

    std::vector<std::string> lines;
    for (size_t pos = 0; pos < depth; pos++) {
        std::vector<std::optional<std::string>> slice;
        for (const auto& cell_lines : wrapped) {
            if (pos < cell_lines.size()) {
                slice.emplace_back(cell_lines[pos]);
            } else {
                slice.emplace_back(std::nullopt);
            }
        }

        for (const auto& parts : match_lines(slice)) {
            std::string line;
            for (size_t j = 0; j < parts.size(); j++) {
                if (j > 0) line += options_.separator;
                line += parts[j];
            }
            size_t end = line.find_last_not_of(" \t");
            line.erase(end == std::string::npos ? 0 : end + 1);
            lines.push_back(std::move(line));
        }
    }
    return lines;
}

std::vector<std::string> ColumnLayout::format_cell(size_t column, const std::string& cell) const {
    int width = widths_[column];
    if (!options_.wrap[column] && cell.length() > static_cast<size_t>(width)) {
        // Spill over every column to the right
        width = std::accumulate(widths_.begin() + column, widths_.end(), 0) +
                static_cast<int>(options_.separator.length() * (options_.count - column - 1));
    }

    std::vector<std::string> lines;
    for (const auto& line : wrap(cell, width)) {
        lines.push_back(pad(line, options_.align[column], width));
    }
    return lines;
}

std::vector<std::vector<std::string>> ColumnLayout::match_lines(
    const std::vector<std::optional<std::string>>& cells) const
{
    std::vector<std::vector<std::string>> result;
    std::vector<std::string> current;
    for (size_t i = 0; i < cells.size(); i++) {
        std::string cell = cells[i] ? *cells[i] : std::string(widths_[i], ' ');
        bool overflows = cell.length() > static_cast<size_t>(widths_[i]);
        current.push_back(std::move(cell));
        if (!overflows) {
            continue;
        }

        result.push_back(std::move(current));
        if (i + 1 == options_.count) {
            return result;
        }
        // Continue under the next column
        int offset = std::accumulate(widths_.begin(), widths_.begin() + i + 1, 0) +
                     static_cast<int>(options_.separator.length() * i);
        current = {std::string(offset, ' ')};
    }
    result.push_back(std::move(current));
    return result;
}

std::string ColumnLayout::pad(const std::string& text, Align align, int width) const {
    if (text.length() >= static_cast<size_t>(width)) {
        return text;
    }
    size_t fill = static_cast<size_t>(width) - text.length();
    switch (align) {
        case Align::Right:
            return std::string(fill, ' ') + text;
        case Align::Center:
            return std::string(fill / 2, ' ') + text + std::string(fill - fill / 2, ' ');
        case Align::Left:
        default:
            return text + std::string(fill, ' ');
    }
}

} // namespace helpfmt
