#include "formatter.hpp"
#include "layout_error.hpp"
#include "terminal.hpp"
#include "text_wrap.hpp"

#include <utility>

namespace helpfmt {

// ========== IndentScope ==========

IndentScope::IndentScope(Formatter& formatter, int amount)
    : formatter_(formatter)
    , amount_(amount)
{
    if (formatter_.indent_ + amount_ < 0) {
        throw WidthError("indentation cannot drop below zero (level " +
                         std::to_string(formatter_.indent_) + ", change " +
                         std::to_string(amount_) + ")");
    }
    formatter_.indent_ += amount_;
}

IndentScope::~IndentScope() {
    formatter_.indent_ -= amount_;
}

// ========== ColumnScope ==========

ColumnScope::ColumnScope(Formatter& formatter, std::shared_ptr<ColumnLayout> layout)
    : formatter_(formatter)
    , layout_(std::move(layout))
{
}

ColumnScope::~ColumnScope() {
    layout_->close();
}

void ColumnScope::append(std::vector<std::string> cells) {
    size_t row = layout_->append(std::move(cells));
    std::shared_ptr<const ColumnLayout> layout = layout_;
    formatter_.append_raw([layout, row]() { return layout->format_row(row); });
}

void ColumnScope::close() {
    layout_->close();
}

// ========== Formatter ==========

std::vector<std::string> Formatter::Line::expand() const {
    if (render) {
        return render();
    }
    return {text};
}

Formatter::Formatter(int max_width)
    : max_width_(max_width == 0 ? terminal::get_width() : max_width)
{
    if (max_width_ < 0) {
        throw WidthError("invalid formatter width " + std::to_string(max_width) +
                         " (must be > 0, or 0 for the terminal width)");
    }
}

void Formatter::append(const std::string& text, int indent) {
    check_indent(indent_ + indent);
    for (auto& line : wrap(text, get_width(indent))) {
        append_raw(line, indent);
    }
}

void Formatter::append_raw(const std::string& line, int indent) {
    if (line.empty()) {
        new_paragraph();
        return;
    }
    add_line(Line{indent_ + indent, line, nullptr});
}

void Formatter::append_raw(RenderFn render, int indent) {
    if (!render) {
        new_paragraph();
        return;
    }
    add_line(Line{indent_ + indent, std::string(), std::move(render)});
}

void Formatter::new_paragraph() {
    if (!lines_.empty() && !lines_.back().is_blank()) {
        lines_.push_back(Line{0, std::string(), nullptr});
    }
}

void Formatter::extend(const Formatter& other) {
    if (&other == this) {
        std::vector<Line> copy = lines_;
        extend(copy);
        return;
    }
    extend(other.lines_);
}

void Formatter::extend(const std::vector<Line>& lines) {
    // Reject the whole batch before storing any of it
    for (const auto& line : lines) {
        if (!line.is_blank()) {
            check_indent(indent_ + line.indent);
        }
    }
    for (const auto& line : lines) {
        if (line.is_blank()) {
            new_paragraph();
        } else {
            add_line(Line{indent_ + line.indent, line.text, line.render});
        }
    }
}

void Formatter::extend(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
        append_raw(line);
    }
}

IndentScope Formatter::indent(int amount) {
    return IndentScope(*this, amount);
}

ColumnScope Formatter::columns(ColumnOptions options) {
    return ColumnScope(*this, std::make_shared<ColumnLayout>(max_width_, std::move(options)));
}

std::string Formatter::str() const {
    size_t count = lines_.size();
    if (count > 0 && lines_.back().is_blank()) {
        count--;
    }

    std::string result;
    bool first = true;
    for (size_t i = 0; i < count; i++) {
        const Line& line = lines_[i];
        for (const auto& text : line.expand()) {
            if (!first) {
                result += DELIMITER;
            }
            first = false;
            result += std::string(line.indent, ' ');
            result += text;
        }
    }
    return result;
}

void Formatter::check_indent(int resolved) const {
    if (resolved < 0) {
        throw WidthError("line indentation cannot drop below zero (level " +
                         std::to_string(indent_) + ", resolved " +
                         std::to_string(resolved) + ")");
    }
}

void Formatter::add_line(Line line) {
    check_indent(line.indent);
    lines_.push_back(std::move(line));
}

} // namespace helpfmt
