#include "text_wrap.hpp"
#include "layout_error.hpp"

#include <cctype>

namespace helpfmt {

std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> words;
    size_t i = 0;
    while (i < text.length()) {
        while (i < text.length() && std::isspace(static_cast<unsigned char>(text[i]))) {
            i++;
        }
        size_t start = i;
        while (i < text.length() && !std::isspace(static_cast<unsigned char>(text[i]))) {
            i++;
        }
        if (i > start) {
            words.push_back(text.substr(start, i - start));
        }
    }
    return words;
}

std::vector<std::string> wrap(const std::string& text, int width) {
    if (width <= 0) {
        throw WidthError("invalid width " + std::to_string(width) + " (must be > 0)");
    }

    std::vector<std::string> lines;
    std::string current;
    for (const auto& word : split_words(text)) {
        if (current.empty()) {
            current = word;
        } else if (current.length() + 1 + word.length() <= static_cast<size_t>(width)) {
            current += ' ';
            current += word;
        } else {
            // Line is full, start a new one
            lines.push_back(current);
            current = word;
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

} // namespace helpfmt
