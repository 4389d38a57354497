#pragma once

#include <string>
#include <vector>

namespace helpfmt {

/**
 * Greedy word wrap.
 *
 * Splits `text` on whitespace and packs as many words as fit on each line,
 * joined by single spaces. A word longer than `width` is placed on a line of
 * its own and is not broken. Empty or all-whitespace text yields no lines.
 *
 * @throws WidthError if width <= 0
 */
std::vector<std::string> wrap(const std::string& text, int width);

// Splits text into whitespace-separated words.
std::vector<std::string> split_words(const std::string& text);

} // namespace helpfmt
