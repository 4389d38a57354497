#pragma once

/**
 * Exceptions raised by the layout engine.
 *
 * All of them signal mistakes in how help text was put together (wrong row
 * shapes, widths that leave no room, misuse of a closed table), so callers
 * are expected to let them propagate rather than recover.
 */

#include <stdexcept>
#include <string>

namespace helpfmt {

// Base class for every layout failure.
class LayoutError : public std::runtime_error {
public:
    explicit LayoutError(const std::string& message)
        : std::runtime_error(message) {}
};

// A row or option list does not match the column count.
class ShapeError : public LayoutError {
public:
    explicit ShapeError(const std::string& message) : LayoutError(message) {}
};

// A wrapping width or indentation resolved to an unusable value.
class WidthError : public LayoutError {
public:
    explicit WidthError(const std::string& message) : LayoutError(message) {}
};

// A column layout was used in the wrong lifecycle state.
class StateError : public LayoutError {
public:
    explicit StateError(const std::string& message) : LayoutError(message) {}
};

} // namespace helpfmt
