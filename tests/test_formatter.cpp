#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>
#include "formatter.hpp"
#include "layout_error.hpp"
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace helpfmt;

// Helper to split rendered output back into lines
std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

// ============================================================================
// Wrapped text
// ============================================================================

TEST_CASE("Text is wrapped greedily to the formatter width", "[formatter]") {
    Formatter f(10);
    f.append("alpha beta gamma delta");

    REQUIRE(f.str() == "alpha beta\ngamma\ndelta");
    for (const auto& line : split_lines(f.str())) {
        REQUIRE(line.length() <= 10);
    }
}

TEST_CASE("Short text stays on one line", "[formatter]") {
    Formatter f(10);
    f.append("a b c d e");

    REQUIRE(f.str() == "a b c d e");
}

TEST_CASE("Extra indent narrows the wrap width", "[formatter]") {
    Formatter f(12);
    f.append("aaaa bbbb cccc", 4);

    REQUIRE(f.str() == "    aaaa\n    bbbb\n    cccc");
}

TEST_CASE("No room left after indentation is a width error", "[formatter][errors]") {
    Formatter f(4);
    auto scope = f.indent(4);

    REQUIRE_THROWS_AS(f.append("x"), WidthError);

    Formatter narrow(3);
    REQUIRE_THROWS_AS(narrow.append("x", 3), WidthError);
    REQUIRE(narrow.lines().empty());
}

TEST_CASE("Raw lines are not wrapped", "[formatter]") {
    Formatter f(5);
    f.append_raw("longer than five");

    REQUIRE(f.str() == "longer than five");
}

TEST_CASE("Zero width means terminal width", "[formatter]") {
    Formatter f;
    REQUIRE(f.max_width() > 0);
}

TEST_CASE("Negative formatter width is rejected", "[formatter][errors]") {
    REQUIRE_THROWS_AS(Formatter(-1), WidthError);
}

TEST_CASE("Negative extra indent is rejected before storing", "[formatter][errors]") {
    Formatter f(20);
    f.append("parent");
    {
        auto scope = f.indent(2);
        REQUIRE_THROWS_AS(f.append("child text that wraps around", -4), WidthError);
        REQUIRE_THROWS_AS(f.append_raw("child", -3), WidthError);
        REQUIRE_THROWS_AS(f.append_raw([]() { return std::vector<std::string>{"row"}; }, -3),
                          WidthError);

        // Extra indent may still reach back to column zero
        f.append("flush", -2);
    }

    REQUIRE(f.lines().size() == 2);
    REQUIRE(f.str() == "parent\nflush");
}

TEST_CASE("Extend with a negative indent stores nothing", "[formatter][extend][errors]") {
    Formatter f(20);
    f.append("head");

    std::vector<Formatter::Line> lines;
    lines.push_back(Formatter::Line{0, "fine", nullptr});
    lines.push_back(Formatter::Line{-2, "bad", nullptr});

    REQUIRE_THROWS_AS(f.extend(lines), WidthError);
    REQUIRE(f.lines().size() == 1);
    REQUIRE(f.str() == "head");
}

// ============================================================================
// Paragraphs
// ============================================================================

TEST_CASE("Paragraph break on an empty buffer does nothing", "[formatter][paragraph]") {
    Formatter f(20);
    f.new_paragraph();

    REQUIRE(f.lines().empty());
    REQUIRE(f.str().empty());
}

TEST_CASE("Repeated paragraph breaks collapse to one blank line", "[formatter][paragraph]") {
    Formatter f(20);
    f.append("first");
    f.new_paragraph();
    f.new_paragraph();
    f.new_paragraph();
    f.append("second");

    REQUIRE(f.lines().size() == 3);
    REQUIRE(f.str() == "first\n\nsecond");
}

TEST_CASE("Empty raw line acts as a paragraph break", "[formatter][paragraph]") {
    Formatter f(20);
    f.append_raw("");
    f.append("first");
    f.append_raw("");
    f.append_raw("");
    f.append("second");

    REQUIRE(f.str() == "first\n\nsecond");
}

TEST_CASE("Empty render hook acts as a paragraph break", "[formatter][paragraph]") {
    Formatter f(20);
    f.append_raw(Formatter::RenderFn{});
    f.append("a");
    f.append_raw(Formatter::RenderFn{});
    f.new_paragraph();
    f.append_raw(Formatter::RenderFn{});
    f.append("b");

    REQUIRE(f.lines().size() == 3);
    REQUIRE(f.str() == "a\n\nb");
}

TEST_CASE("Trailing paragraph break is dropped from output", "[formatter][paragraph]") {
    Formatter f(20);
    f.append("only");
    f.new_paragraph();

    REQUIRE(f.lines().size() == 2);
    REQUIRE(f.str() == "only");
}

// ============================================================================
// Indentation
// ============================================================================

TEST_CASE("Indent scope applies while alive", "[formatter][indent]") {
    Formatter f(20);
    f.append("top");
    {
        auto scope = f.indent();
        REQUIRE(f.indent_level() == 2);
        f.append("inner text here");
    }
    f.append("back");

    REQUIRE(f.indent_level() == 0);
    REQUIRE(f.str() == "top\n  inner text here\nback");
}

TEST_CASE("Nested indent scopes add up", "[formatter][indent]") {
    Formatter f(30);
    {
        auto outer = f.indent(2);
        {
            auto inner = f.indent(3);
            REQUIRE(f.indent_level() == 5);
            REQUIRE(f.get_width() == 25);
            f.append("deep");
        }
        REQUIRE(f.indent_level() == 2);
        f.append("shallow");
    }

    REQUIRE(f.indent_level() == 0);
    REQUIRE(f.str() == "     deep\n  shallow");
}

TEST_CASE("Indent is restored when an exception leaves the scope", "[formatter][indent]") {
    Formatter f(40);
    try {
        auto outer = f.indent(2);
        auto inner = f.indent(3);
        REQUIRE(f.indent_level() == 5);
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }

    REQUIRE(f.indent_level() == 0);
}

TEST_CASE("Indent restored after a width error inside the scope", "[formatter][indent]") {
    Formatter f(6);
    {
        auto scope = f.indent(6);
        REQUIRE_THROWS_AS(f.append("text"), WidthError);
    }

    REQUIRE(f.indent_level() == 0);
    f.append("text");
    REQUIRE(f.str() == "text");
}

TEST_CASE("Indent cannot go below zero", "[formatter][indent]") {
    Formatter f(20);
    REQUIRE_THROWS_AS(f.indent(-1), WidthError);
    REQUIRE(f.indent_level() == 0);

    auto scope = f.indent(4);
    {
        auto back = f.indent(-4);
        REQUIRE(f.indent_level() == 0);
    }
    REQUIRE(f.indent_level() == 4);
}

// ============================================================================
// Extending
// ============================================================================

TEST_CASE("Extend with plain lines uses the current indent", "[formatter][extend]") {
    Formatter f(20);
    f.append("head");
    {
        auto scope = f.indent();
        f.extend(std::vector<std::string>{"one", "two"});
    }

    REQUIRE(f.str() == "head\n  one\n  two");
}

TEST_CASE("Extend starting with a blank line starts a paragraph", "[formatter][extend]") {
    Formatter f(20);
    f.append("head");
    f.new_paragraph();
    f.extend(std::vector<std::string>{"", "body"});

    REQUIRE(f.lines().size() == 3);
    REQUIRE(f.str() == "head\n\nbody");
}

TEST_CASE("Extend with nothing is a no-op", "[formatter][extend]") {
    Formatter f(20);
    f.append("head");
    f.extend(std::vector<std::string>{});
    f.extend(Formatter(20));

    REQUIRE(f.lines().size() == 1);
}

TEST_CASE("Extend keeps relative indentation of a nested formatter", "[formatter][extend]") {
    Formatter inner(20);
    inner.append("x");
    {
        auto scope = inner.indent();
        inner.append("y");
    }

    Formatter outer(20);
    outer.append("title");
    {
        auto scope = outer.indent();
        outer.extend(inner);
    }

    REQUIRE(outer.str() == "title\n  x\n    y");
}

TEST_CASE("Extend carries table rows from a nested formatter", "[formatter][extend][columns]") {
    Formatter inner(20);
    {
        auto table = inner.columns();
        table.append({"a", "b"});
    }

    Formatter outer(20);
    outer.extend(inner);

    REQUIRE(outer.str() == inner.str());
    REQUIRE(outer.str() == "a    b");
}

TEST_CASE("A formatter can extend itself", "[formatter][extend]") {
    Formatter f(20);
    f.append("again");
    f.extend(f);

    REQUIRE(f.str() == "again\nagain");
}

// ============================================================================
// Tables
// ============================================================================

TEST_CASE("Table rows render through the formatter", "[formatter][columns]") {
    Formatter f(20);
    {
        auto table = f.columns(ColumnOptions{2, "  "});
        table.append({"-h", "show help"});
        table.append({"--very-long-flag-name", "a fairly long description that needs wrapping"});
    }

    REQUIRE(f.str() ==
        "-h  show help\n"
        "--very-long-flag-name\n"
        "    a fairly long\n"
        "    description that\n"
        "    needs wrapping");
}

TEST_CASE("Table rows keep the indent current at append time", "[formatter][columns]") {
    Formatter f(30);
    {
        auto scope = f.indent(2);
        auto table = f.columns();
        table.append({"-a", "alpha"});
    }
    f.append("after");

    REQUIRE(f.str() == "  -a   alpha\nafter");
}

TEST_CASE("Table must be closed before output", "[formatter][columns][errors]") {
    Formatter f(20);
    auto table = f.columns();
    table.append({"a", "b"});

    REQUIRE_THROWS_AS(f.str(), StateError);

    table.close();
    REQUIRE(table.layout().is_closed());
    REQUIRE(f.str() == "a    b");
}

TEST_CASE("Closed table rejects rows", "[formatter][columns][errors]") {
    Formatter f(20);
    auto table = f.columns();
    table.append({"a", "b"});
    table.close();

    REQUIRE_THROWS_AS(table.append({"c", "d"}), StateError);
    REQUIRE(f.lines().size() == 1);
}

TEST_CASE("Row with wrong cell count is rejected at append", "[formatter][columns][errors]") {
    Formatter f(20);
    auto table = f.columns();

    REQUIRE_THROWS_AS(table.append({"only one"}), ShapeError);
    REQUIRE_THROWS_AS(table.append({"a", "b", "c"}), ShapeError);
    REQUIRE(f.lines().empty());
}

TEST_CASE("Output is the same every time", "[formatter]") {
    Formatter f(24);
    f.append("Usage: prog [OPTIONS] FILE");
    f.new_paragraph();
    {
        auto scope = f.indent();
        auto table = f.columns();
        table.append({"-o", "output file written after processing"});
        table.append({"--quiet", "say less"});
    }

    std::string first = f.str();
    REQUIRE(f.str() == first);
    REQUIRE(f.str() == first);
}
