#include "config.hpp"
#include "console.hpp"
#include "formatter.hpp"
#include "help_document.hpp"
#include "settings.hpp"
#include "terminal.hpp"
#include "verbose.hpp"

#include <CLI/CLI.hpp>
#include <iostream>

using namespace helpfmt;

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Lay out structured help text for the terminal"};
    app.footer("\nExamples:\n"
               "  helpfmt help.json                 Render at the terminal width\n"
               "  helpfmt -w 60 help.json           Render 60 columns wide\n"
               "  cat help.json | helpfmt -         Read the document from stdin\n"
               "  helpfmt -w 72 --save-settings     Remember the width in .helpfmt.json\n");

    std::string document_path = "-";
    app.add_option("document", document_path, "JSON help document to render ('-' reads stdin)");

    int width = 0;
    auto* width_opt = app.add_option("-w,--width", width, "Output width (default: terminal width)")
        ->check(CLI::Range(1, 1000));

    int indent = DEFAULT_INDENT;
    auto* indent_opt = app.add_option("-i,--indent", indent, "Indent of section bodies (default: 2)")
        ->check(CLI::Range(0, 100));

    std::string separator;
    auto* separator_opt = app.add_option("--separator", separator,
                                         "Text between table columns (default: three spaces)");

    std::string settings_path = SETTINGS_FILE;
    app.add_option("--settings", settings_path, "Settings file (default: .helpfmt.json)");

    bool save = false;
    app.add_flag("--save-settings", save, "Store the effective settings and exit");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log settings, document and layout details to stderr");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);
    Console console;

    try {
        Settings settings = load_settings(settings_path).value_or(Settings{});
        if (width_opt->count() > 0) {
            settings.width = width;
        }
        if (indent_opt->count() > 0) {
            settings.indent = indent;
        }
        if (separator_opt->count() > 0) {
            settings.separator = separator;
        }

        if (save) {
            save_settings(settings, settings_path);
            console.print_success("Saved settings to " + settings_path);
            return 0;
        }

        HelpDocument doc = (document_path == "-")
            ? load_help_document(std::cin)
            : load_help_document(document_path);

        int output_width = settings.width.value_or(terminal::get_width());
        verbose_log(LogCategory::Layout, "width " + std::to_string(output_width) +
                    (terminal::is_tty() ? " (tty)" : ""));

        Formatter formatter(output_width);
        render_help(doc, formatter, settings);
        console.println(formatter.str());
    } catch (const std::exception& e) {
        console.print_error("Error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
