#include "help_document.hpp"
#include "formatter.hpp"
#include "verbose.hpp"

#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace helpfmt {

using json = nlohmann::json;

namespace {
    // Accepts either a string or an array of strings
    std::vector<std::string> read_paragraphs(const json& j, const char* key) {
        std::vector<std::string> paragraphs;
        if (!j.contains(key) || j[key].is_null()) {
            return paragraphs;
        }
        const json& value = j[key];
        if (value.is_string()) {
            paragraphs.push_back(value.get<std::string>());
            return paragraphs;
        }
        if (!value.is_array()) {
            throw DocumentError(std::string("\"") + key + "\" must be a string or an array of strings");
        }
        for (const auto& item : value) {
            if (!item.is_string()) {
                throw DocumentError(std::string("\"") + key + "\" must only contain strings");
            }
            paragraphs.push_back(item.get<std::string>());
        }
        return paragraphs;
    }

    HelpSection read_section(const json& j, size_t index) {
        if (!j.is_object()) {
            throw DocumentError("section " + std::to_string(index) + " must be an object");
        }

        HelpSection section;
        section.title = j.value("title", "");
        section.text = read_paragraphs(j, "text");

        if (j.contains("rows")) {
            if (!j["rows"].is_array()) {
                throw DocumentError("\"rows\" of section " + std::to_string(index) + " must be an array");
            }
            for (const auto& row_json : j["rows"]) {
                if (!row_json.is_array()) {
                    throw DocumentError("each row of section " + std::to_string(index) +
                                        " must be an array of strings");
                }
                std::vector<std::string> row;
                for (const auto& cell : row_json) {
                    if (!cell.is_string()) {
                        throw DocumentError("table cells must be strings");
                    }
                    row.push_back(cell.get<std::string>());
                }
                section.rows.push_back(std::move(row));
            }
        }
        return section;
    }
}

HelpDocument parse_help_document(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw DocumentError(std::string("invalid JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw DocumentError("a help document must be a JSON object");
    }

    try {
        HelpDocument doc;
        doc.usage = j.value("usage", "");
        doc.description = read_paragraphs(j, "description");
        doc.footer = read_paragraphs(j, "footer");

        if (j.contains("sections")) {
            if (!j["sections"].is_array()) {
                throw DocumentError("\"sections\" must be an array");
            }
            size_t index = 0;
            for (const auto& section_json : j["sections"]) {
                doc.sections.push_back(read_section(section_json, index++));
            }
        }

        verbose_log(LogCategory::Document, std::to_string(doc.sections.size()) + " sections, usage: " +
                    truncate(doc.usage, 60));
        return doc;
    } catch (const json::exception& e) {
        throw DocumentError(std::string("malformed help document: ") + e.what());
    }
}

HelpDocument load_help_document(std::istream& in) {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parse_help_document(buffer.str());
}

HelpDocument load_help_document(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw DocumentError("cannot open " + path);
    }
    verbose_log(LogCategory::Document, "reading " + path);
    return load_help_document(file);
}

ColumnOptions table_options(const Settings& settings, size_t count) {
    ColumnOptions options;
    options.count = count;
    options.separator = settings.separator;
    if (settings.first_column_max) {
        options.max_widths.assign(count, std::nullopt);
        options.max_widths[0] = WidthSpec::fraction(*settings.first_column_max);
    }
    return options;
}

void render_help(const HelpDocument& doc, Formatter& formatter, const Settings& settings) {
    if (!doc.usage.empty()) {
        formatter.append("Usage: " + doc.usage);
    }

    for (const auto& paragraph : doc.description) {
        formatter.new_paragraph();
        formatter.append(paragraph);
    }

    for (const auto& section : doc.sections) {
        formatter.new_paragraph();
        if (!section.title.empty()) {
            formatter.append(section.title);
        }

        auto scope = formatter.indent(settings.indent);
        for (const auto& paragraph : section.text) {
            formatter.append(paragraph);
            formatter.new_paragraph();
        }
        if (section.rows.empty()) {
            continue;
        }

        auto table = formatter.columns(table_options(settings, section.rows.front().size()));
        for (const auto& row : section.rows) {
            table.append(row);
        }
    }

    for (const auto& paragraph : doc.footer) {
        formatter.new_paragraph();
        formatter.append(paragraph);
    }
}

} // namespace helpfmt
