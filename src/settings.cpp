#include "settings.hpp"
#include "verbose.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace helpfmt {

using json = nlohmann::json;

std::optional<Settings> load_settings(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            verbose_err(LogCategory::Settings, "cannot check " + path + ": " + ec.message());
        } else {
            verbose_log(LogCategory::Settings, "no settings file at " + path);
        }
        return std::nullopt;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        verbose_err(LogCategory::Settings, "cannot open " + path);
        return std::nullopt;
    }

    try {
        json j;
        file >> j;

        Settings settings;
        if (j.contains("width") && j["width"].is_number_integer()) {
            settings.width = j["width"].get<int>();
        }
        settings.indent = j.value("indent", DEFAULT_INDENT);
        settings.separator = j.value("separator", std::string(DEFAULT_SEPARATOR));
        if (j.contains("first_column_max") && j["first_column_max"].is_number()) {
            settings.first_column_max = j["first_column_max"].get<double>();
        }

        verbose_log(LogCategory::Settings, "loaded " + path);
        return settings;
    } catch (const json::exception& e) {
        verbose_err(LogCategory::Settings, std::string("invalid ") + path + ": " + e.what());
        return std::nullopt;
    }
}

void save_settings(const Settings& settings, const std::string& path) {
    json j;
    if (settings.width) {
        j["width"] = *settings.width;
    }
    j["indent"] = settings.indent;
    j["separator"] = settings.separator;
    if (settings.first_column_max) {
        j["first_column_max"] = *settings.first_column_max;
    }

    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to write settings to " + path);
    }
    file << j.dump(2) << std::endl;
    verbose_log(LogCategory::Settings, "saved " + path);
}

} // namespace helpfmt
