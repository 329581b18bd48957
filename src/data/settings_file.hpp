#pragma once

// settings_file.hpp — Settings overrides from a JSON object:
//   {"predominance_fraction": 0.65, "pivot_window": 2}
// Keys are Settings field names; unknown keys and non-numeric values are
// usage errors.

#include "backtest/settings.hpp"
#include "data/input_error.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <filesystem>
#include <fstream>
#include <string>

namespace settings_file {

inline Settings apply(const nlohmann::json& doc, Settings base) {
    if (!doc.is_object()) {
        throw InputError(exit_code::USAGE,
                         std::string("Settings file must hold an object, got ") + doc.type_name());
    }
    for (const auto& [key, value] : doc.items()) {
        const auto* field = settings_fields::by_key(key);
        if (!field) {
            throw InputError(exit_code::USAGE, "Unknown settings key '" + key + "'");
        }
        if (!value.is_number()) {
            throw InputError(exit_code::USAGE, "Settings key '" + key + "' must be a number");
        }
        double v = value.get<double>();
        if (!settings_fields::accepts(*field, v)) {
            throw InputError(exit_code::USAGE, "Settings key '" + key + "' is out of range");
        }
        if (field->integral && v != std::floor(v)) {
            throw InputError(exit_code::USAGE, "Settings key '" + key + "' must be an integer");
        }
        field->set(base, v);
    }
    return base;
}

inline Settings load(const std::string& path, const Settings& base) {
    if (!std::filesystem::exists(path)) {
        throw InputError(exit_code::FILE_NOT_FOUND, "Settings file not found: " + path);
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Cannot open settings file: " + path);
    }
    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw InputError(exit_code::USAGE, "Invalid JSON in " + path + ": " + e.what());
    }
    return settings_file::apply(doc, base);
}

}  // namespace settings_file
