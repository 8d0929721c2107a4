#include "sweepconfig.hpp"
#include "utils.h"
#include <fstream>
#include <set>

namespace {

// Integer options must be JSON integers; 1.3 is not silently read as 1
int32_t getInt(const nlohmann::json& js, const char* key) {
    const auto& v = js[key];
    if (!v.is_number_integer()) {
        throw SchemaError(std::string("Configuration key '") + key + "' must be an integer, got " + v.dump());
    }
    return v.get<int32_t>();
}

} // namespace

void SweepConfig::validate() const {
    if (dataStartRow < 0) {
        throw DomainError("data_start_row must be non-negative, got " + std::to_string(dataStartRow));
    }
    if (minRadius < 1) {
        throw DomainError("min_radius must be at least 1, got " + std::to_string(minRadius));
    }
    if (maxRadius < minRadius) {
        throw DomainError("max_radius (" + std::to_string(maxRadius) + ") is smaller than min_radius (" +
            std::to_string(minRadius) + ")");
    }
    if (radiusStep < 1) {
        throw DomainError("radius_step must be at least 1, got " + std::to_string(radiusStep));
    }
    if (pixelToUnit.has_value() && !(*pixelToUnit > 0)) {
        throw DomainError("pixel_to_unit_conversion_factor must be positive, got " + std::to_string(*pixelToUnit));
    }
    if (gridStepSize.has_value() && *gridStepSize <= 0) {
        throw DomainError("grid_step_size must be positive, got " + std::to_string(*gridStepSize));
    }
    if (threads < 1) {
        throw DomainError("threads must be at least 1, got " + std::to_string(threads));
    }
}

char parseDelimiter(const std::string& str) {
    std::string s = toLower(str);
    if (s.empty() || s == "auto") return 0;
    if (s == "tab" || s == "\\t" || s == "\t") return '\t';
    if (s == "comma") return ',';
    if (s == "space") return ' ';
    if (s == "semicolon") return ';';
    if (s.size() == 1) return s[0];
    throw DomainError("Unrecognized delimiter: " + str);
}

void SweepConfig::updateFromJson(const nlohmann::json& js) {
    static const std::set<std::string> known = {
        "data_start_row", "min_radius", "max_radius", "radius_step",
        "pixel_to_unit_conversion_factor", "grid_step_size",
        "x_col", "y_col", "u_col", "v_col",
        "delimiter", "averaging", "directional", "threads"};
    if (!js.is_object()) {
        throw SchemaError("Configuration must be a JSON object");
    }
    for (auto it = js.begin(); it != js.end(); ++it) {
        if (known.count(it.key()) == 0) {
            warning("%s: ignoring unknown configuration key '%s'", __func__, it.key().c_str());
        }
    }
    try {
        if (js.contains("data_start_row")) dataStartRow = getInt(js, "data_start_row");
        if (js.contains("min_radius")) minRadius = getInt(js, "min_radius");
        if (js.contains("max_radius")) maxRadius = getInt(js, "max_radius");
        if (js.contains("radius_step")) radiusStep = getInt(js, "radius_step");
        if (js.contains("pixel_to_unit_conversion_factor") && !js["pixel_to_unit_conversion_factor"].is_null())
            pixelToUnit = js["pixel_to_unit_conversion_factor"].get<double>();
        if (js.contains("grid_step_size") && !js["grid_step_size"].is_null())
            gridStepSize = getInt(js, "grid_step_size");
        if (js.contains("x_col")) columns.x = js["x_col"].get<std::string>();
        if (js.contains("y_col")) columns.y = js["y_col"].get<std::string>();
        if (js.contains("u_col")) columns.u = js["u_col"].get<std::string>();
        if (js.contains("v_col")) columns.v = js["v_col"].get<std::string>();
        if (js.contains("delimiter")) delimiter = parseDelimiter(js["delimiter"].get<std::string>());
        if (js.contains("averaging")) averaging = parseCorrAveraging(js["averaging"].get<std::string>());
        if (js.contains("directional")) directional = js["directional"].get<bool>();
        if (js.contains("threads")) threads = getInt(js, "threads");
    } catch (const nlohmann::json::type_error& ex) {
        throw SchemaError(std::string("Invalid value type in configuration: ") + ex.what());
    }
}

nlohmann::json SweepConfig::toJson() const {
    nlohmann::json js;
    js["data_start_row"] = dataStartRow;
    js["min_radius"] = minRadius;
    js["max_radius"] = maxRadius;
    js["radius_step"] = radiusStep;
    js["pixel_to_unit_conversion_factor"] = pixelToUnit.has_value() ? nlohmann::json(*pixelToUnit) : nlohmann::json();
    js["grid_step_size"] = gridStepSize.has_value() ? nlohmann::json(*gridStepSize) : nlohmann::json();
    js["x_col"] = columns.x;
    js["y_col"] = columns.y;
    js["u_col"] = columns.u;
    js["v_col"] = columns.v;
    js["delimiter"] = delimiter == 0 ? std::string("auto") : std::string(1, delimiter);
    js["averaging"] = corrAveragingName(averaging);
    js["directional"] = directional;
    js["threads"] = threads;
    return js;
}

SweepConfig loadSweepConfig(const std::string& jsonFile) {
    std::ifstream in(jsonFile);
    if (!in.is_open()) {
        error("Error opening configuration file: %s", jsonFile.c_str());
    }
    nlohmann::json js;
    try {
        in >> js;
    } catch (const std::exception& ex) {
        error("Error parsing JSON configuration %s: %s", jsonFile.c_str(), ex.what());
    }
    SweepConfig config;
    config.updateFromJson(js);
    notice("Loaded configuration from %s", jsonFile.c_str());
    return config;
}
