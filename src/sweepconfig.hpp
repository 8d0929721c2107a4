#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "dataunits.hpp"
#include "velocitycorr.hpp"
#include <nlohmann/json.hpp>

struct SweepConfig {
    int32_t dataStartRow = 0; // 0-based line index of the header row
    int32_t minRadius = 1;
    int32_t maxRadius = 25;
    int32_t radiusStep = 1;
    std::optional<double> pixelToUnit;  // conversion factor, inferred when absent
    std::optional<int32_t> gridStepSize; // legacy: step in pixels, combined with pixelToUnit
    ColumnNames columns;
    char delimiter = 0; // 0 for auto
    CorrAveraging averaging = CorrAveraging::Arithmetic;
    bool directional = false;
    int32_t threads = 1;

    // Throws DomainError on an invalid combination
    void validate() const;
    void updateFromJson(const nlohmann::json& js);
    nlohmann::json toJson() const;
};

// Load a JSON configuration file on top of the defaults
SweepConfig loadSweepConfig(const std::string& jsonFile);
char parseDelimiter(const std::string& str);
