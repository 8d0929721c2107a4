#pragma once

#include <cstdint>
#include <cstdio>
#include <istream>
#include <string>
#include <vector>
#include "dataunits.hpp"
#include "radiussweep.hpp"
#include "vectorfield.hpp"

// True for empty fields and the usual NA spellings
bool isMissingToken(const std::string& token);

// Read a delimited text table. Lines before dataStartRow are skipped, the line
// at dataStartRow is the header. delim == 0 picks tab if the header has one,
// comma otherwise. Unparsable values are read as missing
SampleTable readSampleTable(std::istream& in, int32_t dataStartRow = 0, char delim = 0);
SampleTable readSampleTable(const std::string& path, int32_t dataStartRow = 0, char delim = 0);

void writeSweepTable(FILE* fp, const std::vector<SweepRow>& rows, char delim = ',', bool directional = false);
void writeSweepTable(const std::string& path, const std::vector<SweepRow>& rows, char delim = ',', bool directional = false);

nlohmann::json sweepToJson(const SweepOutput& out, const SweepConfig& config);
void writeSweepJson(const std::string& path, const SweepOutput& out, const SweepConfig& config);

// One x, y, u, v line per grid cell, NaN for missing velocities
void writeFieldTable(const std::string& path, const VectorField& field, char delim = ',');
