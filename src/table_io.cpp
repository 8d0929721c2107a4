#include "table_io.hpp"
#include "utils.h"
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iomanip>

namespace {

// Split one line on delim, honoring double-quoted fields
void splitFields(std::vector<std::string>& fields, const std::string& line, char delim) {
    fields.clear();
    std::string cur;
    bool quoted = false;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (c == '"') {
            if (quoted && i + 1 < line.size() && line[i + 1] == '"') {
                cur.push_back('"');
                ++i;
            } else {
                quoted = !quoted;
            }
        } else if (c == delim && !quoted) {
            fields.push_back(trim(cur));
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    fields.push_back(trim(cur));
}

bool parseDouble(const std::string& token, double& value) {
    if (token.empty()) return false;
    const char* st = token.c_str();
    char* ed = nullptr;
    errno = 0;
    value = std::strtod(st, &ed);
    return ed != st && *ed == '\0' && errno != ERANGE && std::isfinite(value);
}

void stripCR(std::string& line) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
}

void printValue(FILE* fp, const OptValue& v, const char* fmt) {
    if (v.has_value() && std::isfinite(*v)) {
        fprintf(fp, fmt, *v);
    } else {
        fprintf(fp, "NaN");
    }
}

nlohmann::json optToJson(const OptValue& v) {
    if (v.has_value() && std::isfinite(*v)) return *v;
    return nullptr;
}

} // namespace

bool isMissingToken(const std::string& token) {
    if (token.empty()) return true;
    std::string s = toLower(token);
    return s == "na" || s == "n/a" || s == "nan" || s == "<na>" || s == "null" || s == "none";
}

SampleTable readSampleTable(std::istream& in, int32_t dataStartRow, char delim) {
    if (dataStartRow < 0) {
        throw DomainError("data_start_row must be non-negative");
    }
    std::string line;
    int64_t lineNo = 0;
    for (; lineNo < dataStartRow; ++lineNo) {
        if (!std::getline(in, line)) {
            throw SchemaError("Input ended before the header row " + std::to_string(dataStartRow));
        }
    }
    if (!std::getline(in, line)) {
        throw SchemaError("Input has no header row");
    }
    stripCR(line);
    if (delim == 0) {
        delim = (line.find('\t') != std::string::npos) ? '\t' : ',';
    }
    std::vector<std::string> header;
    splitFields(header, line, delim);
    SampleTable table(header);

    std::vector<std::string> fields;
    std::vector<OptValue> row;
    size_t nUnparsable = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        stripCR(line);
        if (trim(line).empty()) continue;
        splitFields(fields, line, delim);
        if (fields.size() != header.size()) {
            throw SchemaError("Line " + std::to_string(lineNo + 1) + " has " + std::to_string(fields.size()) +
                " fields, the header has " + std::to_string(header.size()));
        }
        row.assign(fields.size(), std::nullopt);
        for (size_t i = 0; i < fields.size(); ++i) {
            double v;
            if (isMissingToken(fields[i])) continue;
            if (parseDouble(fields[i], v)) {
                row[i] = v;
            } else {
                nUnparsable++;
            }
        }
        table.addRow(row);
    }
    if (nUnparsable > 0) {
        warning("%s: %zu non-numeric or non-finite fields were read as missing", __func__, nUnparsable);
    }
    debug("%s: read %zu rows with %zu columns", __func__, table.nRows(), table.nCols());
    return table;
}

SampleTable readSampleTable(const std::string& path, int32_t dataStartRow, char delim) {
    std::ifstream in(path);
    if (!in.is_open()) {
        error("Error opening input file: %s", path.c_str());
    }
    if (delim == 0) {
        const std::string ext = ".tsv";
        if (path.size() >= ext.size() && toLower(path.substr(path.size() - ext.size())) == ext) {
            delim = '\t';
        }
    }
    SampleTable table = readSampleTable(in, dataStartRow, delim);
    notice("Read %zu samples from %s", table.nRows(), path.c_str());
    return table;
}

void writeSweepTable(FILE* fp, const std::vector<SweepRow>& rows, char delim, bool directional) {
    fprintf(fp, "radius%cradius_units%ccorr%cn_observed%cn_ge4%cn_eq8", delim, delim, delim, delim, delim);
    if (directional) {
        for (int32_t k = 0; k < kNumDirections; ++k) fprintf(fp, "%ccorr_d%d", delim, k);
    }
    fprintf(fp, "\n");
    for (const auto& row : rows) {
        fprintf(fp, "%d%c", row.radius, delim);
        printValue(fp, row.radiusUnits, "%.10g");
        fprintf(fp, "%c", delim);
        printValue(fp, row.result.score, "%.8g");
        fprintf(fp, "%c%llu%c%llu%c%llu", delim,
            static_cast<unsigned long long>(row.result.nObserved), delim,
            static_cast<unsigned long long>(row.result.nGe4), delim,
            static_cast<unsigned long long>(row.result.nEq8));
        if (directional) {
            for (const auto& c : row.result.directional) {
                fprintf(fp, "%c", delim);
                printValue(fp, c, "%.8g");
            }
        }
        fprintf(fp, "\n");
    }
}

void writeSweepTable(const std::string& path, const std::vector<SweepRow>& rows, char delim, bool directional) {
    FILE* fp = fopen(path.c_str(), "w");
    if (!fp) {
        error("%s: Cannot open output file %s", __func__, path.c_str());
    }
    writeSweepTable(fp, rows, delim, directional);
    if (fclose(fp) != 0) {
        error("%s: Error closing output file %s", __func__, path.c_str());
    }
    notice("%s: wrote %zu rows to %s", __func__, rows.size(), path.c_str());
}

nlohmann::json sweepToJson(const SweepOutput& out, const SweepConfig& config) {
    nlohmann::json js;
    js["conversion_factor"] = out.conversionFactor;
    js["conversion_factor_inferred"] = out.factorInferred;
    js["grid"] = {{"height", out.height}, {"width", out.width}};
    js["n_samples"] = out.nSamples;
    js["n_observed_cells"] = out.nObserved;
    js["config"] = config.toJson();
    nlohmann::json results = nlohmann::json::array();
    for (const auto& row : out.rows) {
        nlohmann::json r;
        r["radius"] = row.radius;
        r["radius_units"] = optToJson(row.radiusUnits);
        r["corr"] = optToJson(row.result.score);
        r["n_observed"] = row.result.nObserved;
        r["n_ge4"] = row.result.nGe4;
        r["n_eq8"] = row.result.nEq8;
        if (config.directional) {
            nlohmann::json d = nlohmann::json::array();
            for (const auto& c : row.result.directional) d.push_back(optToJson(c));
            r["directional"] = d;
        }
        results.push_back(r);
    }
    js["results"] = results;
    return js;
}

void writeSweepJson(const std::string& path, const SweepOutput& out, const SweepConfig& config) {
    std::ofstream jsonOut(path);
    if (!jsonOut) {
        error("Error opening json output file: %s", path.c_str());
    }
    jsonOut << std::setw(4) << sweepToJson(out, config) << std::endl;
    jsonOut.close();
}

void writeFieldTable(const std::string& path, const VectorField& field, char delim) {
    FILE* fp = fopen(path.c_str(), "w");
    if (!fp) {
        error("%s: Cannot open output file %s", __func__, path.c_str());
    }
    fprintf(fp, "x%cy%cu%cv\n", delim, delim, delim);
    for (int32_t y = 0; y < field.height(); ++y) {
        for (int32_t x = 0; x < field.width(); ++x) {
            auto vel = field.at(y, x);
            if (vel) {
                fprintf(fp, "%d%c%d%c%.10g%c%.10g\n", x, delim, y, delim, (*vel)(0), delim, (*vel)(1));
            } else {
                fprintf(fp, "%d%c%d%cNaN%cNaN\n", x, delim, y, delim, delim);
            }
        }
    }
    if (fclose(fp) != 0) {
        error("%s: Error closing output file %s", __func__, path.c_str());
    }
}
