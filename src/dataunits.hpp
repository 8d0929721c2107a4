#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>
#include "error.hpp"

using OptValue = std::optional<double>;

struct ColumnNames {
    std::string x = "x [px]";
    std::string y = "y [px]";
    std::string u = "u [px/frame]";
    std::string v = "v [px/frame]";
};

// Column-oriented table of numeric samples, missing entries are nullopt
class SampleTable {
public:
    using Column = std::vector<OptValue>;

    SampleTable() = default;
    explicit SampleTable(const std::vector<std::string>& names) {
        for (const auto& name : names) {
            addColumn(name, Column(nRows_));
        }
    }

    void addColumn(const std::string& name, Column values) {
        if (index_.count(name)) {
            throw SchemaError("Duplicate column name: " + name);
        }
        if (!columns_.empty() && values.size() != nRows_) {
            throw SchemaError("Column " + name + " has " + std::to_string(values.size()) +
                " rows, expected " + std::to_string(nRows_));
        }
        nRows_ = values.size();
        index_[name] = columns_.size();
        names_.push_back(name);
        columns_.push_back(std::move(values));
    }

    void addRow(const std::vector<OptValue>& row) {
        if (row.size() != columns_.size()) {
            throw SchemaError("Row has " + std::to_string(row.size()) +
                " fields, expected " + std::to_string(columns_.size()));
        }
        for (size_t i = 0; i < row.size(); ++i) {
            columns_[i].push_back(row[i]);
        }
        nRows_++;
    }

    bool hasColumn(const std::string& name) const { return index_.count(name) > 0; }

    const Column& column(const std::string& name) const {
        auto it = index_.find(name);
        if (it == index_.end()) {
            throw SchemaError("Required column not found: " + name);
        }
        return columns_[it->second];
    }
    Column& column(const std::string& name) {
        auto it = index_.find(name);
        if (it == index_.end()) {
            throw SchemaError("Required column not found: " + name);
        }
        return columns_[it->second];
    }

    size_t nRows() const { return nRows_; }
    size_t nCols() const { return columns_.size(); }
    const std::vector<std::string>& names() const { return names_; }

private:
    std::vector<std::string> names_;
    std::vector<Column> columns_;
    std::unordered_map<std::string, size_t> index_;
    size_t nRows_ = 0;
};

constexpr int32_t kNumDirections = 8;

struct CorrelationResult {
    OptValue score;        // mean of the directional contributions
    uint64_t nObserved = 0; // cells with >= 1 valid comparison
    uint64_t nGe4 = 0;      // cells with >= 4 valid comparisons
    uint64_t nEq8 = 0;      // cells with all 8 comparisons valid
    std::array<OptValue, kNumDirections> directional;
};

struct SweepRow {
    int32_t radius = 0;
    OptValue radiusUnits;
    CorrelationResult result;
};
