#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "dataunits.hpp"

// Tolerance for accepting a rescaled coordinate as an integer grid index
constexpr double kGridTol = 1e-5;
// Conversion factors at or below this are degenerate (duplicate coordinates)
constexpr double kMinConversionFactor = 1e-9;

struct GcdOptions {
    double rtol = 1e-5;
    double atol = 1e-10;
    int32_t rnd = 12; // decimal places, < 0 disables rounding
};

// Euclid's algorithm on reals: iterate (x, y) <- (y, x mod y) while
// |y| > rtol * min(|x0|, |y0|) + atol
double gcdFp(double x, double y, double rtol = 1e-5, double atol = 1e-10, int32_t rnd = -1);

// Pairwise gcdFp reduction over (values - min(values)), seeded with the first two
double axisGcd(const SampleTable::Column& values, const GcdOptions& opts = GcdOptions(), const std::string& label = "");

// Shared raw-units-per-grid-step factor of the x and y axes.
// Throws ConsistencyError if the axes disagree, DomainError if degenerate
double findConversionFactor(const SampleTable& samples, const std::string& xcol, const std::string& ycol,
    const GcdOptions& opts = GcdOptions());

// Returns a copy with (raw - min(raw)) / factor on both position columns,
// each value checked to be within kGridTol of an integer
SampleTable rescalePositions(const SampleTable& samples, double conversionFactor,
    const std::string& xcol, const std::string& ycol);

// Resolved conversion between raw coordinates and grid steps
class GridScale {
public:
    static GridScale fromConversionFactor(double conversionFactor);
    // Legacy form: observations every stepSize pixels of pixelToUnit units each
    static GridScale fromStepSize(int32_t stepSize, double pixelToUnit = 1.0);
    static GridScale infer(const SampleTable& samples, const ColumnNames& cols, const GcdOptions& opts = GcdOptions());
    static GridScale resolve(const SampleTable& samples, const ColumnNames& cols,
        std::optional<double> pixelToUnit, std::optional<int32_t> gridStepSize);

    double factor() const { return factor_; }
    bool inferred() const { return inferred_; }
    SampleTable rescale(const SampleTable& samples, const ColumnNames& cols) const {
        return rescalePositions(samples, factor_, cols.x, cols.y);
    }

private:
    GridScale(double factor, bool inferred) : factor_(factor), inferred_(inferred) {}
    double factor_;
    bool inferred_;
};
