#include "gridunits.hpp"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace {

double roundDecimals(double v, int32_t rnd) {
    if (rnd < 0) return v;
    const double p = std::pow(10.0, rnd);
    return std::round(v * p) / p;
}

std::string formatValue(double v) {
    std::ostringstream oss;
    oss.precision(17);
    oss << v;
    return oss.str();
}

// Minimum of a position column; missing positions are rejected
double positionMin(const SampleTable::Column& values, const std::string& name) {
    double vmin = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < values.size(); ++i) {
        if (!values[i].has_value() || std::isnan(*values[i])) {
            throw DomainError("Position column " + name + " has a missing value at row " + std::to_string(i));
        }
        vmin = std::min(vmin, *values[i]);
    }
    return vmin;
}

} // namespace

double gcdFp(double x, double y, double rtol, double atol, int32_t rnd) {
    const double t = std::min(std::abs(x), std::abs(y));
    while (std::abs(y) > rtol * t + atol) {
        // floored remainder, carrying the sign of the divisor
        double r = std::fmod(x, y);
        if (r != 0 && ((r < 0) != (y < 0))) r += y;
        x = y;
        y = r;
    }
    return roundDecimals(x, rnd);
}

double axisGcd(const SampleTable::Column& values, const GcdOptions& opts, const std::string& label) {
    if (values.size() < 2) {
        throw DomainError("At least two samples are needed to infer the grid step of " + label);
    }
    const double vmin = positionMin(values, label);
    double g = gcdFp(*values[0] - vmin, *values[1] - vmin, opts.rtol, opts.atol, opts.rnd);
    for (size_t i = 2; i < values.size(); ++i) {
        g = gcdFp(g, *values[i] - vmin, opts.rtol, opts.atol, opts.rnd);
    }
    debug("%s: grid step of %s is %.12g", __func__, label.c_str(), g);
    return std::abs(g);
}

double findConversionFactor(const SampleTable& samples, const std::string& xcol, const std::string& ycol,
    const GcdOptions& opts) {
    const double gx = axisGcd(samples.column(xcol), opts, xcol);
    const double gy = axisGcd(samples.column(ycol), opts, ycol);
    if (gx <= kMinConversionFactor || gy <= kMinConversionFactor) {
        throw DomainError("Degenerate grid step (" + xcol + ": " + formatValue(gx) + ", " + ycol + ": " +
            formatValue(gy) + "); each axis needs at least two distinct coordinates");
    }
    if (gx != gy) {
        throw ConsistencyError("Grid steps of the x and y axes differ (" + xcol + ": " + formatValue(gx) +
            ", " + ycol + ": " + formatValue(gy) + "); provide the conversion factor explicitly");
    }
    return gx;
}

SampleTable rescalePositions(const SampleTable& samples, double conversionFactor,
    const std::string& xcol, const std::string& ycol) {
    if (!(conversionFactor > 0) || !std::isfinite(conversionFactor)) {
        throw DomainError("Conversion factor must be positive, got " + formatValue(conversionFactor));
    }
    SampleTable out = samples;
    for (const auto& name : {xcol, ycol}) {
        auto& col = out.column(name);
        const double vmin = positionMin(col, name);
        for (size_t i = 0; i < col.size(); ++i) {
            double scaled = (*col[i] - vmin) / conversionFactor;
            double idx = std::floor(scaled + kGridTol);
            if (std::abs(scaled - idx) > kGridTol) {
                throw DomainError("Cannot safely cast rescaled " + name + " value " + formatValue(scaled) +
                    " (row " + std::to_string(i) + ") to an integer; confirm the step size and conversion factor");
            }
            col[i] = idx;
        }
    }
    return out;
}

GridScale GridScale::fromConversionFactor(double conversionFactor) {
    if (!(conversionFactor > 0) || !std::isfinite(conversionFactor)) {
        throw DomainError("Conversion factor must be positive, got " + formatValue(conversionFactor));
    }
    return GridScale(conversionFactor, false);
}

GridScale GridScale::fromStepSize(int32_t stepSize, double pixelToUnit) {
    if (stepSize <= 0) {
        throw DomainError("Grid step size must be a positive integer, got " + std::to_string(stepSize));
    }
    if (!(pixelToUnit > 0) || !std::isfinite(pixelToUnit)) {
        throw DomainError("Pixel to unit conversion must be positive, got " + formatValue(pixelToUnit));
    }
    return GridScale(stepSize * pixelToUnit, false);
}

GridScale GridScale::infer(const SampleTable& samples, const ColumnNames& cols, const GcdOptions& opts) {
    return GridScale(findConversionFactor(samples, cols.x, cols.y, opts), true);
}

GridScale GridScale::resolve(const SampleTable& samples, const ColumnNames& cols,
    std::optional<double> pixelToUnit, std::optional<int32_t> gridStepSize) {
    if (gridStepSize.has_value()) {
        GridScale scale = fromStepSize(*gridStepSize, pixelToUnit.value_or(1.0));
        notice("Grid step %d x %.6g units per pixel: conversion factor %.12g",
            *gridStepSize, pixelToUnit.value_or(1.0), scale.factor());
        return scale;
    }
    if (pixelToUnit.has_value()) {
        GridScale scale = fromConversionFactor(*pixelToUnit);
        notice("Using conversion factor %.12g", scale.factor());
        return scale;
    }
    GridScale scale = infer(samples, cols);
    notice("Inferred conversion factor %.12g from %zu samples", scale.factor(), samples.nRows());
    return scale;
}
