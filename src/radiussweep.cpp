#include "radiussweep.hpp"
#include "utils.h"
#include <algorithm>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

std::vector<int32_t> RadiusSweep::radii(const VectorField& field) const {
    const int32_t rMax = std::min(field.height(), field.width()) - 1;
    std::vector<int32_t> out;
    int32_t nDropped = 0;
    for (int64_t r = config_.minRadius; r <= config_.maxRadius; r += config_.radiusStep) {
        if (r <= rMax) {
            out.push_back(static_cast<int32_t>(r));
        } else {
            nDropped++;
        }
    }
    if (nDropped > 0) {
        warning("%s: skipping %d radii beyond the largest valid radius %d of a %d x %d field",
            __func__, nDropped, rMax, field.height(), field.width());
    }
    if (out.empty()) {
        throw DomainError("No radius in [" + std::to_string(config_.minRadius) + ", " +
            std::to_string(config_.maxRadius) + "] fits a " + std::to_string(field.height()) + " x " +
            std::to_string(field.width()) + " field");
    }
    return out;
}

std::vector<SweepRow> RadiusSweep::run(const VectorField& field, std::optional<double> unitsPerStep) const {
    const std::vector<int32_t> rs = radii(field);
    VelocityCorrelator corr(field, config_.averaging);
    std::vector<SweepRow> rows(rs.size());
    auto processRadius = [&](size_t i) {
        rows[i].radius = rs[i];
        if (unitsPerStep.has_value()) {
            rows[i].radiusUnits = rs[i] * (*unitsPerStep);
        }
        rows[i].result = corr.compute(rs[i]);
        debug("%s: r=%d n_observed=%llu", __func__, rs[i],
            static_cast<unsigned long long>(rows[i].result.nObserved));
    };
    if (config_.threads > 1 && rs.size() > 1) {
        tbb::global_control globalLimit(tbb::global_control::max_allowed_parallelism,
            static_cast<size_t>(config_.threads));
        tbb::parallel_for(tbb::blocked_range<size_t>(0, rs.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i < range.end(); ++i) {
                    processRadius(i);
                }
            });
    } else {
        for (size_t i = 0; i < rs.size(); ++i) {
            processRadius(i);
        }
    }
    notice("%s: computed %zu radii (%d to %d) with %d thread(s)", __func__, rs.size(),
        rs.front(), rs.back(), config_.threads);
    return rows;
}

std::pair<GridScale, VectorField> RadiusSweep::prepareField(const SampleTable& samples) const {
    const auto& cols = config_.columns;
    for (const auto& name : {cols.x, cols.y, cols.u, cols.v}) {
        if (!samples.hasColumn(name)) {
            throw SchemaError("Required column not found: " + name);
        }
    }
    GridScale scale = GridScale::resolve(samples, cols, config_.pixelToUnit, config_.gridStepSize);
    SampleTable rescaled = scale.rescale(samples, cols);
    VectorField field = squareInput(rescaled, cols);
    notice("%s: %d x %d grid with %zu of %zu cells observed", __func__,
        field.height(), field.width(), field.nObserved(), field.nCells());
    return {scale, std::move(field)};
}

SweepOutput RadiusSweep::run(const SampleTable& samples) const {
    auto [scale, field] = prepareField(samples);
    SweepOutput out;
    out.conversionFactor = scale.factor();
    out.factorInferred = scale.inferred();
    out.height = field.height();
    out.width = field.width();
    out.nSamples = samples.nRows();
    out.nObserved = field.nObserved();
    out.rows = run(field, scale.factor());
    return out;
}
