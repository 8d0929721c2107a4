#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>
#include "dataunits.hpp"
#include "gridunits.hpp"
#include "sweepconfig.hpp"
#include "vectorfield.hpp"

// Everything a sweep produced, for reporting
struct SweepOutput {
    double conversionFactor = 1.0;
    bool factorInferred = false;
    int32_t height = 0;
    int32_t width = 0;
    size_t nSamples = 0;
    size_t nObserved = 0;
    std::vector<SweepRow> rows;
};

class RadiusSweep {
public:
    explicit RadiusSweep(const SweepConfig& config) : config_(config) {
        config_.validate();
    }

    // Configured radii clipped to [1, min(H, W) - 1], ascending.
    // Throws DomainError if none remain
    std::vector<int32_t> radii(const VectorField& field) const;

    // One row per radius, in radius order regardless of the thread count
    std::vector<SweepRow> run(const VectorField& field, std::optional<double> unitsPerStep = std::nullopt) const;

    // Resolve the grid scale, rescale, densify and sweep
    SweepOutput run(const SampleTable& samples) const;

    // Resolved grid scale and the rescaled, densified field of a sample table
    std::pair<GridScale, VectorField> prepareField(const SampleTable& samples) const;

    const SweepConfig& config() const { return config_; }

private:
    SweepConfig config_;
};
