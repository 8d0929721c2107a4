#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include "dataunits.hpp"
#include "vectorfield.hpp"

enum class CorrAveraging : uint8_t { Arithmetic, Fisher };

CorrAveraging parseCorrAveraging(const std::string& name);
const char* corrAveragingName(CorrAveraging avg);

// Offsets round(r cos(k pi/4), r sin(k pi/4)) for k = 0..7
std::array<std::pair<int32_t, int32_t>, kNumDirections> compassOffsets(int32_t radius);

/// Spatial velocity autocorrelation of a dense field (Dombrowski et al. 2004).
/// For each of the 8 compass offsets at a given radius, the mean dot product
/// of all valid (cell, neighbor) pairs is normalized as
///     (<v(x) . v(x + d)> - <v>.<v>) / (<|v|^2> - <v>.<v>)
/// with the global terms taken over all observed cells. The score averages the
/// available directional contributions. Observation counts are per center cell.
class VelocityCorrelator {
public:
    explicit VelocityCorrelator(const VectorField& field, CorrAveraging averaging = CorrAveraging::Arithmetic);
    // The field is referenced, not copied, so it must outlive the correlator
    VelocityCorrelator(VectorField&&, CorrAveraging = CorrAveraging::Arithmetic) = delete;

    // Throws DomainError unless 1 <= radius < min(H, W)
    CorrelationResult compute(int32_t radius) const;

    int32_t maxRadius() const { return std::min(field_.height(), field_.width()) - 1; }
    double meanSquaredSpeed() const { return meanSqSpeed_; }
    const Eigen::Vector2d& meanVelocity() const { return meanVec_; }
    bool uniform() const { return uniform_; }

private:
    const VectorField& field_;
    CorrAveraging averaging_;
    double meanSqSpeed_ = 0;
    double meanVecSq_ = 0;
    Eigen::Vector2d meanVec_ = Eigen::Vector2d::Zero();
    bool uniform_ = false;

    OptValue normalize(double meanDot) const;
    OptValue average(const std::array<OptValue, kNumDirections>& contrib) const;
};

CorrelationResult velocityCorr(const VectorField& field, int32_t radius,
    CorrAveraging averaging = CorrAveraging::Arithmetic);
