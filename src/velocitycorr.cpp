#include "velocitycorr.hpp"
#include "utils.h"
#include <algorithm>
#include <cmath>

namespace {

// Relative variance below which the field is treated as uniform flow
constexpr double kUniformRelTol = 1e-12;
constexpr double kPi = 3.14159265358979323846;
// Contributions are clipped to +/-(1 - eps) before the Fisher transform
constexpr double kFisherClip = 1e-12;

} // namespace

CorrAveraging parseCorrAveraging(const std::string& name) {
    std::string s = toLower(name);
    if (s == "arithmetic" || s == "mean") return CorrAveraging::Arithmetic;
    if (s == "fisher" || s == "fisher-z") return CorrAveraging::Fisher;
    throw DomainError("Unknown averaging method: " + name + " (expected arithmetic or fisher)");
}

const char* corrAveragingName(CorrAveraging avg) {
    return avg == CorrAveraging::Fisher ? "fisher" : "arithmetic";
}

std::array<std::pair<int32_t, int32_t>, kNumDirections> compassOffsets(int32_t radius) {
    std::array<std::pair<int32_t, int32_t>, kNumDirections> offsets;
    for (int32_t k = 0; k < kNumDirections; ++k) {
        const double theta = k * kPi / 4;
        offsets[k] = {static_cast<int32_t>(std::lround(radius * std::cos(theta))),
                      static_cast<int32_t>(std::lround(radius * std::sin(theta)))};
    }
    return offsets;
}

VelocityCorrelator::VelocityCorrelator(const VectorField& field, CorrAveraging averaging)
    : field_(field), averaging_(averaging) {
    const size_t n = field_.nObserved();
    if (n == 0) {
        warning("%s: field has no observed cells", __func__);
        return;
    }
    const auto& m = field_.mask();
    // missing cells hold zeros, so plain sums run over observed cells only
    meanSqSpeed_ = (field_.u().square() + field_.v().square()).sum() / n;
    meanVec_ = Eigen::Vector2d(field_.u().sum() / n, field_.v().sum() / n);
    meanVecSq_ = meanVec_.squaredNorm();
    const double variance = meanSqSpeed_ - meanVecSq_;
    uniform_ = meanSqSpeed_ > 0 && variance <= kUniformRelTol * meanSqSpeed_;
    if (uniform_) {
        notice("%s: velocity field is uniform, directional correlations are set to 1", __func__);
    } else if (meanSqSpeed_ == 0) {
        warning("%s: all observed velocities are zero, correlations are undefined", __func__);
    }
    debug("%s: %zu of %zu cells observed, <|v|^2> = %.6g, <v> = (%.6g, %.6g)", __func__,
        static_cast<size_t>(m.count()), field_.nCells(), meanSqSpeed_, meanVec_(0), meanVec_(1));
}

OptValue VelocityCorrelator::normalize(double meanDot) const {
    if (uniform_) return 1.0;
    const double denom = meanSqSpeed_ - meanVecSq_;
    if (!(denom > 0)) return std::nullopt;
    return (meanDot - meanVecSq_) / denom;
}

OptValue VelocityCorrelator::average(const std::array<OptValue, kNumDirections>& contrib) const {
    double sum = 0;
    int32_t n = 0;
    for (const auto& c : contrib) {
        if (!c.has_value()) continue;
        if (averaging_ == CorrAveraging::Fisher) {
            sum += std::atanh(std::clamp(*c, -1.0 + kFisherClip, 1.0 - kFisherClip));
        } else {
            sum += *c;
        }
        n++;
    }
    if (n == 0) return std::nullopt;
    if (averaging_ == CorrAveraging::Fisher) {
        return std::tanh(sum / n);
    }
    return sum / n;
}

CorrelationResult VelocityCorrelator::compute(int32_t radius) const {
    if (radius < 1) {
        throw DomainError("Radius must be at least 1, got " + std::to_string(radius));
    }
    if (radius > maxRadius()) {
        throw DomainError("Radius " + std::to_string(radius) + " is too large for a " +
            std::to_string(field_.height()) + " x " + std::to_string(field_.width()) +
            " field (maximum " + std::to_string(maxRadius()) + ")");
    }
    const int32_t H = field_.height(), W = field_.width();
    Eigen::Array<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> counts =
        Eigen::Array<int32_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>::Zero(H, W);

    CorrelationResult result;
    const auto offsets = compassOffsets(radius);
    for (int32_t k = 0; k < kNumDirections; ++k) {
        const auto [dx, dy] = offsets[k];
        VectorField neighbor = field_.shifted(dx, dy);
        RowMajorMaskXX valid = field_.mask() && neighbor.mask();
        const int64_t nValid = valid.count();
        counts += valid.cast<int32_t>();
        if (nValid == 0) {
            debug("%s: r=%d direction %d has no valid pairs", __func__, radius, k);
            continue;
        }
        // invalid pairs involve at least one zero-filled cell
        const double sumDot = (field_.u() * neighbor.u() + field_.v() * neighbor.v()).sum();
        result.directional[k] = normalize(sumDot / nValid);
    }
    result.score = average(result.directional);
    result.nObserved = static_cast<uint64_t>((counts >= 1).count());
    result.nGe4 = static_cast<uint64_t>((counts >= 4).count());
    result.nEq8 = static_cast<uint64_t>((counts == kNumDirections).count());
    return result;
}

CorrelationResult velocityCorr(const VectorField& field, int32_t radius, CorrAveraging averaging) {
    VelocityCorrelator corr(field, averaging);
    return corr.compute(radius);
}
