#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "Eigen/Dense"
#include "dataunits.hpp"

using RowMajorArrayXXd = Eigen::Array<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using RowMajorMaskXX = Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

/// Dense (H, W, 2) velocity field indexed [y][x]. A cell either holds a
/// velocity (u, v) or is missing; missing cells store zeros in both planes
/// and are excluded through the observation mask, never through NaN.
class VectorField {
public:
    VectorField() = default;
    // All cells missing
    VectorField(int32_t height, int32_t width);
    // Combine aligned planes; throws ConsistencyError if their shapes differ
    VectorField(RowMajorArrayXXd u, RowMajorArrayXXd v, RowMajorMaskXX mask);

    // Build from a flat row-major array with the given shape, NaN marks missing.
    // Throws ShapeError unless shape is (H, W, 2)
    static VectorField fromArray(const std::vector<double>& data, const std::vector<size_t>& shape);

    int32_t height() const { return static_cast<int32_t>(u_.rows()); }
    int32_t width() const { return static_cast<int32_t>(u_.cols()); }
    size_t nCells() const { return static_cast<size_t>(u_.size()); }
    size_t nObserved() const { return static_cast<size_t>(mask_.count()); }
    bool empty() const { return u_.size() == 0; }

    bool observed(int32_t y, int32_t x) const { return mask_(y, x); }
    std::optional<Eigen::Vector2d> at(int32_t y, int32_t x) const {
        if (!mask_(y, x)) return std::nullopt;
        return Eigen::Vector2d(u_(y, x), v_(y, x));
    }
    void set(int32_t y, int32_t x, double u, double v) {
        u_(y, x) = u; v_(y, x) = v; mask_(y, x) = true;
    }
    void clear(int32_t y, int32_t x) {
        u_(y, x) = 0; v_(y, x) = 0; mask_(y, x) = false;
    }

    const RowMajorArrayXXd& u() const { return u_; }
    const RowMajorArrayXXd& v() const { return v_; }
    const RowMajorMaskXX& mask() const { return mask_; }

    // Field seen from offset (dx, dy): result(y, x) = this(y + dy, x + dx),
    // missing where (y + dy, x + dx) falls outside the grid (no wrap-around)
    VectorField shifted(int32_t dx, int32_t dy) const;

    // Flat (H, W, 2) row-major copy with NaN for missing cells
    std::vector<double> toArray() const;

private:
    RowMajorArrayXXd u_, v_;
    RowMajorMaskXX mask_;
};

// Densify integer-positioned samples into a (max_y + 1, max_x + 1, 2) field.
// Throws SchemaError for absent columns and DomainError for missing, negative,
// non-integer or duplicate positions
VectorField squareInput(const SampleTable& samples, const ColumnNames& cols = ColumnNames());
VectorField squareInput(const SampleTable& samples, const std::string& xcol, const std::string& ycol,
    const std::string& ucol, const std::string& vcol);
