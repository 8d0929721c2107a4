#include "vectorfield.hpp"
#include "utils.h"
#include <algorithm>
#include <cmath>
#include <limits>

VectorField::VectorField(int32_t height, int32_t width) {
    if (height < 0 || width < 0) {
        throw DomainError("Field dimensions must be non-negative");
    }
    u_ = RowMajorArrayXXd::Zero(height, width);
    v_ = RowMajorArrayXXd::Zero(height, width);
    mask_ = RowMajorMaskXX::Constant(height, width, false);
}

VectorField::VectorField(RowMajorArrayXXd u, RowMajorArrayXXd v, RowMajorMaskXX mask)
    : u_(std::move(u)), v_(std::move(v)), mask_(std::move(mask)) {
    if (u_.rows() != v_.rows() || u_.cols() != v_.cols() ||
        u_.rows() != mask_.rows() || u_.cols() != mask_.cols()) {
        throw ConsistencyError("Velocity planes are not aligned: u " + std::to_string(u_.rows()) + "x" +
            std::to_string(u_.cols()) + ", v " + std::to_string(v_.rows()) + "x" + std::to_string(v_.cols()) +
            ", mask " + std::to_string(mask_.rows()) + "x" + std::to_string(mask_.cols()));
    }
    u_ = mask_.select(u_, 0.0);
    v_ = mask_.select(v_, 0.0);
}

VectorField VectorField::fromArray(const std::vector<double>& data, const std::vector<size_t>& shape) {
    if (shape.size() != 3) {
        throw ShapeError("Vector field must have 3 dimensions, got " + std::to_string(shape.size()));
    }
    if (shape[2] != 2) {
        throw ShapeError("Last dimension of a vector field must have length 2, got " + std::to_string(shape[2]));
    }
    const size_t H = shape[0], W = shape[1];
    if (H > static_cast<size_t>(std::numeric_limits<int32_t>::max()) ||
        W > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw ShapeError("Vector field dimensions are too large");
    }
    if (data.size() != H * W * 2) {
        throw ShapeError("Array holds " + std::to_string(data.size()) + " values, shape requires " +
            std::to_string(H * W * 2));
    }
    VectorField field(static_cast<int32_t>(H), static_cast<int32_t>(W));
    for (size_t y = 0; y < H; ++y) {
        for (size_t x = 0; x < W; ++x) {
            const double u = data[(y * W + x) * 2];
            const double v = data[(y * W + x) * 2 + 1];
            if (std::isnan(u) || std::isnan(v)) continue;
            field.set(static_cast<int32_t>(y), static_cast<int32_t>(x), u, v);
        }
    }
    return field;
}

VectorField VectorField::shifted(int32_t dx, int32_t dy) const {
    const int32_t H = height(), W = width();
    const int32_t px = std::abs(dx), py = std::abs(dy);
    // pad with missing cells, then crop the window displaced by (dx, dy)
    RowMajorArrayXXd up = RowMajorArrayXXd::Zero(H + 2 * py, W + 2 * px);
    RowMajorArrayXXd vp = RowMajorArrayXXd::Zero(H + 2 * py, W + 2 * px);
    RowMajorMaskXX mp = RowMajorMaskXX::Constant(H + 2 * py, W + 2 * px, false);
    up.block(py, px, H, W) = u_;
    vp.block(py, px, H, W) = v_;
    mp.block(py, px, H, W) = mask_;
    return VectorField(RowMajorArrayXXd(up.block(py + dy, px + dx, H, W)),
        RowMajorArrayXXd(vp.block(py + dy, px + dx, H, W)),
        RowMajorMaskXX(mp.block(py + dy, px + dx, H, W)));
}

std::vector<double> VectorField::toArray() const {
    const int32_t H = height(), W = width();
    std::vector<double> out(static_cast<size_t>(H) * W * 2, std::numeric_limits<double>::quiet_NaN());
    for (int32_t y = 0; y < H; ++y) {
        for (int32_t x = 0; x < W; ++x) {
            if (!mask_(y, x)) continue;
            size_t off = (static_cast<size_t>(y) * W + x) * 2;
            out[off] = u_(y, x);
            out[off + 1] = v_(y, x);
        }
    }
    return out;
}

namespace {

// Grid indices of a position column: non-missing, non-negative integers
std::vector<int32_t> gridIndices(const SampleTable::Column& col, const std::string& name) {
    std::vector<int32_t> idx(col.size());
    for (size_t i = 0; i < col.size(); ++i) {
        if (!col[i].has_value() || std::isnan(*col[i])) {
            throw DomainError("Position column " + name + " has a missing value at row " + std::to_string(i));
        }
        const double v = *col[i];
        if (!std::isfinite(v) || v != std::floor(v)) {
            throw DomainError("Position column " + name + " must contain integers, found " +
                std::to_string(v) + " at row " + std::to_string(i));
        }
        if (v < 0) {
            throw DomainError("Position column " + name + " must be non-negative, found " +
                std::to_string(v) + " at row " + std::to_string(i));
        }
        if (v >= static_cast<double>(std::numeric_limits<int32_t>::max())) {
            throw DomainError("Position " + std::to_string(v) + " in column " + name + " is too large");
        }
        idx[i] = static_cast<int32_t>(v);
    }
    return idx;
}

} // namespace

VectorField squareInput(const SampleTable& samples, const ColumnNames& cols) {
    return squareInput(samples, cols.x, cols.y, cols.u, cols.v);
}

VectorField squareInput(const SampleTable& samples, const std::string& xcol, const std::string& ycol,
    const std::string& ucol, const std::string& vcol) {
    const auto& xs = samples.column(xcol);
    const auto& ys = samples.column(ycol);
    const auto& us = samples.column(ucol);
    const auto& vs = samples.column(vcol);
    if (samples.nRows() == 0) {
        throw DomainError("No samples to densify");
    }
    std::vector<int32_t> xi = gridIndices(xs, xcol);
    std::vector<int32_t> yi = gridIndices(ys, ycol);
    const int32_t W = *std::max_element(xi.begin(), xi.end()) + 1;
    const int32_t H = *std::max_element(yi.begin(), yi.end()) + 1;

    RowMajorArrayXXd u = RowMajorArrayXXd::Zero(H, W);
    RowMajorArrayXXd v = RowMajorArrayXXd::Zero(H, W);
    RowMajorMaskXX mask = RowMajorMaskXX::Constant(H, W, false);
    RowMajorMaskXX seen = RowMajorMaskXX::Constant(H, W, false);
    size_t nPartial = 0;
    for (size_t i = 0; i < samples.nRows(); ++i) {
        const int32_t x = xi[i], y = yi[i];
        if (seen(y, x)) {
            throw DomainError("Duplicate sample at grid cell (" + std::to_string(x) + ", " +
                std::to_string(y) + "), row " + std::to_string(i));
        }
        seen(y, x) = true;
        const bool hasU = us[i].has_value() && !std::isnan(*us[i]);
        const bool hasV = vs[i].has_value() && !std::isnan(*vs[i]);
        if (hasU && hasV) {
            u(y, x) = *us[i];
            v(y, x) = *vs[i];
            mask(y, x) = true;
        } else if (hasU || hasV) {
            nPartial++;
        }
    }
    if (nPartial > 0) {
        warning("%s: %zu samples with only one velocity component are treated as missing", __func__, nPartial);
    }
    VectorField field(std::move(u), std::move(v), std::move(mask));
    debug("%s: %d x %d grid, %zu samples, %zu observed cells", __func__, H, W, samples.nRows(), field.nObserved());
    return field;
}
