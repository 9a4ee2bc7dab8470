#pragma once

#include <cstddef>
#include <limits>
#include <vector>

namespace lamina::core {

/// Cells no pass covers hold NaN.
inline double missingValue() { return std::numeric_limits<double>::quiet_NaN(); }
bool isMissing(double value);

struct RasterShape {
    std::size_t rows = 0;
    std::size_t cols = 0;

    bool operator==(const RasterShape& other) const {
        return rows == other.rows && cols == other.cols;
    }
    bool operator!=(const RasterShape& other) const { return !(*this == other); }
};

/**
 * @brief Row-major 2-D array of samples.
 *
 * Raw passes arrive as (lines, samples): each row is one scan line and each
 * column one dwell period along the scan direction.
 */
class Raster {
public:
    Raster() = default;
    Raster(std::size_t rows, std::size_t cols, double fill = 0.0);
    Raster(std::size_t rows, std::size_t cols, std::vector<double> values);

    std::size_t rows() const { return rows_; }
    std::size_t cols() const { return cols_; }
    RasterShape shape() const { return {rows_, cols_}; }
    std::size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    double& operator()(std::size_t row, std::size_t col) { return values_[row * cols_ + col]; }
    double operator()(std::size_t row, std::size_t col) const { return values_[row * cols_ + col]; }

    const std::vector<double>& values() const { return values_; }

    Raster transposed() const;

    /// Copy of the half-open window [row0,row1) x [col0,col1), clamped to bounds.
    Raster window(std::size_t row0, std::size_t row1, std::size_t col0, std::size_t col1) const;

    bool operator==(const Raster& other) const;
    bool operator!=(const Raster& other) const { return !(*this == other); }

private:
    std::size_t rows_ = 0;
    std::size_t cols_ = 0;
    std::vector<double> values_;
};

/**
 * @brief (rows, cols, planes) array; plane p is the contribution of pass p.
 */
class RasterStack {
public:
    RasterStack() = default;
    RasterStack(std::size_t rows, std::size_t cols, std::size_t planes, double fill = 0.0);

    std::size_t rows() const { return rows_; }
    std::size_t cols() const { return cols_; }
    std::size_t planes() const { return planes_; }
    RasterShape shape() const { return {rows_, cols_}; }

    double& operator()(std::size_t row, std::size_t col, std::size_t plane) {
        return values_[(row * cols_ + col) * planes_ + plane];
    }
    double operator()(std::size_t row, std::size_t col, std::size_t plane) const {
        return values_[(row * cols_ + col) * planes_ + plane];
    }

    const std::vector<double>& values() const { return values_; }

    Raster plane(std::size_t index) const;

    /// Per-cell mean over the planes that hold data; NaN where none do.
    Raster meanOfPresent() const;

    bool operator==(const RasterStack& other) const;
    bool operator!=(const RasterStack& other) const { return !(*this == other); }

private:
    std::size_t rows_ = 0;
    std::size_t cols_ = 0;
    std::size_t planes_ = 0;
    std::vector<double> values_;
};

} // namespace lamina::core
