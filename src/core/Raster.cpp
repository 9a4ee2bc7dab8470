#include "lamina/core/Raster.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace lamina::core {

namespace {

// Bitwise comparison so NaN cells compare equal to NaN cells.
bool sameBits(const std::vector<double>& a, const std::vector<double>& b) {
    return a.size() == b.size() &&
           (a.empty() || std::memcmp(a.data(), b.data(), a.size() * sizeof(double)) == 0);
}

} // namespace

bool isMissing(double value) {
    return std::isnan(value);
}

Raster::Raster(std::size_t rows, std::size_t cols, double fill)
: rows_(rows), cols_(cols), values_(rows * cols, fill) {}

Raster::Raster(std::size_t rows, std::size_t cols, std::vector<double> values)
: rows_(rows), cols_(cols), values_(std::move(values)) {
    if (values_.size() != rows_ * cols_) {
        throw std::invalid_argument("Raster: value count does not match shape");
    }
}

Raster Raster::transposed() const {
    Raster out(cols_, rows_);
    for (std::size_t r = 0; r < rows_; ++r) {
        for (std::size_t c = 0; c < cols_; ++c) {
            out(c, r) = (*this)(r, c);
        }
    }
    return out;
}

Raster Raster::window(std::size_t row0, std::size_t row1, std::size_t col0, std::size_t col1) const {
    row1 = std::min(row1, rows_);
    col1 = std::min(col1, cols_);
    row0 = std::min(row0, row1);
    col0 = std::min(col0, col1);

    Raster out(row1 - row0, col1 - col0);
    for (std::size_t r = row0; r < row1; ++r) {
        for (std::size_t c = col0; c < col1; ++c) {
            out(r - row0, c - col0) = (*this)(r, c);
        }
    }
    return out;
}

bool Raster::operator==(const Raster& other) const {
    return shape() == other.shape() && sameBits(values_, other.values_);
}

RasterStack::RasterStack(std::size_t rows, std::size_t cols, std::size_t planes, double fill)
: rows_(rows), cols_(cols), planes_(planes), values_(rows * cols * planes, fill) {}

Raster RasterStack::plane(std::size_t index) const {
    if (index >= planes_) {
        throw std::out_of_range("RasterStack: plane index out of range");
    }
    Raster out(rows_, cols_);
    for (std::size_t r = 0; r < rows_; ++r) {
        for (std::size_t c = 0; c < cols_; ++c) {
            out(r, c) = (*this)(r, c, index);
        }
    }
    return out;
}

Raster RasterStack::meanOfPresent() const {
    Raster out(rows_, cols_, missingValue());
    for (std::size_t r = 0; r < rows_; ++r) {
        for (std::size_t c = 0; c < cols_; ++c) {
            double sum = 0.0;
            std::size_t present = 0;
            for (std::size_t p = 0; p < planes_; ++p) {
                const double v = (*this)(r, c, p);
                if (isMissing(v)) continue;
                sum += v;
                ++present;
            }
            if (present > 0) {
                out(r, c) = sum / static_cast<double>(present);
            }
        }
    }
    return out;
}

bool RasterStack::operator==(const RasterStack& other) const {
    return rows_ == other.rows_ && cols_ == other.cols_ && planes_ == other.planes_ &&
           sameBits(values_, other.values_);
}

} // namespace lamina::core
