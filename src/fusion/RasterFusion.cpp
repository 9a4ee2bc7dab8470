#include "lamina/fusion/RasterFusion.hpp"

#include "lamina/geometry/GeometryConfig.hpp"
#include "lamina/log/Log.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <utility>

namespace lamina::fusion {

using geometry::MultiPassGeometry;
using geometry::PassOrientation;

namespace {

// rows * cols * planes <= limit, without overflowing on the way.
bool fitsCellLimit(core::RasterShape shape, std::size_t planes, std::size_t limit) {
    if (shape.rows == 0 || shape.cols == 0 || planes == 0) {
        return true;
    }
    if (shape.rows > limit / shape.cols) {
        return false;
    }
    return shape.rows * shape.cols <= limit / planes;
}

} // namespace

RasterFusion::RasterFusion(std::vector<core::Raster> layers)
: layers_(std::move(layers)) {}

expected<RasterFusion> RasterFusion::create(std::vector<core::Raster> layers) {
    if (layers.empty()) {
        return unexpected(ConfigurationError{"layers", "at least one pass is required"});
    }
    for (std::size_t i = 0; i < layers.size(); ++i) {
        if (layers[i].empty()) {
            return unexpected(ConfigurationError{"layers[" + std::to_string(i) + "]",
                                                 "pass holds no samples"});
        }
    }
    return RasterFusion(std::move(layers));
}

expected<core::Raster> RasterFusion::layer(std::size_t index) const {
    if (index >= layers_.size()) {
        std::ostringstream msg;
        msg << "no pass " << index << " (have " << layers_.size() << ")";
        return unexpected(ConfigurationError{"layer", msg.str()});
    }
    return layers_[index];
}

std::size_t RasterFusion::minimumScanLength() const {
    std::size_t shortest = layers_.front().cols();
    for (const auto& layer : layers_) {
        shortest = std::min(shortest, layer.cols());
    }
    return shortest;
}

core::RasterShape RasterFusion::alignedShape(const MultiPassGeometry& geometry) const {
    const std::size_t warmup = geometry.warmupSamples();
    std::size_t linesAlongX = 0;
    std::size_t linesAlongY = 0;
    std::size_t samplesAlongX = 0;
    bool anyVertical = false;

    for (std::size_t i = 0; i < layers_.size(); ++i) {
        const auto& raw = layers_[i];
        if (geometry.orientation(i) == PassOrientation::Horizontal) {
            linesAlongX = std::max(linesAlongX, raw.rows());
            samplesAlongX = std::max(samplesAlongX, raw.cols() > warmup ? raw.cols() - warmup : 0);
        } else {
            linesAlongY = std::max(linesAlongY, raw.rows());
            anyVertical = true;
        }
    }

    const std::size_t mag = geometry.magnification();
    // Without a vertical pass nothing bounds the columns but the samples.
    return {linesAlongX * mag, anyVertical ? linesAlongY * mag : samplesAlongX};
}

core::RasterShape RasterFusion::fusedShape(const MultiPassGeometry& geometry) const {
    const core::RasterShape grid = alignedShape(geometry);
    const std::size_t spp = geometry.subpixelsPerPixel();

    core::RasterShape maxShift;
    for (std::size_t i = 0; i < layers_.size(); ++i) {
        const core::RasterShape shift = geometry.subpixelShift(i);
        maxShift.rows = std::max(maxShift.rows, shift.rows);
        maxShift.cols = std::max(maxShift.cols, shift.cols);
    }
    return {grid.rows * spp + maxShift.rows, grid.cols * spp + maxShift.cols};
}

core::Raster RasterFusion::alignPass(std::size_t pass,
                                     core::RasterShape grid,
                                     const MultiPassGeometry& geometry) const {
    const auto& raw = layers_[pass];
    const std::size_t warmup = geometry.warmupSamples();
    const std::size_t mag = geometry.magnification();
    const PassOrientation orientation = geometry.orientation(pass);

    // Work in the pass's own frame: rows are stretched lines, cols samples.
    const core::RasterShape target = geometry::orient(grid, orientation);
    const core::Raster trimmed = raw.window(0, raw.rows(), warmup, raw.cols());

    core::Raster aligned(target.rows, target.cols, core::missingValue());
    for (std::size_t r = 0; r < target.rows; ++r) {
        const std::size_t line = r / mag;
        if (line >= trimmed.rows()) {
            break;
        }
        const std::size_t samples = std::min(target.cols, trimmed.cols());
        for (std::size_t c = 0; c < samples; ++c) {
            aligned(r, c) = trimmed(line, c);
        }
    }

    return orientation == PassOrientation::Vertical ? aligned.transposed() : aligned;
}

expected<core::RasterStack> RasterFusion::fuse(const MultiPassGeometry& geometry) const {
    if (layers_.size() != geometry.passCount()) {
        std::ostringstream msg;
        msg << "geometry expects " << geometry.passCount() << " passes, got " << layers_.size();
        logError("[RasterFusion] ", msg.str(), "\n");
        return unexpected(ConfigurationError{"layers", msg.str()});
    }

    const core::RasterShape grid = alignedShape(geometry);
    const core::RasterShape shape = fusedShape(geometry);
    if (!fitsCellLimit(shape, layers_.size(), geometry::config::MAX_FUSED_CELLS)) {
        std::ostringstream msg;
        msg << "fused stack of " << shape.rows << " x " << shape.cols << " x " << layers_.size()
            << " exceeds " << geometry::config::MAX_FUSED_CELLS << " cells";
        logError("[RasterFusion] ", msg.str(), "\n");
        return unexpected(ConfigurationError{"subpixel_offsets", msg.str()});
    }
    const std::size_t spp = geometry.subpixelsPerPixel();
    const std::size_t rows = grid.rows * spp;
    const std::size_t cols = grid.cols * spp;

    core::RasterStack fused(shape.rows, shape.cols, layers_.size(), core::missingValue());

    for (std::size_t i = 0; i < layers_.size(); ++i) {
        const core::Raster aligned = alignPass(i, grid, geometry);
        const core::RasterShape shift = geometry.subpixelShift(i);
        for (std::size_t r = 0; r < rows; ++r) {
            for (std::size_t c = 0; c < cols; ++c) {
                fused(r + shift.rows, c + shift.cols, i) = aligned(r / spp, c / spp);
            }
        }
    }

    return fused;
}

expected<core::Raster> RasterFusion::fuseFlattened(const MultiPassGeometry& geometry) const {
    auto stack = fuse(geometry);
    if (!stack) {
        return unexpected(stack.error());
    }
    return stack->meanOfPresent();
}

} // namespace lamina::fusion
