#pragma once

#include <cstddef>
#include <vector>

#include "lamina/core/Expected.hpp"
#include "lamina/core/Raster.hpp"
#include "lamina/geometry/MultiPassGeometry.hpp"

namespace lamina::fusion {

/**
 * @brief Raw passes of one channel and the fusion that registers them.
 *
 * Each layer is a (lines, samples) array straight from the importer, warm-up
 * samples included. Layers are immutable once stored; fuse() and
 * fuseFlattened() are pure functions of the layers and the geometry passed in.
 *
 * Fusion steps, per pass:
 * 1. drop the geometry's warm-up samples from the start of every line;
 * 2. repeat each line magnification() times across the slow axis and clip or
 *    pad (with missing cells) to the common grid;
 * 3. transpose vertical passes so rows are the slow axis for all of them;
 * 4. upsample by subpixelsPerPixel() and shift by the pass's subpixel offset.
 *
 * The common grid is magnification() times the longest horizontal pass in
 * rows and the longest vertical pass in columns.
 */
class RasterFusion {
public:
    static expected<RasterFusion> create(std::vector<core::Raster> layers);

    std::size_t layerCount() const { return layers_.size(); }

    expected<core::Raster> layer(std::size_t index) const;

    /// Fewest samples on any raw scan line, warm-up included.
    std::size_t minimumScanLength() const;

    /// Grid (rows, cols) the passes are aligned to before subpixel upsampling.
    core::RasterShape alignedShape(const geometry::MultiPassGeometry& geometry) const;

    /// Shape fuse() produces: the aligned grid upsampled, plus the largest shift.
    core::RasterShape fusedShape(const geometry::MultiPassGeometry& geometry) const;

    /// One plane per pass: (rows, cols, passCount).
    expected<core::RasterStack> fuse(const geometry::MultiPassGeometry& geometry) const;

    /// Mean over the passes present at each cell: (rows, cols).
    expected<core::Raster> fuseFlattened(const geometry::MultiPassGeometry& geometry) const;

private:
    explicit RasterFusion(std::vector<core::Raster> layers);

    core::Raster alignPass(std::size_t pass,
                           core::RasterShape grid,
                           const geometry::MultiPassGeometry& geometry) const;

    std::vector<core::Raster> layers_;
};

} // namespace lamina::fusion
