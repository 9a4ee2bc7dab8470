#pragma once

#include "lamina/core/Expected.hpp"
#include "lamina/core/Raster.hpp"
#include "lamina/geometry/Extent.hpp"
#include "lamina/geometry/ScanParameters.hpp"

namespace lamina::geometry {

/**
 * @brief Pixel geometry of a single-direction raster scan.
 *
 * One sample is collected per dwell period while the stage moves, so a pixel
 * is `scanSpeed * dwellTime` wide along the scan and one spot tall across it.
 * Instances only exist with strictly positive, finite parameters.
 */
class ScanGeometry {
public:
    /// Validate the parameters and build the geometry.
    static expected<ScanGeometry> create(const ScanParameters& params);
    static expected<ScanGeometry> create(double spotSize, double scanSpeed, double dwellTime);

    double spotSize() const { return spotSize_; }
    double scanSpeed() const { return scanSpeed_; }
    double dwellTime() const { return dwellTime_; }

    double pixelWidth() const;
    double pixelHeight() const;

    /// Physical box covered by an array of @p shape, origin at (0, 0).
    Extent dataExtent(core::RasterShape shape) const;

protected:
    explicit ScanGeometry(const ScanParameters& params);

private:
    double spotSize_;
    double scanSpeed_;
    double dwellTime_;
};

} // namespace lamina::geometry
