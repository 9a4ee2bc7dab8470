#include "lamina/geometry/ScanGeometry.hpp"

#include "lamina/log/Log.hpp"

namespace lamina::geometry {

ScanGeometry::ScanGeometry(const ScanParameters& params)
: spotSize_(params.spotSize)
, scanSpeed_(params.scanSpeed)
, dwellTime_(params.dwellTime) {}

expected<ScanGeometry> ScanGeometry::create(const ScanParameters& params) {
    if (auto ok = validateParameters(params); !ok) {
        logError("[ScanGeometry] rejected parameters: ", ok.error().describe(), "\n");
        return unexpected(ok.error());
    }
    return ScanGeometry(params);
}

expected<ScanGeometry> ScanGeometry::create(double spotSize, double scanSpeed, double dwellTime) {
    return create(ScanParameters{spotSize, scanSpeed, dwellTime});
}

double ScanGeometry::pixelWidth() const {
    return scanSpeed_ * dwellTime_;
}

double ScanGeometry::pixelHeight() const {
    return spotSize_;
}

Extent ScanGeometry::dataExtent(core::RasterShape shape) const {
    return {0.0,
            static_cast<double>(shape.cols) * pixelWidth(),
            0.0,
            static_cast<double>(shape.rows) * pixelHeight()};
}

} // namespace lamina::geometry
