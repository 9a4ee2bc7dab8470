#pragma once

#include <cstddef>

#include "lamina/core/Raster.hpp"

namespace lamina::geometry {

/**
 * @brief Direction a pass was scanned in.
 *
 * Passes alternate: even indices run along x (horizontal), odd indices run
 * along y (vertical), so each odd pass is the transpose of its neighbours.
 */
enum class PassOrientation {
    Horizontal = 0,
    Vertical = 1
};

struct PixelSize {
    double width = 0.0;
    double height = 0.0;
};

PassOrientation passOrientation(std::size_t pass);

/// Swap width/height for vertical passes; horizontal passes pass through.
PixelSize orient(PixelSize size, PassOrientation orientation);
core::RasterShape orient(core::RasterShape shape, PassOrientation orientation);

const char* toString(PassOrientation orientation);

} // namespace lamina::geometry
