#include "lamina/geometry/PassOrientation.hpp"

namespace lamina::geometry {

PassOrientation passOrientation(std::size_t pass) {
    return (pass % 2 == 0) ? PassOrientation::Horizontal : PassOrientation::Vertical;
}

PixelSize orient(PixelSize size, PassOrientation orientation) {
    if (orientation == PassOrientation::Vertical) {
        return {size.height, size.width};
    }
    return size;
}

core::RasterShape orient(core::RasterShape shape, PassOrientation orientation) {
    if (orientation == PassOrientation::Vertical) {
        return {shape.cols, shape.rows};
    }
    return shape;
}

const char* toString(PassOrientation orientation) {
    switch (orientation) {
        case PassOrientation::Horizontal: return "horizontal";
        case PassOrientation::Vertical:   return "vertical";
    }
    return "unknown";
}

} // namespace lamina::geometry
