#pragma once

#include <ostream>

namespace lamina::geometry {

/// Physical bounding box (x0, x1, y0, y1) in micrometres.
struct Extent {
    double x0 = 0.0;
    double x1 = 0.0;
    double y0 = 0.0;
    double y1 = 0.0;

    bool operator==(const Extent& other) const {
        return x0 == other.x0 && x1 == other.x1 && y0 == other.y0 && y1 == other.y1;
    }
    bool operator!=(const Extent& other) const { return !(*this == other); }
};

inline std::ostream& operator<<(std::ostream& os, const Extent& e) {
    return os << "(" << e.x0 << ", " << e.x1 << ", " << e.y0 << ", " << e.y1 << ")";
}

} // namespace lamina::geometry
