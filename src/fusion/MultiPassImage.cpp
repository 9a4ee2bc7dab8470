#include "lamina/fusion/MultiPassImage.hpp"

#include "lamina/log/Log.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <utility>

namespace lamina::fusion {

using geometry::Extent;
using geometry::MultiPassGeometry;

namespace {

// Physical coordinate to a cell boundary, truncated and clamped to [0, limit].
std::size_t toIndex(double position, double pixel, std::size_t limit) {
    const double cells = position / pixel;
    if (!(cells > 0.0)) {
        return 0;
    }
    if (cells >= static_cast<double>(limit)) {
        return limit;
    }
    return static_cast<std::size_t>(cells);
}

} // namespace

MultiPassImage::MultiPassImage(MultiPassGeometry geometry, ChannelMap channels)
: geometry_(std::move(geometry))
, channels_(std::move(channels)) {}

expected<MultiPassImage> MultiPassImage::create(MultiPassGeometry geometry, ChannelMap channels) {
    if (channels.empty()) {
        return unexpected(ConfigurationError{"channels", "at least one channel is required"});
    }
    for (const auto& [name, data] : channels) {
        if (data.layerCount() != geometry.passCount()) {
            std::ostringstream msg;
            msg << "channel has " << data.layerCount() << " passes, geometry expects "
                << geometry.passCount();
            logError("[MultiPassImage] ", name, ": ", msg.str(), "\n");
            return unexpected(ConfigurationError{name, msg.str()});
        }
    }
    return MultiPassImage(std::move(geometry), std::move(channels));
}

std::vector<std::string> MultiPassImage::channelNames() const {
    std::vector<std::string> names;
    names.reserve(channels_.size());
    for (const auto& entry : channels_) {
        names.push_back(entry.first);
    }
    return names;
}

bool MultiPassImage::hasChannel(const std::string& name) const {
    return channels_.count(name) > 0;
}

std::size_t MultiPassImage::minimumScanLength() const {
    std::size_t shortest = std::numeric_limits<std::size_t>::max();
    for (const auto& entry : channels_) {
        shortest = std::min(shortest, entry.second.minimumScanLength());
    }
    return shortest;
}

std::optional<CompatibilityWarning>
MultiPassImage::findIncompatibility(const MultiPassGeometry& candidate) const {
    return geometry_.findIncompatibility(candidate, minimumScanLength());
}

bool MultiPassImage::checkConfigValid(const MultiPassGeometry& candidate) const {
    return geometry_.checkConfigValid(candidate, minimumScanLength());
}

expected<void> MultiPassImage::setGeometry(const MultiPassGeometry& candidate) {
    if (auto warning = findIncompatibility(candidate)) {
        logError("[MultiPassImage] keeping current geometry: ", warning->message, "\n");
        return unexpected(ConfigurationError{"geometry", warning->message});
    }
    geometry_ = candidate;
    return {};
}

expected<const RasterFusion*> MultiPassImage::channel(const std::string& name) const {
    auto it = channels_.find(name);
    if (it == channels_.end()) {
        return unexpected(ConfigurationError{name, "no such channel"});
    }
    return &it->second;
}

expected<core::Raster> MultiPassImage::get(const std::string& name, const ChannelRequest& request) const {
    auto data = channel(name);
    if (!data) {
        return unexpected(data.error());
    }

    auto image = request.layer ? (*data)->layer(*request.layer)
                               : (*data)->fuseFlattened(geometry_);
    if (!image) {
        return image;
    }
    if (request.extent) {
        return crop(*image, *request.extent, request.layer);
    }
    return image;
}

expected<core::RasterStack> MultiPassImage::getStack(const std::string& name) const {
    auto data = channel(name);
    if (!data) {
        return unexpected(data.error());
    }
    return (*data)->fuse(geometry_);
}

expected<Extent> MultiPassImage::extent(const std::string& name) const {
    auto data = channel(name);
    if (!data) {
        return unexpected(data.error());
    }
    return geometry_.dataExtent((*data)->fusedShape(geometry_));
}

core::Raster MultiPassImage::crop(const core::Raster& data,
                                  const Extent& extent,
                                  std::optional<std::size_t> layer) const {
    const Extent full = geometry_.dataExtent(data.shape(), layer);
    const double px = geometry_.pixelWidth(layer);
    const double py = geometry_.pixelHeight(layer);

    const std::size_t col0 = toIndex(extent.x0 - full.x0, px, data.cols());
    const std::size_t col1 = toIndex(extent.x1 - full.x0, px, data.cols());
    const std::size_t fromBottom0 = toIndex(extent.y0 - full.y0, py, data.rows());
    const std::size_t fromBottom1 = toIndex(extent.y1 - full.y0, py, data.rows());

    const std::size_t rowMax = data.rows();
    return data.window(rowMax - fromBottom1, rowMax - fromBottom0, col0, col1);
}

} // namespace lamina::fusion
