#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "lamina/core/Expected.hpp"
#include "lamina/core/Raster.hpp"
#include "lamina/fusion/RasterFusion.hpp"
#include "lamina/geometry/Extent.hpp"
#include "lamina/geometry/MultiPassGeometry.hpp"

namespace lamina::fusion {

/// What MultiPassImage::get() should return for a channel.
struct ChannelRequest {
    /// Raw pass instead of the fused image.
    std::optional<std::size_t> layer;

    /// Crop to this physical box. y is measured from the bottom edge, the
    /// way plotting extents are drawn.
    std::optional<geometry::Extent> extent;
};

/**
 * @brief One imaging run: a geometry plus every measured channel.
 *
 * All channels are fused through the same geometry, so they must share its
 * pass count. The geometry can be swapped for a compatible one after the fact
 * (e.g. a corrected warm-up); incompatible candidates are reported, not thrown.
 */
class MultiPassImage {
public:
    using ChannelMap = std::map<std::string, RasterFusion>;

    static expected<MultiPassImage> create(geometry::MultiPassGeometry geometry, ChannelMap channels);

    const geometry::MultiPassGeometry& geometry() const { return geometry_; }

    std::size_t layerCount() const { return geometry_.passCount(); }
    std::vector<std::string> channelNames() const;
    bool hasChannel(const std::string& name) const;

    /// Shortest raw scan line across every channel and pass.
    std::size_t minimumScanLength() const;

    std::optional<CompatibilityWarning> findIncompatibility(const geometry::MultiPassGeometry& candidate) const;
    bool checkConfigValid(const geometry::MultiPassGeometry& candidate) const;

    /// Replace the geometry if the candidate fits the stored channels.
    expected<void> setGeometry(const geometry::MultiPassGeometry& candidate);

    expected<core::Raster> get(const std::string& name, const ChannelRequest& request = {}) const;
    expected<core::RasterStack> getStack(const std::string& name) const;

    /// Physical box of a channel's fused image.
    expected<geometry::Extent> extent(const std::string& name) const;

private:
    MultiPassImage(geometry::MultiPassGeometry geometry, ChannelMap channels);

    expected<const RasterFusion*> channel(const std::string& name) const;
    core::Raster crop(const core::Raster& data,
                      const geometry::Extent& extent,
                      std::optional<std::size_t> layer) const;

    geometry::MultiPassGeometry geometry_;
    ChannelMap channels_;
};

} // namespace lamina::fusion
