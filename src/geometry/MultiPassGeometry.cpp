#include "lamina/geometry/MultiPassGeometry.hpp"

#include "lamina/log/Log.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>
#include <string>
#include <utility>

namespace lamina::geometry {

namespace {

// Rounds half to even (the default rounding mode), so 2.5 samples become 2.
std::size_t samplesFor(double seconds, double dwellTime) {
    const double samples = std::nearbyint(seconds / dwellTime);
    return samples < 0.0 ? 0 : static_cast<std::size_t>(samples);
}

std::string entryName(std::size_t index) {
    return "subpixel_offsets[" + std::to_string(index) + "]";
}

} // namespace

MultiPassGeometry::MultiPassGeometry(const MultiPassParameters& params, SubpixelTable offsets)
: ScanGeometry(params.scan())
, passCount_(params.passCount)
, warmupTime_(params.warmupTime)
, warmupSamples_(samplesFor(params.warmupTime, params.dwellTime))
, subpixelOffsets_(std::move(offsets)) {}

expected<MultiPassGeometry> MultiPassGeometry::create(const MultiPassParameters& params) {
    if (auto ok = validateParameters(params); !ok) {
        logError("[MultiPassGeometry] rejected parameters: ", ok.error().describe(), "\n");
        return unexpected(ok.error());
    }
    return MultiPassGeometry(params, equalSubpixelTable(params.passCount));
}

expected<MultiPassGeometry> MultiPassGeometry::create(const MultiPassParameters& params,
                                                      const RawSubpixelTable& subpixelOffsets) {
    auto geometry = create(params);
    if (!geometry) {
        return geometry;
    }
    if (auto ok = geometry->setSubpixelOffsets(subpixelOffsets); !ok) {
        return unexpected(ok.error());
    }
    return geometry;
}

expected<MultiPassGeometry> MultiPassGeometry::create(double spotSize,
                                                      double scanSpeed,
                                                      double dwellTime,
                                                      double warmupTime,
                                                      std::size_t passCount) {
    return create(MultiPassParameters{spotSize, scanSpeed, dwellTime, warmupTime, passCount});
}

double MultiPassGeometry::warmupTime() const {
    return static_cast<double>(warmupSamples_) * dwellTime();
}

std::size_t MultiPassGeometry::magnification() const {
    const double ratio = std::nearbyint(ScanGeometry::pixelHeight() / ScanGeometry::pixelWidth());
    return ratio < 1.0 ? 1 : static_cast<std::size_t>(ratio);
}

std::size_t MultiPassGeometry::subpixelsPerPixel() const {
    const std::size_t mag = magnification();
    return std::lcm(subpixelGridSize(), mag) / mag;
}

core::RasterShape MultiPassGeometry::subpixelShift(std::size_t pass) const {
    const std::size_t grid = subpixelGridSize();
    // Offsets are in 1/grid of a pass pixel, output cells are
    // 1/lcm(grid, magnification) of one.
    const std::size_t scale = std::lcm(grid, magnification()) / grid;
    const SubpixelOffset& offset = subpixelOffsets_[pass % grid];
    return {static_cast<std::size_t>(offset.row) * scale,
            static_cast<std::size_t>(offset.col) * scale};
}

expected<SubpixelTable> MultiPassGeometry::parseSubpixelTable(const RawSubpixelTable& offsets) {
    if (auto ok = checkGridSize(offsets.size()); !ok) {
        return unexpected(ok.error());
    }
    // An offset may reach a whole pass pixel, i.e. the grid size itself.
    const auto maxOffset = static_cast<long long>(offsets.size());
    SubpixelTable table;
    table.reserve(offsets.size());
    for (std::size_t i = 0; i < offsets.size(); ++i) {
        const auto& entry = offsets[i];
        if (entry.size() != 2) {
            std::ostringstream msg;
            msg << "expected a [row, col] pair, got " << entry.size() << " value(s)";
            return unexpected(ConfigurationError{entryName(i), msg.str()});
        }
        for (long long component : entry) {
            if (component < 0 || component > maxOffset) {
                std::ostringstream msg;
                msg << "offset component must lie in [0, " << maxOffset << "] (got " << component << ")";
                return unexpected(ConfigurationError{entryName(i), msg.str()});
            }
        }
        table.push_back({static_cast<int>(entry[0]), static_cast<int>(entry[1])});
    }
    return table;
}

expected<void> MultiPassGeometry::checkGridSize(std::size_t count) {
    if (count > config::MAX_SUBPIXEL_GRID_SIZE) {
        std::ostringstream msg;
        msg << "at most " << config::MAX_SUBPIXEL_GRID_SIZE << " entries allowed (got " << count << ")";
        return unexpected(ConfigurationError{"subpixel_offsets", msg.str()});
    }
    return {};
}

expected<void> MultiPassGeometry::checkSubpixelTable(const SubpixelTable& offsets) {
    if (auto ok = checkGridSize(offsets.size()); !ok) {
        return ok;
    }
    const auto maxOffset = static_cast<long long>(offsets.size());
    for (std::size_t i = 0; i < offsets.size(); ++i) {
        const SubpixelOffset& offset = offsets[i];
        if (offset.row < 0 || offset.col < 0 || offset.row > maxOffset || offset.col > maxOffset) {
            std::ostringstream msg;
            msg << "offset (" << offset.row << ", " << offset.col << ") must lie in [0, "
                << maxOffset << "]";
            return unexpected(ConfigurationError{entryName(i), msg.str()});
        }
    }
    return {};
}

SubpixelTable MultiPassGeometry::equalSubpixelTable(std::size_t count) {
    SubpixelTable table;
    table.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        table.push_back({static_cast<int>(i), static_cast<int>(i)});
    }
    return table;
}

expected<void> MultiPassGeometry::setSubpixelOffsets(const RawSubpixelTable& offsets) {
    auto table = parseSubpixelTable(offsets);
    if (!table) {
        logError("[MultiPassGeometry] rejected subpixel offsets: ", table.error().describe(), "\n");
        return unexpected(table.error());
    }
    return setSubpixelOffsets(*table);
}

expected<void> MultiPassGeometry::setSubpixelOffsets(const SubpixelTable& offsets) {
    if (auto ok = checkSubpixelTable(offsets); !ok) {
        logError("[MultiPassGeometry] rejected subpixel offsets: ", ok.error().describe(), "\n");
        return ok;
    }
    // An empty table means "no alignment data": a single unshifted entry.
    subpixelOffsets_ = offsets.empty() ? SubpixelTable{SubpixelOffset{}} : offsets;
    return {};
}

expected<void> MultiPassGeometry::setEqualSubpixelOffsets(std::size_t count) {
    if (count < 1) {
        std::ostringstream msg;
        msg << "equal offsets need a grid size of at least 1 (got " << count << ")";
        return unexpected(ConfigurationError{"subpixel_offsets", msg.str()});
    }
    if (auto ok = checkGridSize(count); !ok) {
        return ok;
    }
    subpixelOffsets_ = equalSubpixelTable(count);
    return {};
}

PixelSize MultiPassGeometry::pixelSize(std::optional<std::size_t> layer) const {
    const PixelSize base{ScanGeometry::pixelWidth(), ScanGeometry::pixelHeight()};
    if (layer) {
        return orient(base, passOrientation(*layer));
    }
    const auto spp = static_cast<double>(subpixelsPerPixel());
    const auto mag = static_cast<double>(magnification());
    return {base.width / spp, base.height / mag / spp};
}

double MultiPassGeometry::pixelWidth(std::optional<std::size_t> layer) const {
    return pixelSize(layer).width;
}

double MultiPassGeometry::pixelHeight(std::optional<std::size_t> layer) const {
    return pixelSize(layer).height;
}

Extent MultiPassGeometry::dataExtent(core::RasterShape shape, std::optional<std::size_t> layer) const {
    const PixelSize size = pixelSize(layer);
    const double width = static_cast<double>(shape.cols) * size.width;
    const double height = static_cast<double>(shape.rows) * size.height;
    if (layer) {
        return {0.0, width, 0.0, height};
    }
    // Warm-up covers the same stage travel in both directions.
    const double origin = static_cast<double>(warmupSamples_) * ScanGeometry::pixelWidth();
    return {origin, origin + width, origin, origin + height};
}

MultiPassParameters MultiPassGeometry::multiPassParameters() const {
    return {spotSize(), scanSpeed(), dwellTime(), warmupTime_, passCount_};
}

expected<MultiPassGeometry> MultiPassGeometry::withWarmupTime(double warmupTime) const {
    auto params = multiPassParameters();
    params.warmupTime = warmupTime;
    if (auto ok = validateParameters(params); !ok) {
        logError("[MultiPassGeometry] rejected warm-up: ", ok.error().describe(), "\n");
        return unexpected(ok.error());
    }
    return MultiPassGeometry(params, subpixelOffsets_);
}

expected<MultiPassGeometry> MultiPassGeometry::withPassCount(std::size_t passCount) const {
    auto params = multiPassParameters();
    params.passCount = passCount;
    if (auto ok = validateParameters(params); !ok) {
        logError("[MultiPassGeometry] rejected pass count: ", ok.error().describe(), "\n");
        return unexpected(ok.error());
    }
    return MultiPassGeometry(params, subpixelOffsets_);
}

std::optional<CompatibilityWarning>
MultiPassGeometry::findIncompatibility(const MultiPassGeometry& candidate,
                                       std::size_t availableSamples) const {
    if (candidate.passCount() != passCount_) {
        std::ostringstream msg;
        msg << "candidate has " << candidate.passCount() << " passes, data has " << passCount_;
        return CompatibilityWarning{CompatibilityKind::PassCountMismatch, msg.str()};
    }
    if (candidate.warmupSamples() >= availableSamples) {
        std::ostringstream msg;
        msg << "warm-up of " << candidate.warmupSamples() << " samples leaves nothing of "
            << availableSamples << " available";
        return CompatibilityWarning{CompatibilityKind::WarmupExceedsSamples, msg.str()};
    }
    return std::nullopt;
}

bool MultiPassGeometry::checkConfigValid(const MultiPassGeometry& candidate,
                                         std::size_t availableSamples) const {
    if (auto warning = findIncompatibility(candidate, availableSamples)) {
        logInfo("[MultiPassGeometry] incompatible configuration (",
                CompatibilityWarning::toString(warning->kind), "): ", warning->message, "\n");
        return false;
    }
    return true;
}

} // namespace lamina::geometry
