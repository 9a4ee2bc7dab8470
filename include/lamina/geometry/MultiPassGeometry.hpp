#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "lamina/core/Errors.hpp"
#include "lamina/geometry/PassOrientation.hpp"
#include "lamina/geometry/ScanGeometry.hpp"

namespace lamina::geometry {

/// Alignment of one pass on the subpixel grid, in subpixel-grid units.
struct SubpixelOffset {
    int row = 0;
    int col = 0;

    bool operator==(const SubpixelOffset& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const SubpixelOffset& other) const { return !(*this == other); }
};

using SubpixelTable = std::vector<SubpixelOffset>;

/// Loosely typed table as it arrives from importers or config files; every
/// entry must hold exactly two components to be accepted.
using RawSubpixelTable = std::vector<std::vector<long long>>;

/**
 * @brief Geometry of a run built from several orthogonal passes.
 *
 * Adds to ScanGeometry:
 * - a fixed pass count; even passes scan along x, odd passes along y;
 * - warm-up trimming, expressed as whole samples at the start of each line;
 * - the magnification (spot size over pixel width), i.e. how many fused rows
 *   one scan line spans once the orthogonal passes are interleaved;
 * - a subpixel-offset table used to stagger passes by fractions of a pixel.
 *
 * The pass count and the offset table length are independent: passes pick
 * their offset cyclically (`pass % subpixelGridSize()`).
 *
 * Values are only built through create()/with*() so every instance satisfies
 * the parameter schema. setSubpixelOffsets() re-validates and leaves the
 * geometry untouched when it rejects a table.
 */
class MultiPassGeometry : public ScanGeometry {
public:
    static expected<MultiPassGeometry> create(const MultiPassParameters& params);
    static expected<MultiPassGeometry> create(const MultiPassParameters& params,
                                              const RawSubpixelTable& subpixelOffsets);
    static expected<MultiPassGeometry> create(double spotSize,
                                              double scanSpeed,
                                              double dwellTime,
                                              double warmupTime = config::DEFAULT_WARMUP_TIME,
                                              std::size_t passCount = config::DEFAULT_PASS_COUNT);

    std::size_t passCount() const { return passCount_; }
    std::size_t warmupSamples() const { return warmupSamples_; }

    /// Warm-up actually discarded, i.e. rounded to whole samples.
    double warmupTime() const;

    std::size_t magnification() const;

    PassOrientation orientation(std::size_t pass) const { return passOrientation(pass); }

    // Subpixel table -----------------------------------------------------------
    const SubpixelTable& subpixelOffsets() const { return subpixelOffsets_; }
    std::size_t subpixelGridSize() const { return subpixelOffsets_.size(); }

    /// Extra upsampling fusion applies so every offset lands on a whole cell:
    /// lcm(subpixelGridSize, magnification) / magnification.
    std::size_t subpixelsPerPixel() const;

    /// Shift of @p pass in fused output cells (rows, cols).
    core::RasterShape subpixelShift(std::size_t pass) const;

    expected<void> setSubpixelOffsets(const RawSubpixelTable& offsets);
    expected<void> setSubpixelOffsets(const SubpixelTable& offsets);

    /// Offsets [[0,0],[1,1],...,[count-1,count-1]]: passes evenly interleaved.
    expected<void> setEqualSubpixelOffsets(std::size_t count);

    // Pixel geometry -----------------------------------------------------------
    /**
     * @brief Pixel size of the fused image, or of a single pass.
     *
     * Without @p layer the fused size is returned: the base width divided by
     * subpixelsPerPixel(), and the base height divided by magnification() and
     * subpixelsPerPixel(). With @p layer the pass's own size is returned,
     * swapped for vertical passes.
     */
    PixelSize pixelSize(std::optional<std::size_t> layer = std::nullopt) const;
    double pixelWidth(std::optional<std::size_t> layer = std::nullopt) const;
    double pixelHeight(std::optional<std::size_t> layer = std::nullopt) const;

    /**
     * @brief Physical box of an array of @p shape.
     *
     * Fused arrays start after the warm-up distance on both axes; a single
     * pass is reported untrimmed from the origin.
     */
    Extent dataExtent(core::RasterShape shape, std::optional<std::size_t> layer = std::nullopt) const;

    // Reconfiguration ----------------------------------------------------------
    expected<MultiPassGeometry> withWarmupTime(double warmupTime) const;
    expected<MultiPassGeometry> withPassCount(std::size_t passCount) const;

    MultiPassParameters multiPassParameters() const;

    // Compatibility ------------------------------------------------------------
    /**
     * @brief Why @p candidate cannot replace this geometry for data whose
     * shortest raw scan line holds @p availableSamples samples.
     */
    std::optional<CompatibilityWarning> findIncompatibility(const MultiPassGeometry& candidate,
                                                            std::size_t availableSamples) const;

    bool checkConfigValid(const MultiPassGeometry& candidate, std::size_t availableSamples) const;

private:
    MultiPassGeometry(const MultiPassParameters& params, SubpixelTable offsets);

    static expected<SubpixelTable> parseSubpixelTable(const RawSubpixelTable& offsets);
    static expected<void> checkGridSize(std::size_t count);
    static expected<void> checkSubpixelTable(const SubpixelTable& offsets);
    static SubpixelTable equalSubpixelTable(std::size_t count);

    std::size_t passCount_;
    double warmupTime_;
    std::size_t warmupSamples_;
    SubpixelTable subpixelOffsets_;
};

} // namespace lamina::geometry
