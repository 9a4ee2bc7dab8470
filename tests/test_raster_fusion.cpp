#include "lamina/fusion/RasterFusion.hpp"
#include "lamina/log/Log.hpp"

#include <cstdlib>
#include <random>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace lamina;
using namespace lamina::fusion;
using lamina::core::Raster;
using lamina::geometry::MultiPassGeometry;
using lamina::geometry::SubpixelTable;

static int g_failures = 0;

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { lamina::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { lamina::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", _va, " != ", _vb, ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++g_failures; } } while(0)

static Raster randomRaster(std::size_t rows, std::size_t cols, std::mt19937& rng) {
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    Raster out(rows, cols);
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < cols; ++c) {
            out(r, c) = dist(rng);
        }
    }
    return out;
}

// Sample value encodes its position: line * 100 + sample.
static Raster indexedRaster(std::size_t rows, std::size_t cols, double base) {
    Raster out(rows, cols);
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < cols; ++c) {
            out(r, c) = base + static_cast<double>(r * 100 + c);
        }
    }
    return out;
}

template<typename T>
static T require(expected<T> value, const char* what) {
    if (!value) {
        lamina::logError("setup failed (", what, "): ", value.error().describe(), "\n");
        std::exit(1);
    }
    return std::move(*value);
}

static void testFusedShape() {
    std::mt19937 rng(1234);
    const auto geometry = require(MultiPassGeometry::create(5.0, 10.0, 0.5, 2.5), "geometry");
    const auto data = require(RasterFusion::create({randomRaster(10, 20, rng), randomRaster(12, 30, rng)}), "layers");

    ASSERT_EQ(data.layerCount(), std::size_t{2}, "two passes stored");
    ASSERT_EQ(data.minimumScanLength(), std::size_t{20}, "shortest raw line");

    auto stack = data.fuse(geometry);
    ASSERT_TRUE(stack.has_value(), "fuse succeeds");
    if (stack) {
        ASSERT_EQ(stack->rows(), std::size_t{21}, "stacked rows");
        ASSERT_EQ(stack->cols(), std::size_t{25}, "stacked cols");
        ASSERT_EQ(stack->planes(), std::size_t{2}, "one plane per pass");
    }

    auto flat = data.fuseFlattened(geometry);
    ASSERT_TRUE(flat.has_value(), "flattened fuse succeeds");
    if (flat) {
        ASSERT_EQ(flat->rows(), std::size_t{21}, "flattened rows");
        ASSERT_EQ(flat->cols(), std::size_t{25}, "flattened cols");
    }

    ASSERT_TRUE(data.fusedShape(geometry) == (core::RasterShape{21, 25}), "predicted shape matches");
}

static void testIdempotent() {
    std::mt19937 rng(99);
    const auto geometry = require(MultiPassGeometry::create(5.0, 10.0, 0.5, 2.5), "geometry");
    const auto data = require(RasterFusion::create({randomRaster(10, 20, rng), randomRaster(12, 30, rng)}), "layers");

    auto first = data.fuse(geometry);
    auto second = data.fuse(geometry);
    ASSERT_TRUE(first && second && *first == *second, "stacked fusion repeats bit for bit");

    auto flatFirst = data.fuseFlattened(geometry);
    auto flatSecond = data.fuseFlattened(geometry);
    ASSERT_TRUE(flatFirst && flatSecond && *flatFirst == *flatSecond, "flattened fusion repeats bit for bit");
}

static void testPassCountMismatch() {
    lamina::log::ScopedLogHandlers quiet([](std::string_view) {}, [](std::string_view) {});
    std::mt19937 rng(7);
    const auto geometry = require(MultiPassGeometry::create(5.0, 10.0, 0.5, 2.5, 3), "geometry");
    const auto data = require(RasterFusion::create({randomRaster(10, 20, rng), randomRaster(12, 30, rng)}), "layers");

    auto stack = data.fuse(geometry);
    ASSERT_TRUE(!stack, "pass count mismatch rejected");
    if (!stack) ASSERT_EQ(stack.error().field, std::string("layers"), "error names layers");
    ASSERT_TRUE(!data.fuseFlattened(geometry), "flattened fuse rejects too");
}

static void testRejectsEmptyLayers() {
    ASSERT_TRUE(!RasterFusion::create({}), "no passes rejected");
    ASSERT_TRUE(!RasterFusion::create({Raster(2, 2), Raster()}), "empty pass rejected");
}

static void testPlacement() {
    // Magnification 1, a single zero offset: the fused grid is the aligned grid.
    auto geometry = require(MultiPassGeometry::create(5.0, 10.0, 0.5, 2.5), "geometry");
    ASSERT_TRUE(geometry.setSubpixelOffsets(SubpixelTable{{0, 0}}).has_value(), "single offset");

    const Raster horizontal = indexedRaster(2, 8, 0.0);    // 2 lines, 3 valid samples
    const Raster vertical = indexedRaster(3, 7, 1000.0);   // 3 lines, 2 valid samples
    const auto data = require(RasterFusion::create({horizontal, vertical}), "layers");

    ASSERT_TRUE(data.alignedShape(geometry) == (core::RasterShape{2, 3}), "rows from pass 0, cols from pass 1");

    auto stack = data.fuse(geometry);
    ASSERT_TRUE(stack.has_value(), "fuse succeeds");
    if (!stack) return;
    ASSERT_EQ(stack->rows(), std::size_t{2}, "rows");
    ASSERT_EQ(stack->cols(), std::size_t{3}, "cols");

    for (std::size_t r = 0; r < 2; ++r) {
        for (std::size_t c = 0; c < 3; ++c) {
            ASSERT_EQ((*stack)(r, c, 0), horizontal(r, 5 + c), "horizontal pass trimmed in place");
            ASSERT_EQ((*stack)(r, c, 1), vertical(c, 5 + r), "vertical pass trimmed and transposed");
        }
    }

    const Raster pass1 = stack->plane(1);
    ASSERT_TRUE(pass1.shape() == (core::RasterShape{2, 3}), "plane has the fused grid shape");
    ASSERT_EQ(pass1(1, 2), vertical(2, 6), "plane holds one pass");

    bool threw = false;
    try {
        (void)stack->plane(2);
    } catch (const std::out_of_range&) {
        threw = true;
    }
    ASSERT_TRUE(threw, "plane beyond the pass count throws");

    auto flat = data.fuseFlattened(geometry);
    if (flat) {
        ASSERT_EQ((*flat)(1, 2), (horizontal(1, 7) + vertical(2, 6)) / 2.0, "mean of both passes");
    }
}

static void testOversizedStackRejected() {
    std::string error;
    lamina::log::ScopedLogHandlers capture(
        [](std::string_view) {},
        [&error](std::string_view m) { error.append(m); });

    // Magnification 512 against an odd grid of 1023: every pass pixel becomes
    // 1023 * 512 output cells on each axis.
    auto geometry = require(MultiPassGeometry::create(512.0, 1.0, 1.0, 0.0), "geometry");
    ASSERT_TRUE(geometry.setEqualSubpixelOffsets(1023).has_value(), "odd grid accepted");

    const auto data = require(RasterFusion::create({indexedRaster(1, 2, 0.0), indexedRaster(1, 2, 0.0)}), "layers");
    const core::RasterShape shape = data.fusedShape(geometry);
    ASSERT_EQ(shape.rows, std::size_t{524288}, "fused rows");

    auto stack = data.fuse(geometry);
    ASSERT_TRUE(!stack, "oversized stack rejected");
    if (!stack) ASSERT_EQ(stack.error().field, std::string("subpixel_offsets"), "error names the offsets");
    ASSERT_TRUE(!data.fuseFlattened(geometry), "flattened fuse rejects too");
    ASSERT_TRUE(error.find("[RasterFusion]") != std::string::npos, "rejection logged");
}

static void testMissingTail() {
    auto geometry = require(MultiPassGeometry::create(5.0, 10.0, 0.5, 2.5), "geometry");
    ASSERT_TRUE(geometry.setSubpixelOffsets(SubpixelTable{{0, 0}}).has_value(), "single offset");

    const Raster horizontal = indexedRaster(2, 8, 0.0);
    const Raster vertical = indexedRaster(3, 6, 1000.0);   // only one valid sample per line
    const auto data = require(RasterFusion::create({horizontal, vertical}), "layers");

    auto stack = data.fuse(geometry);
    ASSERT_TRUE(stack.has_value(), "fuse succeeds");
    if (!stack) return;
    ASSERT_TRUE(!core::isMissing((*stack)(0, 1, 1)), "first fused row covered by the short pass");
    ASSERT_TRUE(core::isMissing((*stack)(1, 1, 1)), "short pass missing at its tail");

    auto flat = data.fuseFlattened(geometry);
    if (flat) {
        ASSERT_EQ((*flat)(1, 1), horizontal(1, 6), "missing pass excluded from the mean");
        ASSERT_EQ((*flat)(0, 1), (horizontal(0, 6) + vertical(1, 5)) / 2.0, "covered cell averages both");
    }
}

static void testMagnifiedWithOffsets() {
    // Spot twice the pixel width: each line spans two fused rows.
    auto geometry = require(MultiPassGeometry::create(10.0, 10.0, 0.5, 10.0), "geometry");
    ASSERT_TRUE(geometry.setSubpixelOffsets(lamina::geometry::RawSubpixelTable{{0, 1}, {0, 2}}).has_value(), "offsets");

    const Raster horizontal = indexedRaster(3, 24, 0.0);
    const Raster vertical = indexedRaster(2, 26, 1000.0);
    const auto data = require(RasterFusion::create({horizontal, vertical}), "layers");

    ASSERT_TRUE(data.alignedShape(geometry) == (core::RasterShape{6, 4}), "magnified grid");

    auto stack = data.fuse(geometry);
    ASSERT_TRUE(stack.has_value(), "fuse succeeds");
    if (!stack) return;
    ASSERT_EQ(stack->rows(), std::size_t{6}, "no row shift");
    ASSERT_EQ(stack->cols(), std::size_t{6}, "columns grow by the largest shift");

    ASSERT_TRUE(core::isMissing((*stack)(0, 0, 0)), "pass 0 shifted right by one cell");
    ASSERT_EQ((*stack)(1, 1, 0), horizontal(0, 20), "line 0 repeated over two rows");
    ASSERT_EQ((*stack)(2, 1, 0), horizontal(1, 20), "line 1 starts at row 2");
    ASSERT_EQ((*stack)(0, 2, 1), vertical(0, 20), "pass 1 shifted right by two cells");
    ASSERT_EQ((*stack)(0, 4, 1), vertical(1, 20), "vertical lines repeated over two cols");

    auto flat = data.fuseFlattened(geometry);
    if (flat) {
        ASSERT_TRUE(core::isMissing((*flat)(0, 0)), "cell no pass covers stays missing");
        ASSERT_EQ((*flat)(0, 1), horizontal(0, 20), "only pass 0 covers column 1");
    }
}

static void testSinglePass() {
    auto geometry = require(MultiPassGeometry::create(5.0, 10.0, 0.5, 2.5, 1), "geometry");
    const auto data = require(RasterFusion::create({indexedRaster(4, 9, 0.0)}), "layers");

    auto flat = data.fuseFlattened(geometry);
    ASSERT_TRUE(flat.has_value(), "one pass fuses");
    if (flat) {
        ASSERT_EQ(flat->rows(), std::size_t{4}, "rows from the lines");
        ASSERT_EQ(flat->cols(), std::size_t{4}, "cols from the trimmed samples");
        ASSERT_EQ((*flat)(3, 0), 305.0, "first sample after warm-up");
    }
}

int main() {
    testFusedShape();
    testIdempotent();
    testPassCountMismatch();
    testRejectsEmptyLayers();
    testPlacement();
    testMissingTail();
    testMagnifiedWithOffsets();
    testSinglePass();
    testOversizedStackRejected();

    if (g_failures) {
        lamina::logError("Tests failed: ", g_failures, " failure(s)\n");
        return 1;
    }
    lamina::logInfo("RasterFusion tests passed.\n");
    return 0;
}
