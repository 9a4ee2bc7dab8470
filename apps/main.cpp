#include "lamina/fusion/MultiPassImage.hpp"
#include "lamina/geometry/GeometryConfig.hpp"
#include "lamina/log/Log.hpp"

#include <cmath>
#include <cstdlib>
#include <string>
#include <utility>

using namespace lamina;

namespace {

// Two gaussian spots sampled the way a pass would see them: lines across the
// slow axis, samples along the scan, warm-up samples first.
core::Raster simulatePass(const geometry::MultiPassGeometry& geometry,
                          std::size_t pass,
                          std::size_t lines,
                          std::size_t samples,
                          double amplitude) {
    const std::size_t warmup = geometry.warmupSamples();
    const geometry::PixelSize pixel = geometry.pixelSize(pass);
    const bool vertical = geometry.orientation(pass) == geometry::PassOrientation::Vertical;

    core::Raster out(lines, warmup + samples);
    for (std::size_t line = 0; line < lines; ++line) {
        for (std::size_t s = 0; s < warmup + samples; ++s) {
            if (s < warmup) {
                out(line, s) = 0.1 * amplitude; // stage still accelerating
                continue;
            }
            const double along = (static_cast<double>(s - warmup) + 0.5) * pixel.width;
            const double across = (static_cast<double>(line) + 0.5) * pixel.height;
            const double x = vertical ? across : along;
            const double y = vertical ? along : across;
            const double dx1 = x - 300.0, dy1 = y - 250.0;
            const double dx2 = x - 520.0, dy2 = y - 400.0;
            out(line, s) = amplitude * (std::exp(-(dx1 * dx1 + dy1 * dy1) / 8000.0) +
                                        0.5 * std::exp(-(dx2 * dx2 + dy2 * dy2) / 4000.0));
        }
    }
    return out;
}

} // namespace

int main() {
    geometry::MultiPassParameters params; // defaults from GeometryConfig.hpp
    auto geometry = geometry::MultiPassGeometry::create(params);
    if (!geometry) {
        return EXIT_FAILURE;
    }

    logInfo("Geometry: spot=", geometry->spotSize(), "um speed=", geometry->scanSpeed(),
            "um/s dwell=", geometry->dwellTime(), "s passes=", geometry->passCount(),
            " warmup=", geometry->warmupSamples(), " samples\n");

    // 20 lines of 24 samples horizontally, 24 lines of 20 samples vertically.
    fusion::MultiPassImage::ChannelMap channels;
    for (const auto& [name, amplitude] : {std::pair<const char*, double>{"Ca43", 1000.0},
                                          std::pair<const char*, double>{"Zn66", 250.0}}) {
        auto data = fusion::RasterFusion::create({simulatePass(*geometry, 0, 20, 24, amplitude),
                                                  simulatePass(*geometry, 1, 24, 20, amplitude)});
        if (!data) {
            logError("Channel ", name, ": ", data.error().describe(), "\n");
            return EXIT_FAILURE;
        }
        channels.emplace(name, std::move(*data));
    }

    auto image = fusion::MultiPassImage::create(*geometry, std::move(channels));
    if (!image) {
        return EXIT_FAILURE;
    }

    for (const auto& name : image->channelNames()) {
        auto fused = image->get(name);
        auto extent = image->extent(name);
        if (!fused || !extent) {
            logError("Fusion of ", name, " failed\n");
            return EXIT_FAILURE;
        }
        double peak = 0.0;
        for (double v : fused->values()) {
            if (!core::isMissing(v) && v > peak) peak = v;
        }
        logInfo(name, ": fused ", fused->rows(), "x", fused->cols(), " extent ", *extent,
                " peak ", peak, "\n");
    }

    // A warm-up that eats every sample is reported, not applied.
    auto tooLong = geometry->withWarmupTime(60.0);
    if (tooLong && !image->checkConfigValid(*tooLong)) {
        logInfo("Warm-up of ", tooLong->warmupSamples(), " samples rejected for this run\n");
    }

    return EXIT_SUCCESS;
}
