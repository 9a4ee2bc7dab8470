#pragma once

#include <cstddef>

namespace lamina::geometry::config {

/**
 * @brief Default acquisition parameters for a two-pass ablation run.
 *
 * Lengths are in micrometres, times in seconds. Kept here so importers,
 * tests and the demo app agree on one set of numbers.
 */

// Scan ------------------------------------------------------------------------
constexpr double DEFAULT_SPOT_SIZE = 35.0;    // um, perpendicular to scan
constexpr double DEFAULT_SCAN_SPEED = 140.0;  // um/s, along scan
constexpr double DEFAULT_DWELL_TIME = 0.25;   // s per sample

// Multi-pass ------------------------------------------------------------------
constexpr double DEFAULT_WARMUP_TIME = 12.5;  // s discarded at the start of each line
constexpr std::size_t DEFAULT_PASS_COUNT = 2;

// Limits ----------------------------------------------------------------------
constexpr double MAX_MAGNIFICATION = 1024.0;            // spot size / pixel width
constexpr std::size_t MAX_SUBPIXEL_GRID_SIZE = 1024;    // offset table entries
constexpr std::size_t MAX_FUSED_CELLS = std::size_t{1} << 28; // rows * cols * passes

} // namespace lamina::geometry::config
