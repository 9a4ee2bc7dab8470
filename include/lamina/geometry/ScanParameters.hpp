#pragma once

#include <cstddef>
#include <tuple>

#include "lamina/geometry/GeometryConfig.hpp"
#include "lamina/schema/lamina_schema.hpp"

namespace lamina::geometry {

namespace lsch = ::lamina::schema;

/// Physical inputs of a single-direction raster scan.
struct ScanParameters {
    double spotSize = config::DEFAULT_SPOT_SIZE;
    double scanSpeed = config::DEFAULT_SCAN_SPEED;
    double dwellTime = config::DEFAULT_DWELL_TIME;
};

/// ScanParameters plus what a multi-pass run adds on top.
struct MultiPassParameters {
    double spotSize = config::DEFAULT_SPOT_SIZE;
    double scanSpeed = config::DEFAULT_SCAN_SPEED;
    double dwellTime = config::DEFAULT_DWELL_TIME;
    double warmupTime = config::DEFAULT_WARMUP_TIME;
    std::size_t passCount = config::DEFAULT_PASS_COUNT;

    ScanParameters scan() const { return {spotSize, scanSpeed, dwellTime}; }
};

inline const auto scanParameterFields = std::make_tuple(
    lsch::field<&ScanParameters::spotSize >("spot_size" , lsch::Finite{}, lsch::Positive{}),
    lsch::field<&ScanParameters::scanSpeed>("scan_speed", lsch::Finite{}, lsch::Positive{}),
    lsch::field<&ScanParameters::dwellTime>("dwell_time", lsch::Finite{}, lsch::Positive{})
);

inline const auto scanParameterSchema = lsch::makeSchema<ScanParameters>(scanParameterFields);

inline const auto multiPassParameterFields = std::make_tuple(
    lsch::field<&MultiPassParameters::spotSize  >("spot_size"  , lsch::Finite{}, lsch::Positive{}),
    lsch::field<&MultiPassParameters::scanSpeed >("scan_speed" , lsch::Finite{}, lsch::Positive{}),
    lsch::field<&MultiPassParameters::dwellTime >("dwell_time" , lsch::Finite{}, lsch::Positive{}),
    lsch::field<&MultiPassParameters::warmupTime>("warmup_time", lsch::Finite{}),
    lsch::field<&MultiPassParameters::passCount >("pass_count" , lsch::AtLeast<1>{})
);

// A dwell so short relative to the warm-up that the sample count overflows is
// not a usable acquisition. A negative warm-up is clamped to zero samples.
// Every pass needs its own default offset entry, and the spot may span at
// most MAX_MAGNIFICATION pixels along the scan.
inline const auto multiPassRules = lsch::objectValidator([](const MultiPassParameters& p)
    -> lsch::ValidationResult
{
    if (p.warmupTime / p.dwellTime > 1.0e9)
        return lsch::unexpected<ConfigurationError>({"warmup_time", "too many warm-up samples for dwell_time"});
    if (p.passCount > config::MAX_SUBPIXEL_GRID_SIZE)
        return lsch::unexpected<ConfigurationError>({"pass_count", "more passes than subpixel grid entries allowed"});
    if (p.spotSize / (p.scanSpeed * p.dwellTime) > config::MAX_MAGNIFICATION)
        return lsch::unexpected<ConfigurationError>({"spot_size", "spot spans too many pixels along the scan"});
    return {};
});

inline const auto multiPassParameterSchema =
    lsch::makeSchema<MultiPassParameters>(multiPassParameterFields, multiPassRules);

inline lsch::ValidationResult validateParameters(const ScanParameters& params) {
    return lsch::validate(scanParameterSchema, params);
}

inline lsch::ValidationResult validateParameters(const MultiPassParameters& params) {
    return lsch::validate(multiPassParameterSchema, params);
}

} // namespace lamina::geometry
