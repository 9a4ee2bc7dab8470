#pragma once

#include <string>

namespace lamina {

/**
 * @brief Raised (as the error half of an expected) when a geometry, offset
 * table or layer set is structurally wrong.
 *
 * `field` names the offending parameter ("spot_size", "subpixel_offsets[2]",
 * "layers", ...) and `message` says what rule it broke.
 */
struct ConfigurationError {
    std::string field;
    std::string message;

    std::string describe() const { return field + ": " + message; }
};

enum class CompatibilityKind {
    PassCountMismatch,
    WarmupExceedsSamples
};

/**
 * @brief Non-fatal result of comparing a candidate geometry against existing
 * data. Batch callers can skip or flag the run instead of aborting.
 */
struct CompatibilityWarning {
    CompatibilityKind kind = CompatibilityKind::PassCountMismatch;
    std::string message;

    static const char* toString(CompatibilityKind kind) {
        switch (kind) {
            case CompatibilityKind::PassCountMismatch:    return "pass count mismatch";
            case CompatibilityKind::WarmupExceedsSamples: return "warm-up exceeds samples";
        }
        return "unknown";
    }
};

} // namespace lamina
