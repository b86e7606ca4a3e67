/// @file src/core/types.cpp
/// @brief String conversions for the shared glyphnav enums.

#include "glyphnav/types.hpp"

namespace glyphnav {

// ─── to_string ────────────────────────────────────────────────────────────────

const char* to_string(Classification c) noexcept {
    switch (c) {
        case Classification::Accessible:  return "accessible";
        case Classification::Phantom:     return "phantom";
        case Classification::CoreAnomaly: return "core_anomaly";
        case Classification::CorePhantom: return "core_phantom";
    }
    return "unknown";
}

const char* to_string(GlyphField f) noexcept {
    switch (f) {
        case GlyphField::Planet:      return "planet";
        case GlyphField::SolarSystem: return "solar_system";
        case GlyphField::Y:           return "y";
        case GlyphField::Z:           return "z";
        case GlyphField::X:           return "x";
    }
    return "unknown";
}

const char* to_string(WarningKind k) noexcept {
    switch (k) {
        case WarningKind::UnusualSentinelValue: return "unusual_sentinel_value";
        case WarningKind::PhantomStar:          return "phantom_star";
        case WarningKind::CoreVoid:             return "core_void";
    }
    return "unknown";
}

const char* to_string(ErrorKind k) noexcept {
    switch (k) {
        case ErrorKind::FormatError:   return "format_error";
        case ErrorKind::RangeError:    return "range_error";
        case ErrorKind::CoreVoidError: return "core_void_error";
    }
    return "unknown";
}

} // namespace glyphnav
