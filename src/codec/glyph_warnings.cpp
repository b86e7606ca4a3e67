/// @file src/codec/glyph_warnings.cpp
/// @brief Text rendering for decode warnings.

#include "glyphnav/codec.hpp"

#include <fmt/core.h>

namespace glyphnav::codec {

namespace {

const char* sentinel_text(GlyphField field) noexcept {
    switch (field) {
        case GlyphField::SolarSystem: return "Solar system cannot be 000";
        case GlyphField::Y:           return "Y coordinate 80 is forbidden (use 00-7F or 81-FF)";
        case GlyphField::Z:           return "Z coordinate 800 is forbidden (use 000-7FF or 801-FFF)";
        case GlyphField::X:           return "X coordinate 800 is forbidden (use 000-7FF or 801-FFF)";
        case GlyphField::Planet:      break;
    }
    return "Planet index holds an unusual value";
}

} // namespace

std::string describe(const GlyphWarning& warning, const DecodedGlyph& decoded) {
    switch (warning.kind) {
        case WarningKind::UnusualSentinelValue:
            return warning.field ? sentinel_text(*warning.field)
                                 : "Glyph holds an unusual sentinel value";

        case WarningKind::PhantomStar:
            return fmt::format(
                "PHANTOM STAR: Solar system index {} (0x{:03X}) indicates a phantom star. "
                "These systems are not normally accessible via the Galactic Map.",
                decoded.solar_system, decoded.solar_system);

        case WarningKind::CoreVoid:
            return fmt::format(
                "CORE VOID: Coordinates ({}, {}, {}) are within the galactic core void "
                "(~3,000 light years from center). Only phantom stars exist in this region.",
                decoded.coordinate.x, decoded.coordinate.y, decoded.coordinate.z);
    }
    return to_string(warning.kind);
}

std::optional<std::string> render_warnings(const DecodedGlyph& decoded) {
    if (decoded.warnings.empty()) {
        return std::nullopt;
    }

    // Sentinel warnings collapse into one "Valid but unusual" entry placed
    // ahead of the classification advisories.
    std::string sentinels;
    std::string advisories;
    for (const auto& w : decoded.warnings) {
        std::string& target =
            (w.kind == WarningKind::UnusualSentinelValue) ? sentinels : advisories;
        if (!target.empty()) {
            target += "; ";
        }
        target += describe(w, decoded);
    }

    std::string out;
    if (!sentinels.empty()) {
        out = "Valid but unusual: " + sentinels;
    }
    if (!advisories.empty()) {
        if (!out.empty()) {
            out += "; ";
        }
        out += advisories;
    }
    return out;
}

} // namespace glyphnav::codec
