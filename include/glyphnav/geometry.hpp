#pragma once

/// @file include/glyphnav/geometry.hpp
/// @brief Galaxy Geometry — region identity, star placement, accessibility.
///
/// # Module: Galaxy Geometry
///
/// ## Responsibility
/// Derive galaxy-level semantics from already-decoded glyph fields:
///   - whether a coordinate lies inside the core void ellipsoid
///   - whether a solar-system index is a phantom star
///   - the combined accessibility classification
///   - a deterministic star position inside a region for 3D map plotting
///
/// ## Core Void
///   (x/Rxz)² + (y/Ry)² + (z/Rxz)² < 1,   Rxz = 8, Ry = 1
///
/// A point exactly on the boundary is outside.
///
/// ## Star Placement
/// SHA-256 of `"NMS:{rx}:{ry}:{rz}:{sss}"`; digest bytes [0,4), [4,8), [8,12)
/// are read big-endian as u32, mapped to u/0xFFFFFFFF − 0.5 and scaled by
/// STAR_SPREAD, then added to the region's signed base coordinate.
///
/// ## Guarantees
/// - Every operation is total over its declared domain; nothing fails
/// - Configuration is fixed at construction; instances are immutable
/// - Thread-safe: no shared mutable state
///
/// ## NOT Responsible For
/// - Parsing or validating glyph strings (see codec.hpp)

#include "glyphnav/types.hpp"
#include "glyphnav/constants.hpp"

#include <string>

namespace glyphnav::geometry {

// ─── GeometryConfig ───────────────────────────────────────────────────────────

/// Classification switches, set once at startup.
struct GeometryConfig {
    /// If false, `is_in_core_void` always returns false.
    bool core_void_enabled = true;

    /// If false, solar-system index 0 is not treated as a phantom star.
    bool zero_index_is_phantom = true;

    /// Multiplier for presentation-only display coordinates.
    double display_scale = constants::DISPLAY_SCALE;
};

// ─── GalaxyGeometry ───────────────────────────────────────────────────────────

class GalaxyGeometry {
public:
    explicit GalaxyGeometry(GeometryConfig config = GeometryConfig{}) noexcept;

    /// True if (x, y, z) is strictly inside the core void ellipsoid and the
    /// void rule is enabled.
    [[nodiscard]] bool is_in_core_void(int x, int y, int z) const noexcept;

    /// Phantom-star rule:
    ///   0x3E8          → never phantom
    ///   0              → phantom if `zero_index_is_phantom`
    ///   ≥ 0x258        → phantom
    ///   otherwise      → not phantom
    [[nodiscard]] bool is_phantom_star(int solar_system_index) const noexcept;

    /// Combine the phantom and core-void rules into one classification.
    [[nodiscard]] SystemClassification
    classify(int x, int y, int z, int solar_system_index) const noexcept;

    [[nodiscard]] SystemClassification
    classify(const Coordinate& c, int solar_system_index) const noexcept;

    /// Deterministic star position for a system inside a region.
    ///
    /// Identical inputs yield bit-identical outputs across runs and
    /// platforms. Systems sharing a region but differing in index do not
    /// overlap.
    [[nodiscard]] static StarPosition
    star_position_in_region(int region_x, int region_y, int region_z,
                            int solar_system_index) noexcept;

    [[nodiscard]] static StarPosition
    star_position_in_region(const RegionCoordinate& region,
                            int solar_system_index) noexcept;

    /// Apply the split-range sign rule to a region coordinate.
    [[nodiscard]] static Coordinate to_signed(const RegionCoordinate& region) noexcept;

    /// Display label `Region [RX:RY:RZ]` (uppercase hex).
    [[nodiscard]] static std::string region_name(const RegionCoordinate& region);

    [[nodiscard]] const GeometryConfig& config() const noexcept { return config_; }

private:
    GeometryConfig config_;
};

} // namespace glyphnav::geometry
