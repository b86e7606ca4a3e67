/// @file src/geometry/galaxy_geometry.cpp
/// @brief Galaxy Geometry — core void, phantom stars, star placement.

#include "glyphnav/geometry.hpp"
#include "glyphnav/split_range.hpp"

#include "star_hash.hpp"

#include <fmt/core.h>

namespace glyphnav::geometry {

// ─── Construction ─────────────────────────────────────────────────────────────

GalaxyGeometry::GalaxyGeometry(GeometryConfig config) noexcept
    : config_(config)
{}

// ─── Core Void ────────────────────────────────────────────────────────────────

bool GalaxyGeometry::is_in_core_void(int x, int y, int z) const noexcept {
    if (!config_.core_void_enabled) {
        return false;
    }

    const double nx = static_cast<double>(x) / constants::CORE_VOID_RADIUS_XZ;
    const double ny = static_cast<double>(y) / constants::CORE_VOID_RADIUS_Y;
    const double nz = static_cast<double>(z) / constants::CORE_VOID_RADIUS_XZ;

    // Strict: the ellipsoid surface itself is outside.
    return nx * nx + ny * ny + nz * nz < 1.0;
}

// ─── Phantom Stars ────────────────────────────────────────────────────────────

bool GalaxyGeometry::is_phantom_star(int solar_system_index) const noexcept {
    // 0x3E8 ≥ 0x258, so the exception has to win before the threshold test.
    if (solar_system_index == constants::PHANTOM_SSS_EXCEPTION) {
        return false;
    }
    if (solar_system_index == 0) {
        return config_.zero_index_is_phantom;
    }
    return solar_system_index >= constants::PHANTOM_SSS_THRESHOLD;
}

// ─── Classification ───────────────────────────────────────────────────────────

SystemClassification
GalaxyGeometry::classify(int x, int y, int z,
                         int solar_system_index) const noexcept {
    const bool phantom = is_phantom_star(solar_system_index);
    const bool in_core = is_in_core_void(x, y, z);

    Classification c = Classification::Accessible;
    if (in_core && phantom) {
        c = Classification::CorePhantom;
    } else if (in_core) {
        c = Classification::CoreAnomaly;
    } else if (phantom) {
        c = Classification::Phantom;
    }

    return SystemClassification{
        .is_phantom     = phantom,
        .is_in_core     = in_core,
        .is_accessible  = !phantom && !in_core,
        .classification = c,
    };
}

SystemClassification
GalaxyGeometry::classify(const Coordinate& c,
                         int solar_system_index) const noexcept {
    return classify(c.x, c.y, c.z, solar_system_index);
}

// ─── Star Placement ───────────────────────────────────────────────────────────

StarPosition
GalaxyGeometry::star_position_in_region(int region_x, int region_y, int region_z,
                                        int solar_system_index) noexcept {
    const auto digest = detail::sha256(
        detail::star_seed(region_x, region_y, region_z, solar_system_index));

    const Coordinate base = to_signed(RegionCoordinate{region_x, region_y, region_z});

    const StarPosition offset{
        detail::unit_offset(detail::read_window(digest, 0)) * constants::STAR_SPREAD,
        detail::unit_offset(detail::read_window(digest, 1)) * constants::STAR_SPREAD,
        detail::unit_offset(detail::read_window(digest, 2)) * constants::STAR_SPREAD,
    };

    return StarPosition{
        static_cast<double>(base.x) + offset.x(),
        static_cast<double>(base.y) + offset.y(),
        static_cast<double>(base.z) + offset.z(),
    };
}

StarPosition
GalaxyGeometry::star_position_in_region(const RegionCoordinate& region,
                                        int solar_system_index) noexcept {
    return star_position_in_region(region.region_x, region.region_y,
                                   region.region_z, solar_system_index);
}

// ─── Region Helpers ───────────────────────────────────────────────────────────

Coordinate GalaxyGeometry::to_signed(const RegionCoordinate& region) noexcept {
    return Coordinate{
        .x = split::xz_to_signed(region.region_x),
        .y = split::y_to_signed(region.region_y),
        .z = split::xz_to_signed(region.region_z),
    };
}

std::string GalaxyGeometry::region_name(const RegionCoordinate& region) {
    return fmt::format("Region [{:02X}:{:X}:{:02X}]",
                       region.region_x, region.region_y, region.region_z);
}

} // namespace glyphnav::geometry
