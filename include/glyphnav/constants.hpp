#pragma once

#include <cstddef>

/// @file include/glyphnav/constants.hpp
/// @brief Galaxy and portal-glyph constants for the glyphnav library.
///
/// Every numeric rule of the glyph layout lives here so that the codec, the
/// geometry classifier and the catalog agree on one set of values.

namespace glyphnav::constants {

// ─── Glyph Layout ─────────────────────────────────────────────────────────────

/// Number of hex digits in a canonical glyph (P SSS YY ZZZ XXX).
static constexpr std::size_t GLYPH_LENGTH = 12;

/// Field offsets and widths inside the canonical glyph string.
static constexpr std::size_t PLANET_OFFSET       = 0;
static constexpr std::size_t PLANET_WIDTH        = 1;
static constexpr std::size_t SOLAR_SYSTEM_OFFSET = 1;
static constexpr std::size_t SOLAR_SYSTEM_WIDTH  = 3;
static constexpr std::size_t Y_OFFSET            = 4;
static constexpr std::size_t Y_WIDTH             = 2;
static constexpr std::size_t Z_OFFSET            = 6;
static constexpr std::size_t Z_WIDTH             = 3;
static constexpr std::size_t X_OFFSET            = 9;
static constexpr std::size_t X_WIDTH             = 3;

/// Length of the system-identity key: every digit except the planet digit.
static constexpr std::size_t SYSTEM_KEY_LENGTH = GLYPH_LENGTH - PLANET_WIDTH;

// ─── Split-Range Sign Rule ────────────────────────────────────────────────────

/// 12-bit X/Z fields: 000–7FF are non-negative, 801–FFF are negative.
static constexpr int XZ_MODULUS  = 0x1000;
static constexpr int XZ_HALF_MAX = 0x7FF;

/// 8-bit Y field: 00–7F are non-negative, 81–FF are negative.
static constexpr int Y_MODULUS  = 0x100;
static constexpr int Y_HALF_MAX = 0x7F;

/// Raw field values the game never emits.
static constexpr int XZ_SENTINEL = 0x800;
static constexpr int Y_SENTINEL  = 0x80;

// ─── Coordinate Ranges ────────────────────────────────────────────────────────

static constexpr int X_MIN = -2047;
static constexpr int X_MAX =  2047;
static constexpr int Y_MIN = -127;
static constexpr int Y_MAX =  127;
static constexpr int Z_MIN = -2047;
static constexpr int Z_MAX =  2047;

static constexpr int PLANET_MIN = 0;
static constexpr int PLANET_MAX = 15;

/// Solar system index 000 is a sentinel; 001–FFF are encodable.
static constexpr int SOLAR_SYSTEM_MIN = 1;
static constexpr int SOLAR_SYSTEM_MAX = 4095;

// ─── Core Void ────────────────────────────────────────────────────────────────

/// Ellipsoid radii of the galactic-core exclusion zone, in coordinate units.
/// X/Z: ~3,200 ly at ~400 ly per region. Y: the X/Z radius scaled to the
/// flattened 256-unit axis, rounded up.
static constexpr double CORE_VOID_RADIUS_XZ = 8.0;
static constexpr double CORE_VOID_RADIUS_Y  = 1.0;

// ─── Phantom Stars ────────────────────────────────────────────────────────────

/// Indices at or above this value are not shown on the galactic map.
static constexpr int PHANTOM_SSS_THRESHOLD = 0x258;

/// Index 0x3E8 appears on the map despite being above the threshold.
static constexpr int PHANTOM_SSS_EXCEPTION = 0x3E8;

// ─── Visualisation ────────────────────────────────────────────────────────────

/// Total width of the hash-derived star offset inside a region (±32 units).
static constexpr double STAR_SPREAD = 64.0;

/// Presentation scale applied to display coordinates (1:5).
static constexpr double DISPLAY_SCALE = 0.2;

// ─── Catalog Defaults ─────────────────────────────────────────────────────────

static constexpr const char* DEFAULT_GALAXY  = "Euclid";
static constexpr const char* DEFAULT_REALITY = "Normal";

} // namespace glyphnav::constants
