#pragma once

/// @file include/glyphnav/types.hpp
/// @brief Shared value types for the glyphnav portal-glyph library.
///
/// All modules include this file. It defines the coordinate value types, the
/// classification tags, the warning and error taxonomy, and the Eigen-based
/// aliases used for floating-point map positions.

#include <Eigen/Dense>

#include <optional>
#include <string>
#include <variant>

namespace glyphnav {

// ─── Coordinates ──────────────────────────────────────────────────────────────

/// Signed galaxy coordinate decoded from a glyph.
/// Ranges: x, z ∈ [-2047, 2047]; y ∈ [-127, 127].
struct Coordinate {
    int x;
    int y;
    int z;

    bool operator==(const Coordinate&) const = default;
};

/// Unsigned region-grid coordinate: numerically the raw glyph hex fields.
/// Ranges: region_x, region_z ∈ [0, 4095]; region_y ∈ [0, 255].
struct RegionCoordinate {
    int region_x;
    int region_y;
    int region_z;

    bool operator==(const RegionCoordinate&) const = default;
};

/// Hash-derived position of a star inside its region. Rendering aid only:
/// recompute from (region, solar system) and never treat as stored data.
using StarPosition = Eigen::Vector3d;

// ─── Classification ───────────────────────────────────────────────────────────

/// Map accessibility of a system.
enum class Classification {
    Accessible,   ///< Regular system reachable from the galactic map
    Phantom,      ///< Solar-system index hidden from the galactic map
    CoreAnomaly,  ///< Non-phantom index inside the core void
    CorePhantom,  ///< Phantom index inside the core void
};

/// `accessible`, `phantom`, `core_anomaly` or `core_phantom`.
[[nodiscard]] const char* to_string(Classification c) noexcept;

/// Derived accessibility tags for one (coordinate, solar system) pair.
struct SystemClassification {
    bool           is_phantom;
    bool           is_in_core;
    bool           is_accessible;   ///< !is_phantom && !is_in_core
    Classification classification;

    bool operator==(const SystemClassification&) const = default;
};

// ─── Warnings ─────────────────────────────────────────────────────────────────

/// The five positional sub-fields of a glyph.
enum class GlyphField {
    Planet,
    SolarSystem,
    Y,
    Z,
    X,
};

[[nodiscard]] const char* to_string(GlyphField f) noexcept;

/// Non-fatal conditions attached to a successful validate/decode.
enum class WarningKind {
    UnusualSentinelValue,  ///< A field holds a value the game never emits
    PhantomStar,           ///< Solar-system index is a phantom star
    CoreVoid,              ///< Coordinate lies inside the core void
};

[[nodiscard]] const char* to_string(WarningKind k) noexcept;

/// A single advisory. `field` is set only for UnusualSentinelValue.
struct GlyphWarning {
    WarningKind               kind;
    std::optional<GlyphField> field;

    bool operator==(const GlyphWarning&) const = default;
};

// ─── Errors ───────────────────────────────────────────────────────────────────

enum class ErrorKind {
    FormatError,    ///< Wrong length or non-hex characters
    RangeError,     ///< Encode argument out of bounds, or sentinel produced
    CoreVoidError,  ///< Encode target inside the core void
};

[[nodiscard]] const char* to_string(ErrorKind k) noexcept;

/// Typed failure returned across the library boundary. `message` names the
/// offending field and its valid range.
struct GlyphError {
    ErrorKind   kind;
    std::string message;
};

/// Value-or-error return type of every fallible glyphnav operation.
template <typename T>
using Result = std::variant<T, GlyphError>;

} // namespace glyphnav
