#pragma once

/// @file include/glyphnav/split_range.hpp
/// @brief Split-range sign rule shared by the codec and the geometry module.
///
/// An unsigned N-bit glyph field represents a signed coordinate: the lower
/// half of the range (0 … modulus/2 − 1) maps to itself, the upper half maps
/// to `field − modulus`. The inverse adds the modulus to negative values.
///
/// ## Guarantees
/// - constexpr, noexcept, no state
/// - `to_field(to_signed(f)) == f` for every f in [0, modulus)

#include "glyphnav/constants.hpp"

namespace glyphnav::split {

/// Decode a raw field of the given modulus to its signed coordinate.
[[nodiscard]] constexpr int to_signed(int field, int modulus) noexcept {
    return field <= (modulus / 2 - 1) ? field : field - modulus;
}

/// Encode a signed coordinate into a raw field of the given modulus.
[[nodiscard]] constexpr int to_field(int coordinate, int modulus) noexcept {
    return coordinate >= 0 ? coordinate : coordinate + modulus;
}

/// X and Z: 12-bit fields.
[[nodiscard]] constexpr int xz_to_signed(int field) noexcept {
    return to_signed(field, constants::XZ_MODULUS);
}

[[nodiscard]] constexpr int xz_to_field(int coordinate) noexcept {
    return to_field(coordinate, constants::XZ_MODULUS);
}

/// Y: 8-bit field.
[[nodiscard]] constexpr int y_to_signed(int field) noexcept {
    return to_signed(field, constants::Y_MODULUS);
}

[[nodiscard]] constexpr int y_to_field(int coordinate) noexcept {
    return to_field(coordinate, constants::Y_MODULUS);
}

static_assert(xz_to_signed(0x7FF) == 2047);
static_assert(xz_to_signed(0x801) == -2047);
static_assert(xz_to_signed(0xFFF) == -1);
static_assert(y_to_signed(0x7F) == 127);
static_assert(y_to_signed(0x81) == -127);
static_assert(xz_to_field(-1) == 0xFFF);
static_assert(y_to_field(-127) == 0x81);

} // namespace glyphnav::split
