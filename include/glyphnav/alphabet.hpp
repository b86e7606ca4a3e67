#pragma once

/// @file include/glyphnav/alphabet.hpp
/// @brief Glyph Alphabet — the 16 portal symbols behind the hex digits.
///
/// # Module: Glyph Alphabet
///
/// ## Responsibility
/// Static lookup between hex digits, the community glyph names players type
/// (`sunset`, `bird`, …, `atlas`) and the glyph image files shown by the UI.
///
/// | Hex | Name      | Image        |
/// |-----|-----------|--------------|
/// | 0   | sunset    | IMG_9202.jpg |
/// | 1   | bird      | IMG_9203.jpg |
/// | …   | …         | …            |
/// | 6   | boat      | IMG_9208.png |
/// | …   | …         | …            |
/// | F   | atlas     | IMG_9217.jpg |
///
/// ## Guarantees
/// - Lookups return `std::optional`; unknown digits or names never throw
/// - Returned string_views point into static storage

#include "glyphnav/types.hpp"

#include <array>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace glyphnav::alphabet {

/// One row of the glyph table.
struct GlyphSymbol {
    char             hex;    ///< Uppercase hex digit
    std::string_view name;   ///< Community glyph name (lowercase)
    std::string_view image;  ///< Image filename
};

/// The full table, ordered by hex value.
[[nodiscard]] const std::array<GlyphSymbol, 16>& symbols() noexcept;

/// Hex digit for a glyph name (case-insensitive).
[[nodiscard]] std::optional<char> hex_for_name(std::string_view name) noexcept;

/// Glyph name for a hex digit (either case).
[[nodiscard]] std::optional<std::string_view> name_for_hex(char hex) noexcept;

/// Image filename for a hex digit (either case).
[[nodiscard]] std::optional<std::string_view> image_filename(char hex) noexcept;

/// Convert a sequence of 12 glyph names to a canonical glyph string.
///
/// # Returns
/// - 12-digit uppercase glyph
/// - `FormatError` if the sequence is not 12 long or a name is unknown
[[nodiscard]] Result<std::string>
parse_glyph_sequence(std::span<const std::string> names);

/// Glyph names for every digit of `glyph` (normalized first).
/// `nullopt` if the glyph is not 12 hex digits.
[[nodiscard]] std::optional<std::vector<std::string_view>>
glyph_names(std::string_view glyph);

} // namespace glyphnav::alphabet
