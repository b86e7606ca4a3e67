#pragma once

/// @file include/glyphnav/codec.hpp
/// @brief Glyph Codec — public API.
///
/// # Module: Glyph Codec
///
/// ## Responsibility
/// Bit-exact, reversible translation between the 12-hex-digit portal glyph
/// and structured coordinate data, plus format validation.
///
/// ## Glyph Layout
/// ```
///   P   SSS  YY  ZZZ  XXX
///   0   1-3  4-5 6-8  9-11
/// ```
/// Display form: `P-SSS-YY-ZZZ-XXX`. Input is normalized before parsing:
/// whitespace and hyphens are stripped and letters are uppercased.
///
/// ## Usage
/// ```cpp
/// GlyphCodec codec;
/// auto decoded = codec.decode("10A4F3E7B2C1");
/// if (auto* d = std::get_if<DecodedGlyph>(&decoded)) {
///     fmt::print("{} -> ({}, {}, {})\n", d->glyph_formatted,
///                d->coordinate.x, d->coordinate.y, d->coordinate.z);
/// }
/// ```
///
/// ## Guarantees
/// - No exceptions for well-typed input; failures are `GlyphError` values
/// - `validate` and `decode` only fail on format errors; sentinel values,
///   phantom stars and the core void surface as warnings
/// - `encode` is strict: it refuses out-of-range arguments, sentinel fields
///   and coordinates inside the core void
/// - decode(encode(x, y, z, p, s)) returns exactly (x, y, z, p, s)

#include "glyphnav/geometry.hpp"
#include "glyphnav/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace glyphnav::codec {

// ─── GlyphFields ──────────────────────────────────────────────────────────────

/// Raw unsigned sub-fields of a canonical glyph.
struct GlyphFields {
    int planet;        ///< 0–15
    int solar_system;  ///< 0–4095 (0 is a sentinel)
    int y_hex;         ///< 0–255  (0x80 is a sentinel)
    int z_hex;         ///< 0–4095 (0x800 is a sentinel)
    int x_hex;         ///< 0–4095 (0x800 is a sentinel)

    bool operator==(const GlyphFields&) const = default;
};

// ─── ValidationOutcome ────────────────────────────────────────────────────────

/// Result of a successful format check.
struct ValidationOutcome {
    std::string               glyph;     ///< Canonical 12-digit form
    GlyphFields               fields;
    std::vector<GlyphWarning> warnings;  ///< UnusualSentinelValue only
};

// ─── DecodedGlyph ─────────────────────────────────────────────────────────────

/// Presentation-only scaled coordinates.
struct DisplayCoordinates {
    Eigen::Vector3d region;  ///< Signed coordinate × display scale
    Eigen::Vector3d star;    ///< Star position × display scale
};

/// Everything derived from a single glyph.
struct DecodedGlyph {
    Coordinate           coordinate;       ///< Signed region coordinate
    StarPosition         star;             ///< Hash-derived plot position
    int                  planet;
    int                  solar_system;
    RegionCoordinate     region;           ///< Raw (x_hex, y_hex, z_hex)
    std::string          glyph;            ///< Canonical form
    std::string          glyph_formatted;  ///< P-SSS-YY-ZZZ-XXX
    SystemClassification classification;
    std::vector<GlyphWarning> warnings;    ///< Sentinel, phantom, core void

    /// Present only when decode was asked to apply the display scale.
    std::optional<DisplayCoordinates> display;
};

/// Render warnings as the legacy `"; "`-joined text, or nullopt if none.
[[nodiscard]] std::optional<std::string> render_warnings(const DecodedGlyph& decoded);

/// Human-readable text for a single warning in the context of `decoded`.
[[nodiscard]] std::string describe(const GlyphWarning& warning,
                                   const DecodedGlyph& decoded);

// ─── GlyphCodec ───────────────────────────────────────────────────────────────

class GlyphCodec {
public:
    /// Construct with the geometry rules used for classification and for
    /// the encode-side core-void check.
    explicit GlyphCodec(geometry::GeometryConfig config = geometry::GeometryConfig{}) noexcept;

    /// Strip whitespace and hyphens, uppercase ASCII letters.
    [[nodiscard]] static std::string normalize(std::string_view raw);

    /// Check length and charset, then report sentinel values as warnings.
    ///
    /// # Returns
    /// - `ValidationOutcome` for any 12-hex-digit input (after normalization)
    /// - `GlyphError{FormatError}` for empty input, wrong digit count, or
    ///   non-hex characters; the message states the digit count found
    [[nodiscard]] static Result<ValidationOutcome> validate(std::string_view glyph);

    /// Decode a glyph into coordinates, star position and classification.
    ///
    /// # Arguments
    /// * `glyph`       — Raw or display-form glyph
    /// * `apply_scale` — Also emit display coordinates (× display_scale)
    ///
    /// # Returns
    /// - `DecodedGlyph` for every syntactically valid glyph
    /// - `GlyphError{FormatError}` propagated from `validate`
    [[nodiscard]] Result<DecodedGlyph> decode(std::string_view glyph,
                                              bool apply_scale = false) const;

    /// Encode a signed coordinate and indices into a canonical glyph.
    ///
    /// # Returns
    /// - 12-digit uppercase glyph
    /// - `RangeError` if an argument is outside its range, or a field would
    ///   land on a sentinel (0x80 / 0x800) or on the all-zero glyph
    /// - `CoreVoidError` if (x, y, z) is inside the core void
    [[nodiscard]] Result<std::string> encode(int x, int y, int z,
                                             int planet = 0,
                                             int solar_system = 1) const;

    /// Insert hyphens: `P-SSS-YY-ZZZ-XXX`. Input that is not exactly 12
    /// characters is returned unchanged.
    [[nodiscard]] static std::string format(std::string_view glyph);

    /// Parse the five sub-fields of a canonical glyph.
    /// `nullopt` unless `canonical` is exactly 12 uppercase hex digits.
    [[nodiscard]] static std::optional<GlyphFields>
    parse_fields(std::string_view canonical) noexcept;

    /// Signed coordinate of a set of raw fields (split-range rule).
    [[nodiscard]] static Coordinate to_coordinate(const GlyphFields& fields) noexcept;

    [[nodiscard]] const geometry::GalaxyGeometry& geometry() const noexcept {
        return geometry_;
    }

private:
    /// Sentinel-value warnings for already-parsed fields, in field order.
    [[nodiscard]] static std::vector<GlyphWarning>
    sentinel_warnings(const GlyphFields& fields);

    geometry::GalaxyGeometry geometry_;
};

} // namespace glyphnav::codec
