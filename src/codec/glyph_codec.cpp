/// @file src/codec/glyph_codec.cpp
/// @brief Glyph Codec — validate, decode, encode, format.

#include "glyphnav/codec.hpp"
#include "glyphnav/constants.hpp"
#include "glyphnav/split_range.hpp"

#include <fmt/core.h>

#include <cctype>
#include <utility>

namespace glyphnav::codec {

namespace {

/// Value of an uppercase hex digit, or -1.
int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

/// Parse `width` hex digits starting at `offset`. Caller guarantees bounds
/// and charset.
int parse_hex(std::string_view s, std::size_t offset, std::size_t width) noexcept {
    int value = 0;
    for (std::size_t i = offset; i < offset + width; ++i) {
        value = value * 16 + hex_value(s[i]);
    }
    return value;
}

GlyphError range_error(std::string message) {
    return GlyphError{ErrorKind::RangeError, std::move(message)};
}

} // namespace

// ─── Construction ─────────────────────────────────────────────────────────────

GlyphCodec::GlyphCodec(geometry::GeometryConfig config) noexcept
    : geometry_(config)
{}

// ─── Normalization / Parsing ──────────────────────────────────────────────────

std::string GlyphCodec::normalize(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    for (const char c : raw) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc) || c == '-') {
            continue;
        }
        out.push_back(static_cast<char>(std::toupper(uc)));
    }
    return out;
}

std::optional<GlyphFields>
GlyphCodec::parse_fields(std::string_view canonical) noexcept {
    if (canonical.size() != constants::GLYPH_LENGTH) {
        return std::nullopt;
    }
    for (const char c : canonical) {
        if (hex_value(c) < 0) {
            return std::nullopt;
        }
    }

    return GlyphFields{
        .planet       = parse_hex(canonical, constants::PLANET_OFFSET, constants::PLANET_WIDTH),
        .solar_system = parse_hex(canonical, constants::SOLAR_SYSTEM_OFFSET, constants::SOLAR_SYSTEM_WIDTH),
        .y_hex        = parse_hex(canonical, constants::Y_OFFSET, constants::Y_WIDTH),
        .z_hex        = parse_hex(canonical, constants::Z_OFFSET, constants::Z_WIDTH),
        .x_hex        = parse_hex(canonical, constants::X_OFFSET, constants::X_WIDTH),
    };
}

Coordinate GlyphCodec::to_coordinate(const GlyphFields& fields) noexcept {
    return Coordinate{
        .x = split::xz_to_signed(fields.x_hex),
        .y = split::y_to_signed(fields.y_hex),
        .z = split::xz_to_signed(fields.z_hex),
    };
}

std::vector<GlyphWarning> GlyphCodec::sentinel_warnings(const GlyphFields& fields) {
    std::vector<GlyphWarning> warnings;
    if (fields.solar_system == 0) {
        warnings.push_back({WarningKind::UnusualSentinelValue, GlyphField::SolarSystem});
    }
    if (fields.y_hex == constants::Y_SENTINEL) {
        warnings.push_back({WarningKind::UnusualSentinelValue, GlyphField::Y});
    }
    if (fields.z_hex == constants::XZ_SENTINEL) {
        warnings.push_back({WarningKind::UnusualSentinelValue, GlyphField::Z});
    }
    if (fields.x_hex == constants::XZ_SENTINEL) {
        warnings.push_back({WarningKind::UnusualSentinelValue, GlyphField::X});
    }
    return warnings;
}

// ─── validate ─────────────────────────────────────────────────────────────────

Result<ValidationOutcome> GlyphCodec::validate(std::string_view glyph) {
    std::string canonical = normalize(glyph);

    if (canonical.empty()) {
        return GlyphError{ErrorKind::FormatError, "Glyph code cannot be empty"};
    }

    if (canonical.size() != constants::GLYPH_LENGTH) {
        return GlyphError{
            ErrorKind::FormatError,
            fmt::format("Glyph must be {} hex digits (got {})",
                        constants::GLYPH_LENGTH, canonical.size())};
    }

    for (std::size_t i = 0; i < canonical.size(); ++i) {
        if (hex_value(canonical[i]) < 0) {
            return GlyphError{
                ErrorKind::FormatError,
                fmt::format("Glyph must contain only hex digits (0-9, A-F); "
                            "found '{}' at position {}", canonical[i], i)};
        }
    }

    // Charset and length are checked above, so this cannot miss.
    const GlyphFields fields = *parse_fields(canonical);

    return ValidationOutcome{
        .glyph    = std::move(canonical),
        .fields   = fields,
        .warnings = sentinel_warnings(fields),
    };
}

// ─── decode ───────────────────────────────────────────────────────────────────

Result<DecodedGlyph> GlyphCodec::decode(std::string_view glyph,
                                        bool apply_scale) const {
    auto validated = validate(glyph);
    if (auto* err = std::get_if<GlyphError>(&validated)) {
        return std::move(*err);
    }
    auto& outcome = std::get<ValidationOutcome>(validated);
    const GlyphFields& f = outcome.fields;

    const Coordinate coord = to_coordinate(f);
    const RegionCoordinate region{f.x_hex, f.y_hex, f.z_hex};
    const StarPosition star =
        geometry::GalaxyGeometry::star_position_in_region(region, f.solar_system);
    const SystemClassification cls = geometry_.classify(coord, f.solar_system);

    std::vector<GlyphWarning> warnings = std::move(outcome.warnings);
    if (cls.is_phantom) {
        warnings.push_back({WarningKind::PhantomStar, std::nullopt});
    }
    if (cls.is_in_core) {
        warnings.push_back({WarningKind::CoreVoid, std::nullopt});
    }

    std::optional<DisplayCoordinates> display;
    if (apply_scale) {
        const double scale = geometry_.config().display_scale;
        const Eigen::Vector3d signed_region{
            static_cast<double>(coord.x),
            static_cast<double>(coord.y),
            static_cast<double>(coord.z),
        };
        display = DisplayCoordinates{
            .region = signed_region * scale,
            .star   = star * scale,
        };
    }

    std::string formatted = format(outcome.glyph);

    return DecodedGlyph{
        .coordinate      = coord,
        .star            = star,
        .planet          = f.planet,
        .solar_system    = f.solar_system,
        .region          = region,
        .glyph           = std::move(outcome.glyph),
        .glyph_formatted = std::move(formatted),
        .classification  = cls,
        .warnings        = std::move(warnings),
        .display         = display,
    };
}

// ─── encode ───────────────────────────────────────────────────────────────────

Result<std::string> GlyphCodec::encode(int x, int y, int z,
                                       int planet, int solar_system) const {
    using namespace constants;

    if (x < X_MIN || x > X_MAX) {
        return range_error(fmt::format(
            "X coordinate {} out of range ({} to +{})", x, X_MIN, X_MAX));
    }
    if (y < Y_MIN || y > Y_MAX) {
        return range_error(fmt::format(
            "Y coordinate {} out of range ({} to +{})", y, Y_MIN, Y_MAX));
    }
    if (z < Z_MIN || z > Z_MAX) {
        return range_error(fmt::format(
            "Z coordinate {} out of range ({} to +{})", z, Z_MIN, Z_MAX));
    }
    if (planet < PLANET_MIN || planet > PLANET_MAX) {
        return range_error(fmt::format(
            "Planet index {} out of range ({}-{})", planet, PLANET_MIN, PLANET_MAX));
    }
    if (solar_system < SOLAR_SYSTEM_MIN || solar_system > SOLAR_SYSTEM_MAX) {
        return range_error(fmt::format(
            "Solar system index {} out of range ({}-{})",
            solar_system, SOLAR_SYSTEM_MIN, SOLAR_SYSTEM_MAX));
    }

    // Decoding a void glyph only warns; manufacturing one is refused.
    if (geometry_.is_in_core_void(x, y, z)) {
        return GlyphError{
            ErrorKind::CoreVoidError,
            fmt::format("Coordinates ({}, {}, {}) are within the galactic core void "
                        "(X/Z radius: {}, Y radius: {}); no star system can be placed there",
                        x, y, z, CORE_VOID_RADIUS_XZ, CORE_VOID_RADIUS_Y)};
    }

    const int x_hex = split::xz_to_field(x);
    const int y_hex = split::y_to_field(y);
    const int z_hex = split::xz_to_field(z);

    if (y_hex == Y_SENTINEL) {
        return range_error(fmt::format(
            "Y coordinate {} maps to forbidden hex value 0x{:02X}", y, Y_SENTINEL));
    }
    if (x_hex == XZ_SENTINEL) {
        return range_error(fmt::format(
            "X coordinate {} maps to forbidden hex value 0x{:03X}", x, XZ_SENTINEL));
    }
    if (z_hex == XZ_SENTINEL) {
        return range_error(fmt::format(
            "Z coordinate {} maps to forbidden hex value 0x{:03X}", z, XZ_SENTINEL));
    }
    if (x_hex == 0 && y_hex == 0 && z_hex == 0) {
        return range_error("X, Y and Z cannot all be zero (the all-zero address is forbidden)");
    }

    return fmt::format("{:01X}{:03X}{:02X}{:03X}{:03X}",
                       planet, solar_system, y_hex, z_hex, x_hex);
}

// ─── format ───────────────────────────────────────────────────────────────────

std::string GlyphCodec::format(std::string_view glyph) {
    const std::string g = normalize(glyph);
    if (g.size() != constants::GLYPH_LENGTH) {
        return std::string(glyph);
    }

    return fmt::format("{}-{}-{}-{}-{}",
                       g.substr(constants::PLANET_OFFSET, constants::PLANET_WIDTH),
                       g.substr(constants::SOLAR_SYSTEM_OFFSET, constants::SOLAR_SYSTEM_WIDTH),
                       g.substr(constants::Y_OFFSET, constants::Y_WIDTH),
                       g.substr(constants::Z_OFFSET, constants::Z_WIDTH),
                       g.substr(constants::X_OFFSET, constants::X_WIDTH));
}

} // namespace glyphnav::codec
