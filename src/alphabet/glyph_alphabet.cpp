/// @file src/alphabet/glyph_alphabet.cpp
/// @brief Glyph Alphabet — static symbol table lookups.

#include "glyphnav/alphabet.hpp"
#include "glyphnav/codec.hpp"
#include "glyphnav/constants.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>

namespace glyphnav::alphabet {

namespace {

constexpr std::array<GlyphSymbol, 16> kSymbols{{
    {'0', "sunset",    "IMG_9202.jpg"},
    {'1', "bird",      "IMG_9203.jpg"},
    {'2', "face",      "IMG_9204.jpg"},
    {'3', "diplo",     "IMG_9205.jpg"},
    {'4', "eclipse",   "IMG_9206.jpg"},
    {'5', "balloon",   "IMG_9207.jpg"},
    {'6', "boat",      "IMG_9208.png"},
    {'7', "bug",       "IMG_9209.jpg"},
    {'8', "dragonfly", "IMG_9210.jpg"},
    {'9', "galaxy",    "IMG_9211.jpg"},
    {'A', "voxel",     "IMG_9212.jpg"},
    {'B', "fish",      "IMG_9213.jpg"},
    {'C', "tent",      "IMG_9214.jpg"},
    {'D', "rocket",    "IMG_9215.jpg"},
    {'E', "tree",      "IMG_9216.jpg"},
    {'F', "atlas",     "IMG_9217.jpg"},
}};

const GlyphSymbol* find_by_hex(char hex) noexcept {
    const char upper = static_cast<char>(std::toupper(static_cast<unsigned char>(hex)));
    const auto it = std::find_if(kSymbols.begin(), kSymbols.end(),
                                 [upper](const GlyphSymbol& s) { return s.hex == upper; });
    return it == kSymbols.end() ? nullptr : &*it;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char l, char r) {
               return std::tolower(static_cast<unsigned char>(l)) ==
                      std::tolower(static_cast<unsigned char>(r));
           });
}

} // namespace

// ─── Table Lookups ────────────────────────────────────────────────────────────

const std::array<GlyphSymbol, 16>& symbols() noexcept {
    return kSymbols;
}

std::optional<char> hex_for_name(std::string_view name) noexcept {
    for (const auto& s : kSymbols) {
        if (iequals(s.name, name)) {
            return s.hex;
        }
    }
    return std::nullopt;
}

std::optional<std::string_view> name_for_hex(char hex) noexcept {
    if (const auto* s = find_by_hex(hex)) {
        return s->name;
    }
    return std::nullopt;
}

std::optional<std::string_view> image_filename(char hex) noexcept {
    if (const auto* s = find_by_hex(hex)) {
        return s->image;
    }
    return std::nullopt;
}

// ─── Sequences ────────────────────────────────────────────────────────────────

Result<std::string> parse_glyph_sequence(std::span<const std::string> names) {
    if (names.size() != constants::GLYPH_LENGTH) {
        return GlyphError{
            ErrorKind::FormatError,
            fmt::format("Expected {} glyphs, got {}", constants::GLYPH_LENGTH, names.size())};
    }

    std::string glyph;
    glyph.reserve(constants::GLYPH_LENGTH);
    for (const auto& name : names) {
        const auto hex = hex_for_name(name);
        if (!hex) {
            return GlyphError{ErrorKind::FormatError,
                              fmt::format("Unknown glyph name: {}", name)};
        }
        glyph.push_back(*hex);
    }
    return glyph;
}

std::optional<std::vector<std::string_view>> glyph_names(std::string_view glyph) {
    const std::string canonical = codec::GlyphCodec::normalize(glyph);
    if (!codec::GlyphCodec::parse_fields(canonical)) {
        return std::nullopt;
    }

    std::vector<std::string_view> names;
    names.reserve(canonical.size());
    for (const char c : canonical) {
        names.push_back(*name_for_hex(c));
    }
    return names;
}

} // namespace glyphnav::alphabet
