/// @file tests/alphabet/test_glyph_alphabet.cpp
/// @brief Tests for the glyph name / hex / image table.

#include "glyphnav/alphabet.hpp"

#include <gtest/gtest.h>

#include <set>
#include <string>
#include <variant>
#include <vector>

using namespace glyphnav;
using namespace glyphnav::alphabet;

namespace {

const std::vector<std::string> kHavenPrime{
    "bird", "sunset", "voxel", "eclipse", "atlas", "diplo",
    "tree", "bug", "fish", "face", "tent", "bird",
};

} // namespace

// ─── Table ────────────────────────────────────────────────────────────────────

TEST(GlyphAlphabet, TableHasSixteenDistinctEntries) {
    std::set<char>             hexes;
    std::set<std::string_view> names;
    for (const auto& s : symbols()) {
        hexes.insert(s.hex);
        names.insert(s.name);
    }
    EXPECT_EQ(hexes.size(), 16u);
    EXPECT_EQ(names.size(), 16u);
    EXPECT_EQ(symbols().front().hex, '0');
    EXPECT_EQ(symbols().back().hex, 'F');
}

TEST(GlyphAlphabet, NameForHex) {
    EXPECT_EQ(name_for_hex('0'), "sunset");
    EXPECT_EQ(name_for_hex('6'), "boat");
    EXPECT_EQ(name_for_hex('F'), "atlas");
    EXPECT_EQ(name_for_hex('f'), "atlas");
    EXPECT_FALSE(name_for_hex('G').has_value());
}

TEST(GlyphAlphabet, HexForNameIsCaseInsensitive) {
    EXPECT_EQ(hex_for_name("dragonfly"), '8');
    EXPECT_EQ(hex_for_name("Voxel"), 'A');
    EXPECT_EQ(hex_for_name("ATLAS"), 'F');
    EXPECT_FALSE(hex_for_name("spaceship").has_value());
    EXPECT_FALSE(hex_for_name("").has_value());
}

TEST(GlyphAlphabet, ImageFilenames) {
    EXPECT_EQ(image_filename('0'), "IMG_9202.jpg");
    EXPECT_EQ(image_filename('6'), "IMG_9208.png");
    EXPECT_EQ(image_filename('F'), "IMG_9217.jpg");
    EXPECT_FALSE(image_filename('x').has_value());
}

// ─── parse_glyph_sequence ─────────────────────────────────────────────────────

TEST(GlyphSequence, ParsesTwelveNames) {
    const auto r = parse_glyph_sequence(kHavenPrime);
    ASSERT_TRUE(std::holds_alternative<std::string>(r));
    EXPECT_EQ(std::get<std::string>(r), "10A4F3E7B2C1");
}

TEST(GlyphSequence, WrongCountIsFormatError) {
    const std::vector<std::string> short_seq(kHavenPrime.begin(), kHavenPrime.begin() + 11);
    const auto r = parse_glyph_sequence(short_seq);
    ASSERT_TRUE(std::holds_alternative<GlyphError>(r));
    const auto& err = std::get<GlyphError>(r);
    EXPECT_EQ(err.kind, ErrorKind::FormatError);
    EXPECT_EQ(err.message, "Expected 12 glyphs, got 11");
}

TEST(GlyphSequence, UnknownNameIsFormatError) {
    auto names = kHavenPrime;
    names[3] = "comet";
    const auto r = parse_glyph_sequence(names);
    ASSERT_TRUE(std::holds_alternative<GlyphError>(r));
    EXPECT_EQ(std::get<GlyphError>(r).message, "Unknown glyph name: comet");
}

// ─── glyph_names ──────────────────────────────────────────────────────────────

TEST(GlyphNames, InverseOfParseSequence) {
    const auto names = glyph_names("1-0a4-f3-e7b-2c1");
    ASSERT_TRUE(names.has_value());
    ASSERT_EQ(names->size(), 12u);
    for (std::size_t i = 0; i < names->size(); ++i) {
        EXPECT_EQ((*names)[i], kHavenPrime[i]) << "digit " << i;
    }
}

TEST(GlyphNames, MalformedGlyphIsNullopt) {
    EXPECT_FALSE(glyph_names("10A4").has_value());
    EXPECT_FALSE(glyph_names("10A4F3E7B2CZ").has_value());
}
