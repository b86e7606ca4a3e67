/// @file tests/geometry/test_star_position.cpp
/// @brief Tests for deterministic star placement inside a region.

#include "glyphnav/geometry.hpp"
#include "glyphnav/constants.hpp"
#include "../../src/geometry/star_hash.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstring>
#include <set>
#include <tuple>

using namespace glyphnav;
using namespace glyphnav::geometry;
using namespace glyphnav::constants;

// ─── detail: digest helpers ───────────────────────────────────────────────────

TEST(StarHashDetail, SeedFormat) {
    EXPECT_EQ(detail::star_seed(705, 243, 3707, 164), "NMS:705:243:3707:164");
    EXPECT_EQ(detail::star_seed(0, 0, 0, 1), "NMS:0:0:0:1");
}

TEST(StarHashDetail, Sha256KnownVector) {
    const auto d = detail::sha256("abc");
    const detail::Digest expected{
        0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea,
        0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
        0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c,
        0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad,
    };
    EXPECT_EQ(d, expected);
}

TEST(StarHashDetail, ReadWindowIsBigEndian) {
    detail::Digest d{};
    d[4] = 0x01; d[5] = 0x02; d[6] = 0x03; d[7] = 0x04;
    EXPECT_EQ(detail::read_window(d, 1), 0x01020304u);
    EXPECT_EQ(detail::read_window(d, 0), 0u);
}

TEST(StarHashDetail, UnitOffsetEndpoints) {
    EXPECT_DOUBLE_EQ(detail::unit_offset(0u), -0.5);
    EXPECT_DOUBLE_EQ(detail::unit_offset(0xFFFFFFFFu), 0.5);
}

// ─── star_position_in_region: known values ───────────────────────────────────

TEST(StarPosition, KnownRegion) {
    const auto p = GalaxyGeometry::star_position_in_region(705, 243, 3707, 164);
    EXPECT_DOUBLE_EQ(p.x(), 718.8322738366742);
    EXPECT_DOUBLE_EQ(p.y(), -40.16890969759992);
    EXPECT_DOUBLE_EQ(p.z(), -377.5564913946568);
}

TEST(StarPosition, OriginRegion) {
    const auto p = GalaxyGeometry::star_position_in_region(0, 0, 0, 1);
    EXPECT_DOUBLE_EQ(p.x(), 15.873041640937572);
    EXPECT_DOUBLE_EQ(p.y(), 10.658730948962905);
    EXPECT_DOUBLE_EQ(p.z(), 18.49011461122197);
}

TEST(StarPosition, PositiveCornerMayExtendPastGrid) {
    const auto p = GalaxyGeometry::star_position_in_region(0x7FF, 0x7F, 0x7FF, 0xFFF);
    EXPECT_DOUBLE_EQ(p.x(), 2036.0231824268176);
    EXPECT_DOUBLE_EQ(p.y(), 140.89857619579382);
    EXPECT_DOUBLE_EQ(p.z(), 2078.0134809163897);
}

TEST(StarPosition, RegionOverloadMatches) {
    const auto a = GalaxyGeometry::star_position_in_region(705, 243, 3707, 164);
    const auto b = GalaxyGeometry::star_position_in_region(RegionCoordinate{705, 243, 3707}, 164);
    EXPECT_EQ(a, b);
}

// ─── Determinism and spread ───────────────────────────────────────────────────

TEST(StarPosition, RepeatedCallsAreBitIdentical) {
    const auto a = GalaxyGeometry::star_position_in_region(0x801, 0x81, 0xFFF, 0x79);
    const auto b = GalaxyGeometry::star_position_in_region(0x801, 0x81, 0xFFF, 0x79);
    EXPECT_EQ(std::memcmp(a.data(), b.data(), sizeof(double) * 3), 0);
}

TEST(StarPosition, OffsetStaysWithinHalfSpread) {
    const double half = STAR_SPREAD / 2.0;
    for (int sss = 1; sss <= 64; ++sss) {
        const RegionCoordinate r{0xE0C, 0xCE, 0x1F4};
        const auto base = GalaxyGeometry::to_signed(r);
        const auto p = GalaxyGeometry::star_position_in_region(r, sss);
        EXPECT_LE(std::abs(p.x() - base.x), half);
        EXPECT_LE(std::abs(p.y() - base.y), half);
        EXPECT_LE(std::abs(p.z() - base.z), half);
    }
}

TEST(StarPosition, SystemsSharingARegionDoNotOverlap) {
    std::set<std::tuple<double, double, double>> seen;
    for (int sss = 1; sss <= 256; ++sss) {
        const auto p = GalaxyGeometry::star_position_in_region(0, 0, 0, sss);
        seen.emplace(p.x(), p.y(), p.z());
    }
    EXPECT_EQ(seen.size(), 256u);
}

TEST(StarPosition, NegativeRegionBaseIsSigned) {
    // Region 0xFFF is x = -1; the star must land around -1, not 4095.
    const auto p = GalaxyGeometry::star_position_in_region(0xFFF, 0, 0x801, 1);
    EXPECT_LT(p.x(), 32.0);
    EXPECT_LT(p.z(), -2047.0 + 32.0);
}
