/// @file tests/geometry/test_galaxy_geometry.cpp
/// @brief Tests for the core-void, phantom-star and classification rules.

#include "glyphnav/geometry.hpp"
#include "glyphnav/constants.hpp"

#include <gtest/gtest.h>

#include <thread>
#include <vector>

using namespace glyphnav;
using namespace glyphnav::geometry;
using namespace glyphnav::constants;

// ─── is_in_core_void ──────────────────────────────────────────────────────────

TEST(CoreVoid, OriginIsInside) {
    GalaxyGeometry g;
    EXPECT_TRUE(g.is_in_core_void(0, 0, 0));
}

TEST(CoreVoid, GalaxyCornerIsOutside) {
    GalaxyGeometry g;
    EXPECT_FALSE(g.is_in_core_void(2047, 127, 2047));
    EXPECT_FALSE(g.is_in_core_void(-2047, -127, -2047));
}

TEST(CoreVoid, JustInsideXZRadius) {
    GalaxyGeometry g;
    EXPECT_TRUE(g.is_in_core_void(7, 0, 0));
    EXPECT_TRUE(g.is_in_core_void(0, 0, -7));
    EXPECT_TRUE(g.is_in_core_void(5, 0, 5));    // 50/64
}

TEST(CoreVoid, BoundaryIsOutside) {
    // (8/8)² = 1 exactly: strict comparison puts it outside.
    GalaxyGeometry g;
    EXPECT_FALSE(g.is_in_core_void(8, 0, 0));
    EXPECT_FALSE(g.is_in_core_void(0, 0, -8));
    EXPECT_FALSE(g.is_in_core_void(0, 1, 0));
    EXPECT_FALSE(g.is_in_core_void(0, -1, 0));
}

TEST(CoreVoid, DiagonalJustOutside) {
    GalaxyGeometry g;
    EXPECT_FALSE(g.is_in_core_void(6, 0, 6));   // 72/64
}

TEST(CoreVoid, AnyNonZeroYIsOutside) {
    GalaxyGeometry g;
    EXPECT_FALSE(g.is_in_core_void(1, 1, 1));
}

TEST(CoreVoid, DisabledNeverMatches) {
    GalaxyGeometry g(GeometryConfig{.core_void_enabled = false});
    EXPECT_FALSE(g.is_in_core_void(0, 0, 0));
    EXPECT_FALSE(g.is_in_core_void(3, 0, 4));
}

// ─── is_phantom_star ──────────────────────────────────────────────────────────

TEST(PhantomStar, ExceptionIndexIsNeverPhantom) {
    GalaxyGeometry g;
    EXPECT_FALSE(g.is_phantom_star(PHANTOM_SSS_EXCEPTION));
    EXPECT_FALSE(g.is_phantom_star(0x3E8));
}

TEST(PhantomStar, NeighboursOfExceptionArePhantom) {
    GalaxyGeometry g;
    EXPECT_TRUE(g.is_phantom_star(0x3E7));
    EXPECT_TRUE(g.is_phantom_star(0x3E9));
}

TEST(PhantomStar, ThresholdIsInclusive) {
    GalaxyGeometry g;
    EXPECT_TRUE(g.is_phantom_star(0x258));
    EXPECT_FALSE(g.is_phantom_star(0x257));
}

TEST(PhantomStar, ZeroIsPhantomByDefault) {
    GalaxyGeometry g;
    EXPECT_TRUE(g.is_phantom_star(0));
}

TEST(PhantomStar, ZeroRuleCanBeDisabled) {
    GalaxyGeometry g(GeometryConfig{.zero_index_is_phantom = false});
    EXPECT_FALSE(g.is_phantom_star(0));
    EXPECT_TRUE(g.is_phantom_star(0x258));
}

TEST(PhantomStar, OrdinaryIndices) {
    GalaxyGeometry g;
    EXPECT_FALSE(g.is_phantom_star(1));
    EXPECT_FALSE(g.is_phantom_star(0x79));
    EXPECT_TRUE(g.is_phantom_star(0xFFF));
}

// ─── classify ─────────────────────────────────────────────────────────────────

TEST(Classify, Accessible) {
    GalaxyGeometry g;
    const auto c = g.classify(500, 0, 0, 1);
    EXPECT_EQ(c, (SystemClassification{false, false, true, Classification::Accessible}));
    EXPECT_STREQ(to_string(c.classification), "accessible");
}

TEST(Classify, Phantom) {
    GalaxyGeometry g;
    const auto c = g.classify(500, 0, 0, 0x258);
    EXPECT_EQ(c, (SystemClassification{true, false, false, Classification::Phantom}));
    EXPECT_STREQ(to_string(c.classification), "phantom");
}

TEST(Classify, CoreAnomaly) {
    GalaxyGeometry g;
    const auto c = g.classify(0, 0, 0, 1);
    EXPECT_EQ(c, (SystemClassification{false, true, false, Classification::CoreAnomaly}));
    EXPECT_STREQ(to_string(c.classification), "core_anomaly");
}

TEST(Classify, CorePhantom) {
    GalaxyGeometry g;
    const auto c = g.classify(Coordinate{0, 0, 0}, 0);
    EXPECT_EQ(c, (SystemClassification{true, true, false, Classification::CorePhantom}));
    EXPECT_STREQ(to_string(c.classification), "core_phantom");
}

TEST(Classify, IndependentConfigurationsSideBySide) {
    const GalaxyGeometry strict;
    const GalaxyGeometry lenient(GeometryConfig{.core_void_enabled = false,
                                                .zero_index_is_phantom = false});

    std::vector<SystemClassification> strict_out(64);
    std::vector<SystemClassification> lenient_out(64);

    std::thread a([&] {
        for (auto& c : strict_out) c = strict.classify(0, 0, 0, 0);
    });
    std::thread b([&] {
        for (auto& c : lenient_out) c = lenient.classify(0, 0, 0, 0);
    });
    a.join();
    b.join();

    for (const auto& c : strict_out) {
        EXPECT_EQ(c.classification, Classification::CorePhantom);
    }
    for (const auto& c : lenient_out) {
        EXPECT_EQ(c.classification, Classification::Accessible);
    }
}

// ─── Region helpers ───────────────────────────────────────────────────────────

TEST(RegionHelpers, ToSignedUsesSplitRange) {
    EXPECT_EQ(GalaxyGeometry::to_signed(RegionCoordinate{0xFFF, 0xFF, 0x801}),
              (Coordinate{-1, -1, -2047}));
    EXPECT_EQ(GalaxyGeometry::to_signed(RegionCoordinate{0x7FF, 0x7F, 0}),
              (Coordinate{2047, 127, 0}));
}

TEST(RegionHelpers, RegionName) {
    EXPECT_EQ(GalaxyGeometry::region_name(RegionCoordinate{0x2C1, 0xF3, 0xE7B}),
              "Region [2C1:F3:E7B]");
    EXPECT_EQ(GalaxyGeometry::region_name(RegionCoordinate{1, 0, 2}),
              "Region [01:0:02]");
}
