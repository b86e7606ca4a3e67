/**
 * @file  bench/bench_codec.cpp
 * @brief Google Benchmark suite for glyph decode, encode and star placement.
 *
 * Benchmarks
 * ----------
 *   BM_Validate            — format check + sentinel scan
 *   BM_Decode              — full decode (includes SHA-256 star hash)
 *   BM_Decode_Scaled       — decode with display coordinates
 *   BM_Encode              — range / void / sentinel checks + hex render
 *   BM_StarPosition        — star placement alone
 *   BM_PlotCatalog         — batch decode of N records with duplicate index
 *
 * Build (CMake):
 *   cmake -DGLYPHNAV_BENCH=ON ..
 *   cmake --build build --target bench_codec
 *   ./build/bench_codec --benchmark_format=json
 *
 * Throughput units: items/second (glyphs processed).
 */

#include "benchmark/benchmark.h"

#include "glyphnav/catalog.hpp"
#include "glyphnav/codec.hpp"
#include "glyphnav/geometry.hpp"

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

using glyphnav::catalog::SystemRecord;
using glyphnav::codec::GlyphCodec;
using glyphnav::geometry::GalaxyGeometry;

// ── Fixture helpers ────────────────────────────────────────────────────────────

/// Generate N encodable glyphs spread over the galaxy.
static std::vector<std::string> make_glyphs(std::size_t n) {
    const GlyphCodec codec;
    std::vector<std::string> out;
    out.reserve(n);
    for (std::size_t i = 0; out.size() < n; ++i) {
        const int x = static_cast<int>((i * 97) % 4095) - 2047;
        const int y = static_cast<int>((i * 31) % 255) - 127;
        const int z = static_cast<int>((i * 53) % 4095) - 2047;
        const int s = static_cast<int>(i % 4095) + 1;
        const auto enc = codec.encode(x, y, z, static_cast<int>(i % 16), s);
        if (const auto* g = std::get_if<std::string>(&enc)) {
            out.push_back(*g);
        }
    }
    return out;
}

// ── Codec benchmarks ───────────────────────────────────────────────────────────

static void BM_Validate(benchmark::State& state) {
    const auto glyphs = make_glyphs(1024);
    std::size_t i = 0;
    for (auto _ : state) {
        auto r = GlyphCodec::validate(glyphs[i++ & 1023]);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Validate);

static void BM_Decode(benchmark::State& state) {
    const auto glyphs = make_glyphs(1024);
    const GlyphCodec codec;
    std::size_t i = 0;
    for (auto _ : state) {
        auto r = codec.decode(glyphs[i++ & 1023]);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Decode);

static void BM_Decode_Scaled(benchmark::State& state) {
    const auto glyphs = make_glyphs(1024);
    const GlyphCodec codec;
    std::size_t i = 0;
    for (auto _ : state) {
        auto r = codec.decode(glyphs[i++ & 1023], /*apply_scale=*/true);
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Decode_Scaled);

static void BM_Encode(benchmark::State& state) {
    const GlyphCodec codec;
    int x = -2047;
    for (auto _ : state) {
        auto r = codec.encode(x, -50, -1200, 0, 1);
        benchmark::DoNotOptimize(r);
        x = (x >= 2047) ? -2047 : x + 1;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Encode);

// ── Geometry benchmarks ────────────────────────────────────────────────────────

static void BM_StarPosition(benchmark::State& state) {
    int s = 1;
    for (auto _ : state) {
        auto p = GalaxyGeometry::star_position_in_region(705, 243, 3707, s);
        benchmark::DoNotOptimize(p.data());
        s = (s & 0xFFF) + 1;
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_StarPosition);

// ── Catalog benchmarks ─────────────────────────────────────────────────────────

static void BM_PlotCatalog(benchmark::State& state) {
    const std::size_t n = static_cast<std::size_t>(state.range(0));
    const auto glyphs = make_glyphs(n);
    std::vector<SystemRecord> records;
    records.reserve(n);
    for (const auto& g : glyphs) {
        records.push_back(SystemRecord{g, "Euclid", "Normal", ""});
    }
    const GlyphCodec codec;
    for (auto _ : state) {
        auto points = glyphnav::catalog::plot_catalog(records, codec);
        benchmark::DoNotOptimize(points.data());
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()) * static_cast<int64_t>(n));
}
BENCHMARK(BM_PlotCatalog)->RangeMultiplier(4)->Range(256, 16384)->Unit(benchmark::kMicrosecond);

BENCHMARK_MAIN();
