/**
 * @file  fuzz_encode.cpp
 * @brief libFuzzer target for GlyphCodec::encode
 *
 * Build:
 *   cmake -DGLYPHNAV_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_encode
 *
 * Run for 60 seconds:
 *   ./fuzz_encode -max_total_time=60
 *
 * Fuzzer strategy:
 *   The first 20 bytes are read as five native-endian int32 values
 *   (x, y, z, planet, solar_system). Shorter inputs are ignored.
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any integer tuple, including INT_MIN.
 *   2. On success the glyph is 12 characters and decodes back to the
 *      same tuple.
 *   3. On failure the error kind is RangeError or CoreVoidError.
 */

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cassert>
#include <string>
#include <variant>

#include "glyphnav/codec.hpp"

using namespace glyphnav;
using namespace glyphnav::codec;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 5 * sizeof(int32_t)) {
        return 0;
    }

    int32_t v[5];
    std::memcpy(v, data, sizeof(v));

    const GlyphCodec codec;
    const auto enc = codec.encode(v[0], v[1], v[2], v[3], v[4]);

    if (const auto* err = std::get_if<GlyphError>(&enc)) {
        // Invariant 3
        assert(err->kind == ErrorKind::RangeError ||
               err->kind == ErrorKind::CoreVoidError);
        return 0;
    }

    // Invariant 2
    const auto& glyph = std::get<std::string>(enc);
    assert(glyph.size() == 12);

    const auto dec = codec.decode(glyph);
    const auto* d  = std::get_if<DecodedGlyph>(&dec);
    assert(d != nullptr);
    assert(d->coordinate == (Coordinate{v[0], v[1], v[2]}));
    assert(d->planet == v[3]);
    assert(d->solar_system == v[4]);

    return 0;
}
