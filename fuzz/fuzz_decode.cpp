/**
 * @file  fuzz_decode.cpp
 * @brief libFuzzer target for GlyphCodec::validate / decode / format
 *
 * Build:
 *   cmake -DGLYPHNAV_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_decode
 *
 * Run for 60 seconds:
 *   ./fuzz_decode -max_total_time=60
 *
 * Safety invariants verified on every input:
 *   1. No crash, no UB, no abort for any byte sequence.
 *   2. validate and decode agree: both succeed or both fail.
 *   3. On success:
 *      a. glyph is 12 uppercase hex digits
 *      b. coordinate within x, z ∈ [-2048, 2047], y ∈ [-128, 127]
 *      c. star position is finite
 *      d. re-encoding a warning-free result reproduces the glyph
 *   4. format never throws on arbitrary bytes.
 */

#include <cstddef>
#include <cstdint>
#include <cassert>
#include <cmath>
#include <string>
#include <string_view>
#include <variant>

#include "glyphnav/codec.hpp"

using namespace glyphnav;
using namespace glyphnav::codec;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view input{
        reinterpret_cast<const char*>(data), size
    };

    const GlyphCodec codec;

    const auto validated = GlyphCodec::validate(input);
    const auto decoded   = codec.decode(input);

    // Invariant 2
    assert(validated.index() == decoded.index());

    // Invariant 4
    (void)GlyphCodec::format(input);

    const auto* d = std::get_if<DecodedGlyph>(&decoded);
    if (d == nullptr) {
        return 0;
    }

    // Invariant 3a
    assert(d->glyph.size() == 12);
    for (const char c : d->glyph) {
        assert((c >= '0' && c <= '9') || (c >= 'A' && c <= 'F'));
    }

    // Invariant 3b
    assert(d->coordinate.x >= -2048 && d->coordinate.x <= 2047);
    assert(d->coordinate.y >= -128  && d->coordinate.y <= 127);
    assert(d->coordinate.z >= -2048 && d->coordinate.z <= 2047);

    // Invariant 3c
    assert(std::isfinite(d->star.x()));
    assert(std::isfinite(d->star.y()));
    assert(std::isfinite(d->star.z()));

    // Invariant 3d
    if (d->warnings.empty()) {
        const auto enc = codec.encode(d->coordinate.x, d->coordinate.y,
                                      d->coordinate.z, d->planet, d->solar_system);
        if (const auto* glyph = std::get_if<std::string>(&enc)) {
            assert(*glyph == d->glyph);
        }
    }

    return 0;
}
