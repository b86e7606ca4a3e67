/**
 * @file  prop_format_invariant.cpp
 * @brief Property: format/normalize are inverse on canonical glyphs
 *
 * Run with 10,000 random inputs:
 *   RC_PARAMS="max_success=10000" ./prop_format_invariant
 *
 *   normalize(format(g)) == g     for every 12-hex-digit glyph g
 *   format(format(g))    == format(g)
 *   validate(g) never fails on a 12-hex-digit glyph (sentinels only warn)
 *   validate(s) fails for any s whose normalized length is not 12
 */

#include <rapidcheck.h>

#include <string>
#include <variant>

#include "glyphnav/codec.hpp"

using namespace glyphnav;
using namespace glyphnav::codec;

namespace {

rc::Gen<std::string> canonical_glyph() {
    return rc::gen::container<std::string>(
        12, rc::gen::elementOf(std::string("0123456789ABCDEF")));
}

} // namespace

int main() {
    bool ok = true;

    // ── Property 1: format and normalize are inverse ─────────────────────────
    ok &= rc::check(
        "format_invariant: normalize(format(g)) == g",
        [] {
            const auto g = *canonical_glyph();
            const auto f = GlyphCodec::format(g);
            RC_ASSERT(f.size() == 16u);
            RC_ASSERT(GlyphCodec::normalize(f) == g);
            RC_ASSERT(GlyphCodec::format(f) == f);
        }
    );

    // ── Property 2: any 12 hex digits validate ───────────────────────────────
    ok &= rc::check(
        "format_invariant: validate accepts every 12-hex-digit glyph",
        [] {
            const auto g = *canonical_glyph();
            const auto r = GlyphCodec::validate(g);
            RC_ASSERT(std::holds_alternative<ValidationOutcome>(r));
            RC_ASSERT(std::get<ValidationOutcome>(r).glyph == g);
        }
    );

    // ── Property 3: wrong length is a FormatError ────────────────────────────
    ok &= rc::check(
        "format_invariant: validate rejects any other digit count",
        [] {
            const auto len = *rc::gen::inRange<std::size_t>(0, 32);
            RC_PRE(len != 12u);
            const auto g = *rc::gen::container<std::string>(
                len, rc::gen::elementOf(std::string("0123456789abcdef")));
            const auto r = GlyphCodec::validate(g);
            RC_ASSERT(std::holds_alternative<GlyphError>(r));
            RC_ASSERT(std::get<GlyphError>(r).kind == ErrorKind::FormatError);
        }
    );

    return ok ? 0 : 1;
}
