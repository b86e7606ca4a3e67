/// @file src/catalog/system_index.cpp
/// @brief System identity keys, duplicate index and map plotting.

#include "glyphnav/catalog.hpp"
#include "glyphnav/constants.hpp"

#include <variant>

namespace glyphnav::catalog {

// ─── system_key ───────────────────────────────────────────────────────────────

std::optional<std::string> system_key(std::string_view glyph) {
    std::string canonical = codec::GlyphCodec::normalize(glyph);
    if (!codec::GlyphCodec::parse_fields(canonical)) {
        return std::nullopt;
    }
    return canonical.substr(constants::GLYPH_LENGTH - constants::SYSTEM_KEY_LENGTH);
}

std::optional<SystemKey> SystemKey::of(const SystemRecord& record) {
    auto key = system_key(record.glyph_code);
    if (!key) {
        return std::nullopt;
    }
    return SystemKey{
        .system_glyph = std::move(*key),
        .galaxy       = record.galaxy,
        .reality      = record.reality,
    };
}

std::size_t SystemKeyHash::operator()(const SystemKey& key) const noexcept {
    const std::hash<std::string> h;
    std::size_t seed = h(key.system_glyph);
    seed ^= h(key.galaxy)  + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    seed ^= h(key.reality) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
}

// ─── DuplicateIndex ───────────────────────────────────────────────────────────

bool DuplicateIndex::insert(const SystemRecord& record) {
    auto key = SystemKey::of(record);
    if (!key) {
        return false;
    }
    return keys_.insert(std::move(*key)).second;
}

bool DuplicateIndex::contains(const SystemRecord& record) const {
    const auto key = SystemKey::of(record);
    return key && keys_.count(*key) > 0;
}

// ─── plot_catalog ─────────────────────────────────────────────────────────────

std::vector<MapPoint>
plot_catalog(std::span<const SystemRecord> records,
             const codec::GlyphCodec& glyph_codec,
             bool apply_scale) {
    std::vector<MapPoint> points;
    points.reserve(records.size());

    DuplicateIndex seen;

    for (const auto& record : records) {
        auto decoded = glyph_codec.decode(record.glyph_code, apply_scale);
        auto* d = std::get_if<codec::DecodedGlyph>(&decoded);
        if (d == nullptr) {
            continue;
        }

        const bool first_sighting = seen.insert(record);

        points.push_back(MapPoint{
            .glyph          = d->glyph,
            .name           = record.name,
            .region         = d->region,
            .coordinate     = d->coordinate,
            .position       = d->display ? d->display->star : d->star,
            .classification = d->classification,
            .duplicate      = !first_sighting,
        });
    }

    return points;
}

} // namespace glyphnav::catalog
