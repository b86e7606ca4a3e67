#pragma once

/// @file include/glyphnav/catalog.hpp
/// @brief System catalog — CSV loading, duplicate detection, map plotting.
///
/// # Module: Catalog
///
/// ## Responsibility
/// Glue between stored system records and the codec:
///   - parse CSV exports of submitted systems into `SystemRecord`s
///   - derive the system-identity key used for duplicate lookup
///   - build renderer input (`MapPoint`) with freshly computed star positions
///
/// ## Expected CSV Format
/// ```
/// glyph_code,galaxy,reality,name
/// 10A4F3E7B2C1,Euclid,Normal,Haven Prime
/// 2001CEB501F4,Eissentam,Permadeath,
/// ```
/// Only `glyph_code` is required; missing galaxy/reality take the
/// defaults `Euclid` / `Normal`. The first line is treated as a header.
///
/// ## System Identity
/// Two records name the same star system when the last 11 glyph digits,
/// the galaxy and the reality all match. The leading planet digit is not
/// part of the key, so different planets of one system collide.
///
/// ## Guarantees
/// - Loading never throws; `load_csv` returns `nullopt` if the file cannot
///   be opened and bad rows are skipped and counted
/// - Star positions are recomputed on every `plot_catalog` call

#include "glyphnav/codec.hpp"
#include "glyphnav/types.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace glyphnav::catalog {

// ─── SystemRecord ─────────────────────────────────────────────────────────────

/// One submitted system as stored by the backend.
struct SystemRecord {
    std::string glyph_code;
    std::string galaxy;
    std::string reality;
    std::string name;
};

// ─── SystemKey ────────────────────────────────────────────────────────────────

/// The last 11 digits of the canonical glyph (planet digit dropped).
/// `nullopt` if the glyph is not 12 hex digits.
[[nodiscard]] std::optional<std::string> system_key(std::string_view glyph);

/// Identity of a star system across submissions.
struct SystemKey {
    std::string system_glyph;  ///< 11-digit system portion
    std::string galaxy;
    std::string reality;

    bool operator==(const SystemKey&) const = default;

    /// `nullopt` if the record's glyph is malformed.
    [[nodiscard]] static std::optional<SystemKey> of(const SystemRecord& record);
};

struct SystemKeyHash {
    [[nodiscard]] std::size_t operator()(const SystemKey& key) const noexcept;
};

// ─── DuplicateIndex ───────────────────────────────────────────────────────────

/// Set of already-seen systems.
class DuplicateIndex {
public:
    /// Add a record. Returns false if the same system was already present
    /// or the glyph is malformed.
    bool insert(const SystemRecord& record);

    [[nodiscard]] bool contains(const SystemRecord& record) const;

    [[nodiscard]] std::size_t size() const noexcept { return keys_.size(); }

private:
    std::unordered_set<SystemKey, SystemKeyHash> keys_;
};

// ─── CatalogLoader ────────────────────────────────────────────────────────────

/// Records parsed from a CSV export plus the number of rejected rows.
struct LoadedCatalog {
    std::vector<SystemRecord> records;
    std::size_t               skipped = 0;  ///< Malformed rows or bad glyphs
};

class CatalogLoader {
public:
    /// Load a CSV export from disk. `nullopt` if the file cannot be opened.
    [[nodiscard]] static std::optional<LoadedCatalog>
    load_csv(const std::string& filepath) noexcept;

    /// Parse CSV content (first non-comment line is the header).
    [[nodiscard]] static LoadedCatalog
    parse_csv_string(const std::string& csv_content) noexcept;

private:
    /// Parse one data row. `nullopt` if the row is malformed or its glyph
    /// fails format validation.
    [[nodiscard]] static std::optional<SystemRecord>
    parse_row(const std::string& line) noexcept;
};

// ─── Map Plotting ─────────────────────────────────────────────────────────────

/// Renderer input for one record.
struct MapPoint {
    std::string          glyph;         ///< Canonical glyph
    std::string          name;
    RegionCoordinate     region;
    Coordinate           coordinate;
    StarPosition         position;      ///< Display-scaled when requested
    SystemClassification classification;
    bool                 duplicate;     ///< Same system seen earlier in the input
};

/// Decode every record and build plot points in input order.
///
/// Records whose glyph does not decode are omitted. When `apply_scale`
/// is true, `position` is the codec's display-scaled star position.
[[nodiscard]] std::vector<MapPoint>
plot_catalog(std::span<const SystemRecord> records,
             const codec::GlyphCodec& glyph_codec,
             bool apply_scale = false);

} // namespace glyphnav::catalog
