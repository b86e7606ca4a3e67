/// @file src/catalog/catalog_loader.cpp
/// @brief CSV CatalogLoader for submitted system records.

#include "glyphnav/catalog.hpp"
#include "glyphnav/constants.hpp"

#include <fstream>
#include <sstream>
#include <string>
#include <variant>

namespace glyphnav::catalog {

namespace {

constexpr std::size_t MAX_COLUMNS = 4;

/// Trim leading/trailing whitespace.
std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

// ─── CatalogLoader::parse_row ─────────────────────────────────────────────────

std::optional<SystemRecord>
CatalogLoader::parse_row(const std::string& line) noexcept {
    std::istringstream ss(line);
    std::string token;
    std::vector<std::string> fields;
    fields.reserve(MAX_COLUMNS);

    while (std::getline(ss, token, ',')) {
        fields.push_back(trim(token));
    }

    if (fields.empty() || fields.size() > MAX_COLUMNS || fields[0].empty()) {
        return std::nullopt;
    }

    auto validated = codec::GlyphCodec::validate(fields[0]);
    const auto* outcome = std::get_if<codec::ValidationOutcome>(&validated);
    if (outcome == nullptr) {
        return std::nullopt;
    }

    const auto column = [&fields](std::size_t i, const char* fallback) {
        return (i < fields.size() && !fields[i].empty()) ? fields[i] : std::string(fallback);
    };

    return SystemRecord{
        .glyph_code = outcome->glyph,
        .galaxy     = column(1, constants::DEFAULT_GALAXY),
        .reality    = column(2, constants::DEFAULT_REALITY),
        .name       = column(3, ""),
    };
}

// ─── CatalogLoader::parse_csv_string ──────────────────────────────────────────

LoadedCatalog
CatalogLoader::parse_csv_string(const std::string& csv_content) noexcept {
    LoadedCatalog catalog;
    std::istringstream stream(csv_content);
    std::string line;
    bool header_skipped = false;

    while (std::getline(stream, line)) {
        // Trim carriage return.
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        // Blank lines and comments are neither data nor errors.
        if (trim(line).empty() || line[0] == '#') {
            continue;
        }

        if (!header_skipped) {
            header_skipped = true;
            continue;
        }

        auto record = parse_row(line);
        if (record) {
            catalog.records.push_back(std::move(*record));
        } else {
            ++catalog.skipped;
        }
    }

    return catalog;
}

// ─── CatalogLoader::load_csv ──────────────────────────────────────────────────

std::optional<LoadedCatalog>
CatalogLoader::load_csv(const std::string& filepath) noexcept {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::string contents;
    std::string line;
    while (std::getline(file, line)) {
        contents += line;
        contents += '\n';
    }

    return parse_csv_string(contents);
}

} // namespace glyphnav::catalog
