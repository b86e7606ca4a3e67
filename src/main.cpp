/// @file src/main.cpp
/// @brief glyphnav CLI entry point.
///
/// Usage:
///   glyphnav --decode <glyph> [--scale]            Decode a portal glyph
///   glyphnav --encode <x> <y> <z> [planet] [sss]   Encode coordinates
///   glyphnav --validate <glyph>                    Check a glyph's format
///   glyphnav --names <12 glyph names>              Glyph names → hex glyph
///   glyphnav --batch <csv_file>                    Plot a catalog export
///   glyphnav --stream                              Decode glyphs from stdin
///   glyphnav --help                                Print usage
///
/// Options (anywhere on the command line):
///   --no-core-void     Disable the core-void rule
///   --no-zero-phantom  Do not treat solar system 000 as a phantom star
///   --scale            Also print display-scaled coordinates
///   --verbose          Per-record diagnostics on stderr

#include "glyphnav/alphabet.hpp"
#include "glyphnav/catalog.hpp"
#include "glyphnav/codec.hpp"

#include <fmt/core.h>

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

using glyphnav::GlyphError;
using glyphnav::codec::DecodedGlyph;
using glyphnav::codec::GlyphCodec;

struct CliOptions {
    glyphnav::geometry::GeometryConfig geometry{};
    bool apply_scale = false;
    bool verbose     = false;
};

void print_usage() {
    fmt::print(
        "Usage:\n"
        "  glyphnav --decode <glyph> [--scale]            Decode a portal glyph\n"
        "  glyphnav --encode <x> <y> <z> [planet] [sss]   Encode coordinates\n"
        "  glyphnav --validate <glyph>                    Check a glyph's format\n"
        "  glyphnav --names <12 glyph names>              Glyph names to hex glyph\n"
        "  glyphnav --batch <csv_file>                    Plot a catalog export\n"
        "  glyphnav --stream                              Decode glyphs from stdin\n"
        "  glyphnav --help                                Show this help\n"
        "\n"
        "Options:\n"
        "  --no-core-void  --no-zero-phantom  --scale  --verbose\n"
        "\n"
        "CSV format for --batch (header required):\n"
        "  glyph_code,galaxy,reality,name\n"
    );
}

std::optional<int> parse_int(const std::string& s) {
    int value = 0;
    const char* first = s.data();
    const char* last  = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

int report(const GlyphError& err) {
    fmt::print(stderr, "Error ({}): {}\n", glyphnav::to_string(err.kind), err.message);
    return 1;
}

void print_decoded(const DecodedGlyph& d) {
    fmt::print("Glyph:          {}\n", d.glyph_formatted);
    fmt::print("Coordinates:    ({}, {}, {})\n", d.coordinate.x, d.coordinate.y, d.coordinate.z);
    fmt::print("Star position:  ({:.2f}, {:.2f}, {:.2f})\n", d.star.x(), d.star.y(), d.star.z());
    fmt::print("Region:         {} [{}, {}, {}]\n",
               glyphnav::geometry::GalaxyGeometry::region_name(d.region),
               d.region.region_x, d.region.region_y, d.region.region_z);
    fmt::print("Planet:         {}   System: {} (0x{:03X})\n",
               d.planet, d.solar_system, d.solar_system);
    fmt::print("Classification: {}\n", glyphnav::to_string(d.classification.classification));
    if (d.display) {
        fmt::print("Display region: ({:.1f}, {:.1f}, {:.1f})\n",
                   d.display->region.x(), d.display->region.y(), d.display->region.z());
        fmt::print("Display star:   ({:.2f}, {:.2f}, {:.2f})\n",
                   d.display->star.x(), d.display->star.y(), d.display->star.z());
    }
    if (const auto text = glyphnav::codec::render_warnings(d)) {
        fmt::print("WARNING: {}\n", *text);
    }
}

int run_decode(const GlyphCodec& codec, const std::string& glyph, const CliOptions& opts) {
    auto result = codec.decode(glyph, opts.apply_scale);
    if (const auto* err = std::get_if<GlyphError>(&result)) {
        return report(*err);
    }
    print_decoded(std::get<DecodedGlyph>(result));
    return 0;
}

int run_encode(const GlyphCodec& codec, const std::vector<std::string>& args) {
    if (args.size() < 3 || args.size() > 5) {
        fmt::print(stderr, "Error: --encode requires <x> <y> <z> [planet] [sss]\n");
        return 1;
    }

    std::vector<int> values;
    for (const auto& a : args) {
        const auto v = parse_int(a);
        if (!v) {
            fmt::print(stderr, "Error: '{}' is not an integer\n", a);
            return 1;
        }
        values.push_back(*v);
    }

    const int planet       = values.size() > 3 ? values[3] : 0;
    const int solar_system = values.size() > 4 ? values[4] : 1;

    auto result = codec.encode(values[0], values[1], values[2], planet, solar_system);
    if (const auto* err = std::get_if<GlyphError>(&result)) {
        return report(*err);
    }
    fmt::print("{}\n", GlyphCodec::format(std::get<std::string>(result)));
    return 0;
}

int run_validate(const std::string& glyph) {
    auto result = GlyphCodec::validate(glyph);
    if (const auto* err = std::get_if<GlyphError>(&result)) {
        return report(*err);
    }
    const auto& outcome = std::get<glyphnav::codec::ValidationOutcome>(result);
    fmt::print("Valid: {}\n", GlyphCodec::format(outcome.glyph));
    for (const auto& w : outcome.warnings) {
        fmt::print("  unusual {} field\n", glyphnav::to_string(*w.field));
    }
    return 0;
}

int run_names(const std::vector<std::string>& names) {
    auto result = glyphnav::alphabet::parse_glyph_sequence(names);
    if (const auto* err = std::get_if<GlyphError>(&result)) {
        return report(*err);
    }
    fmt::print("{}\n", GlyphCodec::format(std::get<std::string>(result)));
    return 0;
}

/// Load a catalog export, decode every record and print plot rows.
int run_batch(const GlyphCodec& codec, const std::string& filepath, const CliOptions& opts) {
    auto loaded = glyphnav::catalog::CatalogLoader::load_csv(filepath);
    if (!loaded) {
        fmt::print(stderr, "Error: cannot open file '{}'\n", filepath);
        return 1;
    }
    if (loaded->skipped > 0) {
        fmt::print(stderr, "Skipped {} malformed rows in '{}'\n", loaded->skipped, filepath);
    }
    if (loaded->records.empty()) {
        fmt::print(stderr, "Error: no valid records loaded from '{}'\n", filepath);
        return 1;
    }

    const auto points = glyphnav::catalog::plot_catalog(loaded->records, codec, opts.apply_scale);

    fmt::print("glyph,name,star_x,star_y,star_z,classification,duplicate\n");
    std::size_t duplicates = 0;
    for (const auto& p : points) {
        if (p.duplicate) {
            ++duplicates;
            if (opts.verbose) {
                fmt::print(stderr, "Duplicate system: {} ({})\n", GlyphCodec::format(p.glyph), p.name);
            }
        }
        fmt::print("{},{},{:.4f},{:.4f},{:.4f},{},{}\n",
                   p.glyph, p.name, p.position.x(), p.position.y(), p.position.z(),
                   glyphnav::to_string(p.classification.classification),
                   p.duplicate ? "yes" : "no");
    }

    fmt::print(stderr, "Plotted {} systems ({} duplicates).\n", points.size(), duplicates);
    return 0;
}

/// Decode one glyph per stdin line until EOF.
int run_stream(const GlyphCodec& codec, const CliOptions& opts) {
    std::string line;
    std::size_t decoded = 0;
    std::size_t rejected = 0;

    while (std::getline(std::cin, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty() || line[0] == '#') {
            continue;
        }

        auto result = codec.decode(line, opts.apply_scale);
        if (const auto* err = std::get_if<GlyphError>(&result)) {
            ++rejected;
            fmt::print(stderr, "Skipping '{}': {}\n", line, err->message);
            continue;
        }

        const auto& d = std::get<DecodedGlyph>(result);
        ++decoded;
        fmt::print("{}  ({:5d}, {:4d}, {:5d})  star=({:.2f}, {:.2f}, {:.2f})  {}\n",
                   d.glyph_formatted,
                   d.coordinate.x, d.coordinate.y, d.coordinate.z,
                   d.star.x(), d.star.y(), d.star.z(),
                   glyphnav::to_string(d.classification.classification));
        if (opts.verbose) {
            if (const auto text = glyphnav::codec::render_warnings(d)) {
                fmt::print(stderr, "  {}\n", *text);
            }
        }
    }

    fmt::print(stderr, "Decoded {} glyphs, rejected {}.\n", decoded, rejected);
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions opts;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        const std::string a(argv[i]);
        if (a == "--no-core-void") {
            opts.geometry.core_void_enabled = false;
        } else if (a == "--no-zero-phantom") {
            opts.geometry.zero_index_is_phantom = false;
        } else if (a == "--scale") {
            opts.apply_scale = true;
        } else if (a == "--verbose") {
            opts.verbose = true;
        } else {
            args.push_back(a);
        }
    }

    if (args.empty()) {
        print_usage();
        return 1;
    }

    const std::string mode = args[0];
    const std::vector<std::string> rest(args.begin() + 1, args.end());
    const GlyphCodec codec(opts.geometry);

    if (mode == "--help" || mode == "-h") {
        print_usage();
        return 0;
    }

    if (mode == "--decode" || mode == "--validate" || mode == "--batch") {
        if (rest.size() != 1) {
            fmt::print(stderr, "Error: {} requires exactly one argument\n", mode);
            print_usage();
            return 1;
        }
        if (mode == "--decode") {
            return run_decode(codec, rest[0], opts);
        }
        if (mode == "--validate") {
            return run_validate(rest[0]);
        }
        return run_batch(codec, rest[0], opts);
    }

    if (mode == "--encode") {
        return run_encode(codec, rest);
    }

    if (mode == "--names") {
        return run_names(rest);
    }

    if (mode == "--stream") {
        return run_stream(codec, opts);
    }

    fmt::print(stderr, "Unknown option: {}\n", mode);
    print_usage();
    return 1;
}
