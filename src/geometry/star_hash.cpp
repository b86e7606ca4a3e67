/// @file src/geometry/star_hash.cpp
/// @brief Digest helpers for deterministic star placement.

#include "star_hash.hpp"

#include <fmt/core.h>
#include <openssl/sha.h>

namespace glyphnav::geometry::detail {

std::string star_seed(int region_x, int region_y, int region_z,
                      int solar_system_index) {
    return fmt::format("NMS:{}:{}:{}:{}",
                       region_x, region_y, region_z, solar_system_index);
}

Digest sha256(const std::string& seed) noexcept {
    static_assert(SHA256_DIGEST_LENGTH == 32);

    Digest digest{};
    SHA256(reinterpret_cast<const unsigned char*>(seed.data()), seed.size(),
           digest.data());
    return digest;
}

std::uint32_t read_window(const Digest& digest, std::size_t window) noexcept {
    const std::size_t base = window * 4;
    return (static_cast<std::uint32_t>(digest[base])     << 24) |
           (static_cast<std::uint32_t>(digest[base + 1]) << 16) |
           (static_cast<std::uint32_t>(digest[base + 2]) <<  8) |
            static_cast<std::uint32_t>(digest[base + 3]);
}

double unit_offset(std::uint32_t value) noexcept {
    return static_cast<double>(value) / 4294967295.0 - 0.5;
}

} // namespace glyphnav::geometry::detail
