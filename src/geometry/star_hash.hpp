#pragma once

/// @file src/geometry/star_hash.hpp
/// @brief Internal digest helpers for star placement (needs src/ on the
///        include path; not part of the public API).

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace glyphnav::geometry::detail {

using Digest = std::array<std::uint8_t, 32>;

/// Seed string fed to the hash: `NMS:{rx}:{ry}:{rz}:{sss}`.
[[nodiscard]] std::string star_seed(int region_x, int region_y, int region_z,
                                    int solar_system_index);

/// SHA-256 of `seed`.
[[nodiscard]] Digest sha256(const std::string& seed) noexcept;

/// Big-endian u32 from digest bytes [4·window, 4·window + 4).
[[nodiscard]] std::uint32_t read_window(const Digest& digest,
                                        std::size_t window) noexcept;

/// Map a u32 onto [-0.5, 0.5] via u / 0xFFFFFFFF − 0.5.
[[nodiscard]] double unit_offset(std::uint32_t value) noexcept;

} // namespace glyphnav::geometry::detail
