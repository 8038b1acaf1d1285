// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cstdint>

namespace wave {

/**
 * RGBA color with 8 bits per channel
 *
 * The member order is the byte order of a pixel in a FrameBuffer.
 */
struct Color {
  std::uint8_t r, g, b, a;

  // Create from 32-bit RGBA (red in the most significant byte)
  static constexpr auto from_rgba(std::uint32_t rgba) -> Color {
    return Color{.r = static_cast<std::uint8_t>((rgba >> 24) & 0xFF),
                 .g = static_cast<std::uint8_t>((rgba >> 16) & 0xFF),
                 .b = static_cast<std::uint8_t>((rgba >> 8) & 0xFF),
                 .a = static_cast<std::uint8_t>(rgba & 0xFF)};
  }

  // Convert to 32-bit RGBA
  constexpr auto to_rgba() const -> std::uint32_t {
    return (static_cast<std::uint32_t>(r) << 24) | (static_cast<std::uint32_t>(g) << 16) |
           (static_cast<std::uint32_t>(b) << 8) | static_cast<std::uint32_t>(a);
  }

  constexpr auto with_alpha(std::uint8_t alpha) const -> Color {
    return Color{.r = r, .g = g, .b = b, .a = alpha};
  }

  auto operator==(Color const&) const -> bool = default;
};

static_assert(sizeof(Color) == 4, "pixels must be tightly packed RGBA bytes");

// Predefined colors
namespace colors {
inline constexpr Color TRANSPARENT{0, 0, 0, 0};
inline constexpr Color BLACK{0, 0, 0, 255};
inline constexpr Color WHITE{255, 255, 255, 255};
inline constexpr Color RED{255, 0, 0, 255};
inline constexpr Color GREEN{0, 255, 0, 255};
inline constexpr Color BLUE{0, 0, 255, 255};
} // namespace colors

} // namespace wave
