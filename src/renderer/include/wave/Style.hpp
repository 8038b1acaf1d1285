// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "wave/Color.hpp"

#include <cstdint>
#include <optional>

namespace wave {

// Per-draw multiplier applied on top of a color's own alpha.
struct Opacity {
  std::uint8_t value{255};

  static constexpr auto opaque() -> Opacity { return Opacity{255}; }
  static constexpr auto transparent() -> Opacity { return Opacity{0}; }

  auto operator==(Opacity const&) const -> bool = default;
};

// Returns color with its alpha replaced by round(color.a * opacity / 255).
constexpr auto apply_opacity(Color color, Opacity opacity) -> Color {
  const std::uint32_t product = static_cast<std::uint32_t>(color.a) * opacity.value;
  return color.with_alpha(static_cast<std::uint8_t>((product + 127) / 255));
}

struct Fill {
  Color color;
  Opacity opacity{};

  constexpr auto effective_color() const -> Color { return apply_opacity(color, opacity); }
};

struct Stroke {
  Color color;
  Opacity opacity{};
  // In device pixels
  float width{1.0f};

  constexpr auto effective_color() const -> Color { return apply_opacity(color, opacity); }
};

/**
 * Visual options of a shape
 *
 * A style without fill and stroke turns every draw call into a no-op.
 */
struct Style {
  std::optional<Fill> fill;
  std::optional<Stroke> stroke;

  static constexpr auto fill_only(Fill fill) -> Style { return Style{fill, std::nullopt}; }
  static constexpr auto fill_only(Color color) -> Style { return fill_only(Fill{color}); }

  static constexpr auto stroke_only(Stroke stroke) -> Style { return Style{std::nullopt, stroke}; }
  static constexpr auto stroke_only(Color color) -> Style { return stroke_only(Stroke{color}); }

  static constexpr auto fill_and_stroke(Fill fill, Stroke stroke) -> Style {
    return Style{fill, stroke};
  }
  static constexpr auto fill_and_stroke(Color fill, Color stroke) -> Style {
    return Style{Fill{fill}, Stroke{stroke}};
  }

  constexpr auto has_paint() const -> bool { return fill.has_value() || stroke.has_value(); }
};

} // namespace wave
