// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "wave/Color.hpp"
#include "wave/GeometricPrimitives.hpp"
#include "wave/Style.hpp"

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <optional>

namespace wave {

/**
 * Concept for anything the rasterizers can draw into
 *
 * plot() and fill_span() must ignore out of bounds coordinates themselves.
 */
template <typename T>
concept PixelTarget = requires(T& target, int x, int y, Color color) {
  { target.width() } -> std::convertible_to<std::size_t>;
  { target.height() } -> std::convertible_to<std::size_t>;
  target.plot(x, y, color);
  target.fill_span(y, x, x, color);
};

/**
 * Clip a segment to [0, width) x [0, height) with the Cohen-Sutherland algorithm
 *
 * Intersections are computed in 64 bit so that the multiplication in the intersection formula
 * cannot overflow. Returns std::nullopt if no part of the segment is inside.
 */
auto clip_line(Line line, std::size_t width, std::size_t height) -> std::optional<Line>;

// Radii of the three regions a circle can paint, in pixels.
struct CircleRadii {
  std::int64_t outer; // outer edge of the stroke, or the nominal radius without stroke
  std::int64_t inner; // inner edge of the stroke, 0 without stroke
  std::int64_t fill;  // 0 without fill
};

// Derives the circle regions from a nominal radius and the stroke width of the style.
// A stroke with a non-finite or non-positive width does not widen the circle.
auto circle_radii(int radius, Style const& style) -> CircleRadii;

namespace detail {

inline constexpr int kFixedShift = 16;
inline constexpr std::int64_t kFixedOne = std::int64_t{1} << kFixedShift;

constexpr auto to_fixed(std::int64_t value) -> std::int64_t { return value * kFixedOne; }

// dx / dy in 16.16
constexpr auto inverse_slope_fixed(std::int64_t dx, std::int64_t dy) -> std::int64_t {
  return to_fixed(dx) / dy;
}

constexpr auto fixed_ceil(std::int64_t value) -> std::int64_t {
  return (value + kFixedOne - 1) >> kFixedShift;
}

// Horizontal half-extent of a disk, tracked from row 0 downwards.
// Shrinks monotonically using squared distances only.
struct DiskExtent {
  std::int64_t radiusSquared;
  std::int64_t x;
  std::int64_t xSquared;

  explicit constexpr DiskExtent(std::int64_t radius)
      : radiusSquared(radius * radius), x(radius), xSquared(radius * radius) {}

  // Returns the half-extent on the row with squared offset ySquared, or -1 if the row lies
  // completely outside of the disk.
  constexpr auto shrink(std::int64_t ySquared) -> std::int64_t {
    while (x > 0 && xSquared + ySquared > radiusSquared) {
      xSquared -= 2 * x - 1;
      --x;
    }
    return xSquared + ySquared <= radiusSquared ? x : -1;
  }
};

} // namespace detail

/**
 * Scan conversion in pixel coordinates
 *
 * Every algorithm writes through PixelTarget::plot() or PixelTarget::fill_span() only.
 */
class Rasterizer {
public:
  /**
   * Draw a line using Bresenham's line algorithm
   *
   * The segment is clipped to the target first, so far off-screen endpoints cost nothing.
   * The driving axis is the one with the larger delta and every step plots exactly one pixel.
   * A zero-length segment plots its single pixel.
   *
   * @param target The pixel target to draw on
   * @param start Starting point of the line
   * @param end Ending point of the line
   * @param color Color to draw the line with
   */
  template <PixelTarget Target>
  static void draw_line(Target& target, Point start, Point end, Color color) {
    const std::optional<Line> clipped =
        clip_line(Line{start, end}, target.width(), target.height());
    if (!clipped) {
      return;
    }

    int x = clipped->start.x;
    int y = clipped->start.y;
    const int x1 = clipped->end.x;
    const int y1 = clipped->end.y;

    const std::int64_t dx = std::abs(static_cast<std::int64_t>(x1) - x);
    const std::int64_t dy = std::abs(static_cast<std::int64_t>(y1) - y);

    const int sx = x < x1 ? 1 : (x > x1 ? -1 : 0);
    const int sy = y < y1 ? 1 : (y > y1 ? -1 : 0);

    if (dx >= dy) {
      std::int64_t err = 2 * dy - dx;
      for (std::int64_t step = 0; step <= dx; ++step) {
        target.plot(x, y, color);
        if (err >= 0) {
          y += sy;
          err -= 2 * dx;
        }
        x += sx;
        err += 2 * dy;
      }
    } else {
      std::int64_t err = 2 * dx - dy;
      for (std::int64_t step = 0; step <= dy; ++step) {
        target.plot(x, y, color);
        if (err >= 0) {
          x += sx;
          err -= 2 * dy;
        }
        y += sy;
        err += 2 * dx;
      }
    }
  }

  /**
   * Fill a triangle by splitting it into a flat-bottom and a flat-top half
   *
   * The split point on the long edge is interpolated in 16.16 fixed point. Each half covers
   * its rows top inclusive to bottom exclusive and every span is exclusive on the right, so
   * the halves never write the same pixel twice. A triangle whose vertices share one row
   * paints nothing.
   */
  template <PixelTarget Target>
  static void fill_triangle(Target& target, Point a, Point b, Point c, Color color) {
    std::array<Point, 3> vertices{a, b, c};
    std::stable_sort(vertices.begin(), vertices.end(),
                     [](Point const& lhs, Point const& rhs) { return lhs.y < rhs.y; });
    const auto [top, middle, bottom] = vertices;

    if (top.y == bottom.y) {
      return;
    }

    if (middle.y == bottom.y) {
      fill_flat_bottom(target, top, middle, bottom, color);
    } else if (top.y == middle.y) {
      fill_flat_top(target, top, middle, bottom, color);
    } else {
      const std::int64_t height = static_cast<std::int64_t>(bottom.y) - top.y;
      const std::int64_t t = detail::to_fixed(static_cast<std::int64_t>(middle.y) - top.y) / height;
      const std::int64_t dx = static_cast<std::int64_t>(bottom.x) - top.x;
      const std::int64_t splitX = top.x + ((t * dx) >> detail::kFixedShift);
      const Point split{static_cast<int>(splitX), middle.y};

      fill_flat_bottom(target, top, middle, split, color);
      fill_flat_top(target, middle, split, bottom, color);
    }
  }

  /**
   * Draw a filled and/or stroked circle
   *
   * Walks the rows from the center outwards and keeps one shrinking half-extent per region
   * (outer stroke edge, inner stroke edge, fill). Each row is mirrored above and below the
   * center. With both fill and stroke the fill stops where the stroke begins.
   *
   * @param target The pixel target to draw on
   * @param center Center pixel
   * @param radius Nominal radius in pixels, nothing is drawn if it is not positive
   * @param style Fill and stroke of the circle
   */
  template <PixelTarget Target>
  static void draw_circle(Target& target, Point center, int radius, Style const& style) {
    if (!style.has_paint() || radius <= 0) {
      return;
    }

    const CircleRadii radii = circle_radii(radius, style);
    const std::optional<Color> fillColor =
        style.fill ? std::optional<Color>{style.fill->effective_color()} : std::nullopt;
    const std::optional<Color> strokeColor =
        style.stroke ? std::optional<Color>{style.stroke->effective_color()} : std::nullopt;

    const std::int64_t cx = center.x;
    const std::int64_t cy = center.y;
    const auto targetHeight = static_cast<std::int64_t>(target.height());

    detail::DiskExtent outer{radii.outer};
    detail::DiskExtent inner{radii.inner};
    detail::DiskExtent fill{radii.fill};

    auto mirrored_span = [&](std::int64_t y, std::int64_t x0, std::int64_t x1, Color color) {
      fill_span_wide(target, cy - y, x0, x1, color);
      if (y != 0) {
        fill_span_wide(target, cy + y, x0, x1, color);
      }
    };

    std::int64_t ySquared = 0;
    for (std::int64_t y = 0; y <= radii.outer; ++y) {
      if (cy - y < 0 && cy + y >= targetHeight) {
        break;
      }

      const std::int64_t outerRow = outer.shrink(ySquared);
      const std::int64_t innerRow = (strokeColor && radii.inner > 0) ? inner.shrink(ySquared) : -1;
      const std::int64_t fillRow = (fillColor && radii.fill > 0) ? fill.shrink(ySquared) : -1;

      if (fillColor && fillRow >= 0) {
        mirrored_span(y, cx - fillRow, cx + fillRow, *fillColor);
      }

      if (strokeColor) {
        const std::int64_t begin = innerRow + 1;
        if (begin <= outerRow) {
          if (begin <= 0) {
            mirrored_span(y, cx - outerRow, cx + outerRow, *strokeColor);
          } else {
            mirrored_span(y, cx - outerRow, cx - begin, *strokeColor);
            mirrored_span(y, cx + begin, cx + outerRow, *strokeColor);
          }
        }
      }

      ySquared += 2 * y + 1;
    }
  }

private:
  // fill_span() for coordinates that may not fit into an int
  template <PixelTarget Target>
  static void fill_span_wide(Target& target, std::int64_t y, std::int64_t x0, std::int64_t x1,
                             Color color) {
    if (y < 0 || y >= static_cast<std::int64_t>(target.height())) {
      return;
    }
    const auto limit = static_cast<std::int64_t>(target.width());
    x0 = std::clamp<std::int64_t>(x0, -1, limit);
    x1 = std::clamp<std::int64_t>(x1, -1, limit);
    target.fill_span(static_cast<int>(y), static_cast<int>(x0), static_cast<int>(x1), color);
  }

  // Walks two edges from row yBegin (inclusive) to yEnd (exclusive). Edge positions and their
  // per-row increments are 16.16 fixed point.
  template <PixelTarget Target>
  static void walk_edges(Target& target, std::int64_t yBegin, std::int64_t yEnd,
                         std::int64_t leftX, std::int64_t leftStep, std::int64_t rightX,
                         std::int64_t rightStep, Color color) {
    std::int64_t y = yBegin;
    if (y < 0) {
      const std::int64_t skipped = std::min(-y, yEnd - y);
      leftX += leftStep * skipped;
      rightX += rightStep * skipped;
      y += skipped;
    }
    const std::int64_t last = std::min(yEnd, static_cast<std::int64_t>(target.height()));
    for (; y < last; ++y) {
      const std::int64_t xa = detail::fixed_ceil(leftX);
      const std::int64_t xb = detail::fixed_ceil(rightX);
      const std::int64_t x0 = std::min(xa, xb);
      const std::int64_t x1 = std::max(xa, xb) - 1;
      if (x0 <= x1) {
        fill_span_wide(target, y, x0, x1, color);
      }
      leftX += leftStep;
      rightX += rightStep;
    }
  }

  // top.y < left.y == right.y
  template <PixelTarget Target>
  static void fill_flat_bottom(Target& target, Point top, Point left, Point right, Color color) {
    const std::int64_t dy1 = static_cast<std::int64_t>(left.y) - top.y;
    const std::int64_t dy2 = static_cast<std::int64_t>(right.y) - top.y;
    if (dy1 == 0 || dy2 == 0) {
      return;
    }
    const std::int64_t step1 =
        detail::inverse_slope_fixed(static_cast<std::int64_t>(left.x) - top.x, dy1);
    const std::int64_t step2 =
        detail::inverse_slope_fixed(static_cast<std::int64_t>(right.x) - top.x, dy2);
    walk_edges(target, top.y, left.y, detail::to_fixed(top.x), step1, detail::to_fixed(top.x),
               step2, color);
  }

  // left.y == right.y < bottom.y
  template <PixelTarget Target>
  static void fill_flat_top(Target& target, Point left, Point right, Point bottom, Color color) {
    const std::int64_t dy1 = static_cast<std::int64_t>(bottom.y) - left.y;
    const std::int64_t dy2 = static_cast<std::int64_t>(bottom.y) - right.y;
    if (dy1 == 0 || dy2 == 0) {
      return;
    }
    const std::int64_t step1 =
        detail::inverse_slope_fixed(static_cast<std::int64_t>(bottom.x) - left.x, dy1);
    const std::int64_t step2 =
        detail::inverse_slope_fixed(static_cast<std::int64_t>(bottom.x) - right.x, dy2);
    walk_edges(target, left.y, bottom.y, detail::to_fixed(left.x), step1,
               detail::to_fixed(right.x), step2, color);
  }
};

} // namespace wave
