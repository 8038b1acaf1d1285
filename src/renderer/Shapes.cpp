// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "wave/Shapes.hpp"
#include "wave/Path.hpp"
#include "wave/Rasterizer.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <optional>
#include <vector>

namespace wave {

namespace {

constexpr float kSqrt3 = 1.7320508f;

auto valid_extent(float value) -> bool { return std::isfinite(value) && value > 0.0f; }

auto triangle_pixels(FrameBuffer const& buffer, WorldPoint a, WorldPoint b, WorldPoint c)
    -> std::optional<std::array<Point, 3>> {
  const auto pa = buffer.world_to_pixel(a);
  const auto pb = buffer.world_to_pixel(b);
  const auto pc = buffer.world_to_pixel(c);
  if (!pa || !pb || !pc) {
    return std::nullopt;
  }
  return std::array<Point, 3>{*pa, *pb, *pc};
}

auto equilateral_vertices(WorldPoint center, float side_length) -> std::array<WorldPoint, 3> {
  const float apexOffset = (kSqrt3 / 3.0f) * side_length;
  const float baseOffset = (kSqrt3 / 6.0f) * side_length;
  const float halfSide = 0.5f * side_length;
  return {WorldPoint{center.x, center.y + apexOffset},
          WorldPoint{center.x - halfSide, center.y - baseOffset},
          WorldPoint{center.x + halfSide, center.y - baseOffset}};
}

} // namespace

auto line(FrameBuffer& buffer, WorldPoint from, WorldPoint to, Style const& style) -> void {
  if (!style.stroke) {
    return;
  }
  Path{{from, to}, false}.render(buffer, Style::stroke_only(*style.stroke));
}

auto line(FrameBuffer& buffer, WorldPoint from, WorldPoint to, Color color) -> void {
  const auto start = buffer.world_to_pixel(from);
  const auto end = buffer.world_to_pixel(to);
  if (!start || !end) {
    return;
  }
  Rasterizer::draw_line(buffer, *start, *end, color);
}

auto circle(FrameBuffer& buffer, WorldPoint center, float radius, Style const& style) -> void {
  if (!valid_extent(radius) || !style.has_paint()) {
    return;
  }
  const auto origin = buffer.world_to_pixel(center);
  if (!origin) {
    return;
  }
  const double radiusPixels = std::max(std::ceil(static_cast<double>(radius)), 1.0);
  if (radiusPixels > static_cast<double>(std::numeric_limits<int>::max())) {
    return;
  }
  Rasterizer::draw_circle(buffer, *origin, static_cast<int>(radiusPixels), style);
}

auto triangle(FrameBuffer& buffer, WorldPoint a, WorldPoint b, WorldPoint c, Style const& style)
    -> void {
  if (!style.has_paint()) {
    return;
  }
  const auto vertices = triangle_pixels(buffer, a, b, c);
  if (!vertices) {
    return;
  }
  const auto& [pa, pb, pc] = *vertices;
  if (style.fill) {
    Rasterizer::fill_triangle(buffer, pa, pb, pc, style.fill->effective_color());
  }
  if (style.stroke) {
    Path::stroke_pixels(buffer, *vertices, true, style.stroke->width,
                        style.stroke->effective_color());
  }
}

auto triangle(FrameBuffer& buffer, WorldPoint a, WorldPoint b, WorldPoint c, Color color) -> void {
  const auto vertices = triangle_pixels(buffer, a, b, c);
  if (!vertices) {
    return;
  }
  const auto& [pa, pb, pc] = *vertices;
  Rasterizer::draw_line(buffer, pa, pb, color);
  Rasterizer::draw_line(buffer, pb, pc, color);
  Rasterizer::draw_line(buffer, pc, pa, color);
}

auto equilateral_triangle(FrameBuffer& buffer, WorldPoint center, float side_length,
                          Style const& style) -> void {
  if (!valid_extent(side_length)) {
    return;
  }
  const auto [apex, left, right] = equilateral_vertices(center, side_length);
  triangle(buffer, apex, left, right, style);
}

auto equilateral_triangle(FrameBuffer& buffer, WorldPoint center, float side_length, Color color)
    -> void {
  if (!valid_extent(side_length)) {
    return;
  }
  const auto [apex, left, right] = equilateral_vertices(center, side_length);
  triangle(buffer, apex, left, right, color);
}

auto rectangle(FrameBuffer& buffer, WorldPoint center, float width, float height,
               Style const& style) -> void {
  if (!valid_extent(width) || !valid_extent(height) || !style.has_paint()) {
    return;
  }

  // Keep the corners close to the visible area so huge rectangles stay representable.
  const float halfStageWidth = static_cast<float>(buffer.width()) / 2.0f;
  const float halfStageHeight = static_cast<float>(buffer.height()) / 2.0f;

  const float left = std::max(center.x - width / 2.0f, -halfStageWidth);
  const float right = std::min(center.x + width / 2.0f, halfStageWidth);
  const float top = std::min(center.y + height / 2.0f, halfStageHeight);
  const float bottom = std::max(center.y - height / 2.0f, -halfStageHeight);

  // Also rejects NaN centers
  if (!(left <= right) || !(bottom <= top)) {
    return;
  }

  Path{{WorldPoint{left, top}, WorldPoint{right, top}, WorldPoint{right, bottom},
        WorldPoint{left, bottom}},
       true}
      .render(buffer, style);
}

auto square(FrameBuffer& buffer, WorldPoint center, float side_length, Style const& style)
    -> void {
  rectangle(buffer, center, side_length, side_length, style);
}

auto polygon(FrameBuffer& buffer, std::span<WorldPoint const> points, Style const& style) -> void {
  Path{std::vector<WorldPoint>(points.begin(), points.end()), true}.render(buffer, style);
}

auto polyline(FrameBuffer& buffer, std::span<WorldPoint const> points, Style const& style)
    -> void {
  Path{std::vector<WorldPoint>(points.begin(), points.end()), false}.render(buffer, style);
}

} // namespace wave
