// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "wave/Path.hpp"
#include "wave/Rasterizer.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <utility>

namespace wave {

namespace {

auto to_point(double x, double y) -> std::optional<Point> {
  constexpr auto kMin = static_cast<double>(std::numeric_limits<int>::min());
  constexpr auto kMax = static_cast<double>(std::numeric_limits<int>::max());
  const double px = std::round(x);
  const double py = std::round(y);
  if (!(px >= kMin && px <= kMax && py >= kMin && py <= kMax)) {
    return std::nullopt;
  }
  return Point{static_cast<int>(px), static_cast<int>(py)};
}

// Adds the crossing of row y with the edge a-b. Horizontal edges never cross. The edge covers
// the half-open row range [min(a.y, b.y), max(a.y, b.y)) so a shared vertex counts once.
void add_crossing(std::vector<int>& crossings, Point a, Point b, int y) {
  if (a.y == b.y) {
    return;
  }
  if (y < std::min(a.y, b.y) || y >= std::max(a.y, b.y)) {
    return;
  }
  const double x = a.x + (static_cast<double>(y) - a.y) * (static_cast<double>(b.x) - a.x) /
                             (static_cast<double>(b.y) - a.y);
  crossings.push_back(static_cast<int>(std::floor(x)));
}

void stroke_edge(FrameBuffer& buffer, Point start, Point end, float width, Color color) {
  if (width <= 1.0f) {
    Rasterizer::draw_line(buffer, start, end, color);
    return;
  }
  if (const auto quad = stroke_quad(start, end, width)) {
    const auto& [a, b, c, d] = *quad;
    Rasterizer::fill_triangle(buffer, a, b, c, color);
    Rasterizer::fill_triangle(buffer, a, c, d, color);
  }
}

} // namespace

Path::Path(std::vector<WorldPoint> nodes, bool closed) : mNodes(std::move(nodes)), mClosed(closed) {}

auto Path::nodes() const -> std::span<WorldPoint const> { return mNodes; }

auto Path::is_closed() const -> bool { return mClosed; }

auto Path::to_pixels(FrameBuffer const& buffer) const -> std::optional<std::vector<Point>> {
  std::vector<Point> pixels;
  pixels.reserve(mNodes.size());
  for (WorldPoint node : mNodes) {
    const std::optional<Point> pixel = buffer.world_to_pixel(node);
    if (!pixel) {
      return std::nullopt;
    }
    pixels.push_back(*pixel);
  }
  return pixels;
}

auto Path::render(FrameBuffer& buffer, Style const& style) const -> void {
  if (!style.has_paint()) {
    return;
  }
  const std::optional<std::vector<Point>> pixels = to_pixels(buffer);
  if (!pixels) {
    return;
  }

  if (mClosed && style.fill) {
    fill_pixels(buffer, *pixels, style.fill->effective_color());
  }
  if (style.stroke) {
    stroke_pixels(buffer, *pixels, mClosed, style.stroke->width,
                  style.stroke->effective_color());
  }
}

auto Path::fill_pixels(FrameBuffer& buffer, std::span<Point const> nodes, Color color) -> void {
  if (nodes.size() < 3) {
    return;
  }

  const auto [lowest, highest] = std::minmax_element(
      nodes.begin(), nodes.end(), [](Point const& a, Point const& b) { return a.y < b.y; });
  const int ymin = lowest->y;
  const int ymax = highest->y;
  if (ymin >= ymax) {
    return;
  }

  const int firstRow = std::max(ymin, 0);
  const int lastRow = std::min(ymax, static_cast<int>(buffer.height()) - 1);

  std::vector<int> crossings;
  crossings.reserve(nodes.size());
  for (int y = firstRow; y <= lastRow; ++y) {
    crossings.clear();
    for (std::size_t i = 0; i < nodes.size(); ++i) {
      add_crossing(crossings, nodes[i], nodes[(i + 1) % nodes.size()], y);
    }
    std::sort(crossings.begin(), crossings.end());

    for (std::size_t j = 0; j + 1 < crossings.size(); j += 2) {
      const std::int64_t left = static_cast<std::int64_t>(crossings[j]) + 1;
      const std::int64_t right = static_cast<std::int64_t>(crossings[j + 1]) - 1;
      if (left <= right) {
        buffer.fill_span(y, static_cast<int>(left), static_cast<int>(right), color);
      }
    }
  }
}

auto Path::stroke_pixels(FrameBuffer& buffer, std::span<Point const> nodes, bool closed,
                         float width, Color color) -> void {
  if (nodes.size() < 2) {
    return;
  }
  if (!std::isfinite(width) || width <= 0.0f) {
    return;
  }

  for (std::size_t i = 0; i + 1 < nodes.size(); ++i) {
    stroke_edge(buffer, nodes[i], nodes[i + 1], width, color);
  }
  if (closed) {
    stroke_edge(buffer, nodes.back(), nodes.front(), width, color);
  }
}

auto stroke_quad(Point start, Point end, float width) -> std::optional<std::array<Point, 4>> {
  if (!std::isfinite(width) || width <= 0.0f) {
    return std::nullopt;
  }

  const double dx = static_cast<double>(end.x) - start.x;
  const double dy = static_cast<double>(end.y) - start.y;
  const double length = std::hypot(dx, dy);
  if (length == 0.0) {
    return std::nullopt;
  }

  const double half = 0.5 * static_cast<double>(width);
  const double tx = dx / length * half;
  const double ty = dy / length * half;
  const double nx = -ty;
  const double ny = tx;

  const double x1 = start.x - tx;
  const double y1 = start.y - ty;
  const double x2 = end.x + tx;
  const double y2 = end.y + ty;

  const auto a = to_point(x1 + nx, y1 + ny);
  const auto b = to_point(x2 + nx, y2 + ny);
  const auto c = to_point(x2 - nx, y2 - ny);
  const auto d = to_point(x1 - nx, y1 - ny);
  if (!a || !b || !c || !d) {
    return std::nullopt;
  }
  return std::array<Point, 4>{*a, *b, *c, *d};
}

} // namespace wave
