// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "wave/Color.hpp"
#include "wave/FrameBuffer.hpp"
#include "wave/GeometricPrimitives.hpp"
#include "wave/Style.hpp"

#include <array>
#include <optional>
#include <span>
#include <vector>

namespace wave {

// Ordered vertices in world coordinates. A closed path connects its last vertex back to the
// first one and is the only kind of path that can be filled.
class Path {
public:
  Path(std::vector<WorldPoint> nodes, bool closed);

  auto nodes() const -> std::span<WorldPoint const>;
  auto is_closed() const -> bool;

  // Converts every vertex to pixel coordinates. Returns std::nullopt if any vertex is
  // unrepresentable.
  auto to_pixels(FrameBuffer const& buffer) const -> std::optional<std::vector<Point>>;

  // Fill first (closed paths only), then stroke on top. Nothing is drawn if a vertex is
  // unrepresentable.
  auto render(FrameBuffer& buffer, Style const& style) const -> void;

  // Even-odd scanline fill of a simple polygon. Spans are inset by one pixel on both sides so
  // that the boundary pixels stay free for a one pixel stroke.
  static auto fill_pixels(FrameBuffer& buffer, std::span<Point const> nodes, Color color) -> void;

  // Widths up to one pixel draw Bresenham lines. Wider strokes fill one quad per edge.
  static auto stroke_pixels(FrameBuffer& buffer, std::span<Point const> nodes, bool closed,
                            float width, Color color) -> void;

private:
  std::vector<WorldPoint> mNodes;
  bool mClosed;
};

// Corners of the quad covering the edge from start to end with the given stroke width:
// offset by width / 2 along the normal and extended by width / 2 past both ends.
// Order: start + n, end + n, end - n, start - n.
// Returns std::nullopt for zero length edges, invalid widths or unrepresentable corners.
auto stroke_quad(Point start, Point end, float width) -> std::optional<std::array<Point, 4>>;

} // namespace wave
