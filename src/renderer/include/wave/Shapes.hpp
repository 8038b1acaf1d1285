// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "wave/Color.hpp"
#include "wave/FrameBuffer.hpp"
#include "wave/GeometricPrimitives.hpp"
#include "wave/Style.hpp"

#include <span>

namespace wave {

// Shape entry points in world coordinates.
//
// Invalid geometry (non-finite values, non-positive sizes, points that do not map to a pixel)
// silently skips the whole call. The overloads taking a single Color draw a one pixel outline.

// Lines only use the stroke of the style, the fill is ignored.
auto line(FrameBuffer& buffer, WorldPoint from, WorldPoint to, Style const& style) -> void;
auto line(FrameBuffer& buffer, WorldPoint from, WorldPoint to, Color color) -> void;

// The radius is rounded up to whole pixels, at least one.
auto circle(FrameBuffer& buffer, WorldPoint center, float radius, Style const& style) -> void;

// Filled with the triangle rasterizer, stroked like a closed path.
auto triangle(FrameBuffer& buffer, WorldPoint a, WorldPoint b, WorldPoint c, Style const& style)
    -> void;
auto triangle(FrameBuffer& buffer, WorldPoint a, WorldPoint b, WorldPoint c, Color color) -> void;

// Apex above the center, base below it.
auto equilateral_triangle(FrameBuffer& buffer, WorldPoint center, float side_length,
                          Style const& style) -> void;
auto equilateral_triangle(FrameBuffer& buffer, WorldPoint center, float side_length, Color color)
    -> void;

// Axis aligned, centered on center. Edges are clamped to the visible world area first.
auto rectangle(FrameBuffer& buffer, WorldPoint center, float width, float height,
               Style const& style) -> void;
auto square(FrameBuffer& buffer, WorldPoint center, float side_length, Style const& style)
    -> void;

// Closed path through all points
auto polygon(FrameBuffer& buffer, std::span<WorldPoint const> points, Style const& style) -> void;

// Open path through all points, never filled
auto polyline(FrameBuffer& buffer, std::span<WorldPoint const> points, Style const& style)
    -> void;

} // namespace wave
