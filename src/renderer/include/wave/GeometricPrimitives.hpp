// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

namespace wave {

// Pixel coordinate: origin top-left, y pointing down.
struct Point {
  int x;
  int y;

  auto operator==(Point const&) const -> bool = default;
};

// World coordinate: origin at the framebuffer center, y pointing up.
struct WorldPoint {
  float x;
  float y;
};

struct Line {
  Point start;
  Point end;

  auto operator==(Line const&) const -> bool = default;
};

} // namespace wave
