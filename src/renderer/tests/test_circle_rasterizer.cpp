// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "CountingTarget.hpp"

#include "wave/Rasterizer.hpp"

#include <cassert>
#include <cmath>
#include <limits>

using wave::Rasterizer;
using wave::Stroke;
using wave::Style;
using wave::testing::CountingTarget;
namespace colors = wave::colors;

auto stroke_with_width(float width) -> Style {
  return Style::stroke_only(Stroke{colors::WHITE, wave::Opacity{}, width});
}

void test_circle_radii() {
  const auto fillOnly = wave::circle_radii(5, Style::fill_only(colors::RED));
  assert(fillOnly.outer == 5 && fillOnly.inner == 0 && fillOnly.fill == 5);

  const auto thin = wave::circle_radii(5, Style::fill_and_stroke(colors::RED, colors::WHITE));
  assert(thin.outer == 6 && thin.inner == 5 && thin.fill == 5);

  const auto odd = wave::circle_radii(5, stroke_with_width(3.0f));
  assert(odd.outer == 7 && odd.inner == 4 && odd.fill == 0);

  const auto even = wave::circle_radii(5, stroke_with_width(4.0f));
  assert(even.outer == 7 && even.inner == 3);

  const auto wide = wave::circle_radii(5, stroke_with_width(100.0f));
  assert(wide.outer == 55 && wide.inner == 0);

  const auto invalid =
      wave::circle_radii(5, stroke_with_width(std::numeric_limits<float>::quiet_NaN()));
  assert(invalid.outer == 5 && invalid.inner == 5);

  const auto huge = wave::circle_radii(std::numeric_limits<int>::max(), stroke_with_width(3.0f));
  assert(huge.outer == std::numeric_limits<int>::max());
}

void test_fill_and_one_pixel_stroke() {
  CountingTarget target(30, 30);
  Rasterizer::draw_circle(target, {15, 15}, 4, Style::fill_and_stroke(colors::RED, colors::WHITE));
  assert(target.max_writes() == 1);
  for (int y = 0; y < 30; ++y) {
    for (int x = 0; x < 30; ++x) {
      const int d2 = (x - 15) * (x - 15) + (y - 15) * (y - 15);
      if (d2 <= 16) {
        assert(target.writes(x, y) == 1 && target.color(x, y) == colors::RED);
      } else if (d2 <= 25) {
        assert(target.writes(x, y) == 1 && target.color(x, y) == colors::WHITE);
      } else {
        assert(target.writes(x, y) == 0);
      }
    }
  }
}

void test_wide_stroke_grows_both_ways() {
  CountingTarget target(30, 30);
  Rasterizer::draw_circle(target, {15, 15}, 5, stroke_with_width(3.0f));
  assert(target.max_writes() == 1);
  for (int y = 0; y < 30; ++y) {
    for (int x = 0; x < 30; ++x) {
      const int d2 = (x - 15) * (x - 15) + (y - 15) * (y - 15);
      const bool inRing = d2 > 16 && d2 <= 49;
      assert((target.writes(x, y) == 1) == inRing);
      // mirrored pixel agrees
      assert(x == 0 || y == 0 || target.writes(x, y) == target.writes(30 - x, 30 - y));
    }
  }
}

void test_fill_only_disk() {
  CountingTarget target(11, 11);
  Rasterizer::draw_circle(target, {5, 5}, 1, Style::fill_only(colors::BLUE));
  assert(target.total_writes() == 5);
  assert(target.writes(5, 5) == 1);
  assert(target.writes(4, 5) == 1 && target.writes(6, 5) == 1);
  assert(target.writes(5, 4) == 1 && target.writes(5, 6) == 1);
  assert(target.writes(4, 4) == 0);
}

void test_nothing_to_draw() {
  CountingTarget target(10, 10);
  Rasterizer::draw_circle(target, {5, 5}, 0, Style::fill_only(colors::RED));
  Rasterizer::draw_circle(target, {5, 5}, -3, Style::fill_only(colors::RED));
  Rasterizer::draw_circle(target, {5, 5}, 3, Style{});
  Rasterizer::draw_circle(target, {5, -1000}, 5, Style::fill_only(colors::RED));
  Rasterizer::draw_circle(target, {std::numeric_limits<int>::max(), 5}, 5,
                          Style::fill_only(colors::RED));
  assert(target.total_writes() == 0);
}

void test_huge_circle_covers_canvas_once() {
  CountingTarget target(20, 20);
  Rasterizer::draw_circle(target, {10, 10}, 1000000, Style::fill_only(colors::GREEN));
  assert(target.covered_pixels() == 400);
  assert(target.max_writes() == 1);
}

void test_partially_visible_circle() {
  CountingTarget target(10, 10);
  Rasterizer::draw_circle(target, {0, 0}, 3, Style::fill_only(colors::RED));
  assert(target.max_writes() == 1);
  for (int y = 0; y < 10; ++y) {
    for (int x = 0; x < 10; ++x) {
      assert((target.writes(x, y) == 1) == (x * x + y * y <= 9));
    }
  }
}

int main() {
  test_circle_radii();
  test_fill_and_one_pixel_stroke();
  test_wide_stroke_grows_both_ways();
  test_fill_only_disk();
  test_nothing_to_draw();
  test_huge_circle_covers_canvas_once();
  test_partially_visible_circle();
}
