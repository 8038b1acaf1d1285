// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "wave/FrameBuffer.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdint>
#include <limits>

using wave::Color;
using wave::FrameBuffer;
using wave::Point;
namespace colors = wave::colors;

auto all_pixels_are(FrameBuffer const& buffer, Color color) -> bool {
  const auto pixels = buffer.pixels();
  return std::all_of(pixels.begin(), pixels.end(), [&](Color c) { return c == color; });
}

void test_dimensions() {
  FrameBuffer buffer(8, 6);
  assert(buffer.width() == 8);
  assert(buffer.height() == 6);
  assert(buffer.dimensions() == std::make_pair(std::size_t{8}, std::size_t{6}));
  assert(buffer.size() == 8 * 6);
  assert(buffer.pixels().size() == buffer.size());
  assert(!buffer.empty());
  assert(all_pixels_are(buffer, colors::TRANSPARENT));
}

void test_set_and_get_pixel() {
  FrameBuffer buffer(8, 6);
  buffer.clear(colors::BLACK);
  for (std::size_t i = 0; i < 6; ++i) {
    buffer.set_pixel(i, i, colors::RED);
  }
  assert(buffer.get_pixel(2, 2) == colors::RED);
  assert(buffer.get_pixel(3, 2) == colors::BLACK);
  assert(buffer.get_pixel(100, 100) == std::nullopt);
  assert(buffer.get_pixel(8, 0) == std::nullopt);
  assert(buffer.get_pixel(0, 6) == std::nullopt);

  buffer.set_pixel(8, 0, colors::GREEN);
  buffer.set_pixel(0, 6, colors::GREEN);
  assert(std::count(buffer.pixels().begin(), buffer.pixels().end(), colors::GREEN) == 0);
}

void test_plot_treats_negative_as_out_of_bounds() {
  FrameBuffer buffer(4, 3);
  buffer.plot(-1, 0, colors::WHITE);
  buffer.plot(0, -1, colors::WHITE);
  buffer.plot(std::numeric_limits<int>::min(), 1, colors::WHITE);
  buffer.plot(4, 0, colors::WHITE);
  buffer.plot(0, 3, colors::WHITE);
  assert(all_pixels_are(buffer, colors::TRANSPARENT));

  buffer.plot(3, 2, colors::WHITE);
  assert(buffer.get_pixel(3, 2) == colors::WHITE);
}

void test_fill_span_is_inclusive_and_order_independent() {
  FrameBuffer buffer(10, 4);
  buffer.fill_span(2, 5, 1, colors::BLUE);
  for (std::size_t x = 0; x < 10; ++x) {
    const bool inside = x >= 1 && x <= 5;
    assert(buffer.get_pixel(x, 2) == (inside ? colors::BLUE : colors::TRANSPARENT));
  }
  assert(std::count(buffer.pixels().begin(), buffer.pixels().end(), colors::BLUE) == 5);

  buffer.fill_span(0, 7, 7, colors::RED);
  assert(buffer.get_pixel(7, 0) == colors::RED);
  assert(std::count(buffer.pixels().begin(), buffer.pixels().end(), colors::RED) == 1);
}

void test_fill_span_clips() {
  FrameBuffer buffer(10, 4);
  buffer.fill_span(1, -5, 100, colors::GREEN);
  for (std::size_t x = 0; x < 10; ++x) {
    assert(buffer.get_pixel(x, 1) == colors::GREEN);
  }
  assert(std::count(buffer.pixels().begin(), buffer.pixels().end(), colors::GREEN) == 10);

  buffer.clear(colors::TRANSPARENT);
  buffer.fill_span(-1, 0, 9, colors::GREEN);
  buffer.fill_span(4, 0, 9, colors::GREEN);
  buffer.fill_span(2, -10, -1, colors::GREEN);
  buffer.fill_span(2, 10, 20, colors::GREEN);
  buffer.fill_span(2, std::numeric_limits<int>::min(), std::numeric_limits<int>::min(),
                   colors::GREEN);
  assert(all_pixels_are(buffer, colors::TRANSPARENT));

  buffer.fill_span(3, std::numeric_limits<int>::min(), 0, colors::GREEN);
  assert(buffer.get_pixel(0, 3) == colors::GREEN);
  assert(std::count(buffer.pixels().begin(), buffer.pixels().end(), colors::GREEN) == 1);
}

void test_clear() {
  FrameBuffer buffer(5, 5);
  buffer.fill_span(2, 0, 4, colors::RED);
  buffer.clear(colors::WHITE);
  assert(all_pixels_are(buffer, colors::WHITE));
  buffer.clear(colors::TRANSPARENT);
  const auto bytes = buffer.as_bytes();
  assert(std::all_of(bytes.begin(), bytes.end(), [](std::byte b) { return b == std::byte{0}; }));
}

void test_as_bytes_layout() {
  FrameBuffer buffer(3, 2);
  const auto bytes = buffer.as_bytes();
  assert(bytes.size() == buffer.size() * 4);

  buffer.set_pixel(1, 1, Color{1, 2, 3, 4});
  const std::size_t offset = (1 * 3 + 1) * 4;
  assert(bytes[offset + 0] == std::byte{1});
  assert(bytes[offset + 1] == std::byte{2});
  assert(bytes[offset + 2] == std::byte{3});
  assert(bytes[offset + 3] == std::byte{4});
  assert(bytes[offset - 1] == std::byte{0});
}

void test_invalid_dimensions_throw() {
  bool thrown = false;
  try {
    FrameBuffer buffer(0, 5);
  } catch (wave::FrameBufferError const&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    FrameBuffer buffer(5, 0);
  } catch (wave::FrameBufferError const&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    FrameBuffer buffer(std::numeric_limits<std::size_t>::max(), 2);
  } catch (wave::FrameBufferError const&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    FrameBuffer buffer(static_cast<std::size_t>(std::numeric_limits<int>::max()) + 1, 1);
  } catch (wave::FrameBufferError const&) {
    thrown = true;
  }
  assert(thrown);
}

void test_world_to_pixel_centers_odd_dimensions() {
  FrameBuffer buffer(5, 7);
  assert(buffer.world_to_pixel({0.0f, 0.0f}) == (Point{2, 3}));
  assert(buffer.world_to_pixel({1.0f, 1.0f}) == (Point{3, 2}));
  assert(buffer.world_to_pixel({-2.0f, 3.0f}) == (Point{0, 0}));
  assert(buffer.world_to_pixel({2.0f, -3.0f}) == (Point{4, 6}));
  assert(buffer.world_to_pixel({0.4f, -0.4f}) == (Point{2, 3}));
  assert(buffer.world_to_pixel({0.6f, 0.6f}) == (Point{3, 2}));
}

void test_world_to_pixel_rounds_half_away_from_zero() {
  FrameBuffer buffer(20, 15);
  // center_x is 9.5, center_y is 7
  assert(buffer.world_to_pixel({0.0f, 0.0f}) == (Point{10, 7}));
  assert(buffer.world_to_pixel({-1.0f, -2.0f}) == (Point{9, 9}));
  assert(buffer.world_to_pixel({1.0f, 1.0f}) == (Point{11, 6}));
  assert(buffer.world_to_pixel({-10.0f, 7.5f}) == (Point{-1, -1}));
  assert(buffer.world_to_pixel({1.0f, 1.0f}) == buffer.world_to_pixel({1.0f, 1.0f}));
}

void test_world_to_pixel_rejects_unrepresentable() {
  FrameBuffer buffer(20, 15);
  const float nan = std::numeric_limits<float>::quiet_NaN();
  const float inf = std::numeric_limits<float>::infinity();
  assert(!buffer.world_to_pixel({nan, 0.0f}));
  assert(!buffer.world_to_pixel({0.0f, nan}));
  assert(!buffer.world_to_pixel({inf, 0.0f}));
  assert(!buffer.world_to_pixel({0.0f, -inf}));
  assert(!buffer.world_to_pixel({1e10f, 0.0f}));
  assert(!buffer.world_to_pixel({0.0f, -1e10f}));
  assert(!buffer.world_to_pixel({std::numeric_limits<float>::max(), 0.0f}));
  assert(buffer.world_to_pixel({1e9f, -1e9f}).has_value());
}

int main() {
  test_dimensions();
  test_set_and_get_pixel();
  test_plot_treats_negative_as_out_of_bounds();
  test_fill_span_is_inclusive_and_order_independent();
  test_fill_span_clips();
  test_clear();
  test_as_bytes_layout();
  test_invalid_dimensions_throw();
  test_world_to_pixel_centers_odd_dimensions();
  test_world_to_pixel_rounds_half_away_from_zero();
  test_world_to_pixel_rejects_unrepresentable();
}
