// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "wave/Color.hpp"
#include "wave/GeometricPrimitives.hpp"

#include <cstddef>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>
#include <vector>

namespace wave {

struct FrameBufferError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

/**
 * Owned row-major RGBA8 pixel grid
 *
 * The size is fixed at construction. All writes are plain stores: the last write to a pixel
 * wins, nothing is blended against the existing content. Out of bounds writes are ignored.
 *
 * Not synchronized. Use one FrameBuffer per thread or lock externally.
 */
class FrameBuffer {
public:
  // Starts fully transparent.
  // Throws FrameBufferError if a dimension is zero, exceeds the int range used for pixel
  // coordinates, or the byte size of the grid overflows std::size_t.
  FrameBuffer(std::size_t width, std::size_t height);

  auto width() const -> std::size_t;
  auto height() const -> std::size_t;
  auto dimensions() const -> std::pair<std::size_t, std::size_t>;

  // Number of pixels, always width() * height()
  auto size() const -> std::size_t;
  auto empty() const -> bool;

  auto pixels() const -> std::span<Color const>;
  auto pixels() -> std::span<Color>;

  // Returns std::nullopt for out of bounds coordinates
  auto get_pixel(std::size_t x, std::size_t y) const -> std::optional<Color>;

  auto set_pixel(std::size_t x, std::size_t y, Color color) -> void;

  // Signed variant of set_pixel used by the rasterizers. Negative coordinates are out of bounds.
  auto plot(int x, int y, Color color) -> void;

  // Fills the inclusive range between x0 and x1 (in any order) on row y, clipped to the row.
  auto fill_span(int y, int x0, int x1, Color color) -> void;

  auto clear(Color color) -> void;

  // Packed row-major RGBA bytes, size() * 4 long
  auto as_bytes() const -> std::span<std::byte const>;

  // Maps a world coordinate to the nearest pixel. Pixel centers are offset by
  // ((width - 1) / 2, (height - 1) / 2) from the world origin. Returns std::nullopt for
  // non-finite input or if the rounded result does not fit into an int.
  auto world_to_pixel(WorldPoint point) const -> std::optional<Point>;

private:
  std::size_t mWidth;
  std::size_t mHeight;
  std::vector<Color> mPixels;
};

} // namespace wave
