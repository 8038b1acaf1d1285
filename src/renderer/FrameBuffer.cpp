// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "wave/FrameBuffer.hpp"
#include "wave/Logging.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <limits>

namespace wave {

namespace {

auto checked_pixel_count(std::size_t width, std::size_t height) -> std::size_t {
  constexpr auto kMaxExtent = static_cast<std::size_t>(std::numeric_limits<int>::max());
  constexpr auto kMaxPixels = std::numeric_limits<std::size_t>::max() / sizeof(Color);
  if (width == 0 || height == 0) {
    Log::e("Rejecting framebuffer of size {}x{}: dimensions must be positive", width, height);
    throw FrameBufferError(
        std::format("framebuffer dimensions must be positive, got {}x{}", width, height));
  }
  if (width > kMaxExtent || height > kMaxExtent || width > kMaxPixels / height) {
    Log::e("Rejecting framebuffer of size {}x{}: dimensions overflow", width, height);
    throw FrameBufferError(std::format("framebuffer dimensions {}x{} overflow", width, height));
  }
  return width * height;
}

auto fits_int(float value) -> bool {
  const auto wide = static_cast<double>(value);
  return wide >= static_cast<double>(std::numeric_limits<int>::min()) &&
         wide <= static_cast<double>(std::numeric_limits<int>::max());
}

} // namespace

FrameBuffer::FrameBuffer(std::size_t width, std::size_t height)
    : mWidth(width), mHeight(height),
      mPixels(checked_pixel_count(width, height), colors::TRANSPARENT) {
  Log::d("Created framebuffer of size {}x{}", mWidth, mHeight);
}

auto FrameBuffer::width() const -> std::size_t { return mWidth; }
auto FrameBuffer::height() const -> std::size_t { return mHeight; }

auto FrameBuffer::dimensions() const -> std::pair<std::size_t, std::size_t> {
  return {mWidth, mHeight};
}

auto FrameBuffer::size() const -> std::size_t { return mPixels.size(); }
auto FrameBuffer::empty() const -> bool { return mPixels.empty(); }

auto FrameBuffer::pixels() const -> std::span<Color const> { return mPixels; }
auto FrameBuffer::pixels() -> std::span<Color> { return mPixels; }

auto FrameBuffer::get_pixel(std::size_t x, std::size_t y) const -> std::optional<Color> {
  if (x >= mWidth || y >= mHeight) {
    return std::nullopt;
  }
  return mPixels[y * mWidth + x];
}

auto FrameBuffer::set_pixel(std::size_t x, std::size_t y, Color color) -> void {
  if (x >= mWidth || y >= mHeight) {
    return;
  }
  mPixels[y * mWidth + x] = color;
}

auto FrameBuffer::plot(int x, int y, Color color) -> void {
  if (x < 0 || y < 0) {
    return;
  }
  set_pixel(static_cast<std::size_t>(x), static_cast<std::size_t>(y), color);
}

auto FrameBuffer::fill_span(int y, int x0, int x1, Color color) -> void {
  if (y < 0 || static_cast<std::size_t>(y) >= mHeight) {
    return;
  }
  int left = std::min(x0, x1);
  int right = std::max(x0, x1);
  const int maxX = static_cast<int>(mWidth) - 1;
  if (right < 0 || left > maxX) {
    return;
  }
  left = std::max(left, 0);
  right = std::min(right, maxX);
  Color* row = mPixels.data() + static_cast<std::size_t>(y) * mWidth;
  std::fill(row + left, row + right + 1, color);
}

auto FrameBuffer::clear(Color color) -> void { std::ranges::fill(mPixels, color); }

auto FrameBuffer::as_bytes() const -> std::span<std::byte const> {
  return std::as_bytes(std::span<Color const>{mPixels});
}

auto FrameBuffer::world_to_pixel(WorldPoint point) const -> std::optional<Point> {
  if (!std::isfinite(point.x) || !std::isfinite(point.y)) {
    return std::nullopt;
  }

  const float centerX = (static_cast<float>(mWidth) - 1.0f) * 0.5f;
  const float centerY = (static_cast<float>(mHeight) - 1.0f) * 0.5f;

  const float pixelX = std::round(point.x + centerX);
  const float pixelY = std::round(centerY - point.y);

  if (!fits_int(pixelX) || !fits_int(pixelY)) {
    return std::nullopt;
  }
  return Point{static_cast<int>(pixelX), static_cast<int>(pixelY)};
}

} // namespace wave
