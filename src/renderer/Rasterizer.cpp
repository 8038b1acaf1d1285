// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "wave/Rasterizer.hpp"

#include <cmath>
#include <limits>

namespace wave {

namespace {

constexpr std::uint8_t kLeft = 1;
constexpr std::uint8_t kRight = 2;
constexpr std::uint8_t kTop = 4;
constexpr std::uint8_t kBottom = 8;

// Each endpoint can be moved at most twice, anything beyond that is rounding noise at a corner.
constexpr int kMaxClipSteps = 8;

constexpr std::int64_t kMaxRadius = std::numeric_limits<int>::max();

struct ClipRect {
  std::int64_t xmin;
  std::int64_t ymin;
  std::int64_t xmax;
  std::int64_t ymax;

  auto out_code(std::int64_t x, std::int64_t y) const -> std::uint8_t {
    std::uint8_t code = 0;
    if (x < xmin) {
      code |= kLeft;
    } else if (x > xmax) {
      code |= kRight;
    }
    if (y < ymin) {
      code |= kTop;
    } else if (y > ymax) {
      code |= kBottom;
    }
    return code;
  }
};

auto magnitude(std::int64_t value) -> std::uint64_t {
  return value < 0 ? std::uint64_t{0} - static_cast<std::uint64_t>(value)
                   : static_cast<std::uint64_t>(value);
}

// delta * offset / span truncated towards zero. The clipped endpoint lies on the segment, so
// |offset| <= |span| and both factors stay below 2^32 in magnitude: the product fits into
// 64 unsigned bits while it may not fit into 64 signed ones.
auto scale_delta(std::int64_t delta, std::int64_t offset, std::int64_t span) -> std::int64_t {
  const bool negative = ((delta < 0) != (offset < 0)) != (span < 0);
  const auto result =
      static_cast<std::int64_t>(magnitude(delta) * magnitude(offset) / magnitude(span));
  return negative ? -result : result;
}

auto clamp_half_width(float half) -> std::int64_t {
  if (static_cast<double>(half) >= static_cast<double>(kMaxRadius)) {
    return kMaxRadius;
  }
  return static_cast<std::int64_t>(half);
}

} // namespace

auto clip_line(Line line, std::size_t width, std::size_t height) -> std::optional<Line> {
  if (width == 0 || height == 0) {
    return std::nullopt;
  }
  const ClipRect rect{.xmin = 0,
                      .ymin = 0,
                      .xmax = static_cast<std::int64_t>(width) - 1,
                      .ymax = static_cast<std::int64_t>(height) - 1};

  std::int64_t x0 = line.start.x;
  std::int64_t y0 = line.start.y;
  std::int64_t x1 = line.end.x;
  std::int64_t y1 = line.end.y;

  std::uint8_t code0 = rect.out_code(x0, y0);
  std::uint8_t code1 = rect.out_code(x1, y1);

  for (int step = 0; step < kMaxClipSteps; ++step) {
    if ((code0 | code1) == 0) {
      return Line{Point{static_cast<int>(x0), static_cast<int>(y0)},
                  Point{static_cast<int>(x1), static_cast<int>(y1)}};
    }
    if ((code0 & code1) != 0) {
      return std::nullopt;
    }

    const std::uint8_t codeOut = code0 != 0 ? code0 : code1;
    const std::int64_t dx = x1 - x0;
    const std::int64_t dy = y1 - y0;
    std::int64_t x = 0;
    std::int64_t y = 0;

    if ((codeOut & kBottom) != 0) {
      if (dy == 0) {
        return std::nullopt;
      }
      y = rect.ymax;
      x = x0 + scale_delta(dx, y - y0, dy);
    } else if ((codeOut & kTop) != 0) {
      if (dy == 0) {
        return std::nullopt;
      }
      y = rect.ymin;
      x = x0 + scale_delta(dx, y - y0, dy);
    } else if ((codeOut & kRight) != 0) {
      if (dx == 0) {
        return std::nullopt;
      }
      x = rect.xmax;
      y = y0 + scale_delta(dy, x - x0, dx);
    } else {
      if (dx == 0) {
        return std::nullopt;
      }
      x = rect.xmin;
      y = y0 + scale_delta(dy, x - x0, dx);
    }

    if (codeOut == code0) {
      x0 = x;
      y0 = y;
      code0 = rect.out_code(x0, y0);
    } else {
      x1 = x;
      y1 = y;
      code1 = rect.out_code(x1, y1);
    }
  }
  return std::nullopt;
}

auto circle_radii(int radius, Style const& style) -> CircleRadii {
  const std::int64_t nominal = std::max(radius, 0);
  CircleRadii radii{.outer = nominal, .inner = 0, .fill = 0};

  if (style.stroke) {
    radii.inner = nominal;
    const float width = style.stroke->width;
    if (std::isfinite(width) && width > 0.0f) {
      const float half = 0.5f * width;
      radii.outer = std::min(nominal + clamp_half_width(std::ceil(half)), kMaxRadius);
      radii.inner = std::max<std::int64_t>(nominal - clamp_half_width(std::floor(half)), 0);
    }
  }

  if (style.fill) {
    radii.fill = style.stroke ? radii.inner : nominal;
  }
  return radii;
}

} // namespace wave
