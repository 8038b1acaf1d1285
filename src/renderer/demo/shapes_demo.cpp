// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "wave/FrameBuffer.hpp"
#include "wave/Logging.hpp"
#include "wave/Shapes.hpp"

#include <array>
#include <charconv>
#include <cstring>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#include <getopt.h>

namespace wave {

struct ProgramOptions {
  std::filesystem::path outputDirectory;
  std::size_t width;
  std::size_t height;
  bool printAscii;
  Log::Level logLevel;
};

auto parse_command_line_args(int argc, char** argv) -> ProgramOptions;

// One reference drawing. stroke and fill name the colors the ASCII preview highlights.
struct Scene {
  std::string_view label;
  std::string_view fileName;
  std::optional<Color> stroke;
  std::optional<Color> fill;
  void (*draw)(FrameBuffer&);
};

void draw_line_scene(FrameBuffer& buffer) {
  line(buffer, {-1.0f, -2.0f}, {1.0f, 1.0f}, Style::stroke_only(colors::WHITE));
}

void draw_circle_scene(FrameBuffer& buffer) {
  circle(buffer, {1.0f, 1.0f}, 4.0f, Style::fill_and_stroke(colors::RED, colors::WHITE));
}

void draw_square_scene(FrameBuffer& buffer) {
  square(buffer, {-1.0f, 0.0f}, 6.0f, Style::fill_only(colors::RED));
}

void draw_rectangle_scene(FrameBuffer& buffer) {
  rectangle(buffer, {5.0f, 3.0f}, 7.0f, 8.0f, Style::fill_and_stroke(colors::GREEN, colors::WHITE));
}

void draw_triangle_scene(FrameBuffer& buffer) {
  triangle(buffer, {0.0f, -2.0f}, {0.0f, 2.0f}, {8.0f, 3.0f},
           Style::fill_and_stroke(colors::BLUE, colors::WHITE));
}

void draw_equilateral_scene(FrameBuffer& buffer) {
  equilateral_triangle(buffer, {-1.0f, 1.0f}, 9.0f, Style::stroke_only(colors::GREEN));
}

constexpr std::array kScenes{
    Scene{"Line (stroke)", "line.ppm", colors::WHITE, std::nullopt, &draw_line_scene},
    Scene{"Circle (stroke + fill)", "circle.ppm", colors::WHITE, colors::RED, &draw_circle_scene},
    Scene{"Square (fill)", "square.ppm", std::nullopt, colors::RED, &draw_square_scene},
    Scene{"Rectangle (stroke + fill)", "rectangle.ppm", colors::WHITE, colors::GREEN,
          &draw_rectangle_scene},
    Scene{"Triangle (stroke + fill)", "triangle.ppm", colors::WHITE, colors::BLUE,
          &draw_triangle_scene},
    Scene{"Equilateral triangle (stroke)", "equilateral_triangle.ppm", colors::GREEN,
          std::nullopt, &draw_equilateral_scene},
};

/**
 * Simple PPM image format writer, transparent pixels come out black
 */
auto write_ppm(const std::filesystem::path& file_name, const FrameBuffer& buffer) -> bool {
  std::ofstream file(file_name);
  if (!file) {
    Log::e("Failed to open {} for writing", file_name.string());
    return false;
  }

  file << "P3\n";
  file << buffer.width() << " " << buffer.height() << "\n";
  file << "255\n";

  const auto bytes = buffer.as_bytes();
  for (std::size_t y = 0; y < buffer.height(); ++y) {
    for (std::size_t x = 0; x < buffer.width(); ++x) {
      const std::size_t offset = (y * buffer.width() + x) * 4;
      const auto alpha = std::to_integer<unsigned>(bytes[offset + 3]);
      for (std::size_t channel = 0; channel < 3; ++channel) {
        const auto value = alpha == 0 ? 0u : std::to_integer<unsigned>(bytes[offset + channel]);
        file << value << " ";
      }
    }
    file << "\n";
  }

  if (!file) {
    Log::e("Failed to write {}", file_name.string());
    return false;
  }
  Log::i("Saved image to {}", file_name.string());
  return true;
}

void print_ascii(const FrameBuffer& buffer, const Scene& scene) {
  const auto pixels = buffer.pixels();
  for (std::size_t y = 0; y < buffer.height(); ++y) {
    for (std::size_t x = 0; x < buffer.width(); ++x) {
      const Color pixel = pixels[y * buffer.width() + x];
      if (pixel.a == 0) {
        std::cout << "·";
      } else if (scene.stroke && pixel == *scene.stroke) {
        std::cout << 'S';
      } else if (scene.fill && pixel == *scene.fill) {
        std::cout << 'F';
      } else {
        std::cout << '#';
      }
    }
    std::cout << '\n';
  }
  std::cout << scene.label << "\n\n";
}

auto parse_dimension(const char* text, std::size_t& value) -> bool {
  const char* end = text + std::strlen(text);
  std::size_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(text, end, parsed);
  if (ec != std::errc{} || ptr != end) {
    return false;
  }
  value = parsed;
  return true;
}

auto parse_command_line_args(int argc, char** argv) -> ProgramOptions {
  ProgramOptions result{};
  result.outputDirectory = ".";
  result.width = 20;
  result.height = 15;
  result.printAscii = true;
  result.logLevel = Log::Level::Info;
  static ::option long_options[] = {::option{"out-dir", required_argument, nullptr, 'o'},
                                    ::option{"width", required_argument, nullptr, 'w'},
                                    ::option{"height", required_argument, nullptr, 'h'},
                                    ::option{"no-ascii", no_argument, nullptr, 'q'},
                                    ::option{"log-level", required_argument, nullptr, 'l'},
                                    ::option{}};
  const char* short_options = "o:w:h:ql:";
  int option_index = 0;
  int parsedShortOpt = ::getopt_long(argc, argv, short_options, long_options, &option_index);
  while (parsedShortOpt != -1) {
    switch (parsedShortOpt) {
    case 'o':
      if (optarg) {
        result.outputDirectory = optarg;
      }
      break;
    case 'w':
      if (!optarg || !parse_dimension(optarg, result.width)) {
        Log::w("Ignoring invalid width '{}'", optarg ? optarg : "");
      }
      break;
    case 'h':
      if (!optarg || !parse_dimension(optarg, result.height)) {
        Log::w("Ignoring invalid height '{}'", optarg ? optarg : "");
      }
      break;
    case 'q':
      result.printAscii = false;
      break;
    case 'l':
      if (!optarg || !parse_log_level(optarg, result.logLevel)) {
        Log::w("Ignoring invalid log level '{}'", optarg ? optarg : "");
      }
      break;
    default:
      Log::w("Unknown option '{}'", static_cast<char>(parsedShortOpt));
      break;
    }
    parsedShortOpt = ::getopt_long(argc, argv, short_options, long_options, &option_index);
  }
  return result;
}

} // namespace wave

int main(int argc, char** argv) {
  using namespace wave;

  const ProgramOptions options = parse_command_line_args(argc, argv);
  Log::set_threshold(options.logLevel);

  try {
    std::error_code ec;
    std::filesystem::create_directories(options.outputDirectory, ec);
    if (ec) {
      Log::e("Cannot create output directory {}: {}", options.outputDirectory.string(),
             ec.message());
      return 1;
    }

    FrameBuffer buffer(options.width, options.height);
    bool allWritten = true;
    for (const Scene& scene : kScenes) {
      buffer.clear(colors::TRANSPARENT);
      scene.draw(buffer);
      if (options.printAscii) {
        print_ascii(buffer, scene);
      }
      allWritten = write_ppm(options.outputDirectory / scene.fileName, buffer) && allWritten;
    }
    return allWritten ? 0 : 1;
  } catch (const std::exception& e) {
    Log::e("Error: {}", e.what());
    return 1;
  }
}
