#include "palette.hpp"

namespace pagequeue::pipeline {

const std::vector<Rgb>& DefaultPalette() {
  static const std::vector<Rgb> palette = {
      {"red", 1.0, 0.0, 0.0},    {"blue", 0.0, 0.0, 1.0},   {"green", 0.0, 0.6, 0.0},   {"orange", 1.0, 0.5, 0.0},
      {"purple", 0.5, 0.0, 0.5}, {"cyan", 0.0, 0.7, 0.7},   {"magenta", 0.8, 0.0, 0.8}, {"brown", 0.6, 0.3, 0.1},
  };
  return palette;
}

const Rgb& ColorForChunk(size_t index) {
  const auto& palette = DefaultPalette();
  return palette[index % palette.size()];
}

} // namespace pagequeue::pipeline
