#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pagequeue::pipeline {

struct Rgb {
  std::string name;
  double      r = 0.0;
  double      g = 0.0;
  double      b = 0.0;
};

// red, blue, green, orange, purple, cyan, magenta, brown
const std::vector<Rgb>& DefaultPalette();

// palette[index % size]; adjacent chunks differ up to the palette length.
const Rgb& ColorForChunk(size_t index);

} // namespace pagequeue::pipeline
