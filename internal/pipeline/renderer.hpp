#pragma once

#include <filesystem>

#include "internal/pipeline/palette.hpp"

namespace pagequeue::pipeline {

/*
  Page-level transformation applied to one chunk file.

  Called concurrently from pool workers, each call with distinct paths.
  Throws on failure.
*/
class Renderer {
 public:
  virtual ~Renderer() = default;

  virtual void Transform(const std::filesystem::path& chunk_path, const std::filesystem::path& output_path,
                         const Rgb& color) = 0;
};

} // namespace pagequeue::pipeline
