#pragma once

#include <memory>
#include <string>

#include "internal/pipeline/renderer.hpp"

namespace pagequeue::pipeline {
class DocumentCodec;
}

namespace pagequeue::render {

struct StampStyle {
  std::string text     = "WATERMARK";
  double      opacity  = 0.3;
  int         rotation = 45;
};

/*
  Reference renderer: appends one stamp line to every page of a chunk.

      [stamp text=WATERMARK color=red rgb=1.00,0.00,0.00 opacity=0.30 rotation=45]
*/
class StampRenderer final : public pipeline::Renderer {
 public:
  StampRenderer(std::shared_ptr<pipeline::DocumentCodec> codec, StampStyle style);

  void Transform(const std::filesystem::path& chunk_path, const std::filesystem::path& output_path,
                 const pipeline::Rgb& color) override;

  std::string StampLine(const pipeline::Rgb& color) const;

 private:
  std::shared_ptr<pipeline::DocumentCodec> codec_;
  StampStyle                               style_;
};

} // namespace pagequeue::render
