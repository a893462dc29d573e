#include "stamp_renderer.hpp"

#include <iomanip>
#include <sstream>

#include "internal/pipeline/document_codec.hpp"

namespace pagequeue::render {

StampRenderer::StampRenderer(std::shared_ptr<pipeline::DocumentCodec> codec, StampStyle style)
    : codec_(std::move(codec)), style_(std::move(style)) {
}

std::string StampRenderer::StampLine(const pipeline::Rgb& color) const {
  std::ostringstream line;
  line << std::fixed << std::setprecision(2);
  line << "[stamp text=" << style_.text << " color=" << color.name << " rgb=" << color.r << ',' << color.g << ','
       << color.b << " opacity=" << style_.opacity << " rotation=" << style_.rotation << ']';
  return line.str();
}

void StampRenderer::Transform(const std::filesystem::path& chunk_path, const std::filesystem::path& output_path,
                              const pipeline::Rgb& color) {
  auto document = codec_->Read(chunk_path);

  const auto stamp = StampLine(color);
  for (auto& page : document.pages) {
    if (!page.empty() && page.back() != '\n') {
      page += '\n';
    }
    page += stamp;
    page += '\n';
  }

  codec_->Write(output_path, document);
}

} // namespace pagequeue::render
