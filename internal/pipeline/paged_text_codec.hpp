#pragma once

#include <string_view>

#include "internal/pipeline/document_codec.hpp"

namespace pagequeue::pipeline {

/*
  Paged text documents (.pdoc).

      %PAGEDOC-1.0[ key=value ...]\n
      <page 0>\f<page 1>\f...<page N-1>\f

  Every page is terminated by a form feed. Whitespace after the last
  terminator is ignored; anything else there is an unterminated page.
*/
class PagedTextCodec final : public DocumentCodec {
 public:
  static constexpr std::string_view kMagic     = "%PAGEDOC-1.0";
  static constexpr char             kPageBreak = '\f';

  PagedDocument Read(const std::filesystem::path& path) const override;

  void Write(const std::filesystem::path& path, const PagedDocument& document) const override;

  static PagedDocument Parse(std::string_view text);
  static std::string   Serialize(const PagedDocument& document);
};

} // namespace pagequeue::pipeline
