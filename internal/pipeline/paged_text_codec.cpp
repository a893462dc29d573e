#include "paged_text_codec.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace pagequeue::pipeline {

namespace {

bool IsBlank(std::string_view text) {
  return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

void ParseAttributes(std::string_view line, PagedDocument* document) {
  std::istringstream tokens{std::string(line)};
  std::string        token;
  while (tokens >> token) {
    const auto eq = token.find('=');
    if (eq == std::string::npos || eq == 0) {
      throw util::CorruptDocument("malformed header attribute: " + token);
    }
    document->attributes[token.substr(0, eq)] = token.substr(eq + 1);
  }
}

} // namespace

PagedDocument PagedTextCodec::Parse(std::string_view text) {
  const auto newline = text.find('\n');
  const auto header  = text.substr(0, newline);

  if (header.substr(0, kMagic.size()) != kMagic) {
    throw util::CorruptDocument("missing %PAGEDOC header");
  }
  if (header.size() > kMagic.size() && header[kMagic.size()] != ' ' && header[kMagic.size()] != '\r') {
    throw util::CorruptDocument("unsupported document version");
  }

  PagedDocument document;
  ParseAttributes(header.substr(kMagic.size()), &document);

  if (newline == std::string_view::npos) {
    return document;
  }

  auto body = text.substr(newline + 1);
  while (!body.empty()) {
    const auto brk = body.find(kPageBreak);
    if (brk == std::string_view::npos) {
      if (!IsBlank(body)) {
        throw util::CorruptDocument("unterminated page " + std::to_string(document.pages.size()));
      }
      break;
    }
    document.pages.emplace_back(body.substr(0, brk));
    body.remove_prefix(brk + 1);
  }
  return document;
}

std::string PagedTextCodec::Serialize(const PagedDocument& document) {
  std::string out(kMagic);
  for (const auto& [key, value] : document.attributes) {
    out += ' ';
    out += key;
    out += '=';
    out += value;
  }
  out += '\n';

  for (const auto& page : document.pages) {
    out += page;
    out += kPageBreak;
  }
  return out;
}

PagedDocument PagedTextCodec::Read(const std::filesystem::path& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("cannot open " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return Parse(buffer.str());
}

void PagedTextCodec::Write(const std::filesystem::path& path, const PagedDocument& document) const {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("cannot create " + path.string());
  }
  out << Serialize(document);
  out.flush();
  if (!out) {
    throw std::runtime_error("short write to " + path.string());
  }
}

} // namespace pagequeue::pipeline
