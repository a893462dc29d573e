#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace pagequeue::pipeline {

struct PagedDocument {
  std::map<std::string, std::string> attributes;
  std::vector<std::string>           pages;
};

/*
  Reads and writes whole documents as ordered page lists.

  Implementations throw util::CorruptDocument for malformed input and
  std::runtime_error for I/O failures.
*/
class DocumentCodec {
 public:
  virtual ~DocumentCodec() = default;

  virtual PagedDocument Read(const std::filesystem::path& path) const = 0;

  virtual void Write(const std::filesystem::path& path, const PagedDocument& document) const = 0;

  std::vector<std::string> ReadPages(const std::filesystem::path& path) const {
    return Read(path).pages;
  }

  void WritePages(const std::filesystem::path& path, std::vector<std::string> pages) const {
    PagedDocument document;
    document.pages = std::move(pages);
    Write(path, document);
  }
};

} // namespace pagequeue::pipeline
