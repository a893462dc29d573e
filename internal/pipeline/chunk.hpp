#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

#include "internal/pipeline/palette.hpp"

namespace pagequeue::pipeline {

// Half-open page range [start, end).
struct PageRange {
  size_t start = 0;
  size_t end   = 0;

  size_t size() const {
    return end - start;
  }
};

enum class ChunkStage { kPending, kProcessing, kCompleted, kError };

/*
  One contiguous slice of a job's document.

  Lives only for the duration of one pipeline run. `order` is the merge
  position; `color` is fixed at split time.
*/
struct ChunkRecord {
  size_t    chunk_id = 0;
  size_t    order    = 0;
  PageRange range;

  std::filesystem::path working_path;
  std::filesystem::path output_path;

  ChunkStage stage = ChunkStage::kPending;
  Rgb        color;

  std::optional<std::string> error;
};

} // namespace pagequeue::pipeline
