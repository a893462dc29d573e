#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/pipeline/chunk.hpp"

namespace pagequeue::storage {
class ArtifactStore;
}

namespace pagequeue::pipeline {

class DocumentCodec;
class Renderer;
class WorkerPool;

// (stage, progress, message); progress unset lets the tracker pick it.
using ProgressCallback = std::function<void(const std::string& stage, std::optional<int> progress, const std::string& message)>;

struct RunResult {
  bool        ok = false;
  std::string result_path;
  std::string error;
};

/*
  Split -> parallel transform -> ordered merge, for one job at a time.

  Working files live under the artifact store's processing/<id>/; the
  merged result is written to its output path. Run() makes exactly one
  attempt and never throws; the caller removes working files.
*/
class ChunkedPipeline {
 public:
  ChunkedPipeline(std::shared_ptr<DocumentCodec> codec, std::shared_ptr<Renderer> renderer,
                  std::shared_ptr<storage::ArtifactStore> artifacts, std::shared_ptr<WorkerPool> pool);

  RunResult Run(const std::string& job_id, const std::filesystem::path& source, size_t chunk_size,
                const ProgressCallback& progress);

  // Phases; each throws util::PipelineError.
  std::vector<ChunkRecord> Split(const std::string& job_id, const std::filesystem::path& source, size_t chunk_size);
  void                     TransformAll(std::vector<ChunkRecord>& chunks);
  std::filesystem::path    Merge(const std::string& job_id, const std::vector<ChunkRecord>& chunks,
                                 const ProgressCallback& progress);

 private:
  std::shared_ptr<DocumentCodec>          codec_;
  std::shared_ptr<Renderer>               renderer_;
  std::shared_ptr<storage::ArtifactStore> artifacts_;
  std::shared_ptr<WorkerPool>             pool_;
};

// Contiguous ranges of min(chunk_size, page_count) pages covering [0, page_count).
std::vector<PageRange> PartitionPages(size_t page_count, size_t chunk_size);

} // namespace pagequeue::pipeline
