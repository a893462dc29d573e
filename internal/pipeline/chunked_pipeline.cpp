#include "chunked_pipeline.hpp"

#include <algorithm>
#include <future>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/pipeline/document_codec.hpp"
#include "internal/pipeline/renderer.hpp"
#include "internal/pipeline/worker_pool.hpp"
#include "internal/status/status_tracker.hpp"
#include "internal/storage/artifacts/artifact_store.hpp"
#include "internal/util/errors.hpp"

namespace pagequeue::pipeline {

namespace fs = std::filesystem;

using observability::IntField;
using observability::StringField;

namespace {

constexpr int kMergeStart = 80;
constexpr int kMergeEnd   = 95;

std::string ChunkFileName(size_t order) {
  return "chunk_" + std::to_string(order) + ".pdoc";
}

void Report(const ProgressCallback& progress, const std::string& stage, std::optional<int> value,
            const std::string& message) {
  if (progress) progress(stage, value, message);
}

} // namespace

std::vector<PageRange> PartitionPages(size_t page_count, size_t chunk_size) {
  std::vector<PageRange> ranges;
  if (page_count == 0 || chunk_size == 0) return ranges;

  const size_t effective = std::min(chunk_size, page_count);
  for (size_t start = 0; start < page_count; start += effective) {
    ranges.push_back({start, std::min(start + effective, page_count)});
  }
  return ranges;
}

ChunkedPipeline::ChunkedPipeline(std::shared_ptr<DocumentCodec> codec, std::shared_ptr<Renderer> renderer,
                                 std::shared_ptr<storage::ArtifactStore> artifacts, std::shared_ptr<WorkerPool> pool)
    : codec_(std::move(codec)), renderer_(std::move(renderer)), artifacts_(std::move(artifacts)), pool_(std::move(pool)) {
}

// ---------------------------------------------------------------------------
// Split
// ---------------------------------------------------------------------------

std::vector<ChunkRecord> ChunkedPipeline::Split(const std::string& job_id, const fs::path& source, size_t chunk_size) {
  if (chunk_size == 0) {
    throw util::PipelineError("chunk size must be positive");
  }

  std::vector<std::string> pages;
  try {
    pages = codec_->ReadPages(source);
  } catch (const std::exception& e) {
    throw util::PipelineError(std::string("split failed: ") + e.what());
  }
  if (pages.empty()) {
    throw util::PipelineError("split failed: document has no pages");
  }

  const auto chunk_dir  = artifacts_->ChunkDir(job_id);
  const auto output_dir = artifacts_->TransformedDir(job_id);
  fs::create_directories(chunk_dir);
  fs::create_directories(output_dir);

  const auto               ranges = PartitionPages(pages.size(), chunk_size);
  std::vector<ChunkRecord> chunks;
  chunks.reserve(ranges.size());

  for (size_t i = 0; i < ranges.size(); ++i) {
    ChunkRecord chunk;
    chunk.chunk_id     = i;
    chunk.order        = i;
    chunk.range        = ranges[i];
    chunk.working_path = chunk_dir / ChunkFileName(i);
    chunk.output_path  = output_dir / ChunkFileName(i);
    chunk.color        = ColorForChunk(i);

    std::vector<std::string> slice(pages.begin() + static_cast<std::ptrdiff_t>(chunk.range.start),
                                   pages.begin() + static_cast<std::ptrdiff_t>(chunk.range.end));
    try {
      codec_->WritePages(chunk.working_path, std::move(slice));
    } catch (const std::exception& e) {
      throw util::PipelineError(std::string("split failed: ") + e.what());
    }
    chunks.push_back(std::move(chunk));
  }

  PAGEQUEUE_LOG_DEBUG("document split", {StringField("job_id", job_id), IntField("pages", static_cast<int64_t>(pages.size())),
                                         IntField("chunks", static_cast<int64_t>(chunks.size()))});
  return chunks;
}

// ---------------------------------------------------------------------------
// Transform
// ---------------------------------------------------------------------------

void ChunkedPipeline::TransformAll(std::vector<ChunkRecord>& chunks) {
  std::mutex                 error_mutex;
  std::optional<std::string> first_error;

  std::vector<std::future<void>> pending;
  pending.reserve(chunks.size());

  auto settle = [&pending] {
    for (auto& future : pending) {
      future.get();
    }
  };

  for (auto& chunk : chunks) {
    std::future<void> submitted;
    try {
      submitted = pool_->Submit([&, chunk_ptr = &chunk] {
        chunk_ptr->stage = ChunkStage::kProcessing;
        try {
          renderer_->Transform(chunk_ptr->working_path, chunk_ptr->output_path, chunk_ptr->color);
          chunk_ptr->stage = ChunkStage::kCompleted;
        } catch (const std::exception& e) {
          chunk_ptr->stage = ChunkStage::kError;
          chunk_ptr->error = e.what();

          std::lock_guard lock(error_mutex);
          if (!first_error) {
            first_error = "chunk " + std::to_string(chunk_ptr->order) + ": " + e.what();
          }
        }
      });
    } catch (const std::exception& e) {
      // tasks already queued still reference this frame
      settle();
      throw util::PipelineError(std::string("transform failed: ") + e.what());
    }
    pending.push_back(std::move(submitted));
  }

  // every chunk settles before the outcome is decided
  settle();

  std::sort(chunks.begin(), chunks.end(), [](const ChunkRecord& a, const ChunkRecord& b) { return a.order < b.order; });

  if (first_error) {
    throw util::PipelineError("transform failed: " + *first_error);
  }
}

// ---------------------------------------------------------------------------
// Merge
// ---------------------------------------------------------------------------

fs::path ChunkedPipeline::Merge(const std::string& job_id, const std::vector<ChunkRecord>& chunks,
                                const ProgressCallback& progress) {
  std::vector<std::string> merged;

  for (size_t i = 0; i < chunks.size(); ++i) {
    const auto& chunk = chunks[i];
    if (!fs::exists(chunk.output_path)) {
      throw util::PipelineError("merge failed: missing output for chunk " + std::to_string(chunk.order));
    }

    std::vector<std::string> pages;
    try {
      pages = codec_->ReadPages(chunk.output_path);
    } catch (const std::exception& e) {
      throw util::PipelineError(std::string("merge failed: ") + e.what());
    }
    merged.insert(merged.end(), std::make_move_iterator(pages.begin()), std::make_move_iterator(pages.end()));

    if (chunks.size() > 1) {
      const int value = kMergeStart + static_cast<int>((kMergeEnd - kMergeStart) * (i + 1) / chunks.size());
      Report(progress, status::kMerging, value,
             "Merged chunk " + std::to_string(i + 1) + " of " + std::to_string(chunks.size()));
    }
  }

  Report(progress, status::kMerging, kMergeEnd, "Writing result");

  const auto output = artifacts_->OutputPath(job_id);
  fs::create_directories(output.parent_path());
  try {
    codec_->WritePages(output, std::move(merged));
  } catch (const std::exception& e) {
    throw util::PipelineError(std::string("merge failed: ") + e.what());
  }

  Report(progress, status::kMerging, 100, "Merge complete");
  return output;
}

// ---------------------------------------------------------------------------
// Run
// ---------------------------------------------------------------------------

RunResult ChunkedPipeline::Run(const std::string& job_id, const fs::path& source, size_t chunk_size,
                               const ProgressCallback& progress) {
  RunResult result;
  try {
    Report(progress, status::kSplitting, std::nullopt, "Splitting document");
    auto chunks = Split(job_id, source, chunk_size);

    Report(progress, status::kTransforming, std::nullopt,
           "Transforming " + std::to_string(chunks.size()) + " chunks");
    TransformAll(chunks);

    Report(progress, status::kMerging, kMergeStart, "Merging chunks");
    auto output = Merge(job_id, chunks, progress);

    Report(progress, status::kFinished, 100, "Processing complete");
    result.ok          = true;
    result.result_path = output.string();
  } catch (const std::exception& e) {
    PAGEQUEUE_LOG_ERROR("pipeline failed", {StringField("job_id", job_id), StringField("error", e.what())});
    result.ok    = false;
    result.error = e.what();
  }
  return result;
}

} // namespace pagequeue::pipeline
