#include "artifact_store.hpp"

#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace pagequeue::storage {

namespace fs = std::filesystem;

namespace {

uintmax_t RemoveQuietly(const fs::path& path, const std::string& job_id) {
  std::error_code ec;
  auto            removed = fs::remove_all(path, ec);
  if (ec) {
    PAGEQUEUE_LOG_WARN("artifact removal failed", {observability::StringField("job_id", job_id),
                                                   observability::StringField("path", path.string()),
                                                   observability::StringField("error", ec.message())});
    return 0;
  }
  return removed == static_cast<uintmax_t>(-1) ? 0 : removed;
}

} // namespace

void ValidateJobId(const std::string& job_id) {
  if (job_id.empty()) {
    throw std::invalid_argument("job id must not be empty");
  }
  for (char c : job_id) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument("job id contains invalid character");
    }
  }
  if (job_id == "." || job_id == "..") {
    throw std::invalid_argument("job id must not be a relative path component");
  }
}

ArtifactStore::ArtifactStore(fs::path root) : root_(std::move(root)) {
}

void ArtifactStore::EnsureLayout() const {
  fs::create_directories(root_ / "uploads");
  fs::create_directories(root_ / "processing");
  fs::create_directories(root_ / "outputs");
}

fs::path ArtifactStore::UploadPath(const std::string& job_id) const {
  ValidateJobId(job_id);
  return root_ / "uploads" / (job_id + ".pdoc");
}

fs::path ArtifactStore::WorkDir(const std::string& job_id) const {
  ValidateJobId(job_id);
  return root_ / "processing" / job_id;
}

fs::path ArtifactStore::ChunkDir(const std::string& job_id) const {
  return WorkDir(job_id) / "chunks";
}

fs::path ArtifactStore::TransformedDir(const std::string& job_id) const {
  return WorkDir(job_id) / "transformed";
}

fs::path ArtifactStore::OutputPath(const std::string& job_id) const {
  ValidateJobId(job_id);
  return root_ / "outputs" / ("stamped_" + job_id + ".pdoc");
}

fs::path ArtifactStore::AdoptUpload(const std::string& job_id, const fs::path& staged) const {
  auto target = UploadPath(job_id);
  fs::create_directories(target.parent_path());

  std::error_code ec;
  fs::rename(staged, target, ec);
  if (!ec) {
    return target;
  }

  // EXDEV and friends
  fs::copy_file(staged, target, fs::copy_options::overwrite_existing);
  fs::remove(staged, ec);
  return target;
}

uintmax_t ArtifactStore::CleanupWorkingFiles(const std::string& job_id) const {
  return RemoveQuietly(WorkDir(job_id), job_id);
}

uintmax_t ArtifactStore::CleanupArtifacts(const std::string& job_id) const {
  uintmax_t removed = 0;
  removed += RemoveQuietly(UploadPath(job_id), job_id);
  removed += RemoveQuietly(WorkDir(job_id), job_id);
  removed += RemoveQuietly(OutputPath(job_id), job_id);
  return removed;
}

} // namespace pagequeue::storage
