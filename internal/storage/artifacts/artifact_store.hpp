#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace pagequeue::storage {

/*
  Owns the on-disk layout of every job under one root directory.

      <root>/uploads/<id>.pdoc
      <root>/processing/<id>/chunks/
      <root>/processing/<id>/transformed/
      <root>/outputs/stamped_<id>.pdoc

  Job ids must be a single path component; every accessor validates them
  and throws std::invalid_argument otherwise. Cleanup logs filesystem
  failures instead of throwing them.
*/
class ArtifactStore {
 public:
  explicit ArtifactStore(std::filesystem::path root);

  // Creates the top-level directories.
  void EnsureLayout() const;

  std::filesystem::path UploadPath(const std::string& job_id) const;
  std::filesystem::path WorkDir(const std::string& job_id) const;
  std::filesystem::path ChunkDir(const std::string& job_id) const;
  std::filesystem::path TransformedDir(const std::string& job_id) const;
  std::filesystem::path OutputPath(const std::string& job_id) const;

  // Moves a staged upload to UploadPath(job_id). Falls back to copy when
  // rename crosses filesystems.
  std::filesystem::path AdoptUpload(const std::string& job_id, const std::filesystem::path& staged) const;

  // Removes processing/<id>. Returns the number of entries removed.
  uintmax_t CleanupWorkingFiles(const std::string& job_id) const;

  // Removes the upload, the working directory and the output.
  uintmax_t CleanupArtifacts(const std::string& job_id) const;

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

void ValidateJobId(const std::string& job_id);

} // namespace pagequeue::storage
