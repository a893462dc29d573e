#include "internal/validation/document_validator.hpp"

#include <cassert>
#include <iostream>

#include "internal/pipeline/paged_text_codec.hpp"
#include "internal/storage/artifacts/artifact_store.hpp"
#include "internal/util/uuid.hpp"
#include "tests/support/fakes.hpp"

namespace {

using pagequeue::pipeline::PagedTextCodec;
using pagequeue::storage::ArtifactStore;
using pagequeue::testing::FakeResourceProbe;
using pagequeue::testing::kGiB;
using pagequeue::testing::kMiB;
using pagequeue::testing::TempDir;
using pagequeue::testing::WriteFile;
using pagequeue::testing::WritePagedDocument;
using pagequeue::validation::DocumentValidator;
using pagequeue::validation::ValidatorLimits;

struct Fixture {
  explicit Fixture(const std::string& name) : dir(name) {
    probe = std::make_shared<FakeResourceProbe>(100 * kGiB, kGiB);

    ValidatorLimits limits;
    limits.ram_safety_margin = 0.5;
    limits.max_file_size     = 300 * kMiB;
    validator                = std::make_unique<DocumentValidator>(std::make_shared<PagedTextCodec>(), probe, limits);
  }

  TempDir                            dir;
  std::shared_ptr<FakeResourceProbe> probe;
  std::unique_ptr<DocumentValidator> validator;
};

void TestSizeAllowanceIsBoundedByRamAndCap() {
  Fixture f("validator_size");

  // min(1GiB * 0.5, 300MiB)
  assert(f.validator->MaxAllowedSize() == 300 * kMiB);
  assert(f.validator->CheckSizeAllowance(300 * kMiB).ok);
  assert(!f.validator->CheckSizeAllowance(300 * kMiB + 1).ok);
  assert(!f.validator->CheckSizeAllowance(0).ok);

  f.probe->SetAvailableMemory(200 * kMiB);
  assert(f.validator->MaxAllowedSize() == 100 * kMiB);
  assert(!f.validator->CheckSizeAllowance(150 * kMiB).ok);

  f.probe->SetAvailableMemory(0);
  auto result = f.validator->CheckSizeAllowance(1);
  assert(!result.ok);
  assert(result.message.find("memory") != std::string::npos);
}

void TestValidDocumentReportsMetadata() {
  Fixture f("validator_valid");
  WritePagedDocument(f.dir.path() / "ok.pdoc", 7, "title=x");

  auto result = f.validator->ValidateStructure(f.dir.path() / "ok.pdoc");
  assert(result.ok);
  assert(result.metadata.page_count == 7);
  assert(result.metadata.file_size == std::filesystem::file_size(f.dir.path() / "ok.pdoc"));
}

void TestStructuralProblemsAreRejected() {
  Fixture f("validator_invalid");
  WriteFile(f.dir.path() / "empty.pdoc", "");
  WritePagedDocument(f.dir.path() / "report.txt", 2);
  WriteFile(f.dir.path() / "corrupt.pdoc", "%PDF-1.4 not ours");
  WritePagedDocument(f.dir.path() / "locked.pdoc", 2, "encrypted=true");
  WritePagedDocument(f.dir.path() / "blank.pdoc", 0);

  assert(!f.validator->ValidateStructure(f.dir.path() / "absent.pdoc").ok);
  assert(!f.validator->ValidateStructure(f.dir.path() / "empty.pdoc").ok);
  assert(!f.validator->ValidateStructure(f.dir.path() / "report.txt").ok);

  auto corrupt = f.validator->ValidateStructure(f.dir.path() / "corrupt.pdoc");
  assert(!corrupt.ok && corrupt.message.find("Corrupted") != std::string::npos);

  auto locked = f.validator->ValidateStructure(f.dir.path() / "locked.pdoc");
  assert(!locked.ok && locked.message.find("Encrypted") != std::string::npos);

  assert(!f.validator->ValidateStructure(f.dir.path() / "blank.pdoc").ok);
}

void TestArtifactLayoutAndCleanup() {
  TempDir       dir("artifact_store");
  ArtifactStore store(dir.path());
  store.EnsureLayout();

  const auto id = pagequeue::util::GenerateJobId();
  assert(id.size() == 36);
  assert(pagequeue::util::ToString(pagequeue::util::FromString(id)) == id);
  assert(pagequeue::util::IsJobId(id));
  assert(!pagequeue::util::IsJobId("../uploads"));
  assert(!pagequeue::util::IsJobId("0123456789abcdef0123456789abcdef0123"));

  assert(store.UploadPath(id) == dir.path() / "uploads" / (id + ".pdoc"));
  assert(store.ChunkDir(id) == dir.path() / "processing" / id / "chunks");
  assert(store.OutputPath(id) == dir.path() / "outputs" / ("stamped_" + id + ".pdoc"));

  WriteFile(dir.path() / "staged.pdoc", "data");
  auto adopted = store.AdoptUpload(id, dir.path() / "staged.pdoc");
  assert(adopted == store.UploadPath(id));
  assert(!std::filesystem::exists(dir.path() / "staged.pdoc"));

  WriteFile(store.ChunkDir(id) / "chunk_0.pdoc", "c");
  WriteFile(store.OutputPath(id), "o");

  assert(store.CleanupWorkingFiles(id) > 0);
  assert(!std::filesystem::exists(store.WorkDir(id)));
  assert(std::filesystem::exists(store.UploadPath(id)));

  store.CleanupArtifacts(id);
  assert(!std::filesystem::exists(store.UploadPath(id)));
  assert(!std::filesystem::exists(store.OutputPath(id)));

  for (const std::string bad : {"", ".", "..", "a/b", "a\\b"}) {
    bool threw = false;
    try {
      store.UploadPath(bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }
}

} // namespace

int main() {
  TestSizeAllowanceIsBoundedByRamAndCap();
  TestValidDocumentReportsMetadata();
  TestStructuralProblemsAreRejected();
  TestArtifactLayoutAndCleanup();

  std::cout << "pagequeue_unit_document_validator: pass\n";
  return 0;
}
