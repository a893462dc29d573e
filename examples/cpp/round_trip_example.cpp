#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/dispatcher.hpp"
#include "internal/service/job_service.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
  // Scratch root for the embedded instance; pass a directory to keep the output.
  const fs::path root = argc > 1 ? fs::path(argv[1]) : fs::temp_directory_path() / "pagequeue_round_trip";

  pagequeue::runtime::config::RuntimeConfig config;
  config.mutable_storage()->set_temp_dir((root / "work").string());
  config.mutable_pipeline()->set_default_chunk_size(2);
  config.mutable_pipeline()->set_stamp_text("CONFIDENTIAL");
  pagequeue::config::ApplyDefaults(config);
  pagequeue::config::ValidateConfig(config);

  auto app = pagequeue::factory::Build(config);

  // Write a five page document into a staging area the service can adopt.
  const auto staged = root / "staging" / "round_trip.pdoc";
  fs::create_directories(staged.parent_path());
  {
    std::ofstream out(staged, std::ios::binary | std::ios::trunc);
    out << "%PAGEDOC-1.0 title=round-trip\n";
    for (int i = 1; i <= 5; ++i) {
      out << "Page " << i << " of the round trip example\f";
    }
  }

  auto submitted = app.service->Submit("example", staged, 0);
  if (submitted.code != pagequeue::service::SubmitCode::kAccepted) {
    std::cerr << "Submit failed: " << submitted.message << '\n';
    return 1;
  }
  std::cout << "Queued job " << submitted.job_id << " at position " << submitted.queue_position << '\n';

  // Drive the scheduler by hand instead of starting its thread.
  if (!app.dispatcher->RunOnce()) {
    std::cerr << "Nothing was dispatched\n";
    return 1;
  }

  auto view = app.service->GetStatus(submitted.job_id);
  std::cout << "Status: " << view.status->status << " (" << view.status->progress << "%)\n";

  auto download = app.service->Download(submitted.job_id);
  if (download.code != pagequeue::service::DownloadCode::kReady) {
    std::cerr << "Download failed: " << download.message << '\n';
    return 1;
  }

  const auto kept = root / "stamped_round_trip.pdoc";
  fs::copy_file(download.path, kept, fs::copy_options::overwrite_existing);
  std::cout << "Stamped document written to " << kept << '\n';

  // Reclaim the job now instead of waiting for the sweeper.
  if (!app.service->Release(submitted.job_id)) {
    std::cerr << "Release failed: job already reclaimed\n";
    return 1;
  }
  app.Stop();
  return 0;
}
