#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/dispatcher.hpp"
#include "internal/service/job_service.hpp"
#include "internal/storage/artifacts/artifact_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace fs = std::filesystem;

using pagequeue::observability::StringField;
using pagequeue::service::DownloadCode;
using pagequeue::service::SubmitCode;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

struct Options {
  std::string              config_path;
  std::string              owner      = "cli";
  uint32_t                 chunk_size = 0;
  fs::path                 out_dir    = ".";
  std::vector<std::string> inputs;
};

void Usage() {
  std::cerr << "Usage: pagequeue --config <config.yaml> [--owner <id>] [--chunk-size <n>] [--out <dir>] <document.pdoc>...\n";
}

bool ParseArgs(int argc, char** argv, Options* options) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    auto              value = [&]() -> const char* { return i + 1 < argc ? argv[++i] : nullptr; };

    if (arg == "--config") {
      const char* v = value();
      if (!v) return false;
      options->config_path = v;
    } else if (arg == "--owner") {
      const char* v = value();
      if (!v) return false;
      options->owner = v;
    } else if (arg == "--chunk-size") {
      const char* v = value();
      if (!v) return false;
      try {
        options->chunk_size = static_cast<uint32_t>(std::stoul(v));
      } catch (const std::exception&) {
        std::cerr << "invalid --chunk-size: " << v << "\n";
        return false;
      }
    } else if (arg == "--out") {
      const char* v = value();
      if (!v) return false;
      options->out_dir = v;
    } else if (!arg.empty() && arg[0] == '-') {
      std::cerr << "unknown option: " << arg << "\n";
      return false;
    } else {
      options->inputs.push_back(arg);
    }
  }
  return !options->config_path.empty() && !options->inputs.empty();
}

struct PendingJob {
  std::string job_id;
  fs::path    input;
};

} // namespace

int main(int argc, char** argv) {
  Options options;
  if (!ParseArgs(argc, argv, &options)) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = pagequeue::config::ConfigLoader::LoadFromYaml(options.config_path);
    pagequeue::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = pagequeue::factory::Build(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.Start();
    PAGEQUEUE_LOG_INFO("pagequeue started", {StringField("temp_dir", config.storage().temp_dir())});

    // ------------------------------------------------------------
    // Submit
    // ------------------------------------------------------------
    bool                    failed = false;
    std::vector<PendingJob> pending;

    const auto staging = app.artifacts->root() / "staging";
    fs::create_directories(staging);
    fs::create_directories(options.out_dir);

    for (const auto& input : options.inputs) {
      const fs::path source(input);
      const auto     staged = staging / (pagequeue::util::GenerateJobId() + source.extension().string());

      std::error_code ec;
      fs::copy_file(source, staged, fs::copy_options::overwrite_existing, ec);
      if (ec) {
        std::cerr << input << ": cannot read: " << ec.message() << "\n";
        failed = true;
        continue;
      }

      auto submitted = app.service->Submit(options.owner, staged, options.chunk_size);
      if (submitted.code != SubmitCode::kAccepted) {
        fs::remove(staged, ec);
        std::cerr << input << ": " << submitted.message;
        if (submitted.code == SubmitCode::kRejected) {
          std::cerr << " (retry in " << submitted.retry_after_seconds << "s)";
        }
        std::cerr << "\n";
        failed = true;
        continue;
      }

      std::cout << input << ": queued as " << submitted.job_id << " at position " << submitted.queue_position << "\n";
      pending.push_back({submitted.job_id, source});
    }
    app.dispatcher->Notify();

    // ------------------------------------------------------------
    // Collect results
    // ------------------------------------------------------------
    while (g_running && !pending.empty()) {
      for (auto it = pending.begin(); it != pending.end();) {
        auto view = app.service->GetStatus(it->job_id);

        if (view.lifecycle == pagequeue::model::LifecycleState::kFinished) {
          auto download = app.service->Download(it->job_id);
          if (download.code == DownloadCode::kReady) {
            const auto target = options.out_dir / ("stamped_" + it->input.filename().string());
            fs::copy_file(download.path, target, fs::copy_options::overwrite_existing);
            if (!app.service->Release(it->job_id)) {
              PAGEQUEUE_LOG_WARN("job already reclaimed", {StringField("job_id", it->job_id)});
            }
            std::cout << it->input.string() << ": " << target.string() << "\n";
          } else {
            std::cerr << it->input.string() << ": " << download.message << "\n";
            failed = true;
          }
          it = pending.erase(it);
        } else if (view.lifecycle == pagequeue::model::LifecycleState::kError || view.expired) {
          const auto message = view.status && view.status->error ? *view.status->error : std::string("job failed");
          std::cerr << it->input.string() << ": " << message << "\n";
          failed = true;
          it = pending.erase(it);
        } else {
          ++it;
        }
      }

      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (!pending.empty()) {
      PAGEQUEUE_LOG_WARN("interrupted with jobs outstanding", {pagequeue::observability::IntField("jobs", static_cast<int64_t>(pending.size()))});
      failed = true;
    }

    PAGEQUEUE_LOG_INFO("Shutting down pagequeue");
    app.Stop();
    pagequeue::observability::ShutdownLogging();
    return failed ? 3 : 0;
  } catch (const std::exception& e) {
    PAGEQUEUE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    pagequeue::observability::ShutdownLogging();
    return 2;
  }
}
