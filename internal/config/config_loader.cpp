#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace pagequeue::config {

namespace {

constexpr uint64_t kMiB = 1024ull * 1024ull;

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

pagequeue::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  pagequeue::runtime::config::RuntimeConfig config;

  // An empty document means "all defaults".
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  try {
    ValidateConfig(config);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error("Invalid configuration: " + std::string(e.what()));
  }

  return config;
}

void ApplyDefaults(pagequeue::runtime::config::RuntimeConfig& config) {
  auto* storage = config.mutable_storage();
  if (storage->temp_dir().empty()) storage->set_temp_dir("temp_files");
  if (storage->ledger_path().empty()) {
    storage->set_ledger_path((std::filesystem::path(storage->temp_dir()) / "queue.json").string());
  }

  auto* admission = config.mutable_admission();
  if (admission->disk_safety_buffer_bytes() == 0) admission->set_disk_safety_buffer_bytes(150 * kMiB);
  if (admission->min_free_ram_bytes() == 0) admission->set_min_free_ram_bytes(100 * kMiB);
  if (admission->ram_multiplier() == 0) admission->set_ram_multiplier(2.5);
  if (admission->disk_multiplier() == 0) admission->set_disk_multiplier(3.0);
  if (admission->ram_buffer_bytes() == 0) admission->set_ram_buffer_bytes(300 * kMiB);
  if (admission->disk_buffer_bytes() == 0) admission->set_disk_buffer_bytes(150 * kMiB);
  if (admission->cgroup_root().empty()) admission->set_cgroup_root("/sys/fs/cgroup");
  if (admission->proc_root().empty()) admission->set_proc_root("/proc");
  if (admission->history_window() == 0) admission->set_history_window(10);
  if (admission->default_processing_seconds() == 0) admission->set_default_processing_seconds(120);
  if (admission->ram_safety_margin() == 0) admission->set_ram_safety_margin(0.7);
  if (admission->max_file_size_bytes() == 0) admission->set_max_file_size_bytes(500 * kMiB);

  auto* scheduler = config.mutable_scheduler();
  if (scheduler->poll_interval_ms() == 0) scheduler->set_poll_interval_ms(2000);
  if (scheduler->sweep_interval_seconds() == 0) scheduler->set_sweep_interval_seconds(30);
  if (scheduler->download_window_seconds() == 0) scheduler->set_download_window_seconds(60);
  if (scheduler->error_retention_seconds() == 0) scheduler->set_error_retention_seconds(3600);
  if (scheduler->status_retention_seconds() == 0) scheduler->set_status_retention_seconds(3600);

  auto* pipeline = config.mutable_pipeline();
  if (pipeline->max_parallel_workers() == 0) pipeline->set_max_parallel_workers(4);
  if (pipeline->default_chunk_size() == 0) pipeline->set_default_chunk_size(10);
  if (pipeline->stamp_text().empty()) pipeline->set_stamp_text("WATERMARK");
  if (pipeline->stamp_opacity() == 0) pipeline->set_stamp_opacity(0.3);
  if (pipeline->stamp_rotation() == 0) pipeline->set_stamp_rotation(45);
}

void ValidateConfig(const pagequeue::runtime::config::RuntimeConfig& config) {
  const auto& admission = config.admission();
  if (admission.ram_multiplier() <= 0 || admission.disk_multiplier() <= 0) {
    throw std::invalid_argument("admission multipliers must be positive");
  }
  if (admission.ram_safety_margin() <= 0 || admission.ram_safety_margin() > 1) {
    throw std::invalid_argument("admission.ram_safety_margin must be in (0, 1]");
  }
  if (config.pipeline().max_parallel_workers() == 0) {
    throw std::invalid_argument("pipeline.max_parallel_workers must be at least 1");
  }
  if (config.pipeline().stamp_opacity() < 0 || config.pipeline().stamp_opacity() > 1) {
    throw std::invalid_argument("pipeline.stamp_opacity must be in [0, 1]");
  }
  if (config.storage().temp_dir().empty()) {
    throw std::invalid_argument("storage.temp_dir must not be empty");
  }
}

} // namespace pagequeue::config
