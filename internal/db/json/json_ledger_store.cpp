#include "json_ledger_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

#include "api/pagequeue/v1/ledger.pb.h"

namespace pagequeue::db::json {

namespace {

namespace v1 = pagequeue::v1;
using model::LifecycleState;

v1::LifecycleState ToProto(LifecycleState state) {
  switch (state) {
    case LifecycleState::kQueued:
      return v1::LIFECYCLE_STATE_QUEUED;
    case LifecycleState::kProcessing:
      return v1::LIFECYCLE_STATE_PROCESSING;
    case LifecycleState::kFinished:
      return v1::LIFECYCLE_STATE_FINISHED;
    case LifecycleState::kDownloaded:
      return v1::LIFECYCLE_STATE_DOWNLOADED;
    case LifecycleState::kError:
      return v1::LIFECYCLE_STATE_ERROR;
  }
  return v1::LIFECYCLE_STATE_UNSPECIFIED;
}

std::optional<LifecycleState> FromProto(v1::LifecycleState state) {
  switch (state) {
    case v1::LIFECYCLE_STATE_QUEUED:
      return LifecycleState::kQueued;
    case v1::LIFECYCLE_STATE_PROCESSING:
      return LifecycleState::kProcessing;
    case v1::LIFECYCLE_STATE_FINISHED:
      return LifecycleState::kFinished;
    case v1::LIFECYCLE_STATE_DOWNLOADED:
      return LifecycleState::kDownloaded;
    case v1::LIFECYCLE_STATE_ERROR:
      return LifecycleState::kError;
    default:
      return std::nullopt;
  }
}

void SetOptionalTime(const std::optional<util::TimePoint>& tp, google::protobuf::Timestamp* out) {
  if (tp) {
    *out = util::ToProto(*tp);
  }
}

v1::JobRecord ToProto(const model::JobRecord& record) {
  v1::JobRecord out;
  out.set_job_id(record.job_id);
  out.set_owner_id(record.owner_id);
  out.set_source_path(record.source_path);
  out.set_declared_size(record.declared_size);
  out.set_chunk_size(record.chunk_size);
  out.set_lifecycle_state(ToProto(record.state));
  *out.mutable_queued_at() = util::ToProto(record.queued_at);

  if (record.started_at) SetOptionalTime(record.started_at, out.mutable_started_at());
  if (record.finished_at) SetOptionalTime(record.finished_at, out.mutable_finished_at());
  if (record.downloaded_at) SetOptionalTime(record.downloaded_at, out.mutable_downloaded_at());
  if (record.download_window_expires) SetOptionalTime(record.download_window_expires, out.mutable_download_window_expires());

  if (record.last_error) out.set_last_error(*record.last_error);
  out.set_admission_seq(record.admission_seq);
  return out;
}

std::optional<model::JobRecord> FromProto(const std::string& key, const v1::JobRecord& in) {
  auto state = FromProto(in.lifecycle_state());
  if (!state) {
    return std::nullopt;
  }

  model::JobRecord record;
  record.job_id        = in.job_id().empty() ? key : in.job_id();
  record.owner_id      = in.owner_id();
  record.source_path   = in.source_path();
  record.declared_size = in.declared_size();
  record.chunk_size    = in.chunk_size();
  record.state         = *state;
  record.queued_at     = util::FromProto(in.queued_at());

  if (in.has_started_at()) record.started_at = util::FromProto(in.started_at());
  if (in.has_finished_at()) record.finished_at = util::FromProto(in.finished_at());
  if (in.has_downloaded_at()) record.downloaded_at = util::FromProto(in.downloaded_at());
  if (in.has_download_window_expires()) record.download_window_expires = util::FromProto(in.download_window_expires());

  if (!in.last_error().empty()) record.last_error = in.last_error();
  record.admission_seq = in.admission_seq();
  return record;
}

} // namespace

JsonLedgerStore::JsonLedgerStore(std::filesystem::path path) : path_(std::move(path)) {
}

Result JsonLedgerStore::Load(std::vector<model::JobRecord>* records) {
  records->clear();

  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return Result::Ok();
  }

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    return Result::Err(ErrorCode::IOError, "cannot open ledger " + path_.string());
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result::Err(ErrorCode::IOError, "cannot read ledger " + path_.string());
  }

  v1::JobLedger ledger;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &ledger, options);
  if (!status.ok()) {
    return Result::Err(ErrorCode::Corruption, "unparsable ledger: " + std::string(status.message()));
  }

  records->reserve(static_cast<size_t>(ledger.jobs_size()));
  for (const auto& [key, value] : ledger.jobs()) {
    auto record = FromProto(key, value);
    if (!record) {
      records->clear();
      return Result::Err(ErrorCode::Corruption, "ledger entry " + key + " has no lifecycle state");
    }
    records->push_back(std::move(*record));
  }

  return Result::Ok();
}

/*
  Atomic write:
      tmp → flush → rename
*/
Result JsonLedgerStore::Save(const std::vector<model::JobRecord>& records) {
  v1::JobLedger ledger;
  for (const auto& record : records) {
    (*ledger.mutable_jobs())[record.job_id] = ToProto(record);
  }

  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(ledger, &json, options);
  if (!status.ok()) {
    return Result::Err(ErrorCode::InternalError, "ledger serialization failed: " + std::string(status.message()));
  }

  std::error_code ec;
  if (path_.has_parent_path()) {
    std::filesystem::create_directories(path_.parent_path(), ec);
    if (ec) {
      return Result::Err(ErrorCode::IOError, "cannot create ledger directory: " + ec.message());
    }
  }

  const auto tmp_path = std::filesystem::path(path_.string() + ".tmp");
  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Result::Err(ErrorCode::IOError, "cannot open " + tmp_path.string());
    }
    out << json;
    out.flush();
    if (!out) {
      return Result::Err(ErrorCode::IOError, "short write to " + tmp_path.string());
    }
  }

  std::filesystem::rename(tmp_path, path_, ec);
  if (ec) {
    std::filesystem::remove(tmp_path, ec);
    return Result::Err(ErrorCode::IOError, "cannot replace ledger " + path_.string());
  }

  return Result::Ok();
}

} // namespace pagequeue::db::json
