#pragma once

#include <filesystem>

#include "internal/db/api/ledger_store.hpp"

namespace pagequeue::db::json {

/*
  Ledger snapshot as a single JSON document keyed by job id.

  The document is pagequeue.v1.JobLedger printed by protobuf's JSON
  printer. Writes go to "<path>.tmp" and are renamed into place.
*/
class JsonLedgerStore final : public LedgerStore {
 public:
  explicit JsonLedgerStore(std::filesystem::path path);

  Result Load(std::vector<model::JobRecord>* records) override;

  Result Save(const std::vector<model::JobRecord>& records) override;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

} // namespace pagequeue::db::json
