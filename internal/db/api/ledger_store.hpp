#pragma once

#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/model/job_record.hpp"

namespace pagequeue::db {

/*
  Durable snapshot of the queue ledger.

  GUARANTEES:
  - Save() replaces the whole snapshot; a reader never observes a
    partially written document.
  - Load() of a store that was never written succeeds with no records.
  - Neither call throws; failures are reported through Result.

  The in-memory ledger held by the queue stays authoritative for the life
  of the process; the snapshot only matters across restarts.
*/

class LedgerStore {
 public:
  virtual ~LedgerStore() = default;

  virtual Result Load(std::vector<model::JobRecord>* records) = 0;

  virtual Result Save(const std::vector<model::JobRecord>& records) = 0;
};

} // namespace pagequeue::db
