#pragma once

#include <mutex>

#include "internal/db/api/ledger_store.hpp"

namespace pagequeue::db::memory {

/*
  Process-local ledger store.

  Used by tests and by ephemeral runs that do not need restart
  durability. FailSaves() makes every later Save() report an IOError.
*/
class MemoryLedgerStore final : public LedgerStore {
 public:
  MemoryLedgerStore() = default;
  explicit MemoryLedgerStore(std::vector<model::JobRecord> seed);

  Result Load(std::vector<model::JobRecord>* records) override;

  Result Save(const std::vector<model::JobRecord>& records) override;

  void FailSaves(bool fail);

  std::vector<model::JobRecord> Snapshot() const;
  size_t                        SaveCount() const;

 private:
  mutable std::mutex            mutex_;
  std::vector<model::JobRecord> records_;
  size_t                        save_count_ = 0;
  bool                          fail_saves_ = false;
};

} // namespace pagequeue::db::memory
