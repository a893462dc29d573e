#include "memory_ledger_store.hpp"

namespace pagequeue::db::memory {

MemoryLedgerStore::MemoryLedgerStore(std::vector<model::JobRecord> seed) : records_(std::move(seed)) {
}

Result MemoryLedgerStore::Load(std::vector<model::JobRecord>* records) {
  std::lock_guard lock(mutex_);
  *records = records_;
  return Result::Ok();
}

Result MemoryLedgerStore::Save(const std::vector<model::JobRecord>& records) {
  std::lock_guard lock(mutex_);
  if (fail_saves_) {
    return Result::Err(ErrorCode::IOError, "memory store configured to fail");
  }
  records_ = records;
  ++save_count_;
  return Result::Ok();
}

void MemoryLedgerStore::FailSaves(bool fail) {
  std::lock_guard lock(mutex_);
  fail_saves_ = fail;
}

std::vector<model::JobRecord> MemoryLedgerStore::Snapshot() const {
  std::lock_guard lock(mutex_);
  return records_;
}

size_t MemoryLedgerStore::SaveCount() const {
  std::lock_guard lock(mutex_);
  return save_count_;
}

} // namespace pagequeue::db::memory
