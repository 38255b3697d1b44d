#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace batch::db::memory {

namespace {

// Completed, Failed, Canceled
bool IsTerminalState(int state) {
  return state >= 6 && state <= 8;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TxMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::UpsertJob(Transaction& t, const model::JobRecord& r) {
  if (t.Mode() == TxMode::kRead) return Result::Err(ErrorCode::ReadOnly, "upsert job " + r.id);
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it != s.jobs.end() && it->second.version >= r.version) return Result::Ok();
  s.jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::JobRecord> MemoryRepository::ListPendingJobs(Transaction& t) {
  const auto&                   s = TX(t).View();
  std::vector<model::JobRecord> records;
  for (const auto& [_, record] : s.jobs) {
    if (!IsTerminalState(record.state)) records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return records;
}

Result MemoryRepository::DeleteJob(Transaction& t, const std::string& id) {
  if (t.Mode() == TxMode::kRead) return Result::Err(ErrorCode::ReadOnly, "delete job " + id);
  TX(t).Mutable().jobs.erase(id);
  return Result::Ok();
}

Result MemoryRepository::UpsertGroup(Transaction& t, const model::GroupRecord& r) {
  if (t.Mode() == TxMode::kRead) return Result::Err(ErrorCode::ReadOnly, "upsert group " + r.id);
  auto& s  = TX(t).Mutable();
  auto  it = s.groups.find(r.id);
  if (it != s.groups.end() && it->second.version >= r.version) return Result::Ok();
  s.groups[r.id] = r;
  return Result::Ok();
}

std::optional<model::GroupRecord> MemoryRepository::GetGroup(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.groups.find(id);
  if (it == s.groups.end()) return std::nullopt;
  return it->second;
}

std::vector<model::GroupRecord> MemoryRepository::ListUnfinishedGroups(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::GroupRecord> records;
  for (const auto& [_, record] : s.groups) {
    if (!record.finished) records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.id < b.id;
  });
  return records;
}

} // namespace batch::db::memory
