#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace snapshot::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "job " + std::to_string(r.id));
  s.jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::JobRecord> MemoryRepository::ListJobs(Transaction& t) {
  const auto&                   s = TX(t).View();
  std::vector<model::JobRecord> records;
  records.reserve(s.jobs.size());
  for (const auto& [_, record] : s.jobs) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound, "job " + std::to_string(r.id));
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteJob(Transaction& t, uint64_t id) {
  auto& s = TX(t).Mutable();
  if (s.jobs.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "job " + std::to_string(id));
  return Result::Ok();
}

uint64_t MemoryRepository::MaxJobId(Transaction& t) {
  const auto& s = TX(t).View();
  return s.jobs.empty() ? 0 : s.jobs.rbegin()->first;
}

} // namespace snapshot::db::memory
