#include "posmr/storage/audit_log.h"

#include <set>

namespace posmr::storage {

void InMemoryAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (trace_id.empty()) {
    return events_;
  }

  std::vector<AuditEvent> filtered;
  for (const auto& event : events_) {
    if (event.trace_id == trace_id) {
      filtered.push_back(event);
    }
  }
  return filtered;
}

std::vector<std::string> InMemoryAuditLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::set<std::string> ids;
  for (const auto& event : events_) {
    ids.insert(event.trace_id);
  }
  return {ids.begin(), ids.end()};
}

}  // namespace posmr::storage
