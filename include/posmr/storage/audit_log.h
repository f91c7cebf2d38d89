#pragma once

#include "posmr/storage/audit_event.h"

#include <mutex>
#include <string>
#include <vector>

namespace posmr::storage {

// IAuditLog is the structured diagnostic sink injected into the application layer.
// Events are append-only and returned in append order per trace.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  // Empty trace_id returns every stored event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
  // Distinct trace ids, lexicographically ordered.
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;

 protected:
  IAuditLog() = default;
  IAuditLog(const IAuditLog&) = default;
  IAuditLog& operator=(const IAuditLog&) = default;
  IAuditLog(IAuditLog&&) = default;
  IAuditLog& operator=(IAuditLog&&) = default;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  InMemoryAuditLog() = default;

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
};

}  // namespace posmr::storage
