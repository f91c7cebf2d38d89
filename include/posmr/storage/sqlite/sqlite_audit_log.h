#pragma once

#include "posmr/storage/audit_log.h"
#include "posmr/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace posmr::storage::sqlite {

// SqliteAuditLog persists run audit trails in the audit_events table.
// Per-trace ordering is kept by the idx column; append is mutex-guarded.
// Write failures are reported to stderr and counted, never thrown: a broken
// sink must not abort a completion run.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

  [[nodiscard]] std::size_t failed_writes() const;

 private:
  int next_index(const std::string& trace_id);

  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;
  std::map<std::string, int> trace_indices_;
  std::size_t failed_writes_{0};
};

}  // namespace posmr::storage::sqlite
