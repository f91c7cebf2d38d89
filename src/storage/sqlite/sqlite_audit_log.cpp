#include "posmr/storage/sqlite/sqlite_audit_log.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

#include <iostream>

namespace posmr::storage::sqlite {

namespace {

std::string column_text(sqlite3_stmt* stmt, const int col) {
  const unsigned char* raw = sqlite3_column_text(stmt, col);
  return raw != nullptr ? reinterpret_cast<const char*>(raw) : std::string{};  // NOLINT
}

}  // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int idx = next_index(event.trace_id);

  const std::string refs_json = nlohmann::json(event.refs).dump();

  PreparedStatement stmt(db_->connection(), R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, refs_json, idx)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )");
  if (!stmt.is_valid()) {
    ++failed_writes_;
    std::cerr << "audit log: prepare failed: " << stmt.error() << "\n";
    return;
  }

  sqlite3_bind_text(stmt.get(), 1, event.event_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, event.trace_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, event.event_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, event.payload.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, event.created_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 6, refs_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 7, idx);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    ++failed_writes_;
    std::cerr << "audit log: insert of " << event.event_id
              << " failed: " << sqlite3_errmsg(db_->connection()) << "\n";
  }
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  const std::string sql =
      trace_id.empty()
          ? "SELECT event_id, trace_id, event_type, payload, created_at, refs_json"
            "  FROM audit_events ORDER BY trace_id, idx"
          : "SELECT event_id, trace_id, event_type, payload, created_at, refs_json"
            "  FROM audit_events WHERE trace_id = ? ORDER BY idx";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return {};
  }
  if (!trace_id.empty()) {
    sqlite3_bind_text(stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
  }

  std::vector<AuditEvent> result;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    AuditEvent event;
    event.event_id = column_text(stmt.get(), 0);
    event.trace_id = column_text(stmt.get(), 1);
    event.event_type = column_text(stmt.get(), 2);
    event.payload = column_text(stmt.get(), 3);
    event.created_at = column_text(stmt.get(), 4);

    const auto refs = nlohmann::json::parse(column_text(stmt.get(), 5), nullptr, false);
    if (refs.is_array()) {
      event.refs = refs.get<std::vector<std::string>>();
    }

    result.push_back(std::move(event));
  }
  return result;
}

std::vector<std::string> SqliteAuditLog::list_trace_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);

  PreparedStatement stmt(db_->connection(),
                         "SELECT DISTINCT trace_id FROM audit_events ORDER BY trace_id");
  if (!stmt.is_valid()) {
    return {};
  }

  std::vector<std::string> ids;
  while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
    ids.push_back(column_text(stmt.get(), 0));
  }
  return ids;
}

std::size_t SqliteAuditLog::failed_writes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_writes_;
}

// Caller holds mutex_.
int SqliteAuditLog::next_index(const std::string& trace_id) {
  auto it = trace_indices_.find(trace_id);
  if (it != trace_indices_.end()) {
    return it->second++;
  }

  // First append for this trace in this process: continue after rows already stored.
  int max_idx = -1;
  PreparedStatement stmt(db_->connection(),
                         "SELECT MAX(idx) FROM audit_events WHERE trace_id = ?");
  if (stmt.is_valid()) {
    sqlite3_bind_text(stmt.get(), 1, trace_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt.get()) == SQLITE_ROW &&
        sqlite3_column_type(stmt.get(), 0) != SQLITE_NULL) {
      max_idx = sqlite3_column_int(stmt.get(), 0);
    }
  }

  const int idx = max_idx + 1;
  trace_indices_[trace_id] = idx + 1;
  return idx;
}

}  // namespace posmr::storage::sqlite
