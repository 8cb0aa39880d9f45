#include "transfmt/storage/sqlite/sqlite_audit_log.h"

#include <nlohmann/json.hpp>

#include <sqlite3.h>

namespace transfmt::storage::sqlite {

namespace {

std::string column_text(sqlite3_stmt* stmt, const int column) {
  const unsigned char* raw = sqlite3_column_text(stmt, column);
  return raw != nullptr ? reinterpret_cast<const char*>(raw) : std::string{};  // NOLINT
}

}  // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

AppendResult SqliteAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);

  // The index is reserved only after the row is stored.
  const int idx = next_index(event.trace_id);
  const std::string refs_json = nlohmann::json(event.refs).dump();

  const char* sql = R"(
    INSERT INTO audit_events
      (event_id, trace_id, event_type, payload, created_at, refs_json, idx)
    VALUES (?, ?, ?, ?, ?, ?, ?)
  )";

  PreparedStatement stmt(db_->connection(), sql);
  if (!stmt.is_valid()) {
    return AppendResult::err("Failed to prepare audit insert: " + stmt.error());
  }

  sqlite3_bind_text(stmt.get(), 1, event.event_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 2, event.trace_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 3, event.event_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 4, event.payload.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 5, event.created_at.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt.get(), 6, refs_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(stmt.get(), 7, idx);

  if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
    return AppendResult::err("Failed to append audit event: " +
                             std::string(sqlite3_errmsg(db_->connection())));
  }
  trace_indices_[event.trace_id] = idx + 1;
  return AppendResult::ok(true);
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  const std::string sql = trace_id.empty()
                              ? "SELECT event_id, trace_id, event_type, payload, created_at,"
                                "       refs_json FROM audit_events ORDER BY rowid"
                              : "SELECT event_id, trace_id, event_type, payload, created_at,"
                                "       refs_json FROM audit_events WHERE trace_id = ?"
                                " ORDER BY idx";

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

    const nlohmann::json refs = nlohmann::json::parse(column_text(stmt.get(), 5), nullptr, false);
    if (refs.is_array()) {
      event.refs = refs.get<std::vector<std::string>>();
    }
    result.push_back(std::move(event));
  }
  return result;
}

std::vector<std::string> SqliteAuditLog::list_trace_ids() const {
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

int SqliteAuditLog::next_index(const std::string& trace_id) const {
  auto it = trace_indices_.find(trace_id);
  if (it != trace_indices_.end()) {
    return it->second;
  }

  // First event of this trace in this process: continue after what is already stored.
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
  return max_idx + 1;
}

}  // namespace transfmt::storage::sqlite
