#pragma once

#include "transfmt/storage/audit_log.h"
#include "transfmt/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace transfmt::storage::sqlite {

// SqliteAuditLog implements IAuditLog on the audit_events table.
// Events keep their append order per trace through the idx column, also across
// processes appending to the same database file.
class SqliteAuditLog final : public IAuditLog {
 public:
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  [[nodiscard]] AppendResult append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  // Index the next event of trace_id will get. Does not reserve it; callers hold mutex_.
  [[nodiscard]] int next_index(const std::string& trace_id) const;

  std::shared_ptr<SqliteDb> db_;
  std::mutex mutex_;
  std::map<std::string, int> trace_indices_;
};

}  // namespace transfmt::storage::sqlite
