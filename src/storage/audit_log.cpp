#include "transfmt/storage/audit_log.h"

namespace transfmt::storage {

AppendResult InMemoryAuditLog::append(const AuditEvent& event) {
  trace_ids_.insert(event.trace_id);
  events_.push_back(event);
  return AppendResult::ok(true);
}

std::vector<AuditEvent> InMemoryAuditLog::query(const std::string& trace_id) const {
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
  return {trace_ids_.begin(), trace_ids_.end()};
}

}  // namespace transfmt::storage
