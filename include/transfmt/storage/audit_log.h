#pragma once

#include "transfmt/core/result.h"
#include "transfmt/storage/audit_event.h"

#include <set>
#include <string>
#include <vector>

namespace transfmt::storage {

using AppendResult = core::Result<bool, std::string>;

class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  [[nodiscard]] virtual AppendResult append(const AuditEvent& event) = 0;
  // Events of one trace in append order; an empty trace_id returns every event.
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
  [[nodiscard]] virtual std::vector<std::string> list_trace_ids() const = 0;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  [[nodiscard]] AppendResult append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;
  [[nodiscard]] std::vector<std::string> list_trace_ids() const override;

 private:
  std::vector<AuditEvent> events_;
  std::set<std::string> trace_ids_;
};

}  // namespace transfmt::storage
