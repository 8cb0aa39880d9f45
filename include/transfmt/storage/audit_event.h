#pragma once

#include <string>
#include <vector>

namespace transfmt::storage {

// AuditEvent is one entry of a run's trail. trace_id is the run id; payload is a JSON
// object; refs name the files the event is about.
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace transfmt::storage
