#include "transfmt/storage/audit_log.h"

#include <catch2/catch.hpp>

using namespace transfmt;

TEST_CASE("InMemoryAuditLog filters by trace id", "[storage][audit]") {
  storage::InMemoryAuditLog audit_log;
  REQUIRE(audit_log.append({"evt-1", "run-b", "RunStarted", "{}", "2026-01-01T00:00:00Z", {}})
              .has_value());
  REQUIRE(audit_log.append({"evt-2", "run-a", "RunStarted", "{}", "2026-01-01T00:00:00Z", {}})
              .has_value());
  REQUIRE(audit_log
              .append({"evt-3", "run-b", "FileProcessed", "{}", "2026-01-01T00:00:01Z",
                       {"de.properties"}})
              .has_value());

  auto run_b = audit_log.query("run-b");
  REQUIRE(run_b.size() == 2);
  CHECK(run_b[0].event_id == "evt-1");
  CHECK(run_b[1].event_id == "evt-3");
  CHECK(run_b[1].refs == std::vector<std::string>{"de.properties"});

  CHECK(audit_log.query("").size() == 3);
  CHECK(audit_log.query("run-z").empty());
  CHECK(audit_log.list_trace_ids() == std::vector<std::string>{"run-a", "run-b"});
}
