#pragma once

#include <string>
#include <vector>

namespace posmr::storage {

// AuditEvent is one entry of a run's diagnostic trail.
// payload is a compact JSON object; refs name the entities the event concerns
// (store ids, models, submission ids).
struct AuditEvent {
  std::string event_id;
  std::string trace_id;
  std::string event_type;
  std::string payload;
  std::string created_at;
  std::vector<std::string> refs;
};

}  // namespace posmr::storage
