#pragma once

#include "posmr/core/id_generator.h"

#include <string>

namespace posmr::core {

// Strong id for one engine invocation's audit trail.
struct TraceId {
  std::string value;
  auto operator<=>(const TraceId&) const = default;
};

inline TraceId new_trace_id(IIdGenerator& id_gen) {
  return TraceId{id_gen.next("trace")};
}

}  // namespace posmr::core
