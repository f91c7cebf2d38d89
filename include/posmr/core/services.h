#pragma once

#include "posmr/storage/audit_log.h"

namespace posmr::core {

// Services is the composition root handed to the application layer.
// It holds references (not ownership); the CLI owns the concrete sinks.
struct Services {
  storage::IAuditLog& audit_log;  // NOLINT(readability-identifier-naming)

  explicit Services(storage::IAuditLog& audit_log) : audit_log(audit_log) {}

  ~Services() = default;

  Services(const Services&) = delete;
  Services& operator=(const Services&) = delete;
  Services(Services&&) = delete;
  Services& operator=(Services&&) = delete;
};

}  // namespace posmr::core
