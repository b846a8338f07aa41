#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "internal/storage/file_system.hpp"
#include "internal/storage/vault_layout.hpp"
#include "taskvault/v1/audit.pb.h"

namespace taskvault::audit {

struct AuditFilter {
  // inclusive "YYYY-MM-DD" bounds
  std::optional<std::string> since_day;
  std::optional<std::string> until_day;

  std::optional<std::string> task_id;
  std::optional<std::string> action;
  std::optional<std::string> actor;
};

struct AuditReadResult {
  std::vector<taskvault::v1::AuditEntry> entries;
  uint64_t                               skipped_lines{0};
};

struct AuditStats {
  std::map<std::string, uint64_t> by_action;

  uint64_t transitions_succeeded{0};
  uint64_t transitions_rejected{0};
  uint64_t transitions_failed{0};

  uint64_t approvals_created{0};
  uint64_t approvals_approved{0};
  uint64_t approvals_rejected{0};
  uint64_t approvals_expired{0};
  uint64_t approvals_refused{0};

  // approved / (approved + rejected + expired); 0 with no decisions
  double approval_rate{0.0};
  // seconds from approval_created to the decision, over decided approvals
  std::optional<double> mean_response_seconds;
};

/*
  Read side of the audit trail, used by operator tooling.
  Lines that fail to parse are skipped and counted, never fatal.
*/
class AuditLog {
 public:
  AuditLog(storage::FileSystemPtr fs, storage::VaultLayout layout);

  AuditReadResult Read(const AuditFilter& filter = {}) const;

  static AuditStats Summarize(const std::vector<taskvault::v1::AuditEntry>& entries);

 private:
  storage::FileSystemPtr fs_;
  storage::VaultLayout   layout_;
};

} // namespace taskvault::audit
