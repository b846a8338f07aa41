#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>

#include "internal/storage/file_system.hpp"
#include "internal/storage/vault_layout.hpp"
#include "internal/util/time.hpp"
#include "taskvault/v1/audit.pb.h"

namespace taskvault::audit {

inline constexpr const char* kActionStateTransition = "state_transition";
inline constexpr const char* kActionApprovalCreated = "approval_created";
inline constexpr const char* kActionApprovalApproved = "approval_approved";
inline constexpr const char* kActionApprovalRejected = "approval_rejected";
inline constexpr const char* kActionApprovalExpired  = "approval_expired";
inline constexpr const char* kActionApprovalRefused  = "approval_refused";

/*
  Append-only audit trail.

  One JSON object per line in Logs/YYYY-MM-DD.log (UTC day of the entry's
  timestamp). Each line is a single O_APPEND write, so concurrent
  processes may share a day file. Past days are never opened for write
  again because the file name is derived from the entry timestamp.

  Record() never throws: a failed append is logged at error level and
  counted instead, so it cannot undo a transition that already happened.
*/
class AuditLogger {
 public:
  AuditLogger(storage::FileSystemPtr fs, storage::VaultLayout layout, util::ClockFn clock = util::Now);

  void Record(taskvault::v1::AuditEntry entry) noexcept;

  uint64_t FailureCount() const noexcept {
    return failures_.load();
  }

  std::filesystem::path LogPathFor(util::TimePoint tp) const;

 private:
  storage::FileSystemPtr fs_;
  storage::VaultLayout   layout_;
  util::ClockFn          clock_;
  std::atomic<uint64_t>  failures_{0};
};

} // namespace taskvault::audit
