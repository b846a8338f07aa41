#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/task_state.hpp"
#include "internal/util/time.hpp"

namespace taskvault::model {

struct HistoryEntry {
  TaskState       state{TaskState::kEntry};
  util::TimePoint timestamp{};
  std::string     actor;
  std::string     reason;

  bool operator==(const HistoryEntry&) const = default;
};

/*
  In-memory form of one task file.

  Decoded once at the file boundary by the codec; the engine never looks
  at raw frontmatter keys. `path` is where the record was read from and is
  not persisted.
*/
struct TaskRecord {
  std::string                        id;
  TaskState                          state{TaskState::kEntry};
  std::string                        priority{"normal"};
  util::TimePoint                    created_at{};
  util::TimePoint                    modified_at{};
  uint32_t                           retry_count{0};
  std::vector<HistoryEntry>          state_history;
  std::map<std::string, std::string> metadata;
  std::string                        body;

  std::string path;

  // Timestamp of the most recent entry into `s`, if any.
  std::optional<util::TimePoint> EnteredAt(TaskState s) const {
    for (auto it = state_history.rbegin(); it != state_history.rend(); ++it) {
      if (it->state == s) {
        return it->timestamp;
      }
    }
    return std::nullopt;
  }

  bool SameContent(const TaskRecord& other) const {
    return id == other.id && state == other.state && priority == other.priority && created_at == other.created_at &&
           modified_at == other.modified_at && retry_count == other.retry_count && state_history == other.state_history &&
           metadata == other.metadata && body == other.body;
  }
};

enum class ApprovalStatus : std::uint8_t {
  kPending  = 0,
  kApproved = 1,
  kRejected = 2,
  kExpired  = 3,
};

std::string_view              ToString(ApprovalStatus status);
std::optional<ApprovalStatus> ParseApprovalStatus(std::string_view text);

/*
  Approval record: a task record living in Approvals whose id is the
  approval id. task_id points back at the gated task; it does not own it.
*/
struct ApprovalRecord : TaskRecord {
  std::string                    task_id;
  std::string                    nonce;
  std::optional<std::string>     integrity_hash;
  ApprovalStatus                 approval_status{ApprovalStatus::kPending};
  util::TimePoint                expires_at{};
  std::string                    action_type;
  std::string                    risk_level;
  std::optional<std::string>     rejection_reason;
  std::optional<util::TimePoint> reviewed_at;
  std::optional<std::string>     reviewer;

  bool SameContent(const ApprovalRecord& other) const {
    return TaskRecord::SameContent(other) && task_id == other.task_id && nonce == other.nonce && integrity_hash == other.integrity_hash &&
           approval_status == other.approval_status && expires_at == other.expires_at && action_type == other.action_type &&
           risk_level == other.risk_level && rejection_reason == other.rejection_reason && reviewed_at == other.reviewed_at &&
           reviewer == other.reviewer;
  }
};

} // namespace taskvault::model
