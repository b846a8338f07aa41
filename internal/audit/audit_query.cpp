#include "internal/audit/audit_query.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/time_util.h>

#include <algorithm>
#include <cerrno>

#include "internal/audit/audit_logger.hpp"
#include "internal/util/errors.hpp"

namespace taskvault::audit {

using taskvault::v1::AuditEntry;
using taskvault::v1::AUDIT_RESULT_FAILED;
using taskvault::v1::AUDIT_RESULT_REJECTED;
using taskvault::v1::AUDIT_RESULT_SUCCESS;

namespace {

constexpr std::string_view kLogExtension = ".log";

// "YYYY-MM-DD.log" -> "YYYY-MM-DD"
std::optional<std::string> DayOf(const std::string& file_name) {
  if (file_name.size() != 10 + kLogExtension.size() || file_name.substr(10) != kLogExtension) {
    return std::nullopt;
  }
  return file_name.substr(0, 10);
}

bool Matches(const AuditEntry& entry, const AuditFilter& filter) {
  if (filter.task_id && entry.task_id() != *filter.task_id) return false;
  if (filter.action && entry.action() != *filter.action) return false;
  if (filter.actor && entry.actor() != *filter.actor) return false;
  return true;
}

} // namespace

AuditLog::AuditLog(storage::FileSystemPtr fs, storage::VaultLayout layout) : fs_(std::move(fs)), layout_(std::move(layout)) {
}

AuditReadResult AuditLog::Read(const AuditFilter& filter) const {
  AuditReadResult result;

  std::vector<std::string> files;
  try {
    files = fs_->List(layout_.LogsDir());
  } catch (const util::FileOperationError& e) {
    if (e.Errno() == ENOENT) return result;
    throw;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  for (const auto& name : files) {
    const auto day = DayOf(name);
    if (!day) continue;
    if (filter.since_day && *day < *filter.since_day) continue;
    if (filter.until_day && *day > *filter.until_day) continue;

    const auto contents = fs_->Read(layout_.LogsDir() / name);

    size_t start = 0;
    while (start < contents.size()) {
      auto end = contents.find('\n', start);
      if (end == std::string::npos) end = contents.size();
      const auto line = contents.substr(start, end - start);
      start           = end + 1;

      if (line.empty()) continue;

      AuditEntry entry;
      if (!google::protobuf::util::JsonStringToMessage(line, &entry, options).ok()) {
        ++result.skipped_lines;
        continue;
      }
      if (Matches(entry, filter)) {
        result.entries.push_back(std::move(entry));
      }
    }
  }

  std::stable_sort(result.entries.begin(), result.entries.end(), [](const AuditEntry& a, const AuditEntry& b) {
    return google::protobuf::util::TimeUtil::TimestampToNanoseconds(a.timestamp()) <
           google::protobuf::util::TimeUtil::TimestampToNanoseconds(b.timestamp());
  });
  return result;
}

AuditStats AuditLog::Summarize(const std::vector<AuditEntry>& entries) {
  AuditStats stats;

  std::map<std::string, int64_t> created_at_ns;
  double                         response_total = 0.0;
  uint64_t                       responses      = 0;

  for (const auto& entry : entries) {
    ++stats.by_action[entry.action()];
    const auto ts_ns = google::protobuf::util::TimeUtil::TimestampToNanoseconds(entry.timestamp());

    if (entry.action() == kActionStateTransition) {
      switch (entry.result()) {
        case AUDIT_RESULT_SUCCESS:
          ++stats.transitions_succeeded;
          break;
        case AUDIT_RESULT_REJECTED:
          ++stats.transitions_rejected;
          break;
        case AUDIT_RESULT_FAILED:
          ++stats.transitions_failed;
          break;
        default:
          break;
      }
      continue;
    }

    if (entry.action() == kActionApprovalCreated) {
      ++stats.approvals_created;
      created_at_ns[entry.approval_id()] = ts_ns;
      continue;
    }

    if (entry.action() == kActionApprovalRefused) {
      ++stats.approvals_refused;
      continue;
    }

    // a decision whose nonce never reached the ledger does not count
    if (entry.result() != AUDIT_RESULT_SUCCESS) {
      continue;
    }

    const bool approved = entry.action() == kActionApprovalApproved;
    const bool rejected = entry.action() == kActionApprovalRejected;
    if (approved) ++stats.approvals_approved;
    if (rejected) ++stats.approvals_rejected;
    if (entry.action() == kActionApprovalExpired) ++stats.approvals_expired;

    if (approved || rejected) {
      auto it = created_at_ns.find(entry.approval_id());
      if (it != created_at_ns.end() && ts_ns >= it->second) {
        response_total += static_cast<double>(ts_ns - it->second) / 1e9;
        ++responses;
      }
    }
  }

  const auto decided = stats.approvals_approved + stats.approvals_rejected + stats.approvals_expired;
  if (decided > 0) {
    stats.approval_rate = static_cast<double>(stats.approvals_approved) / static_cast<double>(decided);
  }
  if (responses > 0) {
    stats.mean_response_seconds = response_total / static_cast<double>(responses);
  }
  return stats;
}

} // namespace taskvault::audit
