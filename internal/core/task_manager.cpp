#include "task_manager.hpp"

#include <cerrno>

#include "internal/codec/frontmatter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace taskvault::core {

using model::Folder;
using model::TaskRecord;
using model::TaskState;
using observability::IntField;
using observability::StringField;

namespace {

std::string Join(const std::vector<TaskState>& states) {
  std::string out;
  for (auto state : states) {
    if (!out.empty()) out += ", ";
    out += model::ToString(state);
  }
  return out.empty() ? "none" : out;
}

std::string Join(const std::vector<Folder>& folders) {
  std::string out;
  for (auto folder : folders) {
    if (!out.empty()) out += ", ";
    out += model::ToString(folder);
  }
  return out.empty() ? "none" : out;
}

std::string GenerateTaskId(util::TimePoint now) {
  return "T-" + util::CompactDayStamp(now) + "-" + util::ToString(util::GenerateUUID()).substr(0, 8);
}

} // namespace

RetryPolicy RetryPolicy::FromConfig(const taskvault::runtime::config::RuntimeConfig& config) {
  RetryPolicy policy;
  policy.max_retries = config.retry().max_retries();
  policy.enforce     = config.retry().failed_policy() != taskvault::runtime::config::FAILED_TRANSITION_POLICY_WARN;
  return policy;
}

TaskManager::TaskManager(storage::FileSystemPtr fs, storage::VaultLayout layout, std::shared_ptr<audit::AuditLogger> audit,
                         std::shared_ptr<approval::ApprovalGate> gate, RetryPolicy policy, util::ClockFn clock)
    : fs_(fs), layout_(std::move(layout)), relocator_(fs), audit_(std::move(audit)), gate_(std::move(gate)), policy_(policy), clock_(std::move(clock)) {
}

// ------------------------------------------------------------
// Create
// ------------------------------------------------------------

TaskRecord TaskManager::Create(const TaskDraft& draft, const std::string& actor) {
  const auto now = clock_();

  TaskRecord record;
  record.id = draft.task_id.value_or(GenerateTaskId(now));
  storage::VaultLayout::ValidateRecordId(record.id);

  record.state         = TaskState::kEntry;
  record.priority      = draft.priority.empty() ? "normal" : draft.priority;
  record.created_at    = now;
  record.modified_at   = now;
  record.state_history = {{TaskState::kEntry, now, actor, "created"}};
  record.metadata      = draft.metadata;
  record.body          = draft.body;

  const auto path = layout_.RecordPath(Folder::kInbox, record.id);
  relocator_.Publish(path, codec::Serialize(record));
  record.path = path.string();

  TASKVAULT_LOG_INFO("Task created", {StringField("task_id", record.id), StringField("priority", record.priority), StringField("actor", actor)});

  taskvault::v1::AuditEntry entry;
  entry.set_action(audit::kActionStateTransition);
  entry.set_task_id(record.id);
  entry.set_to_state(std::string(model::ToString(TaskState::kEntry)));
  entry.set_actor(actor);
  entry.set_reason("created");
  entry.set_result(taskvault::v1::AUDIT_RESULT_SUCCESS);
  entry.set_severity(taskvault::v1::SEVERITY_INFO);
  audit_->Record(std::move(entry));

  return record;
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

std::optional<TaskRecord> TaskManager::ReadTask(const std::filesystem::path& path) const {
  std::string text;
  try {
    text = fs_->Read(path);
  } catch (const util::FileOperationError& e) {
    if (e.Errno() == ENOENT) return std::nullopt;
    throw;
  }
  if (codec::IsApprovalDocument(text)) {
    return std::nullopt;
  }

  auto record = codec::ParseTask(text);
  record.path = path.string();
  return record;
}

std::optional<TaskRecord> TaskManager::Find(const std::string& task_id) const {
  for (auto folder : model::kAllFolders) {
    if (auto record = ReadTask(layout_.RecordPath(folder, task_id))) {
      return record;
    }
  }
  return std::nullopt;
}

std::vector<TaskRecord> TaskManager::Snapshot(Folder folder) const {
  const auto dir = layout_.FolderPath(folder);

  std::vector<TaskRecord> records;
  for (const auto& name : fs_->List(dir)) {
    if (!storage::VaultLayout::RecordIdFromFileName(name)) {
      continue;
    }
    try {
      if (auto record = ReadTask(dir / name)) {
        records.push_back(std::move(*record));
      }
    } catch (const util::MalformedRecord& e) {
      TASKVAULT_LOG_WARN("Skipping malformed task file", {StringField("path", (dir / name).string()), StringField("error", e.what())});
    }
  }
  return records;
}

// ------------------------------------------------------------
// Move
// ------------------------------------------------------------

void TaskManager::CheckRetryRule(const TaskRecord& task, TaskState to) const {
  if (to != TaskState::kFailed || task.retry_count >= policy_.max_retries) {
    return;
  }

  const auto message = "task " + task.id + " cannot move to failed: retry_count " + std::to_string(task.retry_count) +
                       " is below max_retries " + std::to_string(policy_.max_retries);
  if (policy_.enforce) {
    throw util::InvalidTransition(message);
  }
  TASKVAULT_LOG_WARN("Retry rule violated, allowed by policy", {StringField("task_id", task.id), IntField("retry_count", task.retry_count),
                                                                IntField("max_retries", policy_.max_retries)});
}

std::optional<TaskRecord> TaskManager::Move(const TaskRecord& task, TaskState to, const std::string& reason, const std::string& actor,
                                            std::optional<Folder> destination) {
  const TaskState from   = task.state;
  const Folder    folder = destination.value_or(model::HomeFolder(to));

  try {
    if (!model::IsAllowed(from, to)) {
      throw util::InvalidTransition("illegal transition " + std::string(model::ToString(from)) + " -> " + std::string(model::ToString(to)) +
                                    " (allowed from " + std::string(model::ToString(from)) + ": " + Join(model::NextStates(from)) + ")");
    }
    if (!model::IsLicensed(to, folder)) {
      throw util::FolderMismatch("state " + std::string(model::ToString(to)) + " is not licensed in folder " + std::string(model::ToString(folder)) +
                                 " (licensed: " + Join(model::FoldersFor(to)) + ")");
    }
    CheckRetryRule(task, to);
    gate_->Authorize(task, to);

    if (task.path.empty()) {
      throw util::NotFound("task " + task.id + " has no backing file");
    }

    const auto now = clock_();

    TaskRecord updated  = task;
    updated.state       = to;
    updated.modified_at = now;
    if (from == TaskState::kErrorQueue && to == TaskState::kNeedsAction) {
      ++updated.retry_count;
    }
    updated.state_history.push_back({to, now, actor, reason});

    const auto target  = layout_.RecordPath(folder, task.id);
    const auto outcome = relocator_.Relocate(task.path, target, [&](const std::string& claimed) -> std::optional<std::string> {
      // the decision above was made against `task`; back off if the file moved on
      if (!codec::ParseTask(claimed).SameContent(task)) {
        return std::nullopt;
      }
      return codec::Serialize(updated);
    });

    if (outcome != storage::RelocationOutcome::kMoved) {
      TASKVAULT_LOG_INFO("Task already handled elsewhere", {StringField("task_id", task.id), StringField("to", model::ToString(to)),
                                                            StringField("outcome", outcome == storage::RelocationOutcome::kSourceVanished ? "vanished" : "changed")});
      return std::nullopt;
    }

    updated.path = target.string();
    TASKVAULT_LOG_INFO("Task moved", {StringField("task_id", task.id), StringField("from", model::ToString(from)), StringField("to", model::ToString(to)),
                                      StringField("actor", actor)});
    AuditAttempt(task, to, reason, actor, nullptr);
    return updated;
  } catch (const util::VaultError& e) {
    TASKVAULT_LOG_WARN("Transition refused", {StringField("task_id", task.id), StringField("from", model::ToString(from)),
                                              StringField("to", model::ToString(to)), StringField("kind", util::ToString(e.Kind())),
                                              StringField("error", e.what())});
    AuditAttempt(task, to, reason, actor, &e);
    throw;
  }
}

void TaskManager::AuditAttempt(const TaskRecord& task, TaskState to, const std::string& reason, const std::string& actor,
                               const util::VaultError* error) const {
  taskvault::v1::AuditEntry entry;
  entry.set_action(audit::kActionStateTransition);
  entry.set_task_id(task.id);
  entry.set_from_state(std::string(model::ToString(task.state)));
  entry.set_to_state(std::string(model::ToString(to)));
  entry.set_actor(actor);
  entry.set_reason(reason);

  if (error == nullptr) {
    entry.set_result(taskvault::v1::AUDIT_RESULT_SUCCESS);
    entry.set_severity(taskvault::v1::SEVERITY_INFO);
  } else {
    entry.set_result(error->Retryable() ? taskvault::v1::AUDIT_RESULT_FAILED : taskvault::v1::AUDIT_RESULT_REJECTED);
    entry.set_severity(error->Kind() == util::ErrorKind::kApprovalSecurity ? taskvault::v1::SEVERITY_CRITICAL : taskvault::v1::SEVERITY_WARNING);
    entry.set_error_kind(std::string(util::ToString(error->Kind())));
    entry.set_error(error->what());
  }
  audit_->Record(std::move(entry));
}

// ------------------------------------------------------------
// Sweep / recovery
// ------------------------------------------------------------

SweepReport TaskManager::Sweep(Folder folder, TaskState to, const std::string& reason, const std::string& actor,
                               const std::function<bool(const TaskRecord&)>& filter) {
  SweepReport report;

  for (const auto& task : Snapshot(folder)) {
    if (filter && !filter(task)) {
      continue;
    }
    try {
      if (Move(task, to, reason, actor)) {
        report.moved.push_back(task.id);
      } else {
        report.vanished.push_back(task.id);
      }
    } catch (const util::VaultError& e) {
      if (e.Retryable()) {
        report.failed.emplace_back(task.id, e.what());
      } else {
        report.refused.emplace_back(task.id, e.what());
      }
    }
  }

  TASKVAULT_LOG_INFO("Sweep finished", {StringField("folder", model::ToString(folder)), StringField("to", model::ToString(to)),
                                        IntField("moved", static_cast<int64_t>(report.moved.size())),
                                        IntField("vanished", static_cast<int64_t>(report.vanished.size())),
                                        IntField("refused", static_cast<int64_t>(report.refused.size())),
                                        IntField("failed", static_cast<int64_t>(report.failed.size()))});
  return report;
}

storage::RecoveryReport TaskManager::RecoverOrphans() {
  storage::RecoveryReport total;
  for (auto folder : model::kAllFolders) {
    auto report = relocator_.RecoverOrphans(layout_.FolderPath(folder));
    total.restored.insert(total.restored.end(), report.restored.begin(), report.restored.end());
    total.discarded.insert(total.discarded.end(), report.discarded.begin(), report.discarded.end());
    total.stuck.insert(total.stuck.end(), report.stuck.begin(), report.stuck.end());
  }

  for (const auto& path : total.restored) {
    TASKVAULT_LOG_WARN("Restored orphaned record", {StringField("path", path)});
  }
  return total;
}

} // namespace taskvault::core
