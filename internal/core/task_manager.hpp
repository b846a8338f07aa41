#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config/config.pb.h"
#include "internal/approval/approval_gate.hpp"
#include "internal/audit/audit_logger.hpp"
#include "internal/model/task_record.hpp"
#include "internal/model/transition_graph.hpp"
#include "internal/storage/atomic_relocator.hpp"
#include "internal/storage/file_system.hpp"
#include "internal/storage/vault_layout.hpp"
#include "internal/util/time.hpp"

namespace taskvault::core {

struct RetryPolicy {
  uint32_t max_retries{3};
  // false: "-> failed" below max_retries only logs a warning
  bool enforce{true};

  static RetryPolicy FromConfig(const taskvault::runtime::config::RuntimeConfig& config);
};

struct TaskDraft {
  std::optional<std::string>         task_id;
  std::string                        priority{"normal"};
  std::string                        body;
  std::map<std::string, std::string> metadata;
};

struct SweepReport {
  std::vector<std::string>                         moved;
  std::vector<std::string>                         vanished;
  std::vector<std::pair<std::string, std::string>> refused; // task id, violated rule
  std::vector<std::pair<std::string, std::string>> failed;  // task id, retryable error
};

/*
  Transition engine.

  The only writer of task state. Every Move:
    - checks the edge against the transition graph
    - checks the destination folder licence
    - checks the retry rule for "-> failed"
    - asks the approval gate for edges out of pending_approval
    - relocates the file, appending exactly one history entry
    - audits the attempt, whether it succeeded or was refused

  Engine errors (util::VaultError) propagate unchanged; only
  util::FileOperationError is retryable. A source that vanished between
  listing and moving belongs to another process and yields nullopt.
*/
class TaskManager {
 public:
  TaskManager(storage::FileSystemPtr fs, storage::VaultLayout layout, std::shared_ptr<audit::AuditLogger> audit,
              std::shared_ptr<approval::ApprovalGate> gate, RetryPolicy policy, util::ClockFn clock = util::Now);

  // Producer entry point: writes a new entry-state record into Inbox.
  model::TaskRecord Create(const TaskDraft& draft, const std::string& actor);

  std::optional<model::TaskRecord> Find(const std::string& task_id) const;
  std::vector<model::TaskRecord>   Snapshot(model::Folder folder) const;

  std::optional<model::TaskRecord> Move(const model::TaskRecord& task, model::TaskState to, const std::string& reason, const std::string& actor,
                                        std::optional<model::Folder> destination = std::nullopt);

  // Moves every record of `folder` accepted by `filter` to `to`. One
  // failing record never stops the batch.
  SweepReport Sweep(model::Folder folder, model::TaskState to, const std::string& reason, const std::string& actor,
                    const std::function<bool(const model::TaskRecord&)>& filter = {});

  // Restores records stranded under claim names by crashed processes.
  storage::RecoveryReport RecoverOrphans();

  const storage::VaultLayout& Layout() const {
    return layout_;
  }

 private:
  void CheckRetryRule(const model::TaskRecord& task, model::TaskState to) const;

  void AuditAttempt(const model::TaskRecord& task, model::TaskState to, const std::string& reason, const std::string& actor,
                    const util::VaultError* error) const;

  std::optional<model::TaskRecord> ReadTask(const std::filesystem::path& path) const;

  storage::FileSystemPtr                  fs_;
  storage::VaultLayout                    layout_;
  storage::AtomicRelocator                relocator_;
  std::shared_ptr<audit::AuditLogger>     audit_;
  std::shared_ptr<approval::ApprovalGate> gate_;
  RetryPolicy                             policy_;
  util::ClockFn                           clock_;
};

} // namespace taskvault::core
