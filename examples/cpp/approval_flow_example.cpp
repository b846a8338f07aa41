#include <filesystem>
#include <iostream>
#include <string>

#include "internal/auditor/consistency_auditor.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "taskvault/v1.hpp"

int main(int argc, char** argv) {
  // Scratch vault unless a root is given.
  const std::filesystem::path root = argc > 1 ? argv[1] : std::filesystem::temp_directory_path() / "taskvault_example";

  taskvault::v1::RuntimeConfig config = taskvault::config::ConfigLoader::Defaults();
  config.mutable_vault()->set_root(root.string());
  taskvault::observability::InitializeLogging(config);

  auto runtime = taskvault::factory::Build(config);
  runtime.layout->Initialize(*runtime.fs);

  try {
    // A watcher drops a new task into Inbox.
    taskvault::core::TaskDraft draft;
    draft.priority          = "high";
    draft.body              = "Invoice from ACME Corp: please pay $1,250.00 by Friday.\n";
    draft.metadata["source"] = "email";
    auto task               = runtime.manager->Create(draft, "mail-watcher");
    std::cout << "created " << task.id << " in " << task.path << '\n';

    // Triage spots a payment and parks the task behind an approval.
    task = *runtime.manager->Move(task, taskvault::model::TaskState::kNeedsAction, "triaged", "triage");
    task = *runtime.manager->Move(task, taskvault::model::TaskState::kPendingApproval, "payment keyword", "triage");

    taskvault::approval::ApprovalRequest request;
    request.action_type       = "payment";
    request.details["amount"] = "1250.00";
    request.details["payee"]  = "ACME Corp";
    const auto approval       = runtime.gate->Issue(task, request, "triage");
    std::cout << "approval " << approval.id << " risk=" << approval.risk_level << '\n';

    // A reviewer approves; the worker may now pick the task up.
    runtime.gate->Decide(approval, taskvault::approval::Decision::kApprove, "reviewer");
    task = *runtime.manager->Move(task, taskvault::model::TaskState::kInProgress, "approved", "worker");
    task = *runtime.manager->Move(task, taskvault::model::TaskState::kDone, "paid", "worker");
    std::cout << task.id << " finished with " << task.state_history.size() << " history entries\n";
  } catch (const taskvault::util::VaultError& e) {
    std::cerr << "error [" << taskvault::util::ToString(e.Kind()) << "]: " << e.what() << '\n';
    return 1;
  }

  const auto report = taskvault::auditor::ConsistencyAuditor(runtime.fs, *runtime.layout, config.retry().max_retries()).Run();
  std::cout << "audit: " << report.files_checked << " files, " << report.violations.size() << " violations\n";

  const auto stats = taskvault::audit::AuditLog::Summarize(runtime.audit_log->Read().entries);
  std::cout << "approval rate: " << stats.approval_rate << '\n';

  taskvault::observability::ShutdownLogging();
  return report.Clean() ? 0 : 2;
}
