#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/codec/frontmatter.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/transition_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/identity.hpp"
#include "internal/util/time.hpp"
#include "taskvault/v1.hpp"

using taskvault::approval::Decision;
using taskvault::approval::DecisionOutcome;
using taskvault::model::Folder;
using taskvault::model::TaskState;

namespace {

constexpr int kExitOk        = 0;
constexpr int kExitUsage     = 1;
constexpr int kExitViolation = 2;
constexpr int kExitRetryable = 3;

void Usage() {
  std::cerr << "Usage:\n"
            << "  taskvaultctl [--config FILE] [--vault DIR] [--actor NAME] <command> [args]\n"
            << "\n"
            << "Commands:\n"
            << "  init\n"
            << "  submit <priority> <body-file|-> [--id ID] [--meta key=value]...\n"
            << "  list <folder>\n"
            << "  show <task_id>\n"
            << "  move <task_id> <state> [reason] [--folder FOLDER]\n"
            << "  sweep <folder> <state> [reason]\n"
            << "  request-approval <task_id> <action_type> [key=value]... [--ttl SECONDS]\n"
            << "  approve <approval_id> [reason]\n"
            << "  reject <approval_id> <reason>\n"
            << "  pending\n"
            << "  expire\n"
            << "  recover\n"
            << "  log [--task ID] [--action ACTION] [--actor NAME] [--since YYYY-MM-DD] [--until YYYY-MM-DD]\n"
            << "  stats [--since YYYY-MM-DD] [--until YYYY-MM-DD]\n"
            << "\n"
            << "Folders: Inbox Needs_Action In_Progress Approvals Done Error_Queue\n";
}

struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct Context {
  taskvault::factory::VaultRuntime runtime;
  std::string                      actor;
};

// Positional arguments plus "--flag value" pairs; repeated flags accumulate.
struct Args {
  std::vector<std::string>                        positional;
  std::map<std::string, std::vector<std::string>> flags;

  std::optional<std::string> Flag(const std::string& name) const {
    auto it = flags.find(name);
    if (it == flags.end() || it->second.empty()) return std::nullopt;
    return it->second.back();
  }

  const std::string& At(size_t index, const char* what) const {
    if (index >= positional.size()) throw UsageError(std::string("missing argument: ") + what);
    return positional[index];
  }
};

Args ParseArgs(const std::vector<std::string>& raw) {
  Args args;
  for (size_t i = 0; i < raw.size(); ++i) {
    const auto& token = raw[i];
    if (token.rfind("--", 0) == 0 && token.size() > 2) {
      if (i + 1 >= raw.size()) throw UsageError("flag " + token + " needs a value");
      args.flags[token.substr(2)].push_back(raw[++i]);
    } else {
      args.positional.push_back(token);
    }
  }
  return args;
}

std::pair<std::string, std::string> SplitKeyValue(const std::string& text) {
  const auto eq = text.find('=');
  if (eq == std::string::npos || eq == 0) throw UsageError("expected key=value, got '" + text + "'");
  return {text.substr(0, eq), text.substr(eq + 1)};
}

Folder RequireFolder(const std::string& name) {
  auto folder = taskvault::model::ParseFolder(name);
  if (!folder) throw UsageError("unknown folder '" + name + "'");
  return *folder;
}

TaskState RequireState(const std::string& name) {
  auto state = taskvault::model::ParseTaskState(name);
  if (!state) throw taskvault::util::InvalidTransition("unknown state '" + name + "'");
  return *state;
}

taskvault::model::TaskRecord RequireTask(Context& ctx, const std::string& task_id) {
  auto task = ctx.runtime.manager->Find(task_id);
  if (!task) throw taskvault::util::NotFound("task " + task_id + " not found");
  return *task;
}

std::string ReadBody(const std::string& source) {
  if (source == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream in(source, std::ios::binary);
  if (!in) throw UsageError("cannot read body file '" + source + "'");
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void PrintMove(const std::string& task_id, const std::optional<taskvault::model::TaskRecord>& moved) {
  if (!moved) {
    std::cout << "task " << task_id << " was already handled by another process\n";
    return;
  }
  std::cout << "moved " << moved->id << " -> " << taskvault::model::ToString(moved->state) << " (" << moved->path << ")\n";
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

int CmdInit(Context& ctx, const Args&) {
  ctx.runtime.layout->Initialize(*ctx.runtime.fs);
  std::cout << "initialized vault at " << ctx.runtime.layout->Root().string() << "\n";
  return kExitOk;
}

int CmdSubmit(Context& ctx, const Args& args) {
  taskvault::core::TaskDraft draft;
  draft.priority = args.At(0, "priority");
  draft.body     = ReadBody(args.At(1, "body-file"));
  draft.task_id  = args.Flag("id");
  if (auto it = args.flags.find("meta"); it != args.flags.end()) {
    for (const auto& kv : it->second) {
      draft.metadata.insert(SplitKeyValue(kv));
    }
  }

  const auto task = ctx.runtime.manager->Create(draft, ctx.actor);
  std::cout << task.id << "\n";
  return kExitOk;
}

int CmdList(Context& ctx, const Args& args) {
  for (const auto& task : ctx.runtime.manager->Snapshot(RequireFolder(args.At(0, "folder")))) {
    std::cout << task.id << "\t" << taskvault::model::ToString(task.state) << "\t" << task.priority << "\tretries=" << task.retry_count << "\t"
              << taskvault::util::FormatTimestamp(task.modified_at) << "\n";
  }
  return kExitOk;
}

int CmdShow(Context& ctx, const Args& args) {
  const auto task = RequireTask(ctx, args.At(0, "task_id"));
  std::cout << "# " << task.path << "\n" << taskvault::codec::Serialize(task);
  return kExitOk;
}

int CmdMove(Context& ctx, const Args& args) {
  const auto& task_id = args.At(0, "task_id");
  const auto  to      = RequireState(args.At(1, "state"));
  const auto  reason  = args.positional.size() > 2 ? args.positional[2] : std::string();

  std::optional<Folder> destination;
  if (auto folder = args.Flag("folder")) {
    destination = RequireFolder(*folder);
  }

  const auto task = RequireTask(ctx, task_id);
  PrintMove(task_id, ctx.runtime.manager->Move(task, to, reason, ctx.actor, destination));
  return kExitOk;
}

int CmdSweep(Context& ctx, const Args& args) {
  const auto folder = RequireFolder(args.At(0, "folder"));
  const auto to     = RequireState(args.At(1, "state"));
  const auto reason = args.positional.size() > 2 ? args.positional[2] : std::string("sweep");

  const auto report = ctx.runtime.manager->Sweep(folder, to, reason, ctx.actor);
  for (const auto& id : report.moved) std::cout << "moved\t" << id << "\n";
  for (const auto& id : report.vanished) std::cout << "vanished\t" << id << "\n";
  for (const auto& [id, rule] : report.refused) std::cout << "refused\t" << id << "\t" << rule << "\n";
  for (const auto& [id, error] : report.failed) std::cout << "failed\t" << id << "\t" << error << "\n";
  std::cout << "moved=" << report.moved.size() << " vanished=" << report.vanished.size() << " refused=" << report.refused.size()
            << " failed=" << report.failed.size() << "\n";
  return report.failed.empty() ? kExitOk : kExitRetryable;
}

int CmdRequestApproval(Context& ctx, const Args& args) {
  auto task = RequireTask(ctx, args.At(0, "task_id"));

  taskvault::approval::ApprovalRequest request;
  request.action_type = args.At(1, "action_type");
  for (size_t i = 2; i < args.positional.size(); ++i) {
    request.details.insert(SplitKeyValue(args.positional[i]));
  }
  if (auto ttl = args.Flag("ttl")) {
    try {
      request.ttl = std::chrono::seconds(std::stoll(*ttl));
    } catch (const std::logic_error&) {
      throw UsageError("--ttl expects whole seconds, got '" + *ttl + "'");
    }
  }

  if (task.state != TaskState::kPendingApproval) {
    auto moved = ctx.runtime.manager->Move(task, TaskState::kPendingApproval, "approval requested: " + request.action_type, ctx.actor);
    if (!moved) {
      std::cout << "task " << task.id << " was already handled by another process\n";
      return kExitOk;
    }
    task = *moved;
  }

  const auto approval = ctx.runtime.gate->Issue(task, request, ctx.actor);
  std::cout << approval.id << "\trisk=" << approval.risk_level << "\texpires_at=" << taskvault::util::FormatTimestamp(approval.expires_at) << "\n";
  return kExitOk;
}

int CmdDecide(Context& ctx, const Args& args, Decision decision) {
  const auto& approval_id = args.At(0, "approval_id");
  std::optional<std::string> reason;
  if (args.positional.size() > 1) {
    reason = args.positional[1];
  } else if (decision == Decision::kReject) {
    throw UsageError("missing argument: reason");
  }

  auto approval = ctx.runtime.gate->Find(approval_id);
  if (!approval) throw taskvault::util::NotFound("approval " + approval_id + " not found");

  const auto result = ctx.runtime.gate->Decide(*approval, decision, ctx.actor, reason);
  if (result.outcome == DecisionOutcome::kAlreadyDecided) {
    std::cout << "approval " << approval_id << " already decided: " << taskvault::model::ToString(result.record.approval_status) << "\n";
    return kExitOk;
  }
  std::cout << "approval " << approval_id << " " << taskvault::model::ToString(result.record.approval_status) << "\n";

  auto task = ctx.runtime.manager->Find(result.record.task_id);
  if (!task || task->state != TaskState::kPendingApproval) {
    std::cout << "task " << result.record.task_id << " is not awaiting approval; nothing to move\n";
    return kExitOk;
  }

  const auto to = decision == Decision::kApprove ? TaskState::kInProgress : TaskState::kRejected;
  PrintMove(task->id, ctx.runtime.manager->Move(*task, to, reason.value_or("approved by " + ctx.actor), ctx.actor));
  return kExitOk;
}

int CmdPending(Context& ctx, const Args&) {
  for (const auto& approval : ctx.runtime.gate->ListPending()) {
    std::cout << approval.id << "\ttask=" << approval.task_id << "\taction=" << approval.action_type << "\trisk=" << approval.risk_level
              << "\texpires_at=" << taskvault::util::FormatTimestamp(approval.expires_at) << "\n";
  }
  return kExitOk;
}

int CmdExpire(Context& ctx, const Args&) {
  const auto expired = ctx.runtime.gate->ExpireStale();
  for (const auto& approval : expired) {
    std::cout << "expired\t" << approval.id << "\ttask=" << approval.task_id << "\n";
  }
  std::cout << "expired=" << expired.size() << "\n";
  return kExitOk;
}

int CmdRecover(Context& ctx, const Args&) {
  const auto report = ctx.runtime.manager->RecoverOrphans();
  for (const auto& path : report.restored) std::cout << "restored\t" << path << "\n";
  for (const auto& path : report.discarded) std::cout << "discarded\t" << path << "\n";
  for (const auto& path : report.stuck) std::cout << "stuck\t" << path << "\n";
  return report.stuck.empty() ? kExitOk : kExitViolation;
}

taskvault::audit::AuditFilter FilterFrom(const Args& args) {
  taskvault::audit::AuditFilter filter;
  filter.task_id   = args.Flag("task");
  filter.action    = args.Flag("action");
  filter.actor     = args.Flag("actor");
  filter.since_day = args.Flag("since");
  filter.until_day = args.Flag("until");
  return filter;
}

int CmdLog(Context& ctx, const Args& args) {
  const auto result = ctx.runtime.audit_log->Read(FilterFrom(args));
  for (const auto& entry : result.entries) {
    std::cout << taskvault::util::FormatTimestamp(taskvault::util::FromProto(entry.timestamp())) << "\t" << entry.action() << "\t"
              << (entry.task_id().empty() ? "-" : entry.task_id()) << "\t" << entry.from_state() << "->" << entry.to_state() << "\t"
              << taskvault::v1::AuditResult_Name(entry.result()) << "\t" << entry.actor() << "\t" << entry.reason();
    if (!entry.error().empty()) std::cout << "\t" << entry.error();
    std::cout << "\n";
  }
  if (result.skipped_lines > 0) {
    std::cerr << "skipped " << result.skipped_lines << " unparseable audit lines\n";
  }
  return kExitOk;
}

int CmdStats(Context& ctx, const Args& args) {
  const auto result = ctx.runtime.audit_log->Read(FilterFrom(args));
  const auto stats  = taskvault::audit::AuditLog::Summarize(result.entries);

  std::cout << "transitions: succeeded=" << stats.transitions_succeeded << " rejected=" << stats.transitions_rejected
            << " failed=" << stats.transitions_failed << "\n";
  std::cout << "approvals: created=" << stats.approvals_created << " approved=" << stats.approvals_approved
            << " rejected=" << stats.approvals_rejected << " expired=" << stats.approvals_expired << " refused=" << stats.approvals_refused
            << "\n";
  std::cout << "approval_rate=" << stats.approval_rate << "\n";
  if (stats.mean_response_seconds) {
    std::cout << "mean_response_seconds=" << *stats.mean_response_seconds << "\n";
  }
  for (const auto& [action, count] : stats.by_action) {
    std::cout << "action " << action << "=" << count << "\n";
  }
  return kExitOk;
}

int Dispatch(Context& ctx, const std::string& cmd, const Args& args) {
  if (cmd == "init") return CmdInit(ctx, args);
  if (cmd == "submit") return CmdSubmit(ctx, args);
  if (cmd == "list") return CmdList(ctx, args);
  if (cmd == "show") return CmdShow(ctx, args);
  if (cmd == "move") return CmdMove(ctx, args);
  if (cmd == "sweep") return CmdSweep(ctx, args);
  if (cmd == "request-approval") return CmdRequestApproval(ctx, args);
  if (cmd == "approve") return CmdDecide(ctx, args, Decision::kApprove);
  if (cmd == "reject") return CmdDecide(ctx, args, Decision::kReject);
  if (cmd == "pending") return CmdPending(ctx, args);
  if (cmd == "expire") return CmdExpire(ctx, args);
  if (cmd == "recover") return CmdRecover(ctx, args);
  if (cmd == "log") return CmdLog(ctx, args);
  if (cmd == "stats") return CmdStats(ctx, args);
  throw UsageError("unknown command '" + cmd + "'");
}

} // namespace

int main(int argc, char** argv) {
  std::optional<std::string> config_path;
  std::optional<std::string> vault_root;
  std::optional<std::string> actor;

  // global flags precede the command
  int i = 1;
  for (; i < argc; ++i) {
    const std::string token = argv[i];
    if ((token == "--config" || token == "--vault" || token == "--actor") && i + 1 < argc) {
      auto& slot = token == "--config" ? config_path : token == "--vault" ? vault_root : actor;
      slot       = argv[++i];
      continue;
    }
    break;
  }
  if (i >= argc) {
    Usage();
    return kExitUsage;
  }

  const std::string        cmd = argv[i];
  std::vector<std::string> rest(argv + i + 1, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    taskvault::v1::RuntimeConfig config = config_path ? taskvault::config::ConfigLoader::LoadFromYaml(*config_path) : taskvault::config::ConfigLoader::Defaults();
    if (vault_root) {
      config.mutable_vault()->set_root(*vault_root);
    }

    taskvault::observability::InitializeLogging(config);

    Context ctx{taskvault::factory::Build(config), actor.value_or(taskvault::util::CurrentActor())};

    const int rc = Dispatch(ctx, cmd, ParseArgs(rest));
    if (ctx.runtime.audit->FailureCount() > 0) {
      std::cerr << "warning: " << ctx.runtime.audit->FailureCount() << " audit entries could not be written\n";
    }
    taskvault::observability::ShutdownLogging();
    return rc;
  } catch (const UsageError& e) {
    std::cerr << "usage error: " << e.what() << "\n";
    Usage();
    taskvault::observability::ShutdownLogging();
    return kExitUsage;
  } catch (const taskvault::util::VaultError& e) {
    std::cerr << "error [" << taskvault::util::ToString(e.Kind()) << "]: " << e.what() << "\n";
    taskvault::observability::ShutdownLogging();
    return e.Retryable() ? kExitRetryable : kExitViolation;
  } catch (const std::exception& e) {
    TASKVAULT_LOG_ERROR("Fatal error", {taskvault::observability::StringField("error", e.what())});
    taskvault::observability::ShutdownLogging();
    return kExitViolation;
  }
}
