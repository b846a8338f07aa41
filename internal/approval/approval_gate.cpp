#include "internal/approval/approval_gate.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sstream>

#include "internal/codec/frontmatter.hpp"
#include "internal/crypto/digest.hpp"
#include "internal/model/transition_graph.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/identity.hpp"

namespace taskvault::approval {

using model::ApprovalRecord;
using model::ApprovalStatus;
using model::Folder;
using model::TaskRecord;
using model::TaskState;
using observability::StringField;
using taskvault::v1::AuditEntry;
using util::ApprovalSecurityError;
using SecurityReason = util::ApprovalSecurityError::Reason;

namespace {

constexpr int kIssueAttempts = 16;

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// "$12,500.00" -> 12500.0; nullopt when not a number
std::optional<double> ParseAmount(const std::string& text) {
  std::string digits;
  for (char c : text) {
    if (c == '$' || c == ',' || c == ' ') continue;
    digits.push_back(c);
  }
  if (digits.empty()) return std::nullopt;

  char*        end   = nullptr;
  const double value = std::strtod(digits.c_str(), &end);
  if (end == nullptr || *end != '\0') return std::nullopt;
  return value;
}

bool IntegrityHolds(const ApprovalRecord& record) {
  return !record.integrity_hash || crypto::DigestEquals(crypto::Sha256Hex(record.body), *record.integrity_hash);
}

} // namespace

ApprovalGate::ApprovalGate(storage::FileSystemPtr fs, storage::VaultLayout layout, std::shared_ptr<audit::AuditLogger> audit,
                           std::chrono::seconds default_ttl, util::ClockFn clock)
    : fs_(fs),
      layout_(layout),
      relocator_(fs),
      audit_(std::move(audit)),
      ledger_(fs, layout.NonceLedgerPath()),
      default_ttl_(default_ttl),
      clock_(std::move(clock)) {
}

// ------------------------------------------------------------
// Issue
// ------------------------------------------------------------

std::string ApprovalGate::ClassifyRisk(const std::string& action_type, const std::map<std::string, std::string>& details) {
  const auto type = Lower(action_type);
  if (type == "payment" || type == "wire") {
    auto it = details.find("amount");
    if (it != details.end()) {
      const auto amount = ParseAmount(it->second);
      if (amount && *amount > 10000.0) {
        return "critical";
      }
    }
    return "high";
  }
  if (type == "deploy" || type == "delete") {
    return "high";
  }
  return "medium";
}

std::string ApprovalGate::RenderBody(const TaskRecord& task, const std::string& approval_id, const ApprovalRequest& request,
                                     const std::string& risk_level) {
  std::ostringstream out;
  out << "# Approval Request: " << approval_id << "\n\n";
  out << "**Action Type**: " << request.action_type << "\n";
  out << "**Task**: " << task.id << "\n";
  out << "**Risk Level**: " << risk_level << "\n";

  if (!request.details.empty()) {
    out << "\n## Action Details\n\n";
    for (const auto& [key, value] : request.details) {
      out << "- **" << key << "**: " << value << "\n";
    }
  }

  out << "\n## Task\n\n" << task.body;
  if (!task.body.empty() && task.body.back() != '\n') {
    out << "\n";
  }
  return out.str();
}

ApprovalRecord ApprovalGate::Issue(const TaskRecord& task, const ApprovalRequest& request, const std::string& actor) {
  if (task.state != TaskState::kPendingApproval) {
    throw util::InvalidTransition("approval can only be requested for a task in pending_approval; task " + task.id + " is " +
                                  std::string(model::ToString(task.state)));
  }
  if (request.action_type.empty()) {
    throw util::MalformedRecord("approval request needs an action type");
  }

  const auto now = clock_();
  const auto ttl = request.ttl.value_or(default_ttl_);

  ApprovalRecord record;
  record.task_id         = task.id;
  record.state           = TaskState::kPendingApproval;
  record.priority        = task.priority;
  record.created_at      = now;
  record.modified_at     = now;
  record.state_history   = {{TaskState::kPendingApproval, now, actor, "approval requested: " + request.action_type}};
  record.metadata        = request.details;
  record.nonce           = GenerateNonce();
  record.approval_status = ApprovalStatus::kPending;
  record.expires_at      = now + ttl;
  record.action_type     = request.action_type;
  record.risk_level      = ClassifyRisk(request.action_type, request.details);

  const auto base_id = "APR-" + task.id + "-" + std::to_string(util::ToUnixSeconds(now));
  for (int attempt = 0; attempt < kIssueAttempts; ++attempt) {
    record.id             = attempt == 0 ? base_id : base_id + "-" + std::to_string(attempt);
    record.body           = RenderBody(task, record.id, request, record.risk_level);
    record.integrity_hash = crypto::Sha256Hex(record.body);

    const auto path = layout_.RecordPath(Folder::kApprovals, record.id);
    try {
      relocator_.Publish(path, codec::Serialize(record));
    } catch (const util::FileOperationError& e) {
      if (e.Errno() == EEXIST) continue;
      throw;
    }
    record.path = path.string();

    TASKVAULT_LOG_INFO("Approval issued", {StringField("approval_id", record.id), StringField("task_id", task.id),
                                           StringField("risk_level", record.risk_level), StringField("actor", actor)});
    AuditDecision(record, audit::kActionApprovalCreated, actor, "approval requested: " + request.action_type,
                  taskvault::v1::AUDIT_RESULT_SUCCESS, taskvault::v1::SEVERITY_INFO);
    return record;
  }

  throw util::FileOperationError("could not allocate a unique approval id for task " + task.id, base_id, EEXIST);
}

// ------------------------------------------------------------
// Decide
// ------------------------------------------------------------

DecisionResult ApprovalGate::Decide(const ApprovalRecord& record, Decision decision, const std::string& actor,
                                    const std::optional<std::string>& reason) {
  // the caller's copy may be stale; only what is on disk is checked
  auto loaded = Find(record.id);
  if (!loaded) {
    throw util::NotFound("approval " + record.id + " not found");
  }
  const ApprovalRecord current = std::move(*loaded);

  if (current.approval_status != ApprovalStatus::kPending) {
    TASKVAULT_LOG_WARN("Approval already decided", {StringField("approval_id", current.id),
                                                    StringField("status", model::ToString(current.approval_status)),
                                                    StringField("actor", actor)});
    return {DecisionOutcome::kAlreadyDecided, current};
  }

  const auto now = clock_();
  if (now >= current.expires_at) {
    try {
      MarkExpired(current, now);
    } catch (const util::VaultError& e) {
      TASKVAULT_LOG_WARN("Could not mark approval expired", {StringField("approval_id", current.id), StringField("error", e.what())});
    }
    Refuse(current, SecurityReason::kExpired,
           "approval " + current.id + " expired at " + util::FormatTimestamp(current.expires_at) + " (decision at " +
               util::FormatTimestamp(now) + ")",
           actor);
  }

  if (!IsWellFormedNonce(current.nonce)) {
    Refuse(current, SecurityReason::kMalformedNonce, "approval " + current.id + " carries malformed nonce '" + current.nonce + "'", actor);
  }

  if (ledger_.Contains(current.nonce)) {
    Refuse(current, SecurityReason::kNonceReplayed, "nonce of approval " + current.id + " was already consumed by an earlier decision", actor);
  }

  if (current.integrity_hash) {
    const auto actual = crypto::Sha256Hex(current.body);
    if (!crypto::DigestEquals(actual, *current.integrity_hash)) {
      Refuse(current, SecurityReason::kIntegrityMismatch,
             "integrity hash mismatch for approval " + current.id + ": expected " + *current.integrity_hash + " got " + actual, actor);
    }
  }

  const bool approve = decision == Decision::kApprove;

  ApprovalRecord updated  = current;
  updated.approval_status = approve ? ApprovalStatus::kApproved : ApprovalStatus::kRejected;
  updated.state           = approve ? TaskState::kApproved : TaskState::kRejected;
  updated.modified_at     = now;
  updated.reviewed_at     = now;
  updated.reviewer        = actor;
  if (!approve) {
    updated.rejection_reason = reason.value_or("rejected by " + actor);
  }
  updated.state_history.push_back({updated.state, now, actor, reason.value_or("")});

  if (!Commit(current, updated)) {
    auto latest = Find(current.id);
    if (latest && latest->approval_status == ApprovalStatus::kPending) {
      // edited but still undecided; a fresh Decide re-runs every check
      throw util::FileOperationError("approval " + current.id + " changed while being decided", current.path, EAGAIN);
    }
    TASKVAULT_LOG_WARN("Approval decided concurrently by another process", {StringField("approval_id", current.id), StringField("actor", actor)});
    return {DecisionOutcome::kAlreadyDecided, latest.value_or(current)};
  }

  const char* action = approve ? audit::kActionApprovalApproved : audit::kActionApprovalRejected;
  try {
    ledger_.Consume(current.nonce);
  } catch (const util::FileOperationError& e) {
    // decision stands but Authorize refuses it until the nonce is recorded
    TASKVAULT_LOG_ERROR("Nonce ledger append failed after decision", {StringField("approval_id", current.id), StringField("error", e.what())});
    AuditDecision(updated, action, actor, reason.value_or(""), taskvault::v1::AUDIT_RESULT_FAILED, taskvault::v1::SEVERITY_CRITICAL, e.what());
    throw;
  }

  TASKVAULT_LOG_INFO("Approval decided", {StringField("approval_id", updated.id), StringField("task_id", updated.task_id),
                                          StringField("status", model::ToString(updated.approval_status)), StringField("actor", actor)});
  AuditDecision(updated, action, actor, reason.value_or(""), taskvault::v1::AUDIT_RESULT_SUCCESS, taskvault::v1::SEVERITY_INFO);
  return {DecisionOutcome::kDecided, updated};
}

bool ApprovalGate::Commit(const ApprovalRecord& current, const ApprovalRecord& updated) {
  const auto destination = layout_.RecordPath(model::HomeFolder(updated.state), updated.id);

  const auto outcome = relocator_.Relocate(current.path, destination, [&](const std::string& claimed) -> std::optional<std::string> {
    // someone rewrote the file between our checks and the claim
    if (!codec::ParseApproval(claimed).SameContent(current)) {
      return std::nullopt;
    }
    return codec::Serialize(updated);
  });

  return outcome == storage::RelocationOutcome::kMoved;
}

void ApprovalGate::Refuse(const ApprovalRecord& record, SecurityReason reason, const std::string& message, const std::string& actor) {
  TASKVAULT_LOG_ERROR("Approval decision refused", {StringField("approval_id", record.id), StringField("task_id", record.task_id),
                                                    StringField("reason", util::ToString(reason)), StringField("actor", actor)});

  AuditEntry entry;
  entry.set_action(audit::kActionApprovalRefused);
  entry.set_task_id(record.task_id);
  entry.set_approval_id(record.id);
  entry.set_from_state(std::string(model::ToString(record.approval_status)));
  entry.set_actor(actor);
  entry.set_reason(std::string(util::ToString(reason)));
  entry.set_result(taskvault::v1::AUDIT_RESULT_REJECTED);
  entry.set_error_kind(std::string(util::ToString(util::ErrorKind::kApprovalSecurity)));
  entry.set_error(message);
  entry.set_severity(taskvault::v1::SEVERITY_CRITICAL);
  audit_->Record(std::move(entry));

  throw ApprovalSecurityError(reason, message);
}

// ------------------------------------------------------------
// Expiry
// ------------------------------------------------------------

ApprovalRecord ApprovalGate::MarkExpired(const ApprovalRecord& record, util::TimePoint now) {
  ApprovalRecord updated  = record;
  updated.approval_status = ApprovalStatus::kExpired;
  updated.state           = TaskState::kRejected;
  updated.modified_at     = now;
  updated.state_history.push_back({TaskState::kRejected, now, util::kSystemActor, "approval expired"});

  if (!Commit(record, updated)) {
    auto latest = Find(record.id);
    return latest.value_or(record);
  }

  TASKVAULT_LOG_WARN("Approval expired", {StringField("approval_id", updated.id), StringField("task_id", updated.task_id)});
  AuditDecision(updated, audit::kActionApprovalExpired, util::kSystemActor, "approval expired", taskvault::v1::AUDIT_RESULT_SUCCESS,
                taskvault::v1::SEVERITY_WARNING);
  return updated;
}

std::vector<ApprovalRecord> ApprovalGate::ExpireStale() {
  const auto now = clock_();

  std::vector<ApprovalRecord> expired;
  for (const auto& record : LoadFolder(Folder::kApprovals)) {
    if (record.approval_status != ApprovalStatus::kPending || now < record.expires_at) {
      continue;
    }
    auto result = MarkExpired(record, now);
    if (result.approval_status == ApprovalStatus::kExpired) {
      expired.push_back(std::move(result));
    }
  }
  return expired;
}

// ------------------------------------------------------------
// Authorization for engine edges
// ------------------------------------------------------------

void ApprovalGate::Authorize(const TaskRecord& task, TaskState to) const {
  if (!model::RequiresApproval(task.state, to)) {
    return;
  }

  const auto entered  = task.EnteredAt(TaskState::kPendingApproval);
  const auto approval = FindForTask(task.id);
  if (!approval || (entered && approval->created_at < *entered)) {
    throw util::ApprovalRequired("task " + task.id + " has no approval issued since it entered pending_approval");
  }

  const auto status = std::string(model::ToString(approval->approval_status));

  if (to == TaskState::kInProgress) {
    if (approval->approval_status != ApprovalStatus::kApproved) {
      throw util::ApprovalRequired("approval " + approval->id + " for task " + task.id + " is " + status + ", not approved");
    }
    if (!ledger_.Contains(approval->nonce)) {
      throw util::ApprovalRequired("approval " + approval->id + " has not consumed its nonce");
    }
    if (!IntegrityHolds(*approval)) {
      throw ApprovalSecurityError(SecurityReason::kIntegrityMismatch,
                                  "integrity hash mismatch for approval " + approval->id + " after it was approved");
    }
    return;
  }

  if (approval->approval_status != ApprovalStatus::kRejected && approval->approval_status != ApprovalStatus::kExpired) {
    throw util::ApprovalRequired("approval " + approval->id + " for task " + task.id + " is " + status +
                                 "; rejecting the task needs a rejected or expired approval");
  }
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

std::optional<ApprovalRecord> ApprovalGate::Find(const std::string& approval_id) const {
  for (auto folder : {Folder::kApprovals, Folder::kDone}) {
    const auto path = layout_.RecordPath(folder, approval_id);
    std::string text;
    try {
      text = fs_->Read(path);
    } catch (const util::FileOperationError& e) {
      if (e.Errno() == ENOENT) continue;
      throw;
    }
    auto record = codec::ParseApproval(text);
    record.path = path.string();
    return record;
  }
  return std::nullopt;
}

std::optional<ApprovalRecord> ApprovalGate::FindForTask(const std::string& task_id) const {
  std::optional<ApprovalRecord> latest;
  for (auto folder : {Folder::kApprovals, Folder::kDone}) {
    for (auto& record : LoadFolder(folder)) {
      if (record.task_id != task_id) continue;
      if (!latest || record.created_at > latest->created_at || (record.created_at == latest->created_at && record.id > latest->id)) {
        latest = std::move(record);
      }
    }
  }
  return latest;
}

std::vector<ApprovalRecord> ApprovalGate::ListPending() const {
  std::vector<ApprovalRecord> pending;
  for (auto& record : LoadFolder(Folder::kApprovals)) {
    if (record.approval_status == ApprovalStatus::kPending) {
      pending.push_back(std::move(record));
    }
  }
  return pending;
}

std::vector<ApprovalRecord> ApprovalGate::LoadFolder(Folder folder) const {
  const auto dir = layout_.FolderPath(folder);

  std::vector<ApprovalRecord> records;
  for (const auto& name : fs_->List(dir)) {
    if (!storage::VaultLayout::RecordIdFromFileName(name)) continue;

    const auto  path = dir / name;
    std::string text;
    try {
      text = fs_->Read(path);
    } catch (const util::FileOperationError& e) {
      if (e.Errno() == ENOENT) continue; // relocated since the listing
      throw;
    }
    if (!codec::IsApprovalDocument(text)) continue;

    try {
      auto record = codec::ParseApproval(text);
      record.path = path.string();
      records.push_back(std::move(record));
    } catch (const util::MalformedRecord& e) {
      TASKVAULT_LOG_WARN("Skipping malformed approval record", {StringField("path", path.string()), StringField("error", e.what())});
    }
  }
  return records;
}

void ApprovalGate::AuditDecision(const ApprovalRecord& record, const char* action, const std::string& actor, const std::string& reason,
                                 taskvault::v1::AuditResult result, taskvault::v1::Severity severity, const std::string& error) {
  AuditEntry entry;
  entry.set_action(action);
  entry.set_task_id(record.task_id);
  entry.set_approval_id(record.id);
  entry.set_to_state(std::string(model::ToString(record.approval_status)));
  entry.set_actor(actor);
  entry.set_reason(reason);
  entry.set_result(result);
  entry.set_severity(severity);
  if (!error.empty()) {
    entry.set_error_kind(std::string(util::ToString(util::ErrorKind::kFileOperation)));
    entry.set_error(error);
  }
  audit_->Record(std::move(entry));
}

} // namespace taskvault::approval
