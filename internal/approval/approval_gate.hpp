#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/approval/nonce.hpp"
#include "internal/audit/audit_logger.hpp"
#include "internal/model/task_record.hpp"
#include "internal/storage/atomic_relocator.hpp"
#include "internal/storage/file_system.hpp"
#include "internal/storage/vault_layout.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace taskvault::approval {

struct ApprovalRequest {
  std::string                        action_type;
  std::map<std::string, std::string> details;
  // falls back to the gate's default ttl
  std::optional<std::chrono::seconds> ttl;
};

enum class Decision {
  kApprove,
  kReject,
};

enum class DecisionOutcome {
  kDecided,
  // record was no longer pending; nothing written, nothing audited
  kAlreadyDecided,
};

struct DecisionResult {
  DecisionOutcome       outcome;
  model::ApprovalRecord record;
};

/*
  Approval integrity gate.

  Issues tamper-evident approval records into Approvals and is the only
  component that decides them. A decision is accepted only after, in
  order:

    1. approval_status is pending          (else no-op, kAlreadyDecided)
    2. expires_at is in the future         (else kExpired)
    3. nonce is UUID shaped                (else kMalformedNonce)
    4. nonce is not in the ledger          (else kNonceReplayed)
    5. sha256(body) == integrity_hash      (else kIntegrityMismatch)

  Security failures are audited at CRITICAL severity and thrown as
  util::ApprovalSecurityError; they are never retried here.

  Approved records stay in Approvals with state approved; rejected and
  expired ones are filed under Done with state rejected.
*/
class ApprovalGate {
 public:
  ApprovalGate(storage::FileSystemPtr fs, storage::VaultLayout layout, std::shared_ptr<audit::AuditLogger> audit,
               std::chrono::seconds default_ttl, util::ClockFn clock = util::Now);

  // task must currently be in pending_approval.
  model::ApprovalRecord Issue(const model::TaskRecord& task, const ApprovalRequest& request, const std::string& actor);

  DecisionResult Decide(const model::ApprovalRecord& record, Decision decision, const std::string& actor,
                        const std::optional<std::string>& reason = std::nullopt);

  // Marks every pending approval past expires_at as expired.
  std::vector<model::ApprovalRecord> ExpireStale();

  /*
    Called by the engine before any edge out of pending_approval.

    -> in_progress  needs the task's latest approval approved, its nonce
                    consumed and its body intact
    -> rejected     needs it rejected or expired

    The approval must have been issued after the task last entered
    pending_approval. Throws util::ApprovalRequired or
    util::ApprovalSecurityError.
  */
  void Authorize(const model::TaskRecord& task, model::TaskState to) const;

  std::optional<model::ApprovalRecord> Find(const std::string& approval_id) const;
  std::optional<model::ApprovalRecord> FindForTask(const std::string& task_id) const;
  std::vector<model::ApprovalRecord>   ListPending() const;

  static std::string ClassifyRisk(const std::string& action_type, const std::map<std::string, std::string>& details);
  static std::string RenderBody(const model::TaskRecord& task, const std::string& approval_id, const ApprovalRequest& request,
                                const std::string& risk_level);

 private:
  std::vector<model::ApprovalRecord> LoadFolder(model::Folder folder) const;

  // In-place or Approvals -> Done rewrite through the claim protocol.
  // Returns false when another process took the record first.
  bool Commit(const model::ApprovalRecord& current, const model::ApprovalRecord& updated);

  [[noreturn]] void Refuse(const model::ApprovalRecord& record, util::ApprovalSecurityError::Reason reason, const std::string& message,
                           const std::string& actor);

  model::ApprovalRecord MarkExpired(const model::ApprovalRecord& record, util::TimePoint now);

  void AuditDecision(const model::ApprovalRecord& record, const char* action, const std::string& actor, const std::string& reason,
                     taskvault::v1::AuditResult result, taskvault::v1::Severity severity, const std::string& error = {});

  storage::FileSystemPtr              fs_;
  storage::VaultLayout                layout_;
  storage::AtomicRelocator            relocator_;
  std::shared_ptr<audit::AuditLogger> audit_;
  NonceLedger                         ledger_;
  std::chrono::seconds                default_ttl_;
  util::ClockFn                       clock_;
};

} // namespace taskvault::approval
