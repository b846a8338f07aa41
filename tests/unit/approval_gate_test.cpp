#include <cassert>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/approval/approval_gate.hpp"
#include "internal/approval/nonce.hpp"
#include "internal/codec/frontmatter.hpp"
#include "internal/crypto/digest.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_vault.hpp"

namespace {

using taskvault::approval::ApprovalGate;
using taskvault::approval::ApprovalRequest;
using taskvault::approval::Decision;
using taskvault::approval::DecisionOutcome;
using taskvault::approval::NonceLedger;
using taskvault::core::TaskDraft;
using taskvault::model::ApprovalRecord;
using taskvault::model::ApprovalStatus;
using taskvault::model::Folder;
using taskvault::model::TaskRecord;
using taskvault::model::TaskState;
using taskvault::testing::Harness;
using taskvault::testing::ReadFile;
using taskvault::testing::WriteFile;
using taskvault::util::ApprovalSecurityError;
using Reason = taskvault::util::ApprovalSecurityError::Reason;

TaskRecord PendingTask(Harness& h, const std::string& id) {
  TaskDraft draft;
  draft.task_id = id;
  draft.body    = "Pay invoice #42 to ACME.\n";
  auto task     = h.manager->Create(draft, "producer");
  h.clock.Advance(std::chrono::seconds(1));
  return *h.manager->Move(task, TaskState::kPendingApproval, "payment detected", "triage");
}

ApprovalRequest Payment(const std::string& amount = "1200.00") {
  ApprovalRequest request;
  request.action_type        = "payment";
  request.details["amount"]  = amount;
  request.details["payee"]   = "ACME Corp";
  return request;
}

ApprovalRecord Issue(Harness& h, const TaskRecord& task, const ApprovalRequest& request = Payment()) {
  h.clock.Advance(std::chrono::seconds(1));
  return h.gate->Issue(task, request, "triage");
}

// Rewrites the approval file on disk the way a hand edit would.
template <typename Edit>
void EditOnDisk(const ApprovalRecord& record, Edit edit) {
  auto current = taskvault::codec::ParseApproval(ReadFile(record.path));
  edit(current);
  WriteFile(record.path, taskvault::codec::Serialize(current));
}

Reason ExpectRefused(Harness& h, const ApprovalRecord& record, Decision decision) {
  try {
    h.gate->Decide(record, decision, "bob");
  } catch (const ApprovalSecurityError& e) {
    assert(!e.Retryable());
    return e.SecurityReason();
  }
  assert(false && "decision should have been refused");
  return Reason::kExpired;
}

void TestIssueWritesTamperEvidentRecord() {
  Harness    h("gate_issue");
  const auto task     = PendingTask(h, "T-1");
  const auto approval = Issue(h, task, Payment("$12,500.00"));

  const auto expected_id = "APR-T-1-" + std::to_string(taskvault::util::ToUnixSeconds(h.clock.Now()));
  assert(approval.id == expected_id);
  assert(approval.path == h.vault.PathOf(Folder::kApprovals, expected_id).string());
  assert(approval.task_id == "T-1");
  assert(approval.state == TaskState::kPendingApproval);
  assert(approval.approval_status == ApprovalStatus::kPending);
  assert(approval.risk_level == "critical");
  assert(approval.expires_at == h.clock.Now() + std::chrono::hours(12));
  assert(taskvault::approval::IsWellFormedNonce(approval.nonce));
  assert(approval.integrity_hash == taskvault::crypto::Sha256Hex(approval.body));
  assert(approval.body.find("Pay invoice #42") != std::string::npos);

  const auto on_disk = taskvault::codec::ParseApproval(ReadFile(approval.path));
  assert(on_disk.SameContent(approval));

  const auto created = h.Entries(taskvault::audit::kActionApprovalCreated);
  assert(created.size() == 1);
  assert(created[0].approval_id() == approval.id);

  // same second, same task: the id gets a suffix
  const auto second = h.gate->Issue(task, Payment(), "triage");
  assert(second.id == expected_id + "-1");
  assert(h.gate->FindForTask("T-1")->id == second.id);
  assert(h.gate->ListPending().size() == 2);
}

void TestIssueNeedsPendingTask() {
  Harness h("gate_issue_state");

  TaskDraft draft;
  draft.task_id   = "T-1";
  const auto task = h.manager->Create(draft, "producer");

  bool threw = false;
  try {
    h.gate->Issue(task, Payment(), "triage");
  } catch (const taskvault::util::InvalidTransition&) {
    threw = true;
  }
  assert(threw);
  assert(h.gate->ListPending().empty());
}

void TestApproveUnblocksTask() {
  Harness    h("gate_approve");
  const auto task     = PendingTask(h, "T-1");
  const auto approval = Issue(h, task);

  h.clock.Advance(std::chrono::minutes(5));
  const auto result = h.gate->Decide(approval, Decision::kApprove, "bob");
  assert(result.outcome == DecisionOutcome::kDecided);
  assert(result.record.approval_status == ApprovalStatus::kApproved);
  assert(result.record.state == TaskState::kApproved);
  assert(result.record.reviewer == "bob");
  assert(std::filesystem::exists(approval.path));

  NonceLedger ledger(h.vault.Fs(), h.vault.Layout().NonceLedgerPath());
  assert(ledger.Contains(approval.nonce));

  const auto approved = h.Entries(taskvault::audit::kActionApprovalApproved);
  assert(approved.size() == 1);
  assert(approved[0].actor() == "bob");

  // rejecting the task now has the wrong approval
  bool threw = false;
  try {
    h.manager->Move(task, TaskState::kRejected, "changed mind", "bob");
  } catch (const taskvault::util::ApprovalRequired&) {
    threw = true;
  }
  assert(threw);

  h.clock.Advance(std::chrono::seconds(1));
  const auto working = h.manager->Move(task, TaskState::kInProgress, "approved", "worker");
  assert(working && working->state == TaskState::kInProgress);
}

void TestDecidingTwiceIsANoOp() {
  Harness    h("gate_twice");
  const auto task     = PendingTask(h, "T-1");
  const auto approval = Issue(h, task);

  assert(h.gate->Decide(approval, Decision::kApprove, "bob").outcome == DecisionOutcome::kDecided);
  const auto before = ReadFile(approval.path);

  const auto again = h.gate->Decide(approval, Decision::kReject, "carol");
  assert(again.outcome == DecisionOutcome::kAlreadyDecided);
  assert(again.record.approval_status == ApprovalStatus::kApproved);
  assert(ReadFile(approval.path) == before);
  assert(h.Entries(taskvault::audit::kActionApprovalApproved).size() == 1);
  assert(h.Entries(taskvault::audit::kActionApprovalRejected).empty());
}

void TestRejectFilesRecordUnderDone() {
  Harness    h("gate_reject");
  const auto task     = PendingTask(h, "T-1");
  const auto approval = Issue(h, task);

  const auto result = h.gate->Decide(approval, Decision::kReject, "bob", std::string("amount: too high"));
  assert(result.outcome == DecisionOutcome::kDecided);
  assert(result.record.approval_status == ApprovalStatus::kRejected);
  assert(result.record.rejection_reason == std::string("amount: too high"));
  assert(!std::filesystem::exists(approval.path));

  const auto filed = h.gate->Find(approval.id);
  assert(filed && filed->path == h.vault.PathOf(Folder::kDone, approval.id).string());
  assert(filed->state == TaskState::kRejected);

  bool threw = false;
  try {
    h.manager->Move(task, TaskState::kInProgress, "sneak", "bob");
  } catch (const taskvault::util::ApprovalRequired&) {
    threw = true;
  }
  assert(threw);

  const auto closed = h.manager->Move(task, TaskState::kRejected, "rejected by reviewer", "bob");
  assert(closed && closed->path == h.vault.PathOf(Folder::kDone, "T-1").string());
}

void TestExpiredApprovalIsRefused() {
  Harness    h("gate_expired");
  const auto task     = PendingTask(h, "T-1");
  const auto approval = Issue(h, task);

  // expired one second ago; nonce and body are still fine
  h.clock.Advance(std::chrono::hours(12) + std::chrono::seconds(1));
  assert(ExpectRefused(h, approval, Decision::kApprove) == Reason::kExpired);

  const auto expired = h.gate->Find(approval.id);
  assert(expired && expired->approval_status == ApprovalStatus::kExpired);
  assert(expired->path == h.vault.PathOf(Folder::kDone, approval.id).string());

  const auto refused = h.Entries(taskvault::audit::kActionApprovalRefused);
  assert(refused.size() == 1);
  assert(refused[0].severity() == taskvault::v1::SEVERITY_CRITICAL);
  assert(refused[0].reason() == "expired");
  assert(h.Entries(taskvault::audit::kActionApprovalExpired).size() == 1);
  assert(h.Entries(taskvault::audit::kActionApprovalApproved).empty());

  NonceLedger ledger(h.vault.Fs(), h.vault.Layout().NonceLedgerPath());
  assert(!ledger.Contains(approval.nonce));

  // an expired approval still lets the task be rejected
  const auto closed = h.manager->Move(task, TaskState::kRejected, "approval expired", "system");
  assert(closed && closed->state == TaskState::kRejected);
}

void TestTamperedBodyIsRefused() {
  Harness    h("gate_tamper");
  const auto task     = PendingTask(h, "T-1");
  const auto approval = Issue(h, task);

  EditOnDisk(approval, [](ApprovalRecord& record) { record.body += "- **payee**: Mallory\n"; });

  assert(ExpectRefused(h, approval, Decision::kApprove) == Reason::kIntegrityMismatch);
  assert(ExpectRefused(h, approval, Decision::kReject) == Reason::kIntegrityMismatch);

  const auto still = h.gate->Find(approval.id);
  assert(still && still->approval_status == ApprovalStatus::kPending);
  assert(h.Entries(taskvault::audit::kActionApprovalRefused).size() == 2);
}

void TestMalformedNonceIsRefused() {
  Harness    h("gate_nonce_shape");
  const auto task     = PendingTask(h, "T-1");
  const auto approval = Issue(h, task);

  EditOnDisk(approval, [](ApprovalRecord& record) { record.nonce = "not-a-nonce"; });
  assert(ExpectRefused(h, approval, Decision::kApprove) == Reason::kMalformedNonce);

  // right shape, wrong case
  EditOnDisk(approval, [&](ApprovalRecord& record) {
    record.nonce = approval.nonce;
    for (auto& c : record.nonce) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  });
  assert(ExpectRefused(h, approval, Decision::kApprove) == Reason::kMalformedNonce);
  assert(h.Entries(taskvault::audit::kActionApprovalRefused).size() == 2);
}

void TestRestoredPendingCopyCannotBeReplayed() {
  Harness    h("gate_replay");
  const auto task     = PendingTask(h, "T-1");
  const auto approval = Issue(h, task);
  const auto pending  = ReadFile(approval.path);

  assert(h.gate->Decide(approval, Decision::kApprove, "bob").outcome == DecisionOutcome::kDecided);

  // restore the pending file from a backup
  std::filesystem::remove(approval.path);
  WriteFile(approval.path, pending);

  assert(ExpectRefused(h, approval, Decision::kApprove) == Reason::kNonceReplayed);
  assert(h.Entries(taskvault::audit::kActionApprovalApproved).size() == 1);
}

void TestExpireStale() {
  Harness    h("gate_expire_stale");
  const auto first  = PendingTask(h, "T-1");
  const auto second = PendingTask(h, "T-2");

  auto short_lived = Payment();
  short_lived.ttl  = std::chrono::minutes(10);
  const auto a     = Issue(h, first, short_lived);
  const auto b     = Issue(h, second);

  h.clock.Advance(std::chrono::minutes(11));
  const auto expired = h.gate->ExpireStale();
  assert(expired.size() == 1);
  assert(expired[0].id == a.id);
  assert(expired[0].state == TaskState::kRejected);

  const auto pending = h.gate->ListPending();
  assert(pending.size() == 1);
  assert(pending[0].id == b.id);

  assert(h.gate->ExpireStale().empty());
}

void TestApprovalMustPostDateReentry() {
  Harness    h("gate_reentry");
  const auto task     = PendingTask(h, "T-1");
  const auto approval = Issue(h, task);
  h.gate->Decide(approval, Decision::kApprove, "bob");

  h.clock.Advance(std::chrono::seconds(1));
  auto working = *h.manager->Move(task, TaskState::kInProgress, "approved", "worker");

  h.clock.Advance(std::chrono::seconds(1));
  auto again = *h.manager->Move(working, TaskState::kPendingApproval, "second payment", "worker");

  // the earlier approval does not cover the new request
  bool threw = false;
  try {
    h.manager->Move(again, TaskState::kInProgress, "reuse", "worker");
  } catch (const taskvault::util::ApprovalRequired&) {
    threw = true;
  }
  assert(threw);

  const auto fresh = Issue(h, again);
  h.gate->Decide(fresh, Decision::kApprove, "bob");
  h.clock.Advance(std::chrono::seconds(1));
  assert(h.manager->Move(again, TaskState::kInProgress, "approved again", "worker").has_value());
}

void TestApprovedRecordTamperedLater() {
  Harness    h("gate_tamper_after");
  const auto task     = PendingTask(h, "T-1");
  const auto approval = Issue(h, task);
  h.gate->Decide(approval, Decision::kApprove, "bob");

  EditOnDisk(approval, [](ApprovalRecord& record) { record.body = "approve everything\n"; });

  bool threw = false;
  try {
    h.manager->Move(task, TaskState::kInProgress, "approved", "worker");
  } catch (const ApprovalSecurityError& e) {
    threw = e.SecurityReason() == Reason::kIntegrityMismatch;
  }
  assert(threw);

  const auto transitions = h.Entries(taskvault::audit::kActionStateTransition);
  assert(transitions.back().severity() == taskvault::v1::SEVERITY_CRITICAL);
}

void TestConcurrentDecisionLoserIsANoOp() {
  Harness    h("gate_decide_race");
  const auto task     = PendingTask(h, "T-1");
  const auto approval = Issue(h, task);

  // a second reviewer process decides in place just before our claim
  ApprovalGate other(h.vault.Fs(), h.vault.Layout(), h.audit, std::chrono::hours(12), h.clock.Fn());
  bool         raced = false;
  h.vault.Fs()->before_rename = [&](const std::filesystem::path& from) {
    if (raced || from.string() != approval.path) return;
    raced = true;
    assert(other.Decide(approval, Decision::kApprove, "carol").outcome == DecisionOutcome::kDecided);
  };

  const auto result = h.gate->Decide(approval, Decision::kReject, "bob", std::string("too large"));
  assert(raced);
  assert(result.outcome == DecisionOutcome::kAlreadyDecided);
  assert(result.record.approval_status == ApprovalStatus::kApproved);
  assert(result.record.reviewer == "carol");

  const auto on_disk = taskvault::codec::ParseApproval(ReadFile(approval.path));
  assert(on_disk.approval_status == ApprovalStatus::kApproved);
  assert(!std::filesystem::exists(h.vault.PathOf(Folder::kDone, approval.id)));
  assert(taskvault::testing::CountHidden(h.vault.Layout().FolderPath(Folder::kApprovals)) == 0);

  assert(h.Entries(taskvault::audit::kActionApprovalApproved).size() == 1);
  assert(h.Entries(taskvault::audit::kActionApprovalRejected).empty());
}

void TestPendingEditDuringDecisionIsRetryable() {
  Harness    h("gate_decide_edit");
  const auto task     = PendingTask(h, "T-1");
  const auto approval = Issue(h, task);

  bool edited = false;
  h.vault.Fs()->before_rename = [&](const std::filesystem::path& from) {
    if (edited || from.string() != approval.path) return;
    edited = true;
    EditOnDisk(approval, [](ApprovalRecord& record) { record.risk_level = "high"; });
  };

  bool threw = false;
  try {
    h.gate->Decide(approval, Decision::kApprove, "bob");
  } catch (const taskvault::util::FileOperationError& e) {
    threw = e.Retryable();
  }
  assert(threw);
  assert(taskvault::codec::ParseApproval(ReadFile(approval.path)).approval_status == ApprovalStatus::kPending);
  assert(h.Entries(taskvault::audit::kActionApprovalApproved).empty());

  // the retry re-reads the edited record and decides it
  const auto retried = h.gate->Decide(approval, Decision::kApprove, "bob");
  assert(retried.outcome == DecisionOutcome::kDecided);
  assert(retried.record.risk_level == "high");
}

void TestClassifyRisk() {
  assert(ApprovalGate::ClassifyRisk("payment", {{"amount", "10000.01"}}) == "critical");
  assert(ApprovalGate::ClassifyRisk("WIRE", {{"amount", "$25,000"}}) == "critical");
  assert(ApprovalGate::ClassifyRisk("payment", {{"amount", "10000"}}) == "high");
  assert(ApprovalGate::ClassifyRisk("payment", {{"amount", "lots"}}) == "high");
  assert(ApprovalGate::ClassifyRisk("payment", {}) == "high");
  assert(ApprovalGate::ClassifyRisk("deploy", {{"amount", "99999"}}) == "high");
  assert(ApprovalGate::ClassifyRisk("delete", {}) == "high");
  assert(ApprovalGate::ClassifyRisk("email", {}) == "medium");
}

void TestNonceHelpers() {
  const auto nonce = taskvault::approval::GenerateNonce();
  assert(taskvault::approval::IsWellFormedNonce(nonce));
  assert(nonce != taskvault::approval::GenerateNonce());

  std::string upper = nonce;
  for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  // the record shape is lowercase only; the ledger still folds case
  assert(!taskvault::approval::IsWellFormedNonce(upper));
  assert(taskvault::approval::NormalizeNonce(upper) == nonce);

  assert(!taskvault::approval::IsWellFormedNonce(""));
  assert(!taskvault::approval::IsWellFormedNonce("1234"));
  assert(!taskvault::approval::IsWellFormedNonce(nonce + "0"));

  Harness     h("nonce_ledger");
  NonceLedger ledger(h.vault.Fs(), h.vault.Layout().NonceLedgerPath());
  assert(!ledger.Contains(nonce));
  ledger.Consume(upper);
  assert(ledger.Contains(nonce));
  assert(ledger.Contains(upper));
}

} // namespace

int main() {
  TestIssueWritesTamperEvidentRecord();
  TestIssueNeedsPendingTask();
  TestApproveUnblocksTask();
  TestDecidingTwiceIsANoOp();
  TestRejectFilesRecordUnderDone();
  TestExpiredApprovalIsRefused();
  TestTamperedBodyIsRefused();
  TestMalformedNonceIsRefused();
  TestRestoredPendingCopyCannotBeReplayed();
  TestExpireStale();
  TestApprovalMustPostDateReentry();
  TestApprovedRecordTamperedLater();
  TestConcurrentDecisionLoserIsANoOp();
  TestPendingEditDuringDecisionIsRetryable();
  TestClassifyRisk();
  TestNonceHelpers();

  std::cout << "taskvault_unit_approval_gate: pass\n";
  return 0;
}
