#include <cassert>
#include <iostream>
#include <string>

#include "internal/codec/frontmatter.hpp"
#include "internal/util/errors.hpp"

namespace {

using taskvault::codec::ParseApproval;
using taskvault::codec::ParseTask;
using taskvault::codec::Serialize;
using taskvault::model::ApprovalRecord;
using taskvault::model::ApprovalStatus;
using taskvault::model::TaskRecord;
using taskvault::model::TaskState;
using taskvault::util::ParseTimestamp;

TaskRecord SampleTask() {
  TaskRecord task;
  task.id            = "T-20261019-ab12cd34";
  task.state         = TaskState::kNeedsAction;
  task.priority      = "high";
  task.created_at    = ParseTimestamp("2026-10-19T10:00:00Z");
  task.modified_at   = ParseTimestamp("2026-10-19T10:05:00.250Z");
  task.retry_count   = 1;
  task.state_history = {
      {TaskState::kEntry, ParseTimestamp("2026-10-19T10:00:00Z"), "watcher", ""},
      {TaskState::kNeedsAction, ParseTimestamp("2026-10-19T10:05:00.250Z"), "orchestrator", "triaged: needs reply"},
  };
  task.metadata = {{"source", "email"}, {"subject", "Invoice #42: overdue"}};
  task.body     = "Please pay the invoice.\n\n---\nforwarded message\n";
  return task;
}

bool ThrowsMalformed(const std::string& text) {
  try {
    (void)ParseTask(text);
  } catch (const taskvault::util::MalformedRecord&) {
    return true;
  }
  return false;
}

void TestTaskRoundTrip() {
  const auto task   = SampleTask();
  const auto text   = Serialize(task);
  const auto parsed = ParseTask(text);

  assert(parsed.SameContent(task));
  assert(Serialize(parsed) == text);
}

void TestBodyIsPreservedExactly() {
  auto task = SampleTask();
  for (const std::string body : {"", "\n", "\n\nleading blank lines", "no trailing newline", "---\n", "line\n---\nline"}) {
    task.body        = body;
    const auto again = ParseTask(Serialize(task));
    assert(again.body == body);
  }
}

void TestApprovalRoundTrip() {
  ApprovalRecord approval;
  static_cast<TaskRecord&>(approval) = SampleTask();
  approval.id                        = "APR-T-20261019-ab12cd34-1792400000";
  approval.state                     = TaskState::kPendingApproval;
  approval.state_history             = {{TaskState::kPendingApproval, ParseTimestamp("2026-10-19T10:00:00Z"), "alice", ""}};
  approval.task_id                   = "T-20261019-ab12cd34";
  approval.nonce                     = "3f2b8c1e-9d4a-4e6b-8a1c-2b3c4d5e6f70";
  approval.integrity_hash            = std::string(64, 'a');
  approval.approval_status           = ApprovalStatus::kRejected;
  approval.expires_at                = ParseTimestamp("2026-10-19T22:00:00Z");
  approval.action_type               = "payment";
  approval.risk_level                = "critical";
  approval.rejection_reason          = "amount: too high";
  approval.reviewed_at               = ParseTimestamp("2026-10-19T11:00:00Z");
  approval.reviewer                  = "bob";

  const auto text = Serialize(approval);
  assert(taskvault::codec::IsApprovalDocument(text));
  assert(ParseApproval(text).SameContent(approval));

  // an approval is never accepted where a task is expected
  assert(ThrowsMalformed(text));
}

void TestDefaultsForOptionalFields() {
  const std::string text =
      "---\n"
      "task_id: T-1\n"
      "state: entry\n"
      "created_at: 2026-10-19T10:00:00Z\n"
      "state_history:\n"
      "  - state: entry\n"
      "    timestamp: 2026-10-19T10:00:00Z\n"
      "---\n"
      "\n"
      "body\n";

  const auto task = ParseTask(text);
  assert(task.priority == "normal");
  assert(task.retry_count == 0);
  assert(task.modified_at == task.created_at);
  assert(task.metadata.empty());
  assert(task.body == "body\n");
  assert(!taskvault::codec::IsApprovalDocument(text));
}

void TestStrictDecodingRejectsBadInput() {
  const std::string head    = "---\ntask_id: T-1\n";
  const std::string history = "state_history:\n  - state: entry\n    timestamp: 2026-10-19T10:00:00Z\n";
  const std::string tail    = "---\n\nbody\n";

  // unknown top-level key
  assert(ThrowsMalformed(head + "state: entry\ncreated_at: 2026-10-19T10:00:00Z\nowner: eve\n" + history + tail));
  // unknown state name
  assert(ThrowsMalformed(head + "state: archived\ncreated_at: 2026-10-19T10:00:00Z\n" + history + tail));
  // hyphenated spelling is not the wire form
  assert(ThrowsMalformed(head + "state: needs-action\ncreated_at: 2026-10-19T10:00:00Z\n" + history + tail));
  // missing required state
  assert(ThrowsMalformed(head + "created_at: 2026-10-19T10:00:00Z\n" + history + tail));
  // bad timestamp
  assert(ThrowsMalformed(head + "state: entry\ncreated_at: yesterday\n" + history + tail));
  // negative retry count
  assert(ThrowsMalformed(head + "state: entry\ncreated_at: 2026-10-19T10:00:00Z\nretry_count: -1\n" + history + tail));
  // history entry with unknown key
  assert(ThrowsMalformed(head + "state: entry\ncreated_at: 2026-10-19T10:00:00Z\n" + history + "    mood: happy\n" + tail));
  // history must be a list
  assert(ThrowsMalformed(head + "state: entry\ncreated_at: 2026-10-19T10:00:00Z\nstate_history: entry\n" + tail));
  // no frontmatter delimiters
  assert(ThrowsMalformed("task_id: T-1\nstate: entry\n"));
  assert(ThrowsMalformed(head + "state: entry\n"));
  // frontmatter that is not a mapping
  assert(ThrowsMalformed("---\n- a\n- b\n---\n\nbody"));
}

} // namespace

int main() {
  TestTaskRoundTrip();
  TestBodyIsPreservedExactly();
  TestApprovalRoundTrip();
  TestDefaultsForOptionalFields();
  TestStrictDecodingRejectsBadInput();

  std::cout << "taskvault_unit_frontmatter: pass\n";
  return 0;
}
