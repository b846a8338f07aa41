#include "internal/auditor/consistency_auditor.hpp"

#include <cerrno>

#include "internal/codec/frontmatter.hpp"
#include "internal/crypto/digest.hpp"
#include "internal/model/transition_graph.hpp"
#include "internal/util/errors.hpp"

namespace taskvault::auditor {

using model::Folder;
using model::TaskRecord;
using model::TaskState;

namespace {

std::string Name(TaskState state) {
  return std::string(model::ToString(state));
}

// Rules shared by tasks and approval records. `approval` selects which
// edge table the history is checked against.
void CheckRecord(const TaskRecord& record, Folder folder, bool approval, uint32_t max_retries, const std::string& path,
                 std::vector<Violation>* out) {
  if (!model::IsLicensed(record.state, folder)) {
    out->push_back({path, kRuleFolderMismatch,
                    "declares state " + Name(record.state) + " but resides in " + std::string(model::ToString(folder))});
  }

  const auto& history = record.state_history;
  if (history.empty()) {
    out->push_back({path, kRuleHistoryHead, "state_history is empty"});
  } else if (history.back().state != record.state) {
    out->push_back({path, kRuleHistoryHead, "last history state " + Name(history.back().state) + " differs from state " + Name(record.state)});
  }

  for (size_t i = 1; i < history.size(); ++i) {
    const auto& prev = history[i - 1];
    const auto& curr = history[i];
    if (curr.timestamp < prev.timestamp) {
      out->push_back({path, kRuleHistoryOrder,
                      "entry " + std::to_string(i) + " at " + util::FormatTimestamp(curr.timestamp) + " precedes " +
                          util::FormatTimestamp(prev.timestamp)});
    }
    const bool legal = approval ? model::IsApprovalDecisionEdge(prev.state, curr.state) : model::IsAllowed(prev.state, curr.state);
    if (!legal) {
      out->push_back({path, kRuleIllegalEdge, "history records " + Name(prev.state) + " -> " + Name(curr.state)});
    }
  }

  if (record.state == TaskState::kFailed && record.retry_count < max_retries) {
    out->push_back({path, kRuleRetriesExhausted,
                    "failed with retry_count " + std::to_string(record.retry_count) + " below max_retries " + std::to_string(max_retries)});
  }
}

} // namespace

ConsistencyAuditor::ConsistencyAuditor(storage::FileSystemPtr fs, storage::VaultLayout layout, uint32_t max_retries)
    : fs_(std::move(fs)), layout_(std::move(layout)), max_retries_(max_retries) {
}

AuditorReport ConsistencyAuditor::Run() const {
  AuditorReport report;

  for (auto folder : model::kAllFolders) {
    const auto dir = layout_.FolderPath(folder);

    std::vector<std::string> names;
    try {
      names = fs_->List(dir);
    } catch (const util::FileOperationError& e) {
      if (e.Errno() == ENOENT) continue;
      throw;
    }

    for (const auto& name : names) {
      if (storage::VaultLayout::IsHidden(name)) continue;

      const auto path = (dir / name).string();
      std::string text;
      try {
        text = fs_->Read(dir / name);
      } catch (const util::FileOperationError& e) {
        if (e.Errno() == ENOENT) continue;
        throw;
      }
      ++report.files_checked;

      if (!storage::VaultLayout::RecordIdFromFileName(name)) {
        report.violations.push_back({path, kRuleUnparseable, "file name is not <id>.md"});
        continue;
      }

      try {
        if (codec::IsApprovalDocument(text)) {
          const auto approval = codec::ParseApproval(text);
          CheckRecord(approval, folder, true, max_retries_, path, &report.violations);
          if (approval.integrity_hash) {
            const auto actual = crypto::Sha256Hex(approval.body);
            if (!crypto::DigestEquals(actual, *approval.integrity_hash)) {
              report.violations.push_back({path, kRuleIntegrity, "body digest " + actual + " differs from integrity_hash " + *approval.integrity_hash});
            }
          }
        } else {
          CheckRecord(codec::ParseTask(text), folder, false, max_retries_, path, &report.violations);
        }
      } catch (const util::MalformedRecord& e) {
        report.violations.push_back({path, kRuleUnparseable, e.what()});
      }
    }
  }

  return report;
}

} // namespace taskvault::auditor
