#include "internal/model/task_state.hpp"

namespace taskvault::model {
namespace {

constexpr std::array<std::string_view, kTaskStateCount> kStateNames = {
    "entry", "needs_action", "in_progress", "pending_approval", "approved", "rejected", "done", "error_queue", "failed",
};

constexpr std::array<std::string_view, kFolderCount> kFolderNames = {
    "Inbox", "Needs_Action", "In_Progress", "Approvals", "Done", "Error_Queue",
};

} // namespace

std::string_view ToString(TaskState state) {
  const auto index = static_cast<std::size_t>(state);
  return index < kStateNames.size() ? kStateNames[index] : "unknown";
}

std::optional<TaskState> ParseTaskState(std::string_view text) {
  for (std::size_t i = 0; i < kStateNames.size(); ++i) {
    if (kStateNames[i] == text) {
      return kAllStates[i];
    }
  }
  return std::nullopt;
}

std::string_view ToString(Folder folder) {
  const auto index = static_cast<std::size_t>(folder);
  return index < kFolderNames.size() ? kFolderNames[index] : "unknown";
}

std::optional<Folder> ParseFolder(std::string_view text) {
  for (std::size_t i = 0; i < kFolderNames.size(); ++i) {
    if (kFolderNames[i] == text) {
      return kAllFolders[i];
    }
  }
  return std::nullopt;
}

} // namespace taskvault::model
