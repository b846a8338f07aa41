#include "internal/model/transition_graph.hpp"

namespace taskvault::model {

// compile-time checks on the canonical table
static_assert(!IsAllowed(TaskState::kEntry, TaskState::kEntry));
static_assert(!IsAllowed(TaskState::kEntry, TaskState::kDone));
static_assert(IsAllowed(TaskState::kEntry, TaskState::kPendingApproval));
static_assert(IsLicensed(TaskState::kErrorQueue, Folder::kNeedsAction));
static_assert(IsLicensed(TaskState::kErrorQueue, Folder::kErrorQueue));

std::vector<Folder> FoldersFor(TaskState state) {
  std::vector<Folder> folders;
  for (auto folder : kAllFolders) {
    if (IsLicensed(state, folder)) {
      folders.push_back(folder);
    }
  }
  return folders;
}

std::vector<TaskState> StatesIn(Folder folder) {
  std::vector<TaskState> states;
  for (auto state : kAllStates) {
    if (IsLicensed(state, folder)) {
      states.push_back(state);
    }
  }
  return states;
}

std::vector<TaskState> NextStates(TaskState state) {
  std::vector<TaskState> next;
  for (auto to : kAllStates) {
    if (IsAllowed(state, to)) {
      next.push_back(to);
    }
  }
  return next;
}

} // namespace taskvault::model
