#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace taskvault::model {

enum class TaskState : std::uint8_t {
  kEntry           = 0,
  kNeedsAction     = 1,
  kInProgress      = 2,
  kPendingApproval = 3,
  kApproved        = 4,
  kRejected        = 5,
  kDone            = 6,
  kErrorQueue      = 7,
  kFailed          = 8,
};

inline constexpr std::size_t kTaskStateCount = 9;

enum class Folder : std::uint8_t {
  kInbox       = 0,
  kNeedsAction = 1,
  kInProgress  = 2,
  kApprovals   = 3,
  kDone        = 4,
  kErrorQueue  = 5,
};

inline constexpr std::size_t kFolderCount = 6;

inline constexpr std::array<TaskState, kTaskStateCount> kAllStates = {
    TaskState::kEntry,    TaskState::kNeedsAction, TaskState::kInProgress, TaskState::kPendingApproval, TaskState::kApproved,
    TaskState::kRejected, TaskState::kDone,        TaskState::kErrorQueue, TaskState::kFailed,
};

inline constexpr std::array<Folder, kFolderCount> kAllFolders = {
    Folder::kInbox, Folder::kNeedsAction, Folder::kInProgress, Folder::kApprovals, Folder::kDone, Folder::kErrorQueue,
};

constexpr bool IsTerminal(TaskState state) {
  return state == TaskState::kDone || state == TaskState::kRejected || state == TaskState::kFailed;
}

// Wire names as persisted in frontmatter and the audit log.
std::string_view           ToString(TaskState state);
std::optional<TaskState>   ParseTaskState(std::string_view text);

// Directory names under the vault root.
std::string_view        ToString(Folder folder);
std::optional<Folder>   ParseFolder(std::string_view text);

} // namespace taskvault::model
