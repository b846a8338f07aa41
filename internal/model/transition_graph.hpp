#pragma once

#include <vector>

#include "internal/model/task_state.hpp"

namespace taskvault::model {

/*
  Canonical transition graph.

  Two independent tables:
    edges     state -> allowed next states
    licences  folder -> states permitted to reside there

  Both the engine and the consistency auditor consult only these
  functions. Everything here is pure and lock free.
*/

namespace detail {

using StateMask = std::uint16_t;

constexpr StateMask Bit(TaskState state) {
  return static_cast<StateMask>(1u << static_cast<unsigned>(state));
}

constexpr bool IsKnown(TaskState state) {
  return static_cast<std::size_t>(state) < kTaskStateCount;
}

constexpr bool IsKnown(Folder folder) {
  return static_cast<std::size_t>(folder) < kFolderCount;
}

// indexed by TaskState
inline constexpr std::array<StateMask, kTaskStateCount> kEdges = {
    /* entry            */ Bit(TaskState::kNeedsAction) | Bit(TaskState::kPendingApproval),
    /* needs_action     */ Bit(TaskState::kInProgress) | Bit(TaskState::kPendingApproval) | Bit(TaskState::kErrorQueue),
    /* in_progress      */ Bit(TaskState::kDone) | Bit(TaskState::kPendingApproval) | Bit(TaskState::kErrorQueue),
    /* pending_approval */ Bit(TaskState::kInProgress) | Bit(TaskState::kRejected),
    /* approved         */ 0,
    /* rejected         */ 0,
    /* done             */ 0,
    /* error_queue      */ Bit(TaskState::kNeedsAction) | Bit(TaskState::kFailed),
    /* failed           */ 0,
};

// indexed by Folder
inline constexpr std::array<StateMask, kFolderCount> kLicences = {
    /* Inbox        */ Bit(TaskState::kEntry),
    /* Needs_Action */ Bit(TaskState::kNeedsAction) | Bit(TaskState::kErrorQueue),
    /* In_Progress  */ Bit(TaskState::kInProgress),
    /* Approvals    */ Bit(TaskState::kPendingApproval) | Bit(TaskState::kApproved),
    /* Done         */ Bit(TaskState::kDone) | Bit(TaskState::kRejected) | Bit(TaskState::kFailed),
    /* Error_Queue  */ Bit(TaskState::kErrorQueue),
};

// indexed by TaskState
inline constexpr std::array<Folder, kTaskStateCount> kHomeFolders = {
    Folder::kInbox,     Folder::kNeedsAction, Folder::kInProgress, Folder::kApprovals,  Folder::kApprovals,
    Folder::kDone,      Folder::kDone,        Folder::kErrorQueue, Folder::kDone,
};

} // namespace detail

// Self-loops and unknown states are always refused.
constexpr bool IsAllowed(TaskState from, TaskState to) {
  if (!detail::IsKnown(from) || !detail::IsKnown(to) || from == to) {
    return false;
  }
  return (detail::kEdges[static_cast<std::size_t>(from)] & detail::Bit(to)) != 0;
}

constexpr bool IsLicensed(TaskState state, Folder folder) {
  if (!detail::IsKnown(state) || !detail::IsKnown(folder)) {
    return false;
  }
  return (detail::kLicences[static_cast<std::size_t>(folder)] & detail::Bit(state)) != 0;
}

// Folder a state is placed in when the caller names no destination.
constexpr Folder HomeFolder(TaskState state) {
  return detail::IsKnown(state) ? detail::kHomeFolders[static_cast<std::size_t>(state)] : Folder::kInbox;
}

// Edges out of pending_approval need a decided approval record.
constexpr bool RequiresApproval(TaskState from, TaskState to) {
  return from == TaskState::kPendingApproval && IsAllowed(from, to);
}

/*
  Lifecycle of an approval record itself. Approval records never take
  engine edges; a decision moves them pending_approval -> approved (stays
  in Approvals) or pending_approval -> rejected (filed under Done).
*/
constexpr bool IsApprovalDecisionEdge(TaskState from, TaskState to) {
  return from == TaskState::kPendingApproval && (to == TaskState::kApproved || to == TaskState::kRejected);
}

std::vector<Folder>    FoldersFor(TaskState state);
std::vector<TaskState> StatesIn(Folder folder);
std::vector<TaskState> NextStates(TaskState state);

} // namespace taskvault::model
