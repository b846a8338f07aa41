#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/storage/file_system.hpp"
#include "internal/storage/vault_layout.hpp"

namespace taskvault::auditor {

inline constexpr const char* kRuleUnparseable      = "unparseable";
inline constexpr const char* kRuleFolderMismatch   = "folder_mismatch";
inline constexpr const char* kRuleHistoryOrder     = "history_order";
inline constexpr const char* kRuleIllegalEdge      = "illegal_edge";
inline constexpr const char* kRuleHistoryHead      = "history_head";
inline constexpr const char* kRuleRetriesExhausted = "retries_exhausted";
inline constexpr const char* kRuleIntegrity        = "integrity";

struct Violation {
  std::string path;
  std::string rule;
  std::string detail;
};

struct AuditorReport {
  uint64_t               files_checked{0};
  std::vector<Violation> violations;

  bool Clean() const {
    return violations.empty();
  }
};

/*
  Offline, read-only re-check of a whole vault.

  Shares only the transition graph and codec with the engine, so drift
  introduced by manual edits or engine bugs shows up here. Never writes.
*/
class ConsistencyAuditor {
 public:
  ConsistencyAuditor(storage::FileSystemPtr fs, storage::VaultLayout layout, uint32_t max_retries);

  AuditorReport Run() const;

 private:
  storage::FileSystemPtr fs_;
  storage::VaultLayout   layout_;
  uint32_t               max_retries_;
};

} // namespace taskvault::auditor
