#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/approval/approval_gate.hpp"
#include "internal/audit/audit_logger.hpp"
#include "internal/audit/audit_query.hpp"
#include "internal/core/task_manager.hpp"
#include "internal/storage/file_system.hpp"
#include "internal/storage/vault_layout.hpp"
#include "internal/util/time.hpp"

namespace taskvault::factory {

/*
  VaultRuntime

  Owns every component bound to one vault root. Everything here lives
  for the lifetime of the process.
*/
struct VaultRuntime {
  std::shared_ptr<storage::FileSystem>    fs;
  std::shared_ptr<storage::VaultLayout>   layout;
  std::shared_ptr<audit::AuditLogger>     audit;
  std::shared_ptr<audit::AuditLog>        audit_log;
  std::shared_ptr<approval::ApprovalGate> gate;
  std::shared_ptr<core::TaskManager>      manager;
};

/*
  Build

  Composition root: the only place that knows the concrete filesystem.
  Does not create the vault folders; that is VaultLayout::Initialize.
*/
VaultRuntime Build(const taskvault::runtime::config::RuntimeConfig& config, util::ClockFn clock = util::Now);

} // namespace taskvault::factory
