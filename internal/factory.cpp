#include "factory.hpp"

#include <chrono>

#include "internal/storage/posix_file_system.hpp"

namespace taskvault::factory {

VaultRuntime Build(const taskvault::runtime::config::RuntimeConfig& config, util::ClockFn clock) {
  VaultRuntime runtime;

  runtime.fs     = std::make_shared<storage::PosixFileSystem>();
  runtime.layout = std::make_shared<storage::VaultLayout>(config.vault().root());

  runtime.audit     = std::make_shared<audit::AuditLogger>(runtime.fs, *runtime.layout, clock);
  runtime.audit_log = std::make_shared<audit::AuditLog>(runtime.fs, *runtime.layout);

  const auto ttl = std::chrono::seconds(config.approval().default_ttl().seconds());
  runtime.gate   = std::make_shared<approval::ApprovalGate>(runtime.fs, *runtime.layout, runtime.audit, ttl, clock);

  runtime.manager = std::make_shared<core::TaskManager>(runtime.fs, *runtime.layout, runtime.audit, runtime.gate,
                                                        core::RetryPolicy::FromConfig(config), clock);
  return runtime;
}

} // namespace taskvault::factory
