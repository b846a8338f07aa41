#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/auditor/consistency_auditor.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/posix_file_system.hpp"

/*
  Read-only vault health check.

  Exit codes: 0 clean, 1 violations found, 2 usage or load error.
*/

static void Usage() {
  std::cerr << "Usage: taskvault-audit <vault-root> [--max-retries N] [--config FILE]\n";
}

int main(int argc, char** argv) {
  std::optional<std::string> vault_root;
  std::optional<std::string> config_path;
  std::optional<uint32_t>    max_retries;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--max-retries" && i + 1 < argc) {
      try {
        max_retries = static_cast<uint32_t>(std::stoul(argv[++i]));
      } catch (const std::exception&) {
        Usage();
        return 2;
      }
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (!vault_root && arg.rfind("--", 0) != 0) {
      vault_root = arg;
    } else {
      Usage();
      return 2;
    }
  }
  if (!vault_root) {
    Usage();
    return 2;
  }

  try {
    auto config = config_path ? taskvault::config::ConfigLoader::LoadFromYaml(*config_path) : taskvault::config::ConfigLoader::Defaults();
    taskvault::observability::InitializeLogging(config);

    taskvault::auditor::ConsistencyAuditor auditor(std::make_shared<taskvault::storage::PosixFileSystem>(),
                                                   taskvault::storage::VaultLayout(*vault_root),
                                                   max_retries.value_or(config.retry().max_retries()));
    const auto report = auditor.Run();

    for (const auto& violation : report.violations) {
      std::cout << violation.path << ": " << violation.rule << ": " << violation.detail << "\n";
    }
    std::cout << report.files_checked << " files checked, " << report.violations.size() << " violations\n";

    taskvault::observability::ShutdownLogging();
    return report.Clean() ? 0 : 1;
  } catch (const std::exception& e) {
    TASKVAULT_LOG_ERROR("Audit failed", {taskvault::observability::StringField("error", e.what())});
    taskvault::observability::ShutdownLogging();
    return 2;
  }
}
