#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/storage/file_system.hpp"

namespace taskvault::storage {

enum class RelocationOutcome {
  kMoved,
  // another process claimed the source first
  kSourceVanished,
  // the rewrite declined the claimed contents; source restored untouched
  kSourceChanged,
};

struct RecoveryReport {
  std::vector<std::string> restored;  // claim files renamed back to their record name
  std::vector<std::string> discarded; // stale temp files removed
  std::vector<std::string> stuck;     // claims whose record name is occupied
};

/*
  Moves one record file between folders while rewriting its contents.

  Protocol:
    1. rename source -> hidden claim beside it   (arbitration point)
    2. read claim, compute new contents (nullopt aborts the move)
    3. write hidden temp beside destination, fsync
    4. rename temp -> destination (never replaces)
    5. unlink claim

  Any failure after step 1 removes whatever was written and renames the
  claim back, so the source is left byte-identical and the destination
  absent. Source and destination may be the same path.
*/
class AtomicRelocator {
 public:
  using Rewrite = std::function<std::optional<std::string>(const std::string& current)>;

  explicit AtomicRelocator(FileSystemPtr fs);

  RelocationOutcome Relocate(const std::filesystem::path& source, const std::filesystem::path& destination, const Rewrite& rewrite);

  // Creates a brand-new record at destination. Fails if it exists.
  void Publish(const std::filesystem::path& destination, std::string_view contents);

  // Repairs leftovers of crashed relocations in one folder. Only run it
  // while no other process is relocating in that folder.
  RecoveryReport RecoverOrphans(const std::filesystem::path& folder);

 private:
  void Rollback(const std::filesystem::path& source, const std::filesystem::path& claim, const std::filesystem::path& temp,
                const std::filesystem::path& destination, bool temp_written, bool published);

  FileSystemPtr fs_;
};

} // namespace taskvault::storage
