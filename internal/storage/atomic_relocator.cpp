#include "internal/storage/atomic_relocator.hpp"

#include <cerrno>

#include "internal/observability/logging.hpp"
#include "internal/storage/vault_layout.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace taskvault::storage {

using observability::StringField;
using util::FileOperationError;

namespace {

std::string Token() {
  return util::ToString(util::GenerateUUID()).substr(0, 8);
}

} // namespace

AtomicRelocator::AtomicRelocator(FileSystemPtr fs) : fs_(std::move(fs)) {
}

RelocationOutcome AtomicRelocator::Relocate(const std::filesystem::path& source, const std::filesystem::path& destination,
                                            const Rewrite& rewrite) {
  const auto token = Token();
  const auto claim = source.parent_path() / VaultLayout::ClaimName(source.filename().string(), token);
  const auto temp  = destination.parent_path() / VaultLayout::TempName(destination.filename().string(), token);

  // ------------------------------------------------------------
  // Claim
  // ------------------------------------------------------------
  try {
    fs_->Rename(source, claim);
  } catch (const FileOperationError& e) {
    if (e.Errno() == ENOENT) {
      return RelocationOutcome::kSourceVanished;
    }
    throw;
  }

  bool temp_written = false;
  bool published    = false;
  try {
    const auto current = fs_->Read(claim);
    const auto next    = rewrite(current);
    if (!next) {
      Rollback(source, claim, temp, destination, false, false);
      return RelocationOutcome::kSourceChanged;
    }

    if (destination != source && fs_->Exists(destination)) {
      throw FileOperationError("destination already exists: " + destination.string(), destination.string(), EEXIST);
    }

    fs_->WriteNew(temp, *next);
    temp_written = true;

    fs_->RenameNoReplace(temp, destination);
    published = true;

    fs_->Remove(claim);
  } catch (...) {
    Rollback(source, claim, temp, destination, temp_written, published);
    throw;
  }

  return RelocationOutcome::kMoved;
}

void AtomicRelocator::Rollback(const std::filesystem::path& source, const std::filesystem::path& claim, const std::filesystem::path& temp,
                               const std::filesystem::path& destination, bool temp_written, bool published) {
  try {
    if (published) {
      fs_->Remove(destination);
    } else if (temp_written) {
      fs_->Remove(temp);
    }
  } catch (const FileOperationError& e) {
    TASKVAULT_LOG_ERROR("Relocation rollback could not remove partial output",
                        {StringField("path", e.Path()), StringField("error", e.what())});
  }

  try {
    fs_->Rename(claim, source);
  } catch (const FileOperationError& e) {
    // the record survives under its claim name; RecoverOrphans restores it
    TASKVAULT_LOG_ERROR("Relocation rollback could not restore source",
                        {StringField("source", source.string()), StringField("claim", claim.string()), StringField("error", e.what())});
  }
}

void AtomicRelocator::Publish(const std::filesystem::path& destination, std::string_view contents) {
  const auto temp = destination.parent_path() / VaultLayout::TempName(destination.filename().string(), Token());

  fs_->WriteNew(temp, contents);
  try {
    fs_->RenameNoReplace(temp, destination);
  } catch (const FileOperationError&) {
    try {
      fs_->Remove(temp);
    } catch (const FileOperationError& cleanup) {
      TASKVAULT_LOG_WARN("Could not remove temp file", {StringField("path", temp.string()), StringField("error", cleanup.what())});
    }
    throw;
  }
}

RecoveryReport AtomicRelocator::RecoverOrphans(const std::filesystem::path& folder) {
  RecoveryReport report;

  for (const auto& name : fs_->List(folder)) {
    const auto path = folder / name;

    if (VaultLayout::TempFileName(name)) {
      try {
        fs_->Remove(path);
        report.discarded.push_back(path.string());
      } catch (const FileOperationError& e) {
        if (e.Errno() != ENOENT) throw;
      }
      continue;
    }

    if (auto original = VaultLayout::ClaimedFileName(name)) {
      const auto target = folder / *original;
      try {
        fs_->RenameNoReplace(path, target);
        report.restored.push_back(target.string());
      } catch (const FileOperationError& e) {
        if (e.Errno() == ENOENT) continue;
        if (e.Errno() != EEXIST) throw;
        report.stuck.push_back(path.string());
        TASKVAULT_LOG_WARN("Orphaned claim shadows an existing record", {StringField("claim", path.string()), StringField("record", target.string())});
      }
    }
  }

  return report;
}

} // namespace taskvault::storage
