#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/task_state.hpp"
#include "internal/storage/file_system.hpp"

namespace taskvault::storage {

/*
  Physical layout of a vault:

    <root>/Inbox/<id>.md
    <root>/Needs_Action/<id>.md
    ...
    <root>/Logs/YYYY-MM-DD.log
    <root>/.taskvault/approval_nonces.txt

  Hidden names (leading '.') are engine bookkeeping: claim files held
  during a relocation and temp files being published. They are never
  records.
*/
class VaultLayout {
 public:
  explicit VaultLayout(std::filesystem::path root);

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::filesystem::path FolderPath(model::Folder folder) const;
  std::filesystem::path RecordPath(model::Folder folder, const std::string& record_id) const;
  std::filesystem::path LogsDir() const;
  std::filesystem::path StateDir() const;
  std::filesystem::path NonceLedgerPath() const;

  // Creates every state folder plus Logs and the state dir.
  void Initialize(FileSystem& fs) const;

  // Throws util::MalformedRecord unless id is [A-Za-z0-9._-]+ and not hidden.
  static void ValidateRecordId(const std::string& record_id);

  static std::string FileName(const std::string& record_id);

  // "<id>.md" for visible record files, nullopt otherwise.
  static std::optional<std::string> RecordIdFromFileName(std::string_view file_name);

  static bool IsHidden(std::string_view file_name);

  static std::string ClaimName(std::string_view file_name, std::string_view token);
  static std::string TempName(std::string_view file_name, std::string_view token);

  // Original file name a hidden claim / temp name was derived from.
  static std::optional<std::string> ClaimedFileName(std::string_view hidden_name);
  static std::optional<std::string> TempFileName(std::string_view hidden_name);

 private:
  std::filesystem::path root_;
};

} // namespace taskvault::storage
