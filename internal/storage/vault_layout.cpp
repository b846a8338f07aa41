#include "internal/storage/vault_layout.hpp"

#include "internal/util/errors.hpp"

namespace taskvault::storage {
namespace {

constexpr std::string_view kRecordExtension = ".md";
constexpr std::string_view kClaimMarker     = ".claim-";
constexpr std::string_view kTempMarker      = ".tmp-";

// ".<file><marker><token>" -> "<file>"
std::optional<std::string> StripHidden(std::string_view hidden_name, std::string_view marker) {
  if (!VaultLayout::IsHidden(hidden_name)) {
    return std::nullopt;
  }
  const auto pos = hidden_name.rfind(marker);
  if (pos == std::string_view::npos || pos <= 1) {
    return std::nullopt;
  }
  return std::string(hidden_name.substr(1, pos - 1));
}

} // namespace

VaultLayout::VaultLayout(std::filesystem::path root) : root_(std::move(root)) {
}

std::filesystem::path VaultLayout::FolderPath(model::Folder folder) const {
  return root_ / std::string(model::ToString(folder));
}

std::filesystem::path VaultLayout::RecordPath(model::Folder folder, const std::string& record_id) const {
  ValidateRecordId(record_id);
  return FolderPath(folder) / FileName(record_id);
}

std::filesystem::path VaultLayout::LogsDir() const {
  return root_ / "Logs";
}

std::filesystem::path VaultLayout::StateDir() const {
  return root_ / ".taskvault";
}

std::filesystem::path VaultLayout::NonceLedgerPath() const {
  return StateDir() / "approval_nonces.txt";
}

void VaultLayout::Initialize(FileSystem& fs) const {
  for (auto folder : model::kAllFolders) {
    fs.CreateDirectories(FolderPath(folder));
  }
  fs.CreateDirectories(LogsDir());
  fs.CreateDirectories(StateDir());
}

void VaultLayout::ValidateRecordId(const std::string& record_id) {
  if (record_id.empty()) {
    throw util::MalformedRecord("record id must not be empty");
  }
  if (record_id.front() == '.') {
    throw util::MalformedRecord("record id '" + record_id + "' must not start with '.'");
  }
  for (char c : record_id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.';
    if (!ok) {
      throw util::MalformedRecord("record id '" + record_id + "' contains invalid character");
    }
  }
}

std::string VaultLayout::FileName(const std::string& record_id) {
  return record_id + std::string(kRecordExtension);
}

std::optional<std::string> VaultLayout::RecordIdFromFileName(std::string_view file_name) {
  if (IsHidden(file_name) || file_name.size() <= kRecordExtension.size()) {
    return std::nullopt;
  }
  if (file_name.substr(file_name.size() - kRecordExtension.size()) != kRecordExtension) {
    return std::nullopt;
  }
  return std::string(file_name.substr(0, file_name.size() - kRecordExtension.size()));
}

bool VaultLayout::IsHidden(std::string_view file_name) {
  return !file_name.empty() && file_name.front() == '.';
}

std::string VaultLayout::ClaimName(std::string_view file_name, std::string_view token) {
  return "." + std::string(file_name) + std::string(kClaimMarker) + std::string(token);
}

std::string VaultLayout::TempName(std::string_view file_name, std::string_view token) {
  return "." + std::string(file_name) + std::string(kTempMarker) + std::string(token);
}

std::optional<std::string> VaultLayout::ClaimedFileName(std::string_view hidden_name) {
  return StripHidden(hidden_name, kClaimMarker);
}

std::optional<std::string> VaultLayout::TempFileName(std::string_view hidden_name) {
  return StripHidden(hidden_name, kTempMarker);
}

} // namespace taskvault::storage
