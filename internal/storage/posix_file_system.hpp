#pragma once

#include "internal/storage/file_system.hpp"

namespace taskvault::storage {

class PosixFileSystem : public FileSystem {
 public:
  std::string Read(const std::filesystem::path& path) override;
  void        WriteNew(const std::filesystem::path& path, std::string_view contents) override;
  void        Rename(const std::filesystem::path& from, const std::filesystem::path& to) override;
  void        RenameNoReplace(const std::filesystem::path& from, const std::filesystem::path& to) override;
  void        Remove(const std::filesystem::path& path) override;
  bool        Exists(const std::filesystem::path& path) override;

  std::vector<std::string> List(const std::filesystem::path& dir) override;

  void AppendLine(const std::filesystem::path& path, std::string_view line) override;
  void CreateDirectories(const std::filesystem::path& dir) override;
};

} // namespace taskvault::storage
