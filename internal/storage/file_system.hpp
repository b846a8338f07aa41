#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace taskvault::storage {

/*
  Filesystem abstraction.

  The vault's only durable store is an ordinary directory tree; every
  mutation the engine performs goes through this interface so tests can
  inject failures at any step.

  Failures throw util::FileOperationError carrying the path and errno.

  Implementations:
    POSIX  → PosixFileSystem
    tests  → fault-injecting wrappers
*/

class FileSystem {
 public:
  virtual ~FileSystem() = default;

  // ------------------------------------------------------------------
  // Read
  // ------------------------------------------------------------------
  virtual std::string Read(const std::filesystem::path& path) = 0;

  // ------------------------------------------------------------------
  // WriteNew
  // ------------------------------------------------------------------
  /*
    Create `path` exclusively, write all of `contents`, fsync, close.

    Fails with EEXIST if the path already exists.
  */
  virtual void WriteNew(const std::filesystem::path& path, std::string_view contents) = 0;

  // ------------------------------------------------------------------
  // Rename
  // ------------------------------------------------------------------
  /*
    rename(2): atomic, replaces `to` if it exists. ENOENT when `from`
    has already been taken by another process.
  */
  virtual void Rename(const std::filesystem::path& from, const std::filesystem::path& to) = 0;

  /*
    Atomic rename that fails with EEXIST instead of replacing `to`.
  */
  virtual void RenameNoReplace(const std::filesystem::path& from, const std::filesystem::path& to) = 0;

  // ------------------------------------------------------------------
  // Remove / Exists
  // ------------------------------------------------------------------
  virtual void Remove(const std::filesystem::path& path) = 0;
  virtual bool Exists(const std::filesystem::path& path) = 0;

  // ------------------------------------------------------------------
  // List
  // ------------------------------------------------------------------
  /*
    Names of the regular files directly under `dir`, hidden ones
    included, sorted. A point-in-time snapshot only.
  */
  virtual std::vector<std::string> List(const std::filesystem::path& dir) = 0;

  // ------------------------------------------------------------------
  // AppendLine
  // ------------------------------------------------------------------
  /*
    Append `line` plus '\n' with a single write(2) on an O_APPEND
    descriptor, creating the file if needed. Concurrent appenders never
    interleave within a line.
  */
  virtual void AppendLine(const std::filesystem::path& path, std::string_view line) = 0;

  virtual void CreateDirectories(const std::filesystem::path& dir) = 0;
};

using FileSystemPtr = std::shared_ptr<FileSystem>;

} // namespace taskvault::storage
