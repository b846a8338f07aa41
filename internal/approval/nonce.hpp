#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "internal/storage/file_system.hpp"

namespace taskvault::approval {

// Fresh single-use token: a lowercase UUID v4.
std::string GenerateNonce();

// Canonical lowercase UUID (8-4-4-4-12 hex).
bool IsWellFormedNonce(std::string_view nonce);

std::string NormalizeNonce(std::string_view nonce);

/*
  Durable record of consumed nonces.

  One nonce per line, appended only. Survives restores of approval files
  from backup, so a pending copy of an already decided approval can never
  be decided a second time.
*/
class NonceLedger {
 public:
  NonceLedger(storage::FileSystemPtr fs, std::filesystem::path path);

  bool Contains(std::string_view nonce) const;
  void Consume(std::string_view nonce);

 private:
  storage::FileSystemPtr fs_;
  std::filesystem::path  path_;
};

} // namespace taskvault::approval
