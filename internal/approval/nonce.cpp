#include "internal/approval/nonce.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace taskvault::approval {

std::string GenerateNonce() {
  return util::ToString(util::GenerateUUID());
}

std::string NormalizeNonce(std::string_view nonce) {
  std::string out(nonce);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool IsWellFormedNonce(std::string_view nonce) {
  return util::IsCanonical(nonce);
}

NonceLedger::NonceLedger(storage::FileSystemPtr fs, std::filesystem::path path) : fs_(std::move(fs)), path_(std::move(path)) {
}

bool NonceLedger::Contains(std::string_view nonce) const {
  std::string contents;
  try {
    contents = fs_->Read(path_);
  } catch (const util::FileOperationError& e) {
    if (e.Errno() == ENOENT) return false;
    throw;
  }

  const auto wanted = NormalizeNonce(nonce);
  size_t     start  = 0;
  while (start < contents.size()) {
    auto end = contents.find('\n', start);
    if (end == std::string::npos) end = contents.size();
    if (std::string_view(contents).substr(start, end - start) == wanted) {
      return true;
    }
    start = end + 1;
  }
  return false;
}

void NonceLedger::Consume(std::string_view nonce) {
  fs_->AppendLine(path_, NormalizeNonce(nonce));
}

} // namespace taskvault::approval
