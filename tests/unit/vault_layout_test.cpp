#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/crypto/digest.hpp"
#include "internal/storage/vault_layout.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "tests/support/test_vault.hpp"

namespace {

using taskvault::model::Folder;
using taskvault::storage::VaultLayout;

bool RejectsId(const std::string& id) {
  try {
    VaultLayout::ValidateRecordId(id);
  } catch (const taskvault::util::MalformedRecord&) {
    return true;
  }
  return false;
}

void TestPaths() {
  VaultLayout layout("/srv/vault");
  assert(layout.FolderPath(Folder::kNeedsAction) == std::filesystem::path("/srv/vault/Needs_Action"));
  assert(layout.FolderPath(Folder::kErrorQueue) == std::filesystem::path("/srv/vault/Error_Queue"));
  assert(layout.RecordPath(Folder::kApprovals, "APR-T-1-1") == std::filesystem::path("/srv/vault/Approvals/APR-T-1-1.md"));
  assert(layout.LogsDir() == std::filesystem::path("/srv/vault/Logs"));
  assert(layout.NonceLedgerPath() == std::filesystem::path("/srv/vault/.taskvault/approval_nonces.txt"));
}

void TestInitializeCreatesEveryFolder() {
  taskvault::testing::TempVault vault("layout_init");
  for (auto folder : taskvault::model::kAllFolders) {
    assert(std::filesystem::is_directory(vault.Layout().FolderPath(folder)));
  }
  assert(std::filesystem::is_directory(vault.Layout().LogsDir()));
  assert(std::filesystem::is_directory(vault.Layout().StateDir()));

  // idempotent
  vault.Layout().Initialize(*vault.Fs());
}

void TestRecordIds() {
  VaultLayout::ValidateRecordId("T-20261019-ab12cd34");
  VaultLayout::ValidateRecordId("invoice_42.v2");
  assert(RejectsId(""));
  assert(RejectsId(".hidden"));
  assert(RejectsId("../escape"));
  assert(RejectsId("a/b"));
  assert(RejectsId("with space"));

  assert(VaultLayout::FileName("T-1") == "T-1.md");
  assert(VaultLayout::RecordIdFromFileName("T-1.md") == std::string("T-1"));
  assert(!VaultLayout::RecordIdFromFileName("T-1.txt"));
  assert(!VaultLayout::RecordIdFromFileName(".T-1.md"));
  assert(!VaultLayout::RecordIdFromFileName(".md"));
}

void TestHiddenNames() {
  const auto claim = VaultLayout::ClaimName("T-1.md", "abcd1234");
  const auto temp  = VaultLayout::TempName("T-1.md", "abcd1234");
  assert(VaultLayout::IsHidden(claim));
  assert(VaultLayout::IsHidden(temp));
  assert(claim != temp);

  assert(VaultLayout::ClaimedFileName(claim) == std::string("T-1.md"));
  assert(!VaultLayout::ClaimedFileName(temp));
  assert(VaultLayout::TempFileName(temp) == std::string("T-1.md"));
  assert(!VaultLayout::TempFileName(claim));
  assert(!VaultLayout::ClaimedFileName("T-1.md"));
}

void TestDigest() {
  assert(taskvault::crypto::Sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(taskvault::crypto::Sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  assert(taskvault::crypto::DigestEquals("BA7816BF", "ba7816bf"));
  assert(!taskvault::crypto::DigestEquals("ba7816bf", "ba7816be"));
  assert(!taskvault::crypto::DigestEquals("ba78", "ba7816bf"));
}

void TestTimestamps() {
  const auto tp = taskvault::util::ParseTimestamp("2026-10-19T23:59:59Z");
  assert(taskvault::util::FormatTimestamp(tp) == "2026-10-19T23:59:59Z");
  assert(taskvault::util::DayStamp(tp) == "2026-10-19");
  assert(taskvault::util::CompactDayStamp(tp) == "20261019");
  assert(taskvault::util::DayStamp(tp + std::chrono::seconds(1)) == "2026-10-20");
  assert(taskvault::util::FromProto(taskvault::util::ToProto(tp)) == tp);

  bool threw = false;
  try {
    taskvault::util::ParseTimestamp("19/10/2026");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestUuid() {
  const auto id   = taskvault::util::GenerateUUID();
  const auto text = taskvault::util::ToString(id);
  assert(taskvault::util::IsCanonical(text));
  assert(text[14] == '4');
  assert(taskvault::util::ToString(taskvault::util::GenerateUUID()) != text);
  assert(!taskvault::util::IsCanonical("ABCDEF00-0000-4000-8000-000000000000"));
}

} // namespace

int main() {
  TestPaths();
  TestInitializeCreatesEveryFolder();
  TestRecordIds();
  TestHiddenNames();
  TestDigest();
  TestTimestamps();
  TestUuid();

  std::cout << "taskvault_unit_vault_layout: pass\n";
  return 0;
}
