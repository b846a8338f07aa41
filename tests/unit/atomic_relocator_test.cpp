#include <cassert>
#include <cerrno>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#include "internal/storage/atomic_relocator.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_vault.hpp"

namespace {

using taskvault::model::Folder;
using taskvault::storage::AtomicRelocator;
using taskvault::storage::RelocationOutcome;
using taskvault::testing::CountHidden;
using taskvault::testing::FaultInjectingFileSystem;
using taskvault::testing::ReadFile;
using taskvault::testing::TempVault;
using taskvault::testing::WriteFile;
using Op = FaultInjectingFileSystem::Op;

const std::string kOriginal = "---\ntask_id: T-1\n---\n\noriginal body\n";

std::string Upper(const std::string& text) {
  std::string out = text;
  for (auto& c : out) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

void TestSuccessfulRelocation() {
  TempVault vault("relocate_ok");
  const auto source = vault.PathOf(Folder::kNeedsAction, "T-1");
  const auto dest   = vault.PathOf(Folder::kInProgress, "T-1");
  WriteFile(source, kOriginal);

  AtomicRelocator relocator(vault.Fs());
  const auto      outcome = relocator.Relocate(source, dest, Upper);

  assert(outcome == RelocationOutcome::kMoved);
  assert(!std::filesystem::exists(source));
  assert(ReadFile(dest) == Upper(kOriginal));
  assert(CountHidden(source.parent_path()) == 0);
  assert(CountHidden(dest.parent_path()) == 0);
}

void TestInPlaceRewrite() {
  TempVault vault("relocate_in_place");
  const auto path = vault.PathOf(Folder::kApprovals, "APR-1");
  WriteFile(path, kOriginal);

  AtomicRelocator relocator(vault.Fs());
  assert(relocator.Relocate(path, path, Upper) == RelocationOutcome::kMoved);
  assert(ReadFile(path) == Upper(kOriginal));
  assert(CountHidden(path.parent_path()) == 0);
}

// Every step after the claim is forced to fail in turn; the source must come
// back byte-identical and nothing may appear at the destination.
void TestFailureAtEachStepRollsBack() {
  const Op steps[] = {Op::kRead, Op::kWriteNew, Op::kRenameNoReplace, Op::kRemove};

  for (auto step : steps) {
    TempVault vault("relocate_rollback");
    const auto source = vault.PathOf(Folder::kNeedsAction, "T-1");
    const auto dest   = vault.PathOf(Folder::kInProgress, "T-1");
    WriteFile(source, kOriginal);

    vault.Fs()->FailOn(step);
    AtomicRelocator relocator(vault.Fs());

    bool threw = false;
    try {
      (void)relocator.Relocate(source, dest, Upper);
    } catch (const taskvault::util::FileOperationError& e) {
      threw = true;
      assert(e.Retryable());
    }

    assert(threw);
    assert(ReadFile(source) == kOriginal);
    assert(!std::filesystem::exists(dest));
    assert(CountHidden(source.parent_path()) == 0);
    assert(CountHidden(dest.parent_path()) == 0);
  }
}

void TestRewriteFailureRollsBack() {
  TempVault vault("relocate_rewrite_throws");
  const auto source = vault.PathOf(Folder::kNeedsAction, "T-1");
  const auto dest   = vault.PathOf(Folder::kInProgress, "T-1");
  WriteFile(source, kOriginal);

  AtomicRelocator relocator(vault.Fs());
  bool            threw = false;
  try {
    (void)relocator.Relocate(source, dest, [](const std::string&) -> std::string { throw taskvault::util::MalformedRecord("bad"); });
  } catch (const taskvault::util::MalformedRecord&) {
    threw = true;
  }

  assert(threw);
  assert(ReadFile(source) == kOriginal);
  assert(!std::filesystem::exists(dest));
}

void TestDeclinedRewriteRestoresSource() {
  TempVault vault("relocate_declined");
  const auto path = vault.PathOf(Folder::kApprovals, "APR-1");
  WriteFile(path, kOriginal);

  AtomicRelocator relocator(vault.Fs());
  const auto      outcome = relocator.Relocate(path, path, [](const std::string&) -> std::optional<std::string> { return std::nullopt; });

  assert(outcome == RelocationOutcome::kSourceChanged);
  assert(ReadFile(path) == kOriginal);
  assert(CountHidden(path.parent_path()) == 0);
}

void TestExistingDestinationIsNeverReplaced() {
  TempVault vault("relocate_dest_exists");
  const auto source = vault.PathOf(Folder::kNeedsAction, "T-1");
  const auto dest   = vault.PathOf(Folder::kInProgress, "T-1");
  WriteFile(source, kOriginal);
  WriteFile(dest, "occupant");

  AtomicRelocator relocator(vault.Fs());
  bool            threw = false;
  try {
    (void)relocator.Relocate(source, dest, Upper);
  } catch (const taskvault::util::FileOperationError& e) {
    threw = e.Errno() == EEXIST;
  }

  assert(threw);
  assert(ReadFile(source) == kOriginal);
  assert(ReadFile(dest) == "occupant");
}

void TestVanishedSourceIsBenign() {
  TempVault vault("relocate_vanished");
  const auto source = vault.PathOf(Folder::kNeedsAction, "T-1");
  const auto dest   = vault.PathOf(Folder::kInProgress, "T-1");

  AtomicRelocator relocator(vault.Fs());
  assert(relocator.Relocate(source, dest, Upper) == RelocationOutcome::kSourceVanished);
  assert(!std::filesystem::exists(dest));
}

void TestLosingTheClaimRace() {
  TempVault vault("relocate_race");
  const auto source = vault.PathOf(Folder::kNeedsAction, "T-1");
  const auto winner = vault.PathOf(Folder::kErrorQueue, "T-1");
  const auto loser  = vault.PathOf(Folder::kInProgress, "T-1");
  WriteFile(source, kOriginal);

  // another process relocates the file between our listing and our claim
  vault.Fs()->before_rename = [&](const std::filesystem::path& from) {
    if (from == source && std::filesystem::exists(source)) {
      std::filesystem::rename(source, winner);
    }
  };

  AtomicRelocator relocator(vault.Fs());
  assert(relocator.Relocate(source, loser, Upper) == RelocationOutcome::kSourceVanished);
  assert(ReadFile(winner) == kOriginal);
  assert(!std::filesystem::exists(loser));
}

void TestPublishRefusesOverwrite() {
  TempVault vault("publish");
  const auto path = vault.PathOf(Folder::kInbox, "T-1");

  AtomicRelocator relocator(vault.Fs());
  relocator.Publish(path, kOriginal);
  assert(ReadFile(path) == kOriginal);

  bool threw = false;
  try {
    relocator.Publish(path, "second");
  } catch (const taskvault::util::FileOperationError& e) {
    threw = e.Errno() == EEXIST;
  }
  assert(threw);
  assert(ReadFile(path) == kOriginal);
  assert(CountHidden(path.parent_path()) == 0);
}

void TestRecoverOrphans() {
  TempVault vault("recover");
  const auto dir = vault.Layout().FolderPath(Folder::kNeedsAction);
  WriteFile(dir / ".T-1.md.claim-deadbeef", kOriginal);
  WriteFile(dir / ".T-2.md.tmp-deadbeef", "partial");
  WriteFile(dir / "T-3.md", kOriginal);
  WriteFile(dir / ".T-3.md.claim-cafebabe", "shadowed");

  AtomicRelocator relocator(vault.Fs());
  const auto      report = relocator.RecoverOrphans(dir);

  assert(report.restored.size() == 1);
  assert(report.discarded.size() == 1);
  assert(report.stuck.size() == 1);
  assert(ReadFile(dir / "T-1.md") == kOriginal);
  assert(!std::filesystem::exists(dir / ".T-2.md.tmp-deadbeef"));
  assert(ReadFile(dir / "T-3.md") == kOriginal);
}

} // namespace

int main() {
  TestSuccessfulRelocation();
  TestInPlaceRewrite();
  TestFailureAtEachStepRollsBack();
  TestRewriteFailureRollsBack();
  TestDeclinedRewriteRestoresSource();
  TestExistingDestinationIsNeverReplaced();
  TestVanishedSourceIsBenign();
  TestLosingTheClaimRace();
  TestPublishRefusesOverwrite();
  TestRecoverOrphans();

  std::cout << "taskvault_unit_atomic_relocator: pass\n";
  return 0;
}
