//===- MutationApplier.h - Transactional source mutation --------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Applying a mutation writes a backup of the file (`<file>.mutagen-orig`)
// before touching it, then writes the mutated text. Reverting writes the
// original text back, verifies the file's digest against the pre-apply digest
// and removes the backup. A backup left behind by a crashed run is restored
// by recoverBackups at the next start.
//
// At most one mutation per file may be outstanding: applying to a file that
// still has a backup fails.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_MUTATION_MUTATIONAPPLIER_H
#define MUTAGEN_MUTATION_MUTATIONAPPLIER_H

#include "mutagen/CAST/Document.h"
#include "mutagen/Mutation/MutationSite.h"
#include "mutagen/Support/ContentHash.h"
#include "llvm/Support/Error.h"
#include <optional>
#include <string>
#include <vector>

namespace mutagen {

/// The pre-edit state of a mutated file.
class MutationHandle {
public:
  MutationHandle(std::string file, std::string originalText, std::string label)
      : file(std::move(file)), originalText(std::move(originalText)),
        originalHash(ContentHash::fromString(this->originalText)),
        label(std::move(label)) {}

  StringRef getFile() const { return file; }
  StringRef getOriginalText() const { return originalText; }
  const ContentHash &getOriginalHash() const { return originalHash; }
  /// Site id or batch name, for diagnostics.
  StringRef getLabel() const { return label; }
  bool isReverted() const { return reverted; }

private:
  friend llvm::Error revertMutation(MutationHandle &handle);

  std::string file;
  std::string originalText;
  ContentHash originalHash;
  std::string label;
  bool reverted = false;
};

/// Path of the backup written next to `file`.
std::string getBackupPath(StringRef file);

/// Apply `site` to the file backing `document`. The file must still hold the
/// text the document was parsed from. Fails with LocationNotFound if the
/// site does not resolve and MutationApplyFailure if the replacement cannot
/// be spliced or written; the file is untouched in either case.
llvm::Expected<MutationHandle> applyMutation(const Document &document,
                                             const MutationSite &site);

/// Replace the content of `file`, which must currently be `expectedText`,
/// with `mutatedText`.
llvm::Expected<MutationHandle> applyMutatedText(StringRef file,
                                                StringRef expectedText,
                                                StringRef mutatedText,
                                                StringRef label);

/// Restore the original text and verify its digest. Reverting twice is a
/// no-op. Fails with RevertFailure.
llvm::Error revertMutation(MutationHandle &handle);

/// Restore every file in `files` that still has a backup. Returns the
/// restored files. Fails with RevertFailure.
llvm::Expected<std::vector<std::string>>
recoverBackups(ArrayRef<std::string> files);

/// Reverts its mutation on destruction unless it was reverted explicitly.
/// A failure during destruction cannot be reported to the caller and is
/// fatal.
class ScopedMutation {
public:
  explicit ScopedMutation(MutationHandle handle) : handle(std::move(handle)) {}
  ScopedMutation(const ScopedMutation &) = delete;
  ScopedMutation &operator=(const ScopedMutation &) = delete;
  ~ScopedMutation();

  /// Revert now and report failure to the caller.
  llvm::Error revert();

  const MutationHandle &getHandle() const { return handle; }

private:
  MutationHandle handle;
};

} // namespace mutagen

#endif // MUTAGEN_MUTATION_MUTATIONAPPLIER_H
