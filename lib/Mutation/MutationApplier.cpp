//===- MutationApplier.cpp - Transactional source mutation ----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Mutation/MutationApplier.h"
#include "mutagen/CAST/Parser.h"
#include "mutagen/Support/Diagnostics.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "mutagen-applier"

using namespace mutagen;

static llvm::Expected<std::string> readFile(StringRef path) {
  auto bufferOrErr = llvm::MemoryBuffer::getFile(
      path, /*IsText=*/false, /*RequiresNullTerminator=*/false);
  if (!bufferOrErr)
    return llvm::createStringError(bufferOrErr.getError(),
                                   "failed to read '%s'", path.str().c_str());
  return (*bufferOrErr)->getBuffer().str();
}

static llvm::Error writeFile(StringRef path, StringRef contents) {
  std::error_code ec;
  llvm::raw_fd_ostream os(path, ec);
  if (ec)
    return llvm::createStringError(ec, "failed to open '%s' for writing",
                                   path.str().c_str());
  os << contents;
  os.close();
  if (os.has_error()) {
    ec = os.error();
    os.clear_error();
    return llvm::createStringError(ec, "failed to write '%s'",
                                   path.str().c_str());
  }
  return llvm::Error::success();
}

std::string mutagen::getBackupPath(StringRef file) {
  return (file + ".mutagen-orig").str();
}

//===----------------------------------------------------------------------===//
// Apply
//===----------------------------------------------------------------------===//

llvm::Expected<MutationHandle>
mutagen::applyMutation(const Document &document, const MutationSite &site) {
  auto loc = document.decode(site.formId, site.coord);
  if (!loc)
    return loc.takeError();

  auto replacement = parseFragment(site.replacement);
  if (!replacement)
    return makeError(ErrorKind::MutationApplyFailure,
                     "cannot splice replacement of " + site.getId() + ": " +
                         llvm::toString(replacement.takeError()));

  std::string mutated = document.replace(*loc, *replacement).render();
  return applyMutatedText(document.getFile(), document.render(), mutated,
                          site.getId());
}

llvm::Expected<MutationHandle>
mutagen::applyMutatedText(StringRef file, StringRef expectedText,
                          StringRef mutatedText, StringRef label) {
  std::string backup = getBackupPath(file);
  if (llvm::sys::fs::exists(backup))
    return makeError(ErrorKind::MutationApplyFailure,
                     "'" + file + "' already has an outstanding mutation");

  auto current = readFile(file);
  if (!current)
    return makeError(ErrorKind::MutationApplyFailure,
                     llvm::toString(current.takeError()));
  if (*current != expectedText)
    return makeError(ErrorKind::MutationApplyFailure,
                     "'" + file + "' changed since it was scanned");

  if (auto err = writeFile(backup, expectedText))
    return makeError(ErrorKind::MutationApplyFailure,
                     llvm::toString(std::move(err)));

  MutationHandle handle(file.str(), expectedText.str(), label.str());
  if (auto err = writeFile(file, mutatedText)) {
    std::string reason = llvm::toString(std::move(err));
    // The file may be half written; put the original back before giving up.
    if (auto revertErr = revertMutation(handle))
      return std::move(revertErr);
    return makeError(ErrorKind::MutationApplyFailure, reason);
  }
  LLVM_DEBUG(llvm::dbgs() << "applied " << label << " to " << file << "\n");
  return handle;
}

//===----------------------------------------------------------------------===//
// Revert
//===----------------------------------------------------------------------===//

llvm::Error mutagen::revertMutation(MutationHandle &handle) {
  if (handle.reverted)
    return llvm::Error::success();

  if (auto err = writeFile(handle.file, handle.originalText))
    return makeError(ErrorKind::RevertFailure,
                     "cannot restore '" + handle.file +
                         "': " + llvm::toString(std::move(err)));

  auto restored = ContentHash::fromFile(handle.file);
  if (!restored)
    return makeError(ErrorKind::RevertFailure,
                     "cannot verify '" + handle.file +
                         "': " + llvm::toString(restored.takeError()));
  if (*restored != handle.originalHash)
    return makeError(ErrorKind::RevertFailure,
                     "'" + handle.file + "' does not match its original "
                                         "content after reverting " +
                         handle.label);

  handle.reverted = true;
  if (auto ec = llvm::sys::fs::remove(getBackupPath(handle.file)))
    emitWarning("could not remove backup of '" + handle.file +
                "': " + ec.message());
  LLVM_DEBUG(llvm::dbgs() << "reverted " << handle.label << "\n");
  return llvm::Error::success();
}

llvm::Expected<std::vector<std::string>>
mutagen::recoverBackups(ArrayRef<std::string> files) {
  std::vector<std::string> restored;
  for (const std::string &file : files) {
    std::string backup = getBackupPath(file);
    if (!llvm::sys::fs::exists(backup))
      continue;
    auto original = readFile(backup);
    if (!original)
      return makeError(ErrorKind::RevertFailure,
                       llvm::toString(original.takeError()));
    if (auto err = writeFile(file, *original))
      return makeError(ErrorKind::RevertFailure,
                       "cannot restore '" + file +
                           "': " + llvm::toString(std::move(err)));
    if (auto ec = llvm::sys::fs::remove(backup))
      return makeError(ErrorKind::RevertFailure,
                       "cannot remove backup '" + backup +
                           "': " + ec.message());
    emitWarning("restored '" + file + "' from a backup left by a previous run",
                file);
    restored.push_back(file);
  }
  return restored;
}

//===----------------------------------------------------------------------===//
// ScopedMutation
//===----------------------------------------------------------------------===//

llvm::Error ScopedMutation::revert() { return revertMutation(handle); }

ScopedMutation::~ScopedMutation() {
  if (auto err = revertMutation(handle))
    llvm::report_fatal_error("failed to revert mutation of '" +
                             handle.getFile() +
                             "': " + llvm::toString(std::move(err)));
}
