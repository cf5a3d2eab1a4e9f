//===- ChangeDetector.h - Form-level incremental comparison -----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A digest table records one content digest per form and one per test unit.
// Comparing the table of the previous run with the current one tells which
// forms must be rescanned and re-tested; unchanged forms reuse the previous
// run's results. A selection digest over the effective operators and the
// cluster settings invalidates every form when the selection changes.
//
// On-disk format (digests.json):
//   {"version": 1,
//    "selection": "<digest>",
//    "forms": [{"form": "...", "file": "...", "line": N, "digest": "..."}],
//    "units": {"<unit>": "<digest>"}}
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_ENGINE_CHANGEDETECTOR_H
#define MUTAGEN_ENGINE_CHANGEDETECTOR_H

#include "mutagen/CAST/Document.h"
#include "mutagen/Support/ContentHash.h"
#include "mutagen/Support/MutationConfig.h"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include <string>
#include <vector>

namespace mutagen {

struct FormDigest {
  std::string formId;
  std::string file;
  unsigned line = 0;
  ContentHash digest;
};

/// Digest of a test unit's own definition: its test file and test list.
ContentHash computeUnitDigest(const TestUnitConfig &unit);

/// Digest of everything besides source text that decides which sites a form
/// has and how they are grouped: the selected operator ids, the cluster key
/// and coordinate prefix, and the skipped form heads.
ContentHash computeSelectionDigest(ArrayRef<std::string> operatorIds,
                                   const MutationSettings &settings);

class DigestTable {
public:
  /// Digests of every form of `documents`, in document order.
  static DigestTable fromDocuments(ArrayRef<const Document *> documents);

  void addForm(FormDigest form);
  void setUnitDigest(StringRef unitId, const ContentHash &digest);
  void setSelectionDigest(const ContentHash &digest) { selection = digest; }

  const FormDigest *lookupForm(StringRef formId) const;
  std::optional<ContentHash> getUnitDigest(StringRef unitId) const;
  std::optional<ContentHash> getSelectionDigest() const { return selection; }

  ArrayRef<FormDigest> getForms() const { return forms; }
  const llvm::StringMap<ContentHash> &getUnitDigests() const {
    return unitDigests;
  }
  bool empty() const { return forms.empty() && unitDigests.empty(); }

  llvm::json::Value toJSON() const;
  static llvm::Expected<DigestTable> fromJSON(const llvm::json::Value &json);

  llvm::Error save(StringRef path) const;

  /// A missing file yields an empty table; unreadable content is a
  /// StateError.
  static llvm::Expected<DigestTable> load(StringRef path);

private:
  static constexpr int64_t VERSION = 1;

  std::vector<FormDigest> forms;
  llvm::StringMap<size_t> formIndex;
  llvm::StringMap<ContentHash> unitDigests;
  std::optional<ContentHash> selection;
};

enum class ChangeKind {
  Added,
  Modified,
  SelectionChanged,
  TestsChanged,
  Unchanged,
  Removed
};

/// "added", "modified", "selection-changed", "tests-changed", "unchanged" or
/// "removed".
StringRef getChangeKindName(ChangeKind kind);

struct FormChange {
  std::string formId;
  std::string file;
  ChangeKind kind;
};

class ChangeSet {
public:
  void add(FormChange change);

  /// Current forms in table order, followed by removed forms.
  ArrayRef<FormChange> getChanges() const { return changes; }

  /// True if `formId` is a current form that must be rescanned.
  bool isChanged(StringRef formId) const;

  /// Current forms that must be rescanned.
  llvm::StringSet<> getChangedForms() const;
  /// Current forms whose previous results stay valid.
  llvm::StringSet<> getUnchangedForms() const;

  size_t count(ChangeKind kind) const;

private:
  std::vector<FormChange> changes;
  llvm::StringMap<ChangeKind> byForm;
};

class ChangeDetector {
public:
  /// Whether a test covering the form changed since the previous run.
  using TestsChangedFn = llvm::function_ref<bool(const FormDigest &)>;

  explicit ChangeDetector(const DigestTable &previous) : previous(previous) {}

  /// Compare `current` against the previous table. Forms whose own digest is
  /// unchanged are still reported as SelectionChanged when the selection
  /// digests differ, and as TestsChanged when `testsChanged` says so.
  ChangeSet detect(const DigestTable &current,
                   TestsChangedFn testsChanged) const;

  /// Units whose digest differs from, or is missing in, the previous table.
  llvm::StringSet<> getChangedUnits(const DigestTable &current) const;

private:
  const DigestTable &previous;
};

} // namespace mutagen

#endif // MUTAGEN_ENGINE_CHANGEDETECTOR_H
