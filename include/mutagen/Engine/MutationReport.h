//===- MutationReport.h - Verdict tally and persisted results ---*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The outcome of a run: one result per mutated site, plus the sites left out
// as equivalent or subsumed. The mutation score is
//
//   score = killed / (killed + survived)
//
// Sites without coverage, timeouts and errors are reported but do not enter
// the score. The report is persisted as results.json so that the next run can
// reuse the results of unchanged forms:
//
//   {"version": 1,
//    "results": [{"site", "form", "coord", "operator", "file", "line",
//                 "original", "replacement", "verdict", "detail", "tests",
//                 "representative"?}],
//    "equivalent": [{"site", "form", "file", "line", "reason"}],
//    "subsumed": [{"site", "form", "file", "line", "dominator"}],
//    "summary": {...}}
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_ENGINE_MUTATIONREPORT_H
#define MUTAGEN_ENGINE_MUTATIONREPORT_H

#include "mutagen/Engine/Verdict.h"
#include "mutagen/Mutation/MutationSite.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"
#include <optional>
#include <string>
#include <vector>

namespace mutagen {

struct SiteResult {
  std::string siteId;
  std::string formId;
  std::string coord;
  std::string operatorId;
  std::string file;
  unsigned line = 0;
  std::string original;
  std::string replacement;
  VerdictKind verdict = VerdictKind::Pending;
  std::string detail;
  /// Covering tests that were targeted.
  std::vector<std::string> tests;
  /// Site whose execution decided this verdict, when it was not this one.
  std::string representative;

  /// Fill the identifying fields from `site`.
  static SiteResult fromSite(const MutationSite &site);
};

/// A site that was not executed: equivalent (with a reason) or subsumed (with
/// the id of its dominator).
struct ExcludedResult {
  std::string siteId;
  std::string formId;
  std::string file;
  unsigned line = 0;
  std::string why;
};

class MutationReport {
public:
  void addResult(SiteResult result) { results.push_back(std::move(result)); }
  void addEquivalent(ExcludedResult excluded) {
    equivalent.push_back(std::move(excluded));
  }
  void addSubsumed(ExcludedResult excluded) {
    subsumed.push_back(std::move(excluded));
  }

  ArrayRef<SiteResult> getResults() const { return results; }
  ArrayRef<ExcludedResult> getEquivalent() const { return equivalent; }
  ArrayRef<ExcludedResult> getSubsumed() const { return subsumed; }

  const SiteResult *lookup(StringRef siteId) const;

  size_t count(VerdictKind kind) const;

  /// killed / (killed + survived), or nothing when both are zero.
  std::optional<double> getScore() const;

  /// Copy every entry of `previous` that belongs to one of `forms`. Entries
  /// already present in this report win.
  void mergeFrom(const MutationReport &previous,
                 const llvm::StringSet<> &forms);

  /// Order results by file, then line, then site id.
  void sort();

  llvm::json::Value toJSON() const;
  static llvm::Expected<MutationReport> fromJSON(const llvm::json::Value &json);

  llvm::Error save(StringRef path) const;

  /// A missing file yields an empty report; unreadable content is a
  /// StateError.
  static llvm::Expected<MutationReport> load(StringRef path);

  /// Human-readable summary followed by the surviving mutants.
  void print(llvm::raw_ostream &os, bool verbose = false) const;

private:
  static constexpr int64_t VERSION = 1;

  std::vector<SiteResult> results;
  std::vector<ExcludedResult> equivalent;
  std::vector<ExcludedResult> subsumed;
};

} // namespace mutagen

#endif // MUTAGEN_ENGINE_MUTATIONREPORT_H
