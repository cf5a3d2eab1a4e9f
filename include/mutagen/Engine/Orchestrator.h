//===- Orchestrator.h - Mutation run pipeline -------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Sequences one mutation run:
//
//   recover backups -> parse -> refresh coverage -> detect changes -> scan
//     -> equivalence filter -> subsumption -> clustering
//     -> execute (schemata or apply/revert per site) -> report -> persist
//
// Execution is serialized per file: at most one mutated state of a file is
// outstanding at any time, and every applied edit is reverted before the
// next one is made. A revert failure aborts the run.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_ENGINE_ORCHESTRATOR_H
#define MUTAGEN_ENGINE_ORCHESTRATOR_H

#include "mutagen/CAST/Document.h"
#include "mutagen/Coverage/CoverageStore.h"
#include "mutagen/Engine/ChangeDetector.h"
#include "mutagen/Engine/MutationReport.h"
#include "mutagen/Engine/Services.h"
#include "mutagen/Engine/TestScheduler.h"
#include "mutagen/Mutation/MutationSite.h"
#include "mutagen/Mutation/OperatorCatalog.h"
#include "mutagen/Support/MutationConfig.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"
#include <string>
#include <vector>

namespace mutagen {

/// Counters of the last run.
struct RunStatistics {
  unsigned files = 0;
  unsigned forms = 0;
  unsigned changedForms = 0;
  unsigned removedForms = 0;
  unsigned refreshedUnits = 0;
  unsigned sites = 0;
  unsigned equivalent = 0;
  unsigned subsumed = 0;
  unsigned clusters = 0;
  /// Representatives whose tests were run.
  unsigned executed = 0;
  unsigned schemataBatches = 0;
  /// Sites that fell back from schemata to apply/revert.
  unsigned fallbacks = 0;

  void print(llvm::raw_ostream &os) const;
};

class Orchestrator {
public:
  Orchestrator(const MutationConfig &config, EngineServices services);

  /// Run the pipeline over `files`, which must be resolved paths. Persisted
  /// state is read from and written to the configured state directory.
  llvm::Expected<MutationReport> run(ArrayRef<std::string> files);

  const RunStatistics &getStatistics() const { return stats; }

  /// Paths of the persisted state files.
  std::string getCoveragePath() const;
  std::string getDigestsPath() const;
  std::string getResultsPath() const;

private:
  /// A site scheduled for execution with its covering tests.
  struct PlannedSite {
    size_t index;
    std::vector<std::string> tests;
    Verdict verdict;
  };

  llvm::Error recover(ArrayRef<std::string> files);
  std::vector<HashedUnit> hashUnits() const;
  llvm::Error refreshCoverage(CoverageStore &store,
                              ArrayRef<HashedUnit> units);
  llvm::Expected<UnitCoverage> computeCoverage(const TestUnitConfig &unit);

  /// Tests of `unitIds`, both configured and previously recorded.
  llvm::StringSet<> collectTests(const llvm::StringSet<> &unitIds,
                                 const CoverageStore &store) const;

  /// Execute every planned site of `document`.
  llvm::Error executeFile(const Document &document,
                          ArrayRef<MutationSite> sites,
                          std::vector<PlannedSite *> planned);
  llvm::Error executeSchemata(const Document &document,
                              ArrayRef<MutationSite> sites,
                              std::vector<PlannedSite *> &planned,
                              std::vector<PlannedSite *> &fallback);
  llvm::Error executeSite(const Document &document,
                          const MutationSite &site, PlannedSite &plan);

  /// Reload `file` after restoring it. A failure here is fatal.
  llvm::Error reloadRestored(StringRef file);

  static void finish(PlannedSite &plan, VerdictKind kind, StringRef detail);

  const MutationConfig &config;
  EngineServices services;
  TestScheduler scheduler;
  RunStatistics stats;
};

} // namespace mutagen

#endif // MUTAGEN_ENGINE_ORCHESTRATOR_H
