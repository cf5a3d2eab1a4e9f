//===- Orchestrator.cpp - Mutation run pipeline ---------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Engine/Orchestrator.h"
#include "mutagen/Mutation/ClusterSelector.h"
#include "mutagen/Mutation/EquivalenceFilter.h"
#include "mutagen/Mutation/MutationApplier.h"
#include "mutagen/Mutation/SchemataCompiler.h"
#include "mutagen/Mutation/SiteScanner.h"
#include "mutagen/Mutation/SubsumptionReducer.h"
#include "mutagen/Support/Diagnostics.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/Path.h"
#include <algorithm>
#include <map>

#define DEBUG_TYPE "mutagen-orchestrator"

using namespace mutagen;

void RunStatistics::print(llvm::raw_ostream &os) const {
  os << "Files:            " << files << "\n";
  os << "Forms:            " << forms << " (" << changedForms << " changed, "
     << removedForms << " removed)\n";
  os << "Refreshed units:  " << refreshedUnits << "\n";
  os << "Sites:            " << sites << "\n";
  os << "Equivalent:       " << equivalent << "\n";
  os << "Subsumed:         " << subsumed << "\n";
  os << "Clusters:         " << clusters << "\n";
  os << "Executed:         " << executed << "\n";
  os << "Schemata batches: " << schemataBatches << " (" << fallbacks
     << " fallbacks)\n";
}

Orchestrator::Orchestrator(const MutationConfig &config,
                           EngineServices services)
    : config(config), services(services),
      scheduler(services.executor,
                std::chrono::milliseconds(
                    config.getMutationSettings().timeoutMs),
                config.getMutationSettings().testJobs) {}

static std::string getStatePath(const MutationConfig &config, StringRef name) {
  llvm::SmallString<128> path(
      config.resolvePath(config.getStateConfig().dir));
  llvm::sys::path::append(path, name);
  return std::string(path);
}

std::string Orchestrator::getCoveragePath() const {
  return getStatePath(config, "coverage.json");
}

std::string Orchestrator::getDigestsPath() const {
  return getStatePath(config, "digests.json");
}

std::string Orchestrator::getResultsPath() const {
  return getStatePath(config, "results.json");
}

void Orchestrator::finish(PlannedSite &plan, VerdictKind kind,
                          StringRef detail) {
  llvm::cantFail(plan.verdict.transition(kind, detail));
}

//===----------------------------------------------------------------------===//
// Coverage
//===----------------------------------------------------------------------===//

std::vector<HashedUnit> Orchestrator::hashUnits() const {
  std::vector<HashedUnit> units;
  for (const TestUnitConfig &unit : config.getTestUnits()) {
    TestUnitConfig resolved = unit;
    resolved.file = config.resolvePath(unit.file);
    for (std::string &dependency : resolved.depends)
      dependency = config.resolvePath(dependency);
    ContentHash hash = computeDependencyHash(resolved);
    units.push_back({std::move(resolved), hash});
  }
  return units;
}

llvm::Expected<UnitCoverage>
Orchestrator::computeCoverage(const TestUnitConfig &unit) {
  LLVM_DEBUG(llvm::dbgs() << "collecting coverage of unit " << unit.id
                          << "\n");
  UnitCoverage result;
  std::vector<std::string> tracedForms;
  for (const std::string &test : unit.tests) {
    services.oracle.reset();
    CancellationToken token;
    TestRun run = scheduler.runOne(test, /*activeMutant=*/0, token);
    std::vector<TraceEvent> events = services.oracle.drain();

    if (run.timedOut)
      return makeError(ErrorKind::TestTimeout,
                       "coverage run of '" + test +
                           "' exceeded its time bound");
    if (!run.error.empty())
      return makeError(ErrorKind::TestError,
                       "coverage run of '" + test + "' failed: " + run.error);
    if (run.outcome && *run.outcome != TestOutcome::Pass)
      emitWarning("test '" + test + "' does not pass on the original program");

    result.coverage.addTest(test);
    for (TraceEvent &event : events) {
      event.testId = test;
      tracedForms.push_back(event.formId);
      result.coverage.record(event);
    }
  }

  result.bridge = services.bridge.getAnchors();
  llvm::StringSet<> anchored;
  for (const FormAnchor &anchor : result.bridge)
    anchored.insert(anchor.formId);

  llvm::sort(tracedForms);
  tracedForms.erase(std::unique(tracedForms.begin(), tracedForms.end()),
                    tracedForms.end());
  for (const std::string &formId : tracedForms) {
    if (anchored.contains(formId))
      continue;
    if (auto anchor = services.bridge.locate(formId)) {
      result.bridge.push_back(*anchor);
      continue;
    }
    emitWarning("no source location for traced form '" + formId +
                "'; its coverage is unreachable");
  }
  return result;
}

llvm::Error Orchestrator::refreshCoverage(CoverageStore &store,
                                          ArrayRef<HashedUnit> units) {
  auto refreshed = store.refresh(
      units, [&](const TestUnitConfig &unit) { return computeCoverage(unit); });
  if (!refreshed)
    return refreshed.takeError();
  stats.refreshedUnits = refreshed->size();
  return llvm::Error::success();
}

llvm::StringSet<>
Orchestrator::collectTests(const llvm::StringSet<> &unitIds,
                           const CoverageStore &store) const {
  llvm::StringSet<> tests;
  for (const TestUnitConfig &unit : config.getTestUnits())
    if (unitIds.contains(unit.id))
      for (const std::string &test : unit.tests)
        tests.insert(test);
  for (const auto &entry : unitIds)
    if (const UnitCoverage *unit = store.lookup(entry.getKey()))
      for (const std::string &test : unit->coverage.getTestIds())
        tests.insert(test);
  return tests;
}

//===----------------------------------------------------------------------===//
// Execution
//===----------------------------------------------------------------------===//

llvm::Error Orchestrator::reloadRestored(StringRef file) {
  std::string path = file.str();
  if (auto err = services.reloader.reload(path))
    return makeError(ErrorKind::RevertFailure,
                     "reloading restored '" + file +
                         "' failed: " + llvm::toString(std::move(err)));
  return llvm::Error::success();
}

llvm::Error Orchestrator::recover(ArrayRef<std::string> files) {
  auto restored = recoverBackups(files);
  if (!restored)
    return restored.takeError();
  if (restored->empty())
    return llvm::Error::success();
  if (auto err = services.reloader.reload(*restored))
    return makeError(ErrorKind::RevertFailure,
                     "reloading recovered files failed: " +
                         llvm::toString(std::move(err)));
  return llvm::Error::success();
}

llvm::Error Orchestrator::executeSite(const Document &document,
                                      const MutationSite &site,
                                      PlannedSite &plan) {
  std::string file = document.getFile().str();
  auto handle = applyMutation(document, site);
  if (!handle) {
    std::string message;
    auto kind = consumeMutagenError(handle.takeError(), &message);
    if (kind && isFatal(*kind))
      return makeError(*kind, message);
    finish(plan, VerdictKind::Error, "apply failed: " + message);
    return llvm::Error::success();
  }

  ScopedMutation mutation(std::move(*handle));
  if (auto err = services.reloader.reload(file)) {
    std::string message = llvm::toString(std::move(err));
    emitWarning("reload of mutated file failed for " + site.getId() + ": " +
                    message,
                site.file, site.line);
    finish(plan, VerdictKind::Error, "reload failed: " + message);
  } else {
    ScheduleResult result = scheduler.runTests(plan.tests, 0);
    finish(plan, result.verdict, result.detail);
    ++stats.executed;
  }

  if (auto err = mutation.revert())
    return err;
  return reloadRestored(file);
}

llvm::Error
Orchestrator::executeSchemata(const Document &document,
                              ArrayRef<MutationSite> sites,
                              std::vector<PlannedSite *> &planned,
                              std::vector<PlannedSite *> &fallback) {
  const MutationSettings &settings = config.getMutationSettings();
  SchemataCompiler compiler(settings.selector);
  std::string file = document.getFile().str();
  std::string original = document.render();

  std::map<size_t, PlannedSite *> byIndex;
  std::vector<size_t> indices;
  for (PlannedSite *plan : planned) {
    byIndex[plan->index] = plan;
    indices.push_back(plan->index);
  }

  auto fallBack = [&](ArrayRef<size_t> batch, const Twine &reason) {
    emitWarning("schemata of " + Twine(batch.size()) + " mutants in '" + file +
                "' unusable (" + reason + "); applying them one by one");
    for (size_t index : batch)
      fallback.push_back(byIndex[index]);
    stats.fallbacks += batch.size();
  };

  for (const std::vector<size_t> &batch :
       SchemataCompiler::partition(sites, indices)) {
    auto bundle = compiler.compile(document, sites, batch);
    if (!bundle) {
      fallBack(batch, llvm::toString(bundle.takeError()));
      continue;
    }
    auto handle = applyMutatedText(file, original, bundle->text,
                                   "schemata of '" + file + "'");
    if (!handle) {
      std::string message;
      auto kind = consumeMutagenError(handle.takeError(), &message);
      if (kind && isFatal(*kind))
        return makeError(*kind, message);
      fallBack(batch, message);
      continue;
    }

    ScopedMutation mutation(std::move(*handle));
    if (auto err = services.reloader.reload(file)) {
      std::string message = llvm::toString(std::move(err));
      if (auto revertErr = mutation.revert())
        return revertErr;
      if (auto reloadErr = reloadRestored(file))
        return reloadErr;
      fallBack(batch, "reload failed: " + message);
      continue;
    }

    ++stats.schemataBatches;
    for (const SchemaMutant &mutant : bundle->mutants) {
      PlannedSite &plan = *byIndex[mutant.site];
      LLVM_DEBUG(llvm::dbgs() << "mutant " << mutant.id << ": "
                              << sites[mutant.site].getId() << "\n");
      ScheduleResult result = scheduler.runTests(plan.tests, mutant.id);
      finish(plan, result.verdict, result.detail);
      ++stats.executed;
    }

    if (auto err = mutation.revert())
      return err;
    if (auto err = reloadRestored(file))
      return err;
  }
  return llvm::Error::success();
}

llvm::Error Orchestrator::executeFile(const Document &document,
                                      ArrayRef<MutationSite> sites,
                                      std::vector<PlannedSite *> planned) {
  std::vector<PlannedSite *> fallback;
  if (config.getMutationSettings().schemata) {
    if (auto err = executeSchemata(document, sites, planned, fallback))
      return err;
  } else {
    fallback = std::move(planned);
  }

  for (PlannedSite *plan : fallback)
    if (auto err = executeSite(document, sites[plan->index], *plan))
      return err;
  return llvm::Error::success();
}

//===----------------------------------------------------------------------===//
// Pipeline
//===----------------------------------------------------------------------===//

/// Load persisted state, discarding it with a warning when it is unusable.
template <typename T>
static T loadOrDiscard(llvm::Expected<T> state, StringRef what) {
  if (state)
    return std::move(*state);
  std::string message;
  consumeMutagenError(state.takeError(), &message);
  emitWarning("discarding " + what + " state: " + message);
  return T();
}

llvm::Expected<MutationReport>
Orchestrator::run(ArrayRef<std::string> files) {
  stats = RunStatistics();
  stats.files = files.size();
  const MutationSettings &settings = config.getMutationSettings();
  bool incremental = config.getStateConfig().incremental;

  if (auto err = recover(files))
    return std::move(err);

  auto catalog = OperatorCatalog::getBuiltin().select(
      settings.preset, settings.operators, settings.disableOperators);
  if (!catalog)
    return catalog.takeError();
  auto clusterKey = parseClusterKey(settings.clusterKey);
  if (!clusterKey)
    return clusterKey.takeError();

  std::vector<Document> documents;
  documents.reserve(files.size());
  for (const std::string &file : files) {
    auto document = Document::load(file);
    if (!document)
      return document.takeError();
    documents.push_back(std::move(*document));
  }
  std::vector<const Document *> documentPtrs;
  for (const Document &document : documents)
    documentPtrs.push_back(&document);

  // Bring the coverage of every configured unit up to date.
  std::vector<HashedUnit> units = hashUnits();
  CoverageStore store =
      loadOrDiscard(CoverageStore::load(getCoveragePath()), "coverage");
  if (auto err = refreshCoverage(store, units))
    return std::move(err);

  // Detect changed forms. Stored coverage of units that were removed from
  // the configuration still takes part, so forms they covered are retested.
  DigestTable current = DigestTable::fromDocuments(documentPtrs);
  for (const HashedUnit &unit : units)
    current.setUnitDigest(unit.config.id, computeUnitDigest(unit.config));
  std::vector<std::string> operatorIds;
  for (const Operator &op : catalog->getOperators())
    operatorIds.push_back(op.id);
  current.setSelectionDigest(computeSelectionDigest(operatorIds, settings));

  DigestTable previousDigests;
  MutationReport previousReport;
  if (incremental) {
    previousDigests =
        loadOrDiscard(DigestTable::load(getDigestsPath()), "digest");
    auto loadedReport = MutationReport::load(getResultsPath());
    if (loadedReport) {
      previousReport = std::move(*loadedReport);
    } else {
      // Without the old results nothing can be reused.
      std::string message;
      consumeMutagenError(loadedReport.takeError(), &message);
      emitWarning("discarding results state: " + message);
      previousDigests = DigestTable();
    }
  }

  ChangeDetector detector(previousDigests);
  llvm::StringSet<> changedUnits = detector.getChangedUnits(current);
  for (const auto &entry : previousDigests.getUnitDigests())
    if (!current.getUnitDigest(entry.getKey()))
      changedUnits.insert(entry.getKey());
  llvm::StringSet<> changedTests = collectTests(changedUnits, store);

  CoverageIndex everything;
  for (const std::string &unitId : store.getUnitIds())
    everything.merge(store.lookup(unitId)->coverage);
  FormLocator allForms = store.getLocator();

  ChangeSet changes = detector.detect(current, [&](const FormDigest &form) {
    auto oracleForm = allForms.locate(form.file, form.line);
    if (!oracleForm)
      return false;
    return llvm::any_of(everything.testsInForm(*oracleForm),
                        [&](const std::string &test) {
                          return changedTests.contains(test);
                        });
  });

  llvm::StringSet<> changedForms;
  for (const FormDigest &form : current.getForms())
    if (!incremental || changes.isChanged(form.formId))
      changedForms.insert(form.formId);
  stats.forms = current.getForms().size();
  stats.changedForms = changedForms.size();
  stats.removedForms = changes.count(ChangeKind::Removed);

  store.retainOnly(units);
  auto index = store.getIndex(units);
  if (!index)
    return index.takeError();
  FormLocator locator = store.getLocator();

  // Scan, then drop equivalent and subsumed sites.
  SiteScanner scanner(*catalog, settings.skipForms);
  std::vector<MutationSite> scanned = scanner.scan(documentPtrs, &changedForms);
  stats.sites = scanned.size();

  llvm::StringMap<std::vector<MutationSite>> sitesByFile;
  for (MutationSite &site : scanned)
    sitesByFile[site.file].push_back(std::move(site));

  EquivalenceFilter filter(*catalog);
  std::vector<MutationSite> candidates;
  std::vector<ExcludedSite> equivalent;
  for (const Document &document : documents) {
    auto it = sitesByFile.find(document.getFile());
    if (it == sitesByFile.end())
      continue;
    auto filtered = filter.filter(document, std::move(it->getValue()));
    if (!filtered)
      return filtered.takeError();
    for (MutationSite &site : filtered->kept)
      candidates.push_back(std::move(site));
    for (ExcludedSite &excluded : filtered->equivalent)
      equivalent.push_back(std::move(excluded));
  }
  stats.equivalent = equivalent.size();

  SubsumptionResult reduced =
      SubsumptionReducer(*catalog).pruneSites(std::move(candidates));
  stats.subsumed = reduced.subsumed.size();
  std::vector<MutationSite> &sites = reduced.kept;

  ClusterSelector selector(*clusterKey, settings.coordinatePrefix);
  std::vector<Cluster> clusters = selector.select(sites);
  stats.clusters = clusters.size();

  // Plan one execution per cluster representative. Sites nothing covers are
  // decided without touching their file.
  std::vector<PlannedSite> plans;
  plans.reserve(clusters.size());
  llvm::StringMap<std::vector<PlannedSite *>> plansByFile;
  for (const Cluster &cluster : clusters) {
    const MutationSite &site = sites[cluster.representative];
    plans.push_back({cluster.representative, {}, Verdict()});
    PlannedSite &plan = plans.back();
    if (auto oracleForm = locator.locate(site.file, site.formLine))
      plan.tests = index->testsCovering(*oracleForm, site.coord, site.leaf);
    if (plan.tests.empty()) {
      finish(plan, VerdictKind::NoCoverage, "no covering tests");
      continue;
    }
    plansByFile[site.file].push_back(&plan);
  }

  for (const Document &document : documents) {
    auto it = plansByFile.find(document.getFile());
    if (it == plansByFile.end())
      continue;
    LLVM_DEBUG(llvm::dbgs() << "executing " << it->getValue().size()
                            << " mutants in " << document.getFile() << "\n");
    if (auto err = executeFile(document, sites, it->getValue()))
      return std::move(err);
  }

  // Every cluster member inherits the verdict of its representative.
  MutationReport report;
  for (auto [cluster, plan] : llvm::zip(clusters, plans)) {
    std::string representative = sites[cluster.representative].getId();
    for (size_t member : cluster.members) {
      SiteResult result = SiteResult::fromSite(sites[member]);
      result.verdict = plan.verdict.getKind();
      result.detail = plan.verdict.getDetail().str();
      result.tests = plan.tests;
      if (member != cluster.representative)
        result.representative = representative;
      report.addResult(std::move(result));
    }
  }
  for (const ExcludedSite &excluded : equivalent)
    report.addEquivalent({excluded.site.getId(), excluded.site.formId,
                          excluded.site.file, excluded.site.line,
                          excluded.reason});
  for (const SubsumedSite &excluded : reduced.subsumed)
    report.addSubsumed({excluded.site.getId(), excluded.site.formId,
                        excluded.site.file, excluded.site.line,
                        excluded.dominator});
  if (incremental)
    report.mergeFrom(previousReport, changes.getUnchangedForms());
  report.sort();

  if (auto err = store.save(getCoveragePath()))
    return std::move(err);
  if (auto err = current.save(getDigestsPath()))
    return std::move(err);
  if (auto err = report.save(getResultsPath()))
    return std::move(err);
  return report;
}
