//===- OrchestratorTest.cpp - End-to-end mutation run tests -----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "TestHarness.h"
#include "mutagen/Engine/Orchestrator.h"
#include "mutagen/Mutation/MutationApplier.h"
#include "mutagen/Support/Diagnostics.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"
#include <chrono>
#include <memory>

using namespace mutagen;
using namespace mutagen::testing;

namespace {

const char *kAdd = "(ns demo.core)\n"
                   "\n"
                   "(defn add [a b]\n"
                   "  (+ a b))\n";

class OrchestratorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("mutagen-run", dir));
    config = MutationConfig::createDefault();
    config->setRootDirectory(dir);
    config->getMutationSettings().timeoutMs = 1000;
    source = config->resolvePath("src/core.clj");
    write(config->resolvePath("test/core_test.clj"), "(ns demo.core-test)\n");
  }
  void TearDown() override { llvm::sys::fs::remove_directories(dir); }

  static void write(StringRef path, StringRef contents) {
    ASSERT_FALSE(
        llvm::sys::fs::create_directories(llvm::sys::path::parent_path(path)));
    std::error_code ec;
    llvm::raw_fd_ostream os(path, ec);
    ASSERT_FALSE(ec) << ec.message();
    os << contents;
  }

  static std::string read(StringRef path) {
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
      return "<unreadable>";
    return (*buffer)->getBuffer().str();
  }

  /// Write the source file, load it into the runtime and register one test
  /// unit whose tests are `tests`.
  void setUpProgram(StringRef text,
                    std::vector<std::pair<std::string, FakeExecutor::TestFn>>
                        tests) {
    write(source, text);
    ASSERT_FALSE(llvm::errorToBool(runtime.reload(source)));
    TestUnitConfig unit;
    unit.id = "demo.core-test";
    unit.file = "test/core_test.clj";
    unit.depends = {"src/core.clj"};
    for (auto &test : tests) {
      unit.tests.push_back(test.first);
      executor.add(test.first, std::move(test.second));
    }
    config->getTestUnits() = {unit};
  }

  llvm::Expected<MutationReport> runOnce() {
    orchestrator = std::make_unique<Orchestrator>(
        *config, EngineServices{runtime, runtime, runtime, executor});
    std::vector<std::string> files = {source};
    return orchestrator->run(files);
  }

  const SiteResult *findResult(const MutationReport &report, StringRef op) {
    for (const SiteResult &result : report.getResults())
      if (result.operatorId == op)
        return &result;
    return nullptr;
  }

  llvm::SmallString<256> dir;
  std::unique_ptr<MutationConfig> config;
  std::string source;
  MiniRuntime runtime;
  FakeExecutor executor;
  std::unique_ptr<Orchestrator> orchestrator;
};

TEST_F(OrchestratorTest, AdditionSwapIsKilledWithSchemata) {
  setUpProgram(kAdd, {{"demo.core-test/test-add",
                       runtime.expectCall("add", {2, 3}, 5)}});
  auto report = runOnce();
  ASSERT_TRUE(static_cast<bool>(report)) << llvm::toString(report.takeError());

  ASSERT_EQ(report->getResults().size(), 1u);
  const SiteResult &result = report->getResults()[0];
  EXPECT_EQ(result.operatorId, "aor.+->-");
  EXPECT_EQ(result.formId, source + ":defn add");
  EXPECT_EQ(result.line, 4u);
  EXPECT_EQ(result.verdict, VerdictKind::Killed);
  EXPECT_EQ(result.detail, "failed demo.core-test/test-add");
  EXPECT_EQ(result.tests,
            std::vector<std::string>{"demo.core-test/test-add"});
  EXPECT_EQ(report->getScore(), 1.0);

  const RunStatistics &stats = orchestrator->getStatistics();
  EXPECT_EQ(stats.schemataBatches, 1u);
  EXPECT_EQ(stats.executed, 1u);
  EXPECT_EQ(stats.refreshedUnits, 1u);
  EXPECT_EQ(read(source), kAdd);
  EXPECT_FALSE(llvm::sys::fs::exists(getBackupPath(source)));
}

TEST_F(OrchestratorTest, AdditionSwapIsKilledPerSite) {
  config->getMutationSettings().schemata = false;
  setUpProgram(kAdd, {{"demo.core-test/test-add",
                       runtime.expectCall("add", {2, 3}, 5)}});
  auto report = runOnce();
  ASSERT_TRUE(static_cast<bool>(report)) << llvm::toString(report.takeError());

  const SiteResult *result = findResult(*report, "aor.+->-");
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->verdict, VerdictKind::Killed);
  EXPECT_EQ(orchestrator->getStatistics().schemataBatches, 0u);
  EXPECT_EQ(read(source), kAdd);
  // The mutant and the restored file were both reloaded.
  EXPECT_EQ(runtime.numReloads, 3u);
}

TEST_F(OrchestratorTest, WeakTestLetsMutantSurvive) {
  setUpProgram(kAdd, {{"demo.core-test/test-add-zero",
                       runtime.expectCall("add", {2, 0}, 2)}});
  auto report = runOnce();
  ASSERT_TRUE(static_cast<bool>(report)) << llvm::toString(report.takeError());

  const SiteResult *result = findResult(*report, "aor.+->-");
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->verdict, VerdictKind::Survived);
  EXPECT_EQ(report->getScore(), 0.0);
}

TEST_F(OrchestratorTest, MultiplyByOneIsEquivalent) {
  setUpProgram("(defn scale [x]\n  (* x 1))\n",
               {{"demo.core-test/test-scale",
                 runtime.expectCall("scale", {4}, 4)}});
  auto report = runOnce();
  ASSERT_TRUE(static_cast<bool>(report)) << llvm::toString(report.takeError());

  EXPECT_TRUE(report->getResults().empty());
  ASSERT_EQ(report->getEquivalent().size(), 1u);
  EXPECT_EQ(report->getEquivalent()[0].siteId,
            source + ":defn scale@3:aor.*->/");
  EXPECT_EQ(report->getEquivalent()[0].why, "multiply/divide by one");
  EXPECT_FALSE(report->getScore().has_value());
  // Only the coverage run executed a test.
  EXPECT_EQ(executor.numRuns, 1u);
}

TEST_F(OrchestratorTest, UncoveredSiteHasNoCoverage) {
  setUpProgram("(defn add [a b]\n  (+ a b))\n"
               "(defn unused [a b]\n  (- a b))\n",
               {{"demo.core-test/test-add",
                 runtime.expectCall("add", {2, 3}, 5)}});
  auto report = runOnce();
  ASSERT_TRUE(static_cast<bool>(report)) << llvm::toString(report.takeError());

  const SiteResult *covered = findResult(*report, "aor.+->-");
  const SiteResult *uncovered = findResult(*report, "aor.-->+");
  ASSERT_NE(covered, nullptr);
  ASSERT_NE(uncovered, nullptr);
  EXPECT_EQ(covered->verdict, VerdictKind::Killed);
  EXPECT_EQ(uncovered->verdict, VerdictKind::NoCoverage);
  EXPECT_TRUE(uncovered->tests.empty());
  // The uncovered site is reported but left out of the score.
  EXPECT_EQ(report->count(VerdictKind::NoCoverage), 1u);
  EXPECT_EQ(report->getScore(), 1.0);
  // One coverage run plus one run of the covered mutant.
  EXPECT_EQ(executor.numRuns, 2u);
}

TEST_F(OrchestratorTest, UnexecutedBranchHasNoCoverage) {
  config->getMutationSettings().operators = {"aor.-->+", "aor.+->-"};
  setUpProgram("(defn f [a b]\n"
               "  (if (< a 0)\n"
               "    (- a b)\n"
               "    (+ a b)))\n",
               {{"demo.core-test/test-f", runtime.expectCall("f", {2, 3}, 5)}});
  auto report = runOnce();
  ASSERT_TRUE(static_cast<bool>(report)) << llvm::toString(report.takeError());

  const SiteResult *taken = findResult(*report, "aor.+->-");
  const SiteResult *untaken = findResult(*report, "aor.-->+");
  ASSERT_NE(taken, nullptr);
  ASSERT_NE(untaken, nullptr);
  EXPECT_EQ(taken->verdict, VerdictKind::Killed);
  EXPECT_EQ(untaken->verdict, VerdictKind::NoCoverage);
  EXPECT_TRUE(untaken->tests.empty());
  EXPECT_EQ(report->getScore(), 1.0);
}

TEST_F(OrchestratorTest, NonTerminatingMutantTimesOut) {
  const char *spin = "(defn spin [n]\n"
                     "  (loop [i 0]\n"
                     "    (if (< i n)\n"
                     "      (recur (inc i))\n"
                     "      i)))\n";
  MutationSettings &settings = config->getMutationSettings();
  settings.operators = {"aor.inc->dec"};
  settings.timeoutMs = 2000;
  settings.schemata = false;
  setUpProgram(spin, {{"demo.core-test/test-spin",
                       runtime.expectCall("spin", {5}, 5)}});

  auto start = std::chrono::steady_clock::now();
  auto report = runOnce();
  auto elapsed = std::chrono::steady_clock::now() - start;
  ASSERT_TRUE(static_cast<bool>(report)) << llvm::toString(report.takeError());

  ASSERT_EQ(report->getResults().size(), 1u);
  const SiteResult &result = report->getResults()[0];
  EXPECT_EQ(result.coord, "3/2/2/1");
  EXPECT_EQ(result.verdict, VerdictKind::Timeout);
  EXPECT_EQ(result.detail, "demo.core-test/test-spin exceeded its time bound");
  EXPECT_GE(elapsed, std::chrono::milliseconds(2000));
  EXPECT_FALSE(report->getScore().has_value());

  // The original text is back and no backup is left behind.
  EXPECT_EQ(read(source), spin);
  EXPECT_FALSE(llvm::sys::fs::exists(getBackupPath(source)));
}

TEST_F(OrchestratorTest, IncrementalRerunReusesResults) {
  setUpProgram(kAdd, {{"demo.core-test/test-add",
                       runtime.expectCall("add", {2, 3}, 5)}});
  auto first = runOnce();
  ASSERT_TRUE(static_cast<bool>(first)) << llvm::toString(first.takeError());
  EXPECT_TRUE(llvm::sys::fs::exists(orchestrator->getCoveragePath()));
  EXPECT_TRUE(llvm::sys::fs::exists(orchestrator->getDigestsPath()));
  EXPECT_TRUE(llvm::sys::fs::exists(orchestrator->getResultsPath()));
  unsigned runsAfterFirst = executor.numRuns;

  auto second = runOnce();
  ASSERT_TRUE(static_cast<bool>(second)) << llvm::toString(second.takeError());
  const RunStatistics &stats = orchestrator->getStatistics();
  EXPECT_EQ(stats.forms, 2u);
  EXPECT_EQ(stats.changedForms, 0u);
  EXPECT_EQ(stats.sites, 0u);
  EXPECT_EQ(stats.refreshedUnits, 0u);
  EXPECT_EQ(executor.numRuns, runsAfterFirst);

  ASSERT_EQ(second->getResults().size(), 1u);
  EXPECT_EQ(second->getResults()[0].siteId, first->getResults()[0].siteId);
  EXPECT_EQ(second->getResults()[0].verdict, VerdictKind::Killed);
}

TEST_F(OrchestratorTest, OperatorSelectionChangeRescansEverything) {
  const char *program = "(defn add [a b]\n  (+ a b))\n"
                        "(defn sub [a b]\n  (- a b))\n";
  MutationSettings &settings = config->getMutationSettings();
  settings.operators = {"aor.+->-"};
  setUpProgram(program, {{"demo.core-test/test-add",
                          runtime.expectCall("add", {2, 3}, 5)},
                         {"demo.core-test/test-sub",
                          runtime.expectCall("sub", {5, 3}, 2)}});
  auto first = runOnce();
  ASSERT_TRUE(static_cast<bool>(first)) << llvm::toString(first.takeError());
  ASSERT_EQ(first->getResults().size(), 1u);
  EXPECT_EQ(first->getResults()[0].operatorId, "aor.+->-");

  settings.operators = {"aor.-->+"};
  auto second = runOnce();
  ASSERT_TRUE(static_cast<bool>(second)) << llvm::toString(second.takeError());
  EXPECT_EQ(orchestrator->getStatistics().changedForms, 2u);
  ASSERT_EQ(second->getResults().size(), 1u);
  EXPECT_EQ(findResult(*second, "aor.+->-"), nullptr);
  const SiteResult *sub = findResult(*second, "aor.-->+");
  ASSERT_NE(sub, nullptr);
  EXPECT_EQ(sub->verdict, VerdictKind::Killed);

  // The same selection again reuses everything.
  auto third = runOnce();
  ASSERT_TRUE(static_cast<bool>(third)) << llvm::toString(third.takeError());
  EXPECT_EQ(orchestrator->getStatistics().changedForms, 0u);
  ASSERT_EQ(third->getResults().size(), 1u);
  EXPECT_EQ(third->getResults()[0].operatorId, "aor.-->+");
}

TEST_F(OrchestratorTest, EditedFormIsRetested) {
  setUpProgram("(defn add [a b]\n  (+ a b))\n"
               "(defn sub [a b]\n  (- a b))\n",
               {{"demo.core-test/test-add",
                 runtime.expectCall("add", {2, 3}, 5)},
                {"demo.core-test/test-sub",
                 runtime.expectCall("sub", {5, 3}, 2)}});
  auto first = runOnce();
  ASSERT_TRUE(static_cast<bool>(first)) << llvm::toString(first.takeError());
  ASSERT_EQ(first->getResults().size(), 2u);

  write(source, "(defn add [a b]\n  (+ a b))\n"
                "(defn sub [a b]\n  (- a (* b 1)))\n");
  ASSERT_FALSE(llvm::errorToBool(runtime.reload(source)));
  auto second = runOnce();
  ASSERT_TRUE(static_cast<bool>(second)) << llvm::toString(second.takeError());

  const RunStatistics &stats = orchestrator->getStatistics();
  EXPECT_EQ(stats.changedForms, 1u);
  EXPECT_EQ(stats.refreshedUnits, 1u);
  EXPECT_EQ(stats.equivalent, 1u);
  const SiteResult *add = findResult(*second, "aor.+->-");
  const SiteResult *sub = findResult(*second, "aor.-->+");
  ASSERT_NE(add, nullptr);
  ASSERT_NE(sub, nullptr);
  EXPECT_EQ(add->verdict, VerdictKind::Killed);
  EXPECT_EQ(sub->verdict, VerdictKind::Killed);
  EXPECT_EQ(second->getEquivalent().size(), 1u);
}

TEST_F(OrchestratorTest, NonIncrementalRunRescansEverything) {
  config->getStateConfig().incremental = false;
  setUpProgram(kAdd, {{"demo.core-test/test-add",
                       runtime.expectCall("add", {2, 3}, 5)}});
  ASSERT_FALSE(llvm::errorToBool(runOnce().takeError()));
  auto second = runOnce();
  ASSERT_TRUE(static_cast<bool>(second)) << llvm::toString(second.takeError());
  EXPECT_EQ(orchestrator->getStatistics().changedForms, 2u);
  EXPECT_EQ(orchestrator->getStatistics().sites, 1u);
  EXPECT_EQ(second->getResults().size(), 1u);
}

TEST_F(OrchestratorTest, RejectedSchemataFallsBackPerSite) {
  runtime.rejectSchemata = true;
  setUpProgram(kAdd, {{"demo.core-test/test-add",
                       runtime.expectCall("add", {2, 3}, 5)}});
  std::vector<Diagnostic> diagnostics;
  ScopedDiagnosticHandler handler(
      [&](const Diagnostic &diag) { diagnostics.push_back(diag); });

  auto report = runOnce();
  ASSERT_TRUE(static_cast<bool>(report)) << llvm::toString(report.takeError());
  const SiteResult *result = findResult(*report, "aor.+->-");
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->verdict, VerdictKind::Killed);
  EXPECT_EQ(orchestrator->getStatistics().schemataBatches, 0u);
  EXPECT_EQ(orchestrator->getStatistics().fallbacks, 1u);
  ASSERT_FALSE(diagnostics.empty());
  EXPECT_EQ(diagnostics[0].severity, DiagSeverity::Warning);
  EXPECT_NE(diagnostics[0].message.find("applying them one by one"),
            std::string::npos);
  EXPECT_EQ(read(source), kAdd);
}

TEST_F(OrchestratorTest, ClusterMembersShareTheVerdict) {
  config->getMutationSettings().clusterKey = "operator";
  setUpProgram("(defn add [a b]\n  (+ a b))\n"
               "(defn add3 [a b c]\n  (+ a b c))\n",
               {{"demo.core-test/test-add",
                 runtime.expectCall("add", {2, 3}, 5)},
                {"demo.core-test/test-add3",
                 runtime.expectCall("add3", {1, 2, 3}, 6)}});
  auto report = runOnce();
  ASSERT_TRUE(static_cast<bool>(report)) << llvm::toString(report.takeError());

  ASSERT_EQ(report->getResults().size(), 2u);
  EXPECT_EQ(orchestrator->getStatistics().clusters, 1u);
  EXPECT_EQ(orchestrator->getStatistics().executed, 1u);
  const SiteResult &first = report->getResults()[0];
  const SiteResult &second = report->getResults()[1];
  EXPECT_EQ(first.verdict, second.verdict);
  EXPECT_EQ(first.verdict, VerdictKind::Killed);
  EXPECT_NE(first.representative.empty(), second.representative.empty());
}

TEST_F(OrchestratorTest, LeftoverBackupIsRestoredFirst) {
  setUpProgram(kAdd, {{"demo.core-test/test-add",
                       runtime.expectCall("add", {2, 3}, 5)}});
  // A previous run died with a mutant in place.
  write(getBackupPath(source), kAdd);
  write(source, "(ns demo.core)\n\n(defn add [a b]\n  (- a b))\n");
  ASSERT_FALSE(llvm::errorToBool(runtime.reload(source)));

  std::vector<Diagnostic> diagnostics;
  ScopedDiagnosticHandler handler(
      [&](const Diagnostic &diag) { diagnostics.push_back(diag); });
  auto report = runOnce();
  ASSERT_TRUE(static_cast<bool>(report)) << llvm::toString(report.takeError());

  EXPECT_EQ(read(source), kAdd);
  EXPECT_FALSE(llvm::sys::fs::exists(getBackupPath(source)));
  const SiteResult *result = findResult(*report, "aor.+->-");
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->verdict, VerdictKind::Killed);
  ASSERT_FALSE(diagnostics.empty());
  EXPECT_NE(diagnostics[0].message.find("restored"), std::string::npos);
}

TEST_F(OrchestratorTest, CorruptStateIsDiscarded) {
  setUpProgram(kAdd, {{"demo.core-test/test-add",
                       runtime.expectCall("add", {2, 3}, 5)}});
  ASSERT_FALSE(llvm::errorToBool(runOnce().takeError()));
  write(orchestrator->getCoveragePath(), "{ not json");

  std::vector<Diagnostic> diagnostics;
  ScopedDiagnosticHandler handler(
      [&](const Diagnostic &diag) { diagnostics.push_back(diag); });
  auto report = runOnce();
  ASSERT_TRUE(static_cast<bool>(report)) << llvm::toString(report.takeError());
  EXPECT_EQ(orchestrator->getStatistics().refreshedUnits, 1u);
  ASSERT_FALSE(diagnostics.empty());
  EXPECT_NE(diagnostics[0].message.find("discarding coverage state"),
            std::string::npos);
}

TEST_F(OrchestratorTest, InvalidSettingsAreConfigErrors) {
  setUpProgram(kAdd, {});
  config->getMutationSettings().clusterKey = "random";
  EXPECT_EQ(consumeMutagenError(runOnce().takeError()),
            ErrorKind::ConfigError);

  config->getMutationSettings().clusterKey = "none";
  config->getMutationSettings().preset = "exhaustive";
  EXPECT_EQ(consumeMutagenError(runOnce().takeError()),
            ErrorKind::ConfigError);
}

} // namespace
