//===- MutationReportTest.cpp - Verdict tally tests -------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Engine/MutationReport.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"

using namespace mutagen;

namespace {

SiteResult makeResult(StringRef form, StringRef op, unsigned line,
                      VerdictKind verdict) {
  SiteResult result;
  result.formId = form.str();
  result.coord = "3";
  result.operatorId = op.str();
  result.siteId = (form + "@3:" + op).str();
  result.file = "src/core.clj";
  result.line = line;
  result.original = "(+ a b)";
  result.replacement = "(- a b)";
  result.verdict = verdict;
  return result;
}

MutationReport makeReport() {
  MutationReport report;
  report.addResult(makeResult("src/core.clj:defn f", "aor.+->-", 4,
                              VerdictKind::Killed));
  report.addResult(makeResult("src/core.clj:defn f", "aor.*->/", 4,
                              VerdictKind::Survived));
  report.addResult(makeResult("src/core.clj:defn g", "aor.+->-", 9,
                              VerdictKind::NoCoverage));
  report.addResult(makeResult("src/core.clj:defn g", "aor.inc->dec", 9,
                              VerdictKind::Timeout));
  report.addEquivalent({"src/core.clj:defn h@2:aor.*->/",
                        "src/core.clj:defn h", "src/core.clj", 12,
                        "multiply/divide by one"});
  report.addSubsumed({"src/core.clj:defn f@3:ror.<->>",
                      "src/core.clj:defn f", "src/core.clj", 4,
                      "src/core.clj:defn f@3:ror.<->not="});
  return report;
}

TEST(MutationReportTest, CountsAndScore) {
  MutationReport report = makeReport();
  EXPECT_EQ(report.count(VerdictKind::Killed), 1u);
  EXPECT_EQ(report.count(VerdictKind::Survived), 1u);
  EXPECT_EQ(report.count(VerdictKind::NoCoverage), 1u);
  EXPECT_EQ(report.count(VerdictKind::Timeout), 1u);
  EXPECT_EQ(report.count(VerdictKind::Error), 0u);
  // Only killed and survived enter the score.
  ASSERT_TRUE(report.getScore().has_value());
  EXPECT_DOUBLE_EQ(*report.getScore(), 0.5);
}

TEST(MutationReportTest, NoScoreWithoutDecidedSites) {
  MutationReport report;
  EXPECT_FALSE(report.getScore().has_value());
  report.addResult(makeResult("src/core.clj:defn g", "aor.+->-", 9,
                              VerdictKind::NoCoverage));
  EXPECT_FALSE(report.getScore().has_value());
}

TEST(MutationReportTest, Lookup) {
  MutationReport report = makeReport();
  const SiteResult *result = report.lookup("src/core.clj:defn f@3:aor.*->/");
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->verdict, VerdictKind::Survived);
  EXPECT_EQ(report.lookup("src/core.clj:defn f@9:aor.*->/"), nullptr);
}

TEST(MutationReportTest, MergeKeepsOnlyListedForms) {
  MutationReport previous = makeReport();
  MutationReport current;
  current.addResult(makeResult("src/core.clj:defn f", "aor.+->-", 4,
                               VerdictKind::Survived));

  llvm::StringSet<> unchanged;
  unchanged.insert("src/core.clj:defn f");
  unchanged.insert("src/core.clj:defn h");
  current.mergeFrom(previous, unchanged);

  // The fresh result wins over the stored one.
  ASSERT_EQ(current.getResults().size(), 2u);
  EXPECT_EQ(current.lookup("src/core.clj:defn f@3:aor.+->-")->verdict,
            VerdictKind::Survived);
  EXPECT_NE(current.lookup("src/core.clj:defn f@3:aor.*->/"), nullptr);
  EXPECT_EQ(current.lookup("src/core.clj:defn g@3:aor.+->-"), nullptr);
  EXPECT_EQ(current.getEquivalent().size(), 1u);
  EXPECT_EQ(current.getSubsumed().size(), 1u);
}

TEST(MutationReportTest, SortByLocation) {
  MutationReport report;
  report.addResult(makeResult("src/core.clj:defn g", "b", 9,
                              VerdictKind::Killed));
  report.addResult(makeResult("src/core.clj:defn f", "b", 4,
                              VerdictKind::Killed));
  report.addResult(makeResult("src/core.clj:defn f", "a", 4,
                              VerdictKind::Killed));
  report.sort();
  ASSERT_EQ(report.getResults().size(), 3u);
  EXPECT_EQ(report.getResults()[0].siteId, "src/core.clj:defn f@3:a");
  EXPECT_EQ(report.getResults()[1].siteId, "src/core.clj:defn f@3:b");
  EXPECT_EQ(report.getResults()[2].siteId, "src/core.clj:defn g@3:b");
}

TEST(MutationReportTest, JSONSummary) {
  llvm::json::Value json = makeReport().toJSON();
  auto *root = json.getAsObject();
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(root->getInteger("version"), int64_t(1));
  auto *summary = root->getObject("summary");
  ASSERT_NE(summary, nullptr);
  EXPECT_EQ(summary->getInteger("killed"), int64_t(1));
  EXPECT_EQ(summary->getInteger("no-coverage"), int64_t(1));
  EXPECT_EQ(summary->getInteger("equivalent"), int64_t(1));
  EXPECT_EQ(summary->getNumber("score"), 0.5);

  auto *results = root->getArray("results");
  ASSERT_NE(results, nullptr);
  ASSERT_EQ(results->size(), 4u);
  auto *first = (*results)[0].getAsObject();
  EXPECT_EQ(first->getString("verdict"), StringRef("killed"));
  EXPECT_EQ(first->getString("operator"), StringRef("aor.+->-"));
}

TEST(MutationReportTest, SaveAndLoad) {
  llvm::SmallString<256> dir;
  ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("mutagen-report", dir));
  llvm::SmallString<256> file(dir);
  llvm::sys::path::append(file, "state", "results.json");

  MutationReport report = makeReport();
  SiteResult clustered = makeResult("src/core.clj:defn g", "aor.--/+", 9,
                                    VerdictKind::Timeout);
  clustered.representative = "src/core.clj:defn g@3:aor.inc->dec";
  clustered.tests = {"demo.core-test/test-g"};
  report.addResult(clustered);
  ASSERT_FALSE(llvm::errorToBool(report.save(file)));

  auto loaded = MutationReport::load(file);
  ASSERT_TRUE(static_cast<bool>(loaded)) << llvm::toString(loaded.takeError());
  ASSERT_EQ(loaded->getResults().size(), 5u);
  const SiteResult *result = loaded->lookup(clustered.siteId);
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->representative, clustered.representative);
  EXPECT_EQ(result->tests, clustered.tests);
  EXPECT_EQ(result->original, "(+ a b)");
  EXPECT_EQ(loaded->getEquivalent()[0].why, "multiply/divide by one");
  EXPECT_EQ(loaded->getSubsumed()[0].why,
            "src/core.clj:defn f@3:ror.<->not=");
  EXPECT_EQ(loaded->getScore(), report.getScore());

  llvm::sys::fs::remove_directories(dir);
}

TEST(MutationReportTest, LoadMissingAndCorrupt) {
  llvm::SmallString<256> dir;
  ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("mutagen-report", dir));
  llvm::SmallString<256> file(dir);
  llvm::sys::path::append(file, "results.json");

  auto missing = MutationReport::load(file);
  ASSERT_TRUE(static_cast<bool>(missing));
  EXPECT_TRUE(missing->getResults().empty());

  {
    std::error_code ec;
    llvm::raw_fd_ostream os(file, ec);
    ASSERT_FALSE(ec);
    os << "{\"version\": 1, \"results\": [{\"site\": \"x\"}]}";
  }
  EXPECT_EQ(consumeMutagenError(MutationReport::load(file).takeError()),
            ErrorKind::StateError);

  llvm::sys::fs::remove_directories(dir);
}

TEST(MutationReportTest, PrintListsSurvivors) {
  std::string text;
  llvm::raw_string_ostream os(text);
  makeReport().print(os);
  os.flush();
  EXPECT_NE(text.find("Killed:      1"), std::string::npos);
  EXPECT_NE(text.find("Score:       50.0%"), std::string::npos);
  EXPECT_NE(text.find("[SURV] src/core.clj:4: aor.*->/"), std::string::npos);
  EXPECT_NE(text.find("[NCOV] src/core.clj:9: aor.+->-"), std::string::npos);
  // Killed mutants only show up in verbose mode.
  EXPECT_EQ(text.find("[KILL]"), std::string::npos);

  std::string verbose;
  llvm::raw_string_ostream vos(verbose);
  makeReport().print(vos, /*verbose=*/true);
  vos.flush();
  EXPECT_NE(verbose.find("[KILL] src/core.clj:4: aor.+->-"),
            std::string::npos);
  EXPECT_NE(verbose.find("[EQUV]"), std::string::npos);
  EXPECT_NE(verbose.find("[SUBS]"), std::string::npos);
}

} // namespace
