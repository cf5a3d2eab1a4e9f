//===- ChangeDetectorTest.cpp - Incremental comparison tests ----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Engine/ChangeDetector.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"

using namespace mutagen;

namespace {

const char *kOriginal = "(ns demo.core)\n"
                        "(defn add [a b] (+ a b))\n"
                        "(defn sub [a b] (- a b))\n";

DigestTable tableOf(StringRef text, StringRef file = "src/core.clj") {
  Document doc = llvm::cantFail(Document::parse(text, file));
  const Document *docs[] = {&doc};
  return DigestTable::fromDocuments(docs);
}

bool noTestsChanged(const FormDigest &) { return false; }

class ChangeDetectorTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("mutagen-changes", dir));
  }
  void TearDown() override { llvm::sys::fs::remove_directories(dir); }

  std::string path(StringRef name) {
    llvm::SmallString<256> result(dir);
    llvm::sys::path::append(result, name);
    return std::string(result);
  }

  void write(StringRef file, StringRef contents) {
    std::error_code ec;
    llvm::raw_fd_ostream os(file, ec);
    ASSERT_FALSE(ec) << ec.message();
    os << contents;
  }

  llvm::SmallString<256> dir;
};

TEST_F(ChangeDetectorTest, TableFromDocuments) {
  DigestTable table = tableOf(kOriginal);
  ASSERT_EQ(table.getForms().size(), 3u);
  const FormDigest *add = table.lookupForm("src/core.clj:defn add");
  ASSERT_NE(add, nullptr);
  EXPECT_EQ(add->file, "src/core.clj");
  EXPECT_EQ(add->line, 2u);
  EXPECT_EQ(add->digest, ContentHash::fromString("(defn add [a b] (+ a b))"));
  EXPECT_EQ(table.lookupForm("src/core.clj:defn mul"), nullptr);
}

TEST_F(ChangeDetectorTest, FirstRunAddsEverything) {
  DigestTable previous;
  ChangeSet changes =
      ChangeDetector(previous).detect(tableOf(kOriginal), noTestsChanged);
  EXPECT_EQ(changes.count(ChangeKind::Added), 3u);
  EXPECT_EQ(changes.getChangedForms().size(), 3u);
  EXPECT_TRUE(changes.getUnchangedForms().empty());
}

TEST_F(ChangeDetectorTest, UnchangedRerun) {
  DigestTable previous = tableOf(kOriginal);
  ChangeSet changes =
      ChangeDetector(previous).detect(tableOf(kOriginal), noTestsChanged);
  EXPECT_EQ(changes.count(ChangeKind::Unchanged), 3u);
  EXPECT_TRUE(changes.getChangedForms().empty());
  EXPECT_FALSE(changes.isChanged("src/core.clj:defn add"));
}

TEST_F(ChangeDetectorTest, ModifiedAddedAndRemoved) {
  DigestTable previous = tableOf(kOriginal);
  DigestTable current = tableOf("(ns demo.core)\n"
                                "(defn add [a b] (+ a b 0))\n"
                                "(defn mul [a b] (* a b))\n");
  ChangeSet changes = ChangeDetector(previous).detect(current, noTestsChanged);

  ASSERT_EQ(changes.getChanges().size(), 4u);
  EXPECT_EQ(changes.getChanges()[0].kind, ChangeKind::Unchanged);
  EXPECT_EQ(changes.getChanges()[1].formId, "src/core.clj:defn add");
  EXPECT_EQ(changes.getChanges()[1].kind, ChangeKind::Modified);
  EXPECT_EQ(changes.getChanges()[2].formId, "src/core.clj:defn mul");
  EXPECT_EQ(changes.getChanges()[2].kind, ChangeKind::Added);
  EXPECT_EQ(changes.getChanges()[3].formId, "src/core.clj:defn sub");
  EXPECT_EQ(changes.getChanges()[3].kind, ChangeKind::Removed);

  EXPECT_TRUE(changes.isChanged("src/core.clj:defn add"));
  EXPECT_TRUE(changes.isChanged("src/core.clj:defn mul"));
  // Removed forms are not rescanned.
  EXPECT_FALSE(changes.isChanged("src/core.clj:defn sub"));
  EXPECT_EQ(changes.getChangedForms().size(), 2u);
}

TEST_F(ChangeDetectorTest, WhitespaceInsideFormIsModification) {
  DigestTable previous = tableOf(kOriginal);
  DigestTable current = tableOf("(ns demo.core)\n"
                                "(defn add [a b]  (+ a b))\n"
                                "(defn sub [a b] (- a b))\n");
  ChangeSet changes = ChangeDetector(previous).detect(current, noTestsChanged);
  EXPECT_TRUE(changes.isChanged("src/core.clj:defn add"));
  EXPECT_FALSE(changes.isChanged("src/core.clj:defn sub"));
}

TEST_F(ChangeDetectorTest, MovedFileCountsAsAdded) {
  DigestTable previous = tableOf(kOriginal);
  DigestTable current;
  for (const FormDigest &form : previous.getForms()) {
    FormDigest moved = form;
    moved.file = "src/moved.clj";
    current.addForm(moved);
  }
  ChangeSet changes = ChangeDetector(previous).detect(current, noTestsChanged);
  EXPECT_EQ(changes.count(ChangeKind::Added), 3u);
}

TEST_F(ChangeDetectorTest, TestsChangedInvalidatesCoveredForms) {
  DigestTable previous = tableOf(kOriginal);
  ChangeSet changes = ChangeDetector(previous).detect(
      tableOf(kOriginal), [](const FormDigest &form) {
        return form.formId == "src/core.clj:defn sub";
      });
  EXPECT_EQ(changes.count(ChangeKind::TestsChanged), 1u);
  EXPECT_TRUE(changes.isChanged("src/core.clj:defn sub"));
  EXPECT_EQ(changes.getUnchangedForms().size(), 2u);
}

TEST_F(ChangeDetectorTest, SelectionChangeInvalidatesEveryForm) {
  MutationSettings settings;
  std::vector<std::string> addOnly = {"aor.+->-"};
  std::vector<std::string> subOnly = {"aor.-->+"};
  DigestTable previous = tableOf(kOriginal);
  previous.setSelectionDigest(computeSelectionDigest(addOnly, settings));

  DigestTable same = tableOf(kOriginal);
  same.setSelectionDigest(computeSelectionDigest(addOnly, settings));
  EXPECT_EQ(ChangeDetector(previous)
                .detect(same, noTestsChanged)
                .count(ChangeKind::Unchanged),
            3u);

  DigestTable current = tableOf(kOriginal);
  current.setSelectionDigest(computeSelectionDigest(subOnly, settings));
  ChangeSet changes = ChangeDetector(previous).detect(current, noTestsChanged);
  EXPECT_EQ(changes.count(ChangeKind::SelectionChanged), 3u);
  EXPECT_TRUE(changes.getUnchangedForms().empty());
  EXPECT_TRUE(changes.isChanged("src/core.clj:defn add"));

  MutationSettings clustered = settings;
  clustered.clusterKey = "operator";
  EXPECT_NE(computeSelectionDigest(addOnly, clustered),
            computeSelectionDigest(addOnly, settings));
  MutationSettings shallower = settings;
  shallower.coordinatePrefix = 2;
  EXPECT_NE(computeSelectionDigest(addOnly, shallower),
            computeSelectionDigest(addOnly, settings));

  // A table written before selections were recorded counts as different.
  DigestTable unrecorded = tableOf(kOriginal);
  EXPECT_EQ(ChangeDetector(unrecorded)
                .detect(current, noTestsChanged)
                .count(ChangeKind::SelectionChanged),
            3u);
}

TEST_F(ChangeDetectorTest, UnitDigests) {
  std::string testFile = path("core_test.clj");
  write(testFile, "(deftest test-add (is (= 5 (add 2 3))))\n");
  TestUnitConfig unit{"demo.core-test", testFile, {"demo.core-test/test-add"},
                      {}};
  ContentHash digest = computeUnitDigest(unit);
  EXPECT_EQ(computeUnitDigest(unit), digest);

  TestUnitConfig moreTests = unit;
  moreTests.tests.push_back("demo.core-test/test-sub");
  EXPECT_NE(computeUnitDigest(moreTests), digest);

  write(testFile, "(deftest test-add (is (= 6 (add 3 3))))\n");
  EXPECT_NE(computeUnitDigest(unit), digest);

  TestUnitConfig missing = unit;
  missing.file = path("missing.clj");
  EXPECT_NE(computeUnitDigest(missing), digest);
}

TEST_F(ChangeDetectorTest, ChangedUnits) {
  DigestTable previous;
  previous.setUnitDigest("a", ContentHash(1, 1));
  previous.setUnitDigest("b", ContentHash(2, 2));
  DigestTable current;
  current.setUnitDigest("a", ContentHash(1, 1));
  current.setUnitDigest("b", ContentHash(2, 3));
  current.setUnitDigest("c", ContentHash(4, 4));

  llvm::StringSet<> changed = ChangeDetector(previous).getChangedUnits(current);
  EXPECT_EQ(changed.size(), 2u);
  EXPECT_TRUE(changed.contains("b"));
  EXPECT_TRUE(changed.contains("c"));
}

TEST_F(ChangeDetectorTest, SaveAndLoad) {
  DigestTable table = tableOf(kOriginal);
  table.setUnitDigest("demo.core-test", ContentHash(0x1234, 0x5678));
  table.setSelectionDigest(ContentHash(0x9abc, 0xdef0));
  std::string file = path("state/digests.json");
  ASSERT_FALSE(llvm::errorToBool(table.save(file)));

  auto loaded = DigestTable::load(file);
  ASSERT_TRUE(static_cast<bool>(loaded)) << llvm::toString(loaded.takeError());
  ASSERT_EQ(loaded->getForms().size(), 3u);
  for (const FormDigest &form : table.getForms()) {
    const FormDigest *other = loaded->lookupForm(form.formId);
    ASSERT_NE(other, nullptr);
    EXPECT_EQ(other->file, form.file);
    EXPECT_EQ(other->line, form.line);
    EXPECT_EQ(other->digest, form.digest);
  }
  EXPECT_EQ(loaded->getUnitDigest("demo.core-test"),
            ContentHash(0x1234, 0x5678));
  EXPECT_EQ(loaded->getSelectionDigest(), ContentHash(0x9abc, 0xdef0));
}

TEST_F(ChangeDetectorTest, MissingStateIsEmpty) {
  auto loaded = DigestTable::load(path("nothing.json"));
  ASSERT_TRUE(static_cast<bool>(loaded));
  EXPECT_TRUE(loaded->empty());
}

TEST_F(ChangeDetectorTest, CorruptStateIsStateError) {
  std::string file = path("digests.json");
  write(file, "{\"version\": 1, \"forms\": [{\"form\": 3}]}");
  EXPECT_EQ(consumeMutagenError(DigestTable::load(file).takeError()),
            ErrorKind::StateError);

  write(file, "not json");
  EXPECT_EQ(consumeMutagenError(DigestTable::load(file).takeError()),
            ErrorKind::StateError);

  write(file, "{\"version\": 9, \"forms\": []}");
  EXPECT_EQ(consumeMutagenError(DigestTable::load(file).takeError()),
            ErrorKind::StateError);
}

TEST_F(ChangeDetectorTest, KindNames) {
  EXPECT_EQ(getChangeKindName(ChangeKind::SelectionChanged),
            "selection-changed");
  EXPECT_EQ(getChangeKindName(ChangeKind::TestsChanged), "tests-changed");
  EXPECT_EQ(getChangeKindName(ChangeKind::Removed), "removed");
}

} // namespace
