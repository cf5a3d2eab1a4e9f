//===- CoverageStoreTest.cpp - Persisted coverage tests ---------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Coverage/CoverageStore.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"

using namespace mutagen;

namespace {

class CoverageStoreTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("mutagen-store", dir));
  }
  void TearDown() override { llvm::sys::fs::remove_directories(dir); }

  std::string write(StringRef name, StringRef contents) {
    llvm::SmallString<256> path(dir);
    llvm::sys::path::append(path, name);
    std::error_code ec;
    llvm::raw_fd_ostream os(path, ec);
    EXPECT_FALSE(ec) << ec.message();
    os << contents;
    return path.str().str();
  }

  HashedUnit makeUnit(StringRef id, StringRef testFile, StringRef srcFile) {
    HashedUnit unit;
    unit.config.id = id.str();
    unit.config.file = testFile.str();
    unit.config.tests = {(id + "/t").str()};
    unit.config.depends = {srcFile.str()};
    unit.hash = computeDependencyHash(unit.config);
    return unit;
  }

  llvm::SmallString<256> dir;
};

/// A recompute callback that records one location per test and counts calls.
struct CountingRecompute {
  unsigned calls = 0;

  llvm::Expected<UnitCoverage> operator()(const TestUnitConfig &config) {
    ++calls;
    UnitCoverage result;
    for (const std::string &test : config.tests)
      result.coverage.record(test, "src.clj:defn f",
                             llvm::cantFail(Coordinate::parse("2")));
    result.bridge.push_back({"src.clj:defn f", "src.clj", 3});
    return result;
  }
};

TEST_F(CoverageStoreTest, DependencyHashTracksContent) {
  std::string test = write("t.clj", "(deftest t)");
  std::string src = write("s.clj", "(defn f [] 1)");
  HashedUnit unit = makeUnit("u", test, src);
  EXPECT_EQ(computeDependencyHash(unit.config), unit.hash);

  write("s.clj", "(defn f [] 2)");
  EXPECT_NE(computeDependencyHash(unit.config), unit.hash);
}

TEST_F(CoverageStoreTest, DependencyHashIgnoresOrderAndDuplicates) {
  std::string a = write("a.clj", "a");
  std::string b = write("b.clj", "b");
  TestUnitConfig first{"u", a, {}, {b, a}};
  TestUnitConfig second{"u", b, {}, {a, a}};
  EXPECT_EQ(computeDependencyHash(first), computeDependencyHash(second));
}

TEST_F(CoverageStoreTest, MissingDependencyChangesHash) {
  std::string test = write("t.clj", "(deftest t)");
  std::string src = write("s.clj", "(defn f [] 1)");
  HashedUnit unit = makeUnit("u", test, src);
  llvm::sys::fs::remove(src);
  ContentHash missing = computeDependencyHash(unit.config);
  EXPECT_NE(missing, unit.hash);
  EXPECT_EQ(computeDependencyHash(unit.config), missing);
}

TEST_F(CoverageStoreTest, StaleUnitIsNeverServed) {
  std::string test = write("t.clj", "(deftest t)");
  std::string src = write("s.clj", "(defn f [] 1)");
  HashedUnit unit = makeUnit("u", test, src);

  CoverageStore store;
  auto missing = store.getIndex(unit);
  ASSERT_FALSE(static_cast<bool>(missing));
  EXPECT_EQ(consumeMutagenError(missing.takeError()),
            ErrorKind::IndexStaleness);

  CountingRecompute recompute;
  auto refreshed = store.refresh(unit, recompute);
  ASSERT_TRUE(static_cast<bool>(refreshed));
  EXPECT_EQ(*refreshed, std::vector<std::string>{"u"});
  EXPECT_FALSE(llvm::errorToBool(store.checkFresh("u", unit.hash)));

  write("s.clj", "(defn f [] 2)");
  HashedUnit changed = makeUnit("u", test, src);
  auto stale = store.getIndex(changed);
  ASSERT_FALSE(static_cast<bool>(stale));
  EXPECT_EQ(consumeMutagenError(stale.takeError()),
            ErrorKind::IndexStaleness);
}

TEST_F(CoverageStoreTest, RefreshRecomputesOnlyChangedUnits) {
  std::string srcA = write("a.clj", "(defn a [] 1)");
  std::string srcB = write("b.clj", "(defn b [] 1)");
  std::string testA = write("a_test.clj", "(deftest ta)");
  std::string testB = write("b_test.clj", "(deftest tb)");
  std::vector<HashedUnit> units = {makeUnit("ua", testA, srcA),
                                   makeUnit("ub", testB, srcB)};

  CoverageStore store;
  CountingRecompute recompute;
  ASSERT_TRUE(static_cast<bool>(store.refresh(units, recompute)));
  EXPECT_EQ(recompute.calls, 2u);

  auto again = store.refresh(units, recompute);
  ASSERT_TRUE(static_cast<bool>(again));
  EXPECT_TRUE(again->empty());
  EXPECT_EQ(recompute.calls, 2u);

  write("b.clj", "(defn b [] 2)");
  units[1] = makeUnit("ub", testB, srcB);
  auto partial = store.refresh(units, recompute);
  ASSERT_TRUE(static_cast<bool>(partial));
  EXPECT_EQ(*partial, std::vector<std::string>{"ub"});
  EXPECT_EQ(recompute.calls, 3u);

  auto index = store.getIndex(units);
  ASSERT_TRUE(static_cast<bool>(index));
  EXPECT_EQ(index->getTestIds(), (std::vector<std::string>{"ua/t", "ub/t"}));
}

TEST_F(CoverageStoreTest, RecomputeFailurePropagates) {
  std::string test = write("t.clj", "(deftest t)");
  std::string src = write("s.clj", "(defn f [] 1)");
  HashedUnit unit = makeUnit("u", test, src);

  CoverageStore store;
  auto crash = [](const TestUnitConfig &) -> llvm::Expected<UnitCoverage> {
    return makeError(ErrorKind::TestError, "runner crashed");
  };
  auto result = store.refresh(unit, crash);
  ASSERT_FALSE(static_cast<bool>(result));
  EXPECT_EQ(consumeMutagenError(result.takeError()), ErrorKind::TestError);
  EXPECT_TRUE(store.empty());
}

TEST_F(CoverageStoreTest, RetainOnlyDropsRemovedUnits) {
  std::string src = write("s.clj", "(defn f [] 1)");
  std::string testA = write("a_test.clj", "(deftest ta)");
  std::string testB = write("b_test.clj", "(deftest tb)");
  std::vector<HashedUnit> units = {makeUnit("ua", testA, src),
                                   makeUnit("ub", testB, src)};
  CoverageStore store;
  CountingRecompute recompute;
  ASSERT_TRUE(static_cast<bool>(store.refresh(units, recompute)));

  units.pop_back();
  store.retainOnly(units);
  EXPECT_EQ(store.getUnitIds(), std::vector<std::string>{"ua"});
}

TEST_F(CoverageStoreTest, SaveAndLoad) {
  std::string test = write("t.clj", "(deftest t)");
  std::string src = write("s.clj", "(defn f [] 1)");
  HashedUnit unit = makeUnit("u", test, src);

  CoverageStore store;
  CountingRecompute recompute;
  ASSERT_TRUE(static_cast<bool>(store.refresh(unit, recompute)));

  llvm::SmallString<256> path(dir);
  llvm::sys::path::append(path, "state", "coverage.json");
  ASSERT_FALSE(llvm::errorToBool(store.save(path)));

  auto loaded = CoverageStore::load(path);
  ASSERT_TRUE(static_cast<bool>(loaded)) << llvm::toString(loaded.takeError());
  EXPECT_FALSE(llvm::errorToBool(loaded->checkFresh("u", unit.hash)));
  ASSERT_NE(loaded->lookup("u"), nullptr);
  EXPECT_EQ(loaded->lookup("u")->coverage, store.lookup("u")->coverage);
  EXPECT_EQ(loaded->getLocator().locate("src.clj", 5),
            StringRef("src.clj:defn f"));
}

TEST_F(CoverageStoreTest, LoadMissingFileIsEmpty) {
  llvm::SmallString<256> path(dir);
  llvm::sys::path::append(path, "none.json");
  auto loaded = CoverageStore::load(path);
  ASSERT_TRUE(static_cast<bool>(loaded));
  EXPECT_TRUE(loaded->empty());
}

TEST_F(CoverageStoreTest, LoadCorruptFileIsStateError) {
  for (const char *contents :
       {"{not json", "{\"version\": 99, \"units\": []}",
        "{\"version\": 1, \"units\": [{\"id\": \"u\"}]}"}) {
    std::string path = write("coverage.json", contents);
    auto loaded = CoverageStore::load(path);
    ASSERT_FALSE(static_cast<bool>(loaded)) << contents;
    EXPECT_EQ(consumeMutagenError(loaded.takeError()),
              ErrorKind::StateError);
  }
}

} // namespace
