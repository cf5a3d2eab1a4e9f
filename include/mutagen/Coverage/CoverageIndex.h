//===- CoverageIndex.h - Test to syntax location coverage -------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the CoverageIndex, which records which tests evaluated
// which syntax locations. It is built by folding trace events into a forward
// map (test -> locations); the inverse map (location -> tests) is derived from
// the forward map and never mutated on its own.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_COVERAGE_COVERAGEINDEX_H
#define MUTAGEN_COVERAGE_COVERAGEINDEX_H

#include "mutagen/CAST/Coordinate.h"
#include "mutagen/Support/LLVM.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace mutagen {

/// One observation from the trace oracle: `testId` evaluated the node at
/// `coord` inside `formId`.
struct TraceEvent {
  std::string testId;
  std::string formId;
  Coordinate coord;
};

/// A covered location, (form id, coordinate text).
using CoveredLocation = std::pair<std::string, std::string>;

class CoverageIndex {
public:
  CoverageIndex() = default;

  //===--------------------------------------------------------------------===//
  // Building
  //===--------------------------------------------------------------------===//

  /// Record that `testId` covered (formId, coord). Repeated events union.
  void record(StringRef testId, StringRef formId, const Coordinate &coord);
  void record(const TraceEvent &event) {
    record(event.testId, event.formId, event.coord);
  }

  /// Register a test that covered nothing, so it is known to have run.
  void addTest(StringRef testId);

  /// Drop every record of `testId`.
  void removeTest(StringRef testId);

  /// Union with another index. Commutative and idempotent.
  void merge(const CoverageIndex &other);

  void clear();

  //===--------------------------------------------------------------------===//
  // Queries
  //===--------------------------------------------------------------------===//

  /// Tests that covered exactly (formId, coord), sorted. An empty result
  /// means no covering test; it is not distinguished from an unknown key.
  std::vector<std::string> testsFor(StringRef formId,
                                    const Coordinate &coord) const;

  /// Like testsFor, but a `leaf` token with no record of its own falls back
  /// to its immediate parent. Instrumentation records evaluated expressions,
  /// not the symbols and literals inside them. A composite node without a
  /// record was never evaluated.
  std::vector<std::string> testsCovering(StringRef formId,
                                         const Coordinate &coord,
                                         bool leaf) const;

  /// Tests that covered any location inside `formId`, sorted.
  std::vector<std::string> testsInForm(StringRef formId) const;

  /// Locations covered by `testId`, sorted.
  std::vector<CoveredLocation> locationsFor(StringRef testId) const;

  /// Every test with a record, sorted.
  std::vector<std::string> getTestIds() const;

  bool hasTest(StringRef testId) const { return forward.count(testId); }
  size_t getNumTests() const { return forward.size(); }
  size_t getNumLocations() const;
  bool empty() const { return forward.empty(); }

  bool operator==(const CoverageIndex &other) const;
  bool operator!=(const CoverageIndex &other) const {
    return !(*this == other);
  }

  //===--------------------------------------------------------------------===//
  // Serialization
  //===--------------------------------------------------------------------===//

  /// {"<test>": [{"form": ..., "coord": ...}, ...], ...}
  llvm::json::Value toJSON() const;
  static llvm::Expected<CoverageIndex> fromJSON(const llvm::json::Value &json);

private:
  void rebuildInverse();

  /// test -> covered locations.
  llvm::StringMap<std::set<CoveredLocation>> forward;
  /// form -> coordinate text -> tests. Derived from `forward`.
  llvm::StringMap<std::map<std::string, std::set<std::string>>> inverse;
};

} // namespace mutagen

#endif // MUTAGEN_COVERAGE_COVERAGEINDEX_H
