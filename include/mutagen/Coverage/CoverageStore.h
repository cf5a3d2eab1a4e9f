//===- CoverageStore.h - Persisted per-unit coverage ------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Coverage is persisted per logical test unit, content-addressed by a hash of
// the unit's source dependencies. Only units whose hash changed are
// recomputed; a stale unit is never served.
//
// On-disk format (coverage.json):
//   {"version": 1,
//    "units": [{"id": "...", "hash": "<32 hex>",
//               "tests": {"<test>": [{"form": "...", "coord": "..."}]},
//               "bridge": [{"form": "...", "file": "...", "line": N}]}]}
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_COVERAGE_COVERAGESTORE_H
#define MUTAGEN_COVERAGE_COVERAGESTORE_H

#include "mutagen/Coverage/CoverageIndex.h"
#include "mutagen/Coverage/FormLocator.h"
#include "mutagen/Support/ContentHash.h"
#include "mutagen/Support/MutationConfig.h"
#include "llvm/ADT/STLFunctionalExtras.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include <map>
#include <string>
#include <vector>

namespace mutagen {

/// Coverage of one test unit together with the hash it was computed for.
struct UnitCoverage {
  std::string unitId;
  ContentHash dependencyHash;
  CoverageIndex coverage;
  /// Oracle form ids seen while computing `coverage`, with their location.
  std::vector<FormAnchor> bridge;
};

/// A configured unit paired with the current hash of its dependencies.
struct HashedUnit {
  TestUnitConfig config;
  ContentHash hash;
};

/// SHA-256 over the unit file and every dependency file, in sorted path
/// order. Paths must already be resolved. A missing file contributes a marker
/// derived from its path, so deleting a dependency changes the hash.
ContentHash computeDependencyHash(const TestUnitConfig &unit);

class CoverageStore {
public:
  using RecomputeFn =
      llvm::function_ref<llvm::Expected<UnitCoverage>(const TestUnitConfig &)>;

  CoverageStore() = default;

  /// Succeeds if a record for `unitId` exists and was computed for `hash`;
  /// IndexStaleness otherwise.
  llvm::Error checkFresh(StringRef unitId, const ContentHash &hash) const;

  const UnitCoverage *lookup(StringRef unitId) const;

  /// Insert or replace a unit record.
  void put(UnitCoverage unit);

  /// Drop records of units that are no longer configured.
  void retainOnly(ArrayRef<HashedUnit> units);

  /// Recompute every stale unit through `recompute`. Returns the ids of the
  /// refreshed units, in the order of `units`.
  llvm::Expected<std::vector<std::string>>
  refresh(ArrayRef<HashedUnit> units, RecomputeFn recompute);

  /// Union of the coverage of `units`. Fails with IndexStaleness if any of
  /// them is stale.
  llvm::Expected<CoverageIndex> getIndex(ArrayRef<HashedUnit> units) const;

  /// Bridge entries of every stored unit.
  FormLocator getLocator() const;

  std::vector<std::string> getUnitIds() const;
  size_t size() const { return units.size(); }
  bool empty() const { return units.empty(); }

  //===--------------------------------------------------------------------===//
  // Persistence
  //===--------------------------------------------------------------------===//

  llvm::json::Value toJSON() const;
  static llvm::Expected<CoverageStore> fromJSON(const llvm::json::Value &json);

  llvm::Error save(StringRef path) const;

  /// Load a store. A missing file yields an empty store; unreadable content
  /// is a StateError.
  static llvm::Expected<CoverageStore> load(StringRef path);

private:
  static constexpr int64_t VERSION = 1;

  std::map<std::string, UnitCoverage> units;
};

} // namespace mutagen

#endif // MUTAGEN_COVERAGE_COVERAGESTORE_H
