//===- ClusterSelector.h - Representative site selection -------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Groups sites by a configurable key and picks one representative per group:
// the hardest member, ties broken by scan order. Only representatives run;
// the other members inherit the representative's verdict. A cluster reported
// killed may therefore contain weaker mutants that never ran.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_MUTATION_CLUSTERSELECTOR_H
#define MUTAGEN_MUTATION_CLUSTERSELECTOR_H

#include "mutagen/Mutation/MutationSite.h"
#include "llvm/Support/Error.h"
#include <string>
#include <vector>

namespace mutagen {

enum class ClusterKey {
  /// Every site is its own cluster.
  None,
  /// Operator id.
  Operator,
  /// File, form and coordinate with the last segments dropped.
  Location,
  /// Operator category and parent shape.
  Shape,
};

/// Parse "none", "operator", "location" or "shape". Fails with ConfigError.
llvm::Expected<ClusterKey> parseClusterKey(StringRef name);
StringRef getClusterKeyName(ClusterKey key);

struct Cluster {
  std::string key;
  /// Indices into the selected site list, in scan order.
  std::vector<size_t> members;
  /// Index of the representative.
  size_t representative = 0;
};

class ClusterSelector {
public:
  explicit ClusterSelector(ClusterKey key, unsigned coordinatePrefix = 1)
      : key(key), coordinatePrefix(coordinatePrefix) {}

  /// The group key of `site`.
  std::string getKey(const MutationSite &site) const;

  /// Group `sites`. Clusters are ordered by their first member.
  std::vector<Cluster> select(ArrayRef<MutationSite> sites) const;

private:
  ClusterKey key;
  unsigned coordinatePrefix;
};

} // namespace mutagen

#endif // MUTAGEN_MUTATION_CLUSTERSELECTOR_H
