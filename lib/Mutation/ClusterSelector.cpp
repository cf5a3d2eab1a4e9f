//===- ClusterSelector.cpp - Representative site selection ----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Mutation/ClusterSelector.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/ErrorHandling.h"
#include <algorithm>

using namespace mutagen;

llvm::Expected<ClusterKey> mutagen::parseClusterKey(StringRef name) {
  auto key = llvm::StringSwitch<std::optional<ClusterKey>>(name)
                 .Case("none", ClusterKey::None)
                 .Case("operator", ClusterKey::Operator)
                 .Case("location", ClusterKey::Location)
                 .Case("shape", ClusterKey::Shape)
                 .Default(std::nullopt);
  if (!key)
    return makeError(ErrorKind::ConfigError,
                     "unknown cluster key '" + name +
                         "' (expected none, operator, location or shape)");
  return *key;
}

StringRef mutagen::getClusterKeyName(ClusterKey key) {
  switch (key) {
  case ClusterKey::None:
    return "none";
  case ClusterKey::Operator:
    return "operator";
  case ClusterKey::Location:
    return "location";
  case ClusterKey::Shape:
    return "shape";
  }
  llvm_unreachable("unknown cluster key");
}

std::string ClusterSelector::getKey(const MutationSite &site) const {
  switch (key) {
  case ClusterKey::None:
    return site.getId();
  case ClusterKey::Operator:
    return site.operatorId;
  case ClusterKey::Location:
    return site.file + "|" + site.formId + "|" +
           site.coord.dropBack(coordinatePrefix).toString();
  case ClusterKey::Shape:
    return getOperatorCategoryName(site.category).str() + "|" +
           site.parentShape;
  }
  llvm_unreachable("unknown cluster key");
}

/// True if `a` is a better representative than `b`.
static bool isHarder(const MutationSite &a, const MutationSite &b) {
  if (a.hardness != b.hardness)
    return a.hardness > b.hardness;
  return a.scanOrder < b.scanOrder;
}

std::vector<Cluster>
ClusterSelector::select(ArrayRef<MutationSite> sites) const {
  std::vector<size_t> order(sites.size());
  for (size_t i = 0, e = sites.size(); i < e; ++i)
    order[i] = i;
  std::stable_sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return sites[a].scanOrder < sites[b].scanOrder;
  });

  std::vector<Cluster> clusters;
  llvm::StringMap<size_t> byKey;
  for (size_t i : order) {
    std::string clusterKey = getKey(sites[i]);
    auto inserted = byKey.try_emplace(clusterKey, clusters.size());
    if (inserted.second) {
      Cluster cluster;
      cluster.key = std::move(clusterKey);
      cluster.representative = i;
      clusters.push_back(std::move(cluster));
    }
    Cluster &cluster = clusters[inserted.first->getValue()];
    cluster.members.push_back(i);
    if (isHarder(sites[i], sites[cluster.representative]))
      cluster.representative = i;
  }
  return clusters;
}
