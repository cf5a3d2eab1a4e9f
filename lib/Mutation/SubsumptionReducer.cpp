//===- SubsumptionReducer.cpp - Dominance-minimal operator sets -----------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Mutation/SubsumptionReducer.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringSet.h"
#include <map>

using namespace mutagen;

std::vector<std::string>
SubsumptionReducer::reduce(ArrayRef<std::string> candidates) const {
  llvm::StringSet<> seen;
  std::vector<std::string> unique;
  for (const std::string &id : candidates)
    if (seen.insert(id).second)
      unique.push_back(id);

  std::vector<std::string> result;
  for (const std::string &id : unique) {
    bool dominated = llvm::any_of(unique, [&](const std::string &other) {
      return other != id && catalog.dominates(other, id);
    });
    if (!dominated)
      result.push_back(id);
  }
  return result;
}

SubsumptionResult
SubsumptionReducer::pruneSites(std::vector<MutationSite> sites) const {
  // Operators per location, in site order.
  std::map<std::pair<std::string, std::string>, std::vector<std::string>>
      byLocation;
  for (const MutationSite &site : sites)
    byLocation[{site.formId, site.coord.toString()}].push_back(
        site.operatorId);

  std::map<std::pair<std::string, std::string>, std::vector<std::string>>
      keptByLocation;
  for (auto &entry : byLocation)
    keptByLocation[entry.first] = reduce(entry.second);

  SubsumptionResult result;
  for (MutationSite &site : sites) {
    const auto &kept = keptByLocation[{site.formId, site.coord.toString()}];
    auto dominator = llvm::find_if(kept, [&](const std::string &id) {
      return id != site.operatorId && catalog.dominates(id, site.operatorId);
    });
    if (dominator == kept.end()) {
      result.kept.push_back(std::move(site));
      continue;
    }
    MutationSite dominating = site;
    dominating.operatorId = *dominator;
    std::string dominatorId = dominating.getId();
    result.subsumed.push_back({std::move(site), std::move(dominatorId)});
  }
  return result;
}
