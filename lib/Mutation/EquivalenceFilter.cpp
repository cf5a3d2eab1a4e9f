//===- EquivalenceFilter.cpp - Static equivalent-mutant removal -----------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Mutation/EquivalenceFilter.h"
#include "llvm/Support/Debug.h"

#define DEBUG_TYPE "mutagen-equivalence"

using namespace mutagen;

std::optional<std::string>
EquivalenceFilter::check(const MutationSite &site, const Location &loc) const {
  const Operator *op = catalog.lookup(site.operatorId);
  if (!op || !op->equivalence)
    return std::nullopt;

  MatchContext ctx;
  ctx.node = loc.getNode();
  ctx.parent = loc.getParent();
  if (ctx.parent)
    ctx.ordinal = ctx.parent->getOrdinalOf(loc.getSteps().back().rawIndex);
  if (!op->equivalence->holds(ctx))
    return std::nullopt;
  return op->equivalence->reason;
}

llvm::Expected<EquivalenceResult>
EquivalenceFilter::filter(const Document &document,
                          std::vector<MutationSite> sites) const {
  EquivalenceResult result;
  for (MutationSite &site : sites) {
    auto loc = document.decode(site.formId, site.coord);
    if (!loc)
      return loc.takeError();
    if (auto reason = check(site, *loc)) {
      LLVM_DEBUG(llvm::dbgs() << site.getId() << " is equivalent: " << *reason
                              << "\n");
      result.equivalent.push_back({std::move(site), std::move(*reason)});
      continue;
    }
    result.kept.push_back(std::move(site));
  }
  return result;
}
