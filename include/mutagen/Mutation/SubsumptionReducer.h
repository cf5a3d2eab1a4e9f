//===- SubsumptionReducer.h - Dominance-minimal operator sets ---*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Given the catalog's dominance DAG, reduce a candidate operator set to the
// operators no other candidate dominates (transitively). If a dominating
// mutant is killed, every mutant it dominates would have been killed by the
// same test, so the dominated ones need not run on their own.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_MUTATION_SUBSUMPTIONREDUCER_H
#define MUTAGEN_MUTATION_SUBSUMPTIONREDUCER_H

#include "mutagen/Mutation/MutationSite.h"
#include "mutagen/Mutation/OperatorCatalog.h"
#include <string>
#include <vector>

namespace mutagen {

/// A site left out because another site at the same location dominates it.
struct SubsumedSite {
  MutationSite site;
  /// Id of the dominating site.
  std::string dominator;
};

struct SubsumptionResult {
  std::vector<MutationSite> kept;
  std::vector<SubsumedSite> subsumed;
};

class SubsumptionReducer {
public:
  explicit SubsumptionReducer(const OperatorCatalog &catalog)
      : catalog(catalog) {}

  /// The candidates no other candidate dominates, in input order. Duplicates
  /// are kept once. reduce(reduce(S)) == reduce(S).
  std::vector<std::string> reduce(ArrayRef<std::string> candidates) const;

  /// Apply the reduction per (form, coordinate): the operators that produced
  /// sites at one location form the candidate set. The order of `sites` is
  /// preserved in both outputs.
  SubsumptionResult pruneSites(std::vector<MutationSite> sites) const;

private:
  const OperatorCatalog &catalog;
};

} // namespace mutagen

#endif // MUTAGEN_MUTATION_SUBSUMPTIONREDUCER_H
