//===- EquivalenceFilter.h - Static equivalent-mutant removal ---*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Removes sites whose operator's equivalence rule holds for the node and its
// immediate context. The check is purely syntactic: a mutant that is only
// equivalent at run time is not detected.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_MUTATION_EQUIVALENCEFILTER_H
#define MUTAGEN_MUTATION_EQUIVALENCEFILTER_H

#include "mutagen/CAST/Document.h"
#include "mutagen/Mutation/MutationSite.h"
#include "mutagen/Mutation/OperatorCatalog.h"
#include "llvm/Support/Error.h"
#include <string>
#include <vector>

namespace mutagen {

/// A site excluded before execution, with the reason.
struct ExcludedSite {
  MutationSite site;
  std::string reason;
};

struct EquivalenceResult {
  std::vector<MutationSite> kept;
  std::vector<ExcludedSite> equivalent;
};

class EquivalenceFilter {
public:
  explicit EquivalenceFilter(const OperatorCatalog &catalog)
      : catalog(catalog) {}

  /// Partition `sites`, all of which must come from `document`. Fails with
  /// LocationNotFound if a site does not resolve in the snapshot.
  llvm::Expected<EquivalenceResult>
  filter(const Document &document, std::vector<MutationSite> sites) const;

  /// The reason `site` is equivalent, if its rule holds at `loc`.
  std::optional<std::string> check(const MutationSite &site,
                                   const Location &loc) const;

private:
  const OperatorCatalog &catalog;
};

} // namespace mutagen

#endif // MUTAGEN_MUTATION_EQUIVALENCEFILTER_H
