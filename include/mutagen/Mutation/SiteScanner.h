//===- SiteScanner.h - Candidate mutation discovery -------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The scanner walks every form of a document depth first and asks each
// operator of the catalog about every live node. Quoted and discarded code is
// skipped, as are forms whose head is listed in `skipForms`. The output is in
// tree order, then operator declaration order, and numbered with a global
// scan order.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_MUTATION_SITESCANNER_H
#define MUTAGEN_MUTATION_SITESCANNER_H

#include "mutagen/CAST/Document.h"
#include "mutagen/Mutation/MutationSite.h"
#include "mutagen/Mutation/OperatorCatalog.h"
#include "llvm/ADT/StringSet.h"
#include <string>
#include <vector>

namespace mutagen {

/// Shape of the expression containing a node, e.g. "(if _ _ _)", "[_ _]".
std::string getParentShape(const CompositeNode *parent);

class SiteScanner {
public:
  explicit SiteScanner(const OperatorCatalog &catalog,
                       std::vector<std::string> skipForms = {"comment"});

  /// Scan `documents` in order. With `onlyForms`, forms whose id is not in
  /// the set are skipped. Forms are scanned in parallel.
  std::vector<MutationSite>
  scan(ArrayRef<const Document *> documents,
       const llvm::StringSet<> *onlyForms = nullptr) const;

  /// Scan one form. Sites are numbered from zero.
  std::vector<MutationSite> scanForm(const Document &document,
                                     const Form &form) const;

private:
  const OperatorCatalog &catalog;
  llvm::StringSet<> skipForms;
};

} // namespace mutagen

#endif // MUTAGEN_MUTATION_SITESCANNER_H
