//===- MutationSite.h - A candidate mutation --------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_MUTATION_MUTATIONSITE_H
#define MUTAGEN_MUTATION_MUTATIONSITE_H

#include "mutagen/CAST/Coordinate.h"
#include "mutagen/Mutation/Operator.h"
#include <string>

namespace mutagen {

/// One operator applied at one location of one form. Sites are produced by
/// the scanner against a Document snapshot and only make sense against it.
struct MutationSite {
  std::string formId;
  Coordinate coord;
  std::string operatorId;
  /// Text that replaces the node at `coord`.
  std::string replacement;

  std::string file;
  /// Start line of the form and of the mutated node, 1-based.
  unsigned formLine = 0;
  unsigned line = 0;
  /// Original text of the mutated node.
  std::string original;
  /// Whether the mutated node is a token rather than a composite.
  bool leaf = false;
  /// Arity pattern of the containing expression, e.g. "(if _ _ _)".
  std::string parentShape;
  OperatorCategory category = OperatorCategory::Relational;
  double hardness = 0.5;
  /// Position in the deterministic scan order.
  unsigned scanOrder = 0;

  /// "<formId>@<coordinate>:<operatorId>", stable across runs while the form
  /// is unchanged.
  std::string getId() const {
    return formId + "@" + coord.toString() + ":" + operatorId;
  }
};

} // namespace mutagen

#endif // MUTAGEN_MUTATION_MUTATIONSITE_H
