//===- Operator.h - Declarative mutation operators --------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A mutation operator is plain data: a matcher over a node and its immediate
// context, a generator producing the replacement text, an optional
// equivalence rule, a hardness score and the operators it dominates within
// its comparator family. Matchers and generators must be total and free of
// side effects; the scanner calls them from several threads.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_MUTATION_OPERATOR_H
#define MUTAGEN_MUTATION_OPERATOR_H

#include "mutagen/CAST/Node.h"
#include "mutagen/Support/LLVM.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mutagen {

enum class OperatorCategory {
  Relational,
  Arithmetic,
  Logical,
  Conditional,
  Negation,
  Literal,
  Constant,
  Collection,
};

/// Stable name of a category ("relational", ...).
StringRef getOperatorCategoryName(OperatorCategory category);

/// The node an operator is asked about, with its immediate context.
struct MatchContext {
  const Node *node = nullptr;
  /// Containing node, or null for a form root.
  const CompositeNode *parent = nullptr;
  /// Significant ordinal of `node` in `parent`.
  unsigned ordinal = 0;

  /// The node as a list, or null.
  const SeqNode *getList() const;
  /// Head symbol when the node is a list call such as `(+ a b)`.
  std::optional<StringRef> getCallee() const;
  /// Significant children of a call after the head.
  SmallVector<const Node *, 4> getOperands() const;
};

/// A static reason why a mutant cannot change behavior.
struct EquivalenceRule {
  std::string reason;
  std::function<bool(const MatchContext &)> holds;
};

struct Operator {
  std::string id;
  OperatorCategory category = OperatorCategory::Relational;
  /// Comparator family. Subsumption edges never leave a family.
  std::string family;
  /// Likelihood that a test suite misses the mutant, in [0, 1].
  double hardness = 0.5;
  /// Operators of the same family this one directly dominates.
  std::vector<std::string> dominates;

  std::function<bool(const MatchContext &)> matches;
  /// Replacement text for a matched node; std::nullopt if the node cannot be
  /// rewritten after all.
  std::function<std::optional<std::string>(const MatchContext &)> generate;
  std::optional<EquivalenceRule> equivalence;
};

} // namespace mutagen

#endif // MUTAGEN_MUTATION_OPERATOR_H
