//===- OperatorCatalog.h - Validated set of mutation operators --*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The catalog owns an ordered list of operators. Construction validates the
// subsumption relation (edges stay inside a family, each family is acyclic)
// and precomputes the transitive dominance sets and the named presets:
//
//   fast     relational operators no other operator dominates, plus the
//            arithmetic, logical and negation operators
//   default  every operator except constant replacement
//   all      every operator
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_MUTATION_OPERATORCATALOG_H
#define MUTAGEN_MUTATION_OPERATORCATALOG_H

#include "mutagen/Mutation/Operator.h"
#include "mutagen/Support/LLVM.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Error.h"
#include <optional>
#include <string>
#include <vector>

namespace mutagen {

/// The operators shipped with the engine, in declaration order.
std::vector<Operator> getBuiltinOperators();

/// Truth set of a relation over the regions a<b (1), a=b (2) and a>b (4).
/// "true" and "false" are the constant predicates.
std::optional<unsigned> getRelationTruthMask(StringRef relation);

class OperatorCatalog {
public:
  /// Validate `operators` and build a catalog. Fails with CatalogError.
  static llvm::Expected<OperatorCatalog>
  create(std::vector<Operator> operators);

  /// The built-in catalog, built once.
  static const OperatorCatalog &getBuiltin();

  /// Names of the presets every catalog provides.
  static ArrayRef<StringRef> getPresetNames();

  /// The operator ids of a preset, in declaration order. Fails with
  /// ConfigError for an unknown preset.
  llvm::Expected<std::vector<std::string>> getPreset(StringRef name) const;

  /// A sub-catalog: `allow` if non-empty, `preset` otherwise, minus
  /// `disable`. Dominance inside the subset follows the transitive relation
  /// of this catalog. Unknown names are a ConfigError.
  llvm::Expected<OperatorCatalog> select(StringRef preset,
                                         ArrayRef<std::string> allow,
                                         ArrayRef<std::string> disable) const;

  ArrayRef<Operator> getOperators() const { return operators; }
  const Operator *lookup(StringRef id) const;

  /// Declaration position of `id`.
  std::optional<unsigned> getIndex(StringRef id) const;

  /// Every operator `id` dominates, directly or transitively.
  const llvm::StringSet<> &getDominated(StringRef id) const;

  /// True if `a` dominates `b`, directly or transitively.
  bool dominates(StringRef a, StringRef b) const {
    return getDominated(a).contains(b);
  }

  size_t size() const { return operators.size(); }
  bool empty() const { return operators.empty(); }

private:
  OperatorCatalog() = default;

  llvm::Error validate() const;
  void computeClosures();
  void computePresets();

  std::vector<Operator> operators;
  llvm::StringMap<unsigned> index;
  std::vector<llvm::StringSet<>> closures;
  llvm::StringMap<std::vector<std::string>> presets;
};

} // namespace mutagen

#endif // MUTAGEN_MUTATION_OPERATORCATALOG_H
