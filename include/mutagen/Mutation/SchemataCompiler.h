//===- SchemataCompiler.h - Multi-mutant source instrumentation -*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A mutant schema embeds a batch of mutants of one file into a single edit.
// Every targeted node becomes a choice over a shared runtime selector:
//
//   (case (mutagen.runtime/active-mutant)
//     1 <mutant 1>
//     2 <mutant 2>
//     <original>)
//
// The file is written and reloaded once per batch; the driver then sets the
// selector to each mutant id in turn. Mutant ids are 1-based per batch and 0
// selects the original code. Sites at the same node share one choice; sites
// where one node contains the other cannot share a batch.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_MUTATION_SCHEMATACOMPILER_H
#define MUTAGEN_MUTATION_SCHEMATACOMPILER_H

#include "mutagen/CAST/Document.h"
#include "mutagen/Mutation/MutationSite.h"
#include "llvm/Support/Error.h"
#include <string>
#include <vector>

namespace mutagen {

struct SchemaMutant {
  /// Runtime selector value, 1-based.
  unsigned id;
  /// Index of the site in the list given to the compiler.
  size_t site;
};

struct SchemaBundle {
  std::string file;
  /// Instrumented file content.
  std::string text;
  /// Embedded mutants, in id order.
  std::vector<SchemaMutant> mutants;
  /// Number of choice expressions written.
  unsigned numChoices = 0;
};

class SchemataCompiler {
public:
  static constexpr const char *defaultSelector =
      "(mutagen.runtime/active-mutant)";

  explicit SchemataCompiler(std::string selector = defaultSelector)
      : selector(std::move(selector)) {}

  StringRef getSelector() const { return selector; }

  /// Split the sites at `indices` into batches whose locations do not nest.
  /// Greedy first fit in the order of `indices`.
  static std::vector<std::vector<size_t>>
  partition(ArrayRef<MutationSite> sites, ArrayRef<size_t> indices);

  /// Build the schema of `batch`, whose sites must all belong to `document`
  /// and must not nest. Fails with LocationNotFound or MutationApplyFailure.
  llvm::Expected<SchemaBundle> compile(const Document &document,
                                       ArrayRef<MutationSite> sites,
                                       ArrayRef<size_t> batch) const;

private:
  std::string selector;
};

} // namespace mutagen

#endif // MUTAGEN_MUTATION_SCHEMATACOMPILER_H
