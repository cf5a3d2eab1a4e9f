//===- SchemataCompiler.cpp - Multi-mutant source instrumentation ---------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Mutation/SchemataCompiler.h"
#include "mutagen/CAST/Parser.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "mutagen-schemata"

using namespace mutagen;

/// Two sites conflict if one mutates a node containing the other's.
static bool conflicts(const MutationSite &a, const MutationSite &b) {
  return a.formId == b.formId && a.coord != b.coord &&
         a.coord.overlaps(b.coord);
}

std::vector<std::vector<size_t>>
SchemataCompiler::partition(ArrayRef<MutationSite> sites,
                            ArrayRef<size_t> indices) {
  std::vector<std::vector<size_t>> batches;
  for (size_t index : indices) {
    auto fits = [&](const std::vector<size_t> &batch) {
      return llvm::none_of(batch, [&](size_t other) {
        return conflicts(sites[index], sites[other]);
      });
    };
    auto batch = llvm::find_if(batches, fits);
    if (batch != batches.end())
      batch->push_back(index);
    else
      batches.push_back({index});
  }
  return batches;
}

llvm::Expected<SchemaBundle>
SchemataCompiler::compile(const Document &document,
                          ArrayRef<MutationSite> sites,
                          ArrayRef<size_t> batch) const {
  SchemaBundle bundle;
  bundle.file = document.getFile().str();

  // Group the batch by node, keeping first-occurrence order.
  struct Choice {
    const MutationSite *site;
    std::vector<SchemaMutant> mutants;
  };
  std::vector<Choice> choices;
  for (size_t index : batch) {
    const MutationSite &site = sites[index];
    if (site.file != bundle.file)
      return makeError(ErrorKind::MutationApplyFailure,
                       site.getId() + " does not belong to '" + bundle.file +
                           "'");
    SchemaMutant mutant{static_cast<unsigned>(bundle.mutants.size() + 1),
                        index};
    bundle.mutants.push_back(mutant);

    auto choice = llvm::find_if(choices, [&](const Choice &c) {
      return c.site->formId == site.formId && c.site->coord == site.coord;
    });
    if (choice != choices.end()) {
      choice->mutants.push_back(mutant);
      continue;
    }
    for (const Choice &other : choices)
      if (conflicts(*other.site, site))
        return makeError(ErrorKind::MutationApplyFailure,
                         site.getId() + " nests inside " +
                             other.site->getId());
    choices.push_back({&site, {mutant}});
  }

  std::vector<RawEdit> edits;
  for (const Choice &choice : choices) {
    auto loc = document.decode(choice.site->formId, choice.site->coord);
    if (!loc)
      return loc.takeError();

    std::string text;
    llvm::raw_string_ostream os(text);
    os << "(case " << selector;
    for (const SchemaMutant &mutant : choice.mutants)
      os << ' ' << mutant.id << ' ' << sites[mutant.site].replacement;
    os << ' ';
    loc->getNode()->render(os);
    os << ')';
    os.flush();

    auto node = parseFragment(text);
    if (!node)
      return makeError(ErrorKind::MutationApplyFailure,
                       "cannot build schema for " + choice.site->getId() +
                           ": " + llvm::toString(node.takeError()));
    edits.push_back({loc->getRawPath(), std::move(*node)});
  }

  bundle.text = document.replaceAt(edits).render();
  bundle.numChoices = choices.size();
  LLVM_DEBUG(llvm::dbgs() << "schema for " << bundle.file << ": "
                          << bundle.mutants.size() << " mutants in "
                          << bundle.numChoices << " choices\n");
  return bundle;
}
