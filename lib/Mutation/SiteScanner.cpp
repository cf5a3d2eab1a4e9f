//===- SiteScanner.cpp - Candidate mutation discovery ---------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/Mutation/SiteScanner.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/Parallel.h"

#define DEBUG_TYPE "mutagen-scanner"

using namespace mutagen;

std::string mutagen::getParentShape(const CompositeNode *parent) {
  if (!parent)
    return "<form>";

  std::string shape = parent->getOpen().str();
  unsigned numSignificant = parent->getNumSignificant();
  unsigned first = 0;
  if (auto *seq = dyn_cast<SeqNode>(parent)) {
    if (auto head = seq->getHeadSymbol()) {
      shape += head->str();
      first = 1;
    }
  }
  for (unsigned i = first; i < numSignificant; ++i) {
    if (i != 0)
      shape += ' ';
    shape += '_';
  }
  shape += parent->getClose().str();
  return shape;
}

SiteScanner::SiteScanner(const OperatorCatalog &catalog,
                         std::vector<std::string> skipForms)
    : catalog(catalog) {
  for (const std::string &head : skipForms)
    this->skipForms.insert(head);
}

namespace {
/// Depth-first walk of one form.
class FormWalker {
public:
  FormWalker(const OperatorCatalog &catalog, const llvm::StringSet<> &skipForms,
             const Document &document, const Form &form,
             std::vector<MutationSite> &sites)
      : catalog(catalog), skipForms(skipForms), document(document),
        form(form), sites(sites) {}

  void walk() { visit(form.node.get(), QuoteDepth()); }

private:
  void visit(const Node *node, QuoteDepth depth);
  void matchOperators(const Node *node);

  const OperatorCatalog &catalog;
  const llvm::StringSet<> &skipForms;
  const Document &document;
  const Form &form;
  std::vector<MutationSite> &sites;
  SmallVector<PathStep, 8> steps;
};
} // namespace

void FormWalker::visit(const Node *node, QuoteDepth depth) {
  if (node->isTrivia() || depth.isDiscarded())
    return;
  if (auto *seq = dyn_cast<SeqNode>(node))
    if (auto head = seq->getHeadSymbol())
      if (skipForms.contains(*head))
        return;

  if (depth.isLive())
    matchOperators(node);

  auto *composite = dyn_cast<CompositeNode>(node);
  if (!composite)
    return;

  auto indices = composite->getSignificantIndices();
  QuoteDepth childDepth = depth;
  if (auto *quoted = dyn_cast<QuotedNode>(composite)) {
    childDepth = depth.enter(*quoted);
    // Metadata maps and reader tags are not code.
    if (getPrefixArity(quoted->getPrefixKind()) == 2 && !indices.empty())
      indices.erase(indices.begin(), std::prev(indices.end()));
  } else if (auto *seq = dyn_cast<SeqNode>(composite)) {
    auto head = seq->getHeadSymbol();
    if (seq->getSeqKind() == SeqKind::List && head && *head == "quote")
      childDepth = depth.enter(PrefixKind::Quote);
  }

  auto children = composite->getChildren();
  for (unsigned rawIndex : indices) {
    steps.push_back({composite, rawIndex});
    visit(children[rawIndex].get(), childDepth);
    steps.pop_back();
  }
}

void FormWalker::matchOperators(const Node *node) {
  MatchContext ctx;
  ctx.node = node;
  if (!steps.empty()) {
    ctx.parent = steps.back().parent;
    ctx.ordinal = ctx.parent->getOrdinalOf(steps.back().rawIndex);
  }

  std::optional<Location> loc;
  for (const Operator &op : catalog.getOperators()) {
    if (!op.matches(ctx))
      continue;
    std::optional<std::string> replacement = op.generate(ctx);
    if (!replacement) {
      LLVM_DEBUG(llvm::dbgs() << "operator " << op.id
                              << " matched but produced no replacement\n");
      continue;
    }
    if (!loc)
      loc.emplace(form, node, steps);

    MutationSite site;
    site.formId = form.id;
    site.coord = loc->getCoordinate();
    site.operatorId = op.id;
    site.replacement = std::move(*replacement);
    site.file = form.file;
    site.formLine = form.startLine;
    site.line = document.getLine(*loc);
    site.original = node->toString();
    site.leaf = !isa<CompositeNode>(node);
    site.parentShape = getParentShape(ctx.parent);
    site.category = op.category;
    site.hardness = op.hardness;
    sites.push_back(std::move(site));
  }
}

std::vector<MutationSite> SiteScanner::scanForm(const Document &document,
                                                const Form &form) const {
  std::vector<MutationSite> sites;
  FormWalker(catalog, skipForms, document, form, sites).walk();
  for (unsigned i = 0, e = sites.size(); i < e; ++i)
    sites[i].scanOrder = i;
  return sites;
}

std::vector<MutationSite>
SiteScanner::scan(ArrayRef<const Document *> documents,
                  const llvm::StringSet<> *onlyForms) const {
  struct WorkItem {
    const Document *document;
    const Form *form;
    std::vector<MutationSite> sites;
  };

  std::vector<WorkItem> items;
  for (const Document *document : documents)
    for (const Form &form : document->getForms())
      if (!onlyForms || onlyForms->contains(form.id))
        items.push_back({document, &form, {}});

  llvm::parallelForEach(items, [&](WorkItem &item) {
    item.sites = scanForm(*item.document, *item.form);
  });

  std::vector<MutationSite> sites;
  for (WorkItem &item : items)
    for (MutationSite &site : item.sites) {
      site.scanOrder = sites.size();
      sites.push_back(std::move(site));
    }
  LLVM_DEBUG(llvm::dbgs() << "scanned " << items.size() << " forms, found "
                          << sites.size() << " sites\n");
  return sites;
}
