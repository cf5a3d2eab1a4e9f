//===- Document.cpp - A parsed source file and its forms ------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutagen/CAST/Document.h"
#include "mutagen/CAST/Parser.h"
#include "mutagen/Support/Diagnostics.h"
#include "mutagen/Support/MutagenError.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/MemoryBuffer.h"

#define DEBUG_TYPE "mutagen-cast"

using namespace mutagen;

static CoordinateSegment getSegmentFor(const CompositeNode &parent,
                                       unsigned rawIndex) {
  unsigned ordinal = parent.getOrdinalOf(rawIndex);
  if (auto *assoc = dyn_cast<AssocNode>(&parent))
    return CoordinateSegment::digest(
        digest64(assoc->getAddressText(ordinal)));
  return CoordinateSegment::ordinal(ordinal);
}

//===----------------------------------------------------------------------===//
// Location
//===----------------------------------------------------------------------===//

SmallVector<unsigned, 8> Location::getRawPath() const {
  SmallVector<unsigned, 8> path;
  path.push_back(form->rawIndex);
  for (const PathStep &step : steps)
    path.push_back(step.rawIndex);
  return path;
}

Coordinate Location::getCoordinate() const {
  Coordinate coord;
  for (const PathStep &step : steps)
    coord.push_back(getSegmentFor(*step.parent, step.rawIndex));
  return coord;
}

//===----------------------------------------------------------------------===//
// Form identity
//===----------------------------------------------------------------------===//

std::string mutagen::computeFormId(StringRef file, const Node &node,
                                   unsigned ordinal) {
  std::string prefix = (file + ":").str();
  auto *seq = dyn_cast<SeqNode>(&node);
  auto head = seq ? seq->getHeadSymbol() : std::nullopt;
  if (head && *head == "ns")
    return prefix + "ns";

  if (head && head->substr(0, 3) == "def") {
    if (const Node *name = seq->getSignificant(1)) {
      // (def ^:private name ...) is named by the meta target.
      if (auto *quoted = dyn_cast<QuotedNode>(name))
        if (quoted->getPrefixKind() == PrefixKind::Meta && quoted->getTarget())
          name = quoted->getTarget();
      std::string id = prefix + head->str() + " " + name->canonicalText();
      if (*head == "defmethod")
        if (const Node *dispatch = seq->getSignificant(2))
          id += " " + dispatch->canonicalText();
      return id;
    }
  }
  return prefix + "form@" + std::to_string(ordinal);
}

//===----------------------------------------------------------------------===//
// Document
//===----------------------------------------------------------------------===//

Document::Document(std::string file, NodePtr root)
    : file(std::move(file)), root(std::move(root)) {
  computeForms();
}

void Document::computeForms() {
  auto *seq = cast<SeqNode>(root.get());
  llvm::StringMap<unsigned> seen;
  unsigned line = 1;
  unsigned ordinal = 0;
  auto children = seq->getChildren();
  for (unsigned i = 0, e = children.size(); i != e; ++i) {
    const NodePtr &child = children[i];
    unsigned newlines = child->countNewlines();
    if (child->isTrivia()) {
      line += newlines;
      continue;
    }

    Form form;
    form.file = file;
    form.rawIndex = i;
    form.ordinal = ordinal;
    form.startLine = line;
    form.endLine = line + newlines;
    form.node = child;
    form.digest = ContentHash::fromString(child->toString());
    if (auto *list = dyn_cast<SeqNode>(child.get()))
      if (auto head = list->getHeadSymbol())
        form.head = head->str();

    form.id = computeFormId(file, *child, ordinal);
    unsigned count = ++seen[form.id];
    if (count > 1)
      form.id += "#" + std::to_string(count);

    formIndex[form.id] = forms.size();
    forms.push_back(std::move(form));
    line += newlines;
    ++ordinal;
  }
  LLVM_DEBUG(llvm::dbgs() << file << ": " << forms.size() << " forms\n");
}

llvm::Expected<Document> Document::parse(StringRef text, StringRef file) {
  auto root = parseSource(text, file);
  if (!root)
    return root.takeError();
  return Document(file.str(), std::move(*root));
}

llvm::Expected<Document> Document::load(StringRef path) {
  auto bufferOrErr = llvm::MemoryBuffer::getFile(path);
  if (!bufferOrErr)
    return llvm::createStringError(bufferOrErr.getError(),
                                   "failed to read '%s'", path.str().c_str());
  return parse((*bufferOrErr)->getBuffer(), path);
}

const Form *Document::lookupForm(StringRef id) const {
  auto it = formIndex.find(id);
  if (it == formIndex.end())
    return nullptr;
  return &forms[it->second];
}

llvm::Expected<Location> Document::decode(StringRef formId,
                                          const Coordinate &coord) const {
  const Form *form = lookupForm(formId);
  if (!form)
    return makeError(ErrorKind::LocationNotFound,
                     "no form '" + formId + "' in " + file);
  return decode(*form, coord);
}

llvm::Expected<Location> Document::decode(const Form &form,
                                          const Coordinate &coord) const {
  auto notFound = [&](const Twine &why) {
    return makeError(ErrorKind::LocationNotFound,
                     "coordinate '" + coord.toString() + "' in form '" +
                         form.id + "': " + why);
  };

  const Node *current = form.node.get();
  SmallVector<PathStep, 8> steps;
  for (const CoordinateSegment &segment : coord.getSegments()) {
    auto *composite = dyn_cast<CompositeNode>(current);
    if (!composite)
      return notFound("path descends into a token");
    auto significant = composite->getSignificantIndices();

    unsigned rawIndex;
    if (segment.isOrdinal()) {
      if (isa<AssocNode>(composite))
        return notFound("ordinal segment into an unordered collection");
      if (segment.getOrdinal() >= significant.size())
        return notFound("ordinal " + Twine(segment.getOrdinal()) +
                        " out of range");
      rawIndex = significant[segment.getOrdinal()];
    } else {
      auto *assoc = dyn_cast<AssocNode>(composite);
      if (!assoc)
        return notFound("digest segment into an ordered collection");
      SmallVector<unsigned, 2> matches;
      for (unsigned ordinal = 0, e = significant.size(); ordinal != e;
           ++ordinal)
        if (digest64(assoc->getAddressText(ordinal)) == segment.getDigest())
          matches.push_back(significant[ordinal]);
      if (matches.empty())
        return notFound("no child with digest " + segment.toString());
      if (matches.size() > 1)
        emitWarning("ambiguous coordinate '" + coord.toString() +
                        "' in form '" + form.id + "': " +
                        Twine(matches.size()) +
                        " children share digest " + segment.toString() +
                        ", using the first",
                    file, form.startLine);
      rawIndex = matches.front();
    }
    steps.push_back({composite, rawIndex});
    current = composite->getChildren()[rawIndex].get();
  }
  return Location(form, current, std::move(steps));
}

/// Depth-first search for `target`, recording the path in `steps`.
static bool findPath(const Node *current, const Node *target,
                     SmallVectorImpl<PathStep> &steps) {
  if (current == target)
    return true;
  auto *composite = dyn_cast<CompositeNode>(current);
  if (!composite)
    return false;
  auto children = composite->getChildren();
  for (unsigned i = 0, e = children.size(); i != e; ++i) {
    steps.push_back({composite, i});
    if (findPath(children[i].get(), target, steps))
      return true;
    steps.pop_back();
  }
  return false;
}

llvm::Expected<Location> Document::locate(const Form &form,
                                          const Node *node) const {
  SmallVector<PathStep, 8> steps;
  if (!findPath(form.node.get(), node, steps))
    return makeError(ErrorKind::LocationNotFound,
                     "node is not part of form '" + form.id + "'");
  return Location(form, node, std::move(steps));
}

llvm::Expected<Coordinate> Document::encode(const Form &form,
                                            const Node *node) const {
  auto loc = locate(form, node);
  if (!loc)
    return loc.takeError();
  return loc->getCoordinate();
}

unsigned Document::getLine(const Location &loc) const {
  unsigned line = loc.getForm().startLine;
  for (const PathStep &step : loc.getSteps()) {
    line += step.parent->getOpen().count('\n');
    auto children = step.parent->getChildren();
    for (unsigned i = 0; i < step.rawIndex; ++i)
      line += children[i]->countNewlines();
  }
  return line;
}

/// Rebuild the spine from `node` down `path`, replacing the endpoint.
static NodePtr rebuild(const NodePtr &node, ArrayRef<unsigned> path,
                       NodePtr replacement) {
  if (path.empty())
    return replacement;
  auto *composite = cast<CompositeNode>(node.get());
  auto oldChildren = composite->getChildren();
  std::vector<NodePtr> children(oldChildren.begin(), oldChildren.end());
  children[path.front()] = rebuild(children[path.front()], path.drop_front(),
                                   std::move(replacement));
  return composite->withChildren(std::move(children));
}

Document Document::replace(const Location &loc, NodePtr replacement) const {
  return Document(file,
                  rebuild(root, loc.getRawPath(), std::move(replacement)));
}

Document Document::replaceAt(ArrayRef<RawEdit> edits) const {
  NodePtr newRoot = root;
  for (const RawEdit &edit : edits)
    newRoot = rebuild(newRoot, edit.first, edit.second);
  return Document(file, std::move(newRoot));
}
