//===- Document.h - A parsed source file and its forms ----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A Document is an immutable snapshot of one source file: its syntax tree and
// the top-level forms with their stable identities. Coordinates are decoded
// and encoded against a snapshot; an edit produces a new snapshot that shares
// every untouched subtree with the old one.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_CAST_DOCUMENT_H
#define MUTAGEN_CAST_DOCUMENT_H

#include "mutagen/CAST/Coordinate.h"
#include "mutagen/CAST/Node.h"
#include "mutagen/Support/ContentHash.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/Error.h"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mutagen {

/// A top-level form of a document.
struct Form {
  /// Stable identity, e.g. "src/demo/core.clj:defn add".
  std::string id;
  std::string file;
  /// Head symbol for list forms, empty otherwise.
  std::string head;
  /// Index among the root's children, trivia included.
  unsigned rawIndex = 0;
  /// Index among the root's significant children.
  unsigned ordinal = 0;
  /// 1-based lines of the first and last character.
  unsigned startLine = 0;
  unsigned endLine = 0;
  /// Digest of the exact form text.
  ContentHash digest;
  NodePtr node;
};

/// One step of a path from a form root towards a descendant.
struct PathStep {
  const CompositeNode *parent;
  unsigned rawIndex;
};

/// A resolved node inside a Document snapshot. Holds raw pointers into the
/// snapshot, so it must not outlive the Document it came from.
class Location {
public:
  Location(const Form &form, const Node *node, SmallVector<PathStep, 8> steps)
      : form(&form), node(node), steps(std::move(steps)) {}

  const Form &getForm() const { return *form; }
  const Node *getNode() const { return node; }
  ArrayRef<PathStep> getSteps() const { return steps; }

  /// The containing node, or null for the form root.
  const CompositeNode *getParent() const {
    return steps.empty() ? nullptr : steps.back().parent;
  }

  /// Child indices from the document root, trivia included.
  SmallVector<unsigned, 8> getRawPath() const;

  /// The coordinate addressing this node within its form.
  Coordinate getCoordinate() const;

private:
  const Form *form;
  const Node *node;
  SmallVector<PathStep, 8> steps;
};

/// A raw-path edit: replace the node at `first` with `second`.
using RawEdit = std::pair<SmallVector<unsigned, 8>, NodePtr>;

class Document {
public:
  /// Parse `text`; `file` names the document in form ids and diagnostics.
  static llvm::Expected<Document> parse(StringRef text, StringRef file);

  /// Read and parse the file at `path`.
  static llvm::Expected<Document> load(StringRef path);

  StringRef getFile() const { return file; }
  const NodePtr &getRoot() const { return root; }
  ArrayRef<Form> getForms() const { return forms; }

  /// Find a form by id, or null.
  const Form *lookupForm(StringRef id) const;

  std::string render() const { return root->toString(); }

  /// Resolve a coordinate. Fails with LocationNotFound if the path does not
  /// resolve. A digest segment matching several children resolves to the
  /// first and emits a warning.
  llvm::Expected<Location> decode(const Form &form,
                                  const Coordinate &coord) const;
  llvm::Expected<Location> decode(StringRef formId,
                                  const Coordinate &coord) const;

  /// Find `node` inside `form` by identity. Fails with LocationNotFound if the
  /// node is not part of this snapshot.
  llvm::Expected<Location> locate(const Form &form, const Node *node) const;

  /// Coordinate of a node inside `form`; exact inverse of decode.
  llvm::Expected<Coordinate> encode(const Form &form, const Node *node) const;

  /// 1-based line on which the node at `loc` starts.
  unsigned getLine(const Location &loc) const;

  /// A new snapshot with the node at `loc` replaced.
  Document replace(const Location &loc, NodePtr replacement) const;

  /// A new snapshot with several disjoint raw-path edits applied.
  Document replaceAt(ArrayRef<RawEdit> edits) const;

private:
  Document(std::string file, NodePtr root);

  void computeForms();

  std::string file;
  NodePtr root;
  std::vector<Form> forms;
  llvm::StringMap<unsigned> formIndex;
};

/// Compute the id of a top-level form node. `ordinal` is its significant
/// index in the file.
std::string computeFormId(StringRef file, const Node &node, unsigned ordinal);

} // namespace mutagen

#endif // MUTAGEN_CAST_DOCUMENT_H
