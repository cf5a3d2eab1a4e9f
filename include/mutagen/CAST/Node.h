//===- Node.h - Formatting-preserving syntax tree nodes ---------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Nodes of the coordinate-addressed syntax tree. The node kinds form a closed
// set (tokens, ordered collections, associative collections and quoted
// forms) discriminated with LLVM-style RTTI. Nodes are immutable and shared:
// an edit rebuilds the path from the root to the edited node and reuses every
// untouched subtree.
//
// Every byte of the source is owned by exactly one token or delimiter, so
// rendering a freshly parsed tree reproduces the input.
//
//===----------------------------------------------------------------------===//

#ifndef MUTAGEN_CAST_NODE_H
#define MUTAGEN_CAST_NODE_H

#include "mutagen/Support/LLVM.h"
#include "llvm/Support/raw_ostream.h"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace mutagen {

class Node;
using NodePtr = std::shared_ptr<const Node>;

enum class NodeKind {
  Token,
  // Composite kinds, keep contiguous.
  Seq,
  Assoc,
  Quoted,
};

//===----------------------------------------------------------------------===//
// Node
//===----------------------------------------------------------------------===//

class Node {
public:
  virtual ~Node();

  NodeKind getKind() const { return kind; }

  /// Whitespace, commas and comments. Trivia is rendered but never addressed
  /// by coordinates nor matched by operators.
  bool isTrivia() const;

  /// Write the exact source text of this subtree.
  void render(llvm::raw_ostream &os) const;
  std::string toString() const;

  /// Source text with comments removed and whitespace runs collapsed to a
  /// single space. Used for content digests of unordered collections and for
  /// syntactic comparisons.
  std::string canonicalText() const;

  /// Number of newline characters in the rendered text.
  unsigned countNewlines() const;

protected:
  explicit Node(NodeKind kind) : kind(kind) {}

private:
  const NodeKind kind;
};

//===----------------------------------------------------------------------===//
// TokenNode
//===----------------------------------------------------------------------===//

enum class TokenKind {
  Whitespace,
  Comment,
  Symbol,
  Keyword,
  Number,
  String,
  Character,
  Regex,
};

class TokenNode : public Node {
public:
  TokenNode(TokenKind tokenKind, std::string text)
      : Node(NodeKind::Token), tokenKind(tokenKind), text(std::move(text)) {}

  TokenKind getTokenKind() const { return tokenKind; }
  StringRef getText() const { return text; }

  bool isSymbol(StringRef name) const {
    return tokenKind == TokenKind::Symbol && text == name;
  }

  /// Value of an integer literal (decimal, optional sign, optional N suffix).
  std::optional<int64_t> getIntegerValue() const;

  static bool classof(const Node *node) {
    return node->getKind() == NodeKind::Token;
  }

private:
  TokenKind tokenKind;
  std::string text;
};

//===----------------------------------------------------------------------===//
// CompositeNode
//===----------------------------------------------------------------------===//

/// A node with an opening text, children and a closing text. Children include
/// trivia; "significant" children are the non-trivia ones.
class CompositeNode : public Node {
public:
  StringRef getOpen() const { return open; }
  StringRef getClose() const { return close; }
  ArrayRef<NodePtr> getChildren() const { return children; }

  /// Raw child indices of the significant children, in order.
  SmallVector<unsigned, 8> getSignificantIndices() const;

  /// Number of significant children.
  unsigned getNumSignificant() const;

  /// The `ordinal`-th significant child, or null.
  const Node *getSignificant(unsigned ordinal) const;

  /// Ordinal of the significant child stored at raw index `rawIndex`.
  unsigned getOrdinalOf(unsigned rawIndex) const;

  /// A copy of this node with different children.
  virtual NodePtr withChildren(std::vector<NodePtr> newChildren) const = 0;

  static bool classof(const Node *node) {
    return node->getKind() >= NodeKind::Seq &&
           node->getKind() <= NodeKind::Quoted;
  }

protected:
  CompositeNode(NodeKind kind, std::string open, std::string close,
                std::vector<NodePtr> children)
      : Node(kind), open(std::move(open)), close(std::move(close)),
        children(std::move(children)) {}

private:
  std::string open;
  std::string close;
  std::vector<NodePtr> children;
};

//===----------------------------------------------------------------------===//
// SeqNode
//===----------------------------------------------------------------------===//

enum class SeqKind {
  /// The whole document; empty delimiters, children are the top-level forms.
  Root,
  List,
  Vector,
  /// `#(...)`
  FnLiteral,
  /// `#?(...)` and `#?@(...)`
  ReaderConditional,
};

/// Ordered collection. Coordinates address children by ordinal.
class SeqNode : public CompositeNode {
public:
  SeqNode(SeqKind seqKind, std::string open, std::string close,
          std::vector<NodePtr> children)
      : CompositeNode(NodeKind::Seq, std::move(open), std::move(close),
                      std::move(children)),
        seqKind(seqKind) {}

  SeqKind getSeqKind() const { return seqKind; }

  /// The head symbol of a list, e.g. "+" for `(+ a b)`.
  std::optional<StringRef> getHeadSymbol() const;

  NodePtr withChildren(std::vector<NodePtr> newChildren) const override;

  static bool classof(const Node *node) {
    return node->getKind() == NodeKind::Seq;
  }

private:
  SeqKind seqKind;
};

//===----------------------------------------------------------------------===//
// AssocNode
//===----------------------------------------------------------------------===//

enum class AssocKind {
  /// `{...}` and namespaced `#:ns{...}`
  Map,
  /// `#{...}`
  Set,
};

/// Unordered collection. Coordinates address children by content digest.
class AssocNode : public CompositeNode {
public:
  AssocNode(AssocKind assocKind, std::string open,
            std::vector<NodePtr> children)
      : CompositeNode(NodeKind::Assoc, std::move(open), "}",
                      std::move(children)),
        assocKind(assocKind) {}

  AssocKind getAssocKind() const { return assocKind; }

  /// Text whose digest addresses the significant child at `ordinal`:
  /// "k"/"v" plus the key's canonical text for maps, "e" plus the element's
  /// canonical text for sets.
  std::string getAddressText(unsigned ordinal) const;

  NodePtr withChildren(std::vector<NodePtr> newChildren) const override;

  static bool classof(const Node *node) {
    return node->getKind() == NodeKind::Assoc;
  }

private:
  AssocKind assocKind;
};

//===----------------------------------------------------------------------===//
// QuotedNode
//===----------------------------------------------------------------------===//

enum class PrefixKind {
  Quote,           // 'x
  SyntaxQuote,     // `x
  Unquote,         // ~x
  UnquoteSplicing, // ~@x
  Deref,           // @x
  Var,             // #'x
  Meta,            // ^meta x
  Discard,         // #_x
  Eval,            // #=x
  Tagged,          // #tag x
};

/// Number of significant children a prefix takes (2 for Meta and Tagged).
unsigned getPrefixArity(PrefixKind kind);

/// Reader-macro prefixed form. Coordinates address children by ordinal.
class QuotedNode : public CompositeNode {
public:
  QuotedNode(PrefixKind prefixKind, std::string prefix,
             std::vector<NodePtr> children)
      : CompositeNode(NodeKind::Quoted, std::move(prefix), "",
                      std::move(children)),
        prefixKind(prefixKind) {}

  PrefixKind getPrefixKind() const { return prefixKind; }

  /// The form the prefix applies to (the last significant child).
  const Node *getTarget() const;

  NodePtr withChildren(std::vector<NodePtr> newChildren) const override;

  static bool classof(const Node *node) {
    return node->getKind() == NodeKind::Quoted;
  }

private:
  PrefixKind prefixKind;
};

//===----------------------------------------------------------------------===//
// Quoting depth
//===----------------------------------------------------------------------===//

/// Tracks how deeply the traversal is nested in quoted code. Syntax-quote
/// raises the depth and unquote lowers it again. A plain quote outside any
/// syntax-quote makes the whole subtree data, unquotes included; inside a
/// syntax-quote it is itself syntax-quoted and changes nothing. A discarded
/// form is excluded regardless of depth. Only depth zero is live code.
class QuoteDepth {
public:
  QuoteDepth() = default;

  /// The state inside the target of `node`.
  QuoteDepth enter(const QuotedNode &node) const {
    return enter(node.getPrefixKind());
  }
  /// The state inside a form introduced by `kind`. `(quote x)` enters
  /// PrefixKind::Quote like `'x` does.
  QuoteDepth enter(PrefixKind kind) const;

  bool isLive() const { return !discarded && !quoted && syntaxDepth == 0; }
  unsigned getSyntaxDepth() const { return syntaxDepth; }
  bool isQuoted() const { return quoted; }
  bool isDiscarded() const { return discarded; }

private:
  unsigned syntaxDepth = 0;
  bool quoted = false;
  bool discarded = false;
};

} // namespace mutagen

#endif // MUTAGEN_CAST_NODE_H
